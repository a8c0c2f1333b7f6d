#include "ds_logging.hpp"

#include "duckdb.hpp"

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dslog {

std::string escape_json(const std::string &str) {
  std::string result;
  result.reserve(str.size());
  for (const char c : str) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char escaped[7];
        std::snprintf(escaped, sizeof(escaped), "\\u%04x",
                      static_cast<unsigned int>(static_cast<unsigned char>(c)));
        result += escaped;
      } else {
        result += c;
      }
    }
  }
  return result;
}

void StdoutSink::write(const std::string &level, const std::string &message) {
  std::cout << "{\"level\":\"" << escape_json(level) << "\","
            << "\"message\":\"" << escape_json(message) << "\","
            << "\"message-origin\":\"dimsync\"}" << std::endl;
}

DuckDBSink::DuckDBSink(duckdb::Connection &connection_)
    : connection(connection_) {}

void DuckDBSink::write_now(const std::string &level,
                           const std::string &message) {
  const std::string query =
      "SELECT write_log(" + duckdb::KeywordHelper::WriteQuoted(message, '\'') +
      ", log_type:='dimsync', level:=" +
      duckdb::KeywordHelper::WriteQuoted(level, '\'') + ")";
  // Ignore errors from the query
  connection.Query(query);
}

void DuckDBSink::flush_buffer() {
  for (const auto &entry : buffered_messages) {
    write_now(entry.first, entry.second);
  }
  buffered_messages.clear();
}

void DuckDBSink::write(const std::string &level, const std::string &message) {
  if (connection.HasActiveTransaction()) {
    buffered_messages.emplace_back(level, message);
    if (buffered_messages.size() > MAX_BUFFERED_MESSAGES) {
      buffered_messages.pop_front();
    }
    return;
  }
  flush_buffer();
  write_now(level, message);
}

Logger::Logger(std::vector<std::shared_ptr<LogSink>> sinks_)
    : sinks(std::move(sinks_)) {}

Logger Logger::CreateStdoutLogger() {
  return Logger({std::make_shared<StdoutSink>()});
}

Logger Logger::CreateMultiSinkLogger(duckdb::Connection *connection) {
  std::vector<std::shared_ptr<LogSink>> sinks{std::make_shared<StdoutSink>()};
  if (connection != nullptr) {
    sinks.push_back(std::make_shared<DuckDBSink>(*connection));
  }
  return Logger(std::move(sinks));
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
  sinks.push_back(std::move(sink));
}

void Logger::set_load_id(const std::string &load_id_) { load_id = load_id_; }

void Logger::log(const std::string &level, const std::string &message) {
  const std::string full_message = message + ", load_id=<" + load_id + ">";
  for (const auto &sink : sinks) {
    sink->write(level, full_message);
  }
}

void Logger::info(const std::string &message) { log("INFO", message); }

void Logger::warning(const std::string &message) { log("WARNING", message); }

void Logger::severe(const std::string &message) { log("SEVERE", message); }

} // namespace dslog
