#pragma once

#include "duckdb.hpp"

#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dslog {

/// Escapes `str` for use inside a JSON string literal.
std::string escape_json(const std::string &str);

/// Destination for formatted log lines. `message` already carries the load id.
class LogSink {
public:
  virtual ~LogSink() = default;
  virtual void write(const std::string &level, const std::string &message) = 0;
};

/// One JSON object per line on stdout.
class StdoutSink final : public LogSink {
public:
  void write(const std::string &level, const std::string &message) override;
};

/// Writes through DuckDB's write_log(). Messages produced while the connection
/// is inside an explicit transaction are held back and flushed on the next
/// write outside of it, because a failing log query would abort the
/// transaction of the load.
class DuckDBSink final : public LogSink {
public:
  explicit DuckDBSink(duckdb::Connection &connection_);

  void write(const std::string &level, const std::string &message) override;

private:
  static constexpr size_t MAX_BUFFERED_MESSAGES = 64;

  void write_now(const std::string &level, const std::string &message);
  void flush_buffer();

  duckdb::Connection &connection;
  std::deque<std::pair<std::string, std::string>> buffered_messages;
};

class Logger {
public:
  static Logger CreateStdoutLogger();
  /// Logs to stdout and to the log of the given DuckDB connection. The
  /// connection must outlive the logger.
  static Logger CreateMultiSinkLogger(duckdb::Connection *connection);

  void add_sink(std::shared_ptr<LogSink> sink);
  void set_load_id(const std::string &load_id_);

  void info(const std::string &message);
  void warning(const std::string &message);
  void severe(const std::string &message);

private:
  explicit Logger(std::vector<std::shared_ptr<LogSink>> sinks_);

  void log(const std::string &level, const std::string &message);

  std::string load_id = "none";
  std::vector<std::shared_ptr<LogSink>> sinks;
};

} // namespace dslog
