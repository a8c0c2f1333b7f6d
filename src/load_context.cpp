#include "load_context.hpp"

#include "config.hpp"
#include "connection_factory.hpp"
#include "dimension_loader.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace {
std::int64_t parse_integer_property(const std::string &property_name,
                                    const std::string &value) {
    std::size_t parsed_chars = 0;
    std::int64_t numeric_input;
    try {
        numeric_input = std::stoll(value, &parsed_chars);
    } catch (const std::invalid_argument &) {
        throw std::invalid_argument("Invalid value for property " + property_name + ": " + value + ". Must be an integer.");
    } catch (const std::out_of_range &) {
        throw std::invalid_argument("Invalid value for property " + property_name + ": " + value + ". Out of range.");
    }
    if (parsed_chars != value.size()) {
        throw std::invalid_argument("Invalid value for property " + property_name + ": " + value + ". Must be an integer.");
    }
    return numeric_input;
}
} // namespace

LoadConfiguration LoadConfiguration::FromMap(
    const std::unordered_map<std::string, std::string> &load_config) {
    LoadConfiguration config;
    config.warehouse_database = config::find_property(load_config, config::PROP_DATABASE);
    config.default_start_id = config::DEFAULT_START_ID;
    config.insert_batch_size = config::DEFAULT_INSERT_BATCH_SIZE;

    const auto default_start_id = config::find_optional_property(load_config, config::PROP_DEFAULT_START_ID);
    if (default_start_id.has_value()) {
        const auto numeric_input = parse_integer_property(config::PROP_DEFAULT_START_ID, default_start_id.value());
        if (numeric_input < 0) {
            throw std::invalid_argument("Invalid value for property " + std::string(config::PROP_DEFAULT_START_ID) + ": " + default_start_id.value() + ". Must be greater than or equal to 0.");
        }
        config.default_start_id = numeric_input;
    }

    const auto insert_batch_size = config::find_optional_property(load_config, config::PROP_INSERT_BATCH_SIZE);
    if (insert_batch_size.has_value()) {
        const auto numeric_input = parse_integer_property(config::PROP_INSERT_BATCH_SIZE, insert_batch_size.value());
        if (numeric_input <= 0) {
            throw std::invalid_argument("Invalid value for property " + std::string(config::PROP_INSERT_BATCH_SIZE) + ": " + insert_batch_size.value() + ". Must be greater than 0.");
        }
        if (numeric_input > static_cast<std::int64_t>(config::MAX_INSERT_BATCH_SIZE)) {
            throw std::invalid_argument("Invalid value for property " + std::string(config::PROP_INSERT_BATCH_SIZE) + ": " + insert_batch_size.value() + ". Must be less than or equal to " + std::to_string(config::MAX_INSERT_BATCH_SIZE) + ".");
        }
        config.insert_batch_size = static_cast<std::size_t>(numeric_input);
    }

    return config;
}

LoadContext::LoadContext(
    const std::string &load_name_, ConnectionFactory &connection_factory,
    const std::unordered_map<std::string, std::string> &load_config)
    : load_name(load_name_),
      configuration(LoadConfiguration::FromMap(load_config)),
      con(connection_factory.CreateConnection(configuration.warehouse_database)),
      logger(std::getenv(config::ENV_DISABLE_DUCKDB_LOGGING)
                 ? dslog::Logger::CreateStdoutLogger()
                 : dslog::Logger::CreateMultiSinkLogger(&con.native())) {
  logger.set_load_id(load_name);
  logger.info("Load <" + load_name + "> started");
}

LoadContext::~LoadContext() {
  logger.info("Load <" + load_name + "> completed");
}

DimensionLoader LoadContext::CreateLoader() {
  return DimensionLoader(logger, configuration.insert_batch_size);
}
