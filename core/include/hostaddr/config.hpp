#pragma once

#include <string>

namespace hostaddr {

enum class QueryMode {
    ONE,
    ALL
};

enum class OutputFormat {
    PLAIN,
    JSON
};

QueryMode parse_query_mode(const std::string& value);
OutputFormat parse_output_format(const std::string& value);

// Settings for hostaddr-query
struct Config {
    QueryMode mode = QueryMode::ONE;
    OutputFormat format = OutputFormat::PLAIN;
    std::string bind_address;  // empty: print addresses, not endpoints

    // Keys: mode (one|all), format (plain|json), bind ("host:port").
    // Missing keys keep their defaults.
    static Config from_yaml(const std::string& yaml);
    static Config load_from_file(const std::string& file_path);
};

} // namespace hostaddr
