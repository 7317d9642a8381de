#include <hostaddr/hostaddr.hpp>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config=FILE         YAML config file\n"
              << "  --mode=one|all        Print one address or all of them (default: one)\n"
              << "  --format=plain|json   Output format (default: plain)\n"
              << "  --bind=HOST:PORT      Print the contact endpoints for a bind address\n"
              << "  --help, -h            Show this help message\n";
}

void print_list(const std::string& key, const std::vector<std::string>& values,
                hostaddr::OutputFormat format) {
    if (format == hostaddr::OutputFormat::JSON) {
        json out;
        out[key] = values;
        std::cout << out.dump() << std::endl;
        return;
    }
    for (const auto& value : values) {
        std::cout << value << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1;

    std::string config_file;
    std::string mode;
    std::string format;
    std::string bind_address;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.find("--config=") == 0) {
            config_file = arg.substr(9);
        } else if (arg.find("--mode=") == 0) {
            mode = arg.substr(7);
        } else if (arg.find("--format=") == 0) {
            format = arg.substr(9);
        } else if (arg.find("--bind=") == 0) {
            bind_address = arg.substr(7);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    try {
        hostaddr::Config config;
        if (!config_file.empty()) {
            config = hostaddr::Config::load_from_file(config_file);
        }
        if (!mode.empty()) {
            config.mode = hostaddr::parse_query_mode(mode);
        }
        if (!format.empty()) {
            config.format = hostaddr::parse_output_format(format);
        }
        if (!bind_address.empty()) {
            config.bind_address = bind_address;
        }

        hostaddr::AddressResolver resolver;

        if (!config.bind_address.empty()) {
            print_list("endpoints", resolver.resolve_bind_address(config.bind_address), config.format);
        } else if (config.mode == hostaddr::QueryMode::ALL) {
            print_list("addresses", resolver.all_addresses(), config.format);
        } else if (config.format == hostaddr::OutputFormat::JSON) {
            json out;
            out["address"] = resolver.one_address();
            std::cout << out.dump() << std::endl;
        } else {
            std::cout << resolver.one_address() << std::endl;
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to resolve local addresses: " << e.what();
        return 1;
    }

    return 0;
}
