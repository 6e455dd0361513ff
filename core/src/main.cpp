// tangorest
// Config-based request runner with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "service/request_dispatcher.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage: tangorest [OPTIONS] <operation> [domain/family/member] [key=value ...]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH    Path to config file (default: tangorest.yaml)\n";
    std::cerr << "  --help, -h       Show this help\n\n";
    std::cerr << "Operations:\n";
    for (const auto &spec : tangorest::service::all_operations()) {
        std::cerr << "  " << spec.name << (spec.needs_device ? " <device>" : "") << " " << spec.usage << "\n";
    }
}

}  // namespace

int main(int argc, char **argv) {
    std::string config_path = "tangorest.yaml";  // Default
    tangorest::service::Request request;
    bool have_operation = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg.substr(0, 2) == "--") {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        } else if (!have_operation) {
            request.operation = arg;
            have_operation = true;
        } else if (arg.find('=') != std::string::npos) {
            auto pos = arg.find('=');
            request.args.emplace_back(arg.substr(0, pos), arg.substr(pos + 1));
        } else if (request.device.empty()) {
            request.device = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (!have_operation) {
        print_usage();
        return 1;
    }

    if (!std::filesystem::exists(config_path)) {
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    // Quiet config logging until the configured level applies
    tangorest::logging::Logger::set_level(tangorest::logging::Level::LVL_WARN);

    tangorest::runtime::ServiceConfig config;
    std::string error;
    if (!tangorest::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    tangorest::logging::Logger::set_level(tangorest::logging::string_to_level(config.logging.level));

    tangorest::runtime::Runtime runtime(config);
    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    auto result = runtime.handle(request);
    std::cout << result.to_json().dump(2) << std::endl;
    return result.success ? 0 : 1;
}
