#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../logger/logger.hpp"
#include "../types/constants.hpp"

namespace Tether {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["trace"])
            config.trace_path = yaml["trace"].as<std::string>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();
        if (yaml["json"])
            config.json_output = yaml["json"].as<bool>();
        if (yaml["strict"])
            config.strict = yaml["strict"].as<bool>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"tether-replay - replay a recorded target lifecycle trace"};
    app.set_version_flag("--version", Constants::VERSION);

    app.add_option("trace", config.trace_path, "Trace file (JSON lines)");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_option("--log-level", config.log_level, "none, error, warn, info or debug")
        ->check([](const std::string& value) {
            return Logger::parse_level(value) ? std::string() : "unknown log level " + value;
        });
    app.add_flag("--json", config.json_output, "Print the summary as JSON");
    app.add_flag("--strict", config.strict, "Fail when a target's context is unknown");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    return config;
}

}  // namespace Core
}  // namespace Tether
