#pragma once
#include <string>

namespace Tether {
namespace Core {

struct Config {
    std::string trace_path;
    std::string config_path;
    std::string log_level   = "info";
    bool        json_output = false;
    bool        strict      = false;  // fail when targets fall back to the default context

    static Config parse(int argc, char* argv[]);
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Tether
