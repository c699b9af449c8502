#include "server_config.hpp"

#include <stdexcept>
#include <string_view>

namespace todo {

namespace {

unsigned long parse_number(std::string_view flag, const std::string& value, unsigned long max) {
    size_t consumed = 0;
    unsigned long n = 0;
    try {
        n = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (value.empty() || consumed != value.size() || value.front() == '-' || n > max)
        throw std::invalid_argument("invalid value for " + std::string{flag} + ": " + value);
    return n;
}

} // namespace

ServerConfig parse_server_args(int argc, const char* const* argv) {
    ServerConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string_view flag{argv[i]};
        if (i + 1 >= argc)
            throw std::invalid_argument("missing value for " + std::string{flag});
        std::string value{argv[++i]};

        if (flag == "--host") {
            config.host = value;
        } else if (flag == "--port") {
            config.port = static_cast<uint16_t>(parse_number(flag, value, 65535));
        } else if (flag == "--workers") {
            config.num_workers = parse_number(flag, value, 1024);
            if (config.num_workers == 0)
                throw std::invalid_argument("--workers must be at least 1");
        } else {
            throw std::invalid_argument("unknown argument: " + std::string{flag});
        }
    }

    return config;
}

} // namespace todo
