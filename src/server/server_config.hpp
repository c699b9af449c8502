#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace todo {

struct ServerConfig {
    std::string host{"127.0.0.1"};
    uint16_t port{8080};
    size_t num_workers{5};
};

// Parses --host <addr> --port <n> --workers <n>.
// Throws std::invalid_argument on unknown flags or bad values.
ServerConfig parse_server_args(int argc, const char* const* argv);

} // namespace todo
