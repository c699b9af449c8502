#include "http_server.hpp"
#include "server_config.hpp"
#include "todo/todo_store.hpp"
#include <iostream>
#include <memory>


/*
 * Entry point for the server executable.
 * parse CLI args
 * start server
 * block until SIGINT / SIGTERM
 */

int main(int argc, char** argv) {
    try {
        todo::ServerConfig config = todo::parse_server_args(argc, argv);
        auto store = std::make_shared<todo::TodoStore>();

        todo::HttpServer server{config, store};
        server.start();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "usage: " << argv[0] << " [--host <addr>] [--port <n>] [--workers <n>]\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
