#include "config.hpp"
#include "connection.hpp"
#include "directoryHttp.hpp"
#include "lobby.hpp"
#include "registry.hpp"

#include <boost/asio.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

/*
 * ============================================================================
 * SERVER ENTRY POINT
 * ============================================================================
 *
 *   io_context  <-- run by N threads
 *       |
 *       +-- session acceptor   (port)       -> Connection -> Lobby -> Stage
 *       +-- directory acceptor (http-port)  -> DirectoryHttpSession -> Registry
 *       +-- signal_set (SIGINT/SIGTERM)     -> close every stage, stop
 *
 * The registry and lobby are plain objects owned by main and passed down by
 * reference. They outlive io.run(), so no handler ever sees them destroyed.
 * ============================================================================
 */

namespace {

void closeAcceptor(tcp::acceptor& acceptor, const char* name) {
    boost::system::error_code ec;
    acceptor.close(ec);
    if (ec) {
        std::cerr << "Closing " << name << " acceptor: " << ec.message() << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        ServerConfig config;
        std::string error;
        if (!parseServerArgs(argc, argv, &config, &error) || !config.Validate(&error)) {
            std::cerr << error << "\n" << serverUsage(argv[0]);
            return 1;
        }

        boost::asio::io_context io;
        SessionRegistry registry;
        Lobby lobby(io, registry, config.lobbyOptions());

        tcp::acceptor acceptor(io, tcp::endpoint(tcp::v4(), static_cast<unsigned short>(config.port)));
        std::cout << "Stage server listening on port " << config.port << std::endl;
        start_accept(acceptor, lobby);

        std::unique_ptr<tcp::acceptor> directory;
        if (config.httpPort != 0) {
            directory = std::make_unique<tcp::acceptor>(
                io, tcp::endpoint(tcp::v4(), static_cast<unsigned short>(config.httpPort)));
            std::cout << "Directory listening on http://0.0.0.0:" << config.httpPort
                      << "/sessions/public" << std::endl;
            start_directory_accept(*directory, registry);
        }

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            std::cout << "Signal " << signal << " received, shutting down" << std::endl;
            closeAcceptor(acceptor, "session");
            if (directory) {
                closeAcceptor(*directory, "directory");
            }
            lobby.shutdown();
            io.stop();
        });

        std::vector<std::thread> workers;
        for (int i = 1; i < config.threads; ++i) {
            workers.emplace_back([&io]() { io.run(); });
        }
        io.run();
        for (auto& worker : workers) {
            worker.join();
        }
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
