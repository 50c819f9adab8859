#include "MatchmakingApp.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <thread>

int main(int argc, char* argv[]) {
    try {
        matchmaking::MatchmakingApp app;

        // SIGINT/SIGTERM обрабатываются в обычном потоке, не в контексте сигнала
        boost::asio::io_context signalContext;
        boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
        signals.async_wait([&app](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            std::cout << "[main] Received signal " << signal << ", shutting down..." << std::endl;
            app.stop();
        });
        std::thread signalThread([&signalContext]() { signalContext.run(); });

        int exitCode = 0;
        try {
            app.run(argc, argv);
        } catch (const std::exception& e) {
            std::cerr << "[main] Fatal error: " << e.what() << std::endl;
            exitCode = 1;
        }

        signalContext.stop();
        signalThread.join();

        std::cout << "[main] Matchmaking Service stopped" << std::endl;
        return exitCode;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
