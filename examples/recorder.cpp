#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include <csignal>
#include <cstring>
#include <f1telem.hpp>
#include <f1telem_io.hpp>

using namespace f1telem;

// Global flag for graceful shutdown
std::atomic<bool> keep_running{true};

void signal_handler(int) {
    keep_running.store(false);
}

// "YYYY-MM-DD HH:MM:SS.mmm LEVEL: message"
void log_line(std::ostream& out, const char* level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);

    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setw(3) << std::setfill('0')
        << millis << std::setfill(' ') << " " << level << ": " << message << std::endl;
}

int main(int argc, char** argv) {
    ListenerConfig config;
    if (argc >= 2) {
        auto port = parse_port(argv[1]);
        if (!port) {
            std::cerr << "Usage: " << argv[0] << " [port] [host]\n";
            std::cerr << "Invalid port '" << argv[1] << "' (expected 1-65535)\n";
            return 1;
        }
        config.port = *port;
    }
    if (argc >= 3) {
        config.host = argv[2];
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto listener = [&]() -> std::optional<TelemetryListener> {
        try {
            return std::optional<TelemetryListener>(std::in_place, config);
        } catch (const SocketError& e) {
            std::cout << "Unable to setup connection: " << std::strerror(e.errno_value()) << "\n";
            std::cout << "Failed to open connector, stopping.\n";
            return std::nullopt;
        }
    }();
    if (!listener) {
        return 127;
    }

    // Wake up once a second to check keep_running
    listener->try_set_timeout(std::chrono::seconds(1));

    std::ostringstream banner;
    banner << "Listening on " << (config.host.empty() ? "*" : config.host) << ":"
           << listener->socket_port();
    log_line(std::cerr, "INFO", banner.str());

    size_t packet_count = 0;
    size_t error_count = 0;

    while (keep_running.load()) {
        try {
            Packet pkt = listener->receive_one();
            ++packet_count;
            std::cout << to_text(pkt) << "\n";
        } catch (const ReceiveTimeoutError&) {
            continue;
        } catch (const DecodeError& e) {
            ++error_count;
            log_line(std::cerr, "WARNING", std::string("Skipping datagram: ") + e.what());
        } catch (const SocketError& e) {
            log_line(std::cerr, "ERROR", e.what());
            return 1;
        }
    }

    std::ostringstream summary;
    summary << "Stopped after " << packet_count << " packets (" << error_count
            << " undecodable datagrams)";
    log_line(std::cerr, "INFO", summary.str());
    return 0;
}
