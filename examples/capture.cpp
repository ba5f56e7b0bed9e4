#include <array>
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>

#include <csignal>
#include <f1telem.hpp>
#include <f1telem_io.hpp>

using namespace f1telem;

// Global flag for graceful shutdown
std::atomic<bool> keep_running{true};

void signal_handler(int) {
    keep_running.store(false);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <output_dir> [port]\n";
        std::cerr << "\n";
        std::cerr << "Example: " << argv[0] << " samples 20777\n";
        std::cerr << "  Saves one packet of each type to samples/<type>.bin\n";
        std::cerr << "  (Press Ctrl+C to stop early)\n";
        return 1;
    }

    ListenerConfig config;
    if (argc >= 3) {
        auto port = parse_port(argv[2]);
        if (!port) {
            std::cerr << "Invalid port '" << argv[2] << "' (expected 1-65535)\n";
            return 1;
        }
        config.port = *port;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    SamplePacketStore store(argv[1]);
    std::array<bool, packet_id_count> captured{};
    size_t remaining = packet_id_count;

    try {
        TelemetryListener listener(config);
        listener.try_set_timeout(std::chrono::seconds(1));

        std::cout << "Capturing samples on UDP port " << listener.socket_port() << " into "
                  << store.directory().string() << "\n";

        while (keep_running.load() && remaining > 0) {
            try {
                // Keep the datagram as received so samples stay byte-exact
                auto datagram = listener.receive_datagram();
                Packet pkt = listener.registry().decode(datagram);
                size_t index = pkt.index();
                if (captured[index]) {
                    continue;
                }

                auto path = store.save(pkt, datagram);
                captured[index] = true;
                --remaining;
                std::cout << "Saved " << packet_name(pkt) << " -> " << path.string() << " ("
                          << remaining << " remaining)\n";
            } catch (const ReceiveTimeoutError&) {
                continue;
            } catch (const DecodeError& e) {
                std::cerr << "Skipping datagram: " << e.what() << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (remaining > 0) {
        std::cout << "Stopped with " << remaining << " packet types not captured\n";
    }
    return 0;
}
