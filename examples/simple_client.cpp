/**
 * Example: send commands to an interpreter server
 *
 * Opens the platform default channel (or TCP when a port is given with -p)
 * and sends each remaining argument as one request.
 *
 * Build with: cmake -DINTERLINK_BUILD_EXAMPLES=ON
 * Run: ./simple_client [-p port | -s id] '(plus 1 2)' ...
 */

#include <cstring>
#include <iostream>
#include <interlink/interlink.hpp>

int main(int argc, char *argv[]) {
    interlink::ChannelConfig config;

    int first = 1;
    if (argc >= 3 && std::strcmp(argv[1], "-p") == 0) {
        config.kind = interlink::ChannelKind::Tcp;
        config.id = argv[2];
        first = 3;
    } else if (argc >= 3 && std::strcmp(argv[1], "-s") == 0) {
        config.kind = interlink::ChannelKind::Unix;
        config.id = argv[2];
        first = 3;
    }

    if (first >= argc) {
        std::cerr << "Usage: " << argv[0] << " [-p port | -s id] <command> [command...]\n";
        return 1;
    }

    try {
        auto channel = interlink::channel::open_channel(config);

        for (int i = first; i < argc; ++i) {
            try {
                std::cout << channel->send(argv[i]) << "\n";
            } catch (const interlink::channel::ReceiveAborted &e) {
                std::cerr << e.what() << "\n";
                auto repaired = channel->try_repair();
                if (!repaired.success) {
                    std::cerr << "Repair failed: " << repaired.error << "\n";
                    return 1;
                }
                std::cout << repaired.value << "\n";
            } catch (const interlink::channel::RemoteFailure &e) {
                std::cerr << "Server error: " << e.what() << "\n";
            }
        }
    } catch (const interlink::channel::ChannelError &e) {
        std::cerr << "Channel error (" << interlink::channel::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
