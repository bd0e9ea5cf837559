#include <opensea_stream/client.hpp>
#include <opensea_stream/errors.hpp>
#include <opensea_stream/logging.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <thread>

using namespace opensea_stream;

std::atomic<bool> running{true};
std::shared_ptr<Logger> logger;

void signalHandler(int) {
    running = false;
}

// Subscribes to every collection and reports connection changes and rejoins
// until interrupted. Pull the network cable to watch the socket recover.
int main(int argc, char* argv[]) {
    logger = LoggerFactory::instance().getLogger("reconnect_example");

    const char* env_token = std::getenv("OPENSEA_API_KEY");
    std::string token = argc > 1 ? argv[1] : (env_token != nullptr ? env_token : "");
    if (token.empty()) {
        logger->error("Usage: reconnect_example <token> (or set OPENSEA_API_KEY)");
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    ReconnectPolicy policy;
    policy.initial_delay = std::chrono::milliseconds(250);
    policy.max_delay = std::chrono::seconds(10);
    policy.max_attempts = 20;

    auto config = SocketConfigBuilder()
                      .with_network(Network::Mainnet)
                      .with_token(token)
                      .with_heartbeat_interval(std::chrono::seconds(10))
                      .with_heartbeat_timeout_multiplier(2)
                      .with_reconnect_policy(policy)
                      .build();

    Socket socket(config);
    socket.set_connection_state_callback([](ConnectionState from, ConnectionState to) {
        logger->info("Connection {} -> {}", to_string(from), to_string(to));
    });
    socket.set_error_callback([](const std::string& error) {
        logger->warn("Socket error: {}", error);
    });

    try {
        socket.connect();
        auto subscription = socket.join(Collection::all());

        std::uint64_t received = 0;
        auto last_report = std::chrono::steady_clock::now();
        while (running) {
            if (subscription.receiver.recv_for(std::chrono::milliseconds(500))) {
                ++received;
            } else if (subscription.receiver.is_finished()) {
                logger->warn("Channel closed");
                break;
            }

            auto now = std::chrono::steady_clock::now();
            if (now - last_report >= std::chrono::seconds(10)) {
                auto stats = socket.get_stats();
                logger->info("received={} reconnects={} rejoins={} heartbeat_timeouts={} dropped={} uptime={}ms",
                             received, stats.reconnects, stats.rejoins, stats.heartbeat_timeouts,
                             stats.frames_dropped(), stats.get_current_uptime().count());
                last_report = now;
            }
        }
    } catch (const RejoinError& e) {
        logger->error("Could not restore the subscription: {}", e.what());
        return 1;
    } catch (const StreamException& e) {
        logger->error("{}", e.what());
        return 1;
    }

    socket.disconnect();
    return 0;
}
