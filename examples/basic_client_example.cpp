#include <opensea_stream/client.hpp>
#include <opensea_stream/errors.hpp>
#include <opensea_stream/event_decoder.hpp>
#include <opensea_stream/logging.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace opensea_stream;

// Global flag for graceful shutdown
std::atomic<bool> running{true};

// Global logger instance
std::shared_ptr<Logger> logger;

void signalHandler(int) {
    running = false;
}

void printUsage() {
    std::cout << "OpenSea Stream C++ Client - Basic Example" << std::endl;
    std::cout << "=========================================" << std::endl;
    std::cout << "\nThis example demonstrates:" << std::endl;
    std::cout << "- Connecting to the OpenSea Stream API" << std::endl;
    std::cout << "- Subscribing to a collection" << std::endl;
    std::cout << "- Decoding and printing marketplace events" << std::endl;
    std::cout << "\nUsage: ./basic_client_example [options]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --help              Show this help message" << std::endl;
    std::cout << "  --token TOKEN       API key (default: $OPENSEA_API_KEY)" << std::endl;
    std::cout << "  --collection SLUG   Collection slug, '*' for all (default: *)" << std::endl;
    std::cout << "  --testnet           Connect to the testnet endpoint" << std::endl;
    std::cout << "  --debug             Enable debug logging" << std::endl;
    std::cout << "  --log-frames        Log every frame at TRACE level" << std::endl;
    std::cout << std::endl;
}

void printEvent(const StreamEvent& event) {
    if (const auto* listed = std::get_if<ItemListed>(&event.payload)) {
        logger->info("[{}] listed {} by {} for {} {}", listed->context.collection_slug,
                     listed->context.item.nft_id.to_string(), listed->maker, listed->base_price,
                     listed->payment_token.symbol);
    } else if (const auto* sold = std::get_if<ItemSold>(&event.payload)) {
        logger->info("[{}] sold {} to {} for {} {}", sold->context.collection_slug,
                     sold->context.item.nft_id.to_string(), sold->taker, sold->sale_price,
                     sold->payment_token.symbol);
    } else if (const auto* moved = std::get_if<ItemTransferred>(&event.payload)) {
        logger->info("[{}] transferred {} from {} to {}", moved->context.collection_slug,
                     moved->context.item.nft_id.to_string(), moved->from_account, moved->to_account);
    } else if (const auto* unknown = std::get_if<Unrecognized>(&event.payload)) {
        logger->info("unrecognized event '{}'", unknown->event_type);
    } else {
        auto kind = event_of(event.payload);
        logger->info("{} at {}", kind ? std::string(to_string(*kind)) : std::string("event"), event.sent_at);
    }
}

int main(int argc, char* argv[]) {
    logger = LoggerFactory::instance().getLogger("basic_client_example");

    const char* env_token = std::getenv("OPENSEA_API_KEY");
    std::string token = env_token != nullptr ? env_token : "";
    std::string slug = "*";
    Network network = Network::Mainnet;
    bool debugMode = false;
    bool logFrames = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--token" && i + 1 < argc) {
            token = argv[++i];
        } else if (arg == "--collection" && i + 1 < argc) {
            slug = argv[++i];
        } else if (arg == "--testnet") {
            network = Network::Testnet;
        } else if (arg == "--debug") {
            debugMode = true;
        } else if (arg == "--log-frames") {
            logFrames = true;
        } else {
            logger->error("Unknown argument: {}", arg);
            printUsage();
            return 1;
        }
    }

    if (token.empty()) {
        logger->error("No API key, pass --token or set OPENSEA_API_KEY");
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto config = SocketConfigBuilder()
                          .with_network(network)
                          .with_token(token)
                          .with_log_level(debugMode ? LogLevel::DEBUG : LogLevel::INFO)
                          .with_frame_logging(logFrames)
                          .build();
        if (logFrames) {
            config.logging.level = LogLevel::TRACE;
        }

        auto socket = make_client(config);
        auto collection = Collection::slug(slug);
        auto subscription = subscribe_to(*socket, collection);
        logger->info("Subscribed to {}, press Ctrl+C to stop", collection.to_topic());

        std::uint64_t undecodable = 0;
        while (running) {
            auto message = subscription.receiver.recv_for(std::chrono::milliseconds(500));
            if (!message) {
                if (subscription.receiver.is_finished()) {
                    logger->warn("Channel closed by server");
                    break;
                }
                continue;
            }
            if (auto event = decode_message(*message)) {
                printEvent(*event);
            } else {
                ++undecodable;
                logger->debug("Skipping undecodable {} frame", message->event);
            }
        }

        logger->info("Shutting down...");
        subscription.handler.close();

        auto stats = socket->get_stats();
        logger->info("Frames received: {}, undecodable events: {}, reconnects: {}",
                     stats.frames_received, undecodable, stats.reconnects);
        socket->disconnect();

    } catch (const ChannelError& e) {
        logger->error("Subscription ended: {}", e.what());
        return 1;
    } catch (const StreamException& e) {
        logger->error("{}", e.what());
        return 1;
    }

    return 0;
}
