#pragma once

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace opensea_stream {

/**
 * @brief Raw stderr tracing, enabled with OPENSEA_STREAM_DEBUG=1
 *
 * Bypasses the logger so it works before logging is configured and during teardown.
 */
class DebugLogger {
public:
    static constexpr std::size_t MAX_FRAME_DUMP = 512;

    static bool is_debug_enabled() {
        static bool debug_enabled = []() {
            const char* debug_env = std::getenv("OPENSEA_STREAM_DEBUG");
            return debug_env && std::string(debug_env) == "1";
        }();
        return debug_enabled;
    }

    template<typename... Args>
    static void debug(const std::string& prefix, Args&&... args) {
        if (is_debug_enabled()) {
            std::lock_guard<std::mutex> lock(mutex());
            std::cerr << prefix;
            (std::cerr << ... << args);
            std::cerr << std::endl;
        }
    }

    /**
     * @brief Dump a text frame, cut at MAX_FRAME_DUMP characters
     */
    static void debug_frame(std::string_view direction, std::string_view frame) {
        if (!is_debug_enabled()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex());
        std::cerr << "[FRAME " << direction << "] " << frame.substr(0, MAX_FRAME_DUMP);
        if (frame.size() > MAX_FRAME_DUMP) {
            std::cerr << "... (" << frame.size() << " bytes)";
        }
        std::cerr << std::endl;
    }

private:
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }
};

#define DEBUG_LOG(...) ::opensea_stream::DebugLogger::debug("[DEBUG] ", __VA_ARGS__)
#define DEBUG_FRAME(direction, frame) ::opensea_stream::DebugLogger::debug_frame(direction, frame)

} // namespace opensea_stream
