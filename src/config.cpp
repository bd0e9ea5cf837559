#include "opensea_stream/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace opensea_stream {

namespace {

constexpr const char* MAINNET_URL = "wss://stream.openseabeta.com/socket/websocket";
constexpr const char* TESTNET_URL = "wss://testnets-stream.openseabeta.com/socket/websocket";

// Keeps '-', '_', '.', '~' and alphanumerics as is (RFC 3986 unreserved)
std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace

std::string network_url(Network network) {
    switch (network) {
        case Network::Mainnet: return MAINNET_URL;
        case Network::Testnet: return TESTNET_URL;
    }
    return MAINNET_URL;
}

std::string build_socket_url(const std::string& base_url, const std::string& token) {
    if (token.empty()) {
        return base_url;
    }
    auto fragment_pos = base_url.find('#');
    std::string base = base_url.substr(0, fragment_pos);
    std::string fragment = fragment_pos == std::string::npos ? "" : base_url.substr(fragment_pos);

    char separator = base.find('?') == std::string::npos ? '?' : '&';
    if (!base.empty() && (base.back() == '?' || base.back() == '&')) {
        separator = '\0';
    }

    std::string url = base;
    if (separator != '\0') {
        url.push_back(separator);
    }
    url += "token=" + url_encode(token);
    return url + fragment;
}

void apply_logging_config(const LoggingConfig& config) {
    auto& factory = LoggerFactory::instance();
    factory.setDefaultLevel(config.level);

    // The factory starts with a colored console sink; only rebuild when that is not wanted
    if (config.enable_console && config.use_colors && config.log_file.empty()) {
        return;
    }
    factory.clearDefaultSinks();
    factory.configureConsoleLogging(config.enable_console, config.use_colors);
    if (!config.log_file.empty()) {
        factory.configureFileLogging(config.log_file, config.max_file_size);
    }
}

std::chrono::milliseconds ReconnectPolicy::delay_for(int attempt) const {
    if (attempt <= 1) {
        return std::min(initial_delay, max_delay);
    }
    double scaled = static_cast<double>(initial_delay.count()) *
                    std::pow(multiplier, static_cast<double>(attempt - 1));
    if (!std::isfinite(scaled) || scaled >= static_cast<double>(max_delay.count())) {
        return max_delay;
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(scaled));
}

bool ReconnectPolicy::exhausted(int attempts) const noexcept {
    return max_attempts > 0 && attempts >= max_attempts;
}

void ReconnectPolicy::validate() const {
    if (initial_delay.count() <= 0) {
        throw ConfigurationException("Reconnect initial delay must be positive");
    }
    if (multiplier < 1.0) {
        throw ConfigurationException("Reconnect multiplier must be at least 1.0");
    }
    if (max_delay < initial_delay) {
        throw ConfigurationException("Reconnect max delay cannot be below the initial delay");
    }
    if (max_attempts < 0) {
        throw ConfigurationException("Reconnect max attempts cannot be negative");
    }
}

std::string SocketConfig::socket_url() const {
    return build_socket_url(endpoint, token);
}

void SocketConfig::validate() const {
    static const std::regex url_pattern(R"(^wss?://[^/\s:?#]+(:\d{1,5})?([/?#]\S*)?$)",
                                        std::regex::icase);
    if (endpoint.empty()) {
        throw ConfigurationException("Endpoint cannot be empty");
    }
    if (!std::regex_match(endpoint, url_pattern)) {
        throw ConfigurationException("Endpoint must be a ws:// or wss:// URL: " + endpoint);
    }
    if (connect_timeout.count() <= 0) {
        throw ConfigurationException("Connect timeout must be positive");
    }
    if (heartbeat_interval.count() <= 0) {
        throw ConfigurationException("Heartbeat interval must be positive");
    }
    if (heartbeat_timeout_multiplier < 1) {
        throw ConfigurationException("Heartbeat timeout multiplier must be at least 1");
    }
    if (join_timeout.count() <= 0) {
        throw ConfigurationException("Join timeout must be positive");
    }
    if (leave_timeout.count() <= 0) {
        throw ConfigurationException("Leave timeout must be positive");
    }
    reconnect.validate();
}

SocketConfigBuilder::SocketConfigBuilder() = default;

SocketConfigBuilder& SocketConfigBuilder::with_network(Network network) {
    config_.endpoint = network_url(network);
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_endpoint(const std::string& endpoint) {
    config_.endpoint = endpoint;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_token(const std::string& token) {
    config_.token = token;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_connect_timeout(std::chrono::milliseconds timeout) {
    config_.connect_timeout = timeout;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_heartbeat_interval(
    std::chrono::milliseconds interval) {
    config_.heartbeat_interval = interval;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_heartbeat_timeout_multiplier(int multiplier) {
    config_.heartbeat_timeout_multiplier = multiplier;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_join_timeout(std::chrono::milliseconds timeout) {
    config_.join_timeout = timeout;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_leave_timeout(std::chrono::milliseconds timeout) {
    config_.leave_timeout = timeout;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_reconnect_policy(const ReconnectPolicy& policy) {
    config_.reconnect = policy;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_auto_reconnect(bool enabled) {
    config_.reconnect.enabled = enabled;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_queue_capacity(std::size_t capacity) {
    config_.queue_capacity = capacity;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_log_level(LogLevel level) {
    config_.logging.level = level;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_log_file(const std::string& path) {
    config_.logging.log_file = path;
    return *this;
}

SocketConfigBuilder& SocketConfigBuilder::with_frame_logging(bool enabled) {
    config_.logging.log_frames = enabled;
    return *this;
}

SocketConfig SocketConfigBuilder::build() const {
    SocketConfig config = config_;
    config.validate();
    return config;
}

std::uint64_t SocketStats::frames_dropped() const {
    return frames_malformed + frames_dropped_orphan + frames_dropped_stale + frames_undeliverable;
}

std::chrono::milliseconds SocketStats::get_current_uptime() const {
    if (!is_connected) {
        return total_uptime;
    }

    auto now = std::chrono::steady_clock::now();
    auto current_session_uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - connection_established_time);

    return total_uptime + current_session_uptime;
}

double SocketStats::get_connection_success_rate() const {
    if (connection_attempts == 0) {
        return 0.0;
    }
    return static_cast<double>(successful_connections) / static_cast<double>(connection_attempts);
}

} // namespace opensea_stream
