#include "opensea_stream/transport.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "opensea_stream/errors.hpp"

namespace opensea_stream {

ParsedUrl parse_url(const std::string& url) {
    static const std::regex pattern(R"(^([A-Za-z]+)://([^/:?#\s]+)(?::(\d{1,5}))?([^#\s]*)?(#\S*)?$)");
    std::smatch match;
    if (!std::regex_match(url, match, pattern)) {
        throw ConnectionError("malformed URL: " + url);
    }

    std::string scheme = match[1].str();
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    ParsedUrl parsed;
    if (scheme == "wss") {
        parsed.secure = true;
    } else if (scheme != "ws") {
        throw ConnectionError("unsupported URL scheme '" + scheme + "' in " + url);
    }

    parsed.host = match[2].str();
    parsed.port = match[3].matched ? match[3].str() : (parsed.secure ? "443" : "80");
    if (std::stoi(parsed.port) > 65535) {
        throw ConnectionError("port out of range in " + url);
    }

    parsed.target = match[4].str();
    if (parsed.target.empty()) {
        parsed.target = "/";
    } else if (parsed.target.front() == '?') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    return parsed;
}

} // namespace opensea_stream
