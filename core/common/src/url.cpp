#include <netfetch/common/url.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <vector>

namespace netfetch::common {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool valid_scheme(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Collapse "." and ".." segments of an absolute path
std::string remove_dot_segments(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t pos = 1;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        auto seg = path.substr(pos, next - pos);
        if (seg == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            if (next == path.size()) {
                segments.emplace_back();
            }
        } else if (seg == ".") {
            if (next == path.size()) {
                segments.emplace_back();
            }
        } else {
            segments.push_back(seg);
        }
        pos = next + 1;
    }

    std::string out;
    for (auto seg : segments) {
        out += '/';
        out += seg;
    }
    return out.empty() ? "/" : out;
}

uint16_t default_port(std::string_view scheme) noexcept {
    if (scheme == "https") {
        return 443;
    }
    if (scheme == "http") {
        return 80;
    }
    return 0;
}

}  // anonymous namespace

// ============================================================================
// Url
// ============================================================================

uint16_t Url::effective_port() const noexcept {
    return port != 0 ? port : default_port(scheme);
}

std::string Url::target() const {
    std::string out = path.empty() ? "/" : path;
    if (!query.empty()) {
        out += '?';
        out += query;
    }
    return out;
}

std::string Url::authority_host() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]";
    }
    return host;
}

std::string Url::host_header() const {
    auto out = authority_host();
    if (port != 0 && port != default_port(scheme)) {
        out += ':';
        out += std::to_string(port);
    }
    return out;
}

std::optional<std::filesystem::path> Url::to_file_path() const {
    if (scheme != "file") {
        return std::nullopt;
    }
    if (!host.empty() && host != "localhost") {
        return std::nullopt;
    }
    if (path.empty() || path[0] != '/') {
        return std::nullopt;
    }
    return std::filesystem::path(url_decode(path, false));
}

std::string Url::to_string() const {
    std::string out = scheme + "://" + authority_host();
    if (port != 0) {
        out += ':';
        out += std::to_string(port);
    }
    out += target();
    return out;
}

// ============================================================================
// Parsing
// ============================================================================

std::optional<Url> parse_url(std::string_view text) {
    Url url;

    auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos) {
        // "file:/path" is accepted as well as "file:///path"
        auto colon = text.find(':');
        if (colon == std::string_view::npos || to_lower(text.substr(0, colon)) != "file" ||
            colon + 1 >= text.size() || text[colon + 1] != '/') {
            return std::nullopt;
        }
        url.scheme = "file";
        url.path   = std::string(text.substr(colon + 1));
        return url;
    }

    if (!valid_scheme(text.substr(0, scheme_end))) {
        return std::nullopt;
    }
    url.scheme = to_lower(text.substr(0, scheme_end));

    auto rest          = text.substr(scheme_end + 3);
    auto authority_end = rest.find_first_of("/?#");
    auto authority     = rest.substr(0, authority_end);
    auto remainder =
        authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    // Drop userinfo
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view port_text;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        url.host = std::string(authority.substr(1, close - 1));
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                return std::nullopt;
            }
            port_text = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            url.host  = std::string(authority.substr(0, colon));
            port_text = authority.substr(colon + 1);
        } else {
            url.host = std::string(authority);
        }
    }

    if (!port_text.empty()) {
        uint16_t port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size()) {
            return std::nullopt;
        }
        url.port = port;
    }

    if (url.host.empty() && url.scheme != "file") {
        return std::nullopt;
    }

    // Fragment never reaches the wire
    auto hash = remainder.find('#');
    if (hash != std::string_view::npos) {
        remainder = remainder.substr(0, hash);
    }

    auto query_start = remainder.find('?');
    if (query_start != std::string_view::npos) {
        url.path  = std::string(remainder.substr(0, query_start));
        url.query = std::string(remainder.substr(query_start + 1));
    } else {
        url.path = std::string(remainder);
    }
    if (url.path.empty()) {
        url.path = "/";
    }

    return url;
}

std::optional<Url> resolve_reference(const Url& base, std::string_view location) {
    if (location.empty()) {
        return std::nullopt;
    }

    if (location.find("://") != std::string_view::npos) {
        return parse_url(location);
    }

    if (location.size() >= 2 && location[0] == '/' && location[1] == '/') {
        return parse_url(base.scheme + ":" + std::string(location));
    }

    Url url   = base;
    url.query.clear();

    auto hash = location.find('#');
    if (hash != std::string_view::npos) {
        location = location.substr(0, hash);
    }
    auto query_start = location.find('?');
    std::string_view path_part = location.substr(0, query_start);
    if (query_start != std::string_view::npos) {
        url.query = std::string(location.substr(query_start + 1));
    }

    if (path_part.empty()) {
        url.path = base.path;
    } else if (path_part[0] == '/') {
        url.path = remove_dot_segments(path_part);
    } else {
        auto slash = base.path.rfind('/');
        std::string merged =
            (slash == std::string::npos ? std::string("/") : base.path.substr(0, slash + 1));
        merged += path_part;
        url.path = remove_dot_segments(merged);
    }

    return url;
}

// ============================================================================
// Encoding
// ============================================================================

std::string url_encode(std::string_view str) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;

    for (char c : str) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' ||
            c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return encoded.str();
}

std::string url_decode(std::string_view str, bool plus_as_space) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex_value(str[i + 1]);
            int lo = hex_value(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded += static_cast<char>((hi << 4) | lo);
                i += 2;
            } else {
                decoded += str[i];
            }
        } else if (plus_as_space && str[i] == '+') {
            decoded += ' ';
        } else {
            decoded += str[i];
        }
    }

    return decoded;
}

}  // namespace netfetch::common
