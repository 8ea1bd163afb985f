#pragma once

/**
 * @file url.hpp
 * @brief Parsed resource locators
 *
 * A Url is parsed once by the caller and passed by const reference through
 * the download stack. The engine never mutates it.
 */

#include "platform.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace netfetch::common {

/**
 * @brief URL split into the components the transports need
 *
 * Userinfo is dropped while parsing. The scheme is stored lowercase.
 */
struct Url {
    std::string scheme;
    std::string host;      ///< Without IPv6 brackets
    uint16_t port = 0;     ///< 0 when the URL carries no explicit port
    std::string path;      ///< Always starts with '/'
    std::string query;     ///< Without the leading '?'

    /**
     * @brief Explicit port, or the scheme default (80/443)
     */
    uint16_t effective_port() const noexcept;

    /**
     * @brief Request target for an origin-form request line ("/path?query")
     */
    std::string target() const;

    /**
     * @brief Host as it appears in an authority (brackets around IPv6)
     */
    std::string authority_host() const;

    /**
     * @brief Host[:port] for the Host header, port omitted when default
     */
    std::string host_header() const;

    /**
     * @brief Local path for a file URL
     *
     * @return std::nullopt unless the scheme is "file", the host is empty
     *         or "localhost" and the path is absolute
     */
    std::optional<std::filesystem::path> to_file_path() const;

    std::string to_string() const;

    bool operator==(const Url& other) const = default;
};

/**
 * @brief Parse an absolute URL
 *
 * @return std::nullopt on a missing scheme, an invalid port or an empty host
 *         for schemes other than "file"
 */
NETFETCH_API std::optional<Url> parse_url(std::string_view text);

/**
 * @brief Resolve a redirect Location against the URL it came from
 *
 * Handles absolute URLs, scheme-relative ("//host/x"), absolute paths and
 * paths relative to the base directory.
 */
NETFETCH_API std::optional<Url> resolve_reference(const Url& base, std::string_view location);

/**
 * @brief URL encode a string
 */
NETFETCH_API std::string url_encode(std::string_view str);

/**
 * @brief URL decode a string
 *
 * @param plus_as_space Treat '+' as an encoded space (form encoding)
 */
NETFETCH_API std::string url_decode(std::string_view str, bool plus_as_space = true);

}  // namespace netfetch::common
