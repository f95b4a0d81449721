#ifndef IGDPP_URL_HEADER
#define IGDPP_URL_HEADER

#include "error.hpp"

#include <cstdint>
#include <string>

namespace igd {

/** The parts of an `http://` URL that UPnP devices hand out. */
struct url
{
    std::string scheme;
    std::string host;
    uint16_t port = 80;
    // Always starts with a '/'. Includes the query, if any.
    std::string path = "/";

    /** Returns "scheme://host:port", the base relative references resolve to. */
    std::string origin() const;
};

/**
 * @brief Splits @p s into its parts.
 *
 * Only the `http` scheme is accepted, since that is what SSDP locations and
 * control URLs use. A missing port defaults to 80 and a missing path to "/".
 *
 * @param error Set to `error::client::invalid_argument` if @p s is not such a
 * URL.
 */
url parse_url(const std::string& s, error_code& error);

/**
 * @brief Resolves @p reference against @p base the way UPnP control points
 * do.
 *
 * Absolute references are returned unchanged, references starting with a '/'
 * replace the path of @p base, and any other reference is appended to @p base
 * with exactly one '/' in between.
 */
std::string resolve_url(const std::string& base, const std::string& reference);

} // igd

#include "impl/url.ipp"

#endif // IGDPP_URL_HEADER
