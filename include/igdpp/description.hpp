#ifndef IGDPP_DESCRIPTION_HEADER
#define IGDPP_DESCRIPTION_HEADER

#include "error.hpp"
#include "control_session.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace igd {

struct service_endpoint
{
    std::string service_type;
    // As found in the document, possibly relative.
    std::string control_url;

    bool empty() const noexcept { return control_url.empty(); }
};

/** The parts of a device description a control point needs. */
struct device_description
{
    // Empty if the document has no URLBase element.
    std::string url_base;
    // The first WANIPConnection or WANPPPConnection service.
    service_endpoint connection;
    // The first WANCommonInterfaceConfig service.
    service_endpoint common_interface_config;

    /** Whether both services needed to control the gateway were found. */
    bool is_igd() const noexcept
    {
        return !connection.empty() && !common_interface_config.empty();
    }
};

/**
 * @brief Parses a UPnP device description document.
 *
 * Services are searched in document order through all nested devices.
 *
 * @param error Set to `error::client::malformed_response` if @p xml is not a
 * device description. A description lacking the needed services is not an
 * error, see @ref device_description::is_igd.
 */
device_description parse_description(const std::string& xml, error_code& error);

/**
 * @brief Turns the description found at @p location into a session.
 *
 * Control URLs are resolved against the description's URLBase, or the origin
 * of @p location if it has none. The LAN address is the one this host uses
 * toward the control URL's host, or if that is a name, toward the host of
 * @p location, or if that is a name too, toward the default gateway.
 */
control_session make_session(const device_description& description,
        const std::string& location, error_code& error);

/**
 * @brief Fetches each description in @p locations, in order, and returns the
 * session of the first one that describes a usable gateway.
 *
 * Candidates that cannot be fetched or parsed are skipped.
 *
 * @param error Set to `error::client::no_valid_igd` if no candidate is usable.
 */
control_session fetch_and_validate(const std::vector<std::string>& locations,
        std::chrono::milliseconds timeout, error_code& error);

} // igd

#include "impl/description.ipp"

#endif // IGDPP_DESCRIPTION_HEADER
