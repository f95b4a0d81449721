#ifndef IGDPP_SOAP_HEADER
#define IGDPP_SOAP_HEADER

#include "error.hpp"
#include "control_session.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace igd {

/**
 * Named action arguments or results. Arguments are sent in the order they are
 * listed here and results keep the order of the response document.
 */
using soap_arguments = std::vector<std::pair<std::string, std::string>>;

/** Returns the value of the argument named @p name, or null if there's none. */
const std::string* find_argument(const soap_arguments& args, const std::string& name);

/** Builds the SOAP 1.1 envelope that invokes @p action of @p service_type. */
std::string make_soap_envelope(const std::string& service_type,
        const std::string& action, const soap_arguments& args);

/**
 * @brief Extracts the result of @p action from a SOAP response document.
 *
 * @param error Set to a fault code in the `upnp` category if @p body is a SOAP
 * fault, or to `error::client::malformed_response` if @p body is neither a
 * fault nor a response to @p action.
 *
 * @return The children of the `<action>Response` element, by local name.
 */
soap_arguments parse_soap_response(const std::string& body,
        const std::string& action, error_code& error);

/**
 * @brief Invokes @p action of @p service_type on the control URL of a gateway
 * and waits for the result.
 *
 * @param timeout Bounds the whole HTTP exchange.
 *
 * @param error Set to a fault code in the `upnp` category if the gateway
 * rejected the action. Any other error means the gateway could not be reached
 * or did not answer intelligibly (see @ref is_transport_error).
 */
soap_arguments invoke(const std::string& control_url, const std::string& service_type,
        const std::string& action, const soap_arguments& args,
        std::chrono::milliseconds timeout, error_code& error);

/** Invokes @p action of the service @p which of the gateway of @p session. */
soap_arguments invoke(const control_session& session, service which,
        const std::string& action, const soap_arguments& args,
        std::chrono::milliseconds timeout, error_code& error);

} // igd

#include "impl/soap.ipp"

#endif // IGDPP_SOAP_HEADER
