#ifndef IGDPP_ERROR_HEADER
#define IGDPP_ERROR_HEADER

#include <type_traits>
#include <string>

#include <asio/error.hpp>

namespace igd {

using asio::error_code;
using asio::error_category;

namespace error {

/**
 * Fault codes a gateway reports in the `UPnPError` element of a SOAP fault.
 *
 * Gateways may report codes not listed here, so any integer is a valid value
 * of the `upnp` category.
 */
enum class upnp
{
    invalid_args = 402,
    action_failed = 501,
    specified_array_index_invalid = 713,
    no_such_entry_in_array = 714,
    wild_card_not_permitted_in_src_ip = 715,
    wild_card_not_permitted_in_ext_port = 716,
    conflict_in_mapping_entry = 718,
    same_port_values_required = 724,
    only_permanent_leases_supported = 725,
    remote_host_only_supports_wildcard = 726,
    external_port_only_supports_wildcard = 727,
};

/** Failures detected on this side of the wire. */
enum class client
{
    // A port is outside [1, 65535], the protocol is neither TCP nor UDP, or an
    // option has a value out of range.
    invalid_argument = 1,
    // No discovery has bound the control point to a gateway.
    not_discovered,
    // Nobody answered the SSDP search within the discovery window.
    no_device_found,
    // Devices answered but none of them offers a usable WAN connection and
    // common interface config service pair.
    no_valid_igd,
    // A statistics action returned nothing, a negative or a non-numeric value.
    statistic_unavailable,
    // The peer's reply could not be parsed.
    malformed_response,
    // The peer answered with an unexpected HTTP status.
    http_error,
};

/**
 * Returns the human readable text of a UPnP fault code. Unknown codes yield
 * "Unknown Error: <code>".
 */
inline std::string describe(int code)
{
    switch(code) {
    case 402: return "402 Invalid Args";
    case 501: return "501 Action Failed";
    case 713: return "713 SpecifiedArrayIndexInvalid: The specified array index "
                     "is out of bounds";
    case 714: return "714 NoSuchEntryInArray: The specified value does not exist "
                     "in the array";
    case 715: return "715 WildCardNotPermittedInSrcIP: The source IP address "
                     "cannot be wild-carded";
    case 716: return "716 WildCardNotPermittedInExtPort: The external port "
                     "cannot be wild-carded";
    case 718: return "718 ConflictInMappingEntry: The port mapping entry "
                     "specified conflicts with a mapping assigned previously to "
                     "another client";
    case 724: return "724 SamePortValuesRequired: Internal and External port "
                     "values must be the same";
    case 725: return "725 OnlyPermanentLeasesSupported: The NAT implementation "
                     "only supports permanent lease times on port mappings";
    case 726: return "726 RemoteHostOnlySupportsWildcard: RemoteHost must be a "
                     "wildcard and cannot be a specific IP address or DNS name";
    case 727: return "727 ExternalPortOnlySupportsWildcard: ExternalPort must be "
                     "a wildcard and cannot be a specific port value";
    default: return "Unknown Error: " + std::to_string(code);
    }
}

struct upnp_error_category : public igd::error_category
{
    const char* name() const noexcept override { return "upnp"; }
    std::string message(int ev) const override { return describe(ev); }
};

struct client_error_category : public igd::error_category
{
    const char* name() const noexcept override { return "igd"; }
    std::string message(int ev) const override
    {
        switch(static_cast<client>(ev)) {
        case client::invalid_argument: return "Invalid argument";
        case client::not_discovered: return "No gateway has been discovered";
        case client::no_device_found: return "No UPnP device found";
        case client::no_valid_igd: return "No valid Internet Gateway Device found";
        case client::statistic_unavailable: return "Statistic unavailable";
        case client::malformed_response: return "Malformed response";
        case client::http_error: return "Unexpected HTTP status";
        default: return "Unknown";
        }
    }
};

inline const upnp_error_category& get_upnp_error_category()
{
    static upnp_error_category instance;
    return instance;
}

inline const client_error_category& get_client_error_category()
{
    static client_error_category instance;
    return instance;
}

// Found through argument dependent lookup, so these live next to the enums.
inline error_code make_error_code(upnp ec)
{
    return error_code(static_cast<int>(ec), get_upnp_error_category());
}

inline error_code make_error_code(client ec)
{
    return error_code(static_cast<int>(ec), get_client_error_category());
}

} // error

/** Builds the error for a fault code reported by a gateway. */
inline error_code make_soap_fault(int code)
{
    return error_code(code, error::get_upnp_error_category());
}

/** Determines if @p ec is a fault the gateway returned for an action. */
inline bool is_soap_fault(const error_code& ec)
{
    return ec && ec.category() == error::get_upnp_error_category();
}

/**
 * Determines if @p ec means the gateway could not be reached or did not
 * answer intelligibly, as opposed to having rejected an action or the caller
 * having passed bad arguments.
 */
inline bool is_transport_error(const error_code& ec)
{
    if(!ec || is_soap_fault(ec)) {
        return false;
    }
    if(ec.category() == error::get_client_error_category()) {
        return ec == make_error_code(error::client::malformed_response)
            || ec == make_error_code(error::client::http_error);
    }
    return true;
}

} // igd

namespace std {
template<> struct is_error_code_enum<igd::error::upnp> : public true_type {};
template<> struct is_error_code_enum<igd::error::client> : public true_type {};
} // std

#endif // IGDPP_ERROR_HEADER
