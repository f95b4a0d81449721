#ifndef IGDPP_CONTROL_SESSION_HEADER
#define IGDPP_CONTROL_SESSION_HEADER

#include <string>

namespace igd {

/** The two services of a gateway that actions are addressed to. */
enum class service
{
    // WANIPConnection or WANPPPConnection.
    connection,
    // WANCommonInterfaceConfig.
    common_interface_config,
};

/**
 * Everything needed to talk to a validated gateway. Built once per successful
 * discovery and never modified afterwards.
 */
struct control_session
{
    // The description document this session was derived from.
    std::string location;
    std::string url_base;
    std::string control_url;
    std::string service_type;
    std::string control_url_cif;
    std::string service_type_cif;
    // The address of this host on the gateway's LAN.
    std::string lan_ip;

    const std::string& control_url_of(service s) const noexcept
    {
        return s == service::connection ? control_url : control_url_cif;
    }

    const std::string& service_type_of(service s) const noexcept
    {
        return s == service::connection ? service_type : service_type_cif;
    }
};

} // igd

#endif // IGDPP_CONTROL_SESSION_HEADER
