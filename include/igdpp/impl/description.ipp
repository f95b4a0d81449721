#ifndef IGDPP_DESCRIPTION_IMPL
#define IGDPP_DESCRIPTION_IMPL

#include "../description.hpp"
#include "../gateway.hpp"
#include "../url.hpp"
#include "../detail/http_client.hpp"
#include "../detail/xml.hpp"

#include <spdlog/spdlog.h>

namespace igd {
namespace detail {

inline bool is_service_of(const std::string& service_type, const char* name)
{
    return service_type.find(std::string(":service:") + name + ':') != std::string::npos;
}

// Walks every <service> below @p node in document order, keeping the first
// match of each kind.
inline void collect_services(xmlNode* node, device_description& description)
{
    for(auto* child = node ? node->children : nullptr; child; child = child->next) {
        if(child->type != XML_ELEMENT_NODE) {
            continue;
        }
        if(is_element(child, "service")) {
            service_endpoint endpoint{child_text(child, "serviceType"),
                    child_text(child, "controlURL")};
            if(endpoint.empty()) {
                continue;
            }
            if(description.connection.empty()
                    && (is_service_of(endpoint.service_type, "WANIPConnection")
                        || is_service_of(endpoint.service_type, "WANPPPConnection"))) {
                description.connection = std::move(endpoint);
            } else if(description.common_interface_config.empty()
                    && is_service_of(endpoint.service_type, "WANCommonInterfaceConfig")) {
                description.common_interface_config = std::move(endpoint);
            }
        } else {
            collect_services(child, description);
        }
    }
}

} // detail

inline device_description parse_description(const std::string& xml, error_code& error)
{
    error = error_code();
    // Routers are known to serve slightly broken documents.
    const auto doc = detail::parse_xml(xml, true);
    auto* root = doc ? xmlDocGetRootElement(doc.get()) : nullptr;
    if(!root || !detail::is_element(root, "root")) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }

    device_description description;
    description.url_base = detail::child_text(root, "URLBase");
    detail::collect_services(detail::find_child(root, "device"), description);
    return description;
}

inline control_session make_session(const device_description& description,
        const std::string& location, error_code& error)
{
    error = error_code();
    const auto location_url = parse_url(location, error);
    if(error) {
        return {};
    }

    control_session session;
    session.location = location;
    session.url_base = description.url_base.empty()
        ? location_url.origin() : description.url_base;
    session.control_url = resolve_url(session.url_base, description.connection.control_url);
    session.service_type = description.connection.service_type;
    session.control_url_cif = resolve_url(session.url_base,
            description.common_interface_config.control_url);
    session.service_type_cif = description.common_interface_config.service_type;

    const auto control = parse_url(session.control_url, error);
    if(error) {
        return {};
    }
    // Gateways advertise literal addresses. A name would need resolving first,
    // so fall back to the address the description came from, and then to the
    // default route.
    auto gateway = asio::ip::make_address(control.host, error);
    if(error) {
        gateway = asio::ip::make_address(location_url.host, error);
    }
    if(error) {
        gateway = default_gateway_address(error);
        if(error) {
            return {};
        }
    }
    session.lan_ip = local_address_towards(gateway, error).to_string();
    if(error) {
        return {};
    }
    return session;
}

inline control_session fetch_and_validate(const std::vector<std::string>& locations,
        std::chrono::milliseconds timeout, error_code& error)
{
    for(const auto& location : locations) {
        const auto response = detail::http_request("GET", location, {}, {}, timeout, error);
        if(error) {
            spdlog::warn("igd: could not fetch description {}: {}", location, error.message());
            continue;
        }
        if(response.status != 200) {
            spdlog::warn("igd: description {} answered with status {}", location, response.status);
            continue;
        }

        const auto description = parse_description(response.body, error);
        if(error) {
            spdlog::warn("igd: description {} is malformed", location);
            continue;
        }
        if(!description.is_igd()) {
            spdlog::debug("igd: {} is not an internet gateway device", location);
            continue;
        }

        auto session = make_session(description, location, error);
        if(error) {
            spdlog::warn("igd: cannot use gateway at {}: {}", location, error.message());
            continue;
        }
        spdlog::info("igd: using gateway {} (control URL {}, LAN address {})",
                location, session.control_url, session.lan_ip);
        return session;
    }
    error = make_error_code(error::client::no_valid_igd);
    return {};
}

} // igd

#endif // IGDPP_DESCRIPTION_IMPL
