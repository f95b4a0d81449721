#ifndef IGDPP_CONTROL_POINT_IMPL
#define IGDPP_CONTROL_POINT_IMPL

#include "../control_point.hpp"
#include "../description.hpp"
#include "../gateway.hpp"
#include "../url.hpp"
#include "../detail/xml.hpp"

#include <charconv>
#include <set>
#include <tuple>

#include <spdlog/spdlog.h>

namespace igd {
namespace detail {

// Accepts only a plain decimal number, surrounding whitespace aside.
inline bool parse_unsigned(const std::string& s, uint64_t& value)
{
    const auto text = trim(s);
    if(text.empty()) {
        return false;
    }
    const char* last = text.data() + text.size();
    const auto res = std::from_chars(text.data(), last, value);
    return res.ec == std::errc() && res.ptr == last;
}

inline uint64_t unsigned_or_zero(const soap_arguments& values, const std::string& name)
{
    uint64_t value = 0;
    const auto* text = find_argument(values, name);
    if(!text || !parse_unsigned(*text, value)) {
        return 0;
    }
    return value;
}

inline std::string string_or_empty(const soap_arguments& values, const std::string& name)
{
    const auto* text = find_argument(values, name);
    return text ? *text : std::string();
}

inline bool read_port(const soap_arguments& values, const std::string& name, uint16_t& port)
{
    uint64_t value = 0;
    const auto* text = find_argument(values, name);
    if(!text || !parse_unsigned(*text, value) || value == 0 || value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

// Fills in the fields that both the generic and the specific mapping entry
// actions report. Fails if the internal port is missing or out of range.
inline bool read_mapping_entry(const soap_arguments& values, port_mapping& mapping)
{
    if(!read_port(values, "NewInternalPort", mapping.private_port)) {
        return false;
    }
    mapping.internal_client = trim(string_or_empty(values, "NewInternalClient"));
    mapping.enabled = trim(string_or_empty(values, "NewEnabled")) == "1";
    mapping.description = string_or_empty(values, "NewPortMappingDescription");
    mapping.duration = std::chrono::seconds(unsigned_or_zero(values, "NewLeaseDuration"));
    return true;
}

} // detail

inline control_point::control_point(control_point_options options)
    : options_(std::move(options))
{
    if(options_.autodiscover) {
        async_discover();
    }
}

inline control_point::~control_point()
{
    cancel_discovery_ = true;
    std::shared_future<error_code> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = discovery_;
    }
    if(pending.valid()) {
        pending.wait();
    }
}

inline void control_point::discover(error_code& error)
{
    error = async_discover().get();
}

inline std::shared_future<error_code> control_point::async_discover()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if(discovery_.valid()
            && discovery_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        // Join the discovery in progress rather than racing it.
        return discovery_;
    }
    cancel_discovery_ = false;
    discovery_ = std::async(std::launch::async, [this] { return run_discovery(); }).share();
    return discovery_;
}

inline void control_point::cancel_discovery()
{
    cancel_discovery_ = true;
}

inline error_code control_point::run_discovery()
{
    std::unique_lock<std::shared_mutex> exclusive(operations_);
    error_code error;
    const auto devices = igd::discover(options_.discovery, error, &cancel_discovery_);

    std::shared_ptr<const control_session> session;
    if(!error) {
        std::vector<std::string> locations;
        locations.reserve(devices.size());
        for(const auto& device : devices) {
            locations.push_back(device.location);
        }
        auto validated = fetch_and_validate(locations, options_.http_timeout, error);
        if(!error) {
            session = std::make_shared<const control_session>(std::move(validated));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if(error == asio::error::operation_aborted) {
        // A cancelled discovery leaves the control point as it found it.
        return error;
    }
    session_ = std::move(session);
    discovery_error_ = error;
    return error;
}

inline bool control_point::is_bound() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ != nullptr;
}

inline std::shared_ptr<const control_session> control_point::session() const
{
    std::shared_lock<std::shared_mutex> operation(operations_, std::defer_lock);
    error_code ignored;
    return acquire_session(operation, ignored);
}

inline std::shared_ptr<const control_session> control_point::acquire_session(
        std::shared_lock<std::shared_mutex>& operation, error_code& error) const
{
    error = error_code();
    std::shared_future<error_code> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = discovery_;
    }
    if(pending.valid()) {
        pending.wait();
    }
    // A discovery started since holds the lock exclusively until it is done,
    // so the session read below is never replaced while in use.
    operation.lock();

    std::lock_guard<std::mutex> lock(mutex_);
    if(!session_) {
        error = discovery_error_ ? discovery_error_
                                 : make_error_code(error::client::not_discovered);
    }
    return session_;
}

inline soap_arguments control_point::invoke(service which, const std::string& action,
        const soap_arguments& args, error_code& error)
{
    std::shared_lock<std::shared_mutex> operation(operations_, std::defer_lock);
    const auto session = acquire_session(operation, error);
    if(error) {
        return {};
    }
    return igd::invoke(*session, which, action, args, options_.http_timeout, error);
}

inline std::string control_point::external_ip(error_code& error)
{
    const auto values = invoke(service::connection, "GetExternalIPAddress", {}, error);
    if(error) {
        return {};
    }
    const auto* address = find_argument(values, "NewExternalIPAddress");
    if(!address) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }
    return detail::trim(*address);
}

inline std::string control_point::router_ip(error_code& error)
{
    std::shared_lock<std::shared_mutex> operation(operations_, std::defer_lock);
    const auto session = acquire_session(operation, error);
    if(error) {
        return {};
    }
    const auto base = parse_url(session->url_base, error);
    if(error) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }
    return base.host;
}

inline std::string control_point::lan_ip(error_code& error)
{
    std::shared_lock<std::shared_mutex> operation(operations_, std::defer_lock);
    const auto session = acquire_session(operation, error);
    if(error) {
        return {};
    }
    return session->lan_ip;
}

inline asio::ip::address control_point::gateway_address(error_code& error)
{
    return default_gateway_address(error);
}

inline connection_status control_point::status(error_code& error)
{
    const auto values = invoke(service::connection, "GetStatusInfo", {}, error);
    if(error) {
        return {};
    }
    connection_status status;
    status.status = detail::trim(detail::string_or_empty(values, "NewConnectionStatus"));
    status.last_connection_error = detail::trim(
            detail::string_or_empty(values, "NewLastConnectionError"));
    status.uptime = std::chrono::seconds(detail::unsigned_or_zero(values, "NewUptime"));
    return status;
}

inline std::string control_point::connection_type(error_code& error)
{
    const auto values = invoke(service::connection, "GetConnectionTypeInfo", {}, error);
    if(error) {
        return {};
    }
    return detail::trim(detail::string_or_empty(values, "NewConnectionType"));
}

inline uint64_t control_point::query_statistic(const std::string& action,
        const std::string& result_name, error_code& error)
{
    const auto values = invoke(service::common_interface_config, action, {}, error);
    if(error) {
        return 0;
    }
    uint64_t value = 0;
    const auto* text = find_argument(values, result_name);
    if(!text || !detail::parse_unsigned(*text, value)) {
        error = make_error_code(error::client::statistic_unavailable);
        return 0;
    }
    return value;
}

inline uint64_t control_point::total_bytes_sent(error_code& error)
{
    return query_statistic("GetTotalBytesSent", "NewTotalBytesSent", error);
}

inline uint64_t control_point::total_bytes_received(error_code& error)
{
    return query_statistic("GetTotalBytesReceived", "NewTotalBytesReceived", error);
}

inline uint64_t control_point::total_packets_sent(error_code& error)
{
    return query_statistic("GetTotalPacketsSent", "NewTotalPacketsSent", error);
}

inline uint64_t control_point::total_packets_received(error_code& error)
{
    return query_statistic("GetTotalPacketsReceived", "NewTotalPacketsReceived", error);
}

inline link_bitrates control_point::max_link_bitrates(error_code& error)
{
    const auto values = invoke(service::common_interface_config,
            "GetCommonLinkProperties", {}, error);
    if(error) {
        return {};
    }
    link_bitrates bitrates;
    const auto* down = find_argument(values, "NewLayer1DownstreamMaxBitRate");
    const auto* up = find_argument(values, "NewLayer1UpstreamMaxBitRate");
    if(!down || !up || !detail::parse_unsigned(*down, bitrates.downstream)
            || !detail::parse_unsigned(*up, bitrates.upstream)) {
        error = make_error_code(error::client::statistic_unavailable);
        return {};
    }
    return bitrates;
}

inline std::vector<port_mapping> control_point::port_mappings(error_code& error)
{
    std::shared_lock<std::shared_mutex> operation(operations_, std::defer_lock);
    const auto session = acquire_session(operation, error);
    if(error) {
        return {};
    }

    std::vector<port_mapping> mappings;
    std::set<std::tuple<std::string, uint16_t, protocol>> seen;
    // Each index depends on how many entries came before, so this cannot be
    // parallelized.
    for(uint64_t index = 0; index < options_.max_listed_mappings; ++index) {
        error_code entry_error;
        const auto values = igd::invoke(*session, service::connection,
                "GetGenericPortMappingEntry",
                {{"NewPortMappingIndex", std::to_string(index)}},
                options_.http_timeout, entry_error);
        if(entry_error) {
            // The end of the table and a failure look the same on the wire.
            spdlog::debug("igd: port mapping listing ended at index {}: {}",
                    index, entry_error.message());
            break;
        }

        port_mapping mapping;
        if(!detail::read_mapping_entry(values, mapping)
                || !detail::read_port(values, "NewExternalPort", mapping.public_port)
                || !parse_protocol(detail::trim(detail::string_or_empty(values, "NewProtocol")),
                        mapping.type)) {
            spdlog::debug("igd: skipping unusable port mapping entry {}", index);
            continue;
        }
        mapping.remote_host = detail::trim(detail::string_or_empty(values, "NewRemoteHost"));
        if(!seen.emplace(mapping.remote_host, mapping.public_port, mapping.type).second) {
            spdlog::debug("igd: port mapping entry {} repeats an earlier one, "
                    "listing ends", index);
            break;
        }
        mappings.push_back(std::move(mapping));
    }
    return mappings;
}

inline port_mapping control_point::get_port_mapping(int external_port,
        protocol proto, error_code& error)
{
    error = error_code();
    if(!is_valid_port(external_port) || !is_valid_protocol(proto)) {
        error = make_error_code(error::client::invalid_argument);
        return {};
    }

    const auto values = invoke(service::connection, "GetSpecificPortMappingEntry",
            {
                {"NewRemoteHost", ""},
                {"NewExternalPort", std::to_string(external_port)},
                {"NewProtocol", to_string(proto)},
            },
            error);
    if(error) {
        return {};
    }

    port_mapping mapping;
    mapping.type = proto;
    mapping.public_port = static_cast<uint16_t>(external_port);
    if(!detail::read_mapping_entry(values, mapping)) {
        error = make_error_code(error::client::malformed_response);
        return {};
    }
    return mapping;
}

inline port_mapping control_point::get_port_mapping(int external_port,
        const std::string& proto, error_code& error)
{
    protocol p;
    if(!parse_protocol(proto, p)) {
        error = make_error_code(error::client::invalid_argument);
        return {};
    }
    return get_port_mapping(external_port, p, error);
}

inline void control_point::add_port_mapping(int external_port, int internal_port,
        protocol proto, const std::string& description, error_code& error,
        const std::string& internal_client, std::chrono::seconds lease)
{
    error = error_code();
    if(!is_valid_port(external_port) || !is_valid_port(internal_port)
            || !is_valid_protocol(proto) || lease.count() < 0) {
        error = make_error_code(error::client::invalid_argument);
        return;
    }

    std::shared_lock<std::shared_mutex> operation(operations_, std::defer_lock);
    const auto session = acquire_session(operation, error);
    if(error) {
        return;
    }
    const auto& client = internal_client.empty() ? session->lan_ip : internal_client;

    igd::invoke(*session, service::connection, "AddPortMapping",
            {
                {"NewRemoteHost", ""},
                {"NewExternalPort", std::to_string(external_port)},
                {"NewProtocol", to_string(proto)},
                {"NewInternalPort", std::to_string(internal_port)},
                {"NewInternalClient", client},
                {"NewEnabled", "1"},
                {"NewPortMappingDescription", description.empty() ? "igdpp" : description},
                {"NewLeaseDuration", std::to_string(lease.count())},
            },
            options_.http_timeout, error);
    if(error) {
        spdlog::warn("igd: mapping {} {} to {}:{} failed: {}", to_string(proto),
                external_port, client, internal_port, error.message());
        return;
    }
    spdlog::info("igd: mapped {} {} to {}:{}", to_string(proto), external_port,
            client, internal_port);
}

inline void control_point::add_port_mapping(int external_port, int internal_port,
        const std::string& proto, const std::string& description,
        error_code& error, const std::string& internal_client,
        std::chrono::seconds lease)
{
    protocol p;
    if(!parse_protocol(proto, p)) {
        error = make_error_code(error::client::invalid_argument);
        return;
    }
    add_port_mapping(external_port, internal_port, p, description, error,
            internal_client, lease);
}

inline void control_point::delete_port_mapping(int external_port, protocol proto,
        error_code& error)
{
    error = error_code();
    if(!is_valid_port(external_port) || !is_valid_protocol(proto)) {
        error = make_error_code(error::client::invalid_argument);
        return;
    }

    invoke(service::connection, "DeletePortMapping",
            {
                {"NewRemoteHost", ""},
                {"NewExternalPort", std::to_string(external_port)},
                {"NewProtocol", to_string(proto)},
            },
            error);
    if(error) {
        spdlog::warn("igd: removing mapping of {} {} failed: {}", to_string(proto),
                external_port, error.message());
        return;
    }
    spdlog::info("igd: removed mapping of {} {}", to_string(proto), external_port);
}

inline void control_point::delete_port_mapping(int external_port,
        const std::string& proto, error_code& error)
{
    protocol p;
    if(!parse_protocol(proto, p)) {
        error = make_error_code(error::client::invalid_argument);
        return;
    }
    delete_port_mapping(external_port, p, error);
}

} // igd

#endif // IGDPP_CONTROL_POINT_IMPL
