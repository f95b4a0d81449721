#ifndef IGDPP_CONTROL_POINT_HEADER
#define IGDPP_CONTROL_POINT_HEADER

#include "error.hpp"
#include "port_mapping.hpp"
#include "control_session.hpp"
#include "ssdp.hpp"
#include "soap.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include <asio/ip/address.hpp>

namespace igd {

struct control_point_options
{
    discovery_options discovery;
    // Bounds each HTTP exchange with the gateway.
    std::chrono::milliseconds http_timeout{3000};
    // Start discovering in the background as soon as the control point is
    // constructed.
    bool autodiscover = false;
    // Caps the number of entries `port_mappings` requests. A table holds at
    // most one mapping per port and protocol.
    uint64_t max_listed_mappings = 2 * 65535;
};

struct connection_status
{
    std::string status;
    std::string last_connection_error;
    std::chrono::seconds uptime{0};
};

/** Maximum link layer bitrates, in bits per second. */
struct link_bitrates
{
    uint64_t downstream = 0;
    uint64_t upstream = 0;
};

/**
 * Discovers the Internet Gateway Device of the local network and controls its
 * port mappings.
 *
 * A control point is unbound until a discovery succeeds, after which it holds
 * the session of the found gateway until the next discovery replaces it. All
 * operations other than discovery need a bound control point and report
 * `error::client::not_discovered` otherwise, or the reason the last discovery
 * failed. If a discovery is in progress they first wait for it to complete.
 *
 * @par Thread Safety
 * @e Distinct @e objects: Safe.@n
 * @e Shared @e objects: Safe. At most one discovery runs at a time and never
 * alongside another operation. A discovery started while operations are under
 * way waits for them to finish. Other operations may run concurrently.
 */
class control_point
{
    control_point_options options_;

    mutable std::mutex mutex_;
    std::shared_ptr<const control_session> session_;
    // Why the last discovery failed, if it did.
    error_code discovery_error_;
    // The last discovery started. Only ever waited on outside of the mutex.
    std::shared_future<error_code> discovery_;
    std::atomic<bool> cancel_discovery_{false};
    // Held exclusively by a running discovery and shared by every other
    // operation for as long as it talks to the gateway.
    mutable std::shared_mutex operations_;

public:
    explicit control_point(control_point_options options = {});

    /** Cancels and waits for a discovery that is still in progress. */
    ~control_point();

    control_point(const control_point&) = delete;
    control_point& operator=(const control_point&) = delete;

    const control_point_options& options() const noexcept { return options_; }

    /**
     * @brief Searches for a gateway and binds this control point to the first
     * valid one, replacing the current session.
     *
     * If a discovery is already in progress this waits for that one instead
     * of starting another.
     *
     * @param error Set to `error::client::no_device_found` if nothing
     * answered, `error::client::no_valid_igd` if nothing that answered is a
     * usable gateway. The control point is then unbound.
     */
    void discover(error_code& error);

    /**
     * @brief Starts a discovery in the background, or returns the one in
     * progress.
     *
     * @return The outcome of the discovery, which is also what @ref discover
     * would report.
     */
    std::shared_future<error_code> async_discover();

    /**
     * Asks a discovery in progress to end early, which it then does with
     * `asio::error::operation_aborted`.
     */
    void cancel_discovery();

    /** Whether a discovery succeeded and no later one failed. */
    bool is_bound() const;

    /**
     * Returns the current session, after waiting for a discovery in progress,
     * or null if unbound.
     */
    std::shared_ptr<const control_session> session() const;

    /** Returns the address of the WAN facing side of the gateway. */
    std::string external_ip(error_code& error);

    /**
     * Returns the LAN address of the gateway, taken from its description. No
     * request is made.
     */
    std::string router_ip(error_code& error);

    /** Returns the address of this host on the gateway's LAN. */
    std::string lan_ip(error_code& error);

    /**
     * Returns the default gateway configured for this host, read from the
     * routing table. Needs no discovery.
     */
    asio::ip::address gateway_address(error_code& error);

    connection_status status(error_code& error);

    /** Returns the type of the WAN connection, e.g. "IP_Routed". */
    std::string connection_type(error_code& error);

    uint64_t total_bytes_sent(error_code& error);
    uint64_t total_bytes_received(error_code& error);
    uint64_t total_packets_sent(error_code& error);
    uint64_t total_packets_received(error_code& error);

    link_bitrates max_link_bitrates(error_code& error);

    /**
     * @brief Returns all port mappings of the gateway.
     *
     * Entries are requested by index until the gateway reports an error. As
     * the protocol does not tell the end of the table from other errors, no
     * error is ever reported once the control point is bound; the mappings
     * read until then are returned.
     *
     * The listing also ends when an entry repeats one already read, as
     * gateways that ignore the index do, or after
     * `control_point_options::max_listed_mappings` entries. Entries with a
     * port out of range or an unknown protocol are skipped.
     */
    std::vector<port_mapping> port_mappings(error_code& error);

    /**
     * @brief Returns the mapping of @p external_port for @p proto.
     *
     * @param error Set to `error::client::invalid_argument` if the port or
     * protocol is invalid, before any request is made, and to
     * `error::client::malformed_response` if the gateway reports no valid
     * internal port.
     */
    port_mapping get_port_mapping(int external_port, protocol proto, error_code& error);
    port_mapping get_port_mapping(int external_port, const std::string& proto,
            error_code& error);

    /**
     * @brief Forwards @p external_port of the gateway to @p internal_port of
     * @p internal_client.
     *
     * Whether an existing mapping of the same port is replaced is up to the
     * gateway, which reports a conflict as a fault.
     *
     * @param internal_client Defaults to this host's LAN address if empty.
     *
     * @param lease Zero requests a permanent mapping.
     *
     * @param error Set to `error::client::invalid_argument` if a port or the
     * protocol is invalid, before any request is made.
     */
    void add_port_mapping(int external_port, int internal_port, protocol proto,
            const std::string& description, error_code& error,
            const std::string& internal_client = {},
            std::chrono::seconds lease = std::chrono::seconds(0));
    void add_port_mapping(int external_port, int internal_port,
            const std::string& proto, const std::string& description,
            error_code& error, const std::string& internal_client = {},
            std::chrono::seconds lease = std::chrono::seconds(0));

    /**
     * @brief Removes the mapping of @p external_port for @p proto.
     *
     * Removing a mapping that does not exist is reported however the gateway
     * reports it.
     */
    void delete_port_mapping(int external_port, protocol proto, error_code& error);
    void delete_port_mapping(int external_port, const std::string& proto,
            error_code& error);

private:
    error_code run_discovery();

    /**
     * Waits for a discovery in progress, locks @p operation and returns the
     * session, or sets @p error if unbound. @p operation must stay locked for
     * as long as the session is used to talk to the gateway.
     */
    std::shared_ptr<const control_session> acquire_session(
            std::shared_lock<std::shared_mutex>& operation, error_code& error) const;

    soap_arguments invoke(service which, const std::string& action,
            const soap_arguments& args, error_code& error);

    uint64_t query_statistic(const std::string& action,
            const std::string& result_name, error_code& error);
};

} // igd

#include "impl/control_point.ipp"

#endif // IGDPP_CONTROL_POINT_HEADER
