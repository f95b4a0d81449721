#ifndef IGDPP_SSDP_HEADER
#define IGDPP_SSDP_HEADER

#include "error.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <asio/ip/address.hpp>
#include <asio/ip/udp.hpp>

namespace igd {

constexpr const char* igd_search_target = "urn:schemas-upnp-org:device:InternetGatewayDevice:1";
constexpr const char* all_search_target = "ssdp:all";
constexpr unsigned short ssdp_port = 1900;

/** Tunes a single SSDP search. */
struct discovery_options
{
    // How long replies are collected. Must be positive.
    std::chrono::milliseconds timeout{1000};
    std::string search_target = igd_search_target;
    // If nobody answers @ref search_target, search for `ssdp:all` for another
    // window of the same length.
    bool search_all_fallback = false;
    // The interface to search from. Unspecified means any.
    asio::ip::address source_address;
    // Send from the SSDP port itself, for firewalls that only let replies in
    // to the port the search was sent from. Otherwise an ephemeral port is
    // used. Either way a single socket sends the search and receives the
    // replies, which gateways send by unicast to the search's source.
    bool reuse_incoming_port = true;
    // Stop collecting once this many devices have answered. Zero waits for the
    // whole window, since routers may reply multiple times.
    std::size_t enough_responses = 0;
    asio::ip::udp::endpoint multicast_endpoint{
        asio::ip::make_address_v4("239.255.255.250"), ssdp_port};
    int ttl = 2;
};

/** A device that answered an SSDP search. */
struct gateway_device
{
    // URL of the device description.
    std::string location;
    // The search target the device answered to (its ST header).
    std::string search_target;
    std::string usn;
    asio::ip::udp::endpoint sender;
};

/** Builds the `M-SEARCH` request for @p search_target. */
std::string make_search_request(const std::string& search_target,
        std::chrono::milliseconds timeout,
        const asio::ip::udp::endpoint& multicast_endpoint);

/**
 * @brief Parses an SSDP reply.
 *
 * @return Whether @p datagram was a successful reply carrying a LOCATION
 * header, in which case @p device is filled in (except for its sender).
 */
bool parse_search_response(const std::string& datagram, gateway_device& device);

/**
 * @brief Searches the local network for devices and collects their answers.
 *
 * Replies that cannot be parsed are ignored, as are repeated replies carrying
 * an already known location. Devices are returned in the order their first
 * reply arrived.
 *
 * @param cancel If not null, the search ends as soon as it is set, with
 * @p error set to `asio::error::operation_aborted`.
 *
 * @param error Set to `error::client::no_device_found` if no device answered,
 * or `error::client::invalid_argument` if the timeout is not positive.
 */
std::vector<gateway_device> discover(const discovery_options& options,
        error_code& error, const std::atomic<bool>* cancel = nullptr);

} // igd

#include "impl/ssdp.ipp"

#endif // IGDPP_SSDP_HEADER
