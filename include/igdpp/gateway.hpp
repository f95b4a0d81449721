#ifndef IGDPP_GATEWAY_HEADER
#define IGDPP_GATEWAY_HEADER

#include "error.hpp"

#include <istream>

#include <asio/ip/address.hpp>

namespace igd {

/**
 * @brief Returns the IP address of the default gateway that is configured for
 * this host.
 *
 * The implementation does not make any network requests. It instead parses
 * OS dependent config files.
 *
 * @param error The variable through which errors are reported.
 *
 * @return The default gateway address if no error occurred. Otherwise the
 * return value is a default constructed `asio::ip::address` object.
 */
asio::ip::address default_gateway_address(error_code& error);

/**
 * @brief Finds the default route in a routing table laid out like Linux's
 * `/proc/net/route`.
 *
 * @return The gateway of the first default route, or the unspecified address
 * if there is none.
 */
asio::ip::address_v4 parse_default_route(std::istream& table);

/**
 * @brief Returns the local address the network stack would use as the source
 * of packets sent to @p remote.
 *
 * No packet is sent: a datagram socket is connected to @p remote and its local
 * endpoint is read back.
 */
asio::ip::address local_address_towards(
        const asio::ip::address& remote, error_code& error);

} // igd

#include "impl/gateway.ipp"

#endif // IGDPP_GATEWAY_HEADER
