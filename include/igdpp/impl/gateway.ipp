#ifndef IGDPP_GATEWAY_IMPL
#define IGDPP_GATEWAY_IMPL

#if defined(__linux__)
# define IGDPP_USE_PROC_NET
#endif

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <endian/endian.hpp>
#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/udp.hpp>

namespace igd {

/* Example route file:
Iface	Destination	Gateway 	Flags	RefCnt	Use	Metric	Mask		MTU	Window	IRTT
wlp7s0	00000000	0100A8C0	0003	0	0	600	00000000	0	0	0
wlp7s0	0000A8C0	00000000	0001	0	0	600	00FFFFFF	0	0	0
*/
inline asio::ip::address_v4 parse_default_route(std::istream& table)
{
    std::string row;
    // Column names.
    std::getline(table, row);
    while(std::getline(table, row)) {
        std::istringstream fields(row);
        std::string interface_name;
        uint32_t destination = 0;
        uint32_t gateway = 0;
        if(!(fields >> interface_name >> std::hex >> destination >> gateway)) {
            continue;
        }
        if(destination != 0 || gateway == 0) {
            continue;
        }
        // Addresses are printed as they lie in memory, so on little endian
        // hosts the digits read back in reverse byte order.
        return asio::ip::address_v4(endian::order::host == endian::order::little
                ? endian::reverse(gateway) : gateway);
    }
    return asio::ip::address_v4();
}

inline asio::ip::address default_gateway_address(error_code& error)
{
    error = error_code();
#ifdef IGDPP_USE_PROC_NET
    std::ifstream file("/proc/net/route");
    if(!file)
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return asio::ip::address_v4(0);
    }
    const auto gateway = parse_default_route(file);
    if(gateway.is_unspecified()) {
        error = make_error_code(asio::error::host_unreachable);
    }
    return gateway;
#else
    error = std::make_error_code(std::errc::operation_not_supported);
    return asio::ip::address_v4(0);
#endif
}

inline asio::ip::address local_address_towards(
        const asio::ip::address& remote, error_code& error)
{
    error = error_code();
    asio::io_context ioc;
    asio::ip::udp::socket socket(ioc);
    // The port is irrelevant as connecting a datagram socket only selects a
    // route.
    socket.connect(asio::ip::udp::endpoint(remote, 1900), error);
    if(error) {
        return {};
    }
    const auto local = socket.local_endpoint(error);
    if(error) {
        return {};
    }
    return local.address();
}

} // igd

#endif // IGDPP_GATEWAY_IMPL
