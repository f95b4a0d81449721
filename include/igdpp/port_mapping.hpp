#ifndef IGDPP_PORT_MAPPING_HEADER
#define IGDPP_PORT_MAPPING_HEADER

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace igd {

enum class protocol { tcp, udp };

/** Returns the literal the IGD actions expect for @p p: "TCP" or "UDP". */
inline const char* to_string(protocol p) noexcept
{
    return p == protocol::udp ? "UDP" : "TCP";
}

/**
 * Parses the wire literal of a protocol. Only the exact strings "TCP" and
 * "UDP" are accepted.
 *
 * @return Whether @p s named a protocol, in which case @p p is set.
 */
inline bool parse_protocol(const std::string& s, protocol& p) noexcept
{
    if(s == "TCP") {
        p = protocol::tcp;
        return true;
    }
    if(s == "UDP") {
        p = protocol::udp;
        return true;
    }
    return false;
}

inline bool is_valid_protocol(protocol p) noexcept
{
    return p == protocol::tcp || p == protocol::udp;
}

inline bool is_valid_port(int port) noexcept
{
    return port >= 1 && port <= 65535;
}

/**
 * A port forwarding rule as reported by the gateway.
 *
 * This is a snapshot: removing the rule on the router does not affect objects
 * previously returned.
 */
struct port_mapping
{
    protocol type = protocol::tcp;
    // The port on which this host will be listening for connections.
    uint16_t private_port = 0;
    // The port on which the router's WAN facing side will be listening for
    // connections.
    uint16_t public_port = 0;
    // The LAN address the gateway forwards to.
    std::string internal_client;
    std::string description;
    bool enabled = false;
    // Empty means any remote host.
    std::string remote_host;
    // The lease of the mapping. Zero means the mapping is permanent.
    std::chrono::seconds duration{0};
};

inline std::ostream& operator<<(std::ostream& out, const port_mapping& m)
{
    return out << m.public_port << "->" << m.internal_client << ':'
        << m.private_port << ' ' << to_string(m.type) << " for "
        << m.duration.count() << " -- " << m.description;
}

} // igd

#endif // IGDPP_PORT_MAPPING_HEADER
