#include <igdpp/control_point.hpp>

#include "fake_gateway.hpp"

#include <memory>
#include <thread>

#include <catch2/catch_test_macros.hpp>

using namespace igd;

namespace {

control_point_options loopback_options(const test::fake_gateway& gateway)
{
    control_point_options options;
    options.discovery.timeout = std::chrono::milliseconds(300);
    options.discovery.multicast_endpoint = gateway.ssdp_endpoint();
    options.discovery.reuse_incoming_port = false;
    options.http_timeout = std::chrono::milliseconds(2000);
    return options;
}

control_point_options silent_options(const asio::ip::udp::socket& silent,
        std::chrono::milliseconds timeout)
{
    control_point_options options;
    options.discovery.timeout = timeout;
    options.discovery.multicast_endpoint = silent.local_endpoint();
    options.discovery.reuse_incoming_port = false;
    return options;
}

struct bound_control_point
{
    test::fake_gateway gateway;
    control_point cp{loopback_options(gateway)};

    bound_control_point()
    {
        error_code ec;
        cp.discover(ec);
        INFO(ec.message());
        REQUIRE_FALSE(ec);
        REQUIRE(cp.is_bound());
    }
};

} // namespace

TEST_CASE("Operations need a discovered gateway", "[control-point]") {
    control_point cp;
    CHECK_FALSE(cp.is_bound());
    CHECK(cp.session() == nullptr);

    error_code ec;
    CHECK(cp.external_ip(ec).empty());
    CHECK(ec == error::client::not_discovered);
    cp.router_ip(ec);
    CHECK(ec == error::client::not_discovered);
    cp.lan_ip(ec);
    CHECK(ec == error::client::not_discovered);
    cp.total_bytes_sent(ec);
    CHECK(ec == error::client::not_discovered);
    CHECK(cp.port_mappings(ec).empty());
    CHECK(ec == error::client::not_discovered);
    cp.get_port_mapping(80, protocol::tcp, ec);
    CHECK(ec == error::client::not_discovered);
    cp.delete_port_mapping(80, "UDP", ec);
    CHECK(ec == error::client::not_discovered);
}

TEST_CASE("Invalid ports and protocols are rejected first", "[control-point]") {
    control_point cp;
    error_code ec;

    SECTION("Ports") {
        const int invalid_ports[] = {0, -1, 65536, 100000};
        for(const int port : invalid_ports) {
            INFO(port);
            cp.add_port_mapping(port, 80, "TCP", "x", ec);
            CHECK(ec == error::client::invalid_argument);
            cp.add_port_mapping(80, port, protocol::udp, "x", ec);
            CHECK(ec == error::client::invalid_argument);
            cp.get_port_mapping(port, "UDP", ec);
            CHECK(ec == error::client::invalid_argument);
            cp.delete_port_mapping(port, protocol::tcp, ec);
            CHECK(ec == error::client::invalid_argument);
        }
    }

    SECTION("Protocols") {
        const char* invalid_protocols[] = {"tcp", "udp", "SCTP", "", "TCP "};
        for(const auto* proto : invalid_protocols) {
            INFO(proto);
            cp.add_port_mapping(8080, 80, proto, "x", ec);
            CHECK(ec == error::client::invalid_argument);
            cp.get_port_mapping(8080, proto, ec);
            CHECK(ec == error::client::invalid_argument);
            cp.delete_port_mapping(8080, proto, ec);
            CHECK(ec == error::client::invalid_argument);
        }
    }

    SECTION("Negative lease") {
        cp.add_port_mapping(8080, 80, protocol::tcp, "x", ec, {}, std::chrono::seconds(-1));
        CHECK(ec == error::client::invalid_argument);
    }
}

TEST_CASE_METHOD(bound_control_point, "Invalid arguments make no requests", "[control-point]") {
    const auto requests = gateway.http_requests();
    error_code ec;
    cp.add_port_mapping(0, 80, protocol::tcp, "x", ec);
    CHECK(ec == error::client::invalid_argument);
    cp.add_port_mapping(8080, 80, "ICMP", "x", ec);
    CHECK(ec == error::client::invalid_argument);
    cp.delete_port_mapping(65536, "TCP", ec);
    CHECK(ec == error::client::invalid_argument);
    cp.get_port_mapping(8080, "", ec);
    CHECK(ec == error::client::invalid_argument);
    CHECK(gateway.http_requests() == requests);
}

TEST_CASE_METHOD(bound_control_point, "Session of a discovered gateway", "[control-point]") {
    const auto session = cp.session();
    REQUIRE(session != nullptr);
    CHECK(session->location == gateway.location());
    CHECK(session->control_url == gateway.base_url() + "/ctl/IPConn");
    CHECK(session->control_url_cif == gateway.base_url() + "/ctl/CmnIfCfg");
    CHECK(session->service_type == "urn:schemas-upnp-org:service:WANIPConnection:1");
    CHECK(session->service_type_cif ==
        "urn:schemas-upnp-org:service:WANCommonInterfaceConfig:1");
}

TEST_CASE_METHOD(bound_control_point, "Router address makes no requests", "[control-point]") {
    const auto requests = gateway.http_requests();
    error_code ec;
    const auto first = cp.router_ip(ec);
    REQUIRE_FALSE(ec);
    const auto second = cp.router_ip(ec);
    REQUIRE_FALSE(ec);
    CHECK(first == "127.0.0.1");
    CHECK(first == second);
    CHECK(gateway.http_requests() == requests);
}

TEST_CASE_METHOD(bound_control_point, "Gateway information", "[control-point]") {
    error_code ec;

    SECTION("Addresses") {
        CHECK(cp.external_ip(ec) == "203.0.113.7");
        CHECK_FALSE(ec);
        CHECK(cp.lan_ip(ec) == "127.0.0.1");
        CHECK_FALSE(ec);
    }

    SECTION("Connection") {
        const auto status = cp.status(ec);
        INFO(ec.message());
        REQUIRE_FALSE(ec);
        CHECK(status.status == "Connected");
        CHECK(status.last_connection_error == "ERROR_NONE");
        CHECK(status.uptime == std::chrono::seconds(3600));

        CHECK(cp.connection_type(ec) == "IP_Routed");
        CHECK_FALSE(ec);
    }

    SECTION("Link bitrates") {
        const auto bitrates = cp.max_link_bitrates(ec);
        INFO(ec.message());
        REQUIRE_FALSE(ec);
        CHECK(bitrates.downstream == 100000000u);
        CHECK(bitrates.upstream == 20000000u);
    }
}

TEST_CASE_METHOD(bound_control_point, "Traffic statistics", "[control-point]") {
    error_code ec;

    SECTION("Each counter queries its own action") {
        CHECK(cp.total_bytes_sent(ec) == 123456u);
        CHECK_FALSE(ec);
        CHECK(cp.total_bytes_received(ec) == 654321u);
        CHECK_FALSE(ec);
        CHECK(cp.total_packets_sent(ec) == 1000u);
        CHECK_FALSE(ec);
        CHECK(cp.total_packets_received(ec) == 2000u);
        CHECK_FALSE(ec);

        const auto actions = gateway.actions();
        REQUIRE(actions.size() == 4);
        CHECK(actions[3] == "GetTotalPacketsReceived");
    }

    SECTION("Unusable values") {
        gateway.set_statistic("GetTotalBytesSent", "-1");
        CHECK(cp.total_bytes_sent(ec) == 0u);
        CHECK(ec == error::client::statistic_unavailable);

        gateway.set_statistic("GetTotalBytesSent", "lots");
        cp.total_bytes_sent(ec);
        CHECK(ec == error::client::statistic_unavailable);

        gateway.set_statistic("GetTotalBytesSent", "");
        cp.total_bytes_sent(ec);
        CHECK(ec == error::client::statistic_unavailable);
    }
}

TEST_CASE_METHOD(bound_control_point, "Port mapping management", "[control-point]") {
    error_code ec;

    SECTION("Add, get and delete") {
        cp.add_port_mapping(8080, 80, protocol::tcp, "web", ec, {}, std::chrono::seconds(3600));
        INFO(ec.message());
        REQUIRE_FALSE(ec);

        const auto mapping = cp.get_port_mapping(8080, "TCP", ec);
        REQUIRE_FALSE(ec);
        CHECK(mapping.type == protocol::tcp);
        CHECK(mapping.public_port == 8080);
        CHECK(mapping.private_port == 80);
        CHECK(mapping.internal_client == "127.0.0.1");
        CHECK(mapping.description == "web");
        CHECK(mapping.enabled);
        CHECK(mapping.duration == std::chrono::seconds(3600));

        // The same port for the other protocol is a separate entry.
        cp.get_port_mapping(8080, protocol::udp, ec);
        CHECK(ec == error::upnp::no_such_entry_in_array);

        cp.delete_port_mapping(8080, "TCP", ec);
        REQUIRE_FALSE(ec);

        cp.get_port_mapping(8080, protocol::tcp, ec);
        CHECK(is_soap_fault(ec));
        CHECK(ec.value() == 714);

        cp.delete_port_mapping(8080, protocol::tcp, ec);
        CHECK(ec == error::upnp::no_such_entry_in_array);
    }

    SECTION("Defaults") {
        cp.add_port_mapping(5000, 5001, "UDP", "", ec);
        REQUIRE_FALSE(ec);
        const auto mapping = cp.get_port_mapping(5000, protocol::udp, ec);
        REQUIRE_FALSE(ec);
        CHECK(mapping.internal_client == "127.0.0.1");
        CHECK(mapping.description == "igdpp");
        CHECK(mapping.duration == std::chrono::seconds(0));
    }

    SECTION("Conflicts are faults") {
        cp.add_port_mapping(6000, 6000, protocol::tcp, "a", ec, "192.168.1.20");
        REQUIRE_FALSE(ec);
        cp.add_port_mapping(6000, 6000, protocol::tcp, "b", ec, "192.168.1.21");
        CHECK(ec == error::upnp::conflict_in_mapping_entry);
        CHECK(ec.message() == error::describe(718));
        CHECK_FALSE(is_transport_error(ec));
    }

    SECTION("Listing") {
        CHECK(cp.port_mappings(ec).empty());
        CHECK_FALSE(ec);

        cp.add_port_mapping(7000, 70, protocol::tcp, "one", ec);
        REQUIRE_FALSE(ec);
        cp.add_port_mapping(7001, 71, protocol::udp, "two", ec);
        REQUIRE_FALSE(ec);
        cp.add_port_mapping(7002, 72, protocol::tcp, "three", ec, "192.168.1.30");
        REQUIRE_FALSE(ec);

        const auto mappings = cp.port_mappings(ec);
        CHECK_FALSE(ec);
        REQUIRE(mappings.size() == 3);
        CHECK(mappings[0].public_port == 7000);
        CHECK(mappings[0].private_port == 70);
        CHECK(mappings[0].description == "one");
        CHECK(mappings[1].type == protocol::udp);
        CHECK(mappings[2].internal_client == "192.168.1.30");
        CHECK(mappings[2].remote_host.empty());
    }

    SECTION("Unusable entries are skipped") {
        gateway.add_mapping("70000", "TCP", {"192.168.1.2", "80", "port too high", "0"});
        gateway.add_mapping("7100", "SCTP", {"192.168.1.2", "80", "unknown protocol", "0"});
        gateway.add_mapping("7200", "TCP", {"192.168.1.2", "", "no internal port", "0"});
        gateway.add_mapping("7300", "UDP", {"192.168.1.2", "73", "usable", "0"});

        const auto mappings = cp.port_mappings(ec);
        CHECK_FALSE(ec);
        REQUIRE(mappings.size() == 1);
        CHECK(mappings[0].public_port == 7300);
        CHECK(mappings[0].private_port == 73);
        CHECK(mappings[0].type == protocol::udp);
    }

    SECTION("Internal port out of range") {
        gateway.add_mapping("7400", "TCP", {"192.168.1.2", "70000", "x", "0"});
        cp.get_port_mapping(7400, protocol::tcp, ec);
        CHECK(ec == error::client::malformed_response);
    }

    SECTION("Gateways that ignore the index") {
        gateway.add_mapping("7500", "TCP", {"192.168.1.2", "75", "first", "0"});
        gateway.add_mapping("7501", "TCP", {"192.168.1.2", "76", "second", "0"});
        gateway.set_listing(test::fake_gateway::listing::ignores_index);

        const auto mappings = cp.port_mappings(ec);
        CHECK_FALSE(ec);
        REQUIRE(mappings.size() == 1);
        CHECK(mappings[0].public_port == 7500);
        // The repeated first entry ends the listing.
        CHECK(gateway.actions().size() == 2);
    }
}

TEST_CASE("Listing a table without end", "[control-point]") {
    CHECK(control_point_options().max_listed_mappings == 2 * 65535u);

    test::fake_gateway gateway;
    gateway.set_listing(test::fake_gateway::listing::bottomless);
    auto options = loopback_options(gateway);
    options.max_listed_mappings = 50;
    control_point cp(options);
    error_code ec;
    cp.discover(ec);
    REQUIRE_FALSE(ec);

    const auto mappings = cp.port_mappings(ec);
    CHECK_FALSE(ec);
    CHECK(mappings.size() == 50);
    CHECK(gateway.actions().size() == 50);
}

TEST_CASE_METHOD(bound_control_point, "Discovery waits for operations under way", "[control-point]") {
    gateway.set_delay("GetExternalIPAddress", std::chrono::milliseconds(500));
    error_code ip_error;
    std::string ip;
    std::thread operation([this, &ip, &ip_error] { ip = cp.external_ip(ip_error); });
    // Start discovering only once the request is with the gateway.
    while(gateway.actions().empty()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    auto pending = cp.async_discover();
    operation.join();

    CHECK_FALSE(pending.get());
    CHECK_FALSE(ip_error);
    CHECK(ip == "203.0.113.7");
    CHECK(gateway.events() == std::vector<std::string>{
            "M-SEARCH", "GetExternalIPAddress answered", "M-SEARCH"});
}

TEST_CASE("Listing an unreachable gateway", "[control-point]") {
    auto gateway = std::make_unique<test::fake_gateway>();
    control_point cp(loopback_options(*gateway));
    error_code ec;
    cp.discover(ec);
    REQUIRE_FALSE(ec);

    gateway.reset();
    CHECK(cp.port_mappings(ec).empty());
    CHECK_FALSE(ec);

    cp.external_ip(ec);
    CHECK(is_transport_error(ec));
}

TEST_CASE("Discovery", "[control-point]") {
    test::fake_gateway gateway;
    auto options = loopback_options(gateway);
    error_code ec;

    SECTION("Operations join a discovery in progress") {
        control_point cp(options);
        const auto start = std::chrono::steady_clock::now();
        cp.async_discover();
        const auto ip = cp.external_ip(ec);
        INFO(ec.message());
        REQUIRE_FALSE(ec);
        CHECK(ip == "203.0.113.7");
        // Replies are collected for the whole window before the session exists.
        CHECK(std::chrono::steady_clock::now() - start >= options.discovery.timeout);
    }

    SECTION("Concurrent discoveries coalesce") {
        control_point cp(options);
        auto first = cp.async_discover();
        auto second = cp.async_discover();
        cp.discover(ec);
        CHECK_FALSE(ec);
        CHECK_FALSE(first.get());
        CHECK_FALSE(second.get());
        CHECK(gateway.searches() == 1);
    }

    SECTION("Autodiscovery") {
        options.autodiscover = true;
        control_point cp(options);
        CHECK(cp.lan_ip(ec) == "127.0.0.1");
        CHECK_FALSE(ec);
        CHECK(cp.is_bound());
    }

    SECTION("Rediscovery replaces the session") {
        control_point cp(options);
        cp.discover(ec);
        REQUIRE_FALSE(ec);
        const auto before = cp.session();

        cp.discover(ec);
        REQUIRE_FALSE(ec);
        const auto after = cp.session();
        REQUIRE(before != nullptr);
        REQUIRE(after != nullptr);
        CHECK(before != after);
        CHECK(before->control_url == after->control_url);
        CHECK(gateway.searches() == 2);
    }

    SECTION("Failed rediscovery unbinds") {
        control_point cp(options);
        cp.discover(ec);
        REQUIRE_FALSE(ec);
        REQUIRE(cp.is_bound());

        gateway.set_advertised({});
        cp.discover(ec);
        CHECK(ec == error::client::no_device_found);
        CHECK_FALSE(cp.is_bound());
    }

    SECTION("Cancelled discovery keeps the session") {
        control_point cp(options);
        cp.discover(ec);
        REQUIRE_FALSE(ec);
        const auto before = cp.session();

        auto pending = cp.async_discover();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cp.cancel_discovery();
        CHECK(pending.get() == asio::error::operation_aborted);
        CHECK(cp.is_bound());
        CHECK(cp.session() == before);
    }

    SECTION("No valid IGD") {
        gateway.set_description("<root><device><deviceType>"
                "urn:schemas-upnp-org:device:MediaServer:1</deviceType></device></root>");
        control_point cp(options);
        cp.discover(ec);
        CHECK(ec == error::client::no_valid_igd);
        CHECK_FALSE(cp.is_bound());
        cp.status(ec);
        CHECK(ec == error::client::no_valid_igd);
    }
}

TEST_CASE("Discovery without answers", "[control-point]") {
    asio::io_context ioc;
    asio::ip::udp::socket silent(ioc,
            asio::ip::udp::endpoint(asio::ip::address_v4::loopback(), 0));
    error_code ec;

    SECTION("No device found") {
        const auto options = silent_options(silent, std::chrono::milliseconds(200));
        control_point cp(options);
        const auto start = std::chrono::steady_clock::now();
        cp.discover(ec);
        CHECK(ec == error::client::no_device_found);
        CHECK(std::chrono::steady_clock::now() - start >= options.discovery.timeout);
        CHECK_FALSE(cp.is_bound());

        // Later operations report why there is no gateway.
        cp.external_ip(ec);
        CHECK(ec == error::client::no_device_found);
    }

    SECTION("Destruction cancels discovery") {
        auto options = silent_options(silent, std::chrono::milliseconds(10000));
        options.autodiscover = true;
        const auto start = std::chrono::steady_clock::now();
        {
            control_point cp(options);
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(10000));
    }
}
