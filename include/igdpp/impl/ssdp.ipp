#ifndef IGDPP_SSDP_IMPL
#define IGDPP_SSDP_IMPL

#include "../ssdp.hpp"
#include "../url.hpp"
#include "../detail/http_client.hpp"

#include <algorithm>
#include <array>

#include <asio/buffer.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/multicast.hpp>
#include <asio/socket_base.hpp>
#include <asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

namespace igd {

inline std::string make_search_request(const std::string& search_target,
        std::chrono::milliseconds timeout,
        const asio::ip::udp::endpoint& multicast_endpoint)
{
    // MX is the number of seconds devices may delay their answer by.
    const auto mx = std::max<long long>(1, timeout.count() / 1000);
    return "M-SEARCH * HTTP/1.1\r\n"
        "HOST: " + multicast_endpoint.address().to_string() + ':'
            + std::to_string(multicast_endpoint.port()) + "\r\n"
        "ST: " + search_target + "\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "MX: " + std::to_string(mx) + "\r\n"
        "\r\n";
}

inline bool parse_search_response(const std::string& datagram, gateway_device& device)
{
    error_code error;
    const auto response = detail::parse_http_response(datagram, error);
    if(error || response.status != 200) {
        return false;
    }
    const auto* location = response.header("LOCATION");
    if(!location || location->empty()) {
        return false;
    }
    parse_url(*location, error);
    if(error) {
        return false;
    }
    device.location = *location;
    if(const auto* st = response.header("ST")) {
        device.search_target = *st;
    }
    if(const auto* usn = response.header("USN")) {
        device.usn = *usn;
    }
    return true;
}

namespace detail {

/**
 * A single search window: sends one `M-SEARCH` and collects replies until the
 * window closes, enough devices answered, or it is stopped.
 */
class ssdp_search
{
    asio::ip::udp::socket socket_;
    asio::steady_timer timer_;
    std::array<char, 2048> receive_buffer_;
    asio::ip::udp::endpoint sender_;
    std::size_t enough_responses_;
    std::vector<gateway_device>& devices_;

public:
    ssdp_search(asio::io_context& io_context, std::size_t enough_responses,
            std::vector<gateway_device>& devices)
        : socket_(io_context)
        , timer_(io_context)
        , enough_responses_(enough_responses)
        , devices_(devices)
    {}

    void open(const discovery_options& options, error_code& error)
    {
        const auto& source = options.source_address;
        socket_.open(asio::ip::udp::v4(), error);
        if(error) {
            return;
        }
        // Other control points on this host may hold the SSDP port as well.
        socket_.set_option(asio::socket_base::reuse_address(true), error);
        if(error) {
            return;
        }
        const asio::ip::udp::endpoint local(
                source.is_unspecified() ? asio::ip::address(asio::ip::address_v4::any()) : source,
                options.reuse_incoming_port ? ssdp_port : 0);
        socket_.bind(local, error);
        if(error) {
            return;
        }
        socket_.set_option(asio::ip::multicast::hops(options.ttl), error);
        if(error) {
            return;
        }
        if(!source.is_unspecified()) {
            socket_.set_option(asio::ip::multicast::outbound_interface(source.to_v4()), error);
        }
    }

    void start(const std::string& request, const asio::ip::udp::endpoint& destination,
            std::chrono::milliseconds window, error_code& error)
    {
        socket_.send_to(asio::buffer(request), destination, 0, error);
        if(error) {
            return;
        }
        timer_.expires_after(window);
        timer_.async_wait([this](const error_code& error)
                {
                    if(error != asio::error::operation_aborted) { stop(); }
                });
        receive();
    }

    void stop()
    {
        error_code ignored;
        timer_.cancel();
        socket_.close(ignored);
    }

private:
    void receive()
    {
        socket_.async_receive_from(asio::buffer(receive_buffer_), sender_,
                [this](const error_code& error, std::size_t num_received)
                { on_receive(error, num_received); });
    }

    void on_receive(const error_code& error, std::size_t num_received)
    {
        if(error == asio::error::operation_aborted) {
            return;
        }
        if(error && error != asio::error::connection_refused) {
            spdlog::warn("igd: SSDP receive failed: {}", error.message());
            stop();
            return;
        }

        if(!error) {
            gateway_device device;
            const std::string datagram(receive_buffer_.data(), num_received);
            if(!parse_search_response(datagram, device)) {
                spdlog::debug("igd: ignoring unparsable SSDP reply from {}",
                        sender_.address().to_string());
            } else if(std::none_of(devices_.begin(), devices_.end(),
                        [&device](const gateway_device& d) { return d.location == device.location; })) {
                device.sender = sender_;
                spdlog::debug("igd: {} answered with location {}",
                        sender_.address().to_string(), device.location);
                devices_.push_back(std::move(device));
                if(enough_responses_ > 0 && devices_.size() >= enough_responses_) {
                    stop();
                    return;
                }
            }
        }
        receive();
    }
};

inline void run_search_window(const discovery_options& options,
        const std::string& search_target, std::vector<gateway_device>& devices,
        error_code& error, const std::atomic<bool>* cancel)
{
    asio::io_context io_context;
    ssdp_search search(io_context, options.enough_responses, devices);
    search.open(options, error);
    if(error) {
        return;
    }
    spdlog::debug("igd: searching for {} for {}ms", search_target, options.timeout.count());
    search.start(make_search_request(search_target, options.timeout, options.multicast_endpoint),
            options.multicast_endpoint, options.timeout, error);
    if(error) {
        return;
    }

    // Run in slices so that a cancellation request is noticed promptly.
    const auto slice = std::min(options.timeout, std::chrono::milliseconds(50));
    while(!io_context.stopped()) {
        io_context.run_for(slice);
        if(cancel && cancel->load()) {
            search.stop();
            io_context.run();
            error = make_error_code(asio::error::operation_aborted);
            return;
        }
    }
}

} // detail

inline std::vector<gateway_device> discover(const discovery_options& options,
        error_code& error, const std::atomic<bool>* cancel)
{
    error = error_code();
    if(options.timeout.count() <= 0 || options.ttl < 1 || options.ttl > 255
            || (!options.source_address.is_unspecified() && !options.source_address.is_v4())) {
        error = make_error_code(error::client::invalid_argument);
        return {};
    }

    std::vector<gateway_device> devices;
    detail::run_search_window(options, options.search_target, devices, error, cancel);
    if(!error && devices.empty() && options.search_all_fallback
            && options.search_target != all_search_target) {
        detail::run_search_window(options, all_search_target, devices, error, cancel);
    }
    if(error) {
        spdlog::warn("igd: discovery failed: {}", error.message());
        return {};
    }
    if(devices.empty()) {
        spdlog::warn("igd: no UPnP device answered within {}ms", options.timeout.count());
        error = make_error_code(error::client::no_device_found);
        return {};
    }
    spdlog::info("igd: {} device(s) answered the search", devices.size());
    return devices;
}

} // igd

#endif // IGDPP_SSDP_IMPL
