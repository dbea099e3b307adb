#pragma once

#include <asio.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace pitwall::network {

using asio::ip::udp;

/**
 * Telemetry receiver
 *
 * UDP listener for the game's telemetry stream. Socket operations run on a
 * strand with a single receive in flight; each datagram is copied and the
 * handler is posted to the io_context, so with several worker threads
 * datagrams are handled concurrently.
 *
 * Listens on port 20777 by default.
 */
class TelemetryReceiver {
public:
    using DatagramHandler = std::function<void(const uint8_t* data, size_t size,
                                               const udp::endpoint& sender)>;

    // Largest possible UDP payload
    static constexpr size_t kMaxDatagramSize = 64 * 1024;

    TelemetryReceiver(asio::io_context& io_context, const std::string& host, uint16_t port);
    ~TelemetryReceiver();

    TelemetryReceiver(const TelemetryReceiver&) = delete;
    TelemetryReceiver& operator=(const TelemetryReceiver&) = delete;

    void setDatagramHandler(DatagramHandler handler) { m_handler = std::move(handler); }

    // Bind and start receiving; throws asio::system_error on bind failure
    void start();

    // Close the socket from within the strand; safe while workers run
    void stop();

private:
    void doReceive();
    void closeSocket();

    asio::io_context& m_io_context;
    asio::strand<asio::io_context::executor_type> m_strand;
    udp::socket m_socket;
    std::string m_host;
    uint16_t m_port;
    uint16_t m_boundPort = 0;
    std::atomic<bool> m_running;
    std::atomic<uint64_t> m_datagrams{0};

    std::array<uint8_t, kMaxDatagramSize> m_buffer{};
    udp::endpoint m_sender;
    DatagramHandler m_handler;
};

} // namespace pitwall::network
