#include "network/telemetry_receiver.hpp"
#include "utils/logger.hpp"

#include <memory>
#include <vector>

namespace pitwall::network {

TelemetryReceiver::TelemetryReceiver(asio::io_context& io_context, const std::string& host, uint16_t port)
    : m_io_context(io_context)
    , m_strand(asio::make_strand(io_context))
    , m_socket(io_context)
    , m_host(host)
    , m_port(port)
    , m_running(false)
{
}

TelemetryReceiver::~TelemetryReceiver() {
    m_running = false;
    closeSocket();
}

void TelemetryReceiver::start() {
    if (m_running) return;

    try {
        udp::endpoint endpoint(asio::ip::make_address(m_host), m_port);

        m_socket.open(endpoint.protocol());
        m_socket.set_option(udp::socket::reuse_address(true));
        m_socket.bind(endpoint);
        m_boundPort = m_socket.local_endpoint().port();

        m_running = true;
        LOG_INFO("Telemetry receiver listening on {}:{}", m_host, m_boundPort);

        asio::post(m_strand, [this]() { doReceive(); });
    }
    catch (const std::exception& e) {
        LOG_ERROR("Failed to start telemetry receiver: {}", e.what());
        asio::error_code ec;
        m_socket.close(ec);
        throw;
    }
}

void TelemetryReceiver::stop() {
    if (!m_running.exchange(false)) return;

    asio::post(m_strand, [this]() {
        closeSocket();
        LOG_INFO("Telemetry receiver stopped after {} datagrams", m_datagrams.load());
    });
}

void TelemetryReceiver::closeSocket() {
    asio::error_code ec;
    m_socket.close(ec);
}

void TelemetryReceiver::doReceive() {
    if (!m_running) return;

    m_socket.async_receive_from(
        asio::buffer(m_buffer), m_sender,
        asio::bind_executor(m_strand, [this](const asio::error_code& error, size_t bytes) {
            if (error) {
                if (error == asio::error::operation_aborted) {
                    return;
                }
                LOG_WARN("Telemetry receive error: {}", error.message());
            }
            else {
                m_datagrams++;
                if (m_handler) {
                    auto datagram = std::make_shared<std::vector<uint8_t>>(
                        m_buffer.begin(), m_buffer.begin() + bytes);
                    asio::post(m_io_context, [handler = m_handler, datagram, sender = m_sender]() {
                        try {
                            handler(datagram->data(), datagram->size(), sender);
                        }
                        catch (const std::exception& e) {
                            LOG_ERROR("Datagram from {}:{} failed: {}",
                                      sender.address().to_string(), sender.port(), e.what());
                        }
                    });
                }
            }
            doReceive();
        })
    );
}

} // namespace pitwall::network
