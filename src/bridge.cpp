#include "bridge.hpp"
#include "utils/logger.hpp"

#include <chrono>
#include <csignal>

namespace pitwall {

Bridge::Bridge()
    : m_strand(asio::make_strand(m_io_context))
    , m_statsTimer(m_strand)
    , m_signals(m_strand)
    , m_running(false)
{
}

Bridge::~Bridge() {
    stop();

    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool Bridge::init(const utils::BridgeConfig& config) {
    m_config = config;

    LOG_INFO("Initializing telemetry bridge");
    LOG_INFO("  Listen: {}:{}", config.listen_host, config.listen_port);
    LOG_INFO("  Output: {}", config.output_path == "-" ? "stdout" : config.output_path);

    m_sink = sink::createSink(config.output_path);
    if (!m_sink) {
        LOG_ERROR("Failed to open output {}", config.output_path);
        return false;
    }

    m_processor = std::make_shared<pipeline::PacketProcessor>(m_sink);

    m_receiver = std::make_unique<network::TelemetryReceiver>(
        m_io_context, config.listen_host, config.listen_port);

    m_receiver->setDatagramHandler(
        [processor = m_processor](const uint8_t* data, size_t size, const network::udp::endpoint&) {
            processor->process(data, size);
        });

    LOG_INFO("Bridge initialized successfully");
    return true;
}

bool Bridge::start() {
    if (m_running) return true;

    try {
        m_receiver->start();
    }
    catch (const std::exception&) {
        return false;
    }
    m_running = true;

    m_signals.add(SIGINT);
    m_signals.add(SIGTERM);
    m_signals.async_wait([this](const asio::error_code& error, int signal) {
        if (error) return;
        LOG_INFO("Received signal {}, shutting down...", signal);
        stop();
    });

    asio::post(m_strand, [this]() { scheduleStats(); });

    LOG_INFO("Bridge started");
    return true;
}

void Bridge::stop() {
    if (!m_running.exchange(false)) return;

    LOG_INFO("Stopping bridge...");

    if (m_receiver) m_receiver->stop();

    // Once these are gone the io_context runs out of work and run() returns
    asio::post(m_strand, [this]() {
        asio::error_code ec;
        m_statsTimer.cancel(ec);
        m_signals.cancel(ec);
    });
}

void Bridge::run() {
    unsigned int numThreads = m_config.worker_threads;
    if (numThreads < 1) numThreads = 1;

    LOG_INFO("Starting {} worker threads", numThreads);

    for (unsigned int i = 0; i < numThreads; i++) {
        m_threads.emplace_back([this]() {
            m_io_context.run();
        });
    }

    // Wait for threads
    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_threads.clear();

    if (m_sink) m_sink->flush();
    logStats();
}

void Bridge::scheduleStats() {
    if (m_config.stats_interval == 0 || !m_running) return;

    m_statsTimer.expires_after(std::chrono::seconds(m_config.stats_interval));
    m_statsTimer.async_wait([this](const asio::error_code& error) {
        if (error) return;

        logStats();
        if (m_sink) m_sink->flush();
        scheduleStats();
    });
}

void Bridge::logStats() {
    if (!m_processor) return;

    auto stats = m_processor->stats();
    LOG_INFO("Packets: {} received, {} emitted, {} truncated, {} malformed, {} unsupported, {} with trailing bytes",
             stats.received, stats.emitted, stats.truncated, stats.malformed,
             stats.unsupported, stats.trailing);
}

} // namespace pitwall
