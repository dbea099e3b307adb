#pragma once

#include "network/telemetry_receiver.hpp"
#include "pipeline/packet_processor.hpp"
#include "sink/event_sink.hpp"
#include "utils/config.hpp"
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace pitwall {

/**
 * Telemetry bridge
 *
 * Orchestrates the pipeline:
 * - UDP telemetry receiver (port 20777)
 * - packet processor (decode and serialize)
 * - JSON lines sink (stdout or file)
 *
 * SIGINT and SIGTERM stop the bridge; run() then returns.
 */
class Bridge {
public:
    Bridge();
    ~Bridge();

    // Initialize bridge with configuration
    bool init(const utils::BridgeConfig& config);

    // Bind the receiver and arm timers and signals
    bool start();

    // Request shutdown; safe from any thread
    void stop();

    // Run bridge (blocking until stopped)
    void run();

private:
    void scheduleStats();
    void logStats();

    utils::BridgeConfig m_config;
    asio::io_context m_io_context;
    asio::strand<asio::io_context::executor_type> m_strand;
    asio::steady_timer m_statsTimer;
    asio::signal_set m_signals;

    std::shared_ptr<sink::EventSink> m_sink;
    std::shared_ptr<pipeline::PacketProcessor> m_processor;
    std::unique_ptr<network::TelemetryReceiver> m_receiver;

    // Worker threads
    std::vector<std::thread> m_threads;
    std::atomic<bool> m_running;
};

} // namespace pitwall
