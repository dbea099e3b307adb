#include "sink/event_sink.hpp"
#include "utils/logger.hpp"

#include <iostream>

namespace pitwall::sink {

// =============================================================================
// JsonLinesSink
// =============================================================================

void JsonLinesSink::write(const serialize::Tree& document) {
    std::string line = serialize::renderJson(document);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << line << '\n';
    m_lines++;
}

void JsonLinesSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out.flush();
}

uint64_t JsonLinesSink::linesWritten() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lines;
}

// =============================================================================
// FileSink
// =============================================================================

FileSink::FileSink(const std::string& path)
    : m_file(path, std::ios::out | std::ios::app)
    , m_lines(m_file)
{
}

std::unique_ptr<EventSink> createSink(const std::string& outputPath) {
    if (outputPath.empty() || outputPath == "-") {
        return std::make_unique<JsonLinesSink>(std::cout);
    }

    auto sink = std::make_unique<FileSink>(outputPath);
    if (!sink->isOpen()) {
        LOG_ERROR("Cannot open output file {}", outputPath);
        return nullptr;
    }
    return sink;
}

} // namespace pitwall::sink
