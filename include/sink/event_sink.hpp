#pragma once

#include "serialize/tree.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace pitwall::sink {

/**
 * Destination for serialized packets.
 *
 * Implementations must accept writes from several worker threads.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void write(const serialize::Tree& document) = 0;
    virtual void flush() = 0;
};

/**
 * Writes one compact JSON document per line to a stream.
 */
class JsonLinesSink : public EventSink {
public:
    explicit JsonLinesSink(std::ostream& out)
        : m_out(out) {}

    void write(const serialize::Tree& document) override;
    void flush() override;

    uint64_t linesWritten() const;

private:
    std::ostream& m_out;
    mutable std::mutex m_mutex;
    uint64_t m_lines = 0;
};

/**
 * JSON lines appended to a file.
 */
class FileSink : public EventSink {
public:
    explicit FileSink(const std::string& path);

    bool isOpen() const { return m_file.is_open(); }

    void write(const serialize::Tree& document) override { m_lines.write(document); }
    void flush() override { m_lines.flush(); }

private:
    std::ofstream m_file;
    JsonLinesSink m_lines;
};

// "-" selects stdout; anything else is a file opened for append.
// Returns nullptr if the file cannot be opened.
std::unique_ptr<EventSink> createSink(const std::string& outputPath);

} // namespace pitwall::sink
