#pragma once
#include "console_io.hpp"

#include <deque>
#include <utility>
#include <string>
#include <vector>

// Scripted LineIO that records the order of write/flush/read calls.
class RecordingLineIO : public LineIO {
public:
    explicit RecordingLineIO(std::deque<std::string> lines) : m_lines(std::move(lines)) {}

    void write(const std::string& text) override {
        events.push_back("write");
        written.push_back(text);
    }

    void flush() override {
        events.push_back("flush");
        if (failFlush) {
            throw PromptIOError(PromptIOError::Kind::FlushFailure, "flush refused");
        }
    }

    std::string readLine() override {
        events.push_back("read");
        if (failRead || m_lines.empty()) {
            throw PromptIOError(PromptIOError::Kind::ReadFailure, "no more input");
        }
        std::string line = m_lines.front();
        m_lines.pop_front();
        return line;
    }

    std::size_t remaining() const { return m_lines.size(); }

    std::vector<std::string> events;
    std::vector<std::string> written;
    bool failFlush = false;
    bool failRead  = false;

private:
    std::deque<std::string> m_lines;
};
