#pragma once
#include <string>
#include <iostream>
#include <stdexcept>

// Raised when the prompt cannot be flushed or the answer cannot be read.
// Never retried by the prompt functions.
class PromptIOError : public std::runtime_error {
public:
    enum class Kind { FlushFailure, ReadFailure };

    PromptIOError(Kind kind, const std::string& what)
    : std::runtime_error(what), m_kind(kind) {}

    Kind kind() const noexcept { return m_kind; }

private:
    Kind m_kind;
};

// Line-oriented terminal collaborator used by PromptManager.
class LineIO {
public:
    virtual ~LineIO() = default;

    virtual void write(const std::string& text) = 0;
    // Throws PromptIOError(FlushFailure).
    virtual void flush() = 0;
    // One line without its separator. Throws PromptIOError(ReadFailure).
    virtual std::string readLine() = 0;
};

class StreamLineIO : public LineIO {
public:
    StreamLineIO(std::istream& in = std::cin, std::ostream& out = std::cout)
    : m_in(in), m_out(out) {}

    void write(const std::string& text) override {
        m_out << text;
    }

    void flush() override {
        // A failed write leaves the stream bad, so it surfaces here too.
        m_out.flush();
        if (!m_out) {
            throw PromptIOError(PromptIOError::Kind::FlushFailure, "Flushing line failed.");
        }
    }

    std::string readLine() override {
        std::string line;
        std::getline(m_in, line);

        // EOF before any character is an empty answer, not an error.
        if (m_in.bad() || (m_in.fail() && !m_in.eof())) {
            throw PromptIOError(PromptIOError::Kind::ReadFailure, "Failed to read line.");
        }
        return line;
    }

private:
    std::istream& m_in;
    std::ostream& m_out;
};
