#ifndef LOG_SINK_HPP
#define LOG_SINK_HPP

#include <iostream>
#include <string>
#include <vector>

// ============================================================================
// Diagnostic sinks
// ============================================================================
// Line-oriented diagnostic output. Nothing in the board logic depends on a
// sink being present or on what it does with the lines.

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void line(const std::string& text) = 0;

    void lines(const std::vector<std::string>& texts) {
        for (const auto& text : texts) {
            line(text);
        }
    }
};

class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cout) : out_(out) {}

    void line(const std::string& text) override { out_ << text << "\n"; }

private:
    std::ostream& out_;
};

// Keeps every line; used by tests.
class MemorySink : public LogSink {
public:
    void line(const std::string& text) override { lines_.push_back(text); }

    const std::vector<std::string>& captured() const { return lines_; }
    void clear() { lines_.clear(); }

private:
    std::vector<std::string> lines_;
};

class NullSink : public LogSink {
public:
    void line(const std::string&) override {}
};

#endif // LOG_SINK_HPP
