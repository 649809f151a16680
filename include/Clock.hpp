#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

// ============================================================================
// External clock
// ============================================================================
// Source of the host's "current external tick" (a block height). Readings are
// non-decreasing; equal readings mean no tick happened in between.

class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t currentHeight() const = 0;
};

// Clock driven by the host: the CLI sets it from --height, tests step it.
class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t height = 0) : height_(height) {}

    uint64_t currentHeight() const override { return height_; }

    void setHeight(uint64_t height) {
        if (height < height_) {
            throw std::invalid_argument("Clock cannot move backwards from " + std::to_string(height_) +
                                        " to " + std::to_string(height));
        }
        height_ = height;
    }

    void tick(uint64_t count = 1) { height_ += count; }

private:
    uint64_t height_;
};

#endif // CLOCK_HPP
