#pragma once
#include <chrono>
#include <cstdint>

namespace qcb {

// Source of "now" in unix seconds. Deadlines and staleness are compared
// against it; nothing fires on its own.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now() const = 0;
};

class SystemClock : public Clock {
public:
    uint64_t now() const override {
        using namespace std::chrono;
        return static_cast<uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
    }
};

class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t t = 0) : t_(t) {}
    uint64_t now() const override { return t_; }
    void set(uint64_t t) { t_ = t; }
    void advance(uint64_t secs) { t_ += secs; }

private:
    uint64_t t_;
};

}  // namespace qcb
