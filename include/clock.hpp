#pragma once

#include <cstdint>

#include "raffle_types.hpp"

namespace raffle {

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start);

    Timestamp now() const override { return now_; }
    void advance(std::uint64_t seconds);
    void set(Timestamp value) { now_ = value; }

private:
    Timestamp now_;
};

} // namespace raffle
