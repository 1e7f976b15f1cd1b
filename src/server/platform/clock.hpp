#pragma once

#include <chrono>
#include <thread>

class Clock {
public:
    virtual ~Clock() = default;
    virtual void sleep_for(std::chrono::milliseconds d) = 0;
};

class SteadyClock : public Clock {
public:
    void sleep_for(std::chrono::milliseconds d) override { std::this_thread::sleep_for(d); }
};
