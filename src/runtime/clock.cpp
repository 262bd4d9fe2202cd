#include <vecanim/clock.hpp>

namespace vecanim
{

// ─── SteadyClock ─────────────────────────────────────────────────────────────

void SteadyClock::start()
{
    if (running_)
        return;
    running_    = true;
    start_time_ = std::chrono::steady_clock::now();
    last_time_  = start_time_;
    delta_      = 0.0f;
}

void SteadyClock::stop()
{
    if (!running_)
        return;
    running_ = false;
    delta_   = 0.0f;
}

float SteadyClock::tick()
{
    if (!running_)
        return 0.0f;

    using Seconds = std::chrono::duration<float>;
    auto now      = std::chrono::steady_clock::now();
    delta_        = std::chrono::duration_cast<Seconds>(now - last_time_).count();
    elapsed_      = std::chrono::duration_cast<Seconds>(now - start_time_).count();
    last_time_    = now;
    return delta_;
}

void SteadyClock::reset()
{
    start_time_ = {};
    last_time_  = {};
    elapsed_    = 0.0f;
    delta_      = 0.0f;
    running_    = false;
}

// ─── ManualClock ─────────────────────────────────────────────────────────────

void ManualClock::start()
{
    if (running_)
        return;
    running_    = true;
    start_time_ = now_;
    last_time_  = now_;
    delta_      = 0.0f;
}

void ManualClock::stop()
{
    if (!running_)
        return;
    running_ = false;
    delta_   = 0.0f;
}

float ManualClock::tick()
{
    if (!running_)
        return 0.0f;
    delta_     = now_ - last_time_;
    elapsed_   = now_ - start_time_;
    last_time_ = now_;
    return delta_;
}

void ManualClock::reset()
{
    start_time_ = now_;
    last_time_  = now_;
    elapsed_    = 0.0f;
    delta_      = 0.0f;
    running_    = false;
}

}  // namespace vecanim
