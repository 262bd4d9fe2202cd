#pragma once

#include <chrono>

namespace vecanim
{

// Time source for the runtime. tick() returns seconds since the previous tick
// (0 while stopped); elapsed() is seconds since start().
class Clock
{
   public:
    virtual ~Clock() = default;

    virtual void  start()            = 0;
    virtual void  stop()             = 0;
    virtual float tick()             = 0;
    virtual float elapsed() const    = 0;
    virtual float delta_time() const = 0;
    virtual bool  is_running() const = 0;
    virtual void  reset()            = 0;
};

class SteadyClock final : public Clock
{
   public:
    void  start() override;
    void  stop() override;
    float tick() override;
    float elapsed() const override { return elapsed_; }
    float delta_time() const override { return delta_; }
    bool  is_running() const override { return running_; }
    void  reset() override;

   private:
    using SteadyTime = std::chrono::steady_clock::time_point;

    SteadyTime start_time_{};
    SteadyTime last_time_{};
    float      elapsed_ = 0.0f;
    float      delta_   = 0.0f;
    bool       running_ = false;
};

// Host-driven clock for deterministic stepping: advance() moves time forward,
// the next tick() reports how much moved since the previous one.
class ManualClock final : public Clock
{
   public:
    void advance(float seconds) { now_ += seconds; }
    float now() const { return now_; }

    void  start() override;
    void  stop() override;
    float tick() override;
    float elapsed() const override { return elapsed_; }
    float delta_time() const override { return delta_; }
    bool  is_running() const override { return running_; }
    void  reset() override;

   private:
    float now_        = 0.0f;
    float start_time_ = 0.0f;
    float last_time_  = 0.0f;
    float elapsed_    = 0.0f;
    float delta_      = 0.0f;
    bool  running_    = false;
};

}  // namespace vecanim
