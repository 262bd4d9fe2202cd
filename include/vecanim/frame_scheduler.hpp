#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace vecanim
{

// Fans one display-frame tick out to every scheduled callback. The host calls
// dispatch(dt) from its own frame loop (or run_frame(), which measures dt with
// a steady clock). Scheduling the first callback starts the scheduler and
// unscheduling the last one stops it; dispatch() does nothing while stopped.
class FrameScheduler
{
   public:
    using FrameCallback = std::function<void(float dt)>;
    using CallbackId    = uint64_t;

    // Rolling statistics over the last HISTORY_FRAMES dispatched frames.
    struct FrameStats
    {
        float    fps                = 0.0f;
        float    avg_frame_time_ms  = 0.0f;
        float    min_frame_time_ms  = 0.0f;
        float    max_frame_time_ms  = 0.0f;
        uint32_t hitch_count        = 0;   // frames > 2x target since start
        uint64_t frame_count        = 0;
    };

    static constexpr size_t HISTORY_FRAMES = 60;

    explicit FrameScheduler(float target_fps = 60.0f);

    CallbackId schedule(FrameCallback cb);
    bool       unschedule(CallbackId id);
    void       clear();

    void start();
    void stop();
    bool is_running() const { return running_; }

    size_t callback_count() const { return callbacks_.size(); }

    // Runs every callback registered at the start of the frame that is still
    // registered when its turn comes. Exceptions are logged and swallowed per
    // callback. Returns false when the scheduler is stopped.
    bool dispatch(float dt);

    // Measures dt since the previous run_frame() (0 on the first, clamped to
    // 0.25s) and dispatches it. Returns the dt used.
    float run_frame();

    void  set_target_fps(float fps);
    float target_fps() const { return target_fps_; }

    float      fps() const { return stats_.fps; }
    float      average_frame_time_ms() const { return stats_.avg_frame_time_ms; }
    float      min_frame_time_ms() const { return stats_.min_frame_time_ms; }
    float      max_frame_time_ms() const { return stats_.max_frame_time_ms; }
    FrameStats frame_stats() const { return stats_; }
    uint64_t   frame_number() const { return stats_.frame_count; }

   private:
    using SteadyTime = std::chrono::steady_clock::time_point;

    void update_stats(float dt_ms);

    std::vector<std::pair<CallbackId, std::shared_ptr<FrameCallback>>> callbacks_;
    CallbackId                                                         next_id_ = 1;
    bool                                                               running_ = false;
    float                                                              target_fps_ = 60.0f;

    // run_frame timing
    SteadyTime last_frame_start_{};
    bool       first_frame_ = true;

    // Stats
    FrameStats        stats_;
    std::deque<float> history_ms_;
    float             fps_window_ms_  = 0.0f;
    uint32_t          fps_window_frames_ = 0;
};

}  // namespace vecanim
