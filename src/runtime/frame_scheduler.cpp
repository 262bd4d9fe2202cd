#include <algorithm>
#include <cmath>
#include <exception>
#include <numeric>
#include <vecanim/frame_scheduler.hpp>
#include <vecanim/logger.hpp>

namespace vecanim
{

FrameScheduler::FrameScheduler(float target_fps)
{
    set_target_fps(target_fps);
}

void FrameScheduler::set_target_fps(float fps)
{
    if (fps > 0.0f)
    {
        target_fps_ = fps;
    }
}

FrameScheduler::CallbackId FrameScheduler::schedule(FrameCallback cb)
{
    CallbackId id = next_id_++;
    callbacks_.emplace_back(id, std::make_shared<FrameCallback>(std::move(cb)));
    if (!running_)
        start();
    return id;
}

bool FrameScheduler::unschedule(CallbackId id)
{
    auto it = std::find_if(callbacks_.begin(),
                           callbacks_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == callbacks_.end())
        return false;

    callbacks_.erase(it);
    if (callbacks_.empty() && running_)
        stop();
    return true;
}

void FrameScheduler::clear()
{
    callbacks_.clear();
    stop();
}

void FrameScheduler::start()
{
    if (running_)
        return;
    running_            = true;
    first_frame_        = true;
    fps_window_ms_      = 0.0f;
    fps_window_frames_  = 0;
    VECANIM_LOG_TRACE("scheduler", "started");
}

void FrameScheduler::stop()
{
    if (!running_)
        return;
    running_ = false;
    VECANIM_LOG_TRACE("scheduler", "stopped");
}

bool FrameScheduler::dispatch(float dt)
{
    if (!running_)
        return false;

    update_stats(dt * 1000.0f);

    // Snapshot so callbacks may (un)schedule during the frame.
    auto snapshot = callbacks_;
    for (const auto& [id, cb] : snapshot)
    {
        CallbackId cid = id;
        bool still_scheduled = std::any_of(callbacks_.begin(),
                                           callbacks_.end(),
                                           [cid](const auto& entry) { return entry.first == cid; });
        if (!still_scheduled)
            continue;

        try
        {
            (*cb)(dt);
        }
        catch (const std::exception& e)
        {
            VECANIM_LOG_ERROR("scheduler", "Error in scheduled callback {}: {}", cid, e.what());
        }
    }
    return true;
}

float FrameScheduler::run_frame()
{
    auto  now = std::chrono::steady_clock::now();
    float dt  = 0.0f;
    if (!first_frame_)
    {
        dt = std::chrono::duration<float>(now - last_frame_start_).count();
        // Clamp dt to avoid spiral of death
        dt = std::min(dt, 0.25f);
    }
    first_frame_      = false;
    last_frame_start_ = now;

    dispatch(dt);
    return dt;
}

void FrameScheduler::update_stats(float dt_ms)
{
    history_ms_.push_back(dt_ms);
    if (history_ms_.size() > HISTORY_FRAMES)
        history_ms_.pop_front();

    stats_.frame_count++;
    auto [min_it, max_it]    = std::minmax_element(history_ms_.begin(), history_ms_.end());
    stats_.min_frame_time_ms = *min_it;
    stats_.max_frame_time_ms = *max_it;
    stats_.avg_frame_time_ms = std::accumulate(history_ms_.begin(), history_ms_.end(), 0.0f)
                               / static_cast<float>(history_ms_.size());

    float target_ms = 1000.0f / target_fps_;
    if (dt_ms > target_ms * 2.0f)
    {
        stats_.hitch_count++;
        VECANIM_LOG_DEBUG("scheduler",
                          "Frame {} hitch: {}ms (target: {}ms)",
                          stats_.frame_count,
                          dt_ms,
                          target_ms);
    }

    // FPS refreshes once per second of dispatched time.
    fps_window_ms_ += dt_ms;
    fps_window_frames_++;
    if (fps_window_ms_ >= 1000.0f)
    {
        stats_.fps = std::round(static_cast<float>(fps_window_frames_) * 1000.0f / fps_window_ms_);
        VECANIM_LOG_TRACE("perf",
                          "fps={} avg={}ms max={}ms hitches={}",
                          stats_.fps,
                          stats_.avg_frame_time_ms,
                          stats_.max_frame_time_ms,
                          stats_.hitch_count);
        fps_window_ms_     = 0.0f;
        fps_window_frames_ = 0;
    }
}

}  // namespace vecanim
