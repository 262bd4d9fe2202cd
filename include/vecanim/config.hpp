#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vecanim/logger.hpp>

namespace vecanim
{

enum class PlaybackState
{
    Idle,  // nothing loaded
    Stopped,
    Playing,
    Paused,
};

enum class LoopMode
{
    None,      // Play once and stop
    Loop,      // Wrap back to start
    PingPong,  // Reverse direction at each end
};

const char*             playback_state_name(PlaybackState state);
const char*             loop_mode_name(LoopMode mode);
std::optional<LoopMode> loop_mode_from_string(std::string_view name);

struct RuntimeConfig
{
    float    speed                = 1.0f;
    LoopMode loop_mode            = LoopMode::None;
    float    target_fps           = 60.0f;
    float    redraw_all_threshold = 0.5f;
    float    region_merge_margin  = 10.0f;
    size_t   pool_initial_size    = 10;
    size_t   pool_max_size        = 1000;
    LogLevel log_level            = LogLevel::Info;

    // Defaults overridden by VECANIM_LOG_LEVEL, VECANIM_SPEED, VECANIM_LOOP
    // (none | loop | pingpong) and VECANIM_TARGET_FPS. Unparsable or
    // out-of-range values are logged and ignored.
    static RuntimeConfig from_env();
};

}  // namespace vecanim
