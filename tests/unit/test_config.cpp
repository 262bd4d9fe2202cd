#include <cstdlib>
#include <gtest/gtest.h>
#include <vecanim/config.hpp>

using namespace vecanim;

namespace
{

void clear_env()
{
    unsetenv("VECANIM_LOG_LEVEL");
    unsetenv("VECANIM_SPEED");
    unsetenv("VECANIM_LOOP");
    unsetenv("VECANIM_TARGET_FPS");
}

}  // namespace

TEST(RuntimeConfig, Defaults)
{
    clear_env();
    auto cfg = RuntimeConfig::from_env();
    EXPECT_FLOAT_EQ(cfg.speed, 1.0f);
    EXPECT_EQ(cfg.loop_mode, LoopMode::None);
    EXPECT_FLOAT_EQ(cfg.target_fps, 60.0f);
    EXPECT_FLOAT_EQ(cfg.redraw_all_threshold, 0.5f);
    EXPECT_FLOAT_EQ(cfg.region_merge_margin, 10.0f);
    EXPECT_EQ(cfg.pool_initial_size, 10u);
    EXPECT_EQ(cfg.pool_max_size, 1000u);
    EXPECT_EQ(cfg.log_level, LogLevel::Info);
}

TEST(RuntimeConfig, ReadsEnvironment)
{
    clear_env();
    setenv("VECANIM_LOG_LEVEL", "debug", 1);
    setenv("VECANIM_SPEED", "2.5", 1);
    setenv("VECANIM_LOOP", "ping-pong", 1);
    setenv("VECANIM_TARGET_FPS", "30", 1);

    auto cfg = RuntimeConfig::from_env();
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
    EXPECT_FLOAT_EQ(cfg.speed, 2.5f);
    EXPECT_EQ(cfg.loop_mode, LoopMode::PingPong);
    EXPECT_FLOAT_EQ(cfg.target_fps, 30.0f);
    clear_env();
}

TEST(RuntimeConfig, IgnoresInvalidValues)
{
    clear_env();
    setenv("VECANIM_LOG_LEVEL", "chatty", 1);
    setenv("VECANIM_SPEED", "-1", 1);
    setenv("VECANIM_LOOP", "sometimes", 1);
    setenv("VECANIM_TARGET_FPS", "60fps", 1);

    auto cfg = RuntimeConfig::from_env();
    EXPECT_EQ(cfg.log_level, LogLevel::Info);
    EXPECT_FLOAT_EQ(cfg.speed, 1.0f);
    EXPECT_EQ(cfg.loop_mode, LoopMode::None);
    EXPECT_FLOAT_EQ(cfg.target_fps, 60.0f);
    clear_env();
}

TEST(LoopMode, NamesRoundTrip)
{
    for (auto mode : {LoopMode::None, LoopMode::Loop, LoopMode::PingPong})
        EXPECT_EQ(loop_mode_from_string(loop_mode_name(mode)), mode);
    EXPECT_EQ(loop_mode_from_string("LOOP"), LoopMode::Loop);
    EXPECT_FALSE(loop_mode_from_string("").has_value());
}

TEST(PlaybackState, Names)
{
    EXPECT_STREQ(playback_state_name(PlaybackState::Idle), "idle");
    EXPECT_STREQ(playback_state_name(PlaybackState::Stopped), "stopped");
    EXPECT_STREQ(playback_state_name(PlaybackState::Playing), "playing");
    EXPECT_STREQ(playback_state_name(PlaybackState::Paused), "paused");
}
