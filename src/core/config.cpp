#include <cctype>
#include <cstdlib>
#include <string>
#include <vecanim/config.hpp>

namespace vecanim
{

const char* playback_state_name(PlaybackState state)
{
    switch (state)
    {
        case PlaybackState::Idle:
            return "idle";
        case PlaybackState::Stopped:
            return "stopped";
        case PlaybackState::Playing:
            return "playing";
        case PlaybackState::Paused:
            return "paused";
    }
    return "unknown";
}

const char* loop_mode_name(LoopMode mode)
{
    switch (mode)
    {
        case LoopMode::None:
            return "none";
        case LoopMode::Loop:
            return "loop";
        case LoopMode::PingPong:
            return "pingpong";
    }
    return "unknown";
}

std::optional<LoopMode> loop_mode_from_string(std::string_view name)
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "none")
        return LoopMode::None;
    if (lower == "loop")
        return LoopMode::Loop;
    if (lower == "pingpong" || lower == "ping-pong")
        return LoopMode::PingPong;
    return std::nullopt;
}

namespace
{

std::optional<float> parse_positive(const char* text)
{
    char* end   = nullptr;
    float value = std::strtof(text, &end);
    if (end == text || *end != '\0' || !(value > 0.0f))
        return std::nullopt;
    return value;
}

}  // anonymous namespace

RuntimeConfig RuntimeConfig::from_env()
{
    RuntimeConfig config;

    if (const char* env = std::getenv("VECANIM_LOG_LEVEL"))
    {
        if (auto level = Logger::level_from_string(env))
            config.log_level = *level;
        else
            VECANIM_LOG_WARN("config", "Ignoring VECANIM_LOG_LEVEL='{}'", env);
    }

    if (const char* env = std::getenv("VECANIM_SPEED"))
    {
        if (auto speed = parse_positive(env))
            config.speed = *speed;
        else
            VECANIM_LOG_WARN("config", "Ignoring VECANIM_SPEED='{}': expected a number > 0", env);
    }

    if (const char* env = std::getenv("VECANIM_LOOP"))
    {
        if (auto mode = loop_mode_from_string(env))
            config.loop_mode = *mode;
        else
            VECANIM_LOG_WARN("config",
                             "Ignoring VECANIM_LOOP='{}': expected none, loop or pingpong",
                             env);
    }

    if (const char* env = std::getenv("VECANIM_TARGET_FPS"))
    {
        if (auto fps = parse_positive(env))
            config.target_fps = *fps;
        else
            VECANIM_LOG_WARN("config", "Ignoring VECANIM_TARGET_FPS='{}'", env);
    }

    return config;
}

}  // namespace vecanim
