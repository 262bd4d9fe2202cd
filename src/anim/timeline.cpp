#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vecanim/timeline.hpp>

namespace vecanim
{

const char* interpolation_name(Interpolation interp)
{
    switch (interp)
    {
        case Interpolation::Linear:
            return "Linear";
        case Interpolation::Step:
            return "Step";
        case Interpolation::Cubic:
            return "Cubic";
        case Interpolation::Bezier:
            return "Bezier";
    }
    return "Unknown";
}

AnimValue blend_keyframe_values(const AnimValue& from, const AnimValue& to, float t)
{
    if (std::holds_alternative<float>(from) && std::holds_alternative<float>(to))
    {
        float a = std::get<float>(from);
        float b = std::get<float>(to);
        return a + (b - a) * t;
    }
    return t < 0.5f ? from : to;
}

// ─── AnimationTrack ──────────────────────────────────────────────────────────

AnimationTrack::AnimationTrack(SceneGraph& scene, NodeId target, std::string_view property_path)
    : binding_(PropertyBinding::bind(scene, target, property_path))
{
}

AnimationTrack::AnimationTrack(PropertyBinding binding) : binding_(binding) {}

AnimationTrack& AnimationTrack::add_keyframe(Keyframe keyframe)
{
    if (value_type_of(keyframe.value) != binding_.value_type())
    {
        throw std::invalid_argument(std::string("Keyframe value type ")
                                    + value_type_name(value_type_of(keyframe.value))
                                    + " does not match property \"" + binding_.path() + "\" ("
                                    + value_type_name(binding_.value_type()) + ")");
    }

    // upper_bound keeps equal-time keyframes in insertion order
    auto pos = std::upper_bound(keyframes_.begin(),
                                keyframes_.end(),
                                keyframe.time,
                                [](float t, const Keyframe& kf) { return t < kf.time; });
    keyframes_.insert(pos, std::move(keyframe));
    return *this;
}

AnimationTrack& AnimationTrack::add_keyframe(float         time,
                                             AnimValue     value,
                                             Interpolation interpolation,
                                             EasingFunc    easing)
{
    return add_keyframe(Keyframe{time, std::move(value), interpolation, std::move(easing)});
}

bool AnimationTrack::remove_keyframe(size_t index)
{
    if (index >= keyframes_.size())
        return false;
    keyframes_.erase(keyframes_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

float AnimationTrack::start_time() const
{
    return keyframes_.empty() ? 0.0f : keyframes_.front().time;
}

float AnimationTrack::end_time() const
{
    return keyframes_.empty() ? 0.0f : keyframes_.back().time;
}

std::optional<AnimValue> AnimationTrack::sample(float time) const
{
    if (keyframes_.empty())
        return std::nullopt;

    if (time <= keyframes_.front().time)
        return keyframes_.front().value;
    if (time >= keyframes_.back().time)
        return keyframes_.back().value;

    for (size_t i = 0; i + 1 < keyframes_.size(); ++i)
    {
        const auto& from = keyframes_[i];
        const auto& to   = keyframes_[i + 1];
        if (time < from.time || time > to.time)
            continue;

        float span = to.time - from.time;
        float t    = span > 0.0f ? (time - from.time) / span : 0.0f;
        if (from.easing)
            t = from.easing(t);

        switch (from.interpolation)
        {
            case Interpolation::Step:
                return from.value;
            case Interpolation::Linear:
            case Interpolation::Cubic:
            case Interpolation::Bezier:
                return blend_keyframe_values(from.value, to.value, t);
        }
    }

    return keyframes_.back().value;
}

std::optional<AnimValue> AnimationTrack::evaluate(float time)
{
    auto value = sample(time);
    if (value)
        binding_.set(*value);
    return value;
}

// ─── Timeline ────────────────────────────────────────────────────────────────

Timeline::Timeline(float duration, float fps)
    : duration_(std::max(0.0f, duration)), fps_(std::max(1.0f, fps))
{
}

void Timeline::set_duration(float seconds)
{
    duration_ = std::max(0.0f, seconds);
}

void Timeline::set_fps(float fps)
{
    fps_ = std::max(1.0f, fps);
}

AnimationTrack& Timeline::add_track(std::unique_ptr<AnimationTrack> track)
{
    if (!track)
        throw std::invalid_argument("Timeline: cannot add a null track");

    for (auto& existing : tracks_)
    {
        if (existing.get() == track.get())
        {
            // Already owned; drop the second owner without deleting.
            (void)track.release();
            return *existing;
        }
    }

    tracks_.push_back(std::move(track));
    return *tracks_.back();
}

AnimationTrack& Timeline::add_track(SceneGraph& scene, NodeId target, std::string_view property_path)
{
    return add_track(std::make_unique<AnimationTrack>(scene, target, property_path));
}

bool Timeline::remove_track(const AnimationTrack* track)
{
    auto it = std::find_if(tracks_.begin(),
                           tracks_.end(),
                           [track](const auto& t) { return t.get() == track; });
    if (it == tracks_.end())
        return false;
    tracks_.erase(it);
    return true;
}

void Timeline::evaluate(float time)
{
    float clamped = std::clamp(time, 0.0f, duration_);
    for (auto& track : tracks_)
        track->evaluate(clamped);
}

int Timeline::frame_count() const
{
    return static_cast<int>(std::ceil(duration_ * fps_));
}

float Timeline::frame_to_time(int frame) const
{
    return static_cast<float>(frame) / fps_;
}

int Timeline::time_to_frame(float time) const
{
    return static_cast<int>(std::floor(time * fps_));
}

}  // namespace vecanim
