#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>
#include <vecanim/easing.hpp>
#include <vecanim/property.hpp>

namespace vecanim
{

enum class Interpolation
{
    Linear,
    Step,
    // Declared for authoring tools; both evaluate as Linear for now.
    Cubic,
    Bezier,
};

const char* interpolation_name(Interpolation interp);

struct Keyframe
{
    float         time = 0.0f;
    AnimValue     value{0.0f};
    Interpolation interpolation = Interpolation::Linear;
    EasingFunc    easing;  // applied to segment progress when set
};

// Blends two keyframe values at segment progress t (already eased).
// Floats blend linearly; Vec2, Color and bool switch to `to` at t >= 0.5.
AnimValue blend_keyframe_values(const AnimValue& from, const AnimValue& to, float t);

// Keyframes for one property of one node, kept sorted by time. Keyframes with
// equal times keep their insertion order.
class AnimationTrack
{
   public:
    // Throws std::invalid_argument for an unknown or unsupported property.
    AnimationTrack(SceneGraph& scene, NodeId target, std::string_view property_path);
    explicit AnimationTrack(PropertyBinding binding);

    // Throws std::invalid_argument when the value type does not match the
    // bound property.
    AnimationTrack& add_keyframe(Keyframe keyframe);
    AnimationTrack& add_keyframe(float         time,
                                 AnimValue     value,
                                 Interpolation interpolation = Interpolation::Linear,
                                 EasingFunc    easing        = {});

    bool remove_keyframe(size_t index);
    void clear_keyframes() { keyframes_.clear(); }

    const std::vector<Keyframe>& keyframes() const { return keyframes_; }
    size_t                       keyframe_count() const { return keyframes_.size(); }
    bool                         empty() const { return keyframes_.empty(); }
    float                        start_time() const;
    float                        end_time() const;

    // Value at `time` without touching the scene. nullopt without keyframes.
    std::optional<AnimValue> sample(float time) const;

    // Samples and writes the value to the bound property.
    std::optional<AnimValue> evaluate(float time);

    const PropertyBinding& binding() const { return binding_; }
    NodeId                 target() const { return binding_.node(); }
    PropertyKey            property() const { return binding_.key(); }
    const char*            property_path() const { return binding_.path(); }
    ValueType              value_type() const { return binding_.value_type(); }

   private:
    PropertyBinding       binding_;
    std::vector<Keyframe> keyframes_;
};

class Timeline
{
   public:
    // Duration is clamped to >= 0 and fps to >= 1.
    explicit Timeline(float duration = 0.0f, float fps = 60.0f);

    float duration() const { return duration_; }
    void  set_duration(float seconds);
    float fps() const { return fps_; }
    void  set_fps(float fps);

    // Takes ownership. A track this timeline already owns is left as is.
    // Throws std::invalid_argument for a null track.
    AnimationTrack& add_track(std::unique_ptr<AnimationTrack> track);
    AnimationTrack& add_track(SceneGraph& scene, NodeId target, std::string_view property_path);
    bool            remove_track(const AnimationTrack* track);
    void            clear_tracks() { tracks_.clear(); }

    const std::vector<std::unique_ptr<AnimationTrack>>& tracks() const { return tracks_; }
    size_t track_count() const { return tracks_.size(); }

    // Clamps time to [0, duration] and evaluates every track.
    void evaluate(float time);

    int   frame_count() const;
    float frame_to_time(int frame) const;
    int   time_to_frame(float time) const;

   private:
    float                                        duration_ = 0.0f;
    float                                        fps_      = 60.0f;
    std::vector<std::unique_ptr<AnimationTrack>> tracks_;
};

}  // namespace vecanim
