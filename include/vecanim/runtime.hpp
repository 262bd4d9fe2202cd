#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <vecanim/clock.hpp>
#include <vecanim/config.hpp>
#include <vecanim/dirty_regions.hpp>
#include <vecanim/frame_scheduler.hpp>
#include <vecanim/object_pool.hpp>
#include <vecanim/plugin.hpp>
#include <vecanim/renderer.hpp>
#include <vecanim/scene.hpp>
#include <vecanim/state_machine.hpp>
#include <vecanim/timeline.hpp>

namespace vecanim
{

// Everything a loaded animation consists of. The runtime takes ownership on
// load() and discards it wholesale on unload(). Tracks must target `scene`.
struct AnimationData
{
    std::unique_ptr<SceneGraph>   scene;
    NodeId                        artboard = INVALID_NODE_ID;
    std::unique_ptr<Timeline>     timeline;
    std::unique_ptr<StateMachine> state_machine;  // optional
};

enum class RuntimeEvent
{
    Play,
    Pause,
    Stop,
    Complete,
    Loop,
    StateChange,
};

const char* runtime_event_name(RuntimeEvent event);

// Playback orchestrator. Owns the loaded animation, advances its time from the
// frame scheduler, applies the loop mode, and drives the attached renderer.
//
// With a state machine whose state is active, that state's timeline is
// evaluated in place of `timeline`; the base timeline still sets the duration
// and loop points of playback.
//
// Lifecycle: Idle -(load)-> Stopped -(play)-> Playing <-(pause/play)-> Paused,
// and stop() returns Playing or Paused to Stopped at time 0.
//
// Single-threaded. Listeners and plugins run synchronously inside the tick and
// may call back into the runtime.
class AnimationRuntime
{
   public:
    using ListenerId    = uint64_t;
    using EventListener = std::function<void(RuntimeEvent event, PlaybackState state)>;

    explicit AnimationRuntime(const RuntimeConfig& config = {}, std::unique_ptr<Clock> clock = nullptr);
    ~AnimationRuntime();

    AnimationRuntime(const AnimationRuntime&)            = delete;
    AnimationRuntime& operator=(const AnimationRuntime&) = delete;

    // ─── Loading ────────────────────────────────────────────────────────

    // Validates before touching current state; throws vecanim::Error
    // (InvalidAnimationData) when the scene, artboard or timeline is missing
    // or a track targets another scene. Replaces any loaded animation.
    void load(AnimationData data);
    void unload();
    bool is_loaded() const { return timeline_ != nullptr; }

    // ─── Playback ───────────────────────────────────────────────────────

    // Throws vecanim::Error (InvalidOperation) when nothing is loaded.
    // From Stopped, playback restarts at time 0.
    void play();
    void pause();
    void stop();

    // Clamps to [0, duration] and evaluates. Throws when nothing is loaded.
    void seek(float seconds);

    // Throws vecanim::Error (InvalidArgument) for speed <= 0.
    void  set_speed(float speed);
    float speed() const { return speed_; }

    void     set_loop_mode(LoopMode mode);
    LoopMode loop_mode() const { return loop_mode_; }

    PlaybackState state() const { return state_; }
    bool          is_playing() const { return state_ == PlaybackState::Playing; }
    float         current_time() const { return current_time_; }
    float         duration() const;
    int           direction() const { return direction_; }

    // ─── Loaded data ────────────────────────────────────────────────────

    SceneGraph*   scene() { return scene_.get(); }
    NodeId        artboard() const { return artboard_; }
    Timeline*     timeline() { return timeline_.get(); }
    StateMachine* state_machine() { return state_machine_.get(); }

    // ─── Rendering ──────────────────────────────────────────────────────

    // Non-owning. Initialized with the artboard size when an animation is
    // loaded. Pass nullptr to detach.
    void      set_renderer(Renderer* renderer);
    Renderer* renderer() const { return renderer_; }

    // begin_frame, clear to the artboard background, draw every world-visible
    // node depth-first, end_frame. No-op without a renderer or animation.
    void render_frame();

    // Regions collected and merged on the last tick.
    const DirtyRegionManager& dirty_regions() const { return dirty_regions_; }
    // Against the renderer viewport, or the artboard size without a renderer.
    bool should_redraw_all() const;

    // ─── Collaborators ──────────────────────────────────────────────────

    FrameScheduler&      scheduler() { return scheduler_; }
    Clock&               clock() { return *clock_; }
    PoolSet&             pools() { return pools_; }
    const RuntimeConfig& config() const { return config_; }

    // ─── Plugins ────────────────────────────────────────────────────────

    Plugin&         register_plugin(std::unique_ptr<Plugin> plugin);
    bool            unregister_plugin(const std::string& name);
    PluginRegistry& plugins() { return plugins_; }

    // ─── Events ─────────────────────────────────────────────────────────

    ListenerId on(RuntimeEvent event, EventListener listener);
    // Removed before its first invocation.
    ListenerId once(RuntimeEvent event, EventListener listener);
    bool       off(ListenerId id);
    size_t     off(RuntimeEvent event);
    void       remove_all_listeners();
    size_t     listener_count() const { return listeners_.size(); }

   private:
    struct ListenerEntry
    {
        ListenerId                     id;
        RuntimeEvent                   event;
        bool                           once;
        std::shared_ptr<EventListener> fn;
    };

    void on_frame();
    void            evaluate_at(float time);
    AnimationState* active_state();
    void collect_dirty_regions();
    void render_node(NodeId id);
    void attach_renderer_viewport();
    void start_playback();
    void stop_playback();
    void set_state(PlaybackState state);
    void emit(RuntimeEvent event);
    bool has_listener(ListenerId id) const;

    RuntimeConfig          config_;
    std::unique_ptr<Clock> clock_;
    FrameScheduler         scheduler_;
    DirtyRegionManager     dirty_regions_;
    PoolSet                pools_;

    // Loaded animation
    std::unique_ptr<SceneGraph>   scene_;
    NodeId                        artboard_ = INVALID_NODE_ID;
    std::unique_ptr<Timeline>     timeline_;
    std::unique_ptr<StateMachine> state_machine_;

    // Playback
    PlaybackState               state_        = PlaybackState::Idle;
    float                       current_time_ = 0.0f;
    float                       speed_        = 1.0f;
    LoopMode                    loop_mode_    = LoopMode::None;
    int                         direction_    = 1;
    FrameScheduler::CallbackId  frame_callback_ = 0;

    Renderer* renderer_             = nullptr;
    bool      renderer_initialized_ = false;

    std::vector<ListenerEntry> listeners_;
    ListenerId                 next_listener_id_ = 1;

    // Last member: plugin cleanup may still reach into the runtime.
    PluginRegistry plugins_;
};

}  // namespace vecanim
