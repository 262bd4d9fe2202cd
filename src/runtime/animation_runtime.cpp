#include <algorithm>
#include <cmath>
#include <exception>
#include <vecanim/error.hpp>
#include <vecanim/logger.hpp>
#include <vecanim/runtime.hpp>

namespace vecanim
{

const char* runtime_event_name(RuntimeEvent event)
{
    switch (event)
    {
        case RuntimeEvent::Play:
            return "play";
        case RuntimeEvent::Pause:
            return "pause";
        case RuntimeEvent::Stop:
            return "stop";
        case RuntimeEvent::Complete:
            return "complete";
        case RuntimeEvent::Loop:
            return "loop";
        case RuntimeEvent::StateChange:
            return "stateChange";
    }
    return "unknown";
}

namespace
{

void check_track_targets(const Timeline& timeline, const SceneGraph* scene, const char* owner)
{
    for (const auto& track : timeline.tracks())
    {
        if (track->binding().scene() != scene)
        {
            throw Error(ErrorCode::InvalidAnimationData,
                        std::string(owner) + " track \"" + track->property_path()
                            + "\" targets a different scene");
        }
    }
}

}  // anonymous namespace

AnimationRuntime::AnimationRuntime(const RuntimeConfig& config, std::unique_ptr<Clock> clock)
    : config_(config),
      clock_(clock ? std::move(clock) : std::make_unique<SteadyClock>()),
      scheduler_(config.target_fps),
      dirty_regions_(config.region_merge_margin),
      pools_(config.pool_initial_size, config.pool_max_size),
      loop_mode_(config.loop_mode),
      plugins_(*this)
{
    Logger::instance().set_level(config.log_level);
    set_speed(config.speed);
}

AnimationRuntime::~AnimationRuntime()
{
    plugins_.clear();
    if (frame_callback_ != 0)
        scheduler_.unschedule(frame_callback_);
}

// ─── Loading ─────────────────────────────────────────────────────────────────

void AnimationRuntime::load(AnimationData data)
{
    if (!data.scene)
        throw Error(ErrorCode::InvalidAnimationData, "AnimationData must contain a scene");
    if (!data.scene->contains(data.artboard)
        || data.scene->kind(data.artboard) != NodeKind::Artboard)
    {
        throw Error(ErrorCode::InvalidAnimationData, "AnimationData must contain an artboard");
    }
    if (!data.timeline)
        throw Error(ErrorCode::InvalidAnimationData, "AnimationData must contain a timeline");

    check_track_targets(*data.timeline, data.scene.get(), "Timeline");
    if (data.state_machine)
    {
        for (const auto& id : data.state_machine->state_ids())
            check_track_targets(data.state_machine->state(id)->timeline(),
                                data.scene.get(),
                                "State");
    }

    if (is_loaded())
        unload();

    scene_         = std::move(data.scene);
    artboard_      = data.artboard;
    timeline_      = std::move(data.timeline);
    state_machine_ = std::move(data.state_machine);
    current_time_  = 0.0f;
    direction_     = 1;

    VECANIM_LOG_INFO("runtime",
                     "Loaded animation: {} nodes, {} tracks, duration {}s",
                     scene_->size(),
                     timeline_->track_count(),
                     timeline_->duration());

    if (renderer_)
        attach_renderer_viewport();

    evaluate_at(0.0f);
    set_state(PlaybackState::Stopped);
}

void AnimationRuntime::unload()
{
    if (state_ == PlaybackState::Playing || state_ == PlaybackState::Paused)
        stop_playback();

    scene_.reset();
    artboard_ = INVALID_NODE_ID;
    timeline_.reset();
    state_machine_.reset();
    current_time_ = 0.0f;
    direction_    = 1;
    dirty_regions_.clear();

    if (state_ != PlaybackState::Idle)
        set_state(PlaybackState::Idle);
}

// ─── Playback ────────────────────────────────────────────────────────────────

void AnimationRuntime::play()
{
    if (!is_loaded())
        throw Error(ErrorCode::InvalidOperation, "Cannot play: no animation loaded");
    if (state_ == PlaybackState::Playing)
        return;

    if (state_ == PlaybackState::Stopped)
    {
        current_time_ = 0.0f;
        direction_    = 1;
        evaluate_at(current_time_);
    }

    start_playback();
    set_state(PlaybackState::Playing);
    emit(RuntimeEvent::Play);
}

void AnimationRuntime::pause()
{
    if (state_ != PlaybackState::Playing)
        return;

    stop_playback();
    set_state(PlaybackState::Paused);
    emit(RuntimeEvent::Pause);
}

void AnimationRuntime::stop()
{
    if (state_ != PlaybackState::Playing && state_ != PlaybackState::Paused)
        return;

    stop_playback();
    current_time_ = 0.0f;
    direction_    = 1;
    evaluate_at(current_time_);
    render_frame();

    set_state(PlaybackState::Stopped);
    emit(RuntimeEvent::Stop);
}

void AnimationRuntime::seek(float seconds)
{
    if (!is_loaded())
        throw Error(ErrorCode::InvalidOperation, "Cannot seek: no animation loaded");

    current_time_ = std::clamp(seconds, 0.0f, timeline_->duration());
    evaluate_at(current_time_);
    render_frame();
}

void AnimationRuntime::set_speed(float speed)
{
    if (!(speed > 0.0f))
        throw Error(ErrorCode::InvalidArgument, "Speed must be greater than 0");
    speed_ = speed;
}

void AnimationRuntime::set_loop_mode(LoopMode mode)
{
    loop_mode_ = mode;
    if (mode != LoopMode::PingPong)
        direction_ = 1;
}

float AnimationRuntime::duration() const
{
    return timeline_ ? timeline_->duration() : 0.0f;
}

void AnimationRuntime::start_playback()
{
    if (frame_callback_ == 0)
        frame_callback_ = scheduler_.schedule([this](float) { on_frame(); });
    clock_->start();
}

void AnimationRuntime::stop_playback()
{
    if (frame_callback_ != 0)
    {
        scheduler_.unschedule(frame_callback_);
        frame_callback_ = 0;
    }
    clock_->stop();
}

void AnimationRuntime::set_state(PlaybackState state)
{
    VECANIM_LOG_DEBUG("runtime",
                      "Playback state: {} -> {}",
                      playback_state_name(state_),
                      playback_state_name(state));
    state_ = state;
    emit(RuntimeEvent::StateChange);
}

// ─── Frame loop ──────────────────────────────────────────────────────────────

void AnimationRuntime::on_frame()
{
    if (state_ != PlaybackState::Playing || !is_loaded())
        return;

    float dt = clock_->tick();

    // Plugins and the state machine write before the timeline is evaluated.
    plugins_.update(dt * 1000.0f);
    if (state_ != PlaybackState::Playing || !is_loaded())
        return;
    if (state_machine_)
    {
        // Evaluates the active state's timeline. Its state-change callback
        // may unload or reload the animation.
        state_machine_->update(dt * speed_);
        if (state_ != PlaybackState::Playing || !is_loaded())
            return;
    }

    current_time_ += dt * speed_ * static_cast<float>(direction_);

    const float duration  = timeline_->duration();
    bool        completed = false;
    bool        looped    = false;

    switch (loop_mode_)
    {
        case LoopMode::None:
            if (current_time_ > duration || current_time_ < 0.0f)
            {
                current_time_ = std::clamp(current_time_, 0.0f, duration);
                completed     = true;
            }
            break;

        case LoopMode::Loop:
            if (duration <= 0.0f)
            {
                current_time_ = 0.0f;
            }
            else if (current_time_ >= duration || current_time_ < 0.0f)
            {
                current_time_ = std::fmod(current_time_, duration);
                if (current_time_ < 0.0f)
                    current_time_ += duration;
                looped = true;
            }
            break;

        case LoopMode::PingPong:
            if (duration <= 0.0f)
            {
                current_time_ = 0.0f;
            }
            else if (current_time_ > duration)
            {
                current_time_ = duration - (current_time_ - duration);
                direction_    = -1;
                looped        = true;
            }
            else if (current_time_ < 0.0f)
            {
                current_time_ = -current_time_;
                direction_    = 1;
                looped        = true;
            }
            // A step longer than the whole timeline overshoots the reflection.
            current_time_ = std::clamp(current_time_, 0.0f, duration);
            break;
    }

    if (!active_state())
        timeline_->evaluate(current_time_);
    collect_dirty_regions();
    render_frame();
    if (scene_)
        scene_->clear_dirty(artboard_);

    if (completed)
    {
        stop_playback();
        set_state(PlaybackState::Stopped);
        VECANIM_LOG_DEBUG("runtime", "Playback complete at {}s", current_time_);
        emit(RuntimeEvent::Complete);
    }
    else if (looped)
    {
        emit(RuntimeEvent::Loop);
    }
}

// An active state's timeline replaces the base timeline. Seeking moves the
// state machine's clock along with the runtime's, clamped to the state.
void AnimationRuntime::evaluate_at(float time)
{
    if (AnimationState* active = active_state())
    {
        state_machine_->set_current_time(time);
        active->evaluate(state_machine_->current_time());
    }
    else if (timeline_)
    {
        timeline_->evaluate(time);
    }
}

AnimationState* AnimationRuntime::active_state()
{
    return state_machine_ ? state_machine_->current_state() : nullptr;
}

void AnimationRuntime::collect_dirty_regions()
{
    dirty_regions_.clear();

    auto* regions = pools_.region_buffers.acquire();
    auto* stack   = pools_.traversal_stacks.acquire();

    scene_->collect_dirty_regions(artboard_, *regions, *stack);
    dirty_regions_.add_regions(*regions);
    dirty_regions_.optimize();

    pools_.traversal_stacks.release(stack);
    pools_.region_buffers.release(regions);
}

bool AnimationRuntime::should_redraw_all() const
{
    float w = 0.0f;
    float h = 0.0f;
    if (renderer_)
    {
        w = renderer_->width();
        h = renderer_->height();
    }
    else if (scene_)
    {
        const ArtboardData& ab = scene_->artboard(artboard_);
        w = ab.width;
        h = ab.height;
    }
    return dirty_regions_.should_redraw_all(w, h, config_.redraw_all_threshold);
}

// ─── Rendering ───────────────────────────────────────────────────────────────

void AnimationRuntime::set_renderer(Renderer* renderer)
{
    renderer_             = renderer;
    renderer_initialized_ = false;
    if (renderer_ && is_loaded())
        attach_renderer_viewport();
}

void AnimationRuntime::attach_renderer_viewport()
{
    const auto& ab = scene_->artboard(artboard_);
    if (!renderer_initialized_)
    {
        renderer_->initialize(ab.width, ab.height);
        renderer_initialized_ = true;
    }
    else
    {
        renderer_->resize(ab.width, ab.height);
    }
}

void AnimationRuntime::render_frame()
{
    if (!renderer_ || !scene_)
        return;

    renderer_->begin_frame();
    renderer_->clear(scene_->artboard(artboard_).background_color);
    render_node(artboard_);
    renderer_->end_frame();
}

void AnimationRuntime::render_node(NodeId id)
{
    if (!scene_->visible(id))
        return;

    // World matrices are absolute, so each node's state is restored before
    // its children are drawn.
    renderer_->save();
    renderer_->transform(scene_->world_transform(id));
    renderer_->set_opacity(scene_->world_opacity(id));

    switch (scene_->kind(id))
    {
        case NodeKind::Shape:
        {
            const auto& shape = scene_->shape(id);
            if (shape.fill)
                renderer_->draw_path(shape.path, *shape.fill);
            if (shape.stroke && shape.stroke_width > 0.0f)
                renderer_->draw_stroke(shape.path, *shape.stroke, shape.stroke_width);
            break;
        }
        case NodeKind::Image:
        {
            const auto& image = scene_->image(id);
            renderer_->draw_image(image.image, image.source_rect, scene_->world_transform(id));
            break;
        }
        case NodeKind::Artboard:
        case NodeKind::Group:
            break;
    }

    renderer_->restore();

    for (NodeId child : scene_->children(id))
        render_node(child);
}

// ─── Plugins ─────────────────────────────────────────────────────────────────

Plugin& AnimationRuntime::register_plugin(std::unique_ptr<Plugin> plugin)
{
    return plugins_.register_plugin(std::move(plugin));
}

bool AnimationRuntime::unregister_plugin(const std::string& name)
{
    return plugins_.unregister_plugin(name);
}

// ─── Events ──────────────────────────────────────────────────────────────────

AnimationRuntime::ListenerId AnimationRuntime::on(RuntimeEvent event, EventListener listener)
{
    ListenerId id = next_listener_id_++;
    listeners_.push_back(
        {id, event, false, std::make_shared<EventListener>(std::move(listener))});
    return id;
}

AnimationRuntime::ListenerId AnimationRuntime::once(RuntimeEvent event, EventListener listener)
{
    ListenerId id = next_listener_id_++;
    listeners_.push_back(
        {id, event, true, std::make_shared<EventListener>(std::move(listener))});
    return id;
}

bool AnimationRuntime::off(ListenerId id)
{
    auto it = std::find_if(listeners_.begin(),
                           listeners_.end(),
                           [id](const ListenerEntry& e) { return e.id == id; });
    if (it == listeners_.end())
        return false;
    listeners_.erase(it);
    return true;
}

size_t AnimationRuntime::off(RuntimeEvent event)
{
    size_t before = listeners_.size();
    listeners_.erase(std::remove_if(listeners_.begin(),
                                    listeners_.end(),
                                    [event](const ListenerEntry& e) { return e.event == event; }),
                     listeners_.end());
    return before - listeners_.size();
}

void AnimationRuntime::remove_all_listeners()
{
    listeners_.clear();
}

bool AnimationRuntime::has_listener(ListenerId id) const
{
    return std::any_of(listeners_.begin(),
                       listeners_.end(),
                       [id](const ListenerEntry& e) { return e.id == id; });
}

void AnimationRuntime::emit(RuntimeEvent event)
{
    // Snapshot: listeners may add or remove listeners.
    std::vector<ListenerEntry> snapshot;
    for (const auto& e : listeners_)
    {
        if (e.event == event)
            snapshot.push_back(e);
    }

    const PlaybackState state = state_;
    for (const auto& entry : snapshot)
    {
        if (!has_listener(entry.id))
            continue;
        if (entry.once)
            off(entry.id);

        try
        {
            (*entry.fn)(event, state);
        }
        catch (const std::exception& e)
        {
            VECANIM_LOG_ERROR("runtime",
                              "Listener for '{}' threw: {}",
                              runtime_event_name(event),
                              e.what());
        }
    }
}

}  // namespace vecanim
