#pragma once

#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>
#include <vecanim/timeline.hpp>

namespace vecanim
{

// Inputs that transition conditions read. Events live for one update().
struct StateMachineContext
{
    std::unordered_map<std::string, bool>  booleans;
    std::unordered_map<std::string, float> numbers;
    std::unordered_set<std::string>        events;
    float                                  state_time = 0.0f;  // seconds in the active state
};

// ─── Conditions ──────────────────────────────────────────────────────────────

enum class CompareOp
{
    Equals,
    NotEquals,
    GreaterThan,
    GreaterThanOrEqual,
    LessThan,
    LessThanOrEqual,
};

const char* compare_op_name(CompareOp op);

struct EventCondition
{
    std::string event;
};

// An input that was never set does not match either value.
struct BooleanCondition
{
    std::string input;
    bool        expected = true;
};

// Equals/NotEquals compare |value - threshold| against epsilon.
struct NumberCondition
{
    std::string input;
    CompareOp   op        = CompareOp::Equals;
    float       threshold = 0.0f;
    float       epsilon   = std::numeric_limits<float>::epsilon();
};

// Passes once the active state has run for at least `duration` seconds.
class TimeCondition
{
   public:
    // Throws vecanim::Error (InvalidArgument) for a negative duration.
    explicit TimeCondition(float duration);

    float duration() const { return duration_; }

   private:
    float duration_;
};

using TransitionCondition =
    std::variant<EventCondition, BooleanCondition, NumberCondition, TimeCondition>;

bool evaluate_condition(const TransitionCondition& condition, const StateMachineContext& ctx);

// ─── StateTransition ─────────────────────────────────────────────────────────

class StateTransition
{
   public:
    // Throws vecanim::Error (InvalidArgument) for a negative blend duration.
    StateTransition(std::string                      from,
                    std::string                      to,
                    std::vector<TransitionCondition> conditions = {},
                    float                            duration   = 0.0f,
                    int                              priority   = 0);

    const std::string& from() const { return from_; }
    const std::string& to() const { return to_; }

    const std::vector<TransitionCondition>& conditions() const { return conditions_; }
    StateTransition&                        add_condition(TransitionCondition condition);

    // Blend duration is stored for authoring tools; evaluation ignores it.
    float duration() const { return duration_; }
    void  set_duration(float seconds);

    int  priority() const { return priority_; }
    void set_priority(int priority) { priority_ = priority; }

    // All conditions must pass. A transition without conditions always passes.
    bool can_transition(const StateMachineContext& ctx) const;

   private:
    std::string                      from_;
    std::string                      to_;
    std::vector<TransitionCondition> conditions_;
    float                            duration_ = 0.0f;
    int                              priority_ = 0;
};

// ─── AnimationState ──────────────────────────────────────────────────────────

class AnimationState
{
   public:
    // Speed is clamped to [0.1, 10]. Throws vecanim::Error for a null timeline.
    AnimationState(std::string               id,
                   std::string               name,
                   std::unique_ptr<Timeline> timeline,
                   float                     speed = 1.0f,
                   bool                      loop  = false);

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    void               set_name(std::string name) { name_ = std::move(name); }

    Timeline&       timeline() { return *timeline_; }
    const Timeline& timeline() const { return *timeline_; }
    void            set_timeline(std::unique_ptr<Timeline> timeline);
    float           duration() const { return timeline_->duration(); }

    float speed() const { return speed_; }
    void  set_speed(float speed);
    bool  loop() const { return loop_; }
    void  set_loop(bool loop) { loop_ = loop; }

    bool is_active() const { return active_; }
    void activate() { active_ = true; }
    void deactivate() { active_ = false; }

    void evaluate(float time) { timeline_->evaluate(time); }

   private:
    std::string               id_;
    std::string               name_;
    std::unique_ptr<Timeline> timeline_;
    float                     speed_  = 1.0f;
    bool                      loop_   = false;
    bool                      active_ = false;
};

// ─── StateMachine ────────────────────────────────────────────────────────────

// Graph of states joined by guarded, prioritized transitions. update() runs,
// in order: speed scaling, time advance, transition selection, loop/clamp,
// timeline evaluation, then clears the one-frame events.
//
// A state change made by update() is reported after all of those steps, as
// the last thing update() does. The callback may therefore edit or destroy
// the machine.
class StateMachine
{
   public:
    using StateChangeCallback = std::function<void(const std::string& from, const std::string& to)>;

    StateMachine() = default;

    // Throws vecanim::Error (StateMachineError) for a duplicate id.
    AnimationState& add_state(std::unique_ptr<AnimationState> state);
    AnimationState& add_state(std::string               id,
                              std::string               name,
                              std::unique_ptr<Timeline> timeline,
                              float                     speed = 1.0f,
                              bool                      loop  = false);

    // Also drops every transition that starts or ends at the removed state.
    bool remove_state(const std::string& id);

    AnimationState*       state(const std::string& id);
    const AnimationState* state(const std::string& id) const;
    bool                  has_state(const std::string& id) const;
    size_t                state_count() const { return states_.size(); }

    // Insertion order.
    const std::vector<std::string>& state_ids() const { return state_order_; }

    // Throws vecanim::Error (StateMachineError) unless both endpoints exist.
    StateTransition& add_transition(StateTransition transition);
    bool             remove_transition(const StateTransition* transition);
    size_t           remove_transitions_from(const std::string& id);
    size_t           transition_count() const { return transitions_.size(); }
    const std::vector<std::unique_ptr<StateTransition>>& transitions() const
    {
        return transitions_;
    }

    // ─── Inputs ─────────────────────────────────────────────────────────

    void trigger(const std::string& event);
    void set_input(const std::string& name, bool value) { set_boolean_input(name, value); }
    void set_input(const std::string& name, float value) { set_number_input(name, value); }
    void set_boolean_input(const std::string& name, bool value);
    void set_number_input(const std::string& name, float value);

    std::optional<bool>  boolean_input(const std::string& name) const;
    std::optional<float> number_input(const std::string& name) const;

    const StateMachineContext& context() const { return context_; }

    // ─── Playback ───────────────────────────────────────────────────────

    // Throws vecanim::Error (StateMachineError) for an unknown id.
    void change_state(const std::string& id);

    AnimationState*       current_state() { return current_; }
    const AnimationState* current_state() const { return current_; }
    std::string           current_state_id() const;

    float current_time() const { return current_time_; }
    // Clamped to [0, duration]; ignored while no state is active.
    void set_current_time(float seconds);

    void update(float dt);

    // Deactivates the active state and rewinds. States, transitions and
    // inputs are kept.
    void reset();

    void set_on_state_change(StateChangeCallback cb) { on_state_change_ = std::move(cb); }

   private:
    void evaluate_transitions();

    std::unordered_map<std::string, std::unique_ptr<AnimationState>> states_;
    std::vector<std::string>                                         state_order_;
    std::vector<std::unique_ptr<StateTransition>>                    transitions_;
    StateMachineContext                                              context_;
    AnimationState*                                                  current_      = nullptr;
    float                                                            current_time_ = 0.0f;
    StateChangeCallback                                              on_state_change_;

    // Set while update() runs; change_state() then defers its callback.
    bool                                                             updating_ = false;
    std::optional<std::pair<std::string, std::string>>               pending_change_;
};

}  // namespace vecanim
