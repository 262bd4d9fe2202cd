#include <algorithm>
#include <cmath>
#include <vecanim/error.hpp>
#include <vecanim/logger.hpp>
#include <vecanim/state_machine.hpp>

namespace vecanim
{

const char* compare_op_name(CompareOp op)
{
    switch (op)
    {
        case CompareOp::Equals:
            return "equals";
        case CompareOp::NotEquals:
            return "notEquals";
        case CompareOp::GreaterThan:
            return "greaterThan";
        case CompareOp::GreaterThanOrEqual:
            return "greaterThanOrEqual";
        case CompareOp::LessThan:
            return "lessThan";
        case CompareOp::LessThanOrEqual:
            return "lessThanOrEqual";
    }
    return "unknown";
}

// ─── Conditions ──────────────────────────────────────────────────────────────

TimeCondition::TimeCondition(float duration) : duration_(duration)
{
    if (duration < 0.0f)
        throw Error(ErrorCode::InvalidArgument, "Time condition duration must be non-negative");
}

namespace
{

bool compare(CompareOp op, float value, float threshold, float epsilon)
{
    switch (op)
    {
        case CompareOp::Equals:
            return std::fabs(value - threshold) < epsilon;
        case CompareOp::NotEquals:
            return std::fabs(value - threshold) >= epsilon;
        case CompareOp::GreaterThan:
            return value > threshold;
        case CompareOp::GreaterThanOrEqual:
            return value >= threshold;
        case CompareOp::LessThan:
            return value < threshold;
        case CompareOp::LessThanOrEqual:
            return value <= threshold;
    }
    return false;
}

// Takes the callback by value: it may destroy the machine that owns it.
void notify_state_change(StateMachine::StateChangeCallback cb,
                         const std::string&                from,
                         const std::string&                to)
{
    if (cb)
        cb(from, to);
}

}  // anonymous namespace

bool evaluate_condition(const TransitionCondition& condition, const StateMachineContext& ctx)
{
    if (const auto* c = std::get_if<EventCondition>(&condition))
        return ctx.events.count(c->event) != 0;

    if (const auto* c = std::get_if<BooleanCondition>(&condition))
    {
        auto it = ctx.booleans.find(c->input);
        return it != ctx.booleans.end() && it->second == c->expected;
    }

    if (const auto* c = std::get_if<NumberCondition>(&condition))
    {
        auto it = ctx.numbers.find(c->input);
        if (it == ctx.numbers.end())
            return false;
        return compare(c->op, it->second, c->threshold, c->epsilon);
    }

    const auto& time = std::get<TimeCondition>(condition);
    return ctx.state_time >= time.duration();
}

// ─── StateTransition ─────────────────────────────────────────────────────────

StateTransition::StateTransition(std::string                      from,
                                 std::string                      to,
                                 std::vector<TransitionCondition> conditions,
                                 float                            duration,
                                 int                              priority)
    : from_(std::move(from)),
      to_(std::move(to)),
      conditions_(std::move(conditions)),
      priority_(priority)
{
    set_duration(duration);
}

StateTransition& StateTransition::add_condition(TransitionCondition condition)
{
    conditions_.push_back(std::move(condition));
    return *this;
}

void StateTransition::set_duration(float seconds)
{
    if (seconds < 0.0f)
        throw Error(ErrorCode::InvalidArgument, "Transition duration must be non-negative");
    duration_ = seconds;
}

bool StateTransition::can_transition(const StateMachineContext& ctx) const
{
    return std::all_of(conditions_.begin(),
                       conditions_.end(),
                       [&ctx](const TransitionCondition& c) { return evaluate_condition(c, ctx); });
}

// ─── AnimationState ──────────────────────────────────────────────────────────

AnimationState::AnimationState(std::string               id,
                               std::string               name,
                               std::unique_ptr<Timeline> timeline,
                               float                     speed,
                               bool                      loop)
    : id_(std::move(id)), name_(std::move(name)), loop_(loop)
{
    set_timeline(std::move(timeline));
    set_speed(speed);
}

void AnimationState::set_timeline(std::unique_ptr<Timeline> timeline)
{
    if (!timeline)
        throw Error(ErrorCode::InvalidArgument, "State \"" + id_ + "\" requires a timeline");
    timeline_ = std::move(timeline);
}

void AnimationState::set_speed(float speed)
{
    speed_ = std::clamp(speed, 0.1f, 10.0f);
}

// ─── StateMachine ────────────────────────────────────────────────────────────

AnimationState& StateMachine::add_state(std::unique_ptr<AnimationState> state)
{
    if (!state)
        throw Error(ErrorCode::InvalidArgument, "Cannot add a null state");
    if (states_.count(state->id()) != 0)
    {
        throw Error(ErrorCode::StateMachineError,
                    "State with id \"" + state->id() + "\" already exists");
    }

    std::string id = state->id();
    auto&       ref = *state;
    states_.emplace(id, std::move(state));
    state_order_.push_back(std::move(id));
    return ref;
}

AnimationState& StateMachine::add_state(std::string               id,
                                        std::string               name,
                                        std::unique_ptr<Timeline> timeline,
                                        float                     speed,
                                        bool                      loop)
{
    return add_state(std::make_unique<AnimationState>(std::move(id),
                                                      std::move(name),
                                                      std::move(timeline),
                                                      speed,
                                                      loop));
}

bool StateMachine::remove_state(const std::string& id)
{
    auto it = states_.find(id);
    if (it == states_.end())
        return false;

    if (current_ == it->second.get())
    {
        current_->deactivate();
        current_      = nullptr;
        current_time_ = 0.0f;
    }

    transitions_.erase(std::remove_if(transitions_.begin(),
                                      transitions_.end(),
                                      [&id](const auto& t)
                                      { return t->from() == id || t->to() == id; }),
                       transitions_.end());

    state_order_.erase(std::remove(state_order_.begin(), state_order_.end(), id),
                       state_order_.end());
    states_.erase(it);
    return true;
}

AnimationState* StateMachine::state(const std::string& id)
{
    auto it = states_.find(id);
    return it != states_.end() ? it->second.get() : nullptr;
}

const AnimationState* StateMachine::state(const std::string& id) const
{
    auto it = states_.find(id);
    return it != states_.end() ? it->second.get() : nullptr;
}

bool StateMachine::has_state(const std::string& id) const
{
    return states_.count(id) != 0;
}

StateTransition& StateMachine::add_transition(StateTransition transition)
{
    if (!has_state(transition.from()))
    {
        throw Error(ErrorCode::StateMachineError,
                    "Cannot add transition: source state \"" + transition.from()
                        + "\" does not exist");
    }
    if (!has_state(transition.to()))
    {
        throw Error(ErrorCode::StateMachineError,
                    "Cannot add transition: destination state \"" + transition.to()
                        + "\" does not exist");
    }

    transitions_.push_back(std::make_unique<StateTransition>(std::move(transition)));
    return *transitions_.back();
}

bool StateMachine::remove_transition(const StateTransition* transition)
{
    auto it = std::find_if(transitions_.begin(),
                           transitions_.end(),
                           [transition](const auto& t) { return t.get() == transition; });
    if (it == transitions_.end())
        return false;
    transitions_.erase(it);
    return true;
}

size_t StateMachine::remove_transitions_from(const std::string& id)
{
    size_t before = transitions_.size();
    transitions_.erase(std::remove_if(transitions_.begin(),
                                      transitions_.end(),
                                      [&id](const auto& t) { return t->from() == id; }),
                       transitions_.end());
    return before - transitions_.size();
}

void StateMachine::trigger(const std::string& event)
{
    context_.events.insert(event);
}

void StateMachine::set_boolean_input(const std::string& name, bool value)
{
    context_.booleans[name] = value;
}

void StateMachine::set_number_input(const std::string& name, float value)
{
    context_.numbers[name] = value;
}

std::optional<bool> StateMachine::boolean_input(const std::string& name) const
{
    auto it = context_.booleans.find(name);
    if (it == context_.booleans.end())
        return std::nullopt;
    return it->second;
}

std::optional<float> StateMachine::number_input(const std::string& name) const
{
    auto it = context_.numbers.find(name);
    if (it == context_.numbers.end())
        return std::nullopt;
    return it->second;
}

void StateMachine::change_state(const std::string& id)
{
    AnimationState* next = state(id);
    if (!next)
        throw Error(ErrorCode::StateMachineError, "State with id \"" + id + "\" does not exist");

    std::string previous = current_state_id();
    if (current_)
        current_->deactivate();

    current_ = next;
    current_->activate();
    current_time_       = 0.0f;
    context_.state_time = 0.0f;

    VECANIM_LOG_DEBUG("state", "State change: '{}' -> '{}'", previous, id);
    if (updating_)
    {
        if (pending_change_)
            pending_change_->second = id;
        else
            pending_change_.emplace(std::move(previous), id);
        return;
    }
    notify_state_change(on_state_change_, previous, id);
}

std::string StateMachine::current_state_id() const
{
    return current_ ? current_->id() : std::string();
}

void StateMachine::set_current_time(float seconds)
{
    if (!current_)
        return;
    current_time_ = std::clamp(seconds, 0.0f, current_->duration());
}

void StateMachine::update(float dt)
{
    if (!current_)
    {
        context_.events.clear();
        return;
    }

    updating_ = true;

    float scaled = dt * current_->speed();
    current_time_ += scaled;
    context_.state_time += scaled;

    // May switch state, which rewinds current_time_ before the wrap below.
    evaluate_transitions();

    float duration = current_->duration();
    if (current_->loop() && current_time_ >= duration)
    {
        current_time_ = duration > 0.0f ? std::fmod(current_time_, duration) : 0.0f;
    }
    else
    {
        current_time_ = std::clamp(current_time_, 0.0f, duration);
    }

    current_->evaluate(current_time_);
    context_.events.clear();
    updating_ = false;

    if (!pending_change_)
        return;
    auto change = std::move(*pending_change_);
    pending_change_.reset();
    // Nothing below may touch the machine.
    notify_state_change(on_state_change_, change.first, change.second);
}

void StateMachine::evaluate_transitions()
{
    const StateTransition* best = nullptr;
    for (const auto& t : transitions_)
    {
        if (t->from() != current_->id() || !t->can_transition(context_))
            continue;
        // Strictly greater keeps the first-declared on equal priority.
        if (!best || t->priority() > best->priority())
            best = t.get();
    }

    if (best)
    {
        // Copy: the callback fired by change_state may edit transitions.
        std::string target = best->to();
        change_state(target);
    }
}

void StateMachine::reset()
{
    if (current_)
    {
        current_->deactivate();
        current_ = nullptr;
    }
    current_time_       = 0.0f;
    context_.state_time = 0.0f;
}

}  // namespace vecanim
