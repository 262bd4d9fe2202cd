#include <stdexcept>
#include <string>
#include <vecanim/interpolator.hpp>

namespace vecanim
{

namespace
{

template <typename T>
InterpolateFunc typed_lerp()
{
    return [](const AnimValue& from, const AnimValue& to, float t) -> AnimValue
    { return InterpolatorRegistry::lerp(std::get<T>(from), std::get<T>(to), t); };
}

}  // anonymous namespace

InterpolatorRegistry::InterpolatorRegistry()
{
    reset_defaults();
}

void InterpolatorRegistry::reset_defaults()
{
    interpolators_[ValueType::Float] = typed_lerp<float>();
    interpolators_[ValueType::Vec2]  = typed_lerp<Vec2>();
    interpolators_[ValueType::Color] = typed_lerp<Color>();
}

void InterpolatorRegistry::register_interpolator(ValueType type, InterpolateFunc func)
{
    if (!func)
        throw std::invalid_argument("InterpolatorRegistry: empty interpolator");
    interpolators_[type] = std::move(func);
}

bool InterpolatorRegistry::has(ValueType type) const
{
    return interpolators_.count(type) != 0;
}

bool InterpolatorRegistry::unregister(ValueType type)
{
    return interpolators_.erase(type) != 0;
}

AnimValue InterpolatorRegistry::interpolate(const AnimValue&  from,
                                            const AnimValue&  to,
                                            float             t,
                                            const EasingFunc& easing) const
{
    ValueType type = value_type_of(from);
    if (type != value_type_of(to))
    {
        throw std::invalid_argument(std::string("Cannot interpolate ") + value_type_name(type)
                                    + " with " + value_type_name(value_type_of(to)));
    }

    auto it = interpolators_.find(type);
    if (it == interpolators_.end())
    {
        throw std::invalid_argument(std::string("No interpolator registered for ")
                                    + value_type_name(type));
    }

    float eased = easing ? easing(t) : t;
    return it->second(from, to, eased);
}

}  // namespace vecanim
