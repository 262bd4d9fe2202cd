#pragma once

namespace vecanim
{

struct Vec2;
struct Mat2D;
struct Rect;
struct Transform;
struct Color;

class Path;
class Paint;

class SceneGraph;
class PropertyBinding;

class AnimationTrack;
class Timeline;
class InterpolatorRegistry;

class AnimationState;
class StateTransition;
class StateMachine;

class AnimationRuntime;
class Clock;
class FrameScheduler;
class DirtyRegionManager;
class Renderer;
class Plugin;
class PluginRegistry;

template <typename T>
class ObjectPool;
struct PoolSet;
struct RuntimeConfig;

}  // namespace vecanim
