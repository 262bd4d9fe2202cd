#pragma once

#include <memory>
#include <string>
#include <vector>
#include <vecanim/fwd.hpp>

namespace vecanim
{

struct PluginMetadata
{
    std::string name;  // unique within a registry
    std::string version;
    std::string description;
    std::string author;
};

// Per-frame extension hook. update() runs once per tick before the timeline is
// evaluated, with the frame delta in milliseconds.
class Plugin
{
   public:
    virtual ~Plugin() = default;

    virtual const PluginMetadata& metadata() const = 0;

    virtual void initialize(AnimationRuntime& runtime) = 0;
    virtual void update(float /*delta_ms*/) {}
    virtual void cleanup() {}
};

// Owns registered plugins in registration order. Exceptions thrown by a
// plugin's initialize, update or cleanup are logged and never unregister it.
class PluginRegistry
{
   public:
    explicit PluginRegistry(AnimationRuntime& runtime);
    ~PluginRegistry();

    PluginRegistry(const PluginRegistry&)            = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    // Throws vecanim::Error (PluginError) for a null plugin, an empty name
    // or a name that is already registered.
    Plugin& register_plugin(std::unique_ptr<Plugin> plugin);

    // Calls cleanup() and destroys the plugin.
    bool unregister_plugin(const std::string& name);

    Plugin*       find(const std::string& name);
    const Plugin* find(const std::string& name) const;
    bool          has(const std::string& name) const { return find(name) != nullptr; }
    size_t        size() const { return plugins_.size(); }

    std::vector<std::string> names() const;

    // Cleans up and drops every plugin.
    void clear();

    void update(float delta_ms);

   private:
    std::vector<std::unique_ptr<Plugin>>::iterator locate(const std::string& name);

    AnimationRuntime&                    runtime_;
    std::vector<std::unique_ptr<Plugin>> plugins_;
    // Plugins unregistered from inside update() are destroyed after the loop.
    std::vector<std::unique_ptr<Plugin>> retired_;
    bool                                 updating_ = false;
};

}  // namespace vecanim
