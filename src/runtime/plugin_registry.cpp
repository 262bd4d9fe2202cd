#include <algorithm>
#include <exception>
#include <vecanim/error.hpp>
#include <vecanim/logger.hpp>
#include <vecanim/plugin.hpp>

namespace vecanim
{

namespace
{

void safe_cleanup(Plugin& plugin)
{
    try
    {
        plugin.cleanup();
    }
    catch (const std::exception& e)
    {
        VECANIM_LOG_ERROR("plugin",
                          "Error during cleanup of plugin \"{}\": {}",
                          plugin.metadata().name,
                          e.what());
    }
}

}  // anonymous namespace

PluginRegistry::PluginRegistry(AnimationRuntime& runtime) : runtime_(runtime) {}

PluginRegistry::~PluginRegistry()
{
    clear();
}

Plugin& PluginRegistry::register_plugin(std::unique_ptr<Plugin> plugin)
{
    if (!plugin)
        throw Error(ErrorCode::PluginError, "Invalid plugin: null");

    const std::string& name = plugin->metadata().name;
    if (name.empty())
        throw Error(ErrorCode::PluginError, "Invalid plugin: metadata has no name");
    if (has(name))
        throw Error(ErrorCode::PluginError, "Plugin \"" + name + "\" is already registered");

    Plugin& ref = *plugin;
    plugins_.push_back(std::move(plugin));

    try
    {
        ref.initialize(runtime_);
    }
    catch (const std::exception& e)
    {
        VECANIM_LOG_ERROR("plugin",
                          "Failed to initialize plugin \"{}\": {}",
                          ref.metadata().name,
                          e.what());
    }

    VECANIM_LOG_DEBUG("plugin",
                      "Registered plugin \"{}\" {}",
                      ref.metadata().name,
                      ref.metadata().version);
    return ref;
}

std::vector<std::unique_ptr<Plugin>>::iterator PluginRegistry::locate(const std::string& name)
{
    return std::find_if(plugins_.begin(),
                        plugins_.end(),
                        [&name](const auto& p) { return p->metadata().name == name; });
}

bool PluginRegistry::unregister_plugin(const std::string& name)
{
    auto it = locate(name);
    if (it == plugins_.end())
        return false;

    std::unique_ptr<Plugin> plugin = std::move(*it);
    plugins_.erase(it);
    safe_cleanup(*plugin);

    if (updating_)
        retired_.push_back(std::move(plugin));
    return true;
}

Plugin* PluginRegistry::find(const std::string& name)
{
    auto it = locate(name);
    return it != plugins_.end() ? it->get() : nullptr;
}

const Plugin* PluginRegistry::find(const std::string& name) const
{
    auto it = std::find_if(plugins_.begin(),
                           plugins_.end(),
                           [&name](const auto& p) { return p->metadata().name == name; });
    return it != plugins_.end() ? it->get() : nullptr;
}

std::vector<std::string> PluginRegistry::names() const
{
    std::vector<std::string> result;
    result.reserve(plugins_.size());
    for (const auto& p : plugins_)
        result.push_back(p->metadata().name);
    return result;
}

void PluginRegistry::clear()
{
    auto plugins = std::move(plugins_);
    plugins_.clear();
    for (auto& p : plugins)
        safe_cleanup(*p);
    if (updating_)
    {
        for (auto& p : plugins)
            retired_.push_back(std::move(p));
    }
}

void PluginRegistry::update(float delta_ms)
{
    updating_ = true;

    // Snapshot: update() may register or unregister plugins.
    std::vector<Plugin*> snapshot;
    snapshot.reserve(plugins_.size());
    for (const auto& p : plugins_)
        snapshot.push_back(p.get());

    for (Plugin* plugin : snapshot)
    {
        bool alive = std::any_of(plugins_.begin(),
                                 plugins_.end(),
                                 [plugin](const auto& p) { return p.get() == plugin; });
        if (!alive)
            continue;

        try
        {
            plugin->update(delta_ms);
        }
        catch (const std::exception& e)
        {
            VECANIM_LOG_ERROR("plugin",
                              "Error during update of plugin \"{}\": {}",
                              plugin->metadata().name,
                              e.what());
        }
    }

    updating_ = false;
    retired_.clear();
}

}  // namespace vecanim
