#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <vecanim/error.hpp>
#include <vecanim/runtime.hpp>

using namespace vecanim;

namespace
{

// Records every lifecycle call into a shared journal.
class JournalPlugin : public Plugin
{
   public:
    JournalPlugin(std::string name, std::vector<std::string>& journal)
        : meta_{std::move(name), "1.0.0", "test plugin", "tests"}, journal_(journal)
    {
    }

    const PluginMetadata& metadata() const override { return meta_; }

    void initialize(AnimationRuntime& runtime) override
    {
        attached = &runtime;
        journal_.push_back(meta_.name + ":init");
        if (throw_on_init)
            throw std::runtime_error("init failed");
    }

    void update(float delta_ms) override
    {
        last_delta_ms = delta_ms;
        journal_.push_back(meta_.name + ":update");
        if (throw_on_update)
            throw std::runtime_error("update failed");
        if (on_update)
            on_update();
    }

    void cleanup() override { journal_.push_back(meta_.name + ":cleanup"); }

    bool                  throw_on_init   = false;
    bool                  throw_on_update = false;
    float                 last_delta_ms   = 0.0f;
    std::function<void()> on_update;
    AnimationRuntime*     attached        = nullptr;

   private:
    PluginMetadata            meta_;
    std::vector<std::string>& journal_;
};

ErrorCode register_error(PluginRegistry& reg, std::unique_ptr<Plugin> plugin)
{
    try
    {
        reg.register_plugin(std::move(plugin));
    }
    catch (const Error& e)
    {
        return e.code();
    }
    ADD_FAILURE() << "expected vecanim::Error";
    return ErrorCode::InvalidOperation;
}

}  // namespace

TEST(PluginRegistry, RegisterInitializesWithRuntime)
{
    AnimationRuntime         rt;
    std::vector<std::string> journal;

    auto& p = static_cast<JournalPlugin&>(
        rt.register_plugin(std::make_unique<JournalPlugin>("alpha", journal)));
    EXPECT_EQ(p.attached, &rt);
    EXPECT_EQ(journal, (std::vector<std::string>{"alpha:init"}));
    EXPECT_TRUE(rt.plugins().has("alpha"));
    EXPECT_EQ(rt.plugins().find("alpha"), &p);
    EXPECT_EQ(rt.plugins().find("beta"), nullptr);
}

TEST(PluginRegistry, RejectsInvalidPlugins)
{
    AnimationRuntime         rt;
    std::vector<std::string> journal;
    auto&                    reg = rt.plugins();

    EXPECT_EQ(register_error(reg, nullptr), ErrorCode::PluginError);
    EXPECT_EQ(register_error(reg, std::make_unique<JournalPlugin>("", journal)),
              ErrorCode::PluginError);

    reg.register_plugin(std::make_unique<JournalPlugin>("alpha", journal));
    EXPECT_EQ(register_error(reg, std::make_unique<JournalPlugin>("alpha", journal)),
              ErrorCode::PluginError);
    EXPECT_EQ(reg.size(), 1u);
}

TEST(PluginRegistry, FailedInitializeStaysRegistered)
{
    AnimationRuntime         rt;
    std::vector<std::string> journal;
    auto                     plugin = std::make_unique<JournalPlugin>("flaky", journal);
    plugin->throw_on_init           = true;

    EXPECT_NO_THROW(rt.register_plugin(std::move(plugin)));
    EXPECT_TRUE(rt.plugins().has("flaky"));
}

TEST(PluginRegistry, UpdateRunsInRegistrationOrder)
{
    AnimationRuntime         rt;
    std::vector<std::string> journal;
    rt.register_plugin(std::make_unique<JournalPlugin>("a", journal));
    rt.register_plugin(std::make_unique<JournalPlugin>("b", journal));
    journal.clear();

    rt.plugins().update(16.0f);
    EXPECT_EQ(journal, (std::vector<std::string>{"a:update", "b:update"}));
    EXPECT_EQ(rt.plugins().names(), (std::vector<std::string>{"a", "b"}));
    EXPECT_FLOAT_EQ(static_cast<JournalPlugin*>(rt.plugins().find("b"))->last_delta_ms, 16.0f);
}

TEST(PluginRegistry, UpdateErrorsAreIsolated)
{
    AnimationRuntime         rt;
    std::vector<std::string> journal;
    auto                     bad = std::make_unique<JournalPlugin>("bad", journal);
    bad->throw_on_update         = true;
    rt.register_plugin(std::move(bad));
    rt.register_plugin(std::make_unique<JournalPlugin>("good", journal));
    journal.clear();

    EXPECT_NO_THROW(rt.plugins().update(16.0f));
    EXPECT_EQ(journal, (std::vector<std::string>{"bad:update", "good:update"}));
    EXPECT_EQ(rt.plugins().size(), 2u);
}

TEST(PluginRegistry, UnregisterCallsCleanup)
{
    AnimationRuntime         rt;
    std::vector<std::string> journal;
    rt.register_plugin(std::make_unique<JournalPlugin>("alpha", journal));

    EXPECT_TRUE(rt.unregister_plugin("alpha"));
    EXPECT_FALSE(rt.unregister_plugin("alpha"));
    EXPECT_EQ(journal.back(), "alpha:cleanup");
    EXPECT_EQ(rt.plugins().size(), 0u);
}

TEST(PluginRegistry, UnregisterDuringUpdate)
{
    AnimationRuntime         rt;
    std::vector<std::string> journal;
    auto&                    first = static_cast<JournalPlugin&>(
        rt.register_plugin(std::make_unique<JournalPlugin>("first", journal)));
    rt.register_plugin(std::make_unique<JournalPlugin>("second", journal));
    first.on_update = [&rt] { rt.unregister_plugin("second"); };
    journal.clear();

    rt.plugins().update(16.0f);
    EXPECT_EQ(journal, (std::vector<std::string>{"first:update", "second:cleanup"}));
    EXPECT_EQ(rt.plugins().names(), (std::vector<std::string>{"first"}));
}

TEST(PluginRegistry, SelfUnregisterDuringUpdate)
{
    AnimationRuntime         rt;
    std::vector<std::string> journal;
    auto&                    self = static_cast<JournalPlugin&>(
        rt.register_plugin(std::make_unique<JournalPlugin>("self", journal)));
    self.on_update = [&rt] { rt.unregister_plugin("self"); };

    EXPECT_NO_THROW(rt.plugins().update(16.0f));
    EXPECT_EQ(rt.plugins().size(), 0u);
}

TEST(PluginRegistry, ClearCleansUpEveryPlugin)
{
    AnimationRuntime         rt;
    std::vector<std::string> journal;
    rt.register_plugin(std::make_unique<JournalPlugin>("a", journal));
    rt.register_plugin(std::make_unique<JournalPlugin>("b", journal));
    journal.clear();

    rt.plugins().clear();
    EXPECT_EQ(journal, (std::vector<std::string>{"a:cleanup", "b:cleanup"}));
    EXPECT_EQ(rt.plugins().size(), 0u);
}
