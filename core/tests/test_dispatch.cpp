#include <stdexcept> // std::runtime_error
#include <thread>    // std::thread

#include <boost/ut.hpp>

#include <DPlug++/Core/Plugin.hpp>
#include <DPlug++/Core/Runtime.hpp>
#include <DPlug++/Utils/Env.hpp>
#include <DPlug++/Utils/Error.hpp>
#include <DPlug++/Utils/Logging.hpp>

#include "FakeHost.hpp"

using namespace boost::ut;
using namespace domeplug::utils::error;
using namespace domeplug::utils::types;
using domeplug::core::Context;
using domeplug::core::HookPhase;
using domeplug::core::plugin::HookSet;
using domeplug::core::plugin::InitPlugin;
using domeplug::core::plugin::LoadState;
using domeplug::core::plugin::PluginRuntime;
using domeplug::core::plugin::ToHostResult;
using domeplug::testing::FakeHost;
using domeplug::testing::FreshHost;

namespace {
  i32 g_macroInitCalls = 0;

  auto runtime() -> PluginRuntime& {
    return PluginRuntime::getInstance();
  }

  // Fresh host plus an unloaded runtime with no config overrides
  auto fresh() -> FakeHost& {
    domeplug::utils::env::UnsetEnv("DPLUG_CONFIG");
    domeplug::utils::env::UnsetEnv("DPLUG_LOG_LEVEL");
    runtime().unload();
    return FreshHost();
  }

  auto null_get_api(DPlugApiType /*api*/, int /*version*/) -> void* {
    return nullptr;
  }
} // namespace

DPLUG_PLUGIN({
  .onInit = [](Context& ctx) -> Result<> {
    ++g_macroInitCalls;
    return ctx.registerModule("macro", "class Macro {}");
  },
})

auto main() -> int {
  "Successful load runs the init hook and reaches Ready"_test = [] -> void {
    FakeHost& host      = fresh();
    i32       initCalls = 0;

    const DPlugResult result = InitPlugin(FakeHost::GetApi, host.context(), HookSet { .onInit = [&initCalls](Context& ctx) -> Result<> {
      ++initCalls;
      expect(ctx.phase() == HookPhase::Init);
      return ctx.registerModule("external", "class ExternalClass {}");
    } });

    expect(result == DPLUG_RESULT_SUCCESS);
    expect(initCalls == 1);
    expect(runtime().state() == LoadState::Ready);
    expect(runtime().capabilities() != nullptr);
    expect(host.countCalls("registerModule external") == 1_ul);

    runtime().unload();
  };

  "DPLUG_PLUGIN emits a working PLUGIN_onInit"_test = [] -> void {
    FakeHost& host   = fresh();
    g_macroInitCalls = 0;

    expect(PLUGIN_onInit(FakeHost::GetApi, host.context()) == DPLUG_RESULT_SUCCESS);
    expect(g_macroInitCalls == 1);
    expect(host.sources.at("macro") == String("class Macro {}"));

    expect(PLUGIN_onShutdown(host.context()) == DPLUG_RESULT_SUCCESS);
  };

  "Null getApi is reported as UNKNOWN and no hook runs"_test = [] -> void {
    FakeHost& host      = fresh();
    i32       hookCalls = 0;

    const DPlugResult result = InitPlugin(nullptr, host.context(), HookSet { .onInit = [&hookCalls](Context&) -> Result<> {
      ++hookCalls;
      return {};
    } });

    expect(result == DPLUG_RESULT_UNKNOWN);
    expect(hookCalls == 0);
    expect(runtime().state() == LoadState::Unloaded);
    expect(runtime().capabilities() == nullptr);
    expect(PLUGIN_preUpdate(host.context()) == DPLUG_RESULT_FAILURE);
  };

  "Missing or incomplete tables are reported as UNKNOWN"_test = [] -> void {
    FakeHost& host = fresh();

    expect(InitPlugin(null_get_api, host.context(), HookSet {}) == DPLUG_RESULT_UNKNOWN);

    fresh().provideAudio = false;
    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {}) == DPLUG_RESULT_UNKNOWN);

    fresh().wren.abortFiber = nullptr;
    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {}) == DPLUG_RESULT_UNKNOWN);
    expect(runtime().state() == LoadState::Unloaded);
  };

  "Null host context at init is a failure"_test = [] -> void {
    fresh();

    expect(InitPlugin(FakeHost::GetApi, nullptr, HookSet {}) == DPLUG_RESULT_FAILURE);
    expect(runtime().state() == LoadState::Unloaded);
  };

  "Absent hooks succeed"_test = [] -> void {
    FakeHost& host = fresh();

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {}) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_preUpdate(host.context()) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_postUpdate(host.context()) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_preDraw(host.context(), 0.016) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_postDraw(host.context(), 0.016) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_onShutdown(host.context()) == DPLUG_RESULT_SUCCESS);
  };

  "Each event reaches only its own hook"_test = [] -> void {
    FakeHost&   host = fresh();
    Vec<String> order;

    auto recorder = [&order](String name) -> domeplug::core::plugin::Hook {
      return [&order, name](Context&) -> Result<> {
        order.push_back(name);
        return {};
      };
    };

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .onInit     = recorder("init"),
      .preUpdate  = recorder("preUpdate"),
      .postUpdate = recorder("postUpdate"),
      .preDraw    = recorder("preDraw"),
      .postDraw   = recorder("postDraw"),
      .onShutdown = recorder("shutdown"),
    }) == DPLUG_RESULT_SUCCESS);

    expect(PLUGIN_postDraw(host.context(), 0.0) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_preUpdate(host.context()) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_preDraw(host.context(), 0.0) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_postUpdate(host.context()) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_onShutdown(host.context()) == DPLUG_RESULT_SUCCESS);

    expect(order == Vec<String> { "init", "postDraw", "preUpdate", "preDraw", "postUpdate", "shutdown" });
  };

  "Failed init leaves the plugin unloaded"_test = [] -> void {
    FakeHost& host        = fresh();
    i32       updateCalls = 0;

    const DPlugResult result = InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .onInit = [](Context&) -> Result<> {
        ERR(DplugErrorCode::InvalidArgument, "bad plugin setup");
      },
      .preUpdate = [&updateCalls](Context&) -> Result<> {
        ++updateCalls;
        return {};
      },
    });

    expect(result == DPLUG_RESULT_FAILURE);
    expect(runtime().state() == LoadState::Unloaded);
    expect(PLUGIN_preUpdate(host.context()) == DPLUG_RESULT_FAILURE);
    expect(updateCalls == 0);
  };

  "Init failure is reported through the host log"_test = [] -> void {
    FakeHost& host = fresh();

    const DPlugResult result = InitPlugin(FakeHost::GetApi, host.context(), HookSet { .onInit = [](Context&) -> Result<> {
      ERR(DplugErrorCode::InvalidArgument, "bad plugin setup");
    } });

    expect(result == DPLUG_RESULT_FAILURE);
    expect(std::ranges::any_of(host.logs, [](const String& line) -> bool { return line.contains("bad plugin setup"); }));
  };

  "Only the thread inside a hook writes to the host log"_test = [] -> void {
    FakeHost& host = fresh();

    const DPlugResult result = InitPlugin(FakeHost::GetApi, host.context(), HookSet { .onInit = [](Context&) -> Result<> {
      // Stands in for the mixer thread failing while the hook is running
      std::thread mixer([] -> void { error_log("mixer underrun"); });
      mixer.join();

      warn_log("init warning");
      return {};
    } });

    expect(result == DPLUG_RESULT_SUCCESS);
    expect(std::ranges::any_of(host.logs, [](const String& line) -> bool { return line.contains("init warning"); }));
    expect(std::ranges::none_of(host.logs, [](const String& line) -> bool { return line.contains("mixer underrun"); }));

    runtime().unload();
  };

  "A throwing hook is a failure, not a crash"_test = [] -> void {
    FakeHost& host = fresh();

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .preUpdate = [](Context&) -> Result<> { throw std::runtime_error("boom"); },
    }) == DPLUG_RESULT_SUCCESS);

    expect(PLUGIN_preUpdate(host.context()) == DPLUG_RESULT_FAILURE);
    expect(runtime().state() == LoadState::Ready);
    expect(PLUGIN_onShutdown(host.context()) == DPLUG_RESULT_SUCCESS);

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .onInit = [](Context&) -> Result<> { throw std::runtime_error("boom"); },
    }) == DPLUG_RESULT_FAILURE);
    expect(runtime().state() == LoadState::Unloaded);
  };

  "Failing per-frame hooks do not unload the plugin"_test = [] -> void {
    FakeHost& host       = fresh();
    i32       drawCalls  = 0;

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .preUpdate = [](Context&) -> Result<> { ERR(DplugErrorCode::TypeMismatch, "bad frame"); },
      .postDraw  = [&drawCalls](Context&) -> Result<> {
        ++drawCalls;
        return {};
      },
    }) == DPLUG_RESULT_SUCCESS);

    expect(PLUGIN_preUpdate(host.context()) == DPLUG_RESULT_FAILURE);
    expect(PLUGIN_postDraw(host.context(), 0.1) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_preUpdate(host.context()) == DPLUG_RESULT_FAILURE);
    expect(drawCalls == 1);

    runtime().unload();
  };

  "Shutdown unloads the plugin whatever the hook returns"_test = [] -> void {
    FakeHost& host = fresh();

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {}) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_onShutdown(host.context()) == DPLUG_RESULT_SUCCESS);
    expect(runtime().state() == LoadState::Unloaded);
    expect(PLUGIN_postUpdate(host.context()) == DPLUG_RESULT_FAILURE);

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .onShutdown = [](Context&) -> Result<> { ERR(DplugErrorCode::InternalError, "could not flush"); },
    }) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_onShutdown(host.context()) == DPLUG_RESULT_FAILURE);
    expect(runtime().state() == LoadState::Unloaded);
    expect(runtime().capabilities() == nullptr);
  };

  "Shutdown before init is a failure"_test = [] -> void {
    FakeHost& host = fresh();

    expect(PLUGIN_onShutdown(host.context()) == DPLUG_RESULT_FAILURE);
    expect(runtime().state() == LoadState::Unloaded);
  };

  "Re-entrant events are rejected without disturbing the running hook"_test = [] -> void {
    FakeHost&   host          = fresh();
    i32         nestedCalls   = 0;
    DPlugResult nestedResult  = DPLUG_RESULT_SUCCESS;
    LoadState   stateInside   = LoadState::Unloaded;

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .preUpdate = [&](Context& ctx) -> Result<> {
        stateInside  = runtime().state();
        nestedResult = PLUGIN_postUpdate(ctx.handle());
        return {};
      },
      .postUpdate = [&nestedCalls](Context&) -> Result<> {
        ++nestedCalls;
        return {};
      },
    }) == DPLUG_RESULT_SUCCESS);

    expect(PLUGIN_preUpdate(host.context()) == DPLUG_RESULT_SUCCESS);
    expect(stateInside == LoadState::Dispatching);
    expect(nestedResult == DPLUG_RESULT_FAILURE);
    expect(nestedCalls == 0);
    expect(runtime().state() == LoadState::Ready);

    // The hook still runs normally outside a dispatch
    expect(PLUGIN_postUpdate(host.context()) == DPLUG_RESULT_SUCCESS);
    expect(nestedCalls == 1);

    runtime().unload();
  };

  "A second init while loaded is rejected and keeps the first hooks"_test = [] -> void {
    FakeHost& host       = fresh();
    i32       firstCalls = 0;
    i32       newCalls   = 0;

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .preUpdate = [&firstCalls](Context&) -> Result<> {
        ++firstCalls;
        return {};
      },
    }) == DPLUG_RESULT_SUCCESS);

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .onInit = [&newCalls](Context&) -> Result<> {
        ++newCalls;
        return {};
      },
    }) == DPLUG_RESULT_FAILURE);

    expect(newCalls == 0);
    expect(runtime().state() == LoadState::Ready);
    expect(PLUGIN_preUpdate(host.context()) == DPLUG_RESULT_SUCCESS);
    expect(firstCalls == 1);

    runtime().unload();
  };

  "Draw hooks see the host's frame delta"_test = [] -> void {
    FakeHost&   host = fresh();
    Option<f64> drawDelta;
    Option<f64> updateDelta = Some(-1.0);

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .preUpdate = [&updateDelta](Context& ctx) -> Result<> {
        updateDelta = ctx.frameDelta();
        return {};
      },
      .preDraw = [&drawDelta](Context& ctx) -> Result<> {
        drawDelta = ctx.frameDelta();
        return {};
      },
    }) == DPLUG_RESULT_SUCCESS);

    expect(PLUGIN_preDraw(host.context(), 0.25) == DPLUG_RESULT_SUCCESS);
    expect(PLUGIN_preUpdate(host.context()) == DPLUG_RESULT_SUCCESS);

    expect(drawDelta.has_value());
    expect(*drawDelta == 0.25_d);
    expect(!updateDelta.has_value());

    runtime().unload();
  };

  "Registration outside init fails the hook"_test = [] -> void {
    FakeHost& host = fresh();

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .preUpdate = [](Context& ctx) -> Result<> { return ctx.registerModule("late", "class Late {}"); },
    }) == DPLUG_RESULT_SUCCESS);

    expect(PLUGIN_preUpdate(host.context()) == DPLUG_RESULT_FAILURE);
    expect(host.countCalls("registerModule") == 0_ul);

    runtime().unload();
  };

  "Host refusal during init fails the load"_test = [] -> void {
    FakeHost& host = fresh();
    host.failOn    = "registerModule external";

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .onInit = [](Context& ctx) -> Result<> { return ctx.registerModule("external", "class ExternalClass {}"); },
    }) == DPLUG_RESULT_FAILURE);
    expect(runtime().state() == LoadState::Unloaded);
  };

  "Context::log passes text through untouched"_test = [] -> void {
    FakeHost& host = fresh();

    expect(InitPlugin(FakeHost::GetApi, host.context(), HookSet {
      .onInit = [](Context& ctx) -> Result<> {
        ctx.log("100% ready, {} modules\n", 2);
        return {};
      },
    }) == DPLUG_RESULT_SUCCESS);

    expect(std::ranges::find(host.logs, String("100% ready, 2 modules\n")) != host.logs.end());

    runtime().unload();
  };

  "Result mapping"_test = [] -> void {
    expect(ToHostResult({}) == DPLUG_RESULT_SUCCESS);
    expect(ToHostResult(Err(DplugError(DplugErrorCode::InvalidCapabilityTable, "no table"))) == DPLUG_RESULT_UNKNOWN);
    expect(ToHostResult(Err(DplugError(DplugErrorCode::HookFailure, "hook"))) == DPLUG_RESULT_FAILURE);
    expect(ToHostResult(Err(DplugError(DplugErrorCode::RegistrationFailed, "refused"))) == DPLUG_RESULT_FAILURE);
  };

  return 0;
}
