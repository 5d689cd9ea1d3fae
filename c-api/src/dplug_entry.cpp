#include "../include/dplug_abi.h"

#include <DPlug++/Core/Runtime.hpp>
#include <DPlug++/Utils/Types.hpp>

using namespace domeplug::utils::types;
using domeplug::core::HookPhase;
using domeplug::core::plugin::PluginRuntime;

// PLUGIN_onInit lives in the plugin's own translation unit (see DPLUG_PLUGIN)
extern "C" {
  DPLUG_EXPORT auto PLUGIN_preUpdate(DPlugHostContext ctx) -> DPlugResult {
    return PluginRuntime::getInstance().dispatch(HookPhase::PreUpdate, ctx);
  }

  DPLUG_EXPORT auto PLUGIN_postUpdate(DPlugHostContext ctx) -> DPlugResult {
    return PluginRuntime::getInstance().dispatch(HookPhase::PostUpdate, ctx);
  }

  DPLUG_EXPORT auto PLUGIN_preDraw(DPlugHostContext ctx, const double delta) -> DPlugResult {
    return PluginRuntime::getInstance().dispatch(HookPhase::PreDraw, ctx, Some(f64 { delta }));
  }

  DPLUG_EXPORT auto PLUGIN_postDraw(DPlugHostContext ctx, const double delta) -> DPlugResult {
    return PluginRuntime::getInstance().dispatch(HookPhase::PostDraw, ctx, Some(f64 { delta }));
  }

  DPLUG_EXPORT auto PLUGIN_onShutdown(DPlugHostContext ctx) -> DPlugResult {
    return PluginRuntime::getInstance().dispatch(HookPhase::Shutdown, ctx);
  }
}
