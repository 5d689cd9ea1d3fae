/**
 * @file Plugin.hpp
 * @brief Plugin author interface: lifecycle hooks and the load entry point
 * @author DomePlug++ Team
 * @version 1.0.0
 *
 * @details A plugin is a shared library that supplies up to six lifecycle hooks.
 * The host resolves `PLUGIN_onInit` plus one symbol per event; the event symbols
 * are provided by this library and `PLUGIN_onInit` is emitted by DPLUG_PLUGIN.
 *
 * @example
 * @code
 * auto OnInit(domeplug::core::Context& ctx) -> Result<> {
 *   ctx.log("Initialising external module\n");
 *   return {};
 * }
 *
 * DPLUG_PLUGIN({ .onInit = OnInit })
 * @endcode
 */

#pragma once

#include <dplug_abi.h>

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Context.hpp"

namespace domeplug::core::plugin {
  /**
   * @brief A lifecycle hook. An empty Hook is a no-op that always succeeds.
   */
  using Hook = utils::types::Fn<utils::types::Result<>(Context&)>;

  /**
   * @struct HookSet
   * @brief Hooks supplied once at load time and fixed until the library unloads.
   */
  struct HookSet {
    Hook onInit;
    Hook preUpdate;
    Hook postUpdate;
    Hook preDraw;  ///< Context::frameDelta() holds the host's delta
    Hook postDraw; ///< Context::frameDelta() holds the host's delta
    Hook onShutdown;
  };

  /**
   * @brief Load the plugin: validate capabilities, store hooks, run the init hook.
   * @param getApi Host capability lookup passed to PLUGIN_onInit.
   * @param ctx Host context passed to PLUGIN_onInit.
   * @param hooks The plugin's hooks.
   * @return DPLUG_RESULT_SUCCESS, DPLUG_RESULT_FAILURE if the init hook failed,
   *         or DPLUG_RESULT_UNKNOWN if the host's capability tables were rejected.
   */
  auto InitPlugin(DPlugGetApiFn getApi, DPlugHostContext ctx, HookSet hooks) -> DPlugResult;
} // namespace domeplug::core::plugin

/**
 * @def DPLUG_PLUGIN
 * @brief Emits the `PLUGIN_onInit` export for a plugin library.
 *
 * @param ... A HookSet expression (designated initializers are fine).
 */
// NOLINTBEGIN(bugprone-macro-parentheses)
#define DPLUG_PLUGIN(...)                                                                             \
  extern "C" DPLUG_EXPORT auto PLUGIN_onInit(DPlugGetApiFn getApi, DPlugHostContext ctx) -> DPlugResult { \
    return ::domeplug::core::plugin::InitPlugin(getApi, ctx, ::domeplug::core::plugin::HookSet __VA_ARGS__);  \
  }
// NOLINTEND(bugprone-macro-parentheses)
