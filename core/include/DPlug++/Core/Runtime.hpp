/**
 * @file Runtime.hpp
 * @brief Per-library plugin state and hook dispatch
 * @author DomePlug++ Team
 * @version 1.0.0
 *
 * @details The event entry points take no state from the host besides its
 * context pointer, so the capability table and HookSet installed at load time
 * live in a process-wide PluginRuntime, one per loaded library instance.
 *
 * State machine:
 *   Unloaded -> Loading -> Ready <-> Dispatching, and back to Unloaded after
 *   the shutdown hook returns, when loading fails, or on unload().
 */

#pragma once

#include <atomic> // std::atomic
#include <thread> // std::thread::id, std::this_thread::get_id

#include <dplug_abi.h>

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Capabilities.hpp"
#include "Context.hpp"
#include "Plugin.hpp"
#include "PluginConfig.hpp"

namespace domeplug::core::plugin {
  /**
   * @enum LoadState
   * @brief Lifecycle state of the loaded library instance.
   */
  enum class LoadState : utils::types::u8 {
    Unloaded,    ///< No capabilities or hooks; every event fails.
    Loading,     ///< Capability tables are being validated.
    Ready,       ///< Hooks installed; events are accepted.
    Dispatching, ///< A hook is running; nested events are rejected.
  };

  /**
   * @brief Translate a bridge result into the host's return convention.
   *
   * Success maps to DPLUG_RESULT_SUCCESS, a rejected capability table to
   * DPLUG_RESULT_UNKNOWN and every other failure to DPLUG_RESULT_FAILURE.
   */
  auto ToHostResult(const utils::types::Result<>& result) -> DPlugResult;

  class PluginRuntime {
   public:
    static auto getInstance() -> PluginRuntime& {
      static PluginRuntime instance;
      return instance;
    }

    PluginRuntime(const PluginRuntime&)                    = delete;
    PluginRuntime(PluginRuntime&&)                         = delete;
    auto operator=(const PluginRuntime&) -> PluginRuntime& = delete;
    auto operator=(PluginRuntime&&) -> PluginRuntime&      = delete;

    /**
     * @brief Load capabilities, install hooks and run the init hook.
     * @see InitPlugin
     */
    auto load(DPlugGetApiFn getApi, DPlugHostContext host, HookSet hooks) -> DPlugResult;

    /**
     * @brief Run the hook for an event phase.
     * @param phase Any phase but Init.
     * @param host The host context for this call.
     * @param frameDelta Delta forwarded to draw hooks.
     * @return DPLUG_RESULT_FAILURE when not Ready, when called re-entrantly,
     *         or when the hook fails; DPLUG_RESULT_SUCCESS otherwise.
     */
    auto dispatch(HookPhase phase, DPlugHostContext host, utils::types::Option<utils::types::f64> frameDelta = utils::types::None) -> DPlugResult;

    /**
     * @brief Drop all state without running any hook (host unloaded the library).
     */
    auto unload() -> utils::types::Unit;

    [[nodiscard]] auto state() const -> LoadState {
      return m_state;
    }

    /**
     * @brief Capabilities of the loaded instance, or null while Unloaded or Loading.
     */
    [[nodiscard]] auto capabilities() const -> const CapabilityTable* {
      return m_capabilities ? &*m_capabilities : nullptr;
    }

    [[nodiscard]] auto config() const -> const PluginConfig& {
      return m_config;
    }

   private:
    utils::types::Option<CapabilityTable> m_capabilities;
    HookSet                               m_hooks;
    PluginConfig                          m_config;
    LoadState                             m_state = LoadState::Unloaded;
    std::atomic<DPlugHostContext>         m_activeHost = nullptr;
    std::atomic<std::thread::id>          m_activeThread;

    PluginRuntime()  = default;
    ~PluginRuntime() = default;

    auto loadImpl(DPlugGetApiFn getApi, DPlugHostContext host, HookSet hooks) -> utils::types::Result<>;
    auto dispatchImpl(HookPhase phase, DPlugHostContext host, utils::types::Option<utils::types::f64> frameDelta) -> utils::types::Result<>;

    // Runs a hook with the state set to Dispatching, translating exceptions into errors
    auto invoke(const Hook& hook, Context& ctx) -> utils::types::Result<>;

    [[nodiscard]] auto hookFor(HookPhase phase) const -> const Hook&;

    auto installHostSink() -> utils::types::Unit;

    // Marks the calling thread as the one the host is currently inside
    auto enterHost(DPlugHostContext host) -> utils::types::Unit;
    auto leaveHost() -> utils::types::Unit;
  };
} // namespace domeplug::core::plugin
