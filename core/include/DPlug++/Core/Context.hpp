/**
 * @file Context.hpp
 * @brief Per-hook handle combining the capability table with the host context
 * @author DomePlug++ Team
 * @version 1.0.0
 *
 * @details A Context is built fresh for every hook invocation and handed to the
 * hook by reference. It cannot be copied or moved, so a hook has no way to keep
 * it, or the host pointer inside it, past the invocation that created it.
 */

#pragma once

#include <format> // std::format, std::format_string

#include <dplug_abi.h>

#include "../Audio/Channel.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Capabilities.hpp"

namespace domeplug::core {
  /**
   * @enum HookPhase
   * @brief Lifecycle phase a hook is bound to.
   */
  enum class HookPhase : types::u8 {
    Init,
    PreUpdate,
    PostUpdate,
    PreDraw,
    PostDraw,
    Shutdown,
  };

  class Context {
   public:
    Context(const CapabilityTable& caps, DPlugHostContext host, const HookPhase phase, const types::Option<types::f64> frameDelta = types::None)
      : m_caps(&caps), m_host(host), m_phase(phase), m_frameDelta(frameDelta) {}

    Context(const Context&)                    = delete;
    Context(Context&&)                         = delete;
    auto operator=(const Context&) -> Context& = delete;
    auto operator=(Context&&) -> Context&      = delete;
    ~Context()                                 = default;

    [[nodiscard]] auto phase() const -> HookPhase {
      return m_phase;
    }

    /**
     * @brief Time since the previous frame, forwarded from the host.
     * @return The delta for PreDraw and PostDraw hooks, None otherwise.
     */
    [[nodiscard]] auto frameDelta() const -> types::Option<types::f64> {
      return m_frameDelta;
    }

    [[nodiscard]] auto capabilities() const -> const CapabilityTable& {
      return *m_caps;
    }

    [[nodiscard]] auto handle() const -> DPlugHostContext {
      return m_host;
    }

    /**
     * @brief Define a script module from source.
     * @return RegistrationFailed outside the init hook or when the host refuses the module.
     */
    auto registerModule(types::StringView name, types::StringView source) -> types::Result<>;

    /**
     * @brief Bind a native allocator and optional finalizer to a foreign class.
     */
    auto registerClass(types::StringView module, types::StringView className, DPlugForeignFn allocate, DPlugFinalizerFn finalize = nullptr) -> types::Result<>;

    /**
     * @brief Bind a native handler to a foreign method.
     * @param signature Full host signature, e.g. "static Synth.playTone(_,_)".
     */
    auto registerFn(types::StringView module, types::StringView signature, DPlugForeignFn method) -> types::Result<>;

    auto lockModule(types::StringView module) -> types::Result<>;

    /**
     * @brief Write text to the host log. Text is passed through unformatted.
     */
    auto log(types::StringView text) const -> types::Unit;

    template <typename... Args>
    auto log(std::format_string<Args...> fmt, Args&&... args) const -> types::Unit {
      log(types::StringView(std::format(fmt, std::forward<Args>(args)...)));
    }

    /**
     * @brief Create a host audio channel driven by native callbacks.
     */
    auto createChannel(audio::ChannelCallbacks callbacks) -> types::Result<audio::Channel>;

   private:
    const CapabilityTable*    m_caps;
    DPlugHostContext          m_host;
    HookPhase                 m_phase;
    types::Option<types::f64> m_frameDelta;

    [[nodiscard]] auto requireInitPhase(types::StringView operation) const -> types::Result<>;
  };
} // namespace domeplug::core
