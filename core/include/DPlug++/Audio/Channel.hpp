/**
 * @file Channel.hpp
 * @brief Native audio channels backed by the host mixer
 * @author DomePlug++ Team
 * @version 1.0.0
 *
 * @details A channel is created from three native callbacks. The host mixer
 * calls `mix` on its audio thread to fill an interleaved stereo buffer, and
 * calls `update` and `finish` on the script thread with a VM. Each callback
 * also gets the Channel it belongs to. The callback
 * state is owned by the library and released once `finish` has run.
 */

#pragma once

#include <dplug_abi.h>

#include "../Core/Capabilities.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace domeplug::wren {
  class VM;
} // namespace domeplug::wren

namespace domeplug::audio {
  namespace types = ::domeplug::utils::types;

  /**
   * @enum ChannelState
   * @brief Lifecycle states of a host audio channel.
   */
  enum class ChannelState : types::u8 {
    Invalid      = DPLUG_CHANNEL_INVALID,
    Initialize   = DPLUG_CHANNEL_INITIALIZE,
    ToPlay       = DPLUG_CHANNEL_TO_PLAY,
    Devirtualize = DPLUG_CHANNEL_DEVIRTUALIZE,
    Loading      = DPLUG_CHANNEL_LOADING,
    Playing      = DPLUG_CHANNEL_PLAYING,
    Stopping     = DPLUG_CHANNEL_STOPPING,
    Stopped      = DPLUG_CHANNEL_STOPPED,
    Virtualizing = DPLUG_CHANNEL_VIRTUALIZING,
    Virtual      = DPLUG_CHANNEL_VIRTUAL,
    Last         = DPLUG_CHANNEL_LAST,
  };

  /**
   * @class Channel
   * @brief Copyable handle to a host audio channel.
   *
   * The handle holds its own copy of the audio capabilities, so it stays
   * usable for as long as the host keeps the channel alive.
   */
  class Channel {
   public:
    Channel(const DPlugAudioApiV0& audio, const DPlugChannelRef ref)
      : m_audio(audio), m_ref(ref) {}

    [[nodiscard]] auto id() const -> DPlugChannelId {
      return m_ref.id;
    }

    [[nodiscard]] auto state() const -> ChannelState;
    auto               setState(ChannelState state) -> types::Unit;
    auto               stop() -> types::Unit;

   private:
    DPlugAudioApiV0 m_audio;
    DPlugChannelRef m_ref;
  };

  /**
   * @struct ChannelCallbacks
   * @brief Native behaviour of a channel. Only `mix` is required.
   *
   * Every callback receives a handle to its own channel, so a sound that has
   * run out can stop itself.
   */
  struct ChannelCallbacks {
    types::Fn<void(Channel&, types::Span<types::f32>)> mix;    ///< Fill 2 * samples interleaved stereo floats; runs on the audio thread.
    types::Fn<types::Result<>(Channel&, wren::VM&)>    update; ///< Called once per frame on the script thread.
    types::Fn<types::Result<>(Channel&, wren::VM&)>    finish; ///< Called once when the host retires the channel.
  };

  /**
   * @brief Create a host channel running the given callbacks.
   * @param caps Loaded capabilities.
   * @param host Host context of the hook creating the channel.
   * @param callbacks Native callbacks; `mix` must be set.
   * @return The new channel, or InvalidArgument when `mix` is missing.
   */
  auto CreateChannel(const core::CapabilityTable& caps, DPlugHostContext host, ChannelCallbacks callbacks) -> types::Result<Channel>;
} // namespace domeplug::audio
