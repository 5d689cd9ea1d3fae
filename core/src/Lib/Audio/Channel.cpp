#include <DPlug++/Audio/Channel.hpp>

#include <algorithm> // std::ranges::fill
#include <atomic>    // std::atomic
#include <memory>    // std::make_unique

#include <DPlug++/Utils/Logging.hpp>
#include <DPlug++/Wren/VM.hpp>

namespace domeplug::audio {
  using utils::error::DplugErrorCode;
  using enum DplugErrorCode;
  using types::f32;
  using types::Result;
  using types::Span;
  using types::UniquePointer;
  using types::Unit;
  using types::usize;

  namespace {
    struct ChannelData {
      ChannelCallbacks      callbacks;
      core::CapabilityTable caps;
    };

    using GetDataFn = decltype(DPlugAudioApiV0::getData);

    // Captured at channel creation; the host calls the trampolines without any
    // other way of reaching its audio table.
    auto HostGetData() -> std::atomic<GetDataFn>& {
      static std::atomic<GetDataFn> getData = nullptr;
      return getData;
    }

    auto DataOf(const DPlugChannelRef ref) -> ChannelData* {
      const GetDataFn getData = HostGetData().load(std::memory_order_acquire);

      if (getData == nullptr)
        return nullptr;

      return static_cast<ChannelData*>(getData(ref));
    }

    auto RunScriptCallback(const types::Fn<Result<>(Channel&, wren::VM&)>& callback, Channel& channel, wren::VM& vm) -> Unit {
      if (!callback)
        return;

      const DPlugChannelId id = channel.id();

      try {
        if (Result<> result = callback(channel, vm); !result) {
          warn_at(result.error());
          vm.abortFiber(result.error().message);
        }
      } catch (const types::Exception& exc) {
        error_log("Audio channel {} callback threw: {}", id, exc.what());
        vm.abortFiber(exc.what());
      } catch (...) {
        error_log("Audio channel {} callback threw an unknown exception", id);
        vm.abortFiber("Audio channel callback threw an unknown exception");
      }
    }

    auto MixTrampoline(const DPlugChannelRef ref, float* buffer, const usize requestedSamples) -> void {
      const Span<f32> samples(buffer, requestedSamples * 2);

      ChannelData* data = DataOf(ref);

      if (data == nullptr) {
        std::ranges::fill(samples, 0.0F);
        return;
      }

      Channel channel(data->caps.audio(), ref);

      // Nothing can be aborted on the audio thread; a failing mix plays silence
      try {
        data->callbacks.mix(channel, samples);
      } catch (const types::Exception& exc) {
        error_log("Audio channel {} mix threw: {}", ref.id, exc.what());
        std::ranges::fill(samples, 0.0F);
      } catch (...) {
        error_log("Audio channel {} mix threw an unknown exception", ref.id);
        std::ranges::fill(samples, 0.0F);
      }
    }

    auto UpdateTrampoline(const DPlugChannelRef ref, WrenVM* raw) -> void {
      ChannelData* data = DataOf(ref);

      if (data == nullptr)
        return;

      Channel  channel(data->caps.audio(), ref);
      wren::VM vm(data->caps, raw);
      RunScriptCallback(data->callbacks.update, channel, vm);
    }

    auto FinishTrampoline(const DPlugChannelRef ref, WrenVM* raw) -> void {
      const UniquePointer<ChannelData> data(DataOf(ref));

      if (!data) {
        warn_log("Audio channel {} finished without callback state", ref.id);
        return;
      }

      Channel  channel(data->caps.audio(), ref);
      wren::VM vm(data->caps, raw);
      RunScriptCallback(data->callbacks.finish, channel, vm);

      debug_log("Audio channel {} released", ref.id);
    }
  } // namespace

  auto Channel::state() const -> ChannelState {
    return static_cast<ChannelState>(m_audio.getState(m_ref));
  }

  auto Channel::setState(const ChannelState state) -> Unit {
    m_audio.setState(m_ref, static_cast<DPlugChannelState>(state));
  }

  auto Channel::stop() -> Unit {
    m_audio.stop(m_ref);
  }

  auto CreateChannel(const core::CapabilityTable& caps, DPlugHostContext host, ChannelCallbacks callbacks) -> Result<Channel> {
    if (!callbacks.mix)
      ERR(InvalidArgument, "An audio channel needs a mix callback");

    HostGetData().store(caps.audio().getData, std::memory_order_release);

    auto data = std::make_unique<ChannelData>(ChannelData { .callbacks = std::move(callbacks), .caps = caps });

    const DPlugChannelRef ref = caps.audio().channelCreate(host, MixTrampoline, UpdateTrampoline, FinishTrampoline, data.get());

    // Ownership now belongs to the host until finish runs
    static_cast<void>(data.release());

    debug_log("Created audio channel {}", ref.id);

    return Channel(caps.audio(), ref);
  }
} // namespace domeplug::audio
