// Tone generator plugin driven by an audio channel.
//
//   import "synth" for Synth
//   Synth.volume = 0.3
//   Synth.playTone(440, 500)     // frequency in Hz, length in ms
//   Synth.noteOn(4, 9)           // octave, semitone from C
//   Synth.noteOff()

#include <cmath>   // std::pow, std::sin, std::fmod
#include <format>  // std::format
#include <mutex>   // std::mutex, std::lock_guard
#include <numbers> // std::numbers::pi

#include <DPlug++/Audio/Channel.hpp>
#include <DPlug++/Core/Context.hpp>
#include <DPlug++/Core/Plugin.hpp>
#include <DPlug++/Utils/Error.hpp>
#include <DPlug++/Utils/Logging.hpp>
#include <DPlug++/Utils/Types.hpp>
#include <DPlug++/Wren/Module.hpp>
#include <DPlug++/Wren/VM.hpp>

using namespace domeplug::utils::types;
using domeplug::audio::Channel;
using domeplug::audio::ChannelCallbacks;
using domeplug::audio::ChannelState;
using domeplug::core::Context;
using domeplug::wren::ModuleBuilder;
using domeplug::wren::RegisterModules;
using domeplug::wren::VM;

namespace {
  constexpr f64 SAMPLE_RATE = 44100.0;
  constexpr f64 MIN_AUDIBLE = 20.0;
  constexpr f64 ATTACK      = 0.02;
  constexpr f64 RELEASE     = 0.02;

  enum class Waveform : u8 {
    Sine,
    Square,
    Saw,
  };

  struct Voice {
    Waveform waveform  = Waveform::Saw;
    f64      volume    = 0.5;
    f64      frequency = 0.0;
    f64      length    = 0.0; ///< Seconds; 0 plays until noteOff
    f64      startTime = 0.0;
    f64      offTime   = 0.0;
    bool     held      = false;
  };

  // Shared between the script thread (static methods) and the audio thread (mix)
  struct SynthState {
    std::mutex mutex;
    Voice      voice;
    f64        time = 0.0;
  };

  auto State() -> SynthState& {
    static SynthState state;
    return state;
  }

  Option<Channel> g_channel;

  auto NoteFrequency(const f64 octave, const f64 semitone) -> f64 {
    constexpr f64 C4 = 261.63;
    return C4 * std::pow(2.0, (((octave - 4.0) * 12.0) + semitone) / 12.0);
  }

  auto Envelope(const Voice& voice, const f64 time) -> f64 {
    if (voice.held) {
      const f64 age = time - voice.startTime;
      return age < ATTACK ? age / ATTACK : 1.0;
    }

    const f64 amp = 1.0 - ((time - voice.offTime) / RELEASE);
    return amp < 0.0001 ? 0.0 : amp;
  }

  auto Oscillate(const Waveform waveform, const f64 frequency, const f64 time) -> f64 {
    const f64 phase = std::sin(2.0 * std::numbers::pi * frequency * time);

    switch (waveform) {
      case Waveform::Sine:   return phase;
      case Waveform::Square: return phase > 0.0 ? 1.0 : -1.0;
      case Waveform::Saw:    return (2.0 * frequency * std::fmod(time, 1.0 / frequency)) - 1.0;
    }

    return 0.0;
  }

  auto Mix(Channel& /*channel*/, Span<f32> buffer) -> void {
    SynthState&           state = State();
    const std::lock_guard lock(state.mutex);
    Voice&                voice = state.voice;

    for (usize frame = 0; frame + 1 < buffer.size(); frame += 2) {
      if (voice.held && voice.length > 0.0 && state.time - voice.startTime >= voice.length) {
        voice.held    = false;
        voice.offTime = state.time;
      }

      f64 sample = 0.0;

      if (voice.frequency > MIN_AUDIBLE)
        sample = Oscillate(voice.waveform, voice.frequency, state.time) * Envelope(voice, state.time) * voice.volume;

      buffer[frame]     = static_cast<f32>(sample);
      buffer[frame + 1] = static_cast<f32>(sample);

      state.time += 1.0 / SAMPLE_RATE;
    }
  }

  auto Start(const f64 frequency, const f64 length) -> void {
    SynthState&           state = State();
    const std::lock_guard lock(state.mutex);

    state.voice.frequency = frequency;
    state.voice.length    = length;
    state.voice.startTime = state.time;
    state.voice.held      = true;
  }

  auto SetVolume(VM& vm) -> Result<> {
    const f64 volume = TRY(vm.getSlotDouble(1));

    const std::lock_guard lock(State().mutex);
    State().voice.volume = volume < 0.0 ? 0.0 : volume;
    return {};
  }

  auto GetVolume(VM& vm) -> Result<> {
    f64 volume = 0.0;
    {
      const std::lock_guard lock(State().mutex);
      volume = State().voice.volume;
    }

    return vm.setSlotDouble(0, volume);
  }

  auto SetWaveform(VM& vm) -> Result<> {
    const i64 index = TRY(vm.getSlotInteger(1));

    if (index < 0 || index > static_cast<i64>(Waveform::Saw))
      ERR_FMT(domeplug::utils::error::DplugErrorCode::InvalidArgument, "Unknown waveform {}", index);

    const std::lock_guard lock(State().mutex);
    State().voice.waveform = static_cast<Waveform>(index);
    return {};
  }

  auto PlayTone(VM& vm) -> Result<> {
    const f64 frequency = TRY(vm.getSlotDouble(1));
    const f64 lengthMs  = TRY(vm.getSlotDouble(2));

    Start(frequency, lengthMs / 1000.0);

    vm.log(std::format("Frequency: {}\n", frequency));
    return {};
  }

  auto NoteOn(VM& vm) -> Result<> {
    const f64 octave   = TRY(vm.getSlotDouble(1));
    const f64 semitone = TRY(vm.getSlotDouble(2));

    const f64 frequency = NoteFrequency(octave, semitone);
    Start(frequency, 0.0);

    vm.log(std::format("Octave: {} - Note: {} - Frequency: {}\n", octave, semitone, frequency));
    return {};
  }

  auto NoteOff(VM& /*vm*/) -> void {
    SynthState&           state = State();
    const std::lock_guard lock(state.mutex);

    state.voice.held    = false;
    state.voice.offTime = state.time;
  }

  auto OnInit(Context& ctx) -> Result<> {
    ctx.log("init hook triggered\n");

    ModuleBuilder module("synth");

    module.plainClass("Synth")
      .staticMethod<&SetVolume>("volume=(v)")
      .staticMethod<&GetVolume>("volume")
      .staticMethod<&SetWaveform>("waveform=(index)")
      .staticMethod<&PlayTone>("playTone(frequency, time)")
      .staticMethod<&NoteOn>("noteOn(octave, note)")
      .staticMethod<&NoteOff>("noteOff()");

    TRY_VOID(RegisterModules(ctx, { TRY(module.build()) }));

    Channel channel = TRY(ctx.createChannel(ChannelCallbacks {
      .mix    = Mix,
      .update = {},
      .finish = [](Channel& finished, VM& /*vm*/) -> Result<> {
        debug_log("Synth channel {} finished", finished.id());
        return {};
      },
    }));

    channel.setState(ChannelState::Playing);
    g_channel = channel;

    return {};
  }

  auto OnShutdown(Context& /*ctx*/) -> Result<> {
    if (g_channel) {
      g_channel->stop();
      g_channel.reset();
    }

    return {};
  }
} // namespace

DPLUG_PLUGIN({ .onInit = OnInit, .onShutdown = OnShutdown })
