#include <DPlug++/Core/Runtime.hpp>

#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <matchit.hpp>               // matchit::{match, is, _}

#include <DPlug++/Utils/Logging.hpp>

namespace domeplug::core::plugin {
  using utils::error::DplugError;
  using utils::error::DplugErrorCode;
  using utils::logging::LogLevel;
  using enum DplugErrorCode;
  using types::Err;
  using types::f64;
  using types::Option;
  using types::Result;
  using types::String;
  using types::StringView;
  using types::Unit;

  auto ToHostResult(const Result<>& result) -> DPlugResult {
    using namespace matchit;

    if (result)
      return DPLUG_RESULT_SUCCESS;

    return match(result.error().code)(
      is | InvalidCapabilityTable = DPLUG_RESULT_UNKNOWN,
      is | _                      = DPLUG_RESULT_FAILURE
    );
  }

  auto InitPlugin(DPlugGetApiFn getApi, DPlugHostContext ctx, HookSet hooks) -> DPlugResult {
    return PluginRuntime::getInstance().load(getApi, ctx, std::move(hooks));
  }

  auto PluginRuntime::load(DPlugGetApiFn getApi, DPlugHostContext host, HookSet hooks) -> DPlugResult {
    if (m_state != LoadState::Unloaded) {
      // The stored hooks and capabilities stay as they are
      const Result<> rejected = Err(DplugError(InvalidState, std::format("PLUGIN_onInit called while {}", magic_enum::enum_name(m_state))));
      error_at(rejected.error());
      return ToHostResult(rejected);
    }

    enterHost(host);

    const Result<> result = loadImpl(getApi, host, std::move(hooks));

    if (!result) {
      error_at(result.error());
      unload();
    } else {
      info_log("Plugin loaded");
    }

    leaveHost();

    return ToHostResult(result);
  }

  auto PluginRuntime::loadImpl(DPlugGetApiFn getApi, DPlugHostContext host, HookSet hooks) -> Result<> {
    m_state = LoadState::Loading;

    if (Result<PluginConfig> config = LoadPluginConfig()) {
      m_config = *config;
    } else {
      warn_at(config.error());
      m_config = PluginConfig {};

      // An unusable file must not cost the log level override; a bad override was already reported
      if (const Result<> overridden = ApplyEnvOverrides(m_config); !overridden && overridden.error().code != config.error().code)
        warn_at(overridden.error());
    }

    utils::logging::SetRuntimeLogLevel(m_config.logLevel);

    m_capabilities = TRY(LoadCapabilities(getApi));

    if (host == nullptr)
      ERR(InvalidArgument, "Host passed a null context to PLUGIN_onInit");

    m_hooks = std::move(hooks);
    installHostSink();

    Context ctx(*m_capabilities, host, HookPhase::Init);

    return invoke(m_hooks.onInit, ctx);
  }

  auto PluginRuntime::dispatch(const HookPhase phase, DPlugHostContext host, const Option<f64> frameDelta) -> DPlugResult {
    // Leave everything, including the active host, to the call already running
    if (m_state == LoadState::Dispatching) {
      const Result<> rejected = Err(DplugError(InvalidState, std::format("Rejected re-entrant {} event", magic_enum::enum_name(phase))));
      warn_at(rejected.error());
      return ToHostResult(rejected);
    }

    enterHost(host);

    const Result<> result = dispatchImpl(phase, host, frameDelta);

    if (!result) {
      // Events keep arriving every frame after a failed load
      if (result.error().code == InvalidState)
        debug_log("{}", result.error().toString());
      else
        error_at(result.error());
    }

    leaveHost();

    if (phase == HookPhase::Shutdown && m_state == LoadState::Ready) {
      unload();
      info_log("Plugin unloaded");
    }

    return ToHostResult(result);
  }

  auto PluginRuntime::dispatchImpl(const HookPhase phase, DPlugHostContext host, const Option<f64> frameDelta) -> Result<> {
    if (phase == HookPhase::Init)
      ERR(InvalidArgument, "The init hook only runs through PLUGIN_onInit");

    if (m_state != LoadState::Ready)
      ERR_FMT(InvalidState, "{} event received while {}", magic_enum::enum_name(phase), magic_enum::enum_name(m_state));

    if (host == nullptr)
      ERR_FMT(InvalidArgument, "Host passed a null context to the {} event", magic_enum::enum_name(phase));

    Context ctx(*m_capabilities, host, phase, frameDelta);

    return invoke(hookFor(phase), ctx);
  }

  auto PluginRuntime::invoke(const Hook& hook, Context& ctx) -> Result<> {
    if (!hook) {
      m_state = LoadState::Ready;
      return {};
    }

    const StringView phaseName = magic_enum::enum_name(ctx.phase());

    m_state = LoadState::Dispatching;

    Result<> result;

    try {
      result = hook(ctx);
    } catch (const types::Exception& exc) {
      result = Err(DplugError(HookFailure, std::format("{} hook threw: {}", phaseName, exc.what())));
    } catch (...) {
      result = Err(DplugError(HookFailure, std::format("{} hook threw an unknown exception", phaseName)));
    }

    m_state = LoadState::Ready;

    if (!result) {
      const DplugError& cause = result.error();
      return Err(DplugError(HookFailure, std::format("{} hook failed: {}", phaseName, cause.toString()), cause.location));
    }

    return {};
  }

  auto PluginRuntime::hookFor(const HookPhase phase) const -> const Hook& {
    switch (phase) {
      case HookPhase::Init:       return m_hooks.onInit;
      case HookPhase::PreUpdate:  return m_hooks.preUpdate;
      case HookPhase::PostUpdate: return m_hooks.postUpdate;
      case HookPhase::PreDraw:    return m_hooks.preDraw;
      case HookPhase::PostDraw:   return m_hooks.postDraw;
      case HookPhase::Shutdown:   return m_hooks.onShutdown;
    }

    std::unreachable();
  }

  auto PluginRuntime::installHostSink() -> Unit {
    const auto hostLog = m_capabilities->dome().log;

    if (!m_config.reportErrorsToHost || hostLog == nullptr) {
      utils::logging::SetHostSink({});
      return;
    }

    utils::logging::SetHostSink([this, hostLog](const LogLevel level, const StringView message) -> void {
      // Only the thread the host is currently calling into may use its context
      if (m_activeThread.load() != std::this_thread::get_id())
        return;

      DPlugHostContext host = m_activeHost.load();

      if (host == nullptr)
        return;

      const String line = std::format("[{}] {}\n", magic_enum::enum_name(level), message);
      hostLog(host, "%s", line.c_str());
    });
  }

  auto PluginRuntime::enterHost(DPlugHostContext host) -> Unit {
    m_activeThread.store(std::this_thread::get_id());
    m_activeHost.store(host);
  }

  auto PluginRuntime::leaveHost() -> Unit {
    m_activeHost.store(nullptr);
    m_activeThread.store(std::thread::id {});
  }

  auto PluginRuntime::unload() -> Unit {
    utils::logging::SetHostSink({});

    m_hooks = HookSet {};
    m_capabilities.reset();
    leaveHost();
    m_state = LoadState::Unloaded;
  }
} // namespace domeplug::core::plugin
