#include <DPlug++/Core/Context.hpp>

#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <DPlug++/Utils/Logging.hpp>

namespace domeplug::core {
  using utils::error::DplugErrorCode;
  using enum DplugErrorCode;
  using types::Result;
  using types::String;
  using types::StringView;
  using types::Unit;

  namespace {
    // Host strings are NUL-terminated; an embedded NUL would silently truncate them
    auto ToHostString(const StringView text, const StringView what) -> Result<String> {
      if (text.contains('\0'))
        ERR_FMT(InvalidArgument, "{} '{}' contains a NUL byte", what, text.substr(0, text.find('\0')));

      return String(text);
    }
  } // namespace

  auto Context::requireInitPhase(const StringView operation) const -> Result<> {
    if (m_phase != HookPhase::Init)
      ERR_FMT(RegistrationFailed, "{} is only allowed during the init hook (current phase: {})", operation, magic_enum::enum_name(m_phase));

    return {};
  }

  auto Context::registerModule(const StringView name, const StringView source) -> Result<> {
    TRY_VOID(requireInitPhase("registerModule"));

    const String moduleName = TRY(ToHostString(name, "Module name"));
    const String moduleCode = TRY(ToHostString(source, "Module source"));

    if (m_caps->dome().registerModule(m_host, moduleName.c_str(), moduleCode.c_str()) != DPLUG_RESULT_SUCCESS)
      ERR_FMT(RegistrationFailed, "Host refused module '{}'", moduleName);

    debug_log("Registered module '{}'", moduleName);
    return {};
  }

  auto Context::registerClass(const StringView module, const StringView className, DPlugForeignFn allocate, DPlugFinalizerFn finalize) -> Result<> {
    TRY_VOID(requireInitPhase("registerClass"));

    if (allocate == nullptr)
      ERR_FMT(InvalidArgument, "Foreign class '{}' needs an allocator", className);

    const String moduleName = TRY(ToHostString(module, "Module name"));
    const String name       = TRY(ToHostString(className, "Class name"));

    if (m_caps->dome().registerClass(m_host, moduleName.c_str(), name.c_str(), allocate, finalize) != DPLUG_RESULT_SUCCESS)
      ERR_FMT(RegistrationFailed, "Host refused class '{}' in module '{}'", name, moduleName);

    debug_log("Registered class '{}.{}'", moduleName, name);
    return {};
  }

  auto Context::registerFn(const StringView module, const StringView signature, DPlugForeignFn method) -> Result<> {
    TRY_VOID(requireInitPhase("registerFn"));

    if (method == nullptr)
      ERR_FMT(InvalidArgument, "Foreign method '{}' needs a handler", signature);

    const String moduleName = TRY(ToHostString(module, "Module name"));
    const String fullSig    = TRY(ToHostString(signature, "Signature"));

    if (m_caps->dome().registerFn(m_host, moduleName.c_str(), fullSig.c_str(), method) != DPLUG_RESULT_SUCCESS)
      ERR_FMT(RegistrationFailed, "Host refused method '{}' in module '{}'", fullSig, moduleName);

    trace_log("Registered method '{}' in '{}'", fullSig, moduleName);
    return {};
  }

  auto Context::lockModule(const StringView module) -> Result<> {
    TRY_VOID(requireInitPhase("lockModule"));

    const String moduleName = TRY(ToHostString(module, "Module name"));

    m_caps->dome().lockModule(m_host, moduleName.c_str());
    return {};
  }

  auto Context::log(const StringView text) const -> Unit {
    if (m_caps->dome().log == nullptr) {
      info_log("{}", text);
      return;
    }

    // Never hand user text to the host as a format string
    const String line(text);
    m_caps->dome().log(m_host, "%s", line.c_str());
  }

  auto Context::createChannel(audio::ChannelCallbacks callbacks) -> Result<audio::Channel> {
    return audio::CreateChannel(*m_caps, m_host, std::move(callbacks));
  }
} // namespace domeplug::core
