#include <DPlug++/Core/PluginConfig.hpp>

#include <glaze/toml.hpp>
#include <magic_enum/magic_enum.hpp>
#include <system_error> // std::error_code

#include <DPlug++/Utils/Env.hpp>
#include <DPlug++/Utils/Error.hpp>

using namespace domeplug::utils::types;
using domeplug::utils::env::GetEnv;
using domeplug::utils::error::DplugErrorCode;
using domeplug::utils::logging::LogLevel;

namespace fs = std::filesystem;

// Intermediate structs for TOML parsing with glaze.
// Empty strings act as "not provided".
namespace {
  struct TomlPlugin {
    String logLevel;
    bool   lockModules        = true;
    bool   reportErrorsToHost = true;
  };

  struct TomlConfig {
    TomlPlugin plugin;
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlPlugin> {
  using T                     = TomlPlugin;
  static constexpr auto value = object("log_level", &T::logLevel, "lock_modules", &T::lockModules, "report_errors_to_host", &T::reportErrorsToHost);
};

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object("plugin", &T::plugin);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace domeplug::core::plugin {
  using enum DplugErrorCode;

  namespace {
    auto ParseLogLevel(const StringView name) -> Result<LogLevel> {
      if (const Option<LogLevel> level = magic_enum::enum_cast<LogLevel>(name, magic_enum::case_insensitive))
        return *level;

      ERR_FMT(ConfigurationError, "Unknown log level '{}'", name);
    }
  } // namespace

  auto LoadPluginConfig(const fs::path& path) -> Result<PluginConfig> {
    String       buffer;
    glz::context ctx {};

    ctx.current_file = path.string();

    if (const auto fileError = glz::file_to_buffer(buffer, ctx.current_file); bool(fileError))
      ERR_FMT(IoError, "Failed to read config file: {}", path.string());

    TomlConfig tomlCfg;

    // Unknown keys are allowed so a plugin can keep its own settings in the same file
    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer, ctx))
      ERR_FMT(ParseError, "Failed to parse config file: {}", glz::format_error(readError, buffer));

    PluginConfig cfg {
      .lockModules        = tomlCfg.plugin.lockModules,
      .reportErrorsToHost = tomlCfg.plugin.reportErrorsToHost,
    };

    if (!tomlCfg.plugin.logLevel.empty())
      cfg.logLevel = TRY(ParseLogLevel(tomlCfg.plugin.logLevel));

    debug_log("Config loaded from {}", path.string());

    return cfg;
  }

  auto ApplyEnvOverrides(PluginConfig& cfg) -> Result<> {
    if (const Result<String> level = GetEnv("DPLUG_LOG_LEVEL"))
      cfg.logLevel = TRY(ParseLogLevel(*level));

    return {};
  }

  auto LoadPluginConfig() -> Result<PluginConfig> {
    PluginConfig cfg;

    if (const Result<String> path = GetEnv("DPLUG_CONFIG")) {
      std::error_code errc;

      if (!fs::exists(*path, errc))
        ERR_FMT(NotFound, "DPLUG_CONFIG points to '{}', which does not exist", *path);

      cfg = TRY(LoadPluginConfig(fs::path(*path)));
    }

    TRY_VOID(ApplyEnvOverrides(cfg));

    return cfg;
  }
} // namespace domeplug::core::plugin
