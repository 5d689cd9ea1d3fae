/**
 * @file PluginConfig.hpp
 * @brief Runtime configuration for the plugin bridge
 * @author DomePlug++ Team
 * @version 1.0.0
 *
 * @details Configuration is optional. When the `DPLUG_CONFIG` environment
 * variable names a TOML file it is read at load time:
 *
 * @code{.toml}
 * [plugin]
 * log_level = "debug"
 * lock_modules = true
 * report_errors_to_host = true
 * @endcode
 *
 * `DPLUG_LOG_LEVEL` overrides the log level from the file.
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"

namespace domeplug::core::plugin {
  /**
   * @struct PluginConfig
   * @brief Configuration settings for one loaded plugin library
   */
  struct PluginConfig {
    utils::logging::LogLevel logLevel           = utils::logging::LogLevel::Info; ///< Minimum level written to stderr
    bool                     lockModules        = true;                           ///< Lock registered modules unless a module opts out
    bool                     reportErrorsToHost = true;                           ///< Forward warnings and errors to the host log
  };

  /**
   * @brief Read configuration from a TOML file.
   * @return IoError if the file cannot be read, ParseError or
   *         ConfigurationError if its contents are invalid.
   */
  auto LoadPluginConfig(const std::filesystem::path& path) -> utils::types::Result<PluginConfig>;

  /**
   * @brief Apply `DPLUG_LOG_LEVEL`, if set, on top of cfg.
   * @return ConfigurationError for an unknown level name; cfg is left unchanged.
   */
  auto ApplyEnvOverrides(PluginConfig& cfg) -> utils::types::Result<>;

  /**
   * @brief Resolve configuration from the environment.
   *
   * Defaults apply when `DPLUG_CONFIG` is unset; `DPLUG_LOG_LEVEL` is applied last.
   */
  auto LoadPluginConfig() -> utils::types::Result<PluginConfig>;
} // namespace domeplug::core::plugin
