#pragma once

#include <atomic>     // std::atomic
#include <chrono>     // std::chrono::system_clock
#include <ctime>      // localtime_r/s, strftime, time_t, tm
#include <filesystem> // std::filesystem::path
#include <format>     // std::format
#include <mutex>      // std::mutex, std::lock_guard
#include <stack>      // std::stack for span tracking
#include <utility>    // std::forward

#ifdef __cpp_lib_print
  #include <print> // std::print
#else
  #include <iostream> // std::cerr
#endif

#include <source_location> // std::source_location

#include "Error.hpp"
#include "Types.hpp"

namespace domeplug::utils::logging {
  namespace types = ::domeplug::utils::types;

  inline auto GetLogMutex() -> std::mutex& {
    static std::mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @brief Writes to stderr. The host owns stdout.
   */
  inline auto WriteToConsole(const types::StringView text) -> void {
#ifdef __cpp_lib_print
    std::print(stderr, "{}", text);
#else
    std::cerr << text;
#endif
  }

  enum class LogColor : types::u8 {
    Black   = 0,
    Red     = 1,
    Green   = 2,
    Yellow  = 3,
    Blue    = 4,
    Magenta = 5,
    Cyan    = 6,
    White   = 7,
    Gray    = 8,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 9> COLOR_CODE_LITERALS = {
      "\033[38;5;0m", "\033[38;5;1m", "\033[38;5;2m", "\033[38;5;3m",
      "\033[38;5;4m", "\033[38;5;5m", "\033[38;5;6m", "\033[38;5;7m",
      "\033[38;5;8m",
    };
    // clang-format on

    static constexpr const char* RESET_CODE   = "\033[0m";
    static constexpr const char* BOLD_START   = "\033[1m";
    static constexpr const char* ITALIC_START = "\033[3m";
    static constexpr const char* DIM_START    = "\033[2m";

    // Tracing-style colors: TRACE=magenta, DEBUG=blue, INFO=green, WARN=yellow, ERROR=red
    static constexpr types::StringView TRACE_STYLED = "\033[1m\033[38;5;5mTRACE\033[0m";
    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;4mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S";
  };

  /**
   * @enum LogLevel
   * @brief Represents different log levels (tracing-style).
   */
  enum class LogLevel : types::u8 {
    Trace, // Most verbose - for tracing program flow
    Debug, // Debug information
    Info,  // General information
    Warn,  // Warnings
    Error, // Errors
  };

  inline auto RuntimeLogLevelStorage() -> std::atomic<LogLevel>& {
    static std::atomic<LogLevel> Level = LogLevel::Info;
    return Level;
  }

  /**
   * @brief Gets the current runtime log level.
   * @details Read from any thread; the audio thread logs too.
   */
  inline auto GetRuntimeLogLevel() -> LogLevel {
    return RuntimeLogLevelStorage().load(std::memory_order_relaxed);
  }

  /**
   * @brief Sets the runtime log level.
   */
  inline auto SetRuntimeLogLevel(const LogLevel level) -> void {
    RuntimeLogLevelStorage().store(level, std::memory_order_relaxed);
  }

  /**
   * @brief Optional mirror of warn/error records into the host's own log.
   *
   * Installed by the plugin runtime while a capability table is loaded and
   * cleared on unload. The sink receives the plain (unstyled) message and
   * decides itself whether the calling thread may reach the host.
   */
  using HostSink = types::Fn<void(LogLevel, types::StringView)>;

  inline auto HostSinkStorage() -> HostSink& {
    static HostSink Sink;
    return Sink;
  }

  /**
   * @brief Copy of the installed sink, taken under the log mutex.
   */
  inline auto GetHostSink() -> HostSink {
    const std::lock_guard lock(GetLogMutex());
    return HostSinkStorage();
  }

  inline auto SetHostSink(HostSink sink) -> void {
    const std::lock_guard lock(GetLogMutex());
    HostSinkStorage() = std::move(sink);
  }

  /**
   * @struct Style
   * @brief Options for text styling with ANSI codes.
   */
  struct Style {
    LogColor color  = LogColor::White;
    bool     bold   = false;
    bool     italic = false;
    bool     dim    = false;
  };

  inline auto Stylize(const types::StringView text, const Style& style) -> types::String {
    const bool hasStyle = style.bold || style.italic || style.dim || style.color != LogColor::White;

    if (!hasStyle)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 24);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.dim)
      result += LogLevelConst::DIM_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  constexpr auto GetLevelInfo() -> const types::Array<types::StringView, 5>& {
    static constexpr types::Array<types::StringView, 5> LEVEL_INFO_INSTANCE = {
      LogLevelConst::TRACE_STYLED,
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::WARN_STYLED,
      LogLevelConst::ERROR_STYLED,
    };
    return LEVEL_INFO_INSTANCE;
  }

  /**
   * @brief Returns a ISO8601-like timestamp string (YYYY-MM-DDTHH:MM:SS).
   */
  inline auto GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                   LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 20> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (
#ifdef _WIN32
        localtime_s(&localTm, &timeT) == 0
#else
        localtime_r(&timeT, &localTm) != nullptr
#endif
      ) {
        if (std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
          std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());
      } else
        std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 19 };
  }

  inline auto GetSpanStack() -> std::stack<types::String>& {
    thread_local std::stack<types::String> SpanStackInstance;
    return SpanStackInstance;
  }

  /**
   * @class SpanGuard
   * @brief RAII guard that enters a span on construction and exits on destruction.
   */
  class SpanGuard {
   public:
    explicit SpanGuard(types::String name) {
      GetSpanStack().push(std::move(name));
    }

    ~SpanGuard() {
      if (!GetSpanStack().empty())
        GetSpanStack().pop();
    }

    SpanGuard(const SpanGuard&)                    = delete;
    SpanGuard(SpanGuard&&)                         = delete;
    auto operator=(const SpanGuard&) -> SpanGuard& = delete;
    auto operator=(SpanGuard&&) -> SpanGuard&      = delete;
  };

  /**
   * @brief Extracts a target string from a function name (converts to module-like path).
   * @details Converts "auto domeplug::core::Load(...)" to "domeplug::core"
   */
  inline auto ExtractTarget(const char* funcName) -> types::String {
    types::StringView func(funcName);

    auto parenPos = func.rfind('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    auto lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    auto         spacePos = func.rfind(' ', lastColonPos);
    types::usize startPos = (spacePos != types::StringView::npos) ? spacePos + 1 : 0;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  /**
   * @brief Core logging implementation.
   *
   * Compact format: timestamp LEVEL [file:line] target: message [in span]
   */
  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    std::format_string<Args...> fmt,
    Args&&... args
  ) -> void {
    using namespace std::chrono;
    using std::filesystem::path;

    if (level < GetRuntimeLogLevel())
      return;

    const std::time_t       nowTt     = system_clock::to_time_t(system_clock::now());
    const types::StringView timestamp = GetCachedTimestamp(nowTt);
    const types::String     message   = std::format(fmt, std::forward<Args>(args)...);

    types::String line;
    line.reserve(message.size() + 96);

    line += Stylize(timestamp, { .color = LogColor::Gray, .dim = true });
    line += ' ';
    line += GetLevelInfo().at(static_cast<types::usize>(level));
    line += ' ';
#ifndef NDEBUG
    line += Stylize(std::format("{}:{}", path(loc.file_name()).filename().string(), loc.line()), { .color = LogColor::Gray, .italic = true });
    line += ' ';
#endif
    line += Stylize(target, { .bold = true });
    line += ": ";
    line += message;

    if (const auto& spans = GetSpanStack(); !spans.empty()) {
      line += Stylize(" in ", { .color = LogColor::Gray, .italic = true });
      line += Stylize(spans.top(), { .color = LogColor::Gray, .bold = true });
    }

    line += '\n';

    {
      const std::lock_guard lock(GetLogMutex());
      WriteToConsole(line);
    }

    if (level >= LogLevel::Warn)
      if (const HostSink sink = GetHostSink())
        sink(level, message);
  }

  /**
   * @brief Log an error object at the specified level, at the error's own location.
   */
  template <typename ErrorType>
  auto LogError(
    const LogLevel          level,
    const types::StringView target,
    const ErrorType&        error_obj
  ) -> void {
    using DecayedErrorType = std::decay_t<ErrorType>;

    if constexpr (std::is_same_v<DecayedErrorType, error::DplugError>)
      LogImpl(level, error_obj.location, target, "{}", error_obj.toString());
    else if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
      LogImpl(level, std::source_location::current(), target, "{}", error_obj.what());
    else
      LogImpl(level, std::source_location::current(), target, "{}", "Unknown error type logged");
  }
} // namespace domeplug::utils::logging

// Helper to extract target from current function
#define DPLUG_LOG_TARGET ::domeplug::utils::logging::ExtractTarget(__FUNCTION__)

#define DPLUG_SPAN_CONCAT_IMPL(a, b) a##b
#define DPLUG_SPAN_CONCAT(a, b)      DPLUG_SPAN_CONCAT_IMPL(a, b)

// Span macro - creates an RAII span guard for the rest of the scope
#define span_enter(name) \
  const ::domeplug::utils::logging::SpanGuard DPLUG_SPAN_CONCAT(_dplug_span_, __LINE__)(name)

#define DPLUG_LOG_AT(level, fmt, ...)           \
  ::domeplug::utils::logging::LogImpl(          \
    ::domeplug::utils::logging::LogLevel::level, \
    std::source_location::current(),            \
    DPLUG_LOG_TARGET,                           \
    fmt __VA_OPT__(, ) __VA_ARGS__                \
  )

#define trace_log(fmt, ...) DPLUG_LOG_AT(Trace, fmt __VA_OPT__(, ) __VA_ARGS__)
#define debug_log(fmt, ...) DPLUG_LOG_AT(Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log(fmt, ...)  DPLUG_LOG_AT(Info, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log(fmt, ...)  DPLUG_LOG_AT(Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log(fmt, ...) DPLUG_LOG_AT(Error, fmt __VA_OPT__(, ) __VA_ARGS__)

// Error object logging macros
#define warn_at(error_obj) \
  ::domeplug::utils::logging::LogError(::domeplug::utils::logging::LogLevel::Warn, DPLUG_LOG_TARGET, error_obj)

#define error_at(error_obj) \
  ::domeplug::utils::logging::LogError(::domeplug::utils::logging::LogLevel::Error, DPLUG_LOG_TARGET, error_obj)
