//! # simforge Logging
//!
//! Structured logging shared by the build pipeline, loader, and session.
//!
//! Every record carries a module tag naming the component that produced it:
//!
//! | Tag       | Producer                                        |
//! |-----------|-------------------------------------------------|
//! | `build`   | Callback synthesis and compilation              |
//! | `link`    | macOS install-name rewriting                    |
//! | `loader`  | dlopen, symbol lookup, function registry        |
//! | `cleanup` | Removal of generated files                      |
//! | `module`  | Extension module build attempts                 |
//! | `warning` | Simulation warning translation                  |
//! | `session` | Module activation and hook registration         |
//! | `process` | Subprocess launch and timeouts                  |
//!
//! Compiler output is usually multi-line. Text sinks indent continuation
//! lines under the record header; JSON sinks escape them, along with the
//! ANSI color sequences compilers emit.
//!
//! ## Usage
//!
//! ```cpp
//! SIMFORGE_LOG_INFO("build", "Compiling " << source << " -> " << artifact);
//! SIMFORGE_LOG_WARN("cleanup", "Error removing " << path << ", continuing anyway");
//! ```

#ifndef SIMFORGE_LOG_HPP
#define SIMFORGE_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace simforge::log {

// ============================================================================
// Levels and Records
// ============================================================================

enum class LogLevel : int {
    Trace = 0, ///< Symbol-by-symbol loader detail
    Debug = 1, ///< Compiler command lines and output
    Info = 2,  ///< Build and load milestones
    Warn = 3,  ///< Recoverable problems (cleanup errors, missing key)
    Error = 4, ///< Failed builds and loads
    Fatal = 5, ///< Exhausted module builds
    Off = 6
};

/// Upper-case name, e.g. "WARN".
const char* level_name(LogLevel level);

/// Case-insensitive; accepts "warning" for Warn. Unknown names give Info.
LogLevel parse_level(std::string_view name);

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms;
};

enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One object per line: ts, level, module, msg
};

std::string format_text(const LogRecord& record);

/// Single line, no trailing newline.
std::string format_json(const LogRecord& record);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Base for sinks that print records in either LogFormat.
class FormattedSink : public LogSink {
public:
    void set_format(LogFormat format) {
        format_ = format;
    }

    LogFormat format() const {
        return format_;
    }

protected:
    std::string render(const LogRecord& record) const {
        return format_ == LogFormat::JSON ? format_json(record) : format_text(record);
    }

    LogFormat format_ = LogFormat::Text;
};

/// Writes to stderr. Colors are used only on a terminal and when NO_COLOR
/// is unset.
class ConsoleSink : public FormattedSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_;
};

/// Appends to a file, creating its directory. Error and Fatal records are
/// flushed immediately so a crashed host still leaves the diagnostics.
class FileSink : public FormattedSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

class NullSink : public LogSink {
public:
    void write(const LogRecord&) override {}
    void flush() override {}
};

// ============================================================================
// Module Filter
// ============================================================================

/// Per-module minimum levels, e.g. "build=debug,cleanup,*=warn". A bare
/// module name means Trace; `*` sets the default.
class LogFilter {
public:
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level any record could pass with.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Empty: no per-module overrides
    std::string log_file;    ///< Empty: console only
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Until `init()` runs it prints Warn and above to
/// stderr.
class Logger {
public:
    /// Replaces all sinks and levels.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Checked by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void clear_sinks();

    /// Sets both the global gate and the filter default.
    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    /// Module overrides may lower the global gate, never raise it.
    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    void configure(const LogConfig& config);

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time
// ============================================================================

/// Local wall-clock time as "HH:MM:SS.mmm".
std::string get_timestamp();

inline int64_t epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Command Line
// ============================================================================

/// Reads --log-level=, --log-filter=, --log-file=, --log-format=,
/// -q/--quiet, --verbose and -v/-vv/-vvv. Without a level or filter on the
/// command line, SIMFORGE_LOG is used: a value containing '=' or ',' is a
/// filter, anything else a level.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Macros
// ============================================================================

// 0=Trace ... 5=Fatal, 6=Off. Levels below this compile to nothing.
#ifndef SIMFORGE_MIN_LOG_LEVEL
#define SIMFORGE_MIN_LOG_LEVEL 0
#endif

#define SIMFORGE_LOG_IMPL(level, module_str, msg)                                                  \
    do {                                                                                           \
        if constexpr (static_cast<int>(level) >= SIMFORGE_MIN_LOG_LEVEL) {                         \
            auto& simforge_logger_ = ::simforge::log::Logger::instance();                          \
            if (simforge_logger_.should_log(level, module_str)) {                                  \
                std::ostringstream simforge_oss_;                                                  \
                simforge_oss_ << msg;                                                              \
                simforge_logger_.log(level, module_str, simforge_oss_.str(), __FILE__, __LINE__);  \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define SIMFORGE_LOG_TRACE(module, msg) SIMFORGE_LOG_IMPL(::simforge::log::LogLevel::Trace, module, msg)
#define SIMFORGE_LOG_DEBUG(module, msg) SIMFORGE_LOG_IMPL(::simforge::log::LogLevel::Debug, module, msg)
#define SIMFORGE_LOG_INFO(module, msg) SIMFORGE_LOG_IMPL(::simforge::log::LogLevel::Info, module, msg)
#define SIMFORGE_LOG_WARN(module, msg) SIMFORGE_LOG_IMPL(::simforge::log::LogLevel::Warn, module, msg)
#define SIMFORGE_LOG_ERROR(module, msg) SIMFORGE_LOG_IMPL(::simforge::log::LogLevel::Error, module, msg)
#define SIMFORGE_LOG_FATAL(module, msg) SIMFORGE_LOG_IMPL(::simforge::log::LogLevel::Fatal, module, msg)

} // namespace simforge::log

#endif // SIMFORGE_LOG_HPP
