//! # Logger Implementation
//!
//! Record formatting, the console and file sinks, module filtering, and the
//! Logger singleton.

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

#include <unistd.h>

namespace simforge::log {

// ============================================================================
// Levels
// ============================================================================

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

LogLevel parse_level(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "fatal")
        return LogLevel::Fatal;
    if (lower == "off")
        return LogLevel::Off;
    return LogLevel::Info;
}

std::string get_timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t seconds = system_clock::to_time_t(now);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min,
                  local.tm_sec, static_cast<int>(millis));
    return buf;
}

// ============================================================================
// Formatting
// ============================================================================

namespace {

/// "HH:MM:SS.mmm LEVEL [module] ", with the level optionally colored.
std::string header(const LogRecord& record, const char* color) {
    std::ostringstream oss;
    oss << get_timestamp() << ' ';
    if (color) {
        oss << color;
    }
    oss << std::left << std::setw(5) << level_name(record.level);
    if (color) {
        oss << "\033[0m";
    }
    oss << " [" << record.module << "] ";
    return oss.str();
}

/// Appends the message, indenting every line after the first under the
/// header so multi-line compiler output stays readable.
void append_indented(std::string& out, const std::string& message) {
    size_t start = 0;
    while (true) {
        size_t nl = message.find('\n', start);
        out.append(message, start, nl == std::string::npos ? std::string::npos : nl - start);
        if (nl == std::string::npos || nl + 1 == message.size())
            break;
        out += "\n    | ";
        start = nl + 1;
    }
}

void append_json_string(std::string& out, std::string_view text) {
    out += '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                // ESC from colored compiler diagnostics, among others
                char esc[8];
                std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned char>(c));
                out += esc;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

const char* level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        break;
    }
    return nullptr;
}

bool stderr_supports_color() {
    if (std::getenv("NO_COLOR"))
        return false;
    if (!isatty(fileno(stderr)))
        return false;
    const char* term = std::getenv("TERM");
    return term && std::string_view(term) != "dumb";
}

} // namespace

std::string format_text(const LogRecord& record) {
    std::string out = header(record, nullptr);
    append_indented(out, record.message);
    return out;
}

std::string format_json(const LogRecord& record) {
    std::string out = "{\"ts\":" + std::to_string(record.timestamp_ms) + ",\"level\":";
    append_json_string(out, level_name(record.level));
    out += ",\"module\":";
    append_json_string(out, record.module);
    out += ",\"msg\":";
    append_json_string(out, record.message);
    out += '}';
    return out;
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : colors_(use_colors && stderr_supports_color()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::string line;
    if (format_ == LogFormat::Text && colors_) {
        line = header(record, level_color(record.level));
        append_indented(line, record.message);
    } else {
        line = render(record);
    }
    line += '\n';
    std::cerr << line;
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

namespace {

std::ofstream open_log_file(const std::string& path, bool append) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    return std::ofstream(path, append ? (std::ios::out | std::ios::app) : std::ios::out);
}

} // namespace

FileSink::FileSink(const std::string& path, bool append) : file_(open_log_file(path, append)) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << render(record) << '\n';
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

} // namespace

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        std::string_view entry = trim(spec.substr(0, comma));
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

        if (entry.empty())
            continue;

        size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            module_levels_[std::string(entry)] = LogLevel::Trace;
            continue;
        }

        std::string_view module = trim(entry.substr(0, eq));
        LogLevel level = parse_level(trim(entry.substr(eq + 1)));
        if (module == "*") {
            default_level_ = level;
        } else {
            module_levels_[std::string(module)] = level;
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    LogLevel threshold = it != module_levels_.end() ? it->second : default_level_;
    return level >= threshold;
}

LogLevel LogFilter::min_level() const {
    LogLevel lowest = default_level_;
    for (const auto& entry : module_levels_) {
        if (entry.second < lowest)
            lowest = entry.second;
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.configure(config);
}

void Logger::configure(const LogConfig& config) {
    sinks_.clear();

    filter_ = LogFilter{};
    filter_.set_default_level(config.level);
    level_ = config.level;
    if (!config.filter_spec.empty()) {
        filter_.parse(config.filter_spec);
        // "*=" in the filter can only lower the default set by the level
        if (config.level < filter_.default_level()) {
            filter_.set_default_level(config.level);
        }
        level_ = filter_.min_level();
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    return level >= level_ && filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = std::min(level_, filter_.min_level());
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace simforge::log
