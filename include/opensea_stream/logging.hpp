#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "opensea_stream/errors.hpp"

namespace opensea_stream {

/**
 * @brief Log levels in order of severity
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a level name as written in configuration ("debug", "WARN", ...)
 * @return INFO when the name is not recognised
 */
inline LogLevel parse_log_level(std::string_view name) noexcept {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>((c >= 'a' && c <= 'z') ? c - 'a' + 'A' : c));
    }
    for (int i = static_cast<int>(LogLevel::TRACE); i <= static_cast<int>(LogLevel::OFF); ++i) {
        if (to_string(static_cast<LogLevel>(i)) == upper) {
            return static_cast<LogLevel>(i);
        }
    }
    if (upper == "WARNING") {
        return LogLevel::WARN;
    }
    return LogLevel::INFO;
}

/**
 * @brief One record handed to every sink of a logger
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string logger_name;
    std::thread::id thread_id;
    std::string_view file_name;
    std::string_view function_name;
    int line_number;

    LogEntry(LogLevel lvl, std::string msg, std::string_view logger,
             const char* file = "", const char* func = "", int line = 0)
        : timestamp(std::chrono::system_clock::now())
        , level(lvl)
        , message(std::move(msg))
        , logger_name(logger)
        , thread_id(std::this_thread::get_id())
        , file_name(file)
        , function_name(func)
        , line_number(line) {}
};

namespace detail {

inline std::string_view base_name(std::string_view path) noexcept {
    auto pos = path.find_last_of("/\\");
    return pos != std::string_view::npos ? path.substr(pos + 1) : path;
}

inline void write_timestamp(std::ostream& os, std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif
    os << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
}

} // namespace detail

/**
 * @brief Interface for log output destinations
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Console output sink; errors go to stderr, everything else to stdout
 */
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true) : use_colors_(use_colors) {}

    void write(const LogEntry& entry) override {
        std::ostringstream oss;
        detail::write_timestamp(oss, entry.timestamp);

        if (use_colors_) {
            oss << colorCode(entry.level);
        }
        oss << "[" << to_string(entry.level) << "] ";
        oss << "[" << entry.logger_name << "] ";
        oss << entry.message;

        if (entry.line_number > 0 && entry.level <= LogLevel::DEBUG) {
            oss << " (" << detail::base_name(entry.file_name) << ":" << entry.line_number << ")";
        }
        if (use_colors_) {
            oss << "\033[0m";
        }
        oss << "\n";

        std::lock_guard<std::mutex> lock(mutex_);
        if (entry.level >= LogLevel::ERROR) {
            std::cerr << oss.str();
        } else {
            std::cout << oss.str();
        }
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
    }

private:
    bool use_colors_;
    std::mutex mutex_;

    static const char* colorCode(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::TRACE: return "\033[37m";
            case LogLevel::DEBUG: return "\033[36m";
            case LogLevel::INFO:  return "\033[32m";
            case LogLevel::WARN:  return "\033[33m";
            case LogLevel::ERROR: return "\033[31m";
            case LogLevel::FATAL: return "\033[35m";
            default: return "";
        }
    }
};

/**
 * @brief Append-only file sink, rotated to "<file>.1" once it grows past max_size
 */
class FileSink : public LogSink {
public:
    explicit FileSink(std::string filename, std::size_t max_size = 10 * 1024 * 1024)
        : filename_(std::move(filename)), max_size_(max_size) {
        openFile();
    }

    void write(const LogEntry& entry) override {
        std::ostringstream oss;
        detail::write_timestamp(oss, entry.timestamp);
        oss << "[" << to_string(entry.level) << "] "
            << "[" << entry.logger_name << "] "
            << "[" << entry.thread_id << "] "
            << entry.message;
        if (entry.line_number > 0) {
            oss << " (" << detail::base_name(entry.file_name) << ":" << entry.line_number << ")";
        }
        oss << "\n";
        const std::string line = oss.str();

        std::lock_guard<std::mutex> lock(mutex_);
        if (!file_.is_open()) {
            openFile();
        }
        file_ << line;
        current_size_ += line.size();

        if (current_size_ > max_size_) {
            rotateFile();
        }
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.flush();
        }
    }

    const std::string& filename() const noexcept { return filename_; }

private:
    std::string filename_;
    std::size_t max_size_;
    std::size_t current_size_{0};
    std::ofstream file_;
    std::mutex mutex_;

    void openFile() {
        file_.open(filename_, std::ios::app);
        if (file_.is_open()) {
            file_.seekp(0, std::ios::end);
            current_size_ = static_cast<std::size_t>(file_.tellp());
        }
    }

    void rotateFile() {
        file_.close();
        std::string backup = filename_ + ".1";
        std::rename(filename_.c_str(), backup.c_str());
        current_size_ = 0;
        openFile();
    }
};

/**
 * @brief Named logger fanning entries out to its sinks
 *
 * Messages use "{}" placeholders, filled left to right with operator<<.
 */
class Logger {
public:
    explicit Logger(std::string name) : name_(std::move(name)) {}

    const std::string& name() const noexcept { return name_; }

    void setLevel(LogLevel level) noexcept {
        level_.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] LogLevel getLevel() const noexcept {
        return level_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool isEnabled(LogLevel level) const noexcept {
        return level >= level_.load(std::memory_order_relaxed) && level != LogLevel::OFF;
    }

    void addSink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.push_back(std::move(sink));
    }

    void removeSinks() {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.clear();
    }

    template<typename... Args>
    void logAt(LogLevel level, const char* file, const char* func, int line,
               std::string_view format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        LogEntry entry(level, formatMessage(format, std::forward<Args>(args)...), name_, file, func, line);

        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (auto& sink : sinks_) {
            if (sink) {
                sink->write(entry);
            }
        }
    }

    template<typename... Args>
    void log(LogLevel level, std::string_view format, Args&&... args) {
        logAt(level, "", "", 0, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void trace(std::string_view format, Args&&... args) {
        log(LogLevel::TRACE, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(std::string_view format, Args&&... args) {
        log(LogLevel::FATAL, format, std::forward<Args>(args)...);
    }

    void flush() {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (auto& sink : sinks_) {
            if (sink) {
                sink->flush();
            }
        }
    }

private:
    std::string name_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex sinks_mutex_;

    template<typename... Args>
    static std::string formatMessage(std::string_view format, Args&&... args) {
        if constexpr (sizeof...(args) == 0) {
            return std::string(format);
        } else {
            std::ostringstream oss;
            formatImpl(oss, format, std::forward<Args>(args)...);
            return oss.str();
        }
    }

    template<typename T, typename... Args>
    static void formatImpl(std::ostringstream& oss, std::string_view format, T&& value, Args&&... args) {
        auto pos = format.find("{}");
        if (pos == std::string_view::npos) {
            oss << format;
            return;
        }
        oss << format.substr(0, pos) << value;
        if constexpr (sizeof...(args) > 0) {
            formatImpl(oss, format.substr(pos + 2), std::forward<Args>(args)...);
        } else {
            oss << format.substr(pos + 2);
        }
    }
};

/**
 * @brief Process-wide registry of named loggers
 *
 * New loggers inherit the default level and the default sinks. A console sink is
 * installed on first use.
 */
class LoggerFactory {
public:
    static LoggerFactory& instance() {
        static LoggerFactory factory;
        return factory;
    }

    std::shared_ptr<Logger> getLogger(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = loggers_.find(name);
        if (it != loggers_.end()) {
            if (auto logger = it->second.lock()) {
                return logger;
            }
            loggers_.erase(it);
        }

        auto logger = std::make_shared<Logger>(name);
        loggers_[name] = logger;

        logger->setLevel(default_level_);
        for (auto& sink : default_sinks_) {
            logger->addSink(sink);
        }
        return logger;
    }

    LogLevel getDefaultLevel() {
        std::lock_guard<std::mutex> lock(mutex_);
        return default_level_;
    }

    void setDefaultLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_level_ = level;
        for (auto& [name, weak_logger] : loggers_) {
            if (auto logger = weak_logger.lock()) {
                logger->setLevel(level);
            }
        }
    }

    void addDefaultSink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_sinks_.push_back(sink);
        for (auto& [name, weak_logger] : loggers_) {
            if (auto logger = weak_logger.lock()) {
                logger->addSink(sink);
            }
        }
    }

    /**
     * @brief Drop every default sink, from the registry and from live loggers
     */
    void clearDefaultSinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        default_sinks_.clear();
        for (auto& [name, weak_logger] : loggers_) {
            if (auto logger = weak_logger.lock()) {
                logger->removeSinks();
            }
        }
    }

    void configureConsoleLogging(bool enabled = true, bool colors = true) {
        if (enabled) {
            addDefaultSink(std::make_shared<ConsoleSink>(colors));
        }
    }

    void configureFileLogging(const std::string& filename, std::size_t max_size = 10 * 1024 * 1024) {
        addDefaultSink(std::make_shared<FileSink>(filename, max_size));
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, weak_logger] : loggers_) {
            if (auto logger = weak_logger.lock()) {
                logger->flush();
            }
        }
        loggers_.clear();
        default_sinks_.clear();
    }

private:
    std::unordered_map<std::string, std::weak_ptr<Logger>> loggers_;
    std::vector<std::shared_ptr<LogSink>> default_sinks_;
    LogLevel default_level_{LogLevel::INFO};
    std::mutex mutex_;

    LoggerFactory() {
        default_sinks_.push_back(std::make_shared<ConsoleSink>());
    }
};

#define OPENSEA_LOG_AT(logger, level, ...) \
    (logger)->logAt((level), __FILE__, __func__, __LINE__, __VA_ARGS__)

#define OPENSEA_LOG_TRACE(logger, ...) OPENSEA_LOG_AT(logger, ::opensea_stream::LogLevel::TRACE, __VA_ARGS__)
#define OPENSEA_LOG_DEBUG(logger, ...) OPENSEA_LOG_AT(logger, ::opensea_stream::LogLevel::DEBUG, __VA_ARGS__)
#define OPENSEA_LOG_INFO(logger, ...)  OPENSEA_LOG_AT(logger, ::opensea_stream::LogLevel::INFO, __VA_ARGS__)
#define OPENSEA_LOG_WARN(logger, ...)  OPENSEA_LOG_AT(logger, ::opensea_stream::LogLevel::WARN, __VA_ARGS__)
#define OPENSEA_LOG_ERROR(logger, ...) OPENSEA_LOG_AT(logger, ::opensea_stream::LogLevel::ERROR, __VA_ARGS__)
#define OPENSEA_LOG_FATAL(logger, ...) OPENSEA_LOG_AT(logger, ::opensea_stream::LogLevel::FATAL, __VA_ARGS__)

#define OPENSEA_LOGGER(name) ::opensea_stream::LoggerFactory::instance().getLogger(name)

/**
 * @brief Value-or-error return for operations that report failure without throwing
 */
template<typename T, typename E = StreamException>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result error(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool isSuccess() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool isError() const noexcept { return storage_.index() == 1; }

    [[nodiscard]] const T& value() const {
        if (!isSuccess()) {
            throw std::logic_error("Attempting to access value of error result");
        }
        return std::get<0>(storage_);
    }

    [[nodiscard]] T& value() {
        if (!isSuccess()) {
            throw std::logic_error("Attempting to access value of error result");
        }
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& error() const {
        if (isSuccess()) {
            throw std::logic_error("Attempting to access error of success result");
        }
        return std::get<1>(storage_);
    }

    [[nodiscard]] T valueOr(T defaultValue) const {
        return isSuccess() ? std::get<0>(storage_) : std::move(defaultValue);
    }

    template<typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        using Mapped = Result<std::invoke_result_t<F, const T&>, E>;
        if (isSuccess()) {
            return Mapped::success(func(std::get<0>(storage_)));
        }
        return Mapped::error(std::get<1>(storage_));
    }

    template<typename F>
    const Result& onError(F&& func) const {
        if (isError()) {
            func(std::get<1>(storage_));
        }
        return *this;
    }

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : storage_(tag, std::forward<V>(v)) {}

    std::variant<T, E> storage_;
};

} // namespace opensea_stream
