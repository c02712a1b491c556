/**
 * @file Log.cpp
 * @brief Log facade dispatch and the default stderr sink.
 *
 * Independent fits may run on several threads at once: the active sink and
 * the minimum level are atomics, and the default sink serializes its writes
 * so lines from concurrent optimizers never interleave.
 */
#include "lcca/core/Log.hpp"

#include <array>
#include <atomic>
#include <cstdio>
#include <mutex>

namespace lcca::core {

namespace {

constexpr std::array<const char *, 5> kLevelNames{"DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const std::scoped_lock lock(_mutex);
        std::fprintf(
            stderr,
            "[%s][%.*s] %.*s\n",
            kLevelNames[static_cast<usize>(level)],
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }

private:
    std::mutex _mutex;
};

StderrLogger           gDefaultLogger;
std::atomic<ILogger *> gActiveLogger{&gDefaultLogger};
std::atomic<LogLevel>  gMinLevel{LogLevel::kInfo};

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (!Log::enabled(level))
        return;
    gActiveLogger.load(std::memory_order_acquire)->write(level, tag, msg);
}

} // anonymous namespace

void Log::setLogger(ILogger *logger)
{
    gActiveLogger.store(logger ? logger : &gDefaultLogger, std::memory_order_release);
}

ILogger *Log::logger() { return gActiveLogger.load(std::memory_order_acquire); }

LogLevel Log::minLevel() { return gMinLevel.load(std::memory_order_relaxed); }

void Log::setMinLevel(LogLevel level) { gMinLevel.store(level, std::memory_order_relaxed); }

bool Log::enabled(LogLevel level) { return level >= gMinLevel.load(std::memory_order_relaxed); }

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

} // namespace lcca::core
