#pragma once

#include <fmt/format.h>
#include <string>
#include <string_view>

namespace GridPhysics {

namespace Log {
enum class Level
{
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};
} // namespace Log

class ILog
{
public:
    virtual ~ILog() = default;

    // level: "trace", "debug", "info", "warn", "err", "critical", "off"
    virtual void Init(const std::string &level) = 0;
    virtual void SetLogLevel(const std::string &level) = 0;
    virtual bool ShouldLog(Log::Level level) = 0;
    virtual void Write(Log::Level level, std::string_view message) noexcept = 0;

    virtual void Info(const std::string &msg) = 0;
    virtual void Warn(const std::string &msg) = 0;
    virtual void Error(const std::string &msg) = 0;
    virtual void Debug(const std::string &msg) = 0;
};

// Global Accessor
ILog &GetLog();

} // namespace GridPhysics

// Macros for easy access
#define LOG_INFO(fmtStr, ...) GridPhysics::GetLog().Info(fmt::format(fmtStr, __VA_ARGS__))
#define LOG_WARN(fmtStr, ...) GridPhysics::GetLog().Warn(fmt::format(fmtStr, __VA_ARGS__))
#define LOG_ERROR(fmtStr, ...) GridPhysics::GetLog().Error(fmt::format(fmtStr, __VA_ARGS__))
#define LOG_DEBUG(fmtStr, ...)                                                                                         \
    do                                                                                                                 \
    {                                                                                                                  \
        if (GridPhysics::GetLog().ShouldLog(GridPhysics::Log::Level::Debug))                                           \
            GridPhysics::GetLog().Debug(fmt::format(fmtStr, __VA_ARGS__));                                             \
    } while (0)
