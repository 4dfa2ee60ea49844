#include "GridPhysics/ILog.h"
#include "GridPhysics/Pch.h"
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace GridPhysics {

class LogImpl : public ILog
{
public:
    void Init(const std::string &level) override
    {
        if (_logger)
        {
            SetLogLevel(level);
            return;
        }

        try
        {
            // Small queue, single background I/O thread. The simulation tick must never block on logging.
            spdlog::init_thread_pool(8192, 1);

            auto console_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
            // Rotating file sink: 5MB, keep 3 files
            auto file_sink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>("logs/gridphysics.log", 1024 * 1024 * 5, 3);

            std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};

            _logger = std::make_shared<spdlog::async_logger>(
                "gridphysics",
                sinks.begin(),
                sinks.end(),
                spdlog::thread_pool(),
                spdlog::async_overflow_policy::overrun_oldest
            );

            spdlog::register_logger(_logger);
            spdlog::set_default_logger(_logger);
            spdlog::set_pattern("[%H:%M:%S.%e] [%l] %v");

            SetLogLevel(level);

            _logger->set_error_handler(
                [](const std::string &msg)
                {
                    std::cerr << "[spdlog Error] " << msg << "\n";
                }
            );

            spdlog::flush_on(spdlog::level::err);
            spdlog::flush_every(std::chrono::seconds(5));

            LOG_INFO("Logger Initialized (Level: {})", level);
        } catch (const spdlog::spdlog_ex &e)
        {
            std::cerr << "Logger Init Failed: " << e.what() << std::endl;
            _logger.reset();
        }
    }

    void SetLogLevel(const std::string &level) override
    {
        spdlog::set_level(GetSpdLevel(level));
    }

    bool ShouldLog(Log::Level level) override
    {
        return _logger && _logger->should_log(ToSpdLevel(level));
    }

    void Write(Log::Level level, std::string_view message) noexcept override
    {
        if (_logger)
        {
            _logger->log(ToSpdLevel(level), message);
        }
    }

    void Info(const std::string &msg) override
    {
        Write(Log::Level::Info, msg);
    }
    void Warn(const std::string &msg) override
    {
        Write(Log::Level::Warn, msg);
    }
    void Error(const std::string &msg) override
    {
        Write(Log::Level::Error, msg);
    }
    void Debug(const std::string &msg) override
    {
        Write(Log::Level::Debug, msg);
    }

private:
    spdlog::level::level_enum ToSpdLevel(Log::Level level)
    {
        switch (level)
        {
        case Log::Level::Trace:
            return spdlog::level::trace;
        case Log::Level::Debug:
            return spdlog::level::debug;
        case Log::Level::Info:
            return spdlog::level::info;
        case Log::Level::Warn:
            return spdlog::level::warn;
        case Log::Level::Error:
            return spdlog::level::err;
        case Log::Level::Critical:
            return spdlog::level::critical;
        case Log::Level::Off:
            return spdlog::level::off;
        default:
            return spdlog::level::info;
        }
    }

    spdlog::level::level_enum GetSpdLevel(const std::string &level)
    {
        if (level == "trace")
            return spdlog::level::trace;
        if (level == "debug")
            return spdlog::level::debug;
        if (level == "info")
            return spdlog::level::info;
        if (level == "warn")
            return spdlog::level::warn;
        if (level == "err")
            return spdlog::level::err;
        if (level == "critical")
            return spdlog::level::critical;
        if (level == "off")
            return spdlog::level::off;
        return spdlog::level::info;
    }

    std::shared_ptr<spdlog::async_logger> _logger;
};

ILog &GetLog()
{
    static LogImpl instance;
    return instance;
}

} // namespace GridPhysics
