#include "GridPhysics/Metrics/MetricsCollector.h"
#include "GridPhysics/ILog.h"
#include "GridPhysics/Pch.h"

namespace GridPhysics {

std::shared_ptr<Counter> MetricsCollector::GetCounter(const std::string &name)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto &slot = _registry[name];
    if (!slot)
    {
        slot = std::make_shared<CounterImpl>();
    }
    return std::dynamic_pointer_cast<Counter>(slot);
}

std::shared_ptr<Gauge> MetricsCollector::GetGauge(const std::string &name)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto &slot = _registry[name];
    if (!slot)
    {
        slot = std::make_shared<GaugeImpl>();
    }
    return std::dynamic_pointer_cast<Gauge>(slot);
}

void MetricsCollector::LogMetrics()
{
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto &[name, metric] : _registry)
    {
        if (auto counter = std::dynamic_pointer_cast<Counter>(metric))
        {
            LOG_INFO("[Metrics] {}: {}", name, counter->GetValue());
        }
        else if (auto gauge = std::dynamic_pointer_cast<Gauge>(metric))
        {
            LOG_INFO("[Metrics] {}: {}", name, gauge->GetValue());
        }
    }
}

std::string MetricsCollector::ToJson()
{
    nlohmann::json j = nlohmann::json::object();

    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto &[name, metric] : _registry)
    {
        if (auto counter = std::dynamic_pointer_cast<Counter>(metric))
        {
            j[name] = counter->GetValue();
        }
        else if (auto gauge = std::dynamic_pointer_cast<Gauge>(metric))
        {
            j[name] = gauge->GetValue();
        }
    }
    return j.dump();
}

IMetrics &GetMetrics()
{
    static MetricsCollector instance;
    return instance;
}

} // namespace GridPhysics
