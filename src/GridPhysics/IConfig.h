#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace GridPhysics {

struct GridConfig
{
    // Grid
    int worldSize = 100;
    int cellSize = 10;

    // Log ("trace", "debug", "info", "warn", "err", "critical", "off")
    std::string logLevel = "info";

    // Demo driver
    int tickCount = 60;
    int staticCount = 16;
    int dynamicEntityCount = 64;
    int shapesPerEntity = 3;
    float shapeRadius = 1.0f;
    uint64_t seed = 1234567890ULL;
};

class IConfig
{
public:
    virtual ~IConfig() = default;

    virtual bool Load(const std::string &filePath) = 0;
    virtual const GridConfig &GetConfig() const = 0;

    // Static Factory Method
    static std::shared_ptr<IConfig> Create();
};

} // namespace GridPhysics
