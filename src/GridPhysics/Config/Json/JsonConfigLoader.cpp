#include "GridPhysics/Config/Json/JsonConfigLoader.h"
#include "GridPhysics/ILog.h"
#include "GridPhysics/Pch.h"
#include <fstream>

namespace GridPhysics {

std::shared_ptr<IConfig> IConfig::Create()
{
    return std::make_shared<JsonConfigLoader>();
}

bool JsonConfigLoader::Load(const std::string &filePath)
{
    try
    {
        std::ifstream file(filePath);
        if (!file.is_open())
        {
            LOG_ERROR("Failed to open config file: {}", filePath);
            return false;
        }

        nlohmann::json j;
        file >> j;

        // Missing keys keep their defaults. Accept both snake_case and camelCase.
        if (j.contains("grid"))
        {
            auto &grid = j["grid"];
            _config.worldSize = grid.value("world_size", grid.value("worldSize", _config.worldSize));
            _config.cellSize = grid.value("cell_size", grid.value("cellSize", _config.cellSize));
        }

        if (j.contains("log"))
        {
            auto &log = j["log"];
            _config.logLevel = log.value("level", _config.logLevel);
        }

        if (j.contains("demo"))
        {
            auto &demo = j["demo"];
            _config.tickCount = demo.value("ticks", demo.value("tickCount", _config.tickCount));
            _config.staticCount = demo.value("static_count", demo.value("staticCount", _config.staticCount));
            _config.dynamicEntityCount =
                demo.value("dynamic_entities", demo.value("dynamicEntityCount", _config.dynamicEntityCount));
            _config.shapesPerEntity =
                demo.value("shapes_per_entity", demo.value("shapesPerEntity", _config.shapesPerEntity));
            _config.shapeRadius = demo.value("shape_radius", demo.value("shapeRadius", _config.shapeRadius));
            _config.seed = demo.value("seed", _config.seed);
        }

        LOG_INFO(
            "Config loaded. World: {}, Cell: {}, Ticks: {}, Dynamic Entities: {}",
            _config.worldSize,
            _config.cellSize,
            _config.tickCount,
            _config.dynamicEntityCount
        );
        return true;
    } catch (const nlohmann::json::exception &e)
    {
        LOG_ERROR("Exception loading config: {}", e.what());
        return false;
    }
}

const GridConfig &JsonConfigLoader::GetConfig() const
{
    return _config;
}

} // namespace GridPhysics
