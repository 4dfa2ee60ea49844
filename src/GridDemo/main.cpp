#include "GridPhysics/Collision/GridError.h"
#include "GridPhysics/Collision/SpatialGrid.h"
#include "GridPhysics/Config/Json/JsonConfigLoader.h"
#include "GridPhysics/ILog.h"
#include "GridPhysics/Metrics/IMetrics.h"
#include "GridPhysics/Pch.h"
#include "GridPhysics/Utility/FastRandom.h"
#include <iostream>
#include <string>

using namespace GridPhysics;

namespace {

// Multi-circle body: a short chain of circles along +x
std::vector<Point> MakeChain(Point head, int count, float radius)
{
    std::vector<Point> positions;
    positions.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i)
    {
        positions.push_back(head + Point(radius * static_cast<float>(i), 0.0f));
    }
    return positions;
}

void RunTicks(SpatialGrid &grid, const GridConfig &cfg)
{
    Utility::FastRandom rng(cfg.seed);
    float world = static_cast<float>(cfg.worldSize);
    float margin = cfg.shapeRadius * static_cast<float>(cfg.shapesPerEntity);

    // [1] Static obstacles (entity ids start after the dynamic ones)
    EntityId staticBase = static_cast<EntityId>(cfg.dynamicEntityCount);
    for (int i = 0; i < cfg.staticCount; ++i)
    {
        grid.AddStatic(staticBase + static_cast<EntityId>(i), rng.NextPoint(0.0f, world), cfg.shapeRadius * 2.0f);
    }
    LOG_INFO("Placed {} static obstacles", grid.GetStaticShapeCount());

    float totalSec = 0.0f;
    float maxSec = 0.0f;
    size_t totalOverlaps = 0;

    for (int tick = 0; tick < cfg.tickCount; ++tick)
    {
        auto startPerf = std::chrono::high_resolution_clock::now();

        // [2] Clear dynamic state, statics stay bucketed
        grid.ResetDynamic();

        // [3] Populate
        for (int e = 0; e < cfg.dynamicEntityCount; ++e)
        {
            Point head = rng.NextPoint(0.0f, world - margin);
            grid.AddDynamicBatch(
                static_cast<EntityId>(e), MakeChain(head, cfg.shapesPerEntity, cfg.shapeRadius), cfg.shapeRadius
            );
        }

        // [4] Query
        OverlapSet overlaps = grid.QueryOverlaps();

        auto endPerf = std::chrono::high_resolution_clock::now();
        std::chrono::duration<float> duration = endPerf - startPerf;
        float elapsedSec = duration.count();

        totalSec += elapsedSec;
        if (elapsedSec > maxSec)
            maxSec = elapsedSec;
        totalOverlaps += overlaps.size();

        LOG_DEBUG("[Tick {}] shapes: {}, overlaps: {}", tick, grid.GetDynamicShapeCount(), overlaps.size());
    }

    if (cfg.tickCount > 0)
    {
        LOG_INFO(
            "[Perf] {} ticks: Avg {:.4f}ms, Max {:.4f}ms | Avg overlaps/tick: {}",
            cfg.tickCount,
            totalSec * 1000.0f / static_cast<float>(cfg.tickCount),
            maxSec * 1000.0f,
            totalOverlaps / static_cast<size_t>(cfg.tickCount)
        );
    }

    // Coarse query around the world centre
    EntitySet nearby = grid.QueryArea(Point(world * 0.5f, world * 0.5f), static_cast<float>(cfg.cellSize));
    LOG_INFO("Entities near centre: {}", nearby.size());
}

} // namespace

int main(int argc, char *argv[])
{
    std::string configPath = argc > 1 ? argv[1] : "config/grid_config.json";

    // 1. Init Logger
    GetLog().Init("info");

    // 2. Load Config (defaults apply if the file is missing)
    auto config = std::make_shared<JsonConfigLoader>();
    if (!config->Load(configPath))
    {
        LOG_WARN("Failed to load {}, running with defaults", configPath);
    }
    const GridConfig &cfg = config->GetConfig();
    GetLog().SetLogLevel(cfg.logLevel);

    try
    {
        SpatialGrid grid(cfg.worldSize, cfg.cellSize);
        LOG_INFO("Grid ready: {}x{} cells of {}", grid.GetGridSize(), grid.GetGridSize(), grid.GetCellSize());

        RunTicks(grid, cfg);
    } catch (const GridConfigError &e)
    {
        LOG_ERROR("Invalid grid configuration: {}", e.what());
        spdlog::shutdown();
        return 1;
    }

    GetMetrics().LogMetrics();
    LOG_INFO("Metrics: {}", GetMetrics().ToJson());

    spdlog::shutdown();
    return 0;
}
