#pragma once
#include "GridPhysics/Collision/Overlap.h"
#include "GridPhysics/Collision/Shape.h"
#include "GridPhysics/Math/Point.h"
#include "GridPhysics/Metrics/IMetrics.h"
#include <algorithm>
#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

namespace GridPhysics {

/**
 * @brief Uniform broad-phase grid over a square world [0, worldSize)^2
 *
 * Every cell holds copies of the shapes whose bounding box touches it. A shape that
 * spans several cells is stored once per cell. Dynamic shapes are also kept per entity;
 * that registry (not the cells) drives QueryOverlaps().
 *
 * Typical tick:
 *   grid.ResetDynamic();           // statics stay
 *   grid.AddDynamicBatch(...);     // every moving body
 *   auto overlaps = grid.QueryOverlaps();
 *
 * Not thread-safe. A host that touches the grid from several threads must hold it
 * exclusively for the whole reset -> insert -> query phase.
 */
class SpatialGrid
{
public:
    // Inclusive cell coordinates. May lie outside [0, gridSize); such cells are skipped.
    struct CellRange
    {
        int lowX = 0;
        int highX = 0;
        int lowY = 0;
        int highY = 0;
    };

    /**
     * @throws GridConfigError if worldSize or cellSize is not positive,
     *         or cellSize does not divide worldSize evenly
     */
    SpatialGrid(int worldSize, int cellSize, IMetrics &metrics = GetMetrics());

    // Drops everything, static shapes included.
    void Reset();

    // Drops dynamic shapes only. Static shapes are re-bucketed from the static list.
    void ResetDynamic();

    /**
     * @brief World-space box -> cell range
     *
     * Lower edges use floor, upper edges use ceil. An edge lying exactly on a cell border
     * therefore covers the cells on both sides of it.
     */
    CellRange GetCellRange(const Bounds &bounds) const;

    /**
     * @brief Buckets one circle into every in-grid cell its bounding box covers.
     *
     * Out-of-grid cells are skipped without error, so a shape hanging off the world is
     * only partially indexed (and fully invisible if it lies entirely outside).
     */
    void Insert(EntityId entityId, Point pos, float radius, ShapeIndex shapeIndex, bool isStatic);

    void AddStatic(EntityId entityId, Point pos, float radius);
    // shapeIndex = position inside `positions`
    void AddStaticBatch(EntityId entityId, const std::vector<Point> &positions, float radius);

    void AddDynamic(EntityId entityId, Point pos, float radius);
    // shapeIndex = position inside `positions`
    void AddDynamicBatch(EntityId entityId, const std::vector<Point> &positions, float radius);

    /**
     * @brief All directional overlaps found from the dynamic shapes' side.
     *
     * A pair found again through a second shared cell collapses into the same set entry.
     * Two dynamic shapes that touch produce both (A, B) and (B, A).
     */
    OverlapSet QueryOverlaps() const;

    /**
     * @brief Entities with any shape bucketed in the cells covered by the circle's box.
     *
     * Coarse: membership is by cell only, there is no distance test against the circle.
     * May report entities that do not actually touch it. Includes static entities.
     */
    EntitySet QueryArea(Point center, float radius) const;

    int GetWorldSize() const
    {
        return _worldSize;
    }
    int GetCellSize() const
    {
        return _cellSize;
    }
    int GetGridSize() const
    {
        return _gridSize;
    }
    size_t GetStaticShapeCount() const
    {
        return _staticShapes.size();
    }
    size_t GetDynamicShapeCount() const
    {
        return _dynamicShapeCount;
    }
    size_t GetDynamicEntityCount() const
    {
        return _dynamicShapes.size();
    }

    // 0 for out-of-grid coordinates
    size_t GetCellShapeCount(int cx, int cy) const;

private:
    struct Cell
    {
        std::vector<Shape> shapes;
    };

    bool IsValidCell(int cx, int cy) const
    {
        return cx >= 0 && cx < _gridSize && cy >= 0 && cy < _gridSize;
    }

    size_t GetIndex(int cx, int cy) const
    {
        return static_cast<size_t>(cx) * static_cast<size_t>(_gridSize) + static_cast<size_t>(cy);
    }

    // Calls fn(cellIndex) for every in-grid cell of range, stepping one cell at a time.
    template <typename Fn> void ForEachCell(const CellRange &range, Fn &&fn) const
    {
        int lowX = std::max(range.lowX, 0);
        int highX = std::min(range.highX, _gridSize - 1);
        int lowY = std::max(range.lowY, 0);
        int highY = std::min(range.highY, _gridSize - 1);

        for (int cx = lowX; cx <= highX; cx++)
        {
            for (int cy = lowY; cy <= highY; cy++)
            {
                fn(GetIndex(cx, cy));
            }
        }
    }

    void Bucket(const Shape &shape);
    bool IsInsideWorld(const Bounds &bounds) const;
    void ClearCells();
    void UpdateGauges();

    int _worldSize;
    int _cellSize;
    int _gridSize;

    // Flat [gridSize * gridSize], index = cx * gridSize + cy
    std::vector<Cell> _cells;

    std::unordered_map<EntityId, std::vector<Shape>> _dynamicShapes;
    size_t _dynamicShapeCount = 0;

    // Kept so ResetDynamic() can rebuild the static part of the cells
    std::vector<Shape> _staticShapes;

    std::shared_ptr<Counter> _insertCounter;
    std::shared_ptr<Counter> _clippedCounter;
    std::shared_ptr<Counter> _overlapQueryCounter;
    std::shared_ptr<Counter> _areaQueryCounter;
    std::shared_ptr<Counter> _overlapsFoundCounter;
    std::shared_ptr<Gauge> _dynamicShapesGauge;
};

} // namespace GridPhysics
