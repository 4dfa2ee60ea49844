#include "GridPhysics/Collision/SpatialGrid.h"
#include "GridPhysics/Collision/GridError.h"
#include "GridPhysics/ILog.h"
#include "GridPhysics/Pch.h"
#include <climits>

namespace GridPhysics {

namespace {

// Keeps far-away coordinates from overflowing int. Anything this far out is off-grid anyway.
int ToCellCoord(double value)
{
    constexpr double kLimit = static_cast<double>(INT_MAX / 2);
    if (std::isnan(value))
        return 0;
    return static_cast<int>(std::clamp(value, -kLimit, kLimit));
}

} // namespace

SpatialGrid::SpatialGrid(int worldSize, int cellSize, IMetrics &metrics)
    : _worldSize(worldSize), _cellSize(cellSize), _gridSize(0)
{
    if (worldSize <= 0 || cellSize <= 0)
    {
        LOG_ERROR("SpatialGrid rejected: world size {} and cell size {} must be positive", worldSize, cellSize);
        throw GridConfigError(
            fmt::format("world size ({}) and cell size ({}) must be positive", worldSize, cellSize)
        );
    }

    if (worldSize % cellSize != 0)
    {
        LOG_ERROR("SpatialGrid rejected: cell size {} does not divide world size {}", cellSize, worldSize);
        throw GridConfigError(fmt::format("cell size ({}) does not divide world size ({})", cellSize, worldSize));
    }

    _gridSize = worldSize / cellSize;
    _cells.resize(static_cast<size_t>(_gridSize) * static_cast<size_t>(_gridSize));

    _insertCounter = metrics.GetCounter("grid_shapes_inserted");
    _clippedCounter = metrics.GetCounter("grid_shapes_clipped");
    _overlapQueryCounter = metrics.GetCounter("grid_overlap_queries");
    _areaQueryCounter = metrics.GetCounter("grid_area_queries");
    _overlapsFoundCounter = metrics.GetCounter("grid_overlaps_found");
    _dynamicShapesGauge = metrics.GetGauge("grid_dynamic_shapes");

    LOG_DEBUG("SpatialGrid created. World: {}, Cell: {}, Grid: {}x{}", _worldSize, _cellSize, _gridSize, _gridSize);
}

void SpatialGrid::Reset()
{
    ClearCells();
    _dynamicShapes.clear();
    _dynamicShapeCount = 0;
    _staticShapes.clear();
    UpdateGauges();
}

void SpatialGrid::ResetDynamic()
{
    ClearCells();
    _dynamicShapes.clear();
    _dynamicShapeCount = 0;

    for (const auto &shape : _staticShapes)
    {
        Bucket(shape);
    }
    UpdateGauges();
}

SpatialGrid::CellRange SpatialGrid::GetCellRange(const Bounds &bounds) const
{
    double cellSize = static_cast<double>(_cellSize);

    CellRange range;
    range.lowX = ToCellCoord(std::floor(bounds.minX / cellSize));
    range.highX = ToCellCoord(std::ceil(bounds.maxX / cellSize));
    range.lowY = ToCellCoord(std::floor(bounds.minY / cellSize));
    range.highY = ToCellCoord(std::ceil(bounds.maxY / cellSize));
    return range;
}

void SpatialGrid::Insert(EntityId entityId, Point pos, float radius, ShapeIndex shapeIndex, bool isStatic)
{
    Shape shape(entityId, shapeIndex, pos, radius, isStatic);

    Bucket(shape);

    // Partial or no coverage is the accepted outcome for off-world shapes; only counted.
    if (!IsInsideWorld(shape.GetBounds()) && _clippedCounter)
        _clippedCounter->Increment();

    if (isStatic)
    {
        _staticShapes.push_back(shape);
    }
    else
    {
        _dynamicShapes[entityId].push_back(shape);
        _dynamicShapeCount++;
    }

    if (_insertCounter)
        _insertCounter->Increment();
    UpdateGauges();
}

void SpatialGrid::AddStatic(EntityId entityId, Point pos, float radius)
{
    Insert(entityId, pos, radius, 0, true);
}

void SpatialGrid::AddStaticBatch(EntityId entityId, const std::vector<Point> &positions, float radius)
{
    for (size_t i = 0; i < positions.size(); ++i)
    {
        Insert(entityId, positions[i], radius, static_cast<ShapeIndex>(i), true);
    }
}

void SpatialGrid::AddDynamic(EntityId entityId, Point pos, float radius)
{
    Insert(entityId, pos, radius, 0, false);
}

void SpatialGrid::AddDynamicBatch(EntityId entityId, const std::vector<Point> &positions, float radius)
{
    for (size_t i = 0; i < positions.size(); ++i)
    {
        Insert(entityId, positions[i], radius, static_cast<ShapeIndex>(i), false);
    }
}

OverlapSet SpatialGrid::QueryOverlaps() const
{
    OverlapSet overlaps;

    for (const auto &entry : _dynamicShapes)
    {
        for (const auto &shape : entry.second)
        {
            ForEachCell(
                GetCellRange(shape.GetBounds()),
                [&](size_t cellIdx)
                {
                    for (const auto &other : _cells[cellIdx].shapes)
                    {
                        if (shape.Collided(other))
                        {
                            overlaps.insert({shape.entityId, other.entityId, shape.shapeIndex, other.shapeIndex});
                        }
                    }
                }
            );
        }
    }

    if (_overlapQueryCounter)
        _overlapQueryCounter->Increment();
    if (_overlapsFoundCounter)
        _overlapsFoundCounter->Increment(overlaps.size());

    LOG_DEBUG("QueryOverlaps: {} dynamic shapes -> {} overlaps", _dynamicShapeCount, overlaps.size());
    return overlaps;
}

EntitySet SpatialGrid::QueryArea(Point center, float radius) const
{
    Bounds bounds{center.x - radius, center.x + radius, center.y - radius, center.y + radius};

    EntitySet entities;
    ForEachCell(
        GetCellRange(bounds),
        [&](size_t cellIdx)
        {
            for (const auto &shape : _cells[cellIdx].shapes)
            {
                entities.insert(shape.entityId);
            }
        }
    );

    if (_areaQueryCounter)
        _areaQueryCounter->Increment();
    return entities;
}

size_t SpatialGrid::GetCellShapeCount(int cx, int cy) const
{
    if (!IsValidCell(cx, cy))
        return 0;
    return _cells[GetIndex(cx, cy)].shapes.size();
}

void SpatialGrid::Bucket(const Shape &shape)
{
    ForEachCell(
        GetCellRange(shape.GetBounds()),
        [&](size_t cellIdx)
        {
            _cells[cellIdx].shapes.push_back(shape);
        }
    );
}

bool SpatialGrid::IsInsideWorld(const Bounds &bounds) const
{
    float worldSize = static_cast<float>(_worldSize);
    return bounds.minX >= 0.0f && bounds.minY >= 0.0f && bounds.maxX <= worldSize && bounds.maxY <= worldSize;
}

void SpatialGrid::ClearCells()
{
    // clear() keeps capacity; buckets are refilled every tick
    for (auto &cell : _cells)
        cell.shapes.clear();
}

void SpatialGrid::UpdateGauges()
{
    if (_dynamicShapesGauge)
        _dynamicShapesGauge->Set(static_cast<int64_t>(_dynamicShapeCount));
}

} // namespace GridPhysics
