#include "GridPhysics/Collision/SpatialGrid.h"
#include "GridPhysics/Metrics/MetricsCollector.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

using namespace GridPhysics;

class MetricsTest : public ::testing::Test
{
protected:
    std::unique_ptr<MetricsCollector> metrics;

    void SetUp() override
    {
        metrics = std::make_unique<MetricsCollector>();
    }

    void TearDown() override
    {
        metrics.reset();
    }
};

TEST_F(MetricsTest, CounterIncrement)
{
    // Registered on first access
    auto counter = metrics->GetCounter("test_counter");

    counter->Increment(5);
    counter->Increment(3);

    EXPECT_EQ(counter->GetValue(), 8);
    EXPECT_EQ(metrics->GetCounter("test_counter"), counter);
}

TEST_F(MetricsTest, GaugeSetGet)
{
    auto gauge = metrics->GetGauge("shapes");

    gauge->Set(45);
    EXPECT_EQ(gauge->GetValue(), 45);

    gauge->Set(-3);
    EXPECT_EQ(gauge->GetValue(), -3);
}

TEST_F(MetricsTest, TypeMismatchReturnsNull)
{
    ASSERT_NE(metrics->GetCounter("taken"), nullptr);
    EXPECT_EQ(metrics->GetGauge("taken"), nullptr);
}

TEST_F(MetricsTest, ConcurrentCounterIncrement)
{
    auto counter = metrics->GetCounter("concurrent");

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i)
    {
        threads.emplace_back(
            [counter]()
            {
                for (int j = 0; j < 1000; ++j)
                    counter->Increment(1);
            }
        );
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(counter->GetValue(), 16000);
}

TEST_F(MetricsTest, ToJson)
{
    metrics->GetCounter("a")->Increment(2);
    metrics->GetGauge("b")->Set(7);

    auto j = nlohmann::json::parse(metrics->ToJson());
    EXPECT_EQ(j["a"].get<uint64_t>(), 2);
    EXPECT_EQ(j["b"].get<int64_t>(), 7);
}

TEST_F(MetricsTest, GridRecordsInsertsAndQueries)
{
    SpatialGrid grid(100, 10, *metrics);

    grid.AddDynamic(1, Point(50.0f, 50.0f), 1.0f);
    grid.AddDynamic(2, Point(51.0f, 50.0f), 1.0f);
    grid.AddStatic(3, Point(-5.0f, 50.0f), 1.0f);  // off-world
    grid.AddDynamic(4, Point(99.5f, 10.0f), 1.0f); // hangs over the edge

    EXPECT_EQ(metrics->GetCounter("grid_shapes_inserted")->GetValue(), 4);
    EXPECT_EQ(metrics->GetCounter("grid_shapes_clipped")->GetValue(), 2);
    EXPECT_EQ(metrics->GetGauge("grid_dynamic_shapes")->GetValue(), 3);

    OverlapSet overlaps = grid.QueryOverlaps();
    grid.QueryArea(Point(50.0f, 50.0f), 1.0f);

    EXPECT_EQ(metrics->GetCounter("grid_overlap_queries")->GetValue(), 1);
    EXPECT_EQ(metrics->GetCounter("grid_overlaps_found")->GetValue(), overlaps.size());
    EXPECT_EQ(metrics->GetCounter("grid_area_queries")->GetValue(), 1);

    grid.ResetDynamic();
    EXPECT_EQ(metrics->GetGauge("grid_dynamic_shapes")->GetValue(), 0);
}

TEST_F(MetricsTest, ShapeOnWorldEdgeIsNotClipped)
{
    SpatialGrid grid(100, 10, *metrics);

    // bounds 98..100 touch the edge without leaving the world
    grid.AddDynamic(1, Point(99.0f, 99.0f), 1.0f);

    EXPECT_EQ(metrics->GetCounter("grid_shapes_clipped")->GetValue(), 0);
}
