// Tests for edit/LinearDistanceSnapGrid.h -- tick layout along a ray and axis projection.

#include "edit/LinearDistanceSnapGrid.h"
#include "TestSnapProvider.h"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

namespace rs
{
namespace
{

using edit::LinearDistanceSnapGrid;
using edit::SnapTick;
using test::FixedSnapProvider;

class LinearDistanceSnapGridTest : public ::testing::Test
{
protected:
    std::unique_ptr<LinearDistanceSnapGrid> makeGrid (gfx::Point direction, std::optional<double> endTime)
    {
        auto grid = std::make_unique<LinearDistanceSnapGrid> (provider, divisor, theme, start,
                                                               direction, 500.0, endTime);
        grid->setBounds (0.0f, 0.0f, 100.0f, 100.0f);
        return grid;
    }

    const gfx::Point start { 0.0f, 50.0f };
    FixedSnapProvider provider { 10.0f, 5.0 };
    BeatDivisor divisor { 4 };
    gfx::Theme theme;
};

TEST_F (LinearDistanceSnapGridTest, TicksFillBoundsAlongDirection)
{
    auto grid = makeGrid ({ 1.0f, 0.0f }, std::nullopt);

    ASSERT_EQ (grid->getNumTicks(), 10);

    const SnapTick* first = grid->getTick (0);
    EXPECT_EQ (first->getShape(), SnapTick::Shape::line);
    EXPECT_EQ (first->getBeatIndex(), 0);
    EXPECT_NEAR (first->getCentre().x, 10.0f, 1e-5f);
    EXPECT_NEAR (first->getCentre().y, 50.0f, 1e-5f);

    // Perpendicular to the ray, centred on it
    EXPECT_NEAR (first->getFrom().x, 10.0f, 1e-5f);
    EXPECT_NEAR (first->getFrom().y, 50.0f - theme.tickLength * 0.5f, 1e-5f);
    EXPECT_NEAR (first->getTo().y, 50.0f + theme.tickLength * 0.5f, 1e-5f);

    EXPECT_NEAR (grid->getTick (9)->getCentre().x, 100.0f, 1e-4f);
}

TEST_F (LinearDistanceSnapGridTest, TickCountLimitedByEndTime)
{
    auto grid = makeGrid ({ 1.0f, 0.0f }, 650.0);

    EXPECT_EQ (grid->getMaxIntervals(), 3);
    EXPECT_EQ (grid->getNumTicks(), 3);
}

TEST_F (LinearDistanceSnapGridTest, DirectionIsNormalised)
{
    auto grid = makeGrid ({ 0.0f, -4.0f }, std::nullopt);

    EXPECT_FLOAT_EQ (grid->getDirection().x, 0.0f);
    EXPECT_FLOAT_EQ (grid->getDirection().y, -1.0f);

    // 50 units of room above the start
    EXPECT_EQ (grid->getNumTicks(), 5);
}

TEST_F (LinearDistanceSnapGridTest, ZeroDirectionThrows)
{
    EXPECT_THROW (makeGrid (gfx::Point (0.0f, 0.0f), std::nullopt), std::invalid_argument);
}

TEST_F (LinearDistanceSnapGridTest, ProjectsOntoAxis)
{
    auto grid = makeGrid ({ 1.0f, 0.0f }, std::nullopt);

    auto result = grid->getSnappedPosition ({ 37.0f, 80.0f });

    EXPECT_NEAR (result.position.x, 40.0f, 1e-5f);
    EXPECT_NEAR (result.position.y, 50.0f, 1e-5f);
    EXPECT_DOUBLE_EQ (result.time, 700.0);
}

TEST_F (LinearDistanceSnapGridTest, PositionsBehindStartSnapToStart)
{
    auto grid = makeGrid ({ 1.0f, 0.0f }, std::nullopt);

    auto result = grid->getSnappedPosition ({ -25.0f, 50.0f });

    EXPECT_EQ (result.position, start);
    EXPECT_DOUBLE_EQ (result.time, 500.0);
}

TEST_F (LinearDistanceSnapGridTest, NaNPositionSnapsToStart)
{
    auto grid = makeGrid ({ 1.0f, 0.0f }, std::nullopt);

    auto result = grid->getSnappedPosition ({ std::nanf (""), 50.0f });

    EXPECT_EQ (result.position, start);
    EXPECT_DOUBLE_EQ (result.time, 500.0);
}

TEST_F (LinearDistanceSnapGridTest, EveryTickSnapsToItsOwnTime)
{
    auto grid = makeGrid ({ 3.0f, 4.0f }, 800.0);
    const int maxIntervals = grid->getMaxIntervals();
    ASSERT_EQ (maxIntervals, 6);

    for (int k = 0; k <= maxIntervals; ++k)
    {
        gfx::Point tickPosition = start + grid->getDirection() * (10.0f * static_cast<float> (k));
        auto result = grid->getSnappedPosition (tickPosition);

        EXPECT_NEAR (result.time, grid->getTimeForInterval (k), 1e-9) << "k " << k;
        EXPECT_NEAR (result.time, 500.0 + k * 50.0, 1e-9);
        EXPECT_NEAR (result.position.x, tickPosition.x, 1e-4f);
        EXPECT_NEAR (result.position.y, tickPosition.y, 1e-4f);
    }
}

TEST_F (LinearDistanceSnapGridTest, ClampsToLastInterval)
{
    auto grid = makeGrid ({ 1.0f, 0.0f }, 650.0);

    auto result = grid->getSnappedPosition ({ 95.0f, 50.0f });
    EXPECT_NEAR (result.position.x, 30.0f, 1e-5f);
    EXPECT_DOUBLE_EQ (result.time, 650.0);
}

} // namespace
} // namespace rs
