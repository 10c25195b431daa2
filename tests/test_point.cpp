#include "src/common/point.hpp"
#include "src/engine/engine_types.hpp"

#include <gtest/gtest.h>

using namespace SnakeEngine;

TEST(PointTest, TranslatePureMovesOneCell)
{
        Point p = {.x = 3, .y = 3};
        EXPECT_EQ(translate_pure(p, UP), (Point{3, 2}));
        EXPECT_EQ(translate_pure(p, DOWN), (Point{3, 4}));
        EXPECT_EQ(translate_pure(p, LEFT), (Point{2, 3}));
        EXPECT_EQ(translate_pure(p, RIGHT), (Point{4, 3}));
}

TEST(PointTest, NeighboursAreOrderedLeftRightUpDown)
{
        std::vector<Point> neighbours = get_adjacent_neighbours({5, 5});
        ASSERT_EQ(neighbours.size(), 4u);
        EXPECT_EQ(neighbours[0], (Point{4, 5}));
        EXPECT_EQ(neighbours[1], (Point{6, 5}));
        EXPECT_EQ(neighbours[2], (Point{5, 4}));
        EXPECT_EQ(neighbours[3], (Point{5, 6}));
        for (const Point &neighbour : neighbours) {
                EXPECT_TRUE(is_adjacent(neighbour, {5, 5}));
        }
}

TEST(PointTest, SquareGridBoundsAreInclusive)
{
        EXPECT_TRUE(is_inside_square_grid({0, 0}, 10));
        EXPECT_TRUE(is_inside_square_grid({9, 9}, 10));
        EXPECT_FALSE(is_inside_square_grid({10, 9}, 10));
        EXPECT_FALSE(is_inside_square_grid({9, 10}, 10));
        EXPECT_FALSE(is_inside_square_grid({-1, 0}, 10));
        EXPECT_FALSE(is_inside_square_grid({0, -1}, 10));
}

TEST(PointTest, DiagonalCellsAreNotAdjacent)
{
        EXPECT_FALSE(is_adjacent({1, 1}, {2, 2}));
        EXPECT_FALSE(is_adjacent({1, 1}, {1, 1}));
        EXPECT_TRUE(is_adjacent({1, 1}, {1, 2}));
}

TEST(InputTest, MissingInputMapsToIdle)
{
        EXPECT_EQ(to_absolute_action(std::nullopt), AbsoluteAction::Idle);
        EXPECT_EQ(to_absolute_action(LEFT), AbsoluteAction::Left);
        EXPECT_EQ(to_absolute_action(RIGHT), AbsoluteAction::Right);
        EXPECT_EQ(to_absolute_action(UP), AbsoluteAction::Up);
        EXPECT_EQ(to_absolute_action(DOWN), AbsoluteAction::Down);
}

TEST(EngineTypesTest, TranslateByFollowsScreenCoordinates)
{
        Point p = {.x = 4, .y = 4};
        EXPECT_EQ(translate_by(p, AbsoluteAction::Up), (Point{4, 3}));
        EXPECT_EQ(translate_by(p, AbsoluteAction::Down), (Point{4, 5}));
        EXPECT_EQ(translate_by(p, AbsoluteAction::Left), (Point{3, 4}));
        EXPECT_EQ(translate_by(p, AbsoluteAction::Right), (Point{5, 4}));
        EXPECT_EQ(translate_by(p, AbsoluteAction::Idle), p);
}

TEST(EngineTypesTest, RelativeTurnsMatchTable)
{
        EXPECT_EQ(relative_to_absolute(RelativeAction::Left,
                                       AbsoluteAction::Left),
                  AbsoluteAction::Down);
        EXPECT_EQ(relative_to_absolute(RelativeAction::Right,
                                       AbsoluteAction::Left),
                  AbsoluteAction::Up);
        EXPECT_EQ(relative_to_absolute(RelativeAction::Left,
                                       AbsoluteAction::Right),
                  AbsoluteAction::Up);
        EXPECT_EQ(relative_to_absolute(RelativeAction::Right,
                                       AbsoluteAction::Right),
                  AbsoluteAction::Down);
        EXPECT_EQ(relative_to_absolute(RelativeAction::Left,
                                       AbsoluteAction::Up),
                  AbsoluteAction::Left);
        EXPECT_EQ(relative_to_absolute(RelativeAction::Right,
                                       AbsoluteAction::Up),
                  AbsoluteAction::Right);
        EXPECT_EQ(relative_to_absolute(RelativeAction::Left,
                                       AbsoluteAction::Down),
                  AbsoluteAction::Right);
        EXPECT_EQ(relative_to_absolute(RelativeAction::Right,
                                       AbsoluteAction::Down),
                  AbsoluteAction::Left);
}

TEST(EngineTypesTest, LeftThenRightRestoresHeading)
{
        for (AbsoluteAction heading :
             {AbsoluteAction::Left, AbsoluteAction::Right, AbsoluteAction::Up,
              AbsoluteAction::Down}) {
                AbsoluteAction turned =
                    relative_to_absolute(RelativeAction::Left, heading);
                EXPECT_EQ(relative_to_absolute(RelativeAction::Right, turned),
                          heading)
                    << absolute_action_to_str(heading);
                EXPECT_EQ(relative_to_absolute(RelativeAction::Forward,
                                               heading),
                          heading);
        }
}

TEST(EngineTypesTest, ForbiddenReversals)
{
        EXPECT_TRUE(is_forbidden_reversal(AbsoluteAction::Left,
                                          AbsoluteAction::Right));
        EXPECT_TRUE(is_forbidden_reversal(AbsoluteAction::Right,
                                          AbsoluteAction::Left));
        EXPECT_TRUE(
            is_forbidden_reversal(AbsoluteAction::Up, AbsoluteAction::Down));
        EXPECT_TRUE(
            is_forbidden_reversal(AbsoluteAction::Down, AbsoluteAction::Up));
        EXPECT_FALSE(
            is_forbidden_reversal(AbsoluteAction::Up, AbsoluteAction::Right));
        EXPECT_FALSE(is_forbidden_reversal(AbsoluteAction::Idle,
                                           AbsoluteAction::Right));
}

TEST(EngineTypesTest, CellAtIndexesRowsByY)
{
        ObservationGrid grid = empty_observation(4);
        grid[1][3] = CellType::Food;
        EXPECT_EQ(cell_at(grid, {3, 1}), CellType::Food);
        EXPECT_EQ(cell_at(grid, {1, 3}), CellType::Empty);
}
