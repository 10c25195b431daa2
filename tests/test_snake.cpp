#include "src/engine/snake.hpp"

#include <gtest/gtest.h>

using namespace SnakeEngine;

// Food placed where the snake never goes.
static const Point NO_FOOD = {.x = -100, .y = -100};

static void expect_contiguous(const Snake &snake)
{
        const std::vector<Point> &body = snake.body();
        for (size_t i = 1; i < body.size(); i++) {
                EXPECT_TRUE(is_adjacent(body[i - 1], body[i]))
                    << "segments " << i - 1 << " and " << i;
        }
}

/**
 * Turns a freshly created snake (heading right) so that it heads in
 * `heading`.
 */
static void steer(Snake &snake, AbsoluteAction heading)
{
        switch (heading) {
        case AbsoluteAction::Up:
        case AbsoluteAction::Down:
                snake.move(heading, NO_FOOD);
                break;
        case AbsoluteAction::Left:
                snake.move(AbsoluteAction::Up, NO_FOOD);
                snake.move(AbsoluteAction::Left, NO_FOOD);
                break;
        default:
                break;
        }
        ASSERT_EQ(snake.heading(), heading);
}

TEST(SnakeTest, InitialPlacement)
{
        Snake snake(10);
        ASSERT_EQ(snake.length(), 3);
        EXPECT_EQ(snake.heading(), AbsoluteAction::Right);
        EXPECT_EQ(snake.head(), (Point{2, 2}));
        EXPECT_EQ(snake.body(),
                  (std::vector<Point>{{2, 2}, {1, 2}, {0, 2}}));
        EXPECT_EQ(snake.tail(), (Point{0, 2}));
}

TEST(SnakeTest, MoveWithoutFoodKeepsLength)
{
        Snake snake(20);
        EXPECT_FALSE(snake.move(AbsoluteAction::Right, NO_FOOD));
        EXPECT_EQ(snake.head(), (Point{6, 5}));
        EXPECT_EQ(snake.length(), 3);
        EXPECT_EQ(snake.body().size(), 3u);
        expect_contiguous(snake);
}

TEST(SnakeTest, IdleKeepsGoingStraight)
{
        Snake snake(20);
        EXPECT_TRUE(snake.is_move_invalid(AbsoluteAction::Idle));
        snake.move(AbsoluteAction::Idle, NO_FOOD);
        EXPECT_EQ(snake.heading(), AbsoluteAction::Right);
        EXPECT_EQ(snake.head(), (Point{6, 5}));
}

TEST(SnakeTest, TurnChangesHeading)
{
        Snake snake(20);
        EXPECT_FALSE(snake.is_move_invalid(AbsoluteAction::Up));
        snake.move(AbsoluteAction::Up, NO_FOOD);
        EXPECT_EQ(snake.heading(), AbsoluteAction::Up);
        EXPECT_EQ(snake.head(), (Point{5, 4}));
        expect_contiguous(snake);
}

TEST(SnakeTest, ForbiddenReversalsKeepHeading)
{
        std::vector<std::pair<AbsoluteAction, AbsoluteAction>> pairs = {
            {AbsoluteAction::Left, AbsoluteAction::Right},
            {AbsoluteAction::Right, AbsoluteAction::Left},
            {AbsoluteAction::Up, AbsoluteAction::Down},
            {AbsoluteAction::Down, AbsoluteAction::Up},
        };
        for (const auto &[heading, reversal] : pairs) {
                Snake snake(20);
                steer(snake, heading);
                Point before = snake.head();

                EXPECT_TRUE(snake.is_move_invalid(reversal));
                snake.move(reversal, NO_FOOD);

                EXPECT_EQ(snake.heading(), heading);
                EXPECT_EQ(snake.head(), translate_by(before, heading));
                expect_contiguous(snake);
        }
}

TEST(SnakeTest, EatingGrowsByOne)
{
        Snake snake(20);
        for (int k = 1; k <= 5; k++) {
                Point tail = snake.tail();
                Point food = translate_by(snake.head(), AbsoluteAction::Right);
                EXPECT_TRUE(snake.move(AbsoluteAction::Right, food));
                EXPECT_EQ(snake.length(), 3 + k);
                EXPECT_EQ(static_cast<int>(snake.body().size()), 3 + k);
                EXPECT_EQ(snake.tail(), tail);
                EXPECT_EQ(snake.head(), food);
        }
        expect_contiguous(snake);
}

TEST(SnakeTest, MovesOffBoardWithoutComplaining)
{
        Snake snake(5);
        // Head starts at (2, 2), three steps right leave the board.
        for (int i = 0; i < 3; i++) {
                snake.move(AbsoluteAction::Right, NO_FOOD);
        }
        EXPECT_EQ(snake.head(), (Point{5, 2}));
        EXPECT_FALSE(is_inside_square_grid(snake.head(), 5));
}

TEST(SnakeTest, SmallBoardsStartWithTheWholeBodyOnTheBoard)
{
        for (int size = MIN_BOARD_SIZE; size <= 8; size++) {
                Snake snake(size);
                EXPECT_EQ(snake.head(), (Point{2, 2})) << "size " << size;
                for (const Point &segment : snake.body()) {
                        EXPECT_TRUE(is_inside_square_grid(segment, size))
                            << "size " << size;
                }
        }
}

TEST(SnakeTest, OccupiesCanSkipHead)
{
        Snake snake(10);
        EXPECT_TRUE(snake.occupies({2, 2}));
        EXPECT_FALSE(snake.occupies({2, 2}, true));
        EXPECT_TRUE(snake.occupies({1, 2}, true));
        EXPECT_FALSE(snake.occupies({3, 2}));
}
