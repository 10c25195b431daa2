#include "src/engine/agents.hpp"
#include "src/engine/game_engine.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace SnakeEngine;

static EngineConfiguration make_configuration(int board_size)
{
        EngineConfiguration configuration = DEFAULT_ENGINE_CONFIGURATION;
        configuration.board_size = board_size;
        configuration.seed = 42;
        return configuration;
}

static int as_index(AbsoluteAction action) { return static_cast<int>(action); }

static bool is_all_empty(const ObservationGrid &grid)
{
        for (const std::vector<CellType> &row : grid) {
                for (CellType cell : row) {
                        if (cell != CellType::Empty) {
                                return false;
                        }
                }
        }
        return true;
}

static int count_cells(const ObservationGrid &grid, CellType type)
{
        int count = 0;
        for (const std::vector<CellType> &row : grid) {
                count += std::count(row.begin(), row.end(), type);
        }
        return count;
}

/**
 * Keeps going right until the match ends. The snake goes straight so it never
 * collides with itself, even if it eats on the way.
 */
static StepResult go_right_until_over(GameEngine &engine)
{
        StepResult result = {};
        while (!engine.is_over()) {
                result = engine.step(as_index(AbsoluteAction::Right));
        }
        return result;
}

TEST(GameEngineTest, RejectsTooSmallBoard)
{
        EXPECT_THROW(
            { GameEngine engine(make_configuration(MIN_BOARD_SIZE - 1)); },
            std::invalid_argument);
        EXPECT_NO_THROW(
            { GameEngine engine(make_configuration(MIN_BOARD_SIZE)); });
}

TEST(GameEngineTest, SmallBoardsKeepTheSnakeOnTheBoard)
{
        for (int size = MIN_BOARD_SIZE; size <= 8; size++) {
                GameEngine engine(make_configuration(size));
                for (const Point &segment : engine.snake().body()) {
                        EXPECT_TRUE(is_inside_square_grid(segment, size))
                            << "size " << size;
                }
                ObservationGrid grid = engine.state();
                EXPECT_EQ(count_cells(grid, CellType::Head), 1);
                EXPECT_EQ(count_cells(grid, CellType::Body), 2);

                StepResult result = engine.step(as_index(AbsoluteAction::Down));
                ASSERT_FALSE(result.done) << "size " << size;
                for (const Point &segment : engine.snake().body()) {
                        EXPECT_TRUE(is_inside_square_grid(segment, size))
                            << "size " << size;
                }
        }
}

TEST(GameEngineTest, InitialState)
{
        GameEngine engine(make_configuration(10));

        EXPECT_EQ(engine.phase(), EngineState::Ready);
        EXPECT_EQ(engine.steps(), 0);
        EXPECT_EQ(engine.snake_length(), 3);
        EXPECT_EQ(engine.score(), 0);
        EXPECT_EQ(engine.heading(), AbsoluteAction::Right);
        EXPECT_EQ(engine.snake().body(),
                  (std::vector<Point>{{2, 2}, {1, 2}, {0, 2}}));
        EXPECT_EQ(engine.action_space(), ABSOLUTE_ACTION_SPACE);

        ObservationGrid grid = engine.state();
        ASSERT_EQ(grid.size(), 10u);
        ASSERT_EQ(grid[0].size(), 10u);
        EXPECT_EQ(grid[2][2], CellType::Head);
        EXPECT_EQ(grid[2][1], CellType::Body);
        EXPECT_EQ(grid[2][0], CellType::Body);
        EXPECT_EQ(cell_at(grid, engine.food_position()), CellType::Food);
        EXPECT_EQ(count_cells(grid, CellType::Food), 1);
        EXPECT_EQ(count_cells(grid, CellType::Dangerous), 0);
}

TEST(GameEngineTest, UpIsAcceptedUnlessHeadingDown)
{
        GameEngine engine(make_configuration(10));
        engine.step(as_index(AbsoluteAction::Up));
        EXPECT_EQ(engine.heading(), AbsoluteAction::Up);
        EXPECT_EQ(engine.snake().head(), (Point{2, 1}));

        engine.reset();
        engine.step(as_index(AbsoluteAction::Down));
        engine.step(as_index(AbsoluteAction::Up));
        EXPECT_EQ(engine.heading(), AbsoluteAction::Down);
        EXPECT_EQ(engine.snake().head(), (Point{2, 4}));
}

TEST(GameEngineTest, WallCollisionEndsMatchWithGameOverReward)
{
        EngineConfiguration configuration = make_configuration(10);
        GameEngine engine(configuration);

        // From x = 2 it takes seven steps to reach the last column.
        for (int i = 0; i < 7; i++) {
                StepResult result = engine.step(as_index(AbsoluteAction::Right));
                ASSERT_FALSE(result.done) << "step " << i;
        }
        ASSERT_EQ(engine.snake().head().x, 9);

        StepResult result = engine.step(as_index(AbsoluteAction::Right));
        EXPECT_TRUE(result.done);
        EXPECT_FLOAT_EQ(result.reward, configuration.rewards.game_over);
        EXPECT_TRUE(engine.is_over());
        EXPECT_FALSE(engine.won());
        EXPECT_EQ(engine.phase(), EngineState::Terminal);
}

TEST(GameEngineTest, TurningIntoOwnBodyEndsMatch)
{
        EngineConfiguration configuration = make_configuration(20);
        GameEngine engine(configuration);
        GreedyAgent agent;
        while (engine.snake_length() < 5 && !engine.is_over()) {
                engine.step(agent.select_action(engine));
        }
        ASSERT_FALSE(engine.is_over());
        ASSERT_GE(engine.snake_length(), 5);

        // Three turns the same way bring the head back onto the segment that
        // was right behind it. Turn away from the wall if it is adjacent.
        RelativeAction turn = RelativeAction::Right;
        Point first = translate_by(
            engine.snake().head(),
            relative_to_absolute(turn, engine.heading()));
        if (!is_inside_square_grid(first, 20)) {
                turn = RelativeAction::Left;
        }

        StepResult result = {};
        for (int i = 0; i < 3 && !engine.is_over(); i++) {
                result = engine.step(
                    as_index(relative_to_absolute(turn, engine.heading())));
        }
        EXPECT_TRUE(result.done);
        EXPECT_TRUE(is_inside_square_grid(engine.snake().head(), 20));
        EXPECT_TRUE(engine.snake().occupies(engine.snake().head(), true));
        EXPECT_FLOAT_EQ(result.reward, configuration.rewards.game_over);
        EXPECT_FALSE(engine.won());
}

/**
 * Direction along a cycle through every cell of an 8x8 board: column 0 goes
 * up, even rows go right and odd rows go left down to column 1. The bottom
 * row continues left into column 0.
 */
static AbsoluteAction follow_board_cycle(const Point &head)
{
        const int last = 7;
        if (head.x == 0 && head.y > 0) {
                return AbsoluteAction::Up;
        }
        if (head.y % 2 == 0) {
                return head.x < last ? AbsoluteAction::Right
                                     : AbsoluteAction::Down;
        }
        if (head.x > 1 || head.y == last) {
                return AbsoluteAction::Left;
        }
        return AbsoluteAction::Down;
}

TEST(GameEngineTest, FillingTheBoardWins)
{
        EngineConfiguration configuration = make_configuration(8);
        configuration.player = PlayerMode::Human;
        GameEngine engine(configuration);

        StepResult result = {};
        for (int i = 0; i < 64 * 64 && !engine.is_over(); i++) {
                result = engine.step(
                    as_index(follow_board_cycle(engine.snake().head())));
        }

        ASSERT_TRUE(engine.is_over());
        EXPECT_TRUE(engine.won());
        EXPECT_TRUE(result.done);
        EXPECT_EQ(engine.snake_length(), 64);
        EXPECT_EQ(engine.score(), 64 - INITIAL_SNAKE_LENGTH);
        EXPECT_FLOAT_EQ(result.reward, configuration.rewards.game_over);
        EXPECT_TRUE(is_all_empty(engine.state()));
}

TEST(GameEngineTest, MoveRewardWhenNothingHappens)
{
        EngineConfiguration configuration = make_configuration(30);
        GameEngine engine(configuration);
        // The snake heads down a column that the food may occupy, skip the
        // check in that case.
        Point next = translate_by(engine.snake().head(), AbsoluteAction::Down);
        StepResult result = engine.step(as_index(AbsoluteAction::Down));
        if (next != engine.food_position()) {
                EXPECT_FALSE(engine.scored());
                EXPECT_FLOAT_EQ(result.reward, configuration.rewards.move);
        }
        EXPECT_FALSE(result.done);
        EXPECT_EQ(engine.phase(), EngineState::Running);
        EXPECT_EQ(engine.steps(), 1);
}

TEST(GameEngineTest, EatingFoodGrowsSnakeAndRewardsLength)
{
        GameEngine engine(make_configuration(10));
        GreedyAgent agent;

        StepResult result = {};
        Point food = engine.food_position();
        int length_before = engine.snake_length();
        while (!engine.scored() && !engine.is_over()) {
                food = engine.food_position();
                length_before = engine.snake_length();
                result = engine.step(agent.select_action(engine));
        }
        ASSERT_TRUE(engine.scored());

        EXPECT_EQ(engine.snake().head(), food);
        EXPECT_EQ(engine.snake_length(), length_before + 1);
        EXPECT_EQ(engine.score(), 1);
        EXPECT_FLOAT_EQ(result.reward,
                        static_cast<float>(engine.snake_length()));
        EXPECT_FALSE(result.done);

        // The food is relocated on the next step, away from the body.
        EXPECT_EQ(engine.food_position(), food);
        engine.step(agent.select_action(engine));
        ASSERT_FALSE(engine.is_over());
        if (!engine.scored()) {
                EXPECT_FALSE(engine.snake().occupies(engine.food_position()));
                EXPECT_NE(engine.food_position(), food);
        }
}

TEST(GameEngineTest, AutonomousPlayerStalls)
{
        GameEngine engine(make_configuration(30));

        // The snake loops around the 2x2 square with corners (6, 7) and (7, 8)
        // forever. Make sure the food is not in the way.
        std::vector<Point> loop = {{6, 7}, {7, 7}, {6, 8}, {7, 8}};
        while (std::find(loop.begin(), loop.end(), engine.food_position()) !=
               loop.end()) {
                engine.reset();
        }

        std::vector<AbsoluteAction> pattern = {
            AbsoluteAction::Down, AbsoluteAction::Left, AbsoluteAction::Up,
            AbsoluteAction::Right};
        int i = 0;
        while (!engine.is_over() && i < 1000) {
                engine.step(as_index(pattern[i % pattern.size()]));
                i++;
        }

        ASSERT_TRUE(engine.is_over());
        EXPECT_EQ(engine.score(), 0);
        EXPECT_EQ(engine.steps(), 50 * 3 + 1);
        EXPECT_FLOAT_EQ(engine.reward(),
                        DEFAULT_ENGINE_CONFIGURATION.rewards.game_over);
}

TEST(GameEngineTest, HumanPlayerNeverStalls)
{
        EngineConfiguration configuration = make_configuration(30);
        configuration.player = PlayerMode::Human;
        GameEngine engine(configuration);

        std::vector<Point> loop = {{6, 7}, {7, 7}, {6, 8}, {7, 8}};
        while (std::find(loop.begin(), loop.end(), engine.food_position()) !=
               loop.end()) {
                engine.reset();
        }

        std::vector<AbsoluteAction> pattern = {
            AbsoluteAction::Down, AbsoluteAction::Left, AbsoluteAction::Up,
            AbsoluteAction::Right};
        for (int i = 0; i < 400; i++) {
                engine.step(as_index(pattern[i % pattern.size()]));
        }
        EXPECT_FALSE(engine.is_over());
        EXPECT_EQ(engine.steps(), 400);
}

TEST(GameEngineTest, StallBudgetScalesWithLength)
{
        EngineConfiguration configuration = make_configuration(30);
        configuration.stall_factor = 1;
        GameEngine engine(configuration);

        go_right_until_over(engine);

        // Going straight from x = 7 the wall is far away, so the match ends
        // as soon as the step count exceeds the length.
        EXPECT_TRUE(is_inside_square_grid(engine.snake().head(), 30));
        EXPECT_EQ(engine.steps(), engine.snake_length() + 1);
}

TEST(GameEngineTest, TerminalStateIsEmpty)
{
        GameEngine engine(make_configuration(10));
        go_right_until_over(engine);

        ObservationGrid grid = engine.state();
        ASSERT_EQ(grid.size(), 10u);
        EXPECT_TRUE(is_all_empty(grid));
}

TEST(GameEngineTest, SteppingTerminalEngineThrows)
{
        GameEngine engine(make_configuration(10));
        go_right_until_over(engine);

        EXPECT_THROW(engine.step(as_index(AbsoluteAction::Up)),
                     InvalidStateError);
        EXPECT_THROW(engine.play(as_index(AbsoluteAction::Up)),
                     std::logic_error);
}

TEST(GameEngineTest, ResetStartsNewMatch)
{
        GameEngine engine(make_configuration(10));
        go_right_until_over(engine);

        ObservationGrid grid = engine.reset();
        EXPECT_EQ(engine.phase(), EngineState::Ready);
        EXPECT_EQ(engine.steps(), 0);
        EXPECT_EQ(engine.snake_length(), 3);
        EXPECT_FALSE(engine.is_over());
        EXPECT_EQ(grid[2][2], CellType::Head);

        EXPECT_NO_THROW(engine.step(as_index(AbsoluteAction::Up)));
        EXPECT_EQ(engine.steps(), 1);
}

TEST(GameEngineTest, SameSeedSameFood)
{
        GameEngine first(make_configuration(20));
        GameEngine second(make_configuration(20));
        EXPECT_EQ(first.food_position(), second.food_position());
}

TEST(GameEngineTest, RelativeActions)
{
        EngineConfiguration configuration = make_configuration(20);
        configuration.relative_actions = true;
        GameEngine engine(configuration);
        ASSERT_EQ(engine.action_space(), RELATIVE_ACTION_SPACE);

        engine.step(static_cast<int>(RelativeAction::Left));
        EXPECT_EQ(engine.heading(), AbsoluteAction::Up);
        engine.step(static_cast<int>(RelativeAction::Right));
        EXPECT_EQ(engine.heading(), AbsoluteAction::Right);
        engine.step(static_cast<int>(RelativeAction::Right));
        EXPECT_EQ(engine.heading(), AbsoluteAction::Down);
        engine.step(static_cast<int>(RelativeAction::Forward));
        EXPECT_EQ(engine.heading(), AbsoluteAction::Down);
}

TEST(GameEngineTest, OutOfRangeActionsGoStraight)
{
        GameEngine absolute(make_configuration(20));
        Point head = absolute.snake().head();
        absolute.step(42);
        absolute.step(-1);
        EXPECT_EQ(absolute.heading(), AbsoluteAction::Right);
        EXPECT_EQ(absolute.snake().head(), (Point{head.x + 2, head.y}));

        EngineConfiguration configuration = make_configuration(20);
        configuration.relative_actions = true;
        GameEngine relative(configuration);
        relative.step(RELATIVE_ACTION_SPACE);
        EXPECT_EQ(relative.heading(), AbsoluteAction::Right);
        EXPECT_EQ(relative.snake().head(), (Point{head.x + 1, head.y}));
}

TEST(GameEngineTest, DangerHintsAtTheEdge)
{
        EngineConfiguration configuration = make_configuration(10);
        configuration.local_state = true;
        GameEngine engine(configuration);

        // Head goes from (2, 2) up to the top row.
        engine.step(as_index(AbsoluteAction::Up));
        engine.step(as_index(AbsoluteAction::Up));
        ASSERT_FALSE(engine.is_over());
        ASSERT_EQ(engine.snake().head(), (Point{2, 0}));

        DangerHints hints = engine.danger_hints();
        EXPECT_TRUE(hints.up);
        EXPECT_TRUE(hints.down);
        EXPECT_FALSE(hints.left);
        EXPECT_FALSE(hints.right);

        // Only the in-board body neighbour can be marked on the grid.
        ObservationGrid grid = engine.state();
        EXPECT_EQ(grid[1][2], CellType::Dangerous);
        EXPECT_EQ(count_cells(grid, CellType::Dangerous), 1);
}

TEST(GameEngineTest, NoDangerHintsWhenDisabledOrOver)
{
        GameEngine engine(make_configuration(10));
        engine.step(as_index(AbsoluteAction::Up));
        engine.step(as_index(AbsoluteAction::Up));

        DangerHints none = {
            .left = false, .right = false, .up = false, .down = false};
        EXPECT_EQ(engine.danger_hints(), none);
        EXPECT_EQ(count_cells(engine.state(), CellType::Dangerous), 0);

        EngineConfiguration configuration = make_configuration(10);
        configuration.local_state = true;
        GameEngine local(configuration);
        go_right_until_over(local);
        EXPECT_EQ(local.danger_hints(), none);
}
