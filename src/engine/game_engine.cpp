#include "game_engine.hpp"
#include "../common/logging.hpp"

#include <stdexcept>
#include <string>

#define TAG "game_engine"

namespace SnakeEngine
{

static uint32_t resolve_seed(uint32_t seed)
{
        if (seed != 0) {
                return seed;
        }
        std::random_device device;
        return device();
}

GameEngine::GameEngine(const EngineConfiguration &configuration)
    : configuration_(configuration),
      random_engine_(resolve_seed(configuration.seed)),
      food_position_({.x = 0, .y = 0}), steps_(0), scored_(false), won_(false),
      state_(EngineState::Ready)
{
        if (configuration_.board_size < MIN_BOARD_SIZE) {
                throw std::invalid_argument(
                    "board size must be at least " +
                    std::to_string(MIN_BOARD_SIZE) + ", got " +
                    std::to_string(configuration_.board_size));
        }
        if (configuration_.board_size > RECOMMENDED_MAX_BOARD_SIZE) {
                LOG_WARN(TAG,
                         "Board size %d is larger than %d, the game may run "
                         "slower.",
                         configuration_.board_size,
                         RECOMMENDED_MAX_BOARD_SIZE);
        }

        LOG_DEBUG(TAG,
                  "Engine created: board_size=%d, local_state=%d, "
                  "relative_actions=%d, player=%s",
                  configuration_.board_size, configuration_.local_state,
                  configuration_.relative_actions,
                  configuration_.player == PlayerMode::Human ? "human"
                                                             : "autonomous");
        reset();
}

ObservationGrid GameEngine::reset()
{
        LOG_DEBUG(TAG, "Resetting the engine, previous phase: %s",
                  engine_state_to_str(state_));
        int size = configuration_.board_size;
        steps_ = 0;
        scored_ = false;
        won_ = false;
        snake_ = std::make_unique<Snake>(size);
        food_generator_ = std::make_unique<FoodGenerator>(size, random_engine_,
                                                          snake_->body());
        food_position_ = food_generator_->position();
        state_ = EngineState::Ready;

        LOG_DEBUG(TAG, "Match reset, food at {x: %d, y: %d}", food_position_.x,
                  food_position_.y);
        return state();
}

void GameEngine::play(int action)
{
        if (state_ == EngineState::Terminal) {
                throw InvalidStateError(
                    "cannot play a step after the match is over, call reset()");
        }

        scored_ = false;
        steps_++;
        state_ = EngineState::Running;

        int board_cells = configuration_.board_size * configuration_.board_size;
        if (snake_->length() >= board_cells) {
                won_ = true;
                end_match("the snake filled the board");
                return;
        }
        food_position_ = food_generator_->generate_food(snake_->body());

        AbsoluteAction absolute = decode_action(action);
        LOG_TRACE(TAG, "Step %d: action %d decoded as %s", steps_, action,
                  absolute_action_to_str(absolute));

        if (snake_->move(absolute, food_position_)) {
                scored_ = true;
                food_generator_->consume();
                LOG_DEBUG(TAG, "Food eaten, score: %d", score());
        }

        if (check_collision()) {
                end_match("collision");
        } else if (configuration_.player == PlayerMode::Autonomous &&
                   is_stalling()) {
                end_match("step budget exceeded");
        }
}

StepResult GameEngine::step(int action)
{
        play(action);
        return {.observation = state(), .reward = reward(), .done = is_over()};
}

ObservationGrid GameEngine::state() const
{
        int size = configuration_.board_size;
        ObservationGrid grid = empty_observation(size);
        if (state_ == EngineState::Terminal) {
                return grid;
        }

        const std::vector<Point> &body = snake_->body();
        for (const Point &segment : body) {
                grid[segment.y][segment.x] = CellType::Body;
        }
        grid[body[0].y][body[0].x] = CellType::Head;

        if (configuration_.local_state) {
                // Off-board neighbours have no cell to be marked on, they are
                // only reported through `danger_hints()`.
                for (const Point &neighbour :
                     get_adjacent_neighbours(snake_->head())) {
                        if (is_inside_square_grid(neighbour, size) &&
                            is_dangerous(neighbour)) {
                                grid[neighbour.y][neighbour.x] =
                                    CellType::Dangerous;
                        }
                }
        }

        grid[food_position_.y][food_position_.x] = CellType::Food;
        return grid;
}

float GameEngine::reward() const
{
        if (state_ == EngineState::Terminal) {
                return configuration_.rewards.game_over;
        }
        if (scored_) {
                return static_cast<float>(snake_->length());
        }
        return configuration_.rewards.move;
}

DangerHints GameEngine::danger_hints() const
{
        DangerHints hints = {
            .left = false, .right = false, .up = false, .down = false};
        if (!configuration_.local_state ||
            state_ == EngineState::Terminal) {
                return hints;
        }

        const Point &head = snake_->head();
        hints.left = is_dangerous(translate_by(head, AbsoluteAction::Left));
        hints.right = is_dangerous(translate_by(head, AbsoluteAction::Right));
        hints.up = is_dangerous(translate_by(head, AbsoluteAction::Up));
        hints.down = is_dangerous(translate_by(head, AbsoluteAction::Down));
        return hints;
}

int GameEngine::action_space() const
{
        return configuration_.relative_actions ? RELATIVE_ACTION_SPACE
                                               : ABSOLUTE_ACTION_SPACE;
}

AbsoluteAction GameEngine::decode_action(int action) const
{
        if (configuration_.relative_actions) {
                RelativeAction relative =
                    action >= 0 && action < RELATIVE_ACTION_SPACE
                        ? static_cast<RelativeAction>(action)
                        : RelativeAction::Forward;
                LOG_TRACE(TAG, "Relative action %s while heading %s",
                          relative_action_to_str(relative),
                          absolute_action_to_str(snake_->heading()));
                return relative_to_absolute(relative, snake_->heading());
        }
        if (action < 0 || action >= ABSOLUTE_ACTION_SPACE) {
                return AbsoluteAction::Idle;
        }
        return static_cast<AbsoluteAction>(action);
}

bool GameEngine::check_collision() const
{
        const Point &head = snake_->head();
        if (!is_inside_square_grid(head, configuration_.board_size)) {
                LOG_INFO(TAG, "Wall collision at {x: %d, y: %d}", head.x,
                         head.y);
                return true;
        }
        if (snake_->occupies(head, true)) {
                LOG_INFO(TAG, "Body collision at {x: %d, y: %d}", head.x,
                         head.y);
                return true;
        }
        return false;
}

bool GameEngine::is_stalling() const
{
        return steps_ > configuration_.stall_factor * snake_->length();
}

bool GameEngine::is_dangerous(const Point &point) const
{
        return !is_inside_square_grid(point, configuration_.board_size) ||
               snake_->occupies(point, true);
}

void GameEngine::end_match(const char *reason)
{
        state_ = EngineState::Terminal;
        LOG_INFO(TAG, "Game over (%s) after %d steps, final score: %d", reason,
                 steps_, score());
}

} // namespace SnakeEngine
