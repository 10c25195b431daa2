#include "engine_types.hpp"

namespace SnakeEngine
{

const EngineConfiguration DEFAULT_ENGINE_CONFIGURATION = {
    .board_size = 30,
    .local_state = false,
    .relative_actions = false,
    .player = PlayerMode::Autonomous,
    .rewards = {.move = -0.005f, .game_over = -1.0f},
    .stall_factor = 50,
    .seed = 0};

ObservationGrid empty_observation(int board_size)
{
        return ObservationGrid(board_size,
                               std::vector<CellType>(board_size,
                                                     CellType::Empty));
}

CellType cell_at(const ObservationGrid &grid, const Point &point)
{
        return grid[point.y][point.x];
}

bool is_forbidden_reversal(AbsoluteAction action, AbsoluteAction heading)
{
        switch (action) {
        case AbsoluteAction::Left:
                return heading == AbsoluteAction::Right;
        case AbsoluteAction::Right:
                return heading == AbsoluteAction::Left;
        case AbsoluteAction::Up:
                return heading == AbsoluteAction::Down;
        case AbsoluteAction::Down:
                return heading == AbsoluteAction::Up;
        case AbsoluteAction::Idle:
                return false;
        }
        return false;
}

AbsoluteAction relative_to_absolute(RelativeAction action,
                                    AbsoluteAction heading)
{
        switch (action) {
        case RelativeAction::Forward:
                return heading;
        case RelativeAction::Left:
                switch (heading) {
                case AbsoluteAction::Left:
                        return AbsoluteAction::Down;
                case AbsoluteAction::Right:
                        return AbsoluteAction::Up;
                case AbsoluteAction::Up:
                        return AbsoluteAction::Left;
                case AbsoluteAction::Down:
                        return AbsoluteAction::Right;
                case AbsoluteAction::Idle:
                        return heading;
                }
                break;
        case RelativeAction::Right:
                switch (heading) {
                case AbsoluteAction::Left:
                        return AbsoluteAction::Up;
                case AbsoluteAction::Right:
                        return AbsoluteAction::Down;
                case AbsoluteAction::Up:
                        return AbsoluteAction::Right;
                case AbsoluteAction::Down:
                        return AbsoluteAction::Left;
                case AbsoluteAction::Idle:
                        return heading;
                }
                break;
        }
        return heading;
}

Point translate_by(const Point &p, AbsoluteAction action)
{
        switch (action) {
        case AbsoluteAction::Left:
                return translate_pure(p, Direction::LEFT);
        case AbsoluteAction::Right:
                return translate_pure(p, Direction::RIGHT);
        case AbsoluteAction::Up:
                return translate_pure(p, Direction::UP);
        case AbsoluteAction::Down:
                return translate_pure(p, Direction::DOWN);
        case AbsoluteAction::Idle:
                return p;
        }
        return p;
}

AbsoluteAction to_absolute_action(std::optional<Direction> input)
{
        if (!input.has_value()) {
                return AbsoluteAction::Idle;
        }
        switch (input.value()) {
        case Direction::LEFT:
                return AbsoluteAction::Left;
        case Direction::RIGHT:
                return AbsoluteAction::Right;
        case Direction::UP:
                return AbsoluteAction::Up;
        case Direction::DOWN:
                return AbsoluteAction::Down;
        }
        return AbsoluteAction::Idle;
}

const char *absolute_action_to_str(AbsoluteAction action)
{
        switch (action) {
        case AbsoluteAction::Left:
                return "Left";
        case AbsoluteAction::Right:
                return "Right";
        case AbsoluteAction::Up:
                return "Up";
        case AbsoluteAction::Down:
                return "Down";
        case AbsoluteAction::Idle:
                return "Idle";
        }
        return "Unknown";
}

const char *relative_action_to_str(RelativeAction action)
{
        switch (action) {
        case RelativeAction::Left:
                return "Left";
        case RelativeAction::Forward:
                return "Forward";
        case RelativeAction::Right:
                return "Right";
        }
        return "Unknown";
}

const char *engine_state_to_str(EngineState state)
{
        switch (state) {
        case EngineState::Ready:
                return "Ready";
        case EngineState::Running:
                return "Running";
        case EngineState::Terminal:
                return "Terminal";
        }
        return "Unknown";
}

} // namespace SnakeEngine
