#pragma once

/**
 * Arrow keys on the emulator, the joystick on the device. The values are used
 * as array indices, do not reorder them.
 */
typedef enum Direction { UP = 0, RIGHT = 1, DOWN = 2, LEFT = 3 } Direction;

/**
 * The four coloured buttons. The emulator maps them to:
 *   - YELLOW: F1, opens the help screen
 *   - RED: Enter, confirms a menu
 *   - GREEN: Space, toggles the edited value
 *   - BLUE: Escape or Q, goes back or abandons the match
 */
typedef enum Action { YELLOW = 0, RED = 1, GREEN = 2, BLUE = 3 } Action;

const char *direction_to_str(Direction direction);
const char *action_to_str(Action action);
