#include "common_transitions.hpp"
#include "../common/constants.hpp"
#include "../common/logging.hpp"
#include "../common/user_interface.hpp"

#include <cstdio>

#define TAG "common_transitions"

static void display_input_clarification(Display *display)
{
        int y_pos = (display->get_height() - FONT_SIZE) / 2 + 3 * FONT_SIZE;
        render_centered_text(display, y_pos, "Press blue to exit.");
        render_centered_text(display, y_pos + FONT_SIZE,
                             "Press any arrow to try again.");
}

static void display_end_screen(Display *display, const char *heading,
                               Color color, const char *details)
{
        display->clear(Black);
        display->draw_rectangle(
            {.x = SCREEN_BORDER_WIDTH, .y = SCREEN_BORDER_WIDTH},
            display->get_width() - 2 * SCREEN_BORDER_WIDTH,
            display->get_height() - 2 * SCREEN_BORDER_WIDTH, color,
            SCREEN_BORDER_WIDTH, false);

        int y_pos = (display->get_height() - HEADING_FONT_SIZE) / 2;
        render_centered_text(display, y_pos, heading, color, FontSize::Size24);
        if (details) {
                render_centered_text(display, y_pos + 2 * FONT_SIZE, details);
        }
        display_input_clarification(display);
}

void display_game_over(Display *display,
                       UserInterfaceCustomization *customization,
                       const char *details)
{
        display_end_screen(display, "Game Over", Red, details);
}

void display_game_won(Display *display,
                      UserInterfaceCustomization *customization,
                      const char *details)
{
        display_end_screen(display, "You Won!", Green, details);
}

std::optional<UserAction> display_countdown(Platform *p, int seconds)
{
        Display *display = p->display;
        int y_pos = (display->get_height() - HEADING_FONT_SIZE) / 2;
        for (int remaining = seconds; remaining > 0; remaining--) {
                display->clear(Black);
                render_centered_text(display, y_pos - 2 * FONT_SIZE,
                                     "Game starts in");
                char buffer[4];
                snprintf(buffer, sizeof(buffer), "%d", remaining);
                render_centered_text(display, y_pos, buffer, White,
                                     FontSize::Size24);
                LOG_DEBUG(TAG, "Game starts in %d", remaining);

                // Refresh often enough to keep the window responsive.
                for (int elapsed = 0; elapsed < 1000;
                     elapsed += INPUT_POLLING_DELAY) {
                        if (!display->refresh()) {
                                return UserAction::CloseWindow;
                        }
                        p->delay_provider->delay_ms(INPUT_POLLING_DELAY);
                }
        }
        return std::nullopt;
}

std::optional<UserAction> pause_until_input(Platform *p,
                                            std::optional<Action> *action)
{
        while (true) {
                if (poll_directional_input(p->directional_controllers)) {
                        *action = std::nullopt;
                        break;
                }
                if (auto registered = poll_action_input(p->action_controllers)) {
                        *action = registered;
                        break;
                }
                p->delay_provider->delay_ms(INPUT_POLLING_DELAY);
                // Window events are only processed on refresh, closing the
                // window while paused has to go through here.
                if (!p->display->refresh()) {
                        return UserAction::CloseWindow;
                }
        }
        p->delay_provider->delay_ms(MOVE_REGISTERED_DELAY);
        return std::nullopt;
}
