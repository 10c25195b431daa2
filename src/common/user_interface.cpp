#include "user_interface.hpp"
#include "configuration.hpp"
#include "constants.hpp"
#include "logging.hpp"
#include "platform/interface/color.hpp"
#include "platform/interface/controller.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

#define TAG "user_interface"

#define SELECTOR_CIRCLE_RADIUS 5
// Blank characters between the option name and its value cell.
#define NAME_VALUE_GAP 2

static int centered_x(int screen_width, int font_width, int text_length)
{
        return (screen_width - text_length * font_width) / 2;
}

/**
 * Pixel positions of every element of the option menu. The layout only
 * depends on the display size and the text lengths of the configuration so it
 * is the same for the initial render and all partial updates.
 *
 * The menu is split vertically into the heading, the option bars and the
 * remaining space below them, with equal gaps in between:
 *
 *       Heading
 *
 *   +--------------------------+
 *   | Speed      [    Medium ] |   o  <- selector of the edited option
 *   +--------------------------+
 *   | Board      [        30 ] |
 *   +--------------------------+
 */
typedef struct MenuLayout {
        int heading_y;
        std::vector<int> bar_ys;
        int bar_x;
        int bar_width;
        int bar_height;
        int name_x;
        int value_cell_x;
        int value_cell_width;
        int value_cell_height;
        int selector_x;
        int name_len;
        int value_len;
} MenuLayout;

static MenuLayout compute_menu_layout(Display *display, Configuration *config)
{
        MenuLayout layout;
        layout.name_len = find_max_config_option_name_text_length(config);
        layout.value_len = find_max_config_option_value_text_length(config);

        int width = display->get_width();
        int text_len = layout.name_len + NAME_VALUE_GAP + layout.value_len;
        int h_padding = FONT_WIDTH / 2;

        layout.name_x = centered_x(width, FONT_WIDTH, text_len);
        layout.bar_x = layout.name_x - h_padding;
        layout.bar_width = text_len * FONT_WIDTH + 2 * h_padding;
        layout.bar_height = 2 * FONT_SIZE;
        layout.value_cell_x =
            layout.name_x + (layout.name_len + NAME_VALUE_GAP / 2) * FONT_WIDTH;
        layout.value_cell_width = layout.value_len * FONT_WIDTH + 2 * h_padding;
        layout.value_cell_height = FONT_SIZE + FONT_SIZE / 2;

        int bars = config->options_len();
        int bar_gap = FONT_SIZE * 3 / 4;
        int bars_height = bars * layout.bar_height + (bars - 1) * bar_gap;
        int spacing =
            (display->get_height() - bars_height - HEADING_FONT_SIZE) / 3;

        layout.heading_y = spacing;
        int first_bar_y = layout.heading_y + HEADING_FONT_SIZE + spacing;
        for (int i = 0; i < bars; i++) {
                layout.bar_ys.push_back(first_bar_y +
                                        i * (layout.bar_height + bar_gap));
        }

        int bar_end = layout.bar_x + layout.bar_width;
        layout.selector_x = bar_end + (width - bar_end) / 2;
        return layout;
}

static std::string format_option_value(const ConfigurationOption &option,
                                       int width)
{
        char buffer[64];
        if (option.type == INT) {
                snprintf(buffer, sizeof(buffer), "%*d", width,
                         option.get_curr_int_value());
        } else {
                snprintf(buffer, sizeof(buffer), "%*s", width,
                         option.get_current_str_value());
        }
        return buffer;
}

static void render_value_cell(Display *display, const MenuLayout &layout,
                              int bar_y, const char *value, Color accent)
{
        Point cell = {.x = layout.value_cell_x, .y = bar_y - FONT_SIZE / 4};
        display->draw_rectangle(cell, layout.value_cell_width,
                                layout.value_cell_height, Black, 0, true);
        display->draw_rectangle(cell, layout.value_cell_width,
                                layout.value_cell_height, accent, 1, false);
        display->draw_string({.x = cell.x + FONT_WIDTH / 2, .y = bar_y}, value,
                             Size16, Black, White);
}

static void render_option_bar(Display *display, const MenuLayout &layout,
                              int bar_y, const char *name, Color accent)
{
        display->draw_rectangle({.x = layout.bar_x, .y = bar_y - FONT_SIZE / 2},
                                layout.bar_width, layout.bar_height, accent, 1,
                                false);
        display->draw_string({.x = layout.name_x, .y = bar_y}, name, Size16,
                             Black, White);
}

static void move_selector(Display *display, const MenuLayout &layout,
                          int from, int to, Color accent)
{
        int bars = layout.bar_ys.size();
        if (from < 0 || from >= bars || to < 0 || to >= bars) {
                LOG_WARN(TAG, "Selector index out of range: %d -> %d", from,
                         to);
                return;
        }
        display->draw_circle(
            {.x = layout.selector_x, .y = layout.bar_ys[from] + FONT_SIZE / 2},
            SELECTOR_CIRCLE_RADIUS, Black, 0, true);
        display->draw_circle(
            {.x = layout.selector_x, .y = layout.bar_ys[to] + FONT_SIZE / 2},
            SELECTOR_CIRCLE_RADIUS, accent, 0, true);
}

/**
 * @param `text_update_only` set once the menu has been drawn in full, only the
 * value cells listed in `diff` and the selector are redrawn then.
 */
void render_config_menu(Display *display, Configuration *config,
                        ConfigurationDiff *diff, bool text_update_only,
                        UserInterfaceCustomization *customization)
{
        MenuLayout layout = compute_menu_layout(display, config);
        Color accent = customization->accent_color;

        if (!text_update_only) {
                display->initialize();
                display->clear(Black);
                display->draw_string(
                    {.x = centered_x(display->get_width(), HEADING_FONT_WIDTH,
                                     strlen(config->name)),
                     .y = layout.heading_y},
                    config->name, Size24, Black, White);
        }

        for (int i = 0; i < config->options_len(); i++) {
                const ConfigurationOption &option = *config->options[i];
                bool modified =
                    std::find(diff->modified_options.begin(),
                              diff->modified_options.end(),
                              i) != diff->modified_options.end();
                if (text_update_only && !modified) {
                        continue;
                }
                if (!text_update_only) {
                        render_option_bar(display, layout, layout.bar_ys[i],
                                          option.name, accent);
                }
                std::string value =
                    format_option_value(option, layout.value_len);
                render_value_cell(display, layout, layout.bar_ys[i],
                                  value.c_str(), accent);
        }

        if (!text_update_only ||
            diff->previously_edited_option != diff->currently_edited_option) {
                move_selector(display, layout, diff->previously_edited_option,
                              diff->currently_edited_option, accent);
        }
}

typedef struct ButtonHint {
        Color color;
        const char *label;
} ButtonHint;

/**
 * Renders the legend of the four buttons along the bottom edge of the screen,
 * spread evenly across its width.
 */
void render_controls_explanations(Display *display)
{
        const std::vector<ButtonHint> hints = {
            {.color = Blue, .label = "Back"},
            {.color = Yellow, .label = "Help"},
            {.color = Green, .label = "Toggle"},
            {.color = Red, .label = "Next"}};
        int dot_radius = 2;
        int dot_width = 2 * dot_radius + FONT_WIDTH / 4;
        int side_margin = 2 * FONT_WIDTH;

        int content_width = 0;
        for (const ButtonHint &hint : hints) {
                content_width += dot_width + strlen(hint.label) * FONT_WIDTH;
        }
        int gap = (display->get_width() - 2 * side_margin - content_width) /
                  (static_cast<int>(hints.size()) - 1);

        int text_y = display->get_height() - 3 * FONT_SIZE / 2;
        int x = side_margin;
        for (const ButtonHint &hint : hints) {
                display->draw_circle(
                    {.x = x + dot_radius, .y = text_y + FONT_SIZE / 2},
                    dot_radius, hint.color, 0, true);
                x += dot_width;
                display->draw_string({.x = x, .y = text_y}, hint.label,
                                     FontSize::Size16, Black, White);
                x += strlen(hint.label) * FONT_WIDTH + gap;
        }
}

void render_centered_text(Display *display, int y, const char *text,
                          Color fg_color, FontSize font_size)
{
        int font_width =
            font_size == FontSize::Size24 ? HEADING_FONT_WIDTH : FONT_WIDTH;
        int x = centered_x(display->get_width(), font_width, strlen(text));
        display->draw_string({.x = x, .y = y}, text, font_size, Black,
                             fg_color);
}

/**
 * Splits `text` into lines of at most `line_chars` characters without breaking
 * words. Words longer than a line get a line of their own.
 */
static std::vector<std::string> wrap_words(const char *text, int line_chars)
{
        std::vector<std::string> lines;
        std::istringstream words(text);
        std::string word;
        std::string line;
        while (words >> word) {
                if (!line.empty() &&
                    line.size() + 1 + word.size() >
                        static_cast<size_t>(line_chars)) {
                        lines.push_back(line);
                        line.clear();
                }
                line += line.empty() ? word : " " + word;
        }
        if (!line.empty()) {
                lines.push_back(line);
        }
        return lines;
}

/**
 * Clears the screen and renders `help_text` wrapped to the display width,
 * with a framed 'OK' prompt next to a green dot in the bottom right corner.
 */
void render_wrapped_help_text(Platform *p,
                              UserInterfaceCustomization *customization,
                              const char *help_text)
{
        Display *display = p->display;
        display->clear(Black);

        int margin = display->get_display_margin();
        int line_chars = (display->get_width() - 2 * margin) / FONT_WIDTH;
        std::vector<std::string> lines = wrap_words(help_text, line_chars);
        for (size_t i = 0; i < lines.size(); i++) {
                int y = 2 * FONT_SIZE + static_cast<int>(i) * FONT_SIZE;
                display->draw_string({.x = margin, .y = y}, lines[i].c_str(),
                                     FontSize::Size16, Black, White);
        }

        const char *ok = "OK";
        int ok_len = strlen(ok);
        Point ok_start = {.x = display->get_width() - FONT_WIDTH * (ok_len + 3),
                          .y = display->get_height() - 2 * FONT_SIZE};
        display->draw_rectangle(
            {.x = ok_start.x - FONT_WIDTH / 2, .y = ok_start.y - FONT_SIZE / 4},
            (ok_len + 2) * FONT_WIDTH + FONT_WIDTH / 2,
            FONT_SIZE + FONT_SIZE / 2, customization->accent_color, 1, false);
        display->draw_string(ok_start, ok, FontSize::Size16, Black, White);
        display->draw_circle({.x = ok_start.x + (ok_len + 1) * FONT_WIDTH,
                              .y = ok_start.y + FONT_SIZE / 2},
                             SELECTOR_CIRCLE_RADIUS, Green, 0, true);
}

std::optional<UserAction> wait_until_green_pressed(Platform *p)
{
        while (poll_action_input(p->action_controllers) != Action::GREEN) {
                p->delay_provider->delay_ms(INPUT_POLLING_DELAY);
                if (!p->display->refresh()) {
                        return UserAction::CloseWindow;
                }
        }
        LOG_DEBUG(TAG, "Green pressed, continuing.");
        p->delay_provider->delay_ms(MOVE_REGISTERED_DELAY);
        return std::nullopt;
}
