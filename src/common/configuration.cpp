#include <algorithm>
#include <cstring>
#include <optional>
#include <string>

#include "configuration.hpp"
#include "constants.hpp"
#include "logging.hpp"
#include "maths_utils.hpp"
#include "platform/interface/controller.hpp"
#include "user_interface.hpp"

#define TAG "configuration"

static void select_initial_index(ConfigurationOption *option, int index)
{
        if (index < 0) {
                LOG_WARN(TAG,
                         "Initial value of option '%s' is not available, "
                         "selecting the first value instead.",
                         option->name);
                index = 0;
        }
        option->currently_selected = index;
}

ConfigurationOption *ConfigurationOption::of_integers(const char *name,
                                                      std::vector<int> values,
                                                      int initial_value)
{
        ConfigurationOption *option = new ConfigurationOption();
        option->type = INT;
        option->name = name;
        option->int_values = std::move(values);
        option->available_values_len = option->int_values.size();
        for (int value : option->int_values) {
                int digits = std::to_string(value).size();
                option->max_config_value_len =
                    std::max(option->max_config_value_len, digits);
        }
        select_initial_index(option, option->index_of(initial_value));
        return option;
}

ConfigurationOption *
ConfigurationOption::of_strings(const char *name,
                                std::vector<const char *> values,
                                const char *initial_value)
{
        ConfigurationOption *option = new ConfigurationOption();
        option->type = STRING;
        option->name = name;
        option->str_values = std::move(values);
        option->available_values_len = option->str_values.size();
        for (const char *value : option->str_values) {
                option->max_config_value_len = std::max(
                    option->max_config_value_len, static_cast<int>(strlen(value)));
        }
        select_initial_index(option, option->index_of(initial_value));
        return option;
}

int ConfigurationOption::index_of(int value) const
{
        auto it = std::find(int_values.begin(), int_values.end(), value);
        return it == int_values.end() ? -1 : it - int_values.begin();
}

int ConfigurationOption::index_of(const char *value) const
{
        for (size_t i = 0; i < str_values.size(); i++) {
                if (strcmp(str_values[i], value) == 0) {
                        return i;
                }
        }
        return -1;
}

ConfigurationDiff empty_diff(const Configuration *config)
{
        ConfigurationDiff diff;
        diff.previously_edited_option = config->curr_selected_option;
        diff.currently_edited_option = config->curr_selected_option;
        return diff;
}

static void move_edited_row(Configuration *config, ConfigurationDiff *diff,
                            int offset)
{
        diff->previously_edited_option = config->curr_selected_option;
        config->curr_selected_option = mathematical_modulo(
            config->curr_selected_option + offset, config->options_len());
        diff->currently_edited_option = config->curr_selected_option;
        LOG_TRACE(TAG, "Edited row moved from %d to %d",
                  diff->previously_edited_option,
                  diff->currently_edited_option);
}

void switch_edited_config_option_up(Configuration *config,
                                    ConfigurationDiff *diff)
{
        move_edited_row(config, diff, -1);
}

void switch_edited_config_option_down(Configuration *config,
                                      ConfigurationDiff *diff)
{
        move_edited_row(config, diff, 1);
}

static void cycle_edited_value(Configuration *config, ConfigurationDiff *diff,
                               int offset)
{
        int row = config->curr_selected_option;
        ConfigurationOption *option = config->options[row];
        option->currently_selected = mathematical_modulo(
            option->currently_selected + offset, option->available_values_len);
        diff->modified_options.push_back(row);
}

void increment_current_option_value(Configuration *config,
                                    ConfigurationDiff *diff)
{
        cycle_edited_value(config, diff, 1);
}

void decrement_current_option_value(Configuration *config,
                                    ConfigurationDiff *diff)
{
        cycle_edited_value(config, diff, -1);
}

int find_max_config_option_value_text_length(Configuration *config)
{
        int longest = 0;
        for (const ConfigurationOption *option : config->options) {
                longest = std::max(longest, option->max_config_value_len);
        }
        return longest;
}

int find_max_config_option_name_text_length(Configuration *config)
{
        int longest = 0;
        for (const ConfigurationOption *option : config->options) {
                longest =
                    std::max(longest, static_cast<int>(strlen(option->name)));
        }
        return longest;
}

void free_configuration(Configuration *config)
{
        for (ConfigurationOption *option : config->options) {
                delete option;
        }
        delete config;
}

static void apply_direction(Configuration *config, ConfigurationDiff *diff,
                            Direction direction)
{
        switch (direction) {
        case UP:
                switch_edited_config_option_up(config, diff);
                break;
        case DOWN:
                switch_edited_config_option_down(config, diff);
                break;
        case LEFT:
                decrement_current_option_value(config, diff);
                break;
        case RIGHT:
                increment_current_option_value(config, diff);
                break;
        }
}

std::optional<UserAction>
collect_configuration(Platform *p, Configuration *config,
                      UserInterfaceCustomization *customization,
                      bool allow_exit)
{
        ConfigurationDiff initial_diff = empty_diff(config);
        render_config_menu(p->display, config, &initial_diff, false,
                           customization);
        if (customization->show_help_text) {
                render_controls_explanations(p->display);
        }

        while (true) {
                // Only the changes caused by this iteration's input are
                // redrawn.
                ConfigurationDiff diff = empty_diff(config);
                bool input_registered = false;

                std::optional<Action> action =
                    poll_action_input(p->action_controllers);
                if (action) {
                        input_registered = true;
                        switch (*action) {
                        case Action::RED:
                                LOG_DEBUG(TAG, "Configuration '%s' confirmed.",
                                          config->name);
                                p->delay_provider->delay_ms(
                                    MOVE_REGISTERED_DELAY);
                                return std::nullopt;
                        case Action::YELLOW:
                                p->delay_provider->delay_ms(
                                    MOVE_REGISTERED_DELAY);
                                return UserAction::ShowHelp;
                        case Action::BLUE:
                                if (allow_exit) {
                                        p->delay_provider->delay_ms(
                                            MOVE_REGISTERED_DELAY);
                                        return UserAction::Exit;
                                }
                                break;
                        case Action::GREEN:
                                increment_current_option_value(config, &diff);
                                break;
                        }
                }

                if (std::optional<Direction> direction =
                        poll_directional_input(p->directional_controllers)) {
                        input_registered = true;
                        apply_direction(config, &diff, *direction);
                }

                if (input_registered) {
                        render_config_menu(p->display, config, &diff, true,
                                           customization);
                        p->delay_provider->delay_ms(MOVE_REGISTERED_DELAY);
                }
                p->delay_provider->delay_ms(INPUT_POLLING_DELAY);
                if (!p->display->refresh()) {
                        return UserAction::CloseWindow;
                }
        }
}
