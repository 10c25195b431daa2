#pragma once

#include "platform/interface/platform.hpp"
#include "user_interface_customization.hpp"
#include <optional>
#include <utility>
#include <vector>

typedef enum ConfigurationOptionType {
        INT,
        STRING,
} ConfigurationOptionType;

/**
 * Interruptions that can happen while a screen is waiting for user input. They
 * are returned up the call chain until a loop that knows how to handle them.
 */
enum class UserAction {
        PlayAgain,
        Exit,
        ShowHelp,
        // The emulator window was closed, everything needs to unwind to main.
        CloseWindow,
};

/**
 * A single row of a settings menu: a name and a fixed list of values the user
 * cycles through. Only one of `int_values` and `str_values` is populated,
 * which one is given by `type`.
 */
typedef struct ConfigurationOption {
        ConfigurationOptionType type;
        const char *name;
        std::vector<int> int_values;
        std::vector<const char *> str_values;
        int available_values_len;
        // Index into the populated value list.
        int currently_selected;
        // Widest value in characters, the menu aligns value cells on it.
        int max_config_value_len;

        ConfigurationOption()
            : type(INT), name(nullptr), available_values_len(0),
              currently_selected(0), max_config_value_len(0)
        {
        }

      public:
        /**
         * Both factories select `initial_value` if it is one of `values`,
         * otherwise the first value. Stored settings can refer to values
         * that are not offered anymore.
         */
        static ConfigurationOption *of_integers(const char *name,
                                                std::vector<int> values,
                                                int initial_value);
        static ConfigurationOption *of_strings(const char *name,
                                               std::vector<const char *> values,
                                               const char *initial_value);

        int get_curr_int_value() const
        {
                return int_values[currently_selected];
        }

        const char *get_current_str_value() const
        {
                return str_values[currently_selected];
        }

        /**
         * Returns the index of `value` in the value list or -1 if it is not
         * offered by this option.
         */
        int index_of(int value) const;
        int index_of(const char *value) const;
} ConfigurationOption;

/**
 * An ordered group of options shown together on one menu screen. The
 * configuration owns its options, release it with `free_configuration`.
 */
struct Configuration {
        // Rendered as the heading of the menu.
        const char *name;
        std::vector<ConfigurationOption *> options;
        // Row that is currently edited, marked by the selector dot.
        int curr_selected_option;

        Configuration(const char *name,
                      std::vector<ConfigurationOption *> options)
            : name(name), options(std::move(options)), curr_selected_option(0)
        {
        }

        int options_len() const { return static_cast<int>(options.size()); }
};

/**
 * Records what a single input changed in a `Configuration` so that the menu
 * can redraw only the affected parts: the selector when the edited row moves,
 * and the value cells listed in `modified_options`.
 */
struct ConfigurationDiff {
        int previously_edited_option;
        int currently_edited_option;
        std::vector<int> modified_options;
};

ConfigurationDiff empty_diff(const Configuration *config);

/**
 * Moves the edited row, wrapping around at both ends of the menu.
 */
void switch_edited_config_option_down(Configuration *config,
                                      ConfigurationDiff *diff);
void switch_edited_config_option_up(Configuration *config,
                                    ConfigurationDiff *diff);

/**
 * Cycles the value of the edited row, wrapping around at both ends of its
 * value list.
 */
void increment_current_option_value(Configuration *config,
                                    ConfigurationDiff *diff);
void decrement_current_option_value(Configuration *config,
                                    ConfigurationDiff *diff);

int find_max_config_option_name_text_length(Configuration *config);
int find_max_config_option_value_text_length(Configuration *config);

/**
 * Shows the menu for `config` and lets the user edit it in place until the
 * red button confirms it, in which case `std::nullopt` is returned.
 *
 * Yellow requests the help screen and blue (only if `allow_exit`) requests
 * leaving the menu, both are returned as the corresponding `UserAction` for
 * the caller to handle. Green cycles the value of the edited row.
 */
std::optional<UserAction>
collect_configuration(Platform *p, Configuration *config,
                      UserInterfaceCustomization *customization,
                      bool allow_exit = true);

void free_configuration(Configuration *config);
