#include "gridsnake_config.h"

#include "src/common/constants.hpp"
#include "src/common/logging.hpp"
#include "src/common/platform/emulator/emulator_delay.hpp"
#include "src/common/platform/emulator/file_persistent_storage.hpp"
#include "src/common/platform/emulator/font_provider.hpp"
#include "src/common/platform/emulator/sfml_controller.hpp"
#include "src/common/platform/emulator/sfml_display.hpp"
#include "src/common/platform/interface/platform.hpp"

#include "src/games/game_menu.hpp"

#include <SFML/Graphics.hpp>
#include <cstdlib>
#include <iostream>

#define TAG "emulator_entrypoint"

static void print_version(char *argv[])
{
        std::cout << argv[0] << " version: " << GRIDSNAKE_VERSION_MAJOR << "."
                  << GRIDSNAKE_VERSION_MINOR << std::endl;
}

int main(int argc, char *argv[])
{
        print_version(argv);

        const char *storage_path = std::getenv("GRIDSNAKE_STORAGE_FILE");
        if (!storage_path) {
                storage_path = GRIDSNAKE_STORAGE_FILE;
        }

        try {
                get_emulator_font();
        } catch (const sf::Exception &e) {
                LOG_ERROR(TAG, "Unable to load the font %s: %s",
                          GRIDSNAKE_FONT_PATH, e.what());
                return 1;
        }

        sf::RenderWindow window(sf::VideoMode({DISPLAY_WIDTH, DISPLAY_HEIGHT}),
                                "gridsnake");

        // Anything drawn stays on the texture until something is drawn on top
        // of it, so the screens only need to redraw what changed. The texture
        // is copied onto the window on every refresh.
        sf::RenderTexture texture({DISPLAY_WIDTH, DISPLAY_HEIGHT});

        LOG_DEBUG(TAG, "Initializing the display...");
        SfmlDisplay display(&window, &texture);
        display.setup();
        LOG_DEBUG(TAG, "Display initialized!");

        EmulatorDelay delay;
        SfmlDirectionalController arrow_controller =
            make_arrow_keys_controller();
        SfmlDirectionalController wasd_controller = make_wasd_controller();
        SfmlDirectionalController hjkl_controller = make_hjkl_controller();
        SfmlActionController action_controller;
        FilePersistentStorage persistent_storage(storage_path);
        LOG_INFO(TAG, "Using storage file %s",
                 persistent_storage.get_file_path().c_str());

        std::vector<DirectionalController *> controllers = {
            &arrow_controller,
            &wasd_controller,
            &hjkl_controller,
        };

        std::vector<ActionController *> action_controllers = {
            &action_controller,
        };

        for (DirectionalController *controller : controllers) {
                controller->setup();
        }
        action_controller.setup();

        Platform platform = {.display = &display,
                             .directional_controllers = &controllers,
                             .action_controllers = &action_controllers,
                             .delay_provider = &delay,
                             .persistent_storage = &persistent_storage};

        LOG_DEBUG(TAG, "Entering game loop...");
        while (window.isOpen()) {
                auto maybe_action = select_game(&platform);
                if (maybe_action.has_value() &&
                    maybe_action.value() == UserAction::CloseWindow) {
                        LOG_DEBUG(TAG, "User requested to close the "
                                       "window. Exiting...");
                        break;
                }
        }
        return 0;
}
