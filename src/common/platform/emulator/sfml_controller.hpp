#pragma once
#include "../interface/controller.hpp"
#include <SFML/Window/Keyboard.hpp>

#include <utility>
#include <vector>

/**
 * Directional controller reading a set of four keyboard keys. The emulator
 * registers one instance per layout (arrows, WASD, HJKL).
 */
class SfmlDirectionalController : public DirectionalController
{
      public:
        explicit SfmlDirectionalController(
            std::vector<std::pair<sf::Keyboard::Key, Direction>> key_map)
            : key_map(std::move(key_map))
        {
        }

        bool poll_for_input(Direction *input) override;
        void setup() override {}

      private:
        std::vector<std::pair<sf::Keyboard::Key, Direction>> key_map;
};

/**
 * Maps the keyboard onto the four action buttons:
 *   - Enter: RED
 *   - Space: GREEN
 *   - Escape / Q: BLUE
 *   - F1: YELLOW
 */
class SfmlActionController : public ActionController
{
      public:
        bool poll_for_input(Action *input) override;
        void setup() override {}
};

SfmlDirectionalController make_arrow_keys_controller();
SfmlDirectionalController make_wasd_controller();
SfmlDirectionalController make_hjkl_controller();
