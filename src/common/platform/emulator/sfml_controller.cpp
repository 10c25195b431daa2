#include "sfml_controller.hpp"
#include "../../logging.hpp"

#define TAG "sfml_controller"

using Key = sf::Keyboard::Key;

bool SfmlDirectionalController::poll_for_input(Direction *input)
{
        for (const auto &[key, direction] : key_map) {
                if (sf::Keyboard::isKeyPressed(key)) {
                        LOG_TRACE(TAG, "Key pressed: %s",
                                  direction_to_str(direction));
                        *input = direction;
                        return true;
                }
        }
        return false;
}

bool SfmlActionController::poll_for_input(Action *input)
{
        static const std::vector<std::pair<Key, Action>> key_map = {
            {Key::Enter, Action::RED},   {Key::Space, Action::GREEN},
            {Key::Escape, Action::BLUE}, {Key::Q, Action::BLUE},
            {Key::F1, Action::YELLOW},
        };
        for (const auto &[key, action] : key_map) {
                if (sf::Keyboard::isKeyPressed(key)) {
                        LOG_TRACE(TAG, "Action pressed: %s",
                                  action_to_str(action));
                        *input = action;
                        return true;
                }
        }
        return false;
}

SfmlDirectionalController make_arrow_keys_controller()
{
        return SfmlDirectionalController({{Key::Up, Direction::UP},
                                          {Key::Right, Direction::RIGHT},
                                          {Key::Down, Direction::DOWN},
                                          {Key::Left, Direction::LEFT}});
}

SfmlDirectionalController make_wasd_controller()
{
        return SfmlDirectionalController({{Key::W, Direction::UP},
                                          {Key::D, Direction::RIGHT},
                                          {Key::S, Direction::DOWN},
                                          {Key::A, Direction::LEFT}});
}

SfmlDirectionalController make_hjkl_controller()
{
        return SfmlDirectionalController({{Key::K, Direction::UP},
                                          {Key::L, Direction::RIGHT},
                                          {Key::J, Direction::DOWN},
                                          {Key::H, Direction::LEFT}});
}
