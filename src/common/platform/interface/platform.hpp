#pragma once
#include "controller.hpp"
#include "delay.hpp"
#include "display.hpp"
#include "persistent_storage.hpp"
#include <vector>

/**
 * Everything the human game needs from its host. `main` of the emulator wires
 * the SFML implementations together, the screens only ever see this struct.
 * None of the pointers are owned.
 */
struct Platform {
        Display *display;
        // Polled in order, see `poll_directional_input`.
        std::vector<DirectionalController *> *directional_controllers;
        std::vector<ActionController *> *action_controllers;
        DelayProvider *delay_provider;
        // Holds the snake settings and the leaderboard.
        PersistentStorage *persistent_storage;
};
