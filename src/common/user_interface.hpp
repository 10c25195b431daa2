#pragma once

#include "configuration.hpp"
#include "platform/interface/display.hpp"
#include "user_interface_customization.hpp"
#include <optional>

void render_config_menu(Display *display, Configuration *config,
                        ConfigurationDiff *diff, bool text_update_only,
                        UserInterfaceCustomization *customization);

void render_controls_explanations(Display *display);

/**
 * Renders a single line of text horizontally centered on the display with its
 * top edge at `y`.
 */
void render_centered_text(Display *display, int y, const char *text,
                          Color fg_color = White,
                          FontSize font_size = FontSize::Size16);

/**
 * Shows `help_text` word-wrapped on a cleared screen with a prompt to press
 * green. The caller waits for the input.
 */
void render_wrapped_help_text(Platform *p,
                              UserInterfaceCustomization *customization,
                              const char *help_text);

/**
 * Blocks until the green button is pressed. Returns `UserAction::CloseWindow`
 * if the window got closed while waiting.
 */
std::optional<UserAction> wait_until_green_pressed(Platform *p);
