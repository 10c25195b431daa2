#include "sfml_display.hpp"
#include "../../constants.hpp"
#include "font_provider.hpp"

static sf::Vector2f to_vector(Point point)
{
        return {static_cast<float>(point.x), static_cast<float>(point.y)};
}

static void apply_style(sf::Shape *shape, Color color, int border_width,
                        bool filled)
{
        sf::Color mapped = map_to_sf_color(color);
        shape->setFillColor(filled ? mapped : sf::Color::Transparent);
        shape->setOutlineColor(mapped);
        shape->setOutlineThickness(static_cast<float>(border_width));
}

void SfmlDisplay::setup() { texture->clear(sf::Color::Black); }

// Everything drawn stays on the render texture, there is no per-screen state
// to reset.
void SfmlDisplay::initialize() {}

void SfmlDisplay::clear(Color color)
{
        texture->clear(map_to_sf_color(color));
        texture->display();
}

void SfmlDisplay::draw_circle(Point center, int radius, Color color,
                              int border_width, bool filled)
{
        sf::CircleShape circle(static_cast<float>(radius));
        circle.setPosition(
            to_vector({.x = center.x - radius, .y = center.y - radius}));
        apply_style(&circle, color, border_width, filled);
        draw_shape(circle);
}

void SfmlDisplay::draw_rectangle(Point start, int width, int height,
                                 Color color, int border_width, bool filled)
{
        sf::RectangleShape rectangle(to_vector({.x = width, .y = height}));
        rectangle.setPosition(to_vector(start));
        apply_style(&rectangle, color, border_width, filled);
        draw_shape(rectangle);
}

void SfmlDisplay::draw_string(Point start, const char *string_buffer,
                              FontSize font_size, Color bg_color,
                              Color fg_color)
{
        sf::Text text(get_emulator_font(), string_buffer, font_size);
        text.setFillColor(map_to_sf_color(fg_color));
        text.setPosition(to_vector(start));

        // Text is drawn over an opaque box, otherwise a shorter string would
        // leave parts of the previous one visible.
        sf::FloatRect bounds = text.getLocalBounds();
        sf::RectangleShape background(
            {bounds.position.x + bounds.size.x, static_cast<float>(font_size)});
        background.setPosition(to_vector(start));
        background.setFillColor(map_to_sf_color(bg_color));

        texture->draw(background);
        draw_shape(text);
}

void SfmlDisplay::clear_region(Point top_left, Point bottom_right,
                               Color clear_color)
{
        draw_rectangle(top_left, bottom_right.x - top_left.x,
                       bottom_right.y - top_left.y, clear_color, 0, true);
}

void SfmlDisplay::set_title(const char *title) { window->setTitle(title); }

int SfmlDisplay::get_height() { return DISPLAY_HEIGHT; }

int SfmlDisplay::get_width() { return DISPLAY_WIDTH; }

int SfmlDisplay::get_display_margin() { return DISPLAY_MARGIN; }

bool SfmlDisplay::refresh()
{
        // Desktop environments flag windows that stop draining their event
        // queue as unresponsive.
        while (const std::optional event = window->pollEvent()) {
                if (event->is<sf::Event::Closed>()) {
                        window->close();
                        return false;
                }
        }

        window->clear();
        window->draw(sf::Sprite(texture->getTexture()));
        window->display();
        return true;
}

void SfmlDisplay::draw_shape(const sf::Drawable &drawable)
{
        texture->draw(drawable);
        texture->display();
}

/**
 * Expands an RGB565 colour from the shared palette into the 8 bit channels
 * SFML works with.
 */
sf::Color map_to_sf_color(Color color)
{
        auto expand = [](int channel, int bits) {
                int max = (1 << bits) - 1;
                return static_cast<uint8_t>((channel * 255 + max / 2) / max);
        };
        int red = (color >> 11) & 0x1F;
        int green = (color >> 5) & 0x3F;
        int blue = color & 0x1F;
        return sf::Color(expand(red, 5), expand(green, 6), expand(blue, 5));
}
