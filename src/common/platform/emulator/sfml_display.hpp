#pragma once
#include "../interface/display.hpp"
#include <SFML/Graphics.hpp>

/**
 * Display implementation backed by an SFML window. Shapes are drawn onto a
 * render texture which keeps them until something else is drawn on top, the
 * texture is copied to the window on every `refresh()`.
 */
class SfmlDisplay : public Display
{
      public:
        SfmlDisplay(sf::RenderWindow *window, sf::RenderTexture *texture)
            : window(window), texture(texture)
        {
        }

        void setup() override;
        void initialize() override;
        void clear(Color color) override;
        void draw_circle(Point center, int radius, Color color,
                         int border_width, bool filled) override;
        void draw_rectangle(Point start, int width, int height, Color color,
                            int border_width, bool filled) override;
        void draw_string(Point start, const char *string_buffer,
                         FontSize font_size, Color bg_color,
                         Color fg_color) override;
        void clear_region(Point top_left, Point bottom_right,
                          Color clear_color) override;
        void set_title(const char *title) override;
        int get_height() override;
        int get_width() override;
        int get_display_margin() override;
        bool refresh() override;

      private:
        void draw_shape(const sf::Drawable &drawable);

        sf::RenderWindow *window;
        sf::RenderTexture *texture;
};

sf::Color map_to_sf_color(Color color);
