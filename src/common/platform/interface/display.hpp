#pragma once
#include "../../point.hpp"
#include "color.hpp"
#include "font_size.hpp"

/**
 * Drawing surface the menus and the board are rendered on. Coordinates are in
 * pixels with the origin in the top left corner.
 *
 * Whatever is drawn is retained until something is drawn over it, so the
 * game loops only redraw the cells that changed since the previous move.
 */
class Display
{
      public:
        // Called once by `main` before the first screen is rendered.
        virtual void setup() = 0;
        // Called at the start of every full-screen redraw.
        virtual void initialize() = 0;
        virtual void clear(Color color) = 0;

        /**
         * Shapes are drawn with an outline of `border_width` pixels, a
         * `filled` shape also has its inside painted with `color`.
         */
        virtual void draw_circle(Point center, int radius, Color color,
                                 int border_width, bool filled) = 0;
        virtual void draw_rectangle(Point start, int width, int height,
                                    Color color, int border_width,
                                    bool filled) = 0;

        /**
         * `start` is the top left corner of the text. The area behind the
         * glyphs is painted with `bg_color` first.
         */
        virtual void draw_string(Point start, const char *string_buffer,
                                 FontSize font_size, Color bg_color,
                                 Color fg_color) = 0;
        virtual void clear_region(Point top_left, Point bottom_right,
                                  Color clear_color) = 0;

        // Caption of the hosting window, the score is shown there.
        virtual void set_title(const char *title) = 0;

        virtual int get_height() = 0;
        virtual int get_width() = 0;
        // Pixels kept free along every edge when laying out the board.
        virtual int get_display_margin() = 0;

        /**
         * Presents the frame and drains pending window events. Returns false
         * once the window was closed, the caller must then unwind to `main`
         * with `UserAction::CloseWindow`.
         */
        virtual bool refresh() = 0;

        virtual ~Display() = default;
};
