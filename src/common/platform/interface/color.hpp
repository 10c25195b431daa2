#pragma once
#include <cstdint>
#include <vector>

/**
 * Colors are encoded using RGB565: 5 bits of red, 6 bits of green and 5 bits
 * of blue packed into a 16 bit integer. The named values below form the
 * palette used by the menus; arbitrary colors (e.g. the snake body gradient)
 * can be obtained using `rgb_to_color`.
 */
typedef enum Color : uint16_t {
        White = 0xFFFF,
        Black = 0x0000,
        Blue = 0x001F,
        BRed = 0XF81F,
        GRed = 0XFFE0,
        Gblue = 0X07FF,
        Red = 0xF800,
        Magenta = 0xF81F,
        Green = 0x07E0,
        Cyan = 0x7FFF,
        Yellow = 0xFFE0,
        Brown = 0XBC40,
        BRRed = 0XFC07,
        Gray = 0X8430,
        DarkBlue = 0X01CF,
        LightBlue = 0X7D7C,
        GrayBlue = 0X5458,
        LightGreen = 0X841F,
        LGray = 0XC618,
        LGrayBlue = 0XA651,
        LBBlue = 0X2B12,
} Color;

/**
 * Packs 8-bit-per-channel RGB components into the RGB565 color encoding.
 * Precision of the lower bits of each channel is lost.
 */
Color rgb_to_color(uint8_t red, uint8_t green, uint8_t blue);

/**
 * Linearly interpolates between `start` and `end` producing `steps` colors.
 * The first color is always `start` and, for steps > 1, the last one is `end`.
 * Used to render the snake body fading from the head to the tail.
 */
std::vector<Color> color_gradient(Color start, Color end, int steps);
