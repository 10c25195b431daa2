#include "color.hpp"

Color rgb_to_color(uint8_t red, uint8_t green, uint8_t blue)
{
        uint16_t r = (red >> 3) & 0b11111;
        uint16_t g = (green >> 2) & 0b111111;
        uint16_t b = (blue >> 3) & 0b11111;
        return static_cast<Color>((r << 11) | (g << 5) | b);
}

std::vector<Color> color_gradient(Color start, Color end, int steps)
{
        std::vector<Color> gradient;
        if (steps <= 0) {
                return gradient;
        }

        // Interpolation happens on the unpacked channels, otherwise carries
        // between the packed bit fields would corrupt the result.
        int start_channels[3] = {start >> 11, (start >> 5) & 0b111111,
                                 start & 0b11111};
        int end_channels[3] = {end >> 11, (end >> 5) & 0b111111,
                               end & 0b11111};

        gradient.push_back(start);
        for (int step = 1; step < steps; step++) {
                float t = static_cast<float>(step) / (steps - 1);
                int channels[3];
                for (int i = 0; i < 3; i++) {
                        channels[i] = static_cast<int>(
                            start_channels[i] +
                            t * (end_channels[i] - start_channels[i]));
                }
                gradient.push_back(static_cast<Color>(
                    (channels[0] << 11) | (channels[1] << 5) | channels[2]));
        }
        return gradient;
}
