#pragma once

/**
 * Font sizes supported by the displays. The numeric value is the character
 * height in pixels.
 */
typedef enum FontSize {
        Size16 = 16,
        Size24 = 24,
} FontSize;
