#include "quantizer.hpp"

uint16_t quantize(const Color& color) {
    uint16_t r4 = quantize_channel(static_cast<uint8_t>(color.r));
    uint16_t g4 = quantize_channel(static_cast<uint8_t>(color.g));
    uint16_t b4 = quantize_channel(static_cast<uint8_t>(color.b));
    return static_cast<uint16_t>((r4 << 8) | (g4 << 4) | b4);
}

PackedGrid quantize_image(const Image& image) {
    PackedGrid result(image.height, std::vector<uint16_t>(image.width, 0));

    for (int y = 0; y < image.height; y++) {
        for (int x = 0; x < image.width; x++) {
            result[y][x] = quantize(image.pixel(x, y));
        }
    }

    return result;
}
