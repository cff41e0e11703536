#pragma once

#include <cstdint>
#include <vector>
#include "image.hpp"

/// height rows of width packed 12-bit codes
using PackedGrid = std::vector<std::vector<uint16_t>>;

/// Reduce an 8-bit channel to 4 bits (truncating)
inline uint8_t quantize_channel(uint8_t value) {
    return static_cast<uint8_t>(value >> 4);
}

/// Pack an RGB triple into 12 bits: R4 in [11:8], G4 in [7:4], B4 in [3:0]
uint16_t quantize(const Color& color);

/// Quantize every pixel, rows top to bottom, columns left to right
PackedGrid quantize_image(const Image& image);
