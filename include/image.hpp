#pragma once

#include <cstdint>
#include <string>
#include <vector>

/// RGB color
struct Color {
    int r, g, b;
};

/// How an alpha channel in the source is folded into RGB
enum class AlphaMode {
    Discard,    // keep RGB as stored, drop alpha
    Composite,  // blend over a background color
};

/// Decoded 8-bit-per-channel RGB image, row-major, 3 bytes per pixel
struct Image {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgb;

    bool empty() const { return width <= 0 || height <= 0; }

    Color pixel(int x, int y) const {
        size_t idx = (static_cast<size_t>(y) * width + x) * 3;
        return {rgb[idx], rgb[idx + 1], rgb[idx + 2]};
    }
};

/// Load an image file and normalize it to 8-bit RGB.
/// Throws ConversionError(SourceRead) when the file cannot be decoded.
Image load_image(const std::string& path,
                 AlphaMode alpha = AlphaMode::Discard,
                 Color bg_color = {0, 0, 0});

/// Parse a background color name (black, white, red, yellow)
bool parse_color_name(const std::string& name, Color& out);
