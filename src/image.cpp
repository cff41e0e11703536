#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#include "image.hpp"
#include "errors.hpp"
#include <string>

// --- Image loading ---

Image load_image(const std::string& path, AlphaMode alpha, Color bg_color) {
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);  // Force RGBA
    if (!data) {
        const char* reason = stbi_failure_reason();
        throw ConversionError(ErrorKind::SourceRead,
                              "Failed to load image: " + path +
                              " (" + (reason ? reason : "unknown error") + ")");
    }

    Image img;
    img.width = w;
    img.height = h;
    img.rgb.resize(static_cast<size_t>(w) * h * 3);

    const size_t n = static_cast<size_t>(w) * h;
    if (alpha == AlphaMode::Composite) {
        // Composite alpha onto background color
        for (size_t i = 0; i < n; i++) {
            float a = data[i * 4 + 3] / 255.0f;
            img.rgb[i * 3 + 0] = static_cast<uint8_t>(data[i * 4 + 0] * a + bg_color.r * (1 - a));
            img.rgb[i * 3 + 1] = static_cast<uint8_t>(data[i * 4 + 1] * a + bg_color.g * (1 - a));
            img.rgb[i * 3 + 2] = static_cast<uint8_t>(data[i * 4 + 2] * a + bg_color.b * (1 - a));
        }
    } else {
        for (size_t i = 0; i < n; i++) {
            img.rgb[i * 3 + 0] = data[i * 4 + 0];
            img.rgb[i * 3 + 1] = data[i * 4 + 1];
            img.rgb[i * 3 + 2] = data[i * 4 + 2];
        }
    }
    stbi_image_free(data);

    return img;
}

bool parse_color_name(const std::string& name, Color& out) {
    if (name == "black") {
        out = {0, 0, 0};
    } else if (name == "white") {
        out = {255, 255, 255};
    } else if (name == "red") {
        out = {255, 0, 0};
    } else if (name == "yellow") {
        out = {255, 255, 0};
    } else {
        return false;
    }
    return true;
}
