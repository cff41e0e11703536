#include "vhdl_module.hpp"
#include "errors.hpp"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <sstream>

static std::string to_lower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

static std::string to_upper(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return s;
}

static bool is_vhdl_identifier(const std::string& name) {
    if (name.empty() || !std::isalpha(static_cast<unsigned char>(name[0]))) return false;
    if (name.back() == '_' || name.find("__") != std::string::npos) return false;
    for (char ch : name) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_') return false;
    }
    return true;
}

Identifier make_identifier(const std::string& name) {
    if (name.empty()) {
        throw ConversionError(ErrorKind::Validation, "Identifier must not be empty");
    }
    if (!is_vhdl_identifier(name)) {
        throw ConversionError(ErrorKind::Validation,
                              "'" + name + "' is not a valid VHDL identifier "
                              "(use letters, digits and single underscores, starting with a letter)");
    }
    return {to_lower(name), to_upper(name)};
}

std::string base_name(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

Identifier identifier_from_path(const std::string& path) {
    return make_identifier(base_name(path));
}

std::string hex_literal(uint16_t code) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "X\"%03X\"", static_cast<unsigned>(code & 0xFFF));
    return buf;
}

static void validate_grid(const PackedGrid& grid) {
    if (grid.empty() || grid[0].empty()) {
        throw ConversionError(ErrorKind::Validation,
                              "Image has zero width or height");
    }
    const size_t width = grid[0].size();
    for (size_t y = 0; y < grid.size(); y++) {
        if (grid[y].size() != width) {
            std::ostringstream oss;
            oss << "Row " << y << " has " << grid[y].size()
                << " pixels, expected " << width;
            throw ConversionError(ErrorKind::Validation, oss.str());
        }
    }
}

std::vector<std::string> module_lines(const PackedGrid& grid, const Identifier& id) {
    validate_grid(grid);

    const std::string& l = id.lower;
    const size_t width = grid[0].size();
    const size_t height = grid.size();

    std::vector<std::string> lines;
    lines.reserve(height + 10);

    lines.push_back("library ieee;");
    lines.push_back("use ieee.std_logic_1164.all;");
    lines.push_back("");
    lines.push_back("package " + l + "_graphic is");
    lines.push_back("    constant " + l + "_width : integer := " + std::to_string(width) + ";");
    lines.push_back("    constant " + l + "_height : integer := " + std::to_string(height) + ";");
    lines.push_back("    type " + l + "_array is array (0 to " + l + "_height-1, 0 to " + l +
                    "_width-1) of std_logic_vector(11 downto 0);");
    lines.push_back("    constant " + id.upper + "_IMAGE : " + l + "_array := (");

    // Every row but the last carries a trailing comma
    for (size_t y = 0; y < height; y++) {
        std::string row = "    (";
        for (size_t x = 0; x < width; x++) {
            if (x > 0) row += ", ";
            row += hex_literal(grid[y][x]);
        }
        row += (y + 1 < height) ? ")," : ")";
        lines.push_back(row);
    }

    lines.push_back("    );");
    lines.push_back("end package " + l + "_graphic;");
    return lines;
}

std::string render_module(const PackedGrid& grid, const Identifier& id) {
    std::string text;
    for (const auto& line : module_lines(grid, id)) {
        text += line;
        text += '\n';
    }
    return text;
}
