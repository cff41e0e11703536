// Exact package text, identifier casing and grid validation
#undef NDEBUG
#include <cassert>
#include <iostream>
#include <regex>
#include <string>
#include "errors.hpp"
#include "quantizer.hpp"
#include "vhdl_module.hpp"

static ErrorKind kind_of_module_error(const PackedGrid& grid) {
    try {
        module_lines(grid, make_identifier("x"));
    } catch (const ConversionError& e) {
        return e.kind();
    }
    return ErrorKind::None;
}

static void test_single_red_pixel() {
    PackedGrid grid = {{quantize({255, 0, 0})}};
    std::string text = render_module(grid, make_identifier("Red"));
    const std::string expected =
        "library ieee;\n"
        "use ieee.std_logic_1164.all;\n"
        "\n"
        "package red_graphic is\n"
        "    constant red_width : integer := 1;\n"
        "    constant red_height : integer := 1;\n"
        "    type red_array is array (0 to red_height-1, 0 to red_width-1) of std_logic_vector(11 downto 0);\n"
        "    constant RED_IMAGE : red_array := (\n"
        "    (X\"F00\")\n"
        "    );\n"
        "end package red_graphic;\n";
    assert(text == expected);
}

static void test_black_and_white_row() {
    PackedGrid grid = {{quantize({0, 0, 0}), quantize({255, 255, 255})}};
    auto lines = module_lines(grid, make_identifier("bw"));
    assert(lines.size() == 11);
    assert(lines[4] == "    constant bw_width : integer := 2;");
    assert(lines[5] == "    constant bw_height : integer := 1;");
    assert(lines[8] == "    (X\"000\", X\"FFF\")");
}

static void test_trailing_commas() {
    PackedGrid grid = {
        {0x001, 0x002},
        {0x0A0, 0xB00},
        {0xFFF, 0x000},
    };
    auto lines = module_lines(grid, make_identifier("tri"));
    assert(lines[8] == "    (X\"001\", X\"002\"),");
    assert(lines[9] == "    (X\"0A0\", X\"B00\"),");
    assert(lines[10] == "    (X\"FFF\", X\"000\")");
    assert(lines[11] == "    );");
    assert(lines[12] == "end package tri_graphic;");
}

static void test_identifier_casing() {
    Identifier id = identifier_from_path("assets/Logo.png");
    assert(id.lower == "logo");
    assert(id.upper == "LOGO");

    std::string text = render_module({{0x123}}, id);
    assert(text.find("package logo_graphic is\n") != std::string::npos);
    assert(text.find("constant logo_width : integer := 1;") != std::string::npos);
    assert(text.find("constant logo_height : integer := 1;") != std::string::npos);
    assert(text.find("type logo_array is array (0 to logo_height-1, 0 to logo_width-1)") != std::string::npos);
    assert(text.find("constant LOGO_IMAGE : logo_array := (") != std::string::npos);
    assert(text.find("end package logo_graphic;") != std::string::npos);
    assert(text.find("Logo") == std::string::npos);

    bool threw = false;
    try {
        make_identifier("");
    } catch (const ConversionError& e) {
        threw = e.kind() == ErrorKind::Validation;
    }
    assert(threw);
}

static ErrorKind identifier_error(const std::string& name) {
    try {
        make_identifier(name);
    } catch (const ConversionError& e) {
        return e.kind();
    }
    return ErrorKind::None;
}

static void test_identifier_must_be_vhdl_name() {
    assert(identifier_error("logo") == ErrorKind::None);
    assert(identifier_error("Logo_v2") == ErrorKind::None);
    assert(identifier_error("a1_b2_c3") == ErrorKind::None);

    assert(identifier_error("my logo-v2") == ErrorKind::Validation);
    assert(identifier_error("2logo") == ErrorKind::Validation);
    assert(identifier_error("_logo") == ErrorKind::Validation);
    assert(identifier_error("logo_") == ErrorKind::Validation);
    assert(identifier_error("lo__go") == ErrorKind::Validation);
    assert(identifier_error("logo.v2") == ErrorKind::Validation);

    assert(base_name("dir/my logo-v2.png") == "my logo-v2");
}

static void test_hex_literal() {
    assert(hex_literal(0x000) == "X\"000\"");
    assert(hex_literal(0x00F) == "X\"00F\"");
    assert(hex_literal(0xABC) == "X\"ABC\"");
    assert(hex_literal(0xFFF) == "X\"FFF\"");
}

static void test_rejects_degenerate_grids() {
    assert(kind_of_module_error({}) == ErrorKind::Validation);
    assert(kind_of_module_error({{}}) == ErrorKind::Validation);
    assert(kind_of_module_error({{1, 2}, {3}}) == ErrorKind::Validation);
}

static void test_literals_reparse_to_grid() {
    Image img;
    img.width = 5;
    img.height = 4;
    for (int i = 0; i < img.width * img.height * 3; i++) {
        img.rgb.push_back(static_cast<uint8_t>((i * 37 + 11) % 256));
    }
    PackedGrid grid = quantize_image(img);
    std::string text = render_module(grid, make_identifier("pattern"));

    std::regex literal("X\"([0-9A-F]{3})\"");
    std::vector<uint16_t> parsed;
    for (std::sregex_iterator it(text.begin(), text.end(), literal), end; it != end; ++it) {
        parsed.push_back(static_cast<uint16_t>(std::stoi((*it)[1].str(), nullptr, 16)));
    }
    assert(parsed.size() == 20);
    for (int y = 0; y < img.height; y++) {
        for (int x = 0; x < img.width; x++) {
            assert(parsed[y * img.width + x] == grid[y][x]);
        }
    }

    assert(text.find("pattern_width : integer := 5;") != std::string::npos);
    assert(text.find("pattern_height : integer := 4;") != std::string::npos);
    assert(render_module(grid, make_identifier("pattern")) == text);
}

int main() {
    test_single_red_pixel();
    test_black_and_white_row();
    test_trailing_commas();
    test_identifier_casing();
    test_identifier_must_be_vhdl_name();
    test_hex_literal();
    test_rejects_degenerate_grids();
    test_literals_reparse_to_grid();
    std::cout << "Test vhdl module passed\n";
    return 0;
}
