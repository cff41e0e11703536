#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "quantizer.hpp"

/// The two casings of a package name used in the generated source
struct Identifier {
    std::string lower;  // package, type and width/height constant names
    std::string upper;  // image constant name
};

/// Build both casings of a name.
/// Throws ConversionError(Validation) unless the name is a basic VHDL identifier:
/// a letter, then letters, digits and single underscores, not ending in '_'.
Identifier make_identifier(const std::string& name);

/// File base name without directory or extension ("img/Logo.png" -> "Logo")
std::string base_name(const std::string& path);

/// Identifier from a file's base name ("img/Logo.png" -> logo/LOGO)
Identifier identifier_from_path(const std::string& path);

/// Render a packed code as a 12-bit VHDL literal, e.g. X"0F3"
std::string hex_literal(uint16_t code);

/// Emit the package as a sequence of lines (no line terminators).
/// Throws ConversionError(Validation) for an empty or ragged grid.
std::vector<std::string> module_lines(const PackedGrid& grid, const Identifier& id);

/// Full file text: lines joined with '\n', terminated by a final '\n'
std::string render_module(const PackedGrid& grid, const Identifier& id);
