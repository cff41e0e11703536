#pragma once

#include <string>
#include <vector>
#include "converter.hpp"

/// Where to look for images and where to put the generated packages
struct BatchConfig {
    std::string input_dir = "images";
    std::string output_dir = "vhdl";
    std::string extension = ".png";
    std::string output_extension = ".vhd";
    bool create_dirs = true;
};

/// Create the directories if allowed, then list matching images (sorted by path).
/// Throws ConversionError(Configuration) when discovery cannot proceed, including
/// when two inputs differ only in extension or case and would share an output file.
std::vector<ConversionJob> discover_jobs(const BatchConfig& config);

/// Parse a whole decimal string as an integer >= 1 (e.g. --jobs); rejects "3abc", "0", ""
bool parse_positive_int(const std::string& text, int& out);

/// Case-insensitive extension match; ext may be given with or without the dot
bool has_extension(const std::string& path, const std::string& ext);
