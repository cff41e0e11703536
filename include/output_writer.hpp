#pragma once

#include <string>

/// Write text to path through a temporary file and rename, so the
/// destination is either replaced completely or left untouched.
/// Throws ConversionError(DestinationWrite) on failure.
void write_text_atomic(const std::string& path, const std::string& text);
