#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "errors.hpp"
#include "image.hpp"
#include "vhdl_module.hpp"

/// One image to convert
struct ConversionJob {
    std::string input_path;
    std::string output_path;
    std::string name;  // package name, validated and cased when the job runs
};

/// Options shared by every conversion in a batch
struct ConvertOptions {
    AlphaMode alpha = AlphaMode::Discard;
    Color bg_color = {0, 0, 0};
};

/// Outcome of a single conversion
struct ConversionResult {
    ConversionJob job;
    ErrorKind error = ErrorKind::None;
    std::string message;
    int width = 0;
    int height = 0;
    size_t bytes_written = 0;

    bool ok() const { return error == ErrorKind::None; }
};

struct BatchSummary {
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;
};

/// Convert the image in memory to package text (no I/O)
std::string encode_image(const Image& image, const Identifier& id);

/// Load, quantize, serialize and write one image.
/// Per-image failures are returned in the result, never thrown.
ConversionResult convert(const ConversionJob& job, const ConvertOptions& options = {});

/// Run every job; with workers > 1 jobs are spread over threads.
/// Results come back in job order.
std::vector<ConversionResult> run_batch(const std::vector<ConversionJob>& jobs,
                                        const ConvertOptions& options = {},
                                        int workers = 1);

BatchSummary summarize(const std::vector<ConversionResult>& results);
