#include "converter.hpp"
#include "output_writer.hpp"
#include "quantizer.hpp"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

std::string encode_image(const Image& image, const Identifier& id) {
    if (image.empty()) {
        throw ConversionError(ErrorKind::Validation, "Image has zero width or height");
    }
    if (image.rgb.size() != static_cast<size_t>(image.width) * image.height * 3) {
        throw ConversionError(ErrorKind::Validation, "Pixel buffer does not match image size");
    }
    return render_module(quantize_image(image), id);
}

ConversionResult convert(const ConversionJob& job, const ConvertOptions& options) {
    ConversionResult result;
    result.job = job;

    try {
        Identifier id = make_identifier(job.name);
        Image image = load_image(job.input_path, options.alpha, options.bg_color);
        result.width = image.width;
        result.height = image.height;

        std::string text = encode_image(image, id);
        write_text_atomic(job.output_path, text);
        result.bytes_written = text.size();
    } catch (const ConversionError& e) {
        result.error = e.kind();
        result.message = e.what();
    } catch (const std::exception& e) {
        // Anything else escaping a single conversion (e.g. bad_alloc on a huge image)
        result.error = ErrorKind::SourceRead;
        result.message = e.what();
    }

    return result;
}

std::vector<ConversionResult> run_batch(const std::vector<ConversionJob>& jobs,
                                        const ConvertOptions& options,
                                        int workers) {
    std::vector<ConversionResult> results(jobs.size());
    if (jobs.empty()) return results;

    int n_threads = std::min<int>(std::max(workers, 1), static_cast<int>(jobs.size()));
    if (n_threads == 1) {
        for (size_t i = 0; i < jobs.size(); i++) {
            results[i] = convert(jobs[i], options);
        }
        return results;
    }

    // Each worker claims the next unprocessed job; results land in their own slot
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next++; i < jobs.size(); i = next++) {
            results[i] = convert(jobs[i], options);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(n_threads);
    try {
        for (int t = 0; t < n_threads; t++) {
            threads.emplace_back(worker);
        }
    } catch (const std::system_error&) {
        // Out of threads: the caller's thread works alongside whatever started
        worker();
    }
    for (auto& th : threads) {
        th.join();
    }

    return results;
}

BatchSummary summarize(const std::vector<ConversionResult>& results) {
    BatchSummary summary;
    summary.total = results.size();
    for (const auto& r : results) {
        if (r.ok()) {
            summary.succeeded++;
        } else {
            summary.failed++;
        }
    }
    return summary;
}
