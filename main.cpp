#include "converter.hpp"
#include "discovery.hpp"
#include "image.hpp"

#include <iostream>
#include <string>
#include <vector>

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "       " << prog << " --file <image_path> --out <file.vhd> [--name <identifier>]\n"
              << "\n"
              << "Image to VHDL ROM package converter (12-bit RGB444 constant array)\n"
              << "\n"
              << "Options:\n"
              << "  --input-dir <dir>           Folder scanned for images (default: images)\n"
              << "  --output-dir <dir>          Folder for generated .vhd files (default: vhdl)\n"
              << "  --ext <ext>                 Image extension to convert (default: .png)\n"
              << "  --no-create                 Fail instead of creating missing folders\n"
              << "  --jobs <n>                  Convert n images in parallel (default: 1)\n"
              << "  --alpha <discard|composite> Alpha handling (default: discard)\n"
              << "  --bg <black|white|red|yellow>  Background for --alpha composite (default: black)\n"
              << "  --file <path>               Convert a single image\n"
              << "  --out <path>                Output file for --file\n"
              << "  --name <identifier>         Package name for --file (default: file base name)\n"
              << "  --help                      Show this help message\n";
}

static void report(const ConversionResult& r) {
    if (r.ok()) {
        std::cout << "Converted: " << r.job.input_path << " -> " << r.job.output_path
                  << " (" << r.width << "x" << r.height << ", "
                  << r.bytes_written << " bytes)" << std::endl;
    } else {
        std::cerr << "Error: " << r.job.input_path << ": "
                  << error_kind_name(r.error) << ": " << r.message << std::endl;
    }
}

int main(int argc, char* argv[]) {
    BatchConfig config;
    ConvertOptions options;
    int jobs = 1;
    std::string single_file;
    std::string single_out;
    std::string single_name;
    std::string alpha_name = "discard";
    std::string bg_name = "black";

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--no-create") {
            config.create_dirs = false;
        } else if (arg == "--input-dir" && i + 1 < argc) {
            config.input_dir = argv[++i];
        } else if (arg == "--output-dir" && i + 1 < argc) {
            config.output_dir = argv[++i];
        } else if (arg == "--ext" && i + 1 < argc) {
            config.extension = argv[++i];
        } else if (arg == "--jobs" && i + 1 < argc) {
            if (!parse_positive_int(argv[++i], jobs)) {
                std::cerr << "Invalid job count: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--alpha" && i + 1 < argc) {
            alpha_name = argv[++i];
        } else if (arg == "--bg" && i + 1 < argc) {
            bg_name = argv[++i];
        } else if (arg == "--file" && i + 1 < argc) {
            single_file = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            single_out = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            single_name = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (alpha_name == "discard") {
        options.alpha = AlphaMode::Discard;
    } else if (alpha_name == "composite") {
        options.alpha = AlphaMode::Composite;
    } else {
        std::cerr << "Unknown alpha mode: " << alpha_name << std::endl;
        return 1;
    }

    if (!parse_color_name(bg_name, options.bg_color)) {
        std::cerr << "Unknown background color: " << bg_name << std::endl;
        return 1;
    }

    try {
        std::vector<ConversionJob> work;

        if (!single_file.empty()) {
            if (single_out.empty()) {
                std::cerr << "Error: --file requires --out." << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            ConversionJob job;
            job.input_path = single_file;
            job.output_path = single_out;
            job.name = single_name.empty() ? base_name(single_file) : single_name;
            work.push_back(job);
        } else {
            std::cout << "Scanning: " << config.input_dir << " (*" << config.extension
                      << ") -> " << config.output_dir << std::endl;
            work = discover_jobs(config);
            if (work.empty()) {
                std::cout << "No images found." << std::endl;
                return 0;
            }
        }

        auto results = run_batch(work, options, jobs);
        for (const auto& r : results) {
            report(r);
        }

        auto summary = summarize(results);
        std::cout << "Converted " << summary.succeeded << "/" << summary.total
                  << " image(s)";
        if (summary.failed > 0) {
            std::cout << ", " << summary.failed << " failed";
        }
        std::cout << std::endl;
        return summary.failed > 0 ? 2 : 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
