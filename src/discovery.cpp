#include "discovery.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

static std::string lower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

bool has_extension(const std::string& path, const std::string& ext) {
    std::string want = lower(ext);
    if (!want.empty() && want[0] != '.') want.insert(want.begin(), '.');
    return lower(fs::path(path).extension().string()) == want;
}

bool parse_positive_int(const std::string& text, int& out) {
    size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(text, &pos);
    } catch (const std::exception&) {
        return false;
    }
    if (pos != text.size() || value < 1) return false;
    out = value;
    return true;
}

static void ensure_directory(const std::string& dir, bool create, const char* role) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return;

    if (fs::exists(dir, ec)) {
        throw ConversionError(ErrorKind::Configuration,
                              std::string(role) + " is not a directory: " + dir);
    }
    if (!create) {
        throw ConversionError(ErrorKind::Configuration,
                              std::string(role) + " does not exist: " + dir);
    }
    fs::create_directories(dir, ec);
    if (ec) {
        throw ConversionError(ErrorKind::Configuration,
                              "Cannot create " + std::string(role) + " " + dir +
                              " (" + ec.message() + ")");
    }
}

std::vector<ConversionJob> discover_jobs(const BatchConfig& config) {
    ensure_directory(config.input_dir, config.create_dirs, "input directory");
    ensure_directory(config.output_dir, config.create_dirs, "output directory");

    std::vector<fs::path> sources;
    std::error_code ec;
    for (fs::directory_iterator it(config.input_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        if (!has_extension(it->path().string(), config.extension)) continue;
        sources.push_back(it->path());
    }
    if (ec) {
        throw ConversionError(ErrorKind::Configuration,
                              "Cannot list " + config.input_dir + " (" + ec.message() + ")");
    }
    std::sort(sources.begin(), sources.end());

    // Output names are compared case-insensitively: a.png and a.PNG would
    // share a.vhd, and Logo.png / logo.png would share package logo_graphic
    std::map<std::string, std::string> claimed;

    std::vector<ConversionJob> jobs;
    jobs.reserve(sources.size());
    for (const auto& src : sources) {
        ConversionJob job;
        job.input_path = src.string();
        fs::path out = fs::path(config.output_dir) / src.stem();
        out += config.output_extension;
        job.output_path = out.string();
        job.name = base_name(job.input_path);

        auto inserted = claimed.emplace(lower(job.output_path), job.input_path);
        if (!inserted.second) {
            throw ConversionError(ErrorKind::Configuration,
                                  job.input_path + " and " + inserted.first->second +
                                  " would both be written to " + job.output_path);
        }
        jobs.push_back(job);
    }
    return jobs;
}
