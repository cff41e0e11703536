#include "output_writer.hpp"
#include "errors.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <system_error>

void write_text_atomic(const std::string& path, const std::string& text) {
    namespace fs = std::filesystem;
    // Unique per call so concurrent writers never share a temporary file
    static std::atomic<unsigned long> counter{0};
    const std::string tmp_path = path + ".tmp" + std::to_string(counter++);

    {
        std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
        if (!ofs.good()) {
            throw ConversionError(ErrorKind::DestinationWrite, "Cannot write file: " + path);
        }
        ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
        ofs.flush();
        if (!ofs.good()) {
            ofs.close();
            std::error_code ignored;
            fs::remove(tmp_path, ignored);
            throw ConversionError(ErrorKind::DestinationWrite, "Short write to file: " + path);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw ConversionError(ErrorKind::DestinationWrite,
                              "Cannot replace " + path + " (" + ec.message() + ")");
    }
}
