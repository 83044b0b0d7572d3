#include "gambit/core/util/AtomicFileWriter.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace gambit::core::util {

namespace {

bool Report(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

}  // namespace

bool AtomicFileWriter::Write(const std::string& path, const std::string& contents, std::string* error) {
    const std::filesystem::path fs_path(path);
    if (!fs_path.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(fs_path.parent_path(), ec);
        if (ec) {
            return Report(error, "Failed to create directory " + fs_path.parent_path().string() + ": " + ec.message());
        }
    }

    const std::string temp_path = path + ".tmp";
    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Report(error, "Failed to open temp file: " + temp_path);
        }
        output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        output.flush();
        if (!output) {
            return Report(error, "Failed to write temp file: " + temp_path);
        }
    }

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        std::remove(temp_path.c_str());
        return Report(error, "rename failed for " + path);
    }
    return true;
}

}  // namespace gambit::core::util
