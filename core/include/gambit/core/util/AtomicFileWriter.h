#pragma once

#include <string>

namespace gambit::core::util {

// Writes `contents` to `path + ".tmp"` and renames it over `path`, creating
// missing parent directories first. Readers never observe a partial file.
class AtomicFileWriter {
public:
    static bool Write(const std::string& path, const std::string& contents, std::string* error = nullptr);
};

}  // namespace gambit::core::util
