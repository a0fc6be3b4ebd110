#pragma once

#include <optional>
#include <string>

namespace salvo::core {

struct FileSystem {
    static bool exists(const std::string& path);

    // nullopt when the file cannot be opened; an empty file yields ""
    static std::optional<std::string> read_text(const std::string& path);
    static bool write_text(const std::string& path, const std::string& text);
};

} // namespace salvo::core
