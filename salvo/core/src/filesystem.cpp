#include <salvo/core/filesystem.hpp>
#include <fstream>
#include <sstream>

namespace salvo::core {

bool FileSystem::exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

std::optional<std::string> FileSystem::read_text(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) return std::nullopt;

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool FileSystem::write_text(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) return false;
    file << text;
    file.flush();
    return file.good();
}

} // namespace salvo::core
