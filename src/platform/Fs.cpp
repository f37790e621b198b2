#include "Fs.h"
#include <fstream>
#include <filesystem>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace Platform {

std::optional<std::string> ReadTextFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    
    std::string content(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>()
    );
    return content;
}

bool WriteTextFile(const std::string& path, const std::string& text) {
    std::string tempPath = path + ".tmp";
    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }
        file << text;
        if (!file.good()) {
            return false;
        }
    }
    
    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

bool FileExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

} // namespace Platform
