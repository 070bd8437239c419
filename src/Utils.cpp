#include "Utils.h"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <system_error>

std::string toLower(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

std::string trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

void ensureDirectory(const std::string& path) {
    if (path.empty()) {
        return;
    }
    // 만들지 못하면 이후 파일 열기에서 실패가 드러난다
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
}

void ensureParentDirectory(const std::string& filePath) {
    std::filesystem::path parent = std::filesystem::path(filePath).parent_path();
    if (parent.empty()) {
        return;
    }
    ensureDirectory(parent.string());
}

std::int64_t unixNow() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}
