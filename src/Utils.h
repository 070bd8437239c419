#pragma once

#include <cstdint>
#include <string>

std::string toLower(std::string value);
std::string trim(const std::string& value);
void ensureDirectory(const std::string& path);
void ensureParentDirectory(const std::string& filePath);
std::int64_t unixNow();
