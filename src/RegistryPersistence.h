#pragma once

#include <string>

#include "BeastCollection.h"

class RegistryPersistence {
public:
    static bool save(const BeastCollection& collection, const std::string& filePath);
    static bool load(BeastCollection& collection, const std::string& filePath);
};
