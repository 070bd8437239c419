#include "RegistryPersistence.h"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "Utils.h"

bool RegistryPersistence::save(const BeastCollection& collection, const std::string& filePath) {
    nlohmann::json root = nlohmann::json::object();
    nlohmann::json beasts = nlohmann::json::array();

    for (const auto& beast : collection.all()) {
        beasts.push_back(beast.toJson());
    }
    root["beasts"] = beasts;

    ensureParentDirectory(filePath);
    std::ofstream file(filePath);
    if (!file.is_open()) {
        std::cerr << "저장 파일을 열 수 없습니다: " << filePath << "\n";
        return false;
    }
    file << root.dump(2);
    return true;
}

bool RegistryPersistence::load(BeastCollection& collection, const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (content.empty()) {
        return false;
    }

    try {
        nlohmann::json root = nlohmann::json::parse(content);
        std::vector<MintedBeast> beasts;
        if (root.contains("beasts")) {
            for (const auto& entry : root["beasts"]) {
                beasts.push_back(MintedBeast::fromJson(entry));
            }
        }
        collection.replaceAll(beasts);
    } catch (const std::exception& ex) {
        std::cerr << "저장 데이터를 불러오는 중 오류: " << ex.what() << "\n";
        return false;
    }
    return true;
}
