#include "Beast.h"

#include <stdexcept>

#include "Utils.h"

nlohmann::json MintedBeast::toJson() const {
    nlohmann::json data = nlohmann::json::object();
    data["id"] = id;
    data["owner"] = owner;
    data["templateId"] = attributes.templateId;
    data["rarity"] = rarityName(attributes.rarity);
    data["hp"] = attributes.hp;
    data["attack"] = attributes.attack;
    data["defense"] = attributes.defense;
    data["element"] = elementToString(attributes.element);
    data["image"] = image;
    return data;
}

MintedBeast MintedBeast::fromJson(const nlohmann::json& data) {
    MintedBeast result;
    result.id = data.value<ItemId>("id", 0);
    result.owner = data.value<std::string>("owner", "");
    result.attributes.templateId = data.value<TemplateId>("templateId", 0);
    result.attributes.hp = data.value<std::uint32_t>("hp", 0);
    result.attributes.attack = data.value<std::uint32_t>("attack", 0);
    result.attributes.defense = data.value<std::uint32_t>("defense", 0);
    result.image = data.value<std::string>("image", "");

    auto rarity = rarityFromString(data.value<std::string>("rarity", ""));
    auto element = elementFromString(data.value<std::string>("element", ""));
    if (!rarity || !element || result.id == 0 || result.attributes.templateId == 0) {
        throw std::runtime_error("Malformed beast record");
    }
    result.attributes.rarity = *rarity;
    result.attributes.element = *element;
    return result;
}

std::optional<Element> elementFromCode(std::uint32_t code) {
    if (code == 0 || code > kMaxElementCode) {
        return std::nullopt;
    }
    return static_cast<Element>(code);
}

std::optional<Element> elementFromString(const std::string& name) {
    std::string lowered = toLower(name);
    if (lowered == "fire") return Element::Fire;
    if (lowered == "ice") return Element::Ice;
    if (lowered == "nature") return Element::Nature;
    if (lowered == "thunder") return Element::Thunder;
    return std::nullopt;
}

std::string elementToString(Element element) {
    switch (element) {
        case Element::Fire: return "Fire";
        case Element::Ice: return "Ice";
        case Element::Nature: return "Nature";
        case Element::Thunder: return "Thunder";
    }
    return "Unknown";
}

std::optional<Rarity> rarityFromString(const std::string& name) {
    std::string lowered = toLower(name);
    if (lowered == "common") return Rarity::Common;
    if (lowered == "rare") return Rarity::Rare;
    if (lowered == "unique") return Rarity::Unique;
    if (lowered == "legendary") return Rarity::Legendary;
    return std::nullopt;
}

std::string rarityName(Rarity rarity) {
    switch (rarity) {
        case Rarity::Common: return "Common";
        case Rarity::Rare: return "Rare";
        case Rarity::Unique: return "Unique";
        case Rarity::Legendary: return "Legendary";
    }
    return "Unknown";
}

std::string rarityToString(Rarity rarity) {
    switch (rarity) {
        case Rarity::Legendary: return "★★★★";
        case Rarity::Unique: return "★★★";
        case Rarity::Rare: return "★★";
        default: return "★";
    }
}
