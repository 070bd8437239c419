#include "BeastCatalog.h"

#include <limits>
#include <stdexcept>

#include "GachaError.h"

BeastCatalog::BeastCatalog(const std::vector<std::uint32_t>& templateIds,
    const std::vector<std::uint32_t>& elementCodes,
    const std::vector<std::string>& images) {
    if (templateIds.size() != elementCodes.size() || templateIds.size() != images.size()) {
        throw GachaError(GachaErrorCode::LengthMismatch,
            "catalog lists differ in length (" + std::to_string(templateIds.size()) + ", "
                + std::to_string(elementCodes.size()) + ", " + std::to_string(images.size()) + ")");
    }
    if (templateIds.empty()) {
        throw GachaError(GachaErrorCode::ZeroValue, "catalog must contain at least one template");
    }

    for (size_t i = 0; i < templateIds.size(); ++i) {
        std::uint32_t id = templateIds[i];
        std::uint32_t code = elementCodes[i];
        if (id == 0 || code == 0) {
            throw GachaError(GachaErrorCode::ZeroValue, "catalog entry " + std::to_string(i) + " has a zero template id or element");
        }
        if (code > kMaxElementCode) {
            throw GachaError(GachaErrorCode::OutOfBound, "catalog entry " + std::to_string(i) + " has element code " + std::to_string(code));
        }
        if (id > std::numeric_limits<TemplateId>::max()) {
            throw GachaError(GachaErrorCode::OutOfBound, "template id " + std::to_string(id) + " is too large");
        }

        TemplateId templateId = static_cast<TemplateId>(id);
        if (templates_.count(templateId) != 0) {
            throw GachaError(GachaErrorCode::DuplicateValue, "template id " + std::to_string(id) + " appears twice");
        }

        BeastTemplate tmpl;
        tmpl.templateId = templateId;
        tmpl.element = *elementFromCode(code);
        tmpl.image = images[i];
        order_.push_back(templateId);
        templates_.emplace(templateId, tmpl);
    }
}

BeastCatalog BeastCatalog::fromJson(const nlohmann::json& data) {
    std::vector<std::uint32_t> ids;
    std::vector<std::uint32_t> elements;
    std::vector<std::string> images;

    try {
        for (const auto& id : data.at("templateIds")) {
            ids.push_back(id.get<std::uint32_t>());
        }
        for (const auto& element : data.at("elements")) {
            if (element.is_string()) {
                auto parsed = elementFromString(element.get<std::string>());
                if (!parsed) {
                    throw GachaError(GachaErrorCode::OutOfBound, "unknown element '" + element.get<std::string>() + "'");
                }
                elements.push_back(static_cast<std::uint32_t>(*parsed));
            } else {
                elements.push_back(element.get<std::uint32_t>());
            }
        }
        if (data.contains("images")) {
            for (const auto& image : data.at("images")) {
                images.push_back(image.get<std::string>());
            }
        } else {
            images.assign(ids.size(), "");
        }
    } catch (const nlohmann::json::exception& ex) {
        throw GachaError(GachaErrorCode::InvalidConfig, std::string("catalog seed data: ") + ex.what());
    }

    return BeastCatalog(ids, elements, images);
}

BeastCatalog BeastCatalog::defaultCatalog() {
    return BeastCatalog(
        {1, 2, 3, 4, 5, 6},
        {1, 2, 3, 4, 1, 3},
        {
            "ipfs://etherbeast/1.png",
            "ipfs://etherbeast/2.png",
            "ipfs://etherbeast/3.png",
            "ipfs://etherbeast/4.png",
            "ipfs://etherbeast/5.png",
            "ipfs://etherbeast/6.png"
        });
}

std::size_t BeastCatalog::size() const {
    return order_.size();
}

const BeastTemplate& BeastCatalog::atIndex(std::size_t index) const {
    if (index >= order_.size()) {
        throw std::out_of_range("beast index out of range");
    }
    return templates_.at(order_[index]);
}

const BeastTemplate* BeastCatalog::find(TemplateId templateId) const {
    auto it = templates_.find(templateId);
    if (it == templates_.end()) {
        return nullptr;
    }
    return &it->second;
}

const std::vector<TemplateId>& BeastCatalog::templateIds() const {
    return order_;
}
