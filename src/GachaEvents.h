#pragma once

#include <functional>
#include <optional>

#include "Amount.h"
#include "Beast.h"
#include "RandomnessProvider.h"

enum class GachaEventType {
    RollStarted,
    RollFulfilled,
    TokenPurchased
};

struct GachaEvent {
    GachaEventType type{GachaEventType::RollStarted};
    UserId user;
    RequestId requestId{0};
    Amount amount{0};
    std::optional<ItemId> itemId;
};

using GachaEventListener = std::function<void(const GachaEvent&)>;

const char* gachaEventTypeName(GachaEventType type);
