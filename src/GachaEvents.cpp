#include "GachaEvents.h"

const char* gachaEventTypeName(GachaEventType type) {
    switch (type) {
    case GachaEventType::RollStarted:
        return "RollStarted";
    case GachaEventType::RollFulfilled:
        return "RollFulfilled";
    case GachaEventType::TokenPurchased:
        return "TokenPurchased";
    }
    return "Unknown";
}
