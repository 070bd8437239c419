#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Amount.h"
#include "Beast.h"

using RequestId = std::uint64_t;

struct RandomnessRequest {
    std::string keyHash;
    std::uint64_t subscriptionId{0};
    std::uint16_t requestConfirmations{3};
    std::uint32_t callbackGasLimit{200000};
    std::uint32_t numWords{1};
};

// 제공자가 비동기로 호출하는 콜백 쪽 인터페이스
class RandomnessConsumer {
public:
    virtual ~RandomnessConsumer() = default;

    // caller는 호출한 제공자의 식별자다. 요청 하나당 정확히 한 번 호출된다.
    virtual bool rawFulfillRandomWords(const UserId& caller, RequestId requestId,
        const std::vector<Word256>& randomWords) = 0;
};

class RandomnessProvider {
public:
    virtual ~RandomnessProvider() = default;

    virtual const UserId& identity() const = 0;

    // 즉시 반환한다. 결과는 나중에 consumer.rawFulfillRandomWords로 전달되며
    // requestRandomWords 호출 안에서 전달되는 일은 없다.
    virtual RequestId requestRandomWords(RandomnessConsumer& consumer, const RandomnessRequest& request) = 0;
};
