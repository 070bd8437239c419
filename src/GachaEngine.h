#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "Amount.h"
#include "BeastCatalog.h"
#include "BeastRoller.h"
#include "GachaEvents.h"
#include "Logger.h"
#include "NFTRegistry.h"
#include "RandomnessProvider.h"
#include "TokenLedger.h"

enum class RollState {
    Idle,
    Rolling
};

// 소각형 소환 엔진.
//
// initiateRoll은 지불 토큰을 가져와 즉시 소각한 뒤 난수를 요청하고 사용자를 Rolling으로 둔다.
// 난수는 제공자가 나중에 rawFulfillRandomWords로 전달하며, 그때 속성을 도출해 민팅하고
// 사용자를 Idle로 되돌린다. 모든 작업은 하나의 재진입 가능한 락 아래에서 끝까지 실행되므로
// 같은 사용자에 대한 시작과 이행이 섞이지 않는다. 이벤트는 작업이 확정되고 락을 푼 뒤 전달되며,
// 리스너의 예외는 로그로만 남고 작업 결과를 바꾸지 않는다.
//
// 난수가 끝내 오지 않으면 사용자는 Rolling에 머물고 지불분도 돌려받지 못한다.
// 타임아웃이나 수동 복구 경로는 없다.
class GachaEngine : public RandomnessConsumer {
public:
    GachaEngine(UserId identity,
        TokenLedger& ledger,
        RandomnessProvider& provider,
        NFTRegistry& registry,
        std::shared_ptr<const BeastCatalog> catalog,
        Amount rollPrice,
        RandomnessRequest requestParams = {},
        std::shared_ptr<Logger> logger = nullptr);

    RequestId initiateRoll(const UserId& user);

    // 등록된 제공자만 호출할 수 있다. 알 수 없는 요청 id는 무시하고 false를 돌려준다.
    bool rawFulfillRandomWords(const UserId& caller, RequestId requestId,
        const std::vector<Word256>& randomWords) override;

    RollState stateOf(const UserId& user) const;
    std::optional<RequestId> pendingRequestOf(const UserId& user) const;
    std::optional<UserId> userForRequest(RequestId requestId) const;
    std::size_t pendingRollCount() const;

    const Amount& rollPrice() const;
    const UserId& identity() const;
    const BeastCatalog& catalog() const;

    void subscribe(GachaEventListener listener);

private:
    bool onRandomnessFulfilled(RequestId requestId, const std::vector<Word256>& randomWords);
    void emit(const GachaEvent& event) const;

    UserId identity_;
    TokenLedger& ledger_;
    RandomnessProvider& provider_;
    NFTRegistry& registry_;
    BeastRoller roller_;
    Amount rollPrice_;
    RandomnessRequest requestParams_;
    std::shared_ptr<Logger> logger_;

    mutable std::recursive_mutex mutex_;
    std::unordered_map<UserId, RollState> states_;
    std::unordered_map<RequestId, UserId> requests_;
    std::vector<GachaEventListener> listeners_;
};

const char* rollStateName(RollState state);
