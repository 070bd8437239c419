#include "GachaEngine.h"

#include <exception>
#include <string>

#include "GachaError.h"

namespace {
// 한 번의 롤 시작 안에서 장부에 반영한 효과를 기억해 두었다가 실패하면 되돌린다
class RollCharge {
public:
    RollCharge(TokenLedger& ledger, const UserId& user) : ledger_(ledger), user_(user) {}

    void recordPull(const Amount& amount) { pulled_ = amount; }
    void recordBurn(const Amount& amount) { burned_ = amount; }

    void rollback() {
        if (pulled_ > 0 || burned_ > 0) {
            ledger_.restore(user_, pulled_, burned_);
            pulled_ = 0;
            burned_ = 0;
        }
    }

private:
    TokenLedger& ledger_;
    const UserId& user_;
    Amount pulled_{0};
    Amount burned_{0};
};
} // 익명 네임스페이스 종료

const char* rollStateName(RollState state) {
    return state == RollState::Rolling ? "Rolling" : "Idle";
}

GachaEngine::GachaEngine(UserId identity,
    TokenLedger& ledger,
    RandomnessProvider& provider,
    NFTRegistry& registry,
    std::shared_ptr<const BeastCatalog> catalog,
    Amount rollPrice,
    RandomnessRequest requestParams,
    std::shared_ptr<Logger> logger)
    : identity_(std::move(identity)),
      ledger_(ledger),
      provider_(provider),
      registry_(registry),
      roller_(std::move(catalog)),
      rollPrice_(std::move(rollPrice)),
      requestParams_(std::move(requestParams)),
      logger_(std::move(logger)) {
    if (identity_.empty()) {
        throw GachaError(GachaErrorCode::InvalidConfig, "engine needs an identity");
    }
    if (rollPrice_ == 0) {
        throw GachaError(GachaErrorCode::InvalidConfig, "roll price must be positive");
    }
    if (requestParams_.numWords == 0) {
        throw GachaError(GachaErrorCode::InvalidConfig, "numWords must be at least 1");
    }
    logTo(logger_, LogLevel::Info, "GachaEngine 초기화: 템플릿 " + std::to_string(roller_.catalog().size())
        + "종, 롤 가격 " + formatUnits(rollPrice_, kTokenDecimals));
}

RequestId GachaEngine::initiateRoll(const UserId& user) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    if (user.empty()) {
        throw GachaError(GachaErrorCode::ZeroValue, "user identity is empty");
    }
    if (stateOf(user) == RollState::Rolling) {
        throw GachaError(GachaErrorCode::RollNotIdle, user + " already has a roll in progress");
    }
    if (ledger_.balanceOf(user) < rollPrice_) {
        throw GachaError(GachaErrorCode::InsufficientFunds, user + " cannot afford a roll");
    }

    RollCharge charge(ledger_, user);
    RequestId requestId = 0;
    try {
        if (!ledger_.pull(user, rollPrice_)) {
            throw GachaError(GachaErrorCode::TransferFailed, "ledger refused to pull the roll price from " + user);
        }
        charge.recordPull(rollPrice_);

        // 결과를 보기 전에 소각해 두어야 지불을 취소할 수 없다
        ledger_.burn(rollPrice_);
        charge.recordBurn(rollPrice_);

        requestId = provider_.requestRandomWords(*this, requestParams_);
        if (requests_.count(requestId) != 0) {
            throw GachaError(GachaErrorCode::DuplicateRequest, "provider reused request id " + std::to_string(requestId));
        }
    } catch (...) {
        charge.rollback();
        logTo(logger_, LogLevel::Error, "롤 시작 실패, 차감을 되돌렸습니다: " + user);
        throw;
    }

    states_[user] = RollState::Rolling;
    requests_[requestId] = user;

    logTo(logger_, LogLevel::Info, "롤 시작: " + user + ", request=" + std::to_string(requestId)
        + " (난수가 도착할 때까지 Rolling 유지, 타임아웃 없음)");

    GachaEvent event;
    event.type = GachaEventType::RollStarted;
    event.user = user;
    event.requestId = requestId;
    event.amount = rollPrice_;
    lock.unlock();
    emit(event);
    return requestId;
}

bool GachaEngine::rawFulfillRandomWords(const UserId& caller, RequestId requestId,
    const std::vector<Word256>& randomWords) {
    if (caller != provider_.identity()) {
        logTo(logger_, LogLevel::Warning, "등록되지 않은 호출자의 난수 전달 거부: " + caller);
        throw GachaError(GachaErrorCode::Unauthorized, "only the randomness provider can fulfill");
    }
    return onRandomnessFulfilled(requestId, randomWords);
}

bool GachaEngine::onRandomnessFulfilled(RequestId requestId, const std::vector<Word256>& randomWords) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    if (randomWords.empty()) {
        throw GachaError(GachaErrorCode::EmptyRandomness, "request " + std::to_string(requestId) + " delivered no words");
    }

    auto it = requests_.find(requestId);
    if (it == requests_.end()) {
        logTo(logger_, LogLevel::Warning, "알 수 없거나 이미 처리된 요청 무시: request=" + std::to_string(requestId));
        return false;
    }
    UserId user = it->second;
    RollOutcome outcome = roller_.roll(randomWords.front(), requestId);

    // 민팅이 엔진으로 재진입하더라도 일관된 상태를 보도록 먼저 정리한다
    requests_.erase(it);
    states_[user] = RollState::Idle;

    ItemId itemId = 0;
    try {
        itemId = registry_.mint(identity_, user, outcome.attributes);
    } catch (...) {
        // 재진입으로 새 롤이 시작되지 않았다면 이행 전 상태로 돌린다
        if (stateOf(user) == RollState::Idle && requests_.count(requestId) == 0) {
            states_[user] = RollState::Rolling;
            requests_[requestId] = user;
        }
        logTo(logger_, LogLevel::Error, "민팅 실패로 이행을 취소합니다: request=" + std::to_string(requestId));
        throw;
    }

    logTo(logger_, LogLevel::Info, "롤 이행: " + user + ", request=" + std::to_string(requestId)
        + ", beast #" + std::to_string(itemId) + " template=" + std::to_string(outcome.attributes.templateId)
        + " " + rarityName(outcome.attributes.rarity) + " (roll " + std::to_string(outcome.rarityRoll) + ")"
        + " hp=" + std::to_string(outcome.attributes.hp)
        + " atk=" + std::to_string(outcome.attributes.attack)
        + " def=" + std::to_string(outcome.attributes.defense));

    GachaEvent event;
    event.type = GachaEventType::RollFulfilled;
    event.user = user;
    event.requestId = requestId;
    event.itemId = itemId;
    lock.unlock();
    emit(event);
    return true;
}

RollState GachaEngine::stateOf(const UserId& user) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = states_.find(user);
    if (it == states_.end()) {
        return RollState::Idle;
    }
    return it->second;
}

std::optional<RequestId> GachaEngine::pendingRequestOf(const UserId& user) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& entry : requests_) {
        if (entry.second == user) {
            return entry.first;
        }
    }
    return std::nullopt;
}

std::optional<UserId> GachaEngine::userForRequest(RequestId requestId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = requests_.find(requestId);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t GachaEngine::pendingRollCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return requests_.size();
}

const Amount& GachaEngine::rollPrice() const {
    return rollPrice_;
}

const UserId& GachaEngine::identity() const {
    return identity_;
}

const BeastCatalog& GachaEngine::catalog() const {
    return roller_.catalog();
}

void GachaEngine::subscribe(GachaEventListener listener) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void GachaEngine::emit(const GachaEvent& event) const {
    // 작업은 이미 확정됐다. 리스너는 락 밖에서 복사본으로 돌고, 실패는 로그만 남긴다.
    std::vector<GachaEventListener> listeners;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& ex) {
            logTo(logger_, LogLevel::Error, std::string("이벤트 리스너 실패(") + gachaEventTypeName(event.type) + "): " + ex.what());
        }
    }
}
