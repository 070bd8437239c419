#include "LocalRandomnessCoordinator.h"

#include <algorithm>
#include <exception>
#include <iterator>

#include <openssl/rand.h>

#include "GachaError.h"

LocalRandomnessCoordinator::LocalRandomnessCoordinator(UserId identity, std::shared_ptr<Logger> logger)
    : identity_(std::move(identity)), logger_(std::move(logger)) {
    if (identity_.empty()) {
        throw GachaError(GachaErrorCode::InvalidConfig, "randomness coordinator needs an identity");
    }
}

LocalRandomnessCoordinator::~LocalRandomnessCoordinator() {
    stop();
}

const UserId& LocalRandomnessCoordinator::identity() const {
    return identity_;
}

RequestId LocalRandomnessCoordinator::requestRandomWords(RandomnessConsumer& consumer, const RandomnessRequest& request) {
    if (request.numWords == 0) {
        throw GachaError(GachaErrorCode::InvalidConfig, "numWords must be at least 1");
    }

    RequestId requestId = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requestId = nextRequestId_++;
        PendingRequest pending;
        pending.consumer = &consumer;
        pending.request = request;
        pending.requestedAt = std::chrono::steady_clock::now();
        pending_.emplace(requestId, pending);
    }
    wake_.notify_all();
    logTo(logger_, LogLevel::Info, "난수 요청 접수: id=" + std::to_string(requestId));
    return requestId;
}

LocalRandomnessCoordinator::PendingRequest LocalRandomnessCoordinator::take(RequestId requestId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw GachaError(GachaErrorCode::UnknownRequest, "no pending randomness request " + std::to_string(requestId));
    }
    PendingRequest pending = it->second;
    pending_.erase(it);
    return pending;
}

bool LocalRandomnessCoordinator::deliver(RequestId requestId, const PendingRequest& pending,
    const std::vector<Word256>& randomWords) {
    logTo(logger_, LogLevel::Info, "난수 전달: id=" + std::to_string(requestId) + ", words=" + std::to_string(randomWords.size()));
    try {
        return pending.consumer->rawFulfillRandomWords(identity_, requestId, randomWords);
    } catch (const std::exception& ex) {
        requeue(requestId, pending);
        logTo(logger_, LogLevel::Warning, "consumer 처리 실패, 요청을 대기열에 되돌립니다: id="
            + std::to_string(requestId) + ", " + ex.what());
        throw;
    }
}

void LocalRandomnessCoordinator::requeue(RequestId requestId, PendingRequest pending) {
    pending.retryAfter = std::chrono::steady_clock::now() + kRetryBackoff;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.emplace(requestId, pending);
    }
    wake_.notify_all();
}

std::chrono::steady_clock::time_point LocalRandomnessCoordinator::dueLocked(const PendingRequest& pending) const {
    return std::max(pending.requestedAt + deliveryDelay_, pending.retryAfter);
}

bool LocalRandomnessCoordinator::fulfill(RequestId requestId) {
    PendingRequest pending = take(requestId);
    return deliver(requestId, pending, drawWords(pending.request.numWords));
}

bool LocalRandomnessCoordinator::fulfillWith(RequestId requestId, const std::vector<Word256>& randomWords) {
    if (randomWords.empty()) {
        throw GachaError(GachaErrorCode::EmptyRandomness, "fulfillment must carry at least one word");
    }
    PendingRequest pending = take(requestId);
    return deliver(requestId, pending, randomWords);
}

std::size_t LocalRandomnessCoordinator::fulfillAll() {
    std::size_t delivered = 0;
    for (RequestId requestId : pendingIds()) {
        if (fulfill(requestId)) {
            ++delivered;
        }
    }
    return delivered;
}

std::size_t LocalRandomnessCoordinator::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::vector<RequestId> LocalRandomnessCoordinator::pendingIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RequestId> ids;
    ids.reserve(pending_.size());
    for (const auto& entry : pending_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void LocalRandomnessCoordinator::start(std::chrono::milliseconds deliveryDelay) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stopping_ = false;
    deliveryDelay_ = deliveryDelay;
    worker_ = std::thread(&LocalRandomnessCoordinator::workerLoop, this);
    logTo(logger_, LogLevel::Info, "난수 전달 워커 시작: delay=" + std::to_string(deliveryDelay.count()) + "ms");
}

void LocalRandomnessCoordinator::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    wake_.notify_all();
    worker_.join();
    logTo(logger_, LogLevel::Info, "난수 전달 워커 종료");
}

bool LocalRandomnessCoordinator::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable() && !stopping_;
}

std::vector<Word256> LocalRandomnessCoordinator::drawWords(std::uint32_t count) {
    std::vector<Word256> words;
    words.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        Bytes32 bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            throw GachaError(GachaErrorCode::RandomnessUnavailable, "RAND_bytes failed");
        }
        words.push_back(fromBigEndian(bytes));
    }
    return words;
}

void LocalRandomnessCoordinator::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (pending_.empty()) {
            wake_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            continue;
        }

        // 재시도 대기 중인 요청이 있으면 맨 앞이 가장 먼저 due가 아닐 수 있다
        auto next = pending_.begin();
        auto due = dueLocked(next->second);
        for (auto it = std::next(pending_.begin()); it != pending_.end(); ++it) {
            auto candidate = dueLocked(it->second);
            if (candidate < due) {
                next = it;
                due = candidate;
            }
        }
        if (std::chrono::steady_clock::now() < due) {
            wake_.wait_until(lock, due);
            continue;
        }

        RequestId requestId = next->first;
        lock.unlock();
        try {
            fulfill(requestId);
        } catch (const std::exception& ex) {
            logTo(logger_, LogLevel::Error, "난수 전달 실패: id=" + std::to_string(requestId) + ", " + ex.what());
        }
        lock.lock();
    }
}
