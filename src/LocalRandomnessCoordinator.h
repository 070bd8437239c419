#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "Logger.h"
#include "RandomnessProvider.h"

// 프로세스 안에서 동작하는 난수 제공자.
// 요청은 대기열에 쌓였다가 fulfill* 호출이나 백그라운드 워커가 꺼내 전달한다.
// consumer가 정상적으로 받아 간 요청 id는 다시 전달되지 않는다. consumer가 예외를 던지면 요청은
// 대기열로 돌아가고, 워커는 kRetryBackoff 뒤에 다시 시도한다.
// consumer는 대기 중인 요청보다 오래 살아 있어야 한다.
class LocalRandomnessCoordinator : public RandomnessProvider {
public:
    static constexpr std::chrono::milliseconds kRetryBackoff{1000};

    explicit LocalRandomnessCoordinator(UserId identity, std::shared_ptr<Logger> logger = nullptr);
    ~LocalRandomnessCoordinator() override;

    LocalRandomnessCoordinator(const LocalRandomnessCoordinator&) = delete;
    LocalRandomnessCoordinator& operator=(const LocalRandomnessCoordinator&) = delete;

    const UserId& identity() const override;
    RequestId requestRandomWords(RandomnessConsumer& consumer, const RandomnessRequest& request) override;

    // RAND_bytes로 numWords개의 워드를 뽑아 전달한다.
    bool fulfill(RequestId requestId);
    // 지정한 워드를 그대로 전달한다.
    bool fulfillWith(RequestId requestId, const std::vector<Word256>& randomWords);
    std::size_t fulfillAll();

    std::size_t pendingCount() const;
    std::vector<RequestId> pendingIds() const;

    void start(std::chrono::milliseconds deliveryDelay);
    void stop();
    bool running() const;

    static std::vector<Word256> drawWords(std::uint32_t count);

private:
    struct PendingRequest {
        RandomnessConsumer* consumer{nullptr};
        RandomnessRequest request;
        std::chrono::steady_clock::time_point requestedAt;
        std::chrono::steady_clock::time_point retryAfter{};
    };

    PendingRequest take(RequestId requestId);
    void requeue(RequestId requestId, PendingRequest pending);
    std::chrono::steady_clock::time_point dueLocked(const PendingRequest& pending) const;
    bool deliver(RequestId requestId, const PendingRequest& pending, const std::vector<Word256>& randomWords);
    void workerLoop();

    UserId identity_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::map<RequestId, PendingRequest> pending_;
    RequestId nextRequestId_{1};

    std::thread worker_;
    bool stopping_{false};
    std::chrono::milliseconds deliveryDelay_{0};
};
