#pragma once

#include <string>

struct HttpResponse {
    long status{0};
    std::string body;
};

// JSON 본문을 POST한다. Content-Type/Accept는 application/json으로 고정된다.
// 전송 자체가 실패하면 false와 함께 errorMessage를 채운다. HTTP 상태 코드는 호출 측이 판단한다.
bool postJson(const std::string& url,
    const std::string& jsonBody,
    HttpResponse& response,
    std::string& errorMessage,
    long timeoutSeconds = 10);
