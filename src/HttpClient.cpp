#include "HttpClient.h"

#ifdef USE_LIBCURL
#include <memory>
#include <utility>

#include <curl/curl.h>
#endif

namespace {
#ifdef USE_LIBCURL
struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlListPtr = std::unique_ptr<curl_slist, CurlListDeleter>;

size_t appendBody(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t chunk = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), chunk);
    return chunk;
}
#endif
} // 익명 네임스페이스 종료

bool postJson(const std::string& url,
    const std::string& jsonBody,
    HttpResponse& response,
    std::string& errorMessage,
    long timeoutSeconds) {
#ifdef USE_LIBCURL
    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
        errorMessage = "curl_easy_init 실패";
        return false;
    }

    CurlListPtr headers(curl_slist_append(nullptr, "Content-Type: application/json"));
    headers.reset(curl_slist_append(headers.release(), "Accept: application/json"));

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, jsonBody.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(jsonBody.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        errorMessage = curl_easy_strerror(res);
        return false;
    }

    long status = 0;
    if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) {
        errorMessage = "응답 코드를 읽을 수 없습니다.";
        return false;
    }
    response.status = status;
    response.body = std::move(body);
    return true;
#else
    (void)url;
    (void)jsonBody;
    (void)response;
    (void)timeoutSeconds;
    errorMessage = "HTTP 백엔드가 활성화되어 있지 않습니다. (ETHERBEAST_USE_LIBCURL)";
    return false;
#endif
}
