#include "storage/HttpProvider.hpp"
#include "error/CloudError.hpp"
#include "log/Registry.hpp"

using namespace cs::storage;
using namespace cs::error;
using namespace cs::util;
using namespace cs::log;

namespace {

const char* methodName(const int m) {
    static constexpr const char* names[] = {"GET", "PUT", "POST", "PATCH", "DELETE"};
    return names[m];
}

}

HttpProvider::HttpProvider(const std::chrono::milliseconds timeout) : timeout_(timeout) {
    CurlGlobal::ensure();
}

void HttpProvider::setAuthToken(std::string token) {
    std::scoped_lock lock(tokenMutex_);
    authToken_ = std::move(token);
}

std::string HttpProvider::authToken() const {
    std::scoped_lock lock(tokenMutex_);
    return authToken_;
}

HttpResponse HttpProvider::request(const Method method, const std::string& url,
                                   const std::vector<std::string>& headers, const std::string& body) const {
    SList hdrs;
    for (const auto& h : headers) hdrs.add(h);
    if (!body.empty()) hdrs.add("Content-Type: application/json");

    const auto verb = methodName(static_cast<int>(method));

    auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));

        switch (method) {
            case Method::Get:
                curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
                break;
            case Method::Post:
                curl_easy_setopt(h, CURLOPT_POST, 1L);
                break;
            default:
                curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, verb);
                break;
        }

        if (method != Method::Get) {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        }
    });

    Registry::storage()->debug("[{}] {} {} -> curl={} http={}", name(), verb, url.substr(0, url.find('?')),
                               static_cast<int>(resp.curl), resp.http);
    return resp;
}

void HttpProvider::raiseForStatus(const HttpResponse& resp, const std::string& what) const {
    if (resp.ok()) return;

    if (resp.curl != CURLE_OK) {
        const bool timedOut = resp.curl == CURLE_OPERATION_TIMEDOUT;
        OperationError err(timedOut ? ErrorCode::NetworkTimeout : ErrorCode::NetworkError,
                           name() + " " + what + " failed: " + resp.curlError(), true);
        Registry::storage()->warn("[{}] {}", name(), err.what());
        throw err;
    }

    auto err = fromHttpStatus(resp.http, resp.body);
    Registry::storage()->warn("[{}] {} failed: {}", name(), what, err.what());
    throw err;
}

std::string HttpProvider::escape(const std::string& s) {
    CurlEasy h;
    char* out = curl_easy_escape(h, s.c_str(), static_cast<int>(s.size()));
    if (!out) throw std::runtime_error("curl_easy_escape failed");
    std::string escaped(out);
    curl_free(out);
    return escaped;
}
