#include "network/Prober.hpp"
#include "util/curlWrappers.hpp"

using namespace cs::network;
using namespace cs::util;

ProbeResult CurlProber::probe(const std::string& url, const std::chrono::milliseconds timeout) {
    const auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(h, CURLOPT_FRESH_CONNECT, 1L); // no-cache
    });

    ProbeResult r;
    r.reachable = res.curl == CURLE_OK;
    r.rtt = std::chrono::milliseconds(static_cast<int64_t>(res.totalSeconds * 1000.0));
    if (!r.reachable) r.error = res.curlError();
    return r;
}
