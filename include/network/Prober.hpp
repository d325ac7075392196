#pragma once

#include <chrono>
#include <string>

namespace cs::network {

struct ProbeResult {
    bool reachable = false;
    std::chrono::milliseconds rtt{0};
    std::string error;
};

// One probe attempt. Implementations enforce the timeout themselves.
class Prober {
public:
    virtual ~Prober() = default;
    virtual ProbeResult probe(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

// HEAD request through libcurl; any HTTP answer counts as reachable
class CurlProber final : public Prober {
public:
    ProbeResult probe(const std::string& url, std::chrono::milliseconds timeout) override;
};

}
