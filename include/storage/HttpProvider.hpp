#pragma once

#include "storage/Provider.hpp"
#include "util/curlWrappers.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace cs::storage {

// Shared plumbing for the REST-backed providers
class HttpProvider : public Provider {
public:
    explicit HttpProvider(std::chrono::milliseconds timeout);

    // Bearer/ID token obtained by the host application; empty means unauthenticated
    void setAuthToken(std::string token);

protected:
    enum class Method { Get, Put, Post, Patch, Delete };

    [[nodiscard]] util::HttpResponse request(Method method,
                                             const std::string& url,
                                             const std::vector<std::string>& headers = {},
                                             const std::string& body = {}) const;

    // Maps transport failures and non-2xx statuses onto OperationError
    void raiseForStatus(const util::HttpResponse& resp, const std::string& what) const;

    [[nodiscard]] static std::string escape(const std::string& s);

    [[nodiscard]] std::string authToken() const;

    std::chrono::milliseconds timeout_;

private:
    mutable std::mutex tokenMutex_;
    std::string authToken_;
};

}
