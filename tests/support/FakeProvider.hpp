#pragma once

#include "storage/Provider.hpp"
#include "error/CloudError.hpp"

#include <deque>
#include <map>
#include <mutex>
#include <utility>

namespace cs::test {

// In-memory provider with failure injection. Injected errors are thrown by the
// next calls to putSlot/getSlot/deleteSlot in FIFO order.
class FakeProvider final : public storage::Provider {
public:
    [[nodiscard]] std::string name() const override { return "fake"; }

    void putSlot(const std::string& ownerId, const storage::SlotRecord& record) override {
        std::scoped_lock lock(mutex_);
        ++puts_;
        throwInjectedLocked();
        slots_[{ownerId, record.slot}] = record;
    }

    std::optional<storage::SlotRecord> getSlot(const std::string& ownerId, const unsigned int slot) override {
        std::scoped_lock lock(mutex_);
        ++gets_;
        throwInjectedLocked();
        const auto it = slots_.find({ownerId, slot});
        if (it == slots_.end()) return std::nullopt;
        return it->second;
    }

    bool deleteSlot(const std::string& ownerId, const unsigned int slot) override {
        std::scoped_lock lock(mutex_);
        throwInjectedLocked();
        return slots_.erase({ownerId, slot}) > 0;
    }

    std::vector<storage::SlotInfo> listSlots(const std::string& ownerId) override {
        std::scoped_lock lock(mutex_);
        std::vector<storage::SlotInfo> out;
        for (const auto& [key, record] : slots_)
            if (key.first == ownerId) out.push_back(storage::toInfo(record));
        return out;
    }

    void testConnection() override {
        std::scoped_lock lock(mutex_);
        ++connectionTests_;
        if (!reachable_)
            throw error::OperationError(error::ErrorCode::NetworkUnavailable, "fake backend unreachable", true);
    }

    void failNext(const error::OperationError& err, const size_t times = 1) {
        std::scoped_lock lock(mutex_);
        for (size_t i = 0; i < times; ++i) failures_.push_back(err);
    }

    void setReachable(const bool reachable) {
        std::scoped_lock lock(mutex_);
        reachable_ = reachable;
    }

    // Stores a record as-is, bypassing failure injection
    void seed(const std::string& ownerId, const storage::SlotRecord& record) {
        std::scoped_lock lock(mutex_);
        slots_[{ownerId, record.slot}] = record;
    }

    [[nodiscard]] std::optional<storage::SlotRecord> peek(const std::string& ownerId, const unsigned int slot) const {
        std::scoped_lock lock(mutex_);
        const auto it = slots_.find({ownerId, slot});
        if (it == slots_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] unsigned int puts() const { std::scoped_lock lock(mutex_); return puts_; }
    [[nodiscard]] unsigned int gets() const { std::scoped_lock lock(mutex_); return gets_; }
    [[nodiscard]] unsigned int connectionTests() const { std::scoped_lock lock(mutex_); return connectionTests_; }

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, unsigned int>, storage::SlotRecord> slots_;
    std::deque<error::OperationError> failures_;
    bool reachable_ = true;
    unsigned int puts_ = 0, gets_ = 0, connectionTests_ = 0;

    void throwInjectedLocked() {
        if (failures_.empty()) return;
        auto err = failures_.front();
        failures_.pop_front();
        throw err;
    }
};

}
