#pragma once

#include "config/Config.hpp"
#include "storage/HttpProvider.hpp"

namespace cs::storage {

// Firebase Realtime Database over its REST API.
// Layout: /users/{ownerId}/saves/slot_{n}
class FirebaseProvider final : public HttpProvider {
public:
    FirebaseProvider(config::FirebaseConfig cfg, std::chrono::milliseconds timeout);

    [[nodiscard]] std::string name() const override { return "firebase"; }

    void putSlot(const std::string& ownerId, const SlotRecord& record) override;
    std::optional<SlotRecord> getSlot(const std::string& ownerId, unsigned int slot) override;
    bool deleteSlot(const std::string& ownerId, unsigned int slot) override;
    std::vector<SlotInfo> listSlots(const std::string& ownerId) override;
    void testConnection() override;

    [[nodiscard]] const std::string& baseUrl() const { return baseUrl_; }

    // "<base><path>.json?<query>" with the emulator namespace and auth token appended
    [[nodiscard]] std::string urlFor(const std::string& path, const std::string& query = {}) const;

private:
    config::FirebaseConfig cfg_;
    std::string baseUrl_;

    [[nodiscard]] std::string slotPath(const std::string& ownerId, unsigned int slot) const;
};

}
