#pragma once

#include "config/Config.hpp"
#include "storage/HttpProvider.hpp"

namespace cs::storage {

// Supabase PostgREST table keyed by (user_id, slot_number)
class SupabaseProvider final : public HttpProvider {
public:
    SupabaseProvider(config::SupabaseConfig cfg, std::chrono::milliseconds timeout);

    [[nodiscard]] std::string name() const override { return "supabase"; }

    void putSlot(const std::string& ownerId, const SlotRecord& record) override;
    std::optional<SlotRecord> getSlot(const std::string& ownerId, unsigned int slot) override;
    bool deleteSlot(const std::string& ownerId, unsigned int slot) override;
    std::vector<SlotInfo> listSlots(const std::string& ownerId) override;
    void testConnection() override;

    [[nodiscard]] std::string tableUrl(const std::string& query = {}) const;

    static nlohmann::json toRow(const std::string& ownerId, const SlotRecord& r);
    static SlotRecord fromRow(const nlohmann::json& row);

private:
    config::SupabaseConfig cfg_;
    std::string restBase_;

    [[nodiscard]] std::vector<std::string> headers(const std::vector<std::string>& extra = {}) const;
    [[nodiscard]] std::string slotFilter(const std::string& ownerId, unsigned int slot) const;
};

}
