#include "storage/SupabaseProvider.hpp"
#include "error/CloudError.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace cs::storage;
using namespace cs::error;
using namespace cs::log;

namespace {

nlohmann::json parseArray(const std::string& body, const std::string& what) {
    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_array())
        throw OperationError(ErrorCode::StorageCorrupted, "Supabase returned malformed JSON for " + what, false);
    return j;
}

}

SupabaseProvider::SupabaseProvider(config::SupabaseConfig cfg, const std::chrono::milliseconds timeout)
    : HttpProvider(timeout), cfg_(std::move(cfg)) {
    if (cfg_.url.empty() || cfg_.anon_key.empty())
        throw ConfigurationError("Supabase provider requires url and anon_key");

    auto base = cfg_.url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    restBase_ = base + "/rest/v1/";
}

std::string SupabaseProvider::tableUrl(const std::string& query) const {
    auto url = restBase_ + cfg_.table;
    if (!query.empty()) url += "?" + query;
    return url;
}

std::vector<std::string> SupabaseProvider::headers(const std::vector<std::string>& extra) const {
    const auto token = authToken();
    std::vector<std::string> h{
        "apikey: " + cfg_.anon_key,
        "Authorization: Bearer " + (token.empty() ? cfg_.anon_key : token),
        "Accept: application/json",
    };
    h.insert(h.end(), extra.begin(), extra.end());
    return h;
}

std::string SupabaseProvider::slotFilter(const std::string& ownerId, const unsigned int slot) const {
    return fmt::format("user_id=eq.{}&slot_number=eq.{}", escape(ownerId), slot);
}

nlohmann::json SupabaseProvider::toRow(const std::string& ownerId, const SlotRecord& r) {
    return {
        {"user_id", ownerId},
        {"slot_number", r.slot},
        {"save_name", r.saveName},
        {"save_data", r.blob},
        {"checksum", r.checksum},
        {"updated_at", util::toIso8601(r.updatedAt)},
        {"original_size", r.originalSize},
        {"stored_size", r.storedSize}
    };
}

SlotRecord SupabaseProvider::fromRow(const nlohmann::json& row) {
    SlotRecord r;
    r.slot = row.at("slot_number").get<unsigned int>();
    if (row.contains("save_name") && row.at("save_name").is_string()) r.saveName = row.at("save_name").get<std::string>();
    if (row.contains("save_data")) r.blob = row.at("save_data");
    if (row.contains("checksum") && row.at("checksum").is_string()) r.checksum = row.at("checksum").get<std::string>();
    if (row.contains("updated_at") && row.at("updated_at").is_string())
        r.updatedAt = util::parseIso8601(row.at("updated_at").get<std::string>());
    if (row.contains("original_size") && row.at("original_size").is_number())
        r.originalSize = row.at("original_size").get<size_t>();
    if (row.contains("stored_size") && row.at("stored_size").is_number())
        r.storedSize = row.at("stored_size").get<size_t>();
    return r;
}

void SupabaseProvider::putSlot(const std::string& ownerId, const SlotRecord& record) {
    const auto body = toRow(ownerId, record).dump();
    const auto resp = request(Method::Post, tableUrl("on_conflict=user_id,slot_number"),
                              headers({"Prefer: resolution=merge-duplicates,return=minimal"}), body);
    raiseForStatus(resp, fmt::format("upload of slot {}", record.slot));
}

std::optional<SlotRecord> SupabaseProvider::getSlot(const std::string& ownerId, const unsigned int slot) {
    const auto resp = request(Method::Get, tableUrl(slotFilter(ownerId, slot) + "&select=*&limit=1"), headers());
    raiseForStatus(resp, fmt::format("download of slot {}", slot));

    const auto rows = parseArray(resp.body, "slot " + std::to_string(slot));
    if (rows.empty()) return std::nullopt;
    return fromRow(rows.front());
}

bool SupabaseProvider::deleteSlot(const std::string& ownerId, const unsigned int slot) {
    const auto resp = request(Method::Delete, tableUrl(slotFilter(ownerId, slot)),
                              headers({"Prefer: return=representation"}));
    raiseForStatus(resp, fmt::format("delete of slot {}", slot));
    return !parseArray(resp.body, "slot delete").empty();
}

std::vector<SlotInfo> SupabaseProvider::listSlots(const std::string& ownerId) {
    const auto query = fmt::format("user_id=eq.{}&select=slot_number,save_name,checksum,updated_at,stored_size"
                                   "&order=slot_number.asc", escape(ownerId));
    const auto resp = request(Method::Get, tableUrl(query), headers());
    raiseForStatus(resp, "slot listing");

    std::vector<SlotInfo> out;
    for (const auto& row : parseArray(resp.body, "slot listing")) {
        try {
            out.push_back(toInfo(fromRow(row)));
        } catch (const std::exception& e) {
            Registry::storage()->warn("[SupabaseProvider] Skipping unreadable row: {}", e.what());
        }
    }
    return out;
}

void SupabaseProvider::testConnection() {
    const auto resp = request(Method::Get, tableUrl("select=slot_number&limit=1"), headers());
    raiseForStatus(resp, "connection test");
    Registry::storage()->info("[SupabaseProvider] Connection test succeeded ({}ms)",
                              static_cast<int64_t>(resp.totalSeconds * 1000));
}
