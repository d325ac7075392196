#include "storage/FirebaseProvider.hpp"
#include "error/CloudError.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace cs::storage;
using namespace cs::error;
using namespace cs::log;

namespace {

std::string rstrip(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

}

FirebaseProvider::FirebaseProvider(config::FirebaseConfig cfg, const std::chrono::milliseconds timeout)
    : HttpProvider(timeout), cfg_(std::move(cfg)) {
    if (cfg_.project_id.empty() && cfg_.database_url.empty())
        throw ConfigurationError("Firebase provider requires project_id or database_url");

    if (cfg_.use_emulator) {
        const auto emu = cfg_.emulator.value_or(config::EmulatorConfig{});
        baseUrl_ = fmt::format("http://{}:{}", emu.host, emu.port);
    } else if (!cfg_.database_url.empty()) {
        baseUrl_ = rstrip(cfg_.database_url);
    } else {
        baseUrl_ = fmt::format("https://{}-default-rtdb.firebaseio.com", cfg_.project_id);
    }

    Registry::storage()->debug("[FirebaseProvider] Using {}", baseUrl_);
}

std::string FirebaseProvider::urlFor(const std::string& path, const std::string& query) const {
    std::vector<std::string> params;
    if (!query.empty()) params.push_back(query);
    if (cfg_.use_emulator) params.push_back("ns=" + escape(cfg_.project_id));
    if (const auto token = authToken(); !token.empty()) params.push_back("auth=" + escape(token));

    auto url = baseUrl_ + path + ".json";
    for (size_t i = 0; i < params.size(); ++i) url += (i == 0 ? "?" : "&") + params[i];
    return url;
}

std::string FirebaseProvider::slotPath(const std::string& ownerId, const unsigned int slot) const {
    return fmt::format("/users/{}/saves/slot_{}", escape(ownerId), slot);
}

void FirebaseProvider::putSlot(const std::string& ownerId, const SlotRecord& record) {
    const nlohmann::json body = record;
    const auto resp = request(Method::Put, urlFor(slotPath(ownerId, record.slot)), {}, body.dump());
    raiseForStatus(resp, fmt::format("upload of slot {}", record.slot));
}

std::optional<SlotRecord> FirebaseProvider::getSlot(const std::string& ownerId, const unsigned int slot) {
    const auto resp = request(Method::Get, urlFor(slotPath(ownerId, slot)));
    raiseForStatus(resp, fmt::format("download of slot {}", slot));

    const auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded())
        throw OperationError(ErrorCode::StorageCorrupted, "Firebase returned malformed JSON for slot " + std::to_string(slot), false);
    if (j.is_null()) return std::nullopt;

    return j.get<SlotRecord>();
}

bool FirebaseProvider::deleteSlot(const std::string& ownerId, const unsigned int slot) {
    const auto path = slotPath(ownerId, slot);

    const auto probe = request(Method::Get, urlFor(path, "shallow=true"));
    raiseForStatus(probe, fmt::format("lookup of slot {}", slot));
    if (probe.body.empty() || probe.body == "null") return false;

    const auto resp = request(Method::Delete, urlFor(path));
    raiseForStatus(resp, fmt::format("delete of slot {}", slot));
    return true;
}

std::vector<SlotInfo> FirebaseProvider::listSlots(const std::string& ownerId) {
    const auto resp = request(Method::Get, urlFor(fmt::format("/users/{}/saves", escape(ownerId))));
    raiseForStatus(resp, "slot listing");

    const auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded())
        throw OperationError(ErrorCode::StorageCorrupted, "Firebase returned malformed JSON for slot listing", false);

    std::vector<SlotInfo> out;
    if (!j.is_object()) return out;

    for (const auto& [key, value] : j.items()) {
        if (!value.is_object()) continue;
        try {
            out.push_back(toInfo(value.get<SlotRecord>()));
        } catch (const std::exception& e) {
            Registry::storage()->warn("[FirebaseProvider] Skipping unreadable entry {}: {}", key, e.what());
        }
    }

    std::ranges::sort(out, {}, &SlotInfo::slot);
    return out;
}

void FirebaseProvider::testConnection() {
    const auto resp = request(Method::Get, urlFor("/.info/serverTimeOffset"));
    raiseForStatus(resp, "connection test");
    Registry::storage()->info("[FirebaseProvider] Connection test succeeded ({}ms)",
                              static_cast<int64_t>(resp.totalSeconds * 1000));
}
