#include "storage/Provider.hpp"

namespace cs::storage {

void to_json(nlohmann::json& j, const SlotRecord& r) {
    j = {
        {"slot", r.slot},
        {"saveName", r.saveName},
        {"blob", r.blob},
        {"checksum", r.checksum},
        {"updatedAt", util::toIso8601(r.updatedAt)},
        {"originalSize", r.originalSize},
        {"storedSize", r.storedSize}
    };
}

void from_json(const nlohmann::json& j, SlotRecord& r) {
    r.slot = j.at("slot").get<unsigned int>();
    r.saveName = j.value("saveName", std::string{});
    r.blob = j.at("blob");
    r.checksum = j.value("checksum", std::string{});
    if (j.contains("updatedAt") && j.at("updatedAt").is_string())
        r.updatedAt = util::parseIso8601(j.at("updatedAt").get<std::string>());
    r.originalSize = j.value("originalSize", size_t{0});
    r.storedSize = j.value("storedSize", size_t{0});
}

void to_json(nlohmann::json& j, const SlotInfo& i) {
    j = {
        {"slot", i.slot},
        {"saveName", i.saveName},
        {"checksum", i.checksum},
        {"updatedAt", util::toIso8601(i.updatedAt)},
        {"storedSize", i.storedSize}
    };
}

SlotInfo toInfo(const SlotRecord& r) {
    return {
        .slot = r.slot,
        .saveName = r.saveName,
        .checksum = r.checksum,
        .updatedAt = r.updatedAt,
        .storedSize = r.storedSize,
    };
}

}
