#pragma once

#include "util/timestamp.hpp"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::storage {

// One save slot as stored remotely
struct SlotRecord {
    unsigned int slot = 0;
    std::string saveName;
    nlohmann::json blob;           // Compressor blob
    std::string checksum;          // of the uncompressed game state
    util::SystemTime updatedAt{};
    size_t originalSize = 0;
    size_t storedSize = 0;
};

struct SlotInfo {
    unsigned int slot = 0;
    std::string saveName;
    std::string checksum;
    util::SystemTime updatedAt{};
    size_t storedSize = 0;
};

// Remote save store. Failures are thrown as error::OperationError.
class Provider {
public:
    virtual ~Provider() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    virtual void putSlot(const std::string& ownerId, const SlotRecord& record) = 0;
    virtual std::optional<SlotRecord> getSlot(const std::string& ownerId, unsigned int slot) = 0;

    // Returns false when the slot did not exist
    virtual bool deleteSlot(const std::string& ownerId, unsigned int slot) = 0;

    virtual std::vector<SlotInfo> listSlots(const std::string& ownerId) = 0;

    // Throws when the backend cannot be reached or rejects the credentials
    virtual void testConnection() = 0;
};

void to_json(nlohmann::json& j, const SlotRecord& r);
void from_json(const nlohmann::json& j, SlotRecord& r);
void to_json(nlohmann::json& j, const SlotInfo& i);

SlotInfo toInfo(const SlotRecord& r);

}
