#include "queue/Store.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

using namespace cs::queue;
using namespace cs::log;

FileStore::FileStore(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<OperationRecord> FileStore::load() {
    std::vector<OperationRecord> out;
    if (!std::filesystem::exists(path_)) return out;

    const auto j = nlohmann::json::parse(util::readFileToString(path_), nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        Registry::queue()->error("[FileStore] {} is not a JSON array, starting with an empty queue", path_.string());
        return out;
    }

    for (const auto& item : j) {
        try {
            out.push_back(item.get<OperationRecord>());
        } catch (const std::exception& e) {
            Registry::queue()->warn("[FileStore] Dropping unreadable record: {}", e.what());
        }
    }

    Registry::queue()->debug("[FileStore] Loaded {} operations from {}", out.size(), path_.string());
    return out;
}

void FileStore::save(const std::vector<OperationRecord>& records) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& r : records) j.push_back(r);
    util::writeFileAtomic(path_, j.dump());
}
