#pragma once

#include "queue/Operation.hpp"

#include <filesystem>
#include <vector>

namespace cs::queue {

// Durable snapshot of the queue. Every save replaces the previous snapshot.
class Store {
public:
    virtual ~Store() = default;

    virtual std::vector<OperationRecord> load() = 0;
    virtual void save(const std::vector<OperationRecord>& records) = 0;
};

// JSON array on disk, replaced atomically on every save
class FileStore final : public Store {
public:
    explicit FileStore(std::filesystem::path path);

    // Unreadable records are skipped with a warning; a missing file is an empty queue
    std::vector<OperationRecord> load() override;
    void save(const std::vector<OperationRecord>& records) override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
