#pragma once

#include "ism/domain.hpp"
#include "ism/utility.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace imagesmith {

/**
 * @brief Durable map from unit name to its last successful build.
 *
 * Implementations must make `put` atomic per unit: either the new record is fully
 * stored or the previous one is left as it was. Units never share a key, so no
 * operation needs to lock across units.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    /** @return The record, or nullopt if the unit was never built (or its record is unreadable). */
    virtual std::optional<BuildRecord> get(std::string_view unit) const = 0;
    virtual Result<void> put(std::string_view unit, const BuildRecord &record) = 0;
    virtual Result<void> erase(std::string_view unit) = 0;
};

/**
 * @brief One JSON document per unit under `<state_dir>/records/`.
 *
 * `put` writes a temporary sibling and renames it over the record file.
 */
class FileRecordStore final : public RecordStore {
public:
    static constexpr int FORMAT_VERSION = 1;

    explicit FileRecordStore(std::filesystem::path state_dir);

    std::optional<BuildRecord> get(std::string_view unit) const override;
    Result<void> put(std::string_view unit, const BuildRecord &record) override;
    Result<void> erase(std::string_view unit) override;

    std::filesystem::path record_path(std::string_view unit) const;

private:
    std::filesystem::path records_dir_;
};

class MemoryRecordStore final : public RecordStore {
public:
    std::optional<BuildRecord> get(std::string_view unit) const override;
    Result<void> put(std::string_view unit, const BuildRecord &record) override;
    Result<void> erase(std::string_view unit) override;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, BuildRecord> records_;
};

} // namespace imagesmith
