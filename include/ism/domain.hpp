#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imagesmith {

struct ImageUnit {
    std::string name;
    std::optional<std::string> base_reference = std::nullopt; // FROM
    std::vector<std::string> requirements = {};               // `requires`, in application order
    std::optional<std::filesystem::path> build_directory = std::nullopt;
    std::string build_steps = {};
    std::string description = {};
};

struct BuildRecord {
    std::string fingerprint;
    int64_t timestamp = 0; // seconds since the Unix epoch
};

enum class UnitState : uint8_t { Pending, Building, Succeeded, Failed, Skipped, UpToDate };

constexpr std::string_view to_string(UnitState state) {
    switch (state) {
    case UnitState::Pending:
        return "pending";
    case UnitState::Building:
        return "building";
    case UnitState::Succeeded:
        return "succeeded";
    case UnitState::Failed:
        return "failed";
    case UnitState::Skipped:
        return "skipped";
    case UnitState::UpToDate:
        return "up-to-date";
    }
    return "unknown";
}

} // namespace imagesmith
