#pragma once

#include "ism/fingerprint.hpp"
#include "ism/graph.hpp"
#include "ism/record_store.hpp"
#include "ism/utility.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace imagesmith {

enum class PlanReason : uint8_t {
    Forced,             // --force
    NeverBuilt,         // no BuildRecord
    FingerprintChanged, // recorded fingerprint differs
    FingerprintUnknown, // fingerprinting failed (UnreadableFile)
    DependencyRebuilt,  // a required unit is planned
    UpToDate,           // not planned
};

std::string_view to_string(PlanReason reason);

/** @brief Fingerprint per unit index; an error marks the unit's status as unknown. */
using FingerprintMap = std::unordered_map<size_t, Result<std::string>>;

struct PlannedUnit {
    size_t unit;
    PlanReason reason;
    std::optional<std::string> fingerprint; ///< nullopt if fingerprinting failed
};

struct BuildPlan {
    std::vector<PlannedUnit> to_build;   ///< dependencies before dependents
    std::vector<PlannedUnit> up_to_date; ///< units of the target closure left alone

    bool empty() const {
        return to_build.empty();
    }
};

/** @brief Fingerprints every unit in `units`. */
FingerprintMap compute_fingerprints(FingerprintEngine &engine, const DependencyGraph &graph,
                                    const std::vector<size_t> &units);

/**
 * @brief Decides which units of the targets' closure must be built.
 *
 * A unit is planned if it has no record, its fingerprint differs from the recorded one
 * (or is unknown), `force` is set, or any unit it requires is planned.
 * Empty `targets` means every registered unit.
 * Units of the closure missing from `fingerprints` are treated as unknown.
 */
BuildPlan plan_build(const DependencyGraph &graph, const std::vector<size_t> &targets,
                     const FingerprintMap &fingerprints, const RecordStore &records, bool force = false);

} // namespace imagesmith
