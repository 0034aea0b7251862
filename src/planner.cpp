#include "ism/planner.hpp"

#include <numeric>

namespace imagesmith {

std::string_view to_string(PlanReason reason) {
    switch (reason) {
    case PlanReason::Forced:
        return "forced";
    case PlanReason::NeverBuilt:
        return "never built";
    case PlanReason::FingerprintChanged:
        return "fingerprint changed";
    case PlanReason::FingerprintUnknown:
        return "fingerprint unknown";
    case PlanReason::DependencyRebuilt:
        return "dependency rebuilt";
    case PlanReason::UpToDate:
        return "up to date";
    }
    return "unknown";
}

FingerprintMap compute_fingerprints(FingerprintEngine &engine, const DependencyGraph &graph,
                                    const std::vector<size_t> &units) {
    FingerprintMap out;
    for (size_t id : units) {
        out.emplace(id, engine.fingerprint(linearize(graph, id)));
    }
    return out;
}

BuildPlan plan_build(const DependencyGraph &graph, const std::vector<size_t> &targets,
                     const FingerprintMap &fingerprints, const RecordStore &records, bool force) {
    std::vector<size_t> roots = targets;
    if (roots.empty()) {
        roots.resize(graph.size());
        std::iota(roots.begin(), roots.end(), size_t{0});
    }

    BuildPlan plan;
    std::vector<bool> planned(graph.size(), false);

    for (size_t id : graph.closure(roots)) {
        std::optional<std::string> fingerprint;
        if (auto it = fingerprints.find(id); it != fingerprints.end() && it->second) {
            fingerprint = *it->second;
        }

        PlanReason reason = PlanReason::UpToDate;
        if (force) {
            reason = PlanReason::Forced;
        } else if (!fingerprint) {
            reason = PlanReason::FingerprintUnknown;
        } else if (auto record = records.get(graph.name(id)); !record) {
            reason = PlanReason::NeverBuilt;
        } else if (record->fingerprint != *fingerprint) {
            reason = PlanReason::FingerprintChanged;
        } else {
            for (size_t dep : graph.requirements(id)) {
                if (planned[dep]) {
                    reason = PlanReason::DependencyRebuilt;
                    break;
                }
            }
        }

        if (reason == PlanReason::UpToDate) {
            plan.up_to_date.push_back({id, reason, std::move(fingerprint)});
        } else {
            planned[id] = true;
            plan.to_build.push_back({id, reason, std::move(fingerprint)});
        }
    }
    return plan;
}

} // namespace imagesmith
