#pragma once

#include "ism/graph.hpp"
#include "ism/utility.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace imagesmith {

/**
 * @brief The linearized chain of units whose steps make up one unit's image.
 *
 * `entries` runs from the furthest ancestor to `target` (always last), with
 * every unit present at most once.
 */
struct EffectiveBuildPlan {
    size_t target;
    std::vector<size_t> entries;
};

/**
 * @brief Post-order walk over `requires` edges starting at `unit`.
 *
 * Requirements are visited in declaration order and each unit is appended once,
 * at its first encounter, so diamonds collapse. The graph must already be validated.
 */
EffectiveBuildPlan linearize(const DependencyGraph &graph, size_t unit);

/**
 * @brief The single base image of a plan.
 * @return `ConflictingBase` if plan entries declare different bases, `MissingBase` if none does.
 */
Result<std::string> resolve_base(const DependencyGraph &graph, const EffectiveBuildPlan &plan);

/** @brief Runs `resolve_base` for every unit of the graph. */
Result<void> validate_bases(const DependencyGraph &graph);

/**
 * @brief Composes the effective instruction script for a plan.
 *
 * `FROM <base>` followed by each entry's steps, each preceded by a marker line.
 */
Result<std::string> compose_script(const DependencyGraph &graph, const EffectiveBuildPlan &plan);

/** @brief Build directories of the plan entries that have one, in plan order. */
std::vector<std::filesystem::path> context_directories(const DependencyGraph &graph, const EffectiveBuildPlan &plan);

} // namespace imagesmith
