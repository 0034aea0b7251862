#pragma once

#include "ism/domain.hpp"
#include "ism/graph.hpp"
#include "ism/image_builder.hpp"
#include "ism/planner.hpp"
#include "ism/record_store.hpp"
#include "ism/utility.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace imagesmith {

struct ExecutorConfig {
    bool dry_run = false;
    bool verbose = false;
    bool quiet = false;
    size_t jobs = 0; // 0 means auto-detect
    std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(); // per build, 0 = unbounded
};

struct UnitOutcome {
    std::string unit;
    UnitState state;
    PlanReason reason;
    std::optional<std::string> image = std::nullopt;
    std::optional<Error> error = std::nullopt;
    std::chrono::milliseconds elapsed = std::chrono::milliseconds::zero();
};

struct RunSummary {
    std::vector<UnitOutcome> outcomes; ///< planned units in plan order, then up-to-date ones
    std::chrono::milliseconds total_time = std::chrono::milliseconds::zero();

    /** @brief False if any unit ended `Failed` or `Skipped`. */
    bool ok() const;
    size_t count(UnitState state) const;
    const UnitOutcome *find(std::string_view unit) const;
};

/**
 * @brief Runs the image builder for every unit of a plan.
 *
 * A bounded pool of workers pulls units whose in-plan requirements have all
 * succeeded. A failed unit leaves its record untouched and marks every unit that
 * transitively requires it `Skipped`; unrelated units keep building. Records are
 * written per unit after a successful build only.
 */
class Executor {
public:
    Executor(const DependencyGraph &graph, ImageBuilder &builder, RecordStore &records, ExecutorConfig config = {});

    RunSummary execute(const BuildPlan &plan);

    /** @brief Writes the plan as JSON (unit, reason, fingerprint, image, script). */
    Result<void> emit_plan(const BuildPlan &plan, const std::filesystem::path &path) const;

private:
    Result<ImageHandle> build_unit(const PlannedUnit &planned) const;
    BuildRequest make_request(const PlannedUnit &planned, std::string script) const;
    void record_success(const PlannedUnit &planned);

    const DependencyGraph &graph;
    ImageBuilder &builder;
    RecordStore &records;
    ExecutorConfig config;
    std::vector<std::jthread> pool;
};

/** @brief Prints the per-unit end states and totals. */
void print_summary(const RunSummary &summary);

} // namespace imagesmith
