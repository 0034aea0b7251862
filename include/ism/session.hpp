#pragma once

#include "ism/executor.hpp"
#include "ism/graph.hpp"
#include "ism/image_builder.hpp"
#include "ism/planner.hpp"
#include "ism/record_store.hpp"
#include "ism/registry.hpp"
#include "ism/utility.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace imagesmith {

/** @brief Everything one `ism` invocation needs beyond the manifest. */
struct SessionConfig {
    std::vector<std::string> targets = {}; ///< unit names given on the command line
    bool all = false;                      ///< build the manifest's default target list
    bool force = false;                    ///< plan every unit of the closure
    std::filesystem::path state_dir = ".imagesmith";
    ExecutorConfig executor = {};
};

/**
 * @brief Unit names an invocation builds.
 *
 * Explicit targets are used as given. Without any (or with `all`), the manifest's `_ALL_`
 * list is used, or every registered unit if the manifest has none.
 * @return `InvalidArgument` if `all` is combined with explicit targets.
 */
Result<std::vector<std::string>> select_targets(const UnitRegistry &registry, const std::vector<std::string> &targets,
                                                bool all);

/**
 * @brief Selects and resolves the targets, fingerprints their closure and plans it.
 *
 * Only the closure is fingerprinted. Units whose context cannot be read are reported
 * on stderr and planned as `FingerprintUnknown`.
 * @return `UnknownUnit` or `InvalidArgument` from target selection.
 */
Result<BuildPlan> plan_session(const DependencyGraph &graph, const SessionConfig &config,
                               const RecordStore &records);

/** @brief Plans and executes; an empty plan yields a summary of up-to-date units. */
Result<RunSummary> run_session(const DependencyGraph &graph, ImageBuilder &builder, RecordStore &records,
                               const SessionConfig &config);

/** @return 0 if no unit ended `Failed` or `Skipped`, 1 otherwise. */
int exit_status(const RunSummary &summary);

} // namespace imagesmith
