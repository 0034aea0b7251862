#include "ism/session.hpp"

#include "ism/fingerprint.hpp"

#include <cstdio>
#include <print>

namespace imagesmith {

Result<std::vector<std::string>> select_targets(const UnitRegistry &registry, const std::vector<std::string> &targets,
                                                bool all) {
    if (all && !targets.empty()) {
        return fail(ErrorKind::InvalidArgument, "--all cannot be combined with explicit targets");
    }
    if (!targets.empty()) {
        return targets;
    }
    if (const auto &defaults = registry.default_targets()) {
        return *defaults;
    }
    return registry.names();
}

Result<BuildPlan> plan_session(const DependencyGraph &graph, const SessionConfig &config,
                               const RecordStore &records) {
    auto names = select_targets(graph.registry(), config.targets, config.all);
    if (!names) {
        return std::unexpected(names.error());
    }
    auto targets = graph.resolve(*names);
    if (!targets) {
        return std::unexpected(targets.error());
    }

    FingerprintEngine engine(graph);
    auto fingerprints = compute_fingerprints(engine, graph, graph.closure(*targets));
    for (const auto &[id, fp] : fingerprints) {
        if (!fp) {
            std::println(stderr, "warning: {}; it will be rebuilt", fp.error().message);
        }
    }
    return plan_build(graph, *targets, fingerprints, records, config.force);
}

Result<RunSummary> run_session(const DependencyGraph &graph, ImageBuilder &builder, RecordStore &records,
                               const SessionConfig &config) {
    auto plan = plan_session(graph, config, records);
    if (!plan) {
        return std::unexpected(plan.error());
    }
    if (plan->empty() && !config.executor.quiet) {
        std::println("Nothing to build: {} unit(s) up to date.", plan->up_to_date.size());
    }
    return Executor(graph, builder, records, config.executor).execute(*plan);
}

int exit_status(const RunSummary &summary) {
    return summary.ok() ? 0 : 1;
}

} // namespace imagesmith
