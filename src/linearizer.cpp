#include "ism/linearizer.hpp"

#include <format>
#include <functional>

namespace imagesmith {

EffectiveBuildPlan linearize(const DependencyGraph &graph, size_t unit) {
    EffectiveBuildPlan plan{unit, {}};
    std::vector<bool> seen(graph.size(), false);

    std::function<void(size_t)> visit = [&](size_t u) {
        for (size_t dep : graph.requirements(u)) {
            if (!seen[dep]) {
                visit(dep);
            }
        }
        seen[u] = true;
        plan.entries.push_back(u);
    };

    visit(unit);
    return plan;
}

Result<std::string> resolve_base(const DependencyGraph &graph, const EffectiveBuildPlan &plan) {
    const ImageUnit *declaring = nullptr;
    for (size_t id : plan.entries) {
        const ImageUnit &unit = graph.registry().at(id);
        if (!unit.base_reference)
            continue;
        if (!declaring) {
            declaring = &unit;
        } else if (*declaring->base_reference != *unit.base_reference) {
            return fail(ErrorKind::ConflictingBase,
                        std::format("Unit '{}' inherits conflicting bases: '{}' from '{}' and '{}' from '{}'",
                                    graph.name(plan.target), *declaring->base_reference, declaring->name,
                                    *unit.base_reference, unit.name),
                        {graph.name(plan.target), declaring->name, unit.name});
        }
    }

    if (!declaring) {
        const std::string &target = graph.name(plan.target);
        return fail(ErrorKind::MissingBase,
                    std::format("Unit '{}' has no base image anywhere in its requirement chain", target), {target});
    }
    return *declaring->base_reference;
}

Result<void> validate_bases(const DependencyGraph &graph) {
    for (size_t id = 0; id < graph.size(); ++id) {
        if (auto res = resolve_base(graph, linearize(graph, id)); !res) {
            return std::unexpected(res.error());
        }
    }
    return {};
}

Result<std::string> compose_script(const DependencyGraph &graph, const EffectiveBuildPlan &plan) {
    auto base = resolve_base(graph, plan);
    if (!base) {
        return std::unexpected(base.error());
    }

    std::string script = std::format("FROM {}\n", *base);
    for (size_t id : plan.entries) {
        const ImageUnit &unit = graph.registry().at(id);
        script += std::format("# --- {} ---\n", unit.name);
        script += unit.build_steps;
        if (!unit.build_steps.empty() && unit.build_steps.back() != '\n') {
            script += '\n';
        }
    }
    return script;
}

std::vector<std::filesystem::path> context_directories(const DependencyGraph &graph, const EffectiveBuildPlan &plan) {
    std::vector<std::filesystem::path> dirs;
    for (size_t id : plan.entries) {
        if (const auto &dir = graph.registry().at(id).build_directory) {
            dirs.push_back(*dir);
        }
    }
    return dirs;
}

} // namespace imagesmith
