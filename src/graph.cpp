#include "ism/graph.hpp"

#include "ism/utility.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <functional>
#include <queue>
#include <sstream>

namespace imagesmith {

Result<DependencyGraph> DependencyGraph::build(const UnitRegistry &registry) {
    DependencyGraph graph{registry};
    graph.nodes_.resize(registry.size());

    for (size_t id = 0; id < registry.size(); ++id) {
        const ImageUnit &unit = registry.at(id);
        auto &reqs = graph.nodes_[id].requirements;

        for (const auto &dep_name : unit.requirements) {
            auto dep = registry.index_of(dep_name);
            if (!dep) {
                return fail(ErrorKind::DanglingReference,
                            std::format("Unit '{}' requires unknown unit '{}'", unit.name, dep_name),
                            {unit.name, dep_name});
            }
            if (std::find(reqs.begin(), reqs.end(), *dep) != reqs.end()) {
                continue; // listed twice, the first position wins
            }
            reqs.push_back(*dep);
            graph.nodes_[*dep].dependents.push_back(id);
        }
    }

    if (auto res = graph.detect_cycles(); !res) {
        return std::unexpected(res.error());
    }
    return graph;
}

Result<void> DependencyGraph::detect_cycles() const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::vector<STATUS> status(nodes_.size(), STATUS::UNSTARTED);
    std::vector<size_t> stack;

    std::function<Result<void>(size_t)> dfs = [&](size_t u) -> Result<void> {
        status[u] = STATUS::WORKING;
        stack.push_back(u);
        for (size_t v : nodes_[u].requirements) {
            if (status[v] == STATUS::UNSTARTED) {
                if (auto res = dfs(v); !res)
                    return res;
            } else if (status[v] == STATUS::WORKING) {
                auto first = std::find(stack.begin(), stack.end(), v);
                std::vector<std::string> cycle;
                for (auto it = first; it != stack.end(); ++it) {
                    cycle.push_back(name(*it));
                }
                cycle.push_back(name(v));

                std::string rendered;
                for (const auto &n : cycle) {
                    if (!rendered.empty())
                        rendered += " -> ";
                    rendered += n;
                }
                return fail(ErrorKind::CyclicDependency, std::format("Dependency cycle: {}", rendered),
                            std::move(cycle));
            }
        }
        stack.pop_back();
        status[u] = STATUS::FINISHED;
        return {};
    };

    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (status[i] == STATUS::UNSTARTED) {
            if (auto res = dfs(i); !res)
                return res;
        }
    }
    return {};
}

Result<std::vector<size_t>> DependencyGraph::resolve(const std::vector<std::string> &names) const {
    std::vector<size_t> ids;
    ids.reserve(names.size());
    for (const auto &n : names) {
        auto id = registry_->index_of(n);
        if (!id) {
            return fail(ErrorKind::UnknownUnit, std::format("Unknown unit: {}", n), {n});
        }
        ids.push_back(*id);
    }
    return ids;
}

std::vector<size_t> DependencyGraph::topo_order() const {
    std::vector<size_t> in_degrees(nodes_.size(), 0);
    for (size_t i = 0; i < nodes_.size(); ++i) {
        in_degrees[i] = nodes_[i].requirements.size();
    }

    // min-heap on the index keeps independent units in registration order
    std::priority_queue<size_t, std::vector<size_t>, std::greater<>> ready;
    for (size_t i = 0; i < in_degrees.size(); ++i) {
        if (in_degrees[i] == 0)
            ready.push(i);
    }

    std::vector<size_t> order;
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        size_t u = ready.top();
        ready.pop();
        order.push_back(u);
        for (size_t v : nodes_[u].dependents) {
            if (--in_degrees[v] == 0)
                ready.push(v);
        }
    }
    return order;
}

std::vector<size_t> DependencyGraph::closure(const std::vector<size_t> &targets) const {
    std::vector<bool> included(nodes_.size(), false);
    std::vector<size_t> work(targets.begin(), targets.end());
    while (!work.empty()) {
        size_t u = work.back();
        work.pop_back();
        if (included[u])
            continue;
        included[u] = true;
        for (size_t v : nodes_[u].requirements) {
            work.push_back(v);
        }
    }

    std::vector<size_t> out;
    for (size_t u : topo_order()) {
        if (included[u])
            out.push_back(u);
    }
    return out;
}

std::unordered_set<size_t> DependencyGraph::transitive_dependents(size_t id) const {
    std::unordered_set<size_t> seen;
    std::vector<size_t> work(nodes_[id].dependents);
    while (!work.empty()) {
        size_t u = work.back();
        work.pop_back();
        if (!seen.insert(u).second)
            continue;
        for (size_t v : nodes_[u].dependents) {
            work.push_back(v);
        }
    }
    return seen;
}

std::string DependencyGraph::to_dot(const std::unordered_set<size_t> &highlighted) const {
    std::ostringstream out;
    out << "digraph imagesmith {\n";
    out << "  rankdir=LR;\n";
    out << "  node [shape=box, style=filled, fontname=\"Helvetica\"];\n";

    for (size_t i = 0; i < nodes_.size(); ++i) {
        const char *color = highlighted.contains(i) ? "green" : "white";
        out << "  n" << i << " [label=\"" << name(i) << "\", fillcolor=\"" << color << "\"];\n";
    }
    // arrows point from a requirement to the unit built on top of it
    for (size_t i = 0; i < nodes_.size(); ++i) {
        for (size_t dep : nodes_[i].requirements) {
            out << "  n" << dep << " -> n" << i << ";\n";
        }
    }
    out << "}\n";
    return out.str();
}

} // namespace imagesmith
