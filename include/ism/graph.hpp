#pragma once

#include "ism/registry.hpp"
#include "ism/utility.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace imagesmith {

/**
 * @brief Directed acyclic graph over the units of a registry.
 *
 * Node `i` is the unit registered at index `i`. Edges are stored as index lists:
 * `requirements` follows the unit's `requires` order (duplicates dropped),
 * `dependents` is the reverse adjacency in ascending index order.
 * The graph keeps a pointer to the registry it was built from; the registry must outlive it.
 */
class DependencyGraph {
public:
    struct Node {
        std::vector<size_t> requirements; ///< Units this unit requires, in declaration order.
        std::vector<size_t> dependents;   ///< Units that require this unit.
    };

    /**
     * @brief Builds and validates the graph.
     *
     * Fails with `DanglingReference` if a `requires` entry names an unregistered unit,
     * or with `CyclicDependency` carrying the full cycle (first unit repeated at the end).
     * Has no side effects and returns an identical graph for an unchanged registry.
     */
    static Result<DependencyGraph> build(const UnitRegistry &registry);

    const UnitRegistry &registry() const {
        return *registry_;
    }

    const std::vector<Node> &nodes() const {
        return nodes_;
    }

    size_t size() const {
        return nodes_.size();
    }

    const std::vector<size_t> &requirements(size_t id) const {
        return nodes_[id].requirements;
    }

    const std::vector<size_t> &dependents(size_t id) const {
        return nodes_[id].dependents;
    }

    const std::string &name(size_t id) const {
        return registry_->at(id).name;
    }

    /** @brief Resolves unit names to indices, failing with `UnknownUnit`. */
    Result<std::vector<size_t>> resolve(const std::vector<std::string> &names) const;

    /**
     * @brief Topological order over all nodes: dependencies before dependents,
     *        ties broken by registration order.
     */
    std::vector<size_t> topo_order() const;

    /** @brief The targets plus everything they transitively require, in `topo_order()`. */
    std::vector<size_t> closure(const std::vector<size_t> &targets) const;

    /** @brief Every unit that transitively requires `id` (excluding `id`). */
    std::unordered_set<size_t> transitive_dependents(size_t id) const;

    /**
     * @brief Renders the graph in Graphviz DOT format.
     * @param highlighted Units drawn filled (e.g. the ones a plan would rebuild).
     */
    std::string to_dot(const std::unordered_set<size_t> &highlighted = {}) const;

private:
    explicit DependencyGraph(const UnitRegistry &registry) : registry_(&registry) {
    }

    Result<void> detect_cycles() const;

    const UnitRegistry *registry_;
    std::vector<Node> nodes_;
};

} // namespace imagesmith
