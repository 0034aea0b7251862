#pragma once

#include "ism/domain.hpp"
#include "ism/utility.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imagesmith {

/**
 * @brief Owns every parsed `ImageUnit`, keyed by name.
 *
 * Units keep the index they were registered at for the lifetime of the registry,
 * so graphs and plans refer to them by index instead of holding copies.
 * Enumeration is in insertion order.
 */
class UnitRegistry {
public:
    /**
     * @brief Registers a unit.
     * @return The unit's index, or `DuplicateName` if the name is taken.
     */
    Result<size_t> add_unit(ImageUnit &&unit);

    /**
     * @brief Replaces the definition of an already registered unit in place.
     * @return `UnknownUnit` if no unit with that name exists.
     */
    Result<void> replace_unit(ImageUnit &&unit);

    /** @return The unit, or `UnknownUnit`. */
    Result<std::reference_wrapper<const ImageUnit>> lookup(std::string_view name) const;

    std::optional<size_t> index_of(std::string_view name) const;

    const ImageUnit &at(size_t index) const {
        return units_[index];
    }

    const std::vector<ImageUnit> &units() const {
        return units_;
    }

    size_t size() const {
        return units_.size();
    }

    /** @brief Records the manifest's `_ALL_` list. */
    void set_default_targets(std::vector<std::string> names) {
        default_targets_ = std::move(names);
    }

    const std::optional<std::vector<std::string>> &default_targets() const {
        return default_targets_;
    }

    /** @brief Names of every registered unit, in insertion order. */
    std::vector<std::string> names() const;

private:
    std::vector<ImageUnit> units_;
    std::map<std::string, size_t, std::less<>> index_;
    std::optional<std::vector<std::string>> default_targets_;
};

} // namespace imagesmith
