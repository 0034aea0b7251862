#include "ism/registry.hpp"

#include <format>

namespace imagesmith {

Result<size_t> UnitRegistry::add_unit(ImageUnit &&unit) {
    if (index_.contains(unit.name)) {
        return fail(ErrorKind::DuplicateName, std::format("Duplicate unit name: {}", unit.name), {unit.name});
    }

    size_t id = units_.size();
    index_.emplace(unit.name, id);
    units_.push_back(std::move(unit));
    return id;
}

Result<void> UnitRegistry::replace_unit(ImageUnit &&unit) {
    auto it = index_.find(unit.name);
    if (it == index_.end()) {
        return fail(ErrorKind::UnknownUnit, std::format("Unknown unit: {}", unit.name), {unit.name});
    }
    units_[it->second] = std::move(unit);
    return {};
}

Result<std::reference_wrapper<const ImageUnit>> UnitRegistry::lookup(std::string_view name) const {
    if (auto id = index_of(name)) {
        return std::cref(units_[*id]);
    }
    return fail(ErrorKind::UnknownUnit, std::format("Unknown unit: {}", name), {std::string(name)});
}

std::optional<size_t> UnitRegistry::index_of(std::string_view name) const {
    if (auto it = index_.find(name); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<std::string> UnitRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(units_.size());
    for (const auto &unit : units_) {
        out.push_back(unit.name);
    }
    return out;
}

} // namespace imagesmith
