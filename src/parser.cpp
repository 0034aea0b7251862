#include "ism/parser.hpp"

#include "ism/domain.hpp"
#include "ism/utility.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace imagesmith {

namespace {

constexpr std::string_view DEFAULT_TARGETS_KEY = "_ALL_";

Result<std::string> scalar(const YAML::Node &node, std::string_view unit, std::string_view key) {
    if (!node.IsScalar()) {
        return fail(ErrorKind::ManifestError, std::format("Unit '{}': '{}' must be a string", unit, key),
                    {std::string(unit)});
    }
    return node.as<std::string>();
}

Result<std::vector<std::string>> name_list(const YAML::Node &node, std::string_view unit, std::string_view key) {
    std::vector<std::string> names;
    if (node.IsNull()) {
        return names;
    }
    if (!node.IsSequence()) {
        return fail(ErrorKind::ManifestError, std::format("'{}' of '{}' must be a list of unit names", key, unit),
                    {std::string(unit)});
    }
    for (const auto &item : node) {
        auto name = scalar(item, unit, key);
        if (!name) {
            return std::unexpected(name.error());
        }
        names.push_back(std::move(*name));
    }
    return names;
}

Result<ImageUnit> parse_unit(const std::string &name, const YAML::Node &body, const fs::path &base_dir) {
    ImageUnit unit{.name = name};
    if (body.IsNull()) {
        return unit;
    }
    if (!body.IsMap()) {
        return fail(ErrorKind::ManifestError, std::format("Unit '{}' must be a mapping", name), {name});
    }

    for (const auto &entry : body) {
        const std::string key = entry.first.as<std::string>();
        const YAML::Node &value = entry.second;

        if (key == "FROM") {
            auto base = scalar(value, name, key);
            if (!base)
                return std::unexpected(base.error());
            unit.base_reference = std::move(*base);
        } else if (key == "requires") {
            auto reqs = name_list(value, name, key);
            if (!reqs)
                return std::unexpected(reqs.error());
            unit.requirements = std::move(*reqs);
        } else if (key == "build_directory") {
            auto dir = scalar(value, name, key);
            if (!dir)
                return std::unexpected(dir.error());
            fs::path p = fs::path(*dir).lexically_normal();
            if (!p.has_filename() && p.has_parent_path()) {
                p = p.parent_path(); // "notebook/" -> "notebook"
            }
            unit.build_directory = p.is_absolute() ? p : (base_dir / p).lexically_normal();
        } else if (key == "build") {
            auto steps = scalar(value, name, key);
            if (!steps)
                return std::unexpected(steps.error());
            unit.build_steps = std::move(*steps);
        } else if (key == "description") {
            auto text = scalar(value, name, key);
            if (!text)
                return std::unexpected(text.error());
            unit.description = std::move(*text);
        } else {
            return fail(ErrorKind::ManifestError, std::format("Unit '{}' has unknown key '{}'", name, key), {name});
        }
    }
    return unit;
}

} // namespace

Result<void> parse_string(UnitRegistry &registry, std::string_view content, const fs::path &base_dir) {
    YAML::Node doc;
    try {
        doc = YAML::Load(std::string(content));
    } catch (const YAML::Exception &err) {
        return fail(ErrorKind::ManifestError, std::format("Malformed manifest: {}", err.what()));
    }

    if (doc.IsNull()) {
        return {};
    }
    if (!doc.IsMap()) {
        return fail(ErrorKind::ManifestError, "Manifest must be a mapping of unit names to definitions");
    }

    try {
        for (const auto &entry : doc) {
            const std::string name = entry.first.as<std::string>();

            if (name == DEFAULT_TARGETS_KEY) {
                auto targets = name_list(entry.second, name, name);
                if (!targets)
                    return std::unexpected(targets.error());
                registry.set_default_targets(std::move(*targets));
                continue;
            }

            auto unit = parse_unit(name, entry.second, base_dir);
            if (!unit)
                return std::unexpected(unit.error());
            if (auto res = registry.add_unit(std::move(*unit)); !res)
                return std::unexpected(res.error());
        }
    } catch (const YAML::Exception &err) {
        return fail(ErrorKind::ManifestError, std::format("Malformed manifest: {}", err.what()));
    }
    return {};
}

Result<void> parse(UnitRegistry &registry, const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return fail(ErrorKind::ManifestError, std::format("Cannot open manifest {}", path.string()));
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return fail(ErrorKind::ManifestError, std::format("Failed to read manifest {}", path.string()));
    }

    fs::path base_dir = path.parent_path();
    if (base_dir.empty()) {
        base_dir = ".";
    }
    return parse_string(registry, content, base_dir);
}

} // namespace imagesmith
