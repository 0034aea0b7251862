#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "ism/registry.hpp"

using namespace imagesmith;

namespace {

bool duplicate_name_rejected() {
    UnitRegistry registry;
    CHECK(registry.add_unit(make_unit("base", {}, "", "debian:jessie")));
    auto res = registry.add_unit(make_unit("base"));
    CHECK(!res);
    CHECK(res.error().kind == ErrorKind::DuplicateName);
    CHECK(res.error().structural());
    CHECK(registry.size() == 1);
    CHECK(registry.at(0).base_reference == "debian:jessie");
    return true;
}

bool lookup_unknown_fails() {
    UnitRegistry registry;
    CHECK(register_all(registry, {make_unit("base")}));
    auto found = registry.lookup("base");
    CHECK(found);
    CHECK(found->get().name == "base");

    auto missing = registry.lookup("nope");
    CHECK(!missing);
    CHECK(missing.error().kind == ErrorKind::UnknownUnit);
    CHECK(!registry.index_of("nope").has_value());
    return true;
}

bool enumeration_keeps_insertion_order() {
    UnitRegistry registry;
    CHECK(register_all(registry, {make_unit("zeta"), make_unit("alpha"), make_unit("mid")}));
    CHECK((registry.names() == std::vector<std::string>{"zeta", "alpha", "mid"}));
    CHECK(registry.names() == registry.names());
    CHECK(registry.index_of("alpha") == 1u);
    return true;
}

bool replace_keeps_index() {
    UnitRegistry registry;
    CHECK(register_all(registry, {make_unit("base", {}, "RUN a"), make_unit("app", {"base"}, "RUN b")}));
    CHECK(registry.replace_unit(make_unit("base", {}, "RUN changed")));
    CHECK(registry.index_of("base") == 0u);
    CHECK(registry.at(0).build_steps == "RUN changed");

    auto res = registry.replace_unit(make_unit("ghost"));
    CHECK(!res);
    CHECK(res.error().kind == ErrorKind::UnknownUnit);
    return true;
}

bool default_targets_are_optional() {
    UnitRegistry registry;
    CHECK(!registry.default_targets().has_value());
    registry.set_default_targets({"app"});
    CHECK(registry.default_targets().has_value());
    CHECK(registry.default_targets()->front() == "app");
    return true;
}

} // namespace

bool registry_tests() {
    bool ok = true;
    ok = duplicate_name_rejected() && ok;
    ok = lookup_unknown_fails() && ok;
    ok = enumeration_keeps_insertion_order() && ok;
    ok = replace_keeps_index() && ok;
    ok = default_targets_are_optional() && ok;
    return ok;
}
