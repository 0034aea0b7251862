#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "ism/parser.hpp"

namespace fs = std::filesystem;
using namespace imagesmith;

namespace {

constexpr std::string_view MANIFEST = R"(
_ALL_:
  - notebook
  - java

base:
  FROM: debian:bookworm
  description: Shared system packages
  build: |
    RUN apt-get update
    RUN apt-get install -y curl

python_install:
  requires:
    - base
  build: RUN apt-get install -y python3

notebook:
  requires: [python_install]
  build_directory: notebook/
  build: |
    ADD . /opt/notebook

java:
  requires:
    - base
  build_directory: ../shared/java

empty_unit:
)";

bool parses_units_in_order() {
    UnitRegistry registry;
    auto res = parse_string(registry, MANIFEST, "/work/project");
    if (!res) {
        std::println(std::cerr, "{}", res.error().message);
        return false;
    }

    CHECK((registry.names() ==
           std::vector<std::string>{"base", "python_install", "notebook", "java", "empty_unit"}));
    CHECK(registry.default_targets().has_value());
    CHECK((*registry.default_targets() == std::vector<std::string>{"notebook", "java"}));

    const ImageUnit &base = registry.lookup("base")->get();
    CHECK(base.base_reference == "debian:bookworm");
    CHECK(base.requirements.empty());
    CHECK(base.build_steps == "RUN apt-get update\nRUN apt-get install -y curl\n");
    CHECK(base.description == "Shared system packages");
    CHECK(!base.build_directory.has_value());

    const ImageUnit &py = registry.lookup("python_install")->get();
    CHECK(!py.base_reference.has_value());
    CHECK(py.requirements == std::vector<std::string>{"base"});
    CHECK(py.build_steps == "RUN apt-get install -y python3");

    const ImageUnit &nb = registry.lookup("notebook")->get();
    CHECK(nb.requirements == std::vector<std::string>{"python_install"});
    CHECK(nb.build_directory == fs::path("/work/project/notebook"));

    CHECK(registry.lookup("java")->get().build_directory == fs::path("/work/shared/java"));

    const ImageUnit &empty = registry.lookup("empty_unit")->get();
    CHECK(empty.build_steps.empty());
    CHECK(empty.requirements.empty());
    return true;
}

bool rejects_unknown_keys() {
    UnitRegistry registry;
    auto res = parse_string(registry, "a:\n  FROM: x\n  bulid: RUN true\n", ".");
    CHECK(!res);
    CHECK(res.error().kind == ErrorKind::ManifestError);
    CHECK(res.error().message.find("bulid") != std::string::npos);
    return true;
}

bool rejects_malformed_documents() {
    UnitRegistry registry;
    auto broken = parse_string(registry, "a:\n  requires: [b\n", ".");
    CHECK(!broken);
    CHECK(broken.error().kind == ErrorKind::ManifestError);

    auto list = parse_string(registry, "- a\n- b\n", ".");
    CHECK(!list);
    CHECK(list.error().kind == ErrorKind::ManifestError);

    auto bad_requires = parse_string(registry, "a:\n  requires: b\n", ".");
    CHECK(!bad_requires);
    CHECK(bad_requires.error().kind == ErrorKind::ManifestError);
    return true;
}

bool duplicate_units_are_rejected() {
    UnitRegistry registry;
    CHECK(parse_string(registry, "a:\n  FROM: x\n", "."));
    auto res = parse_string(registry, "a:\n  FROM: y\n", ".");
    CHECK(!res);
    CHECK(res.error().kind == ErrorKind::DuplicateName);
    CHECK(registry.lookup("a")->get().base_reference == "x");
    return true;
}

bool reads_manifest_files() {
    TempDir tmp{"ism_parser"};
    create_file(tmp.path() / "DockerMake.yml", "app:\n  FROM: alpine\n  build_directory: src\n");

    UnitRegistry registry;
    CHECK(parse(registry, tmp.path() / "DockerMake.yml"));
    CHECK(registry.size() == 1);
    CHECK(registry.lookup("app")->get().build_directory == (tmp.path() / "src").lexically_normal());
    CHECK(!registry.default_targets().has_value());

    UnitRegistry missing;
    auto res = parse(missing, tmp.path() / "absent.yml");
    CHECK(!res);
    CHECK(res.error().kind == ErrorKind::ManifestError);
    return true;
}

} // namespace

bool parser_tests() {
    bool ok = true;
    ok = parses_units_in_order() && ok;
    ok = rejects_unknown_keys() && ok;
    ok = rejects_malformed_documents() && ok;
    ok = duplicate_units_are_rejected() && ok;
    ok = reads_manifest_files() && ok;
    return ok;
}
