#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "ism/executor.hpp"
#include "ism/graph.hpp"
#include "ism/planner.hpp"
#include "ism/record_store.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace imagesmith;

namespace {

class RejectingStore final : public RecordStore {
public:
    std::optional<BuildRecord> get(std::string_view) const override {
        return std::nullopt;
    }
    Result<void> put(std::string_view unit, const BuildRecord &) override {
        return fail(ErrorKind::IOError, "disk full", {std::string(unit)});
    }
    Result<void> erase(std::string_view) override {
        return {};
    }
};

// base <- A <- C <- E
//      <- B <- D <-/
struct Fixture {
    UnitRegistry registry;
    std::optional<DependencyGraph> graph;
    FingerprintMap fingerprints;

    bool setup() {
        if (!register_all(registry, {make_unit("base", {}, "RUN base", "debian"), make_unit("A", {"base"}, "RUN a"),
                                     make_unit("B", {"base"}, "RUN b"), make_unit("C", {"A"}, "RUN c"),
                                     make_unit("D", {"B"}, "RUN d"), make_unit("E", {"C", "D"}, "RUN e")}))
            return false;
        auto built = DependencyGraph::build(registry);
        if (!built)
            return false;
        graph.emplace(std::move(*built));
        for (size_t id = 0; id < graph->size(); ++id) {
            fingerprints.emplace(id, "fp-" + graph->name(id));
        }
        return true;
    }

    BuildPlan plan(const RecordStore &records) const {
        return plan_build(*graph, {}, fingerprints, records);
    }
};

ExecutorConfig quiet_config(size_t jobs = 2) {
    ExecutorConfig config;
    config.quiet = true;
    config.jobs = jobs;
    return config;
}

bool success_records_every_unit() {
    Fixture f;
    CHECK(f.setup());
    MemoryRecordStore records;
    ScriptedBuilder builder;

    Executor executor(*f.graph, builder, records, quiet_config());
    auto summary = executor.execute(f.plan(records));
    CHECK(summary.ok());
    CHECK(summary.count(UnitState::Succeeded) == 6);
    for (const auto &unit : f.registry.units()) {
        auto record = records.get(unit.name);
        CHECK(record.has_value());
        CHECK(record->fingerprint == "fp-" + unit.name);
        CHECK(record->timestamp > 0);
    }

    auto requests = builder.requests();
    auto e = std::find_if(requests.begin(), requests.end(), [](const BuildRequest &r) { return r.unit == "E"; });
    CHECK(e != requests.end());
    CHECK(e->script.starts_with("FROM debian\n"));
    CHECK(e->script.find("RUN c") < e->script.find("RUN e"));
    CHECK(summary.find("E")->image == "E");
    return true;
}

bool dependencies_finish_before_dependents_start() {
    Fixture f;
    CHECK(f.setup());
    MemoryRecordStore records;
    ScriptedBuilder builder;
    builder.delay = std::chrono::milliseconds(20);

    Executor executor(*f.graph, builder, records, quiet_config(4));
    auto summary = executor.execute(f.plan(records));
    CHECK(summary.ok());

    auto order = builder.built();
    CHECK(order.size() == 6);
    auto pos = [&](std::string_view name) { return std::find(order.begin(), order.end(), name) - order.begin(); };
    for (size_t id = 0; id < f.graph->size(); ++id) {
        for (size_t dep : f.graph->requirements(id)) {
            CHECK(pos(f.graph->name(dep)) < pos(f.graph->name(id)));
        }
    }
    return true;
}

bool siblings_build_in_parallel() {
    UnitRegistry registry;
    CHECK(register_all(registry, {make_unit("base", {}, "", "debian"), make_unit("x", {"base"}),
                                  make_unit("y", {"base"}), make_unit("z", {"base"})}));
    auto graph = DependencyGraph::build(registry);
    CHECK(graph);
    FingerprintMap fps;
    for (size_t id = 0; id < graph->size(); ++id) {
        fps.emplace(id, graph->name(id));
    }
    MemoryRecordStore records;
    CHECK(records.put("base", {"base", 1}));

    ScriptedBuilder builder;
    builder.delay = std::chrono::milliseconds(150);
    Executor executor(*graph, builder, records, quiet_config(3));
    auto summary = executor.execute(plan_build(*graph, {}, fps, records));
    CHECK(summary.ok());
    CHECK(summary.count(UnitState::Succeeded) == 3);
    CHECK(summary.count(UnitState::UpToDate) == 1);
    CHECK(builder.max_concurrent() >= 2);
    return true;
}

bool failure_skips_dependents_only() {
    Fixture f;
    CHECK(f.setup());
    MemoryRecordStore records;
    CHECK(records.put("A", {"fp-A-old", 1}));
    ScriptedBuilder builder;
    builder.failing = {"A"};

    Executor executor(*f.graph, builder, records, quiet_config(1));
    auto summary = executor.execute(f.plan(records));
    CHECK(!summary.ok());

    CHECK(summary.find("A")->state == UnitState::Failed);
    CHECK(summary.find("C")->state == UnitState::Skipped);
    CHECK(summary.find("E")->state == UnitState::Skipped);
    CHECK(summary.find("B")->state == UnitState::Succeeded);
    CHECK(summary.find("D")->state == UnitState::Succeeded);
    CHECK(summary.find("base")->state == UnitState::Succeeded);

    auto built = builder.built();
    CHECK(std::find(built.begin(), built.end(), "C") == built.end());
    CHECK(std::find(built.begin(), built.end(), "E") == built.end());

    // the failed unit keeps its old record, skipped ones get none
    CHECK(records.get("A")->fingerprint == "fp-A-old");
    CHECK(!records.get("C").has_value());
    CHECK(!records.get("E").has_value());
    CHECK(records.get("D").has_value());

    // next invocation retries exactly the failed subtree
    auto retry = f.plan(records);
    std::vector<std::string> names;
    for (const auto &p : retry.to_build) {
        names.push_back(f.graph->name(p.unit));
    }
    CHECK((names == std::vector<std::string>{"A", "C", "E"}));
    return true;
}

bool timeout_counts_as_failure() {
    Fixture f;
    CHECK(f.setup());
    MemoryRecordStore records;
    ScriptedBuilder builder;
    builder.timing_out = {"D"};

    ExecutorConfig config = quiet_config();
    config.timeout = std::chrono::milliseconds(10);
    Executor executor(*f.graph, builder, records, config);
    auto summary = executor.execute(f.plan(records));
    CHECK(!summary.ok());
    CHECK(summary.find("D")->state == UnitState::Failed);
    CHECK(summary.find("D")->error->kind == ErrorKind::Timeout);
    CHECK(summary.find("E")->state == UnitState::Skipped);
    CHECK(summary.find("C")->state == UnitState::Succeeded);

    for (const auto &request : builder.requests()) {
        CHECK(request.deadline == std::chrono::milliseconds(10));
    }
    return true;
}

bool record_write_failure_is_contained() {
    Fixture f;
    CHECK(f.setup());
    RejectingStore records;
    ScriptedBuilder builder;

    Executor executor(*f.graph, builder, records, quiet_config());
    auto summary = executor.execute(f.plan(records));
    CHECK(summary.ok());
    CHECK(summary.count(UnitState::Succeeded) == 6);
    return true;
}

bool dry_run_builds_nothing() {
    Fixture f;
    CHECK(f.setup());
    MemoryRecordStore records;
    ScriptedBuilder builder;

    ExecutorConfig config = quiet_config();
    config.dry_run = true;
    Executor executor(*f.graph, builder, records, config);
    auto summary = executor.execute(f.plan(records));
    CHECK(summary.ok());
    CHECK(builder.built().empty());
    CHECK(summary.count(UnitState::Pending) == 6);
    CHECK(!records.get("base").has_value());
    return true;
}

bool empty_plan_is_a_success() {
    Fixture f;
    CHECK(f.setup());
    MemoryRecordStore records;
    for (const auto &[id, fp] : f.fingerprints) {
        CHECK(records.put(f.graph->name(id), {*fp, 1}));
    }
    ScriptedBuilder builder;
    Executor executor(*f.graph, builder, records, quiet_config());
    auto summary = executor.execute(f.plan(records));
    CHECK(summary.ok());
    CHECK(summary.count(UnitState::UpToDate) == 6);
    CHECK(builder.built().empty());
    return true;
}

bool plan_export_lists_scripts() {
    Fixture f;
    CHECK(f.setup());
    MemoryRecordStore records;
    ScriptedBuilder builder;
    TempDir dir{"ism_plan"};

    Executor executor(*f.graph, builder, records, quiet_config());
    CHECK(executor.emit_plan(f.plan(records), dir.path() / "build_plan.json"));

    std::ifstream in(dir.path() / "build_plan.json");
    auto doc = nlohmann::json::parse(in);
    CHECK(doc.is_array());
    CHECK(doc.size() == 6);
    CHECK(doc[0]["unit"] == "base");
    CHECK(doc[0]["reason"] == "never built");
    CHECK(doc[5]["unit"] == "E");
    CHECK(doc[5]["chain"].size() == 6);
    CHECK(doc[5]["script"].get<std::string>().starts_with("FROM debian"));
    return true;
}

} // namespace

bool executor_tests() {
    bool ok = true;
    ok = success_records_every_unit() && ok;
    ok = dependencies_finish_before_dependents_start() && ok;
    ok = siblings_build_in_parallel() && ok;
    ok = failure_skips_dependents_only() && ok;
    ok = timeout_counts_as_failure() && ok;
    ok = record_write_failure_is_contained() && ok;
    ok = dry_run_builds_nothing() && ok;
    ok = empty_plan_is_a_success() && ok;
    ok = plan_export_lists_scripts() && ok;
    return ok;
}
