#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "ism/record_store.hpp"

#include <atomic>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace imagesmith;

namespace {

bool absent_means_never_built() {
    TempDir dir{"ism_records"};
    FileRecordStore store(dir.path());
    CHECK(!store.get("base").has_value());
    // nothing is created until the first put
    CHECK(!fs::exists(dir.path() / "records"));
    return true;
}

bool put_overwrites_previous_record() {
    TempDir dir{"ism_records"};
    FileRecordStore store(dir.path());
    CHECK(store.put("base", {"aaaa", 100}));
    CHECK(store.put("base", {"bbbb", 200}));

    auto record = store.get("base");
    CHECK(record.has_value());
    CHECK(record->fingerprint == "bbbb");
    CHECK(record->timestamp == 200);

    std::ifstream in(store.record_path("base"));
    auto doc = nlohmann::json::parse(in);
    CHECK(doc["unit"] == "base");
    CHECK(doc["format"] == FileRecordStore::FORMAT_VERSION);

    // no temporary files left behind
    size_t files = 0;
    for (const auto &entry : fs::directory_iterator(dir.path() / "records")) {
        CHECK(entry.path().extension() == ".json");
        files++;
    }
    CHECK(files == 1);
    return true;
}

bool corrupt_record_reads_as_absent() {
    TempDir dir{"ism_records"};
    FileRecordStore store(dir.path());
    create_file(store.record_path("base"), "{ not json");
    CHECK(!store.get("base").has_value());

    // a record written for another unit does not count
    create_file(store.record_path("py"), R"({"unit": "base", "fingerprint": "aa", "timestamp": 1})");
    CHECK(!store.get("py").has_value());
    return true;
}

bool failed_put_keeps_previous_record() {
    TempDir dir{"ism_records"};
    FileRecordStore store(dir.path());
    CHECK(store.put("base", {"good", 1}));

    // a directory squatting on the temporary name makes the write fail
    fs::path squatter = store.record_path("base").string() + std::format(".tmp.{}", getpid());
    fs::create_directories(squatter);
    auto res = store.put("base", {"bad", 2});
    CHECK(!res);
    CHECK(res.error().kind == ErrorKind::IOError);

    auto record = store.get("base");
    CHECK(record.has_value());
    CHECK(record->fingerprint == "good");
    return true;
}

bool unit_names_are_escaped() {
    TempDir dir{"ism_records"};
    FileRecordStore store(dir.path());
    CHECK(store.record_path("chem/python").filename() == "chem%2Fpython.json");
    CHECK(store.record_path("..").filename() == "%...json");
    CHECK(store.put("chem/python", {"ff", 3}));
    CHECK(store.get("chem/python").has_value());
    CHECK(!store.get("chem_python").has_value());
    return true;
}

bool erase_forgets() {
    TempDir dir{"ism_records"};
    FileRecordStore store(dir.path());
    CHECK(store.put("base", {"aa", 1}));
    CHECK(store.erase("base"));
    CHECK(!store.get("base").has_value());
    CHECK(store.erase("never-there"));
    return true;
}

bool concurrent_puts_on_distinct_units() {
    TempDir dir{"ism_records"};
    FileRecordStore store(dir.path());
    std::atomic<int> failures = 0;
    {
        std::vector<std::jthread> writers;
        for (int t = 0; t < 8; ++t) {
            writers.emplace_back([&store, &failures, t] {
                for (int i = 0; i < 20; ++i) {
                    if (!store.put(std::format("unit{}", t), {std::format("fp{}-{}", t, i), i})) {
                        failures++;
                    }
                }
            });
        }
    }
    CHECK(failures == 0);
    for (int t = 0; t < 8; ++t) {
        auto record = store.get(std::format("unit{}", t));
        CHECK(record.has_value());
        CHECK(record->fingerprint == std::format("fp{}-19", t));
    }
    return true;
}

bool memory_store_behaves_alike() {
    MemoryRecordStore store;
    CHECK(!store.get("base"));
    CHECK(store.put("base", {"aa", 1}));
    CHECK(store.get("base")->fingerprint == "aa");
    CHECK(store.erase("base"));
    CHECK(!store.get("base"));
    return true;
}

} // namespace

bool record_store_tests() {
    bool ok = true;
    ok = absent_means_never_built() && ok;
    ok = put_overwrites_previous_record() && ok;
    ok = corrupt_record_reads_as_absent() && ok;
    ok = failed_put_keeps_previous_record() && ok;
    ok = unit_names_are_escaped() && ok;
    ok = erase_forgets() && ok;
    ok = concurrent_puts_on_distinct_units() && ok;
    ok = memory_store_behaves_alike() && ok;
    return ok;
}
