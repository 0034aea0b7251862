#include "ism/executor.hpp"

#include "ism/linearizer.hpp"
#include "ism/utility.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdio>
#include <format>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <print>
#include <queue>
#include <string>
#include <unistd.h>
#include <unordered_map>
#include <vector>

namespace imagesmith {

namespace {

int64_t now_seconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

bool is_terminal(UnitState state) {
    return state == UnitState::Succeeded || state == UnitState::Failed || state == UnitState::Skipped;
}

} // namespace

bool RunSummary::ok() const {
    return std::none_of(outcomes.begin(), outcomes.end(), [](const UnitOutcome &o) {
        return o.state == UnitState::Failed || o.state == UnitState::Skipped;
    });
}

size_t RunSummary::count(UnitState state) const {
    return std::count_if(outcomes.begin(), outcomes.end(), [state](const UnitOutcome &o) { return o.state == state; });
}

const UnitOutcome *RunSummary::find(std::string_view unit) const {
    auto it = std::find_if(outcomes.begin(), outcomes.end(), [unit](const UnitOutcome &o) { return o.unit == unit; });
    return it == outcomes.end() ? nullptr : &*it;
}

Executor::Executor(const DependencyGraph &graph, ImageBuilder &builder, RecordStore &records, ExecutorConfig config)
    : graph(graph), builder(builder), records(records), config(config) {
}

BuildRequest Executor::make_request(const PlannedUnit &planned, std::string script) const {
    const std::string &name = graph.name(planned.unit);
    return BuildRequest{.unit = name,
                        .image = builder.image_name(name),
                        .script = std::move(script),
                        .context_dirs = context_directories(graph, linearize(graph, planned.unit)),
                        .deadline = config.timeout};
}

Result<ImageHandle> Executor::build_unit(const PlannedUnit &planned) const {
    auto script = compose_script(graph, linearize(graph, planned.unit));
    if (!script) {
        return std::unexpected(script.error());
    }
    return builder.build(make_request(planned, std::move(*script)));
}

void Executor::record_success(const PlannedUnit &planned) {
    const std::string &name = graph.name(planned.unit);
    if (!planned.fingerprint) {
        std::println(stderr, "warning: {} built without a known fingerprint; it will be rebuilt next time", name);
        return;
    }
    if (auto res = records.put(name, BuildRecord{*planned.fingerprint, now_seconds()}); !res) {
        std::println(stderr, "warning: failed to record build of {}: {}", name, res.error().message);
    }
}

RunSummary Executor::execute(const BuildPlan &plan) {
    pool.clear(); // Ensure clean state

    const auto start_time = std::chrono::steady_clock::now();
    const size_t total = plan.to_build.size();

    RunSummary summary;
    summary.outcomes.reserve(total + plan.up_to_date.size());
    std::unordered_map<size_t, size_t> slot_of; // unit index -> position in plan.to_build
    for (size_t slot = 0; slot < total; ++slot) {
        const auto &planned = plan.to_build[slot];
        slot_of.emplace(planned.unit, slot);
        summary.outcomes.push_back({graph.name(planned.unit), UnitState::Pending, planned.reason});
    }
    for (const auto &planned : plan.up_to_date) {
        summary.outcomes.push_back({graph.name(planned.unit), UnitState::UpToDate, planned.reason});
    }

    std::ofstream tty;
    if (isatty(STDOUT_FILENO)) {
        tty.open("/dev/tty");
    }
    std::mutex cout_tty_mtx;

    auto announce = [&](size_t slot, size_t position, std::string_view verb) {
        if (config.quiet)
            return;
        const auto &planned = plan.to_build[slot];
        std::lock_guard lock(cout_tty_mtx);
        tty << "\033[1m" << std::flush;
        std::cout << "[" << position << "/" << total << "] " << std::flush;
        tty << "\033[0m\033[1;32m" << std::flush;
        std::cout << verb << std::flush;
        tty << "\033[0m" << std::flush;
        std::cout << " -> " << graph.name(planned.unit);
        if (config.verbose)
            std::cout << " (" << to_string(planned.reason) << ")";
        std::cout << std::endl;
    };

    if (config.dry_run) {
        for (size_t slot = 0; slot < total; ++slot) {
            announce(slot, slot + 1, "would build");
            if (config.verbose) {
                auto script = compose_script(graph, linearize(graph, plan.to_build[slot].unit));
                if (script) {
                    std::println("    {}", builder.describe(make_request(plan.to_build[slot], std::move(*script))));
                }
            }
        }
        summary.total_time =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
        return summary;
    }

    if (total == 0) {
        return summary;
    }

    // Count in-plan requirements; requirements outside the plan are already built.
    std::vector<size_t> remaining(total, 0);
    std::vector<std::vector<size_t>> plan_dependents(total);
    for (size_t slot = 0; slot < total; ++slot) {
        for (size_t dep : graph.requirements(plan.to_build[slot].unit)) {
            if (auto it = slot_of.find(dep); it != slot_of.end()) {
                remaining[slot]++;
                plan_dependents[it->second].push_back(slot);
            }
        }
    }

    // lowest slot first keeps independent units in plan order
    std::priority_queue<size_t, std::vector<size_t>, std::greater<>> ready_queue;
    for (size_t slot = 0; slot < total; ++slot) {
        if (remaining[slot] == 0)
            ready_queue.push(slot);
    }

    std::mutex mtx;
    std::condition_variable cv_ready;
    size_t finished_count = 0;
    size_t started_count = 0;

    auto skip_dependents = [&](size_t failed_slot) {
        std::vector<size_t> work(plan_dependents[failed_slot]);
        while (!work.empty()) {
            size_t slot = work.back();
            work.pop_back();
            auto &outcome = summary.outcomes[slot];
            if (outcome.state != UnitState::Pending)
                continue;
            outcome.state = UnitState::Skipped;
            outcome.error = Error{ErrorKind::BuildError,
                                  std::format("skipped because {} failed", summary.outcomes[failed_slot].unit),
                                  {summary.outcomes[failed_slot].unit}};
            finished_count++;
            work.insert(work.end(), plan_dependents[slot].begin(), plan_dependents[slot].end());
        }
    };

    auto worker = [&]() {
        while (true) {
            size_t slot;
            size_t position;
            {
                std::unique_lock lock(mtx);
                cv_ready.wait(lock, [&] { return !ready_queue.empty() || finished_count == total; });
                if (ready_queue.empty())
                    return;

                slot = ready_queue.top();
                ready_queue.pop();
                summary.outcomes[slot].state = UnitState::Building;
                position = ++started_count;
            }

            announce(slot, position, "build");
            const auto unit_start = std::chrono::steady_clock::now();
            auto result = build_unit(plan.to_build[slot]);
            auto elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - unit_start);

            if (result) {
                record_success(plan.to_build[slot]);
            } else {
                std::lock_guard lock(cout_tty_mtx);
                std::println(stderr, "Build failed: {}: {}", graph.name(plan.to_build[slot].unit),
                             result.error().message);
            }

            {
                std::lock_guard lock(mtx);
                auto &outcome = summary.outcomes[slot];
                outcome.elapsed = elapsed;
                finished_count++;

                if (result) {
                    outcome.state = UnitState::Succeeded;
                    outcome.image = result->image;
                    for (size_t next : plan_dependents[slot]) {
                        if (--remaining[next] == 0 && summary.outcomes[next].state == UnitState::Pending) {
                            ready_queue.push(next);
                        }
                    }
                } else {
                    outcome.state = UnitState::Failed;
                    outcome.error = result.error();
                    skip_dependents(slot);
                }
            }
            cv_ready.notify_all();
        }
    };

    size_t thread_count = config.jobs;
    if (thread_count == 0)
        thread_count = std::thread::hardware_concurrency();
    if (thread_count == 0)
        thread_count = 1;
    thread_count = std::min(thread_count, total);

    for (size_t i = 0; i < thread_count; ++i) {
        pool.emplace_back(worker);
    }

    pool.clear(); // Join all threads

    summary.total_time =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
    return summary;
}

Result<void> Executor::emit_plan(const BuildPlan &plan, const std::filesystem::path &path) const {
    using json = nlohmann::json;
    json out = json::array();

    for (const auto &planned : plan.to_build) {
        json entry;
        entry["unit"] = graph.name(planned.unit);
        entry["reason"] = to_string(planned.reason);
        entry["fingerprint"] = planned.fingerprint ? json(*planned.fingerprint) : json(nullptr);
        entry["image"] = builder.image_name(graph.name(planned.unit));

        json chain = json::array();
        const auto linear = linearize(graph, planned.unit);
        for (size_t id : linear.entries) {
            chain.push_back(graph.name(id));
        }
        entry["chain"] = chain;

        auto script = compose_script(graph, linear);
        if (!script) {
            return std::unexpected(script.error());
        }
        entry["script"] = *script;
        out.push_back(entry);
    }

    std::ofstream f(path);
    f << out.dump(4) << '\n';
    f.flush();
    if (!f) {
        return fail(ErrorKind::IOError, std::format("Failed to write {}", path.string()));
    }
    return {};
}

void print_summary(const RunSummary &summary) {
    for (const auto &outcome : summary.outcomes) {
        if (outcome.state == UnitState::UpToDate)
            continue;
        if (outcome.error) {
            std::println("  {:<24} {:<10} {}", outcome.unit, to_string(outcome.state), outcome.error->message);
        } else {
            std::println("  {:<24} {:<10} {} ms", outcome.unit, to_string(outcome.state), outcome.elapsed.count());
        }
    }
    std::println("{} built, {} failed, {} skipped, {} up to date ({} ms)", summary.count(UnitState::Succeeded),
                 summary.count(UnitState::Failed), summary.count(UnitState::Skipped),
                 summary.count(UnitState::UpToDate), summary.total_time.count());
}

} // namespace imagesmith
