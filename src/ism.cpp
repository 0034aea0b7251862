#include "ism/executor.hpp"
#include "ism/graph.hpp"
#include "ism/image_builder.hpp"
#include "ism/linearizer.hpp"
#include "ism/parser.hpp"
#include "ism/record_store.hpp"
#include "ism/registry.hpp"
#include "ism/session.hpp"

#include <charconv>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <print>
#include <string>
#include <unordered_set>

namespace {

void print_help() {
    std::println("Usage: ism [options] [unit...]");
    std::println("Builds the named units (default: the manifest's _ALL_ list, or every unit).");
    std::println("Options:");
    std::println("  -h, --help             Show this help message");
    std::println("  -v, --version          Show version");
    std::println("  -d <dir>               Change working directory before doing anything");
    std::println("  -f <file>              Use <file> as the manifest (default: DockerMake.yml)");
    std::println("  -j, --jobs <N>         Set number of parallel builds (default: auto)");
    std::println("  --all                  Build the default target list (no unit names allowed)");
    std::println("  --force                Rebuild regardless of recorded fingerprints");
    std::println("  --dry-run              Print what would be built without building");
    std::println("  --timeout <seconds>    Fail any single build running longer than this");
    std::println("  --state-dir <dir>      Where build records live (default: .imagesmith)");
    std::println("  --repository <prefix>  Prefix image names with <prefix>/");
    std::println("  --tag <tag>            Tag images with <tag> (default: latest)");
    std::println("  --docker <exe>         Docker executable (default: docker)");
    std::println("  --no-cache             Pass --no-cache to docker build");
    std::println("  --keep-staging         Keep the staged build contexts");
    std::println("  --list                 List units and exit");
    std::println("  --print-script <unit>  Print the composed build script of <unit> and exit");
    std::println("  --graph                Print the dependency graph in DOT format and exit");
    std::println("  --emit-plan            Write build_plan.json and exit");
    std::println("  --forget <unit>        Drop the build record of <unit> and exit");
    std::println("  --verbose              Print rebuild reasons and builder commands");
    std::println("  --quiet                Only print failures and the summary");
}

void print_version() {
    std::println("ism {}", IMAGESMITH_PROJ_VER);
}

void report(const imagesmith::Error &err) {
    std::println(std::cerr, "{}: {}", imagesmith::to_string(err.kind), err.message);
}

bool parse_count(const char *text, size_t &out) {
    auto res = std::from_chars(text, text + strlen(text), out);
    return res.ec == std::errc() && res.ptr == text + strlen(text);
}

} // namespace

int main(const int argc, const char *const *argv) {
    imagesmith::SessionConfig session;
    imagesmith::ExecutorConfig &config = session.executor;
    imagesmith::DockerBuilderConfig docker;
    std::filesystem::path manifest_path = "DockerMake.yml";
    std::filesystem::path work_dir = ".";
    bool list = false;
    bool graph_only = false;
    bool emit_plan = false;
    std::string print_script;
    std::string forget;

    auto need_value = [&](int &i, std::string_view arg) -> const char * {
        if (i + 1 < argc) {
            return argv[++i];
        }
        std::println(std::cerr, "Missing argument for {}", arg);
        return nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-d") {
            auto value = need_value(i, arg);
            if (!value)
                return 1;
            work_dir = value;
        } else if (arg == "-f") {
            auto value = need_value(i, arg);
            if (!value)
                return 1;
            manifest_path = value;
        } else if (arg == "-j" || arg == "--jobs") {
            auto value = need_value(i, arg);
            if (!value)
                return 1;
            if (!parse_count(value, config.jobs)) {
                std::println(std::cerr, "Invalid job count: {}", value);
                return 1;
            }
        } else if (arg == "--timeout") {
            auto value = need_value(i, arg);
            if (!value)
                return 1;
            size_t seconds = 0;
            if (!parse_count(value, seconds)) {
                std::println(std::cerr, "Invalid timeout: {}", value);
                return 1;
            }
            config.timeout = std::chrono::seconds(seconds);
        } else if (arg == "--state-dir") {
            auto value = need_value(i, arg);
            if (!value)
                return 1;
            session.state_dir = value;
        } else if (arg == "--repository") {
            auto value = need_value(i, arg);
            if (!value)
                return 1;
            docker.repository = value;
        } else if (arg == "--tag") {
            auto value = need_value(i, arg);
            if (!value)
                return 1;
            docker.tag = value;
        } else if (arg == "--docker") {
            auto value = need_value(i, arg);
            if (!value)
                return 1;
            docker.docker = value;
        } else if (arg == "--print-script") {
            auto value = need_value(i, arg);
            if (!value)
                return 1;
            print_script = value;
        } else if (arg == "--forget") {
            auto value = need_value(i, arg);
            if (!value)
                return 1;
            forget = value;
        } else if (arg == "--all") {
            session.all = true;
        } else if (arg == "--force") {
            session.force = true;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "--no-cache") {
            docker.no_cache = true;
        } else if (arg == "--keep-staging") {
            docker.keep_staging = true;
        } else if (arg == "--list") {
            list = true;
        } else if (arg == "--graph") {
            graph_only = true;
        } else if (arg == "--emit-plan") {
            emit_plan = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else if (arg.starts_with("-")) {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        } else {
            session.targets.emplace_back(arg);
        }
    }

    if (work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(work_dir, ec);
        if (ec) {
            std::println(std::cerr, "Failed to change directory to {}: {}", work_dir.string(), ec.message());
            return 1;
        }
    }

    imagesmith::UnitRegistry registry;
    if (auto res = imagesmith::parse(registry, manifest_path); !res) {
        report(res.error());
        return 1;
    }

    auto graph = imagesmith::DependencyGraph::build(registry);
    if (!graph) {
        report(graph.error());
        return 1;
    }
    if (auto res = imagesmith::validate_bases(*graph); !res) {
        report(res.error());
        return 1;
    }

    if (list) {
        for (const auto &unit : registry.units()) {
            if (unit.description.empty()) {
                std::println("{}", unit.name);
            } else {
                std::println("{:<24} {}", unit.name, unit.description.substr(0, unit.description.find('\n')));
            }
        }
        return 0;
    }

    imagesmith::FileRecordStore records(session.state_dir);

    if (!forget.empty()) {
        if (auto found = registry.lookup(forget); !found) {
            report(found.error());
            return 1;
        }
        if (auto res = records.erase(forget); !res) {
            report(res.error());
            return 1;
        }
        return 0;
    }

    if (!print_script.empty()) {
        auto id = graph->resolve({print_script});
        if (!id) {
            report(id.error());
            return 1;
        }
        auto script = imagesmith::compose_script(*graph, imagesmith::linearize(*graph, id->front()));
        if (!script) {
            report(script.error());
            return 1;
        }
        std::print("{}", *script);
        return 0;
    }

    imagesmith::DockerImageBuilder builder(docker);

    if (graph_only || emit_plan) {
        auto plan = imagesmith::plan_session(*graph, session, records);
        if (!plan) {
            report(plan.error());
            return 1;
        }
        if (graph_only) {
            std::unordered_set<size_t> highlighted;
            for (const auto &planned : plan->to_build) {
                highlighted.insert(planned.unit);
            }
            std::print("{}", graph->to_dot(highlighted));
            return 0;
        }
        imagesmith::Executor executor(*graph, builder, records, config);
        if (auto res = executor.emit_plan(*plan, "build_plan.json"); !res) {
            report(res.error());
            return 1;
        }
        return 0;
    }

    auto summary = imagesmith::run_session(*graph, builder, records, session);
    if (!summary) {
        report(summary.error());
        return 1;
    }
    if (!config.dry_run && summary->count(imagesmith::UnitState::UpToDate) < summary->outcomes.size()) {
        imagesmith::print_summary(*summary);
    }
    return imagesmith::exit_status(*summary);
}
