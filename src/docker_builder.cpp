#include "ism/image_builder.hpp"

#include "ism/process_exec.hpp"

#include <format>
#include <fstream>
#include <print>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace imagesmith {

std::string DockerImageBuilder::image_name(std::string_view unit) const {
    if (config_.repository.empty()) {
        return std::format("{}:{}", unit, config_.tag);
    }
    std::string_view repo = config_.repository;
    if (repo.ends_with('/')) {
        repo.remove_suffix(1);
    }
    return std::format("{}/{}:{}", repo, unit, config_.tag);
}

fs::path DockerImageBuilder::make_staging_dir(std::string_view unit) const {
    std::random_device rd;
    return config_.staging_root / std::format("{}-{:08x}", unit, rd());
}

Result<void> DockerImageBuilder::stage(const BuildRequest &request, const fs::path &dir) {
    std::error_code ec;
    const fs::path context = dir / "context";
    fs::create_directories(context, ec);
    if (ec) {
        return fail(ErrorKind::BuildError, std::format("Failed to create {}: {}", context.string(), ec.message()),
                    {request.unit});
    }

    // later plan entries win on name clashes
    for (const auto &src : request.context_dirs) {
        fs::copy(src, context, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return fail(ErrorKind::BuildError,
                        std::format("Failed to stage build directory {}: {}", src.string(), ec.message()),
                        {request.unit});
        }
    }

    std::ofstream script(dir / "Dockerfile", std::ios::binary | std::ios::trunc);
    script.write(request.script.data(), static_cast<std::streamsize>(request.script.size()));
    script.flush();
    if (!script) {
        return fail(ErrorKind::BuildError, std::format("Failed to write {}", (dir / "Dockerfile").string()),
                    {request.unit});
    }
    return {};
}

std::vector<std::string> DockerImageBuilder::command(const BuildRequest &request, const fs::path &dir) const {
    std::vector<std::string> args{config_.docker, "build", "-t", request.image, "-f", (dir / "Dockerfile").string()};
    if (config_.no_cache) {
        args.push_back("--no-cache");
    }
    args.insert(args.end(), config_.extra_args.begin(), config_.extra_args.end());
    args.push_back((dir / "context").string());
    return args;
}

std::string DockerImageBuilder::describe(const BuildRequest &request) const {
    std::string out;
    for (const auto &arg : command(request, config_.staging_root / std::format("{}-XXXXXXXX", request.unit))) {
        if (!out.empty())
            out += ' ';
        out += arg;
    }
    return out;
}

Result<ImageHandle> DockerImageBuilder::build(const BuildRequest &request) {
    const fs::path dir = make_staging_dir(request.unit);

    auto result = [&]() -> Result<ImageHandle> {
        if (auto res = stage(request, dir); !res) {
            return std::unexpected(res.error());
        }

        auto status = process_exec(command(request, dir), std::nullopt, request.deadline);
        if (!status) {
            Error err = status.error();
            err.path = {request.unit};
            return std::unexpected(std::move(err));
        }
        if (*status != 0) {
            return fail(ErrorKind::BuildError,
                        std::format("{} build of '{}' exited with status {}", config_.docker, request.unit, *status),
                        {request.unit});
        }
        return ImageHandle{request.image};
    }();

    if (!config_.keep_staging) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            std::println(stderr, "warning: failed to remove staging directory {}: {}", dir.string(), ec.message());
        }
    }
    return result;
}

} // namespace imagesmith
