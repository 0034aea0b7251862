#pragma once

#include "ism/utility.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace imagesmith {

struct ImageHandle {
    std::string image;
};

struct BuildRequest {
    std::string unit;
    std::string image;                                   ///< name to tag the result with
    std::string script;                                  ///< composed instruction script
    std::vector<std::filesystem::path> context_dirs = {}; ///< merged in order into one context
    std::chrono::milliseconds deadline = std::chrono::milliseconds::zero();
};

/**
 * @brief The external image builder.
 *
 * `build` may be slow and blocks the calling worker. Implementations must be safe
 * to call from several workers at once.
 */
class ImageBuilder {
public:
    virtual ~ImageBuilder() = default;

    /** @return The built image, or `BuildError` / `Timeout`. */
    virtual Result<ImageHandle> build(const BuildRequest &request) = 0;

    /** @brief Name the image of `unit` is tagged with. */
    virtual std::string image_name(std::string_view unit) const {
        return std::string(unit);
    }

    /** @brief Human-readable form of the command `build` would run (for dry runs and --verbose). */
    virtual std::string describe(const BuildRequest &request) const {
        return "build " + request.image;
    }
};

struct DockerBuilderConfig {
    std::string docker = "docker";
    std::vector<std::string> extra_args = {};
    std::string repository = {}; // prefix, e.g. "registry.example.com/chem"
    std::string tag = "latest";
    bool no_cache = false;
    std::filesystem::path staging_root = std::filesystem::temp_directory_path() / "imagesmith";
    bool keep_staging = false;
};

/**
 * @brief Builds images with `docker build`.
 *
 * Each request gets a private staging directory holding the merged build context
 * and the script as `Dockerfile`; it is removed afterwards unless `keep_staging` is set.
 */
class DockerImageBuilder final : public ImageBuilder {
public:
    explicit DockerImageBuilder(DockerBuilderConfig config = {}) : config_(std::move(config)) {
    }

    Result<ImageHandle> build(const BuildRequest &request) override;
    std::string image_name(std::string_view unit) const override;
    std::string describe(const BuildRequest &request) const override;

    /** @brief Copies the context directories into `<dir>/context` and writes `<dir>/Dockerfile`. */
    static Result<void> stage(const BuildRequest &request, const std::filesystem::path &dir);

    std::vector<std::string> command(const BuildRequest &request, const std::filesystem::path &dir) const;

private:
    std::filesystem::path make_staging_dir(std::string_view unit) const;

    DockerBuilderConfig config_;
};

} // namespace imagesmith
