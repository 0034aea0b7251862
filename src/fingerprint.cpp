#include "ism/fingerprint.hpp"

#include "ism/mmap.hpp"

#include <algorithm>
#include <array>
#include <blake3.h>
#include <cstdint>
#include <format>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace imagesmith {

namespace {

constexpr std::string_view FINGERPRINT_FORMAT = "imagesmith-fingerprint-v1";

std::string to_hex(const uint8_t *bytes, size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0f]);
    }
    return out;
}

class Hasher {
public:
    Hasher() {
        blake3_hasher_init(&state_);
    }

    void update(std::string_view bytes) {
        blake3_hasher_update(&state_, bytes.data(), bytes.size());
    }

    // Length-prefixed so that adjacent fields cannot trade bytes.
    void field(std::string_view bytes) {
        uint64_t len = bytes.size();
        std::array<uint8_t, 8> prefix{};
        for (size_t i = 0; i < prefix.size(); ++i) {
            prefix[i] = static_cast<uint8_t>(len >> (8 * i));
        }
        blake3_hasher_update(&state_, prefix.data(), prefix.size());
        update(bytes);
    }

    std::string hex() {
        std::array<uint8_t, BLAKE3_OUT_LEN> out{};
        blake3_hasher_finalize(&state_, out.data(), out.size());
        return to_hex(out.data(), out.size());
    }

private:
    blake3_hasher state_;
};

} // namespace

Result<std::string> DigestCache::get_or_compute(const fs::path &p) {
    auto is_path_less = [](const Entry &e, const fs::path &val) { return e.path < val; };
    {
        std::shared_lock read_lock(cache_mtx);
        auto it = std::lower_bound(cache.begin(), cache.end(), p, is_path_less);
        if (it != cache.end() && it->path == p) {
            return it->digest;
        }
    }

    auto digest = FingerprintEngine::hash_file(p);
    if (!digest) {
        return digest;
    }

    std::lock_guard write_lock(cache_mtx);
    auto it = std::lower_bound(cache.begin(), cache.end(), p, is_path_less);
    if (it == cache.end() || it->path != p) {
        cache.insert(it, {p, *digest});
    }
    return digest;
}

void DigestCache::clear() {
    std::lock_guard write_lock(cache_mtx);
    cache.clear();
}

Result<std::string> FingerprintEngine::hash_file(const fs::path &path) {
    try {
        MappedFile file(path);
        Hasher hasher;
        hasher.update(file.content());
        return hasher.hex();
    } catch (const std::exception &e) {
        return fail(ErrorKind::UnreadableFile, e.what(), {path.string()});
    }
}

std::string FingerprintEngine::hash_bytes(std::string_view bytes) {
    Hasher hasher;
    hasher.update(bytes);
    return hasher.hex();
}

Result<std::vector<FileDigest>> FingerprintEngine::context_listing(const fs::path &dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return fail(ErrorKind::UnreadableFile, std::format("Build directory is not readable: {}", dir.string()),
                    {dir.string()});
    }

    // Directory links are followed, matching what staging copies into the build context.
    // open_dirs[d] is the resolved directory whose entries sit at depth d.
    std::vector<fs::path> open_dirs{fs::canonical(dir, ec)};
    if (ec) {
        return fail(ErrorKind::UnreadableFile, std::format("Failed to resolve {}: {}", dir.string(), ec.message()),
                    {dir.string()});
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(dir, fs::directory_options::follow_directory_symlink, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            fs::path real = fs::canonical(it->path(), type_ec);
            if (!type_ec) {
                open_dirs.resize(static_cast<size_t>(it.depth()) + 1);
                if (std::find(open_dirs.begin(), open_dirs.end(), real) != open_dirs.end()) {
                    return fail(
                        ErrorKind::UnreadableFile,
                        std::format("Symlink loop at {} (resolves to {})", it->path().string(), real.string()),
                        {it->path().string()});
                }
                open_dirs.push_back(std::move(real));
                continue;
            }
        } else if (!type_ec && it->is_regular_file(type_ec)) {
            files.push_back(it->path());
            continue;
        }
        if (type_ec) {
            return fail(ErrorKind::UnreadableFile,
                        std::format("Failed to stat {}: {}", it->path().string(), type_ec.message()),
                        {it->path().string()});
        }
    }
    if (ec) {
        return fail(ErrorKind::UnreadableFile, std::format("Failed to list {}: {}", dir.string(), ec.message()),
                    {dir.string()});
    }

    std::vector<FileDigest> listing;
    listing.reserve(files.size());
    for (const auto &file : files) {
        auto digest = cache_.get_or_compute(file);
        if (!digest) {
            return std::unexpected(digest.error());
        }
        listing.push_back({file.lexically_relative(dir).generic_string(), std::move(*digest)});
    }

    std::sort(listing.begin(), listing.end(), [](const FileDigest &a, const FileDigest &b) { return a.path < b.path; });
    return listing;
}

Result<std::string> FingerprintEngine::fingerprint(const EffectiveBuildPlan &plan) {
    Hasher hasher;
    hasher.field(FINGERPRINT_FORMAT);
    hasher.field(std::to_string(plan.entries.size()));

    for (size_t id : plan.entries) {
        const ImageUnit &unit = graph_->registry().at(id);
        hasher.field(unit.name);
        hasher.field(unit.base_reference ? "FROM " + *unit.base_reference : std::string());
        hasher.field(unit.build_steps);

        if (!unit.build_directory) {
            hasher.field("0");
            continue;
        }
        auto listing = context_listing(*unit.build_directory);
        if (!listing) {
            Error err = listing.error();
            err.message = std::format("Cannot fingerprint '{}': {}", graph_->name(plan.target), err.message);
            return std::unexpected(std::move(err));
        }
        hasher.field(std::to_string(listing->size()));
        for (const auto &file : *listing) {
            hasher.field(file.path);
            hasher.field(file.digest);
        }
    }
    return hasher.hex();
}

} // namespace imagesmith
