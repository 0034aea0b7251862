#pragma once

#include "ism/graph.hpp"
#include "ism/linearizer.hpp"
#include "ism/utility.hpp"

#include <filesystem>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace imagesmith {

/** @brief One file of a build context: path relative to the build directory and content digest. */
struct FileDigest {
    std::string path;
    std::string digest;
};

/**
 * @brief Memoised per-file content digests, keyed by path.
 *
 * Entries are kept sorted by path; lookups take a shared lock, inserts an exclusive one.
 */
class DigestCache {
    struct Entry {
        std::filesystem::path path;
        std::string digest;
    };

    std::vector<Entry> cache;
    std::shared_mutex cache_mtx;

public:
    Result<std::string> get_or_compute(const std::filesystem::path &p);
    void clear();
};

/**
 * @brief Computes content fingerprints of units.
 *
 * A fingerprint is a BLAKE3 digest over the unit's effective build plan in plan
 * order: for every entry its name, base reference, build steps, and the sorted
 * (relative path, content digest) list of every file under its build directory.
 * Timestamps and directory enumeration order never enter the digest.
 */
class FingerprintEngine {
public:
    explicit FingerprintEngine(const DependencyGraph &graph) : graph_(&graph) {
    }

    /** @return The fingerprint, or `UnreadableFile` if any context file of the plan cannot be read. */
    Result<std::string> fingerprint(const EffectiveBuildPlan &plan);

    Result<std::string> fingerprint(size_t unit) {
        return fingerprint(linearize(*graph_, unit));
    }

    /**
     * @brief Sorted digest listing of every regular file below `dir`.
     *
     * Symlinked directories are entered, so the listing covers what staging copies.
     * A link that loops back onto a directory being walked is `UnreadableFile`.
     */
    Result<std::vector<FileDigest>> context_listing(const std::filesystem::path &dir);

    /** @brief Forgets memoised file digests (after files were modified in-process). */
    void clear_cache() {
        cache_.clear();
    }

    static Result<std::string> hash_file(const std::filesystem::path &path);
    static std::string hash_bytes(std::string_view bytes);

private:
    const DependencyGraph *graph_;
    DigestCache cache_;
};

} // namespace imagesmith
