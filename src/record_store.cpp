#include "ism/record_store.hpp"

#include <cstdio>
#include <format>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace imagesmith {

namespace {

// Unit names become file names; anything outside [A-Za-z0-9._-] is %-escaped.
std::string escape_name(std::string_view unit) {
    std::string out;
    out.reserve(unit.size());
    for (unsigned char c : unit) {
        bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
                     c == '-' || c == '.';
        if (plain) {
            out.push_back(static_cast<char>(c));
        } else {
            out += std::format("%{:02X}", c);
        }
    }
    if (out.empty() || out.front() == '.') {
        out.insert(0, "%");
    }
    return out;
}

} // namespace

FileRecordStore::FileRecordStore(fs::path state_dir) : records_dir_(std::move(state_dir) / "records") {
}

fs::path FileRecordStore::record_path(std::string_view unit) const {
    return records_dir_ / (escape_name(unit) + ".json");
}

std::optional<BuildRecord> FileRecordStore::get(std::string_view unit) const {
    const fs::path path = record_path(unit);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    using json = nlohmann::json;
    json doc = json::parse(content, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("fingerprint") || !doc["fingerprint"].is_string() ||
        !doc.contains("timestamp") || !doc["timestamp"].is_number_integer() || doc.value("unit", "") != unit) {
        std::println(stderr, "warning: ignoring unreadable build record {}", path.string());
        return std::nullopt;
    }
    return BuildRecord{doc["fingerprint"].get<std::string>(), doc["timestamp"].get<int64_t>()};
}

Result<void> FileRecordStore::put(std::string_view unit, const BuildRecord &record) {
    std::error_code ec;
    fs::create_directories(records_dir_, ec);
    if (ec) {
        return fail(ErrorKind::IOError, std::format("Failed to create {}: {}", records_dir_.string(), ec.message()),
                    {std::string(unit)});
    }

    nlohmann::json doc;
    doc["format"] = FORMAT_VERSION;
    doc["unit"] = unit;
    doc["fingerprint"] = record.fingerprint;
    doc["timestamp"] = record.timestamp;
    const std::string body = doc.dump(2) + "\n";

    const fs::path target = record_path(unit);
    const fs::path tmp = target.string() + std::format(".tmp.{}", getpid());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return fail(ErrorKind::IOError, std::format("Failed to write {}", tmp.string()), {std::string(unit)});
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(tmp, cleanup_ec);
        return fail(ErrorKind::IOError, std::format("Failed to replace {}: {}", target.string(), ec.message()),
                    {std::string(unit)});
    }
    return {};
}

Result<void> FileRecordStore::erase(std::string_view unit) {
    std::error_code ec;
    fs::remove(record_path(unit), ec);
    if (ec) {
        return fail(ErrorKind::IOError, std::format("Failed to remove record of {}: {}", unit, ec.message()),
                    {std::string(unit)});
    }
    return {};
}

std::optional<BuildRecord> MemoryRecordStore::get(std::string_view unit) const {
    std::lock_guard lock(mtx_);
    if (auto it = records_.find(std::string(unit)); it != records_.end()) {
        return it->second;
    }
    return std::nullopt;
}

Result<void> MemoryRecordStore::put(std::string_view unit, const BuildRecord &record) {
    std::lock_guard lock(mtx_);
    records_.insert_or_assign(std::string(unit), record);
    return {};
}

Result<void> MemoryRecordStore::erase(std::string_view unit) {
    std::lock_guard lock(mtx_);
    records_.erase(std::string(unit));
    return {};
}

} // namespace imagesmith
