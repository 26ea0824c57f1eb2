#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

struct ManifestEntry {
    std::string relativePath;
    std::optional<std::string> digest;   // empty when the file could not be hashed

    ManifestEntry() = default;
    ManifestEntry(std::string path, std::optional<std::string> d)
        : relativePath(std::move(path)), digest(std::move(d)) {}

    bool failed() const { return !digest.has_value(); }

    bool operator==(const ManifestEntry& other) const {
        return relativePath == other.relativePath && digest == other.digest;
    }
};

// relativePath -> digest
using Manifest = std::unordered_map<std::string, std::optional<std::string>>;

struct GenerateSummary {
    size_t fileCount = 0;
    size_t errorCount = 0;
};
