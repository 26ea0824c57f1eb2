#pragma once
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>
#include "manifest_entry.hpp"
#include "../common/result.hpp"

// Destination of manifest lines. Every write is one complete line.
class ManifestSink {
public:
    virtual ~ManifestSink() = default;
    virtual Result<void> open() = 0;
    virtual Result<void> write(const ManifestEntry& entry) = 0;
    virtual Result<void> flush() = 0;
};

class FileManifestSink : public ManifestSink {
public:
    explicit FileManifestSink(const std::string& path);
    Result<void> open() override;   // truncates
    Result<void> write(const ManifestEntry& entry) override;
    Result<void> flush() override;

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mtx_;
};

class StreamManifestSink : public ManifestSink {
public:
    explicit StreamManifestSink(std::ostream& out);
    Result<void> open() override;
    Result<void> write(const ManifestEntry& entry) override;
    Result<void> flush() override;

private:
    std::ostream& out_;
    std::mutex mtx_;
};

// Text format: "<path> <md5 hex | FAILED>\n", split on the first space.
// '%', ' ', '\n' and '\r' inside a path are percent-encoded.
class ManifestStore {
public:
    static std::string encodePath(const std::string& path);
    static Result<std::string> decodePath(const std::string& encoded);

    static std::string formatLine(const ManifestEntry& entry);
    static Result<ManifestEntry> parseLine(const std::string& line, size_t lineNumber);

    static Result<void> write(ManifestSink& sink, const std::vector<ManifestEntry>& entries);
    static Result<Manifest> load(const std::string& path);

    // sorted paths whose digest is missing
    static std::vector<std::string> failedEntries(const Manifest& manifest);
};
