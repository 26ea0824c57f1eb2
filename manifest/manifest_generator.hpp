#pragma once
#include <string>
#include "manifest_entry.hpp"
#include "manifest_store.hpp"
#include "../common/reporter.hpp"
#include "../common/result.hpp"

// Outcome of hashing one file inside the pool.
struct FileDigest {
    std::string relativePath;
    Result<std::string> digest;
};

// Walks a tree, hashes every file on a bounded pool and streams one manifest
// line per file to the sink in completion order. A file that cannot be hashed
// becomes a FAILED line and is counted; only a failed walk or a failed sink
// aborts the run.
class ManifestGenerator {
public:
    // threadCount 0 picks Config::defaultThreadCount()
    explicit ManifestGenerator(size_t threadCount = 0, Reporter* reporter = nullptr);

    Result<GenerateSummary> generate(const std::string& rootDir, ManifestSink& sink);

    size_t threadCount() const { return threadCount_; }

    ManifestGenerator(const ManifestGenerator&) = delete;
    ManifestGenerator& operator=(const ManifestGenerator&) = delete;

private:
    size_t threadCount_;
    NullReporter nullReporter_;
    Reporter* reporter_;

    static Result<std::string> hashOne(const std::string& filePath);
};
