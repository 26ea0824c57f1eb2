#include "manifest_generator.hpp"
#include "../common/completion_queue.hpp"
#include "../common/config.hpp"
#include "../common/hash_utils.hpp"
#include "../common/thread_pool.hpp"
#include "../scan/file_enumerator.hpp"
#include <exception>
#include <memory>
#include <vector>

ManifestGenerator::ManifestGenerator(size_t threadCount, Reporter* reporter)
    : threadCount_(threadCount == 0 ? Config::defaultThreadCount() : threadCount),
      reporter_(reporter ? reporter : &nullReporter_) {}

namespace {

// hands the task's slot index to the consumer however the task ends
struct DeliverOnExit {
    CompletionQueue<size_t>& queue;
    size_t index;
    ~DeliverOnExit() { queue.push(index); }
};

}

Result<std::string> ManifestGenerator::hashOne(const std::string& filePath) {
    try {
        return HashUtils::computeFileDigest(filePath);
    } catch (const std::exception& e) {
        return Result<std::string>::Error(ErrorType::IOError,
            std::string("Exception while hashing ") + filePath + ": " + e.what());
    }
}

Result<GenerateSummary> ManifestGenerator::generate(const std::string& rootDir, ManifestSink& sink) {
    FileEnumerator enumerator(rootDir);

    // 1. the whole task list is known before any hashing starts
    reporter_->info("Walking directory " + rootDir + " to gather all file paths.");
    Result<std::vector<std::string>> listed = enumerator.listFiles();
    if (!listed.success) {
        reporter_->error(listed.message);
        return Result<GenerateSummary>::From(listed);
    }
    const std::vector<std::string>& files = listed.data;

    // one slot per file, preset to a failure that a finished task overwrites
    std::vector<FileDigest> slots;
    slots.reserve(files.size());
    for (const std::string& filePath : files) {
        std::string relativePath = enumerator.relativePath(filePath);
        slots.push_back({relativePath, Result<std::string>::Error(ErrorType::IOError,
            "Hashing did not complete for " + filePath)});
    }

    GenerateSummary summary;
    Result<void> sinkFailure = Result<void>::Ok();
    CompletionQueue<size_t> completed(files.size());

    // declared after everything its tasks reference, so it is torn down first
    std::unique_ptr<ThreadPool> pool;
    try {
        pool = std::make_unique<ThreadPool>(threadCount_);
    } catch (const std::exception& e) {
        // std::system_error from thread creation, length_error/bad_alloc from sizing
        Result<GenerateSummary> failed = Result<GenerateSummary>::Error(ErrorType::ResourceError,
            "Failed to start " + std::to_string(threadCount_) + " worker threads: " + e.what());
        reporter_->error(failed.message);
        return failed;
    }

    // 2. opened after the walk so a manifest inside the tree does not list itself
    Result<void> opened = sink.open();
    if (!opened.success) {
        reporter_->error(opened.message);
        return Result<GenerateSummary>::From(opened);
    }

    reporter_->info("Hashing " + std::to_string(files.size()) + " files with "
                    + std::to_string(threadCount_) + " workers.");

    // 3. one task per file, each delivers its index exactly once
    size_t submitted = 0;
    try {
        for (; submitted < files.size(); ++submitted) {
            const size_t index = submitted;
            const std::string& filePath = files[index];
            pool->submit([&completed, &slots, &filePath, index]() {
                DeliverOnExit deliver{completed, index};
                slots[index].digest = hashOne(filePath);
            });
        }
    } catch (const std::exception& e) {
        // the rest keep their preset failure
        for (size_t index = submitted; index < files.size(); ++index) completed.push(index);
        reporter_->error(std::string("Stopped scheduling checksum tasks: ") + e.what());
    }

    // 4. fan-in in completion order
    for (size_t done = 1; done <= files.size(); ++done) {
        const FileDigest& result = slots[completed.pop()];
        ++summary.fileCount;

        ManifestEntry entry;
        entry.relativePath = result.relativePath;
        if (result.digest.success) {
            entry.digest = result.digest.data;
            reporter_->fileHashed(entry.relativePath, result.digest.data);
        } else {
            ++summary.errorCount;
            reporter_->fileFailed(entry.relativePath, result.digest.message);
        }

        // keep draining after a sink failure so every file is accounted for
        if (sinkFailure.success) {
            Result<void> written = sink.write(entry);
            if (!written.success) sinkFailure = written;
        }
        reporter_->progress(done, files.size());
    }
    pool->shutdown();
    if (sinkFailure.success) {
        sinkFailure = sink.flush();
    }
    if (!sinkFailure.success) {
        reporter_->error(sinkFailure.message);
        return Result<GenerateSummary>::From(sinkFailure);
    }

    if (files.empty()) reporter_->progress(0, 0);
    reporter_->info("Finished generating md5sum manifest: " + std::to_string(summary.fileCount)
                    + " files, " + std::to_string(summary.errorCount) + " errors.");
    return Result<GenerateSummary>::Ok(summary);
}
