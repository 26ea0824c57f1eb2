#include "reporter.hpp"
#include "config.hpp"

ConsoleReporter::ConsoleReporter(std::ostream& out, const std::string& tag, bool showProgress)
    : out_(out), tag_(tag), showProgress_(showProgress) {}

void ConsoleReporter::info(const std::string& msg) {
    writeLine("", msg);
}

void ConsoleReporter::warn(const std::string& msg) {
    writeLine("Warning", msg);
}

void ConsoleReporter::error(const std::string& msg) {
    writeLine("Error", msg);
}

// successes are only counted, a line per file would drown the failures
void ConsoleReporter::fileHashed(const std::string&, const std::string&) {}

void ConsoleReporter::fileFailed(const std::string& relativePath, const std::string& cause) {
    writeLine("Error", "Error processing file " + relativePath + ": " + cause);
}

void ConsoleReporter::progress(size_t done, size_t total) {
    if (!showProgress_) return;
    if (done != total && done % Config::PROGRESS_STEP != 0) return;

    std::lock_guard<std::mutex> lock(mtx_);
    size_t percent = total == 0 ? 100 : (done * 100) / total;
    out_ << "\r[" << tag_ << "] Computing md5sums: " << done << "/" << total
         << " files (" << percent << "%)" << std::flush;
    progressLineOpen_ = true;
    if (done == total) endProgressLine();
}

void ConsoleReporter::writeLine(const std::string& level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mtx_);
    endProgressLine();
    out_ << "[" << tag_ << "] ";
    if (!level.empty()) out_ << level << ": ";
    out_ << msg << "\n";
}

// caller holds mtx_
void ConsoleReporter::endProgressLine() {
    if (progressLineOpen_) {
        out_ << "\n";
        progressLineOpen_ = false;
    }
}
