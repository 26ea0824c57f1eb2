#pragma once
#include <cstddef>
#include <iostream>
#include <mutex>
#include <string>

// Receives log lines and per-file events from long running operations.
// Implementations may be called from the generator thread only, but must
// tolerate calls from other threads as well.
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void info(const std::string& msg) = 0;
    virtual void warn(const std::string& msg) = 0;
    virtual void error(const std::string& msg) = 0;

    virtual void fileHashed(const std::string& relativePath, const std::string& digest) = 0;
    virtual void fileFailed(const std::string& relativePath, const std::string& cause) = 0;
    virtual void progress(size_t done, size_t total) = 0;
};

class NullReporter : public Reporter {
public:
    void info(const std::string&) override {}
    void warn(const std::string&) override {}
    void error(const std::string&) override {}
    void fileHashed(const std::string&, const std::string&) override {}
    void fileFailed(const std::string&, const std::string&) override {}
    void progress(size_t, size_t) override {}
};

// Tagged lines on a stream (stderr by default) plus a single-line file counter.
class ConsoleReporter : public Reporter {
public:
    explicit ConsoleReporter(std::ostream& out = std::cerr, const std::string& tag = "Generator", bool showProgress = true);

    void info(const std::string& msg) override;
    void warn(const std::string& msg) override;
    void error(const std::string& msg) override;
    void fileHashed(const std::string& relativePath, const std::string& digest) override;
    void fileFailed(const std::string& relativePath, const std::string& cause) override;
    void progress(size_t done, size_t total) override;

private:
    std::ostream& out_;
    std::string tag_;
    bool showProgress_;
    bool progressLineOpen_ = false;
    std::mutex mtx_;

    void writeLine(const std::string& level, const std::string& msg);
    void endProgressLine();
};
