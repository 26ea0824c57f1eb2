#include "file_enumerator.hpp"

namespace fs = std::filesystem;

namespace {

// "dir/" and "dir" must give the same relative paths
fs::path normalizedBase(const std::string& rootDir) {
    fs::path base = fs::path(rootDir).lexically_normal();
    if (!base.has_filename() && base.has_relative_path())
        base = base.parent_path();
    return base;
}

}

FileEnumerator::FileEnumerator(const std::string& rootDir) : rootDir_(rootDir), base_(normalizedBase(rootDir)) {}

// regular files, plus symlinks that resolve to a regular file. A link whose
// target cannot be resolved is listed too, so hashing reports it as FAILED
// instead of it vanishing; opening it fails at once on the same lookup.
// Links to FIFOs, sockets and devices are skipped, opening them may block.
bool FileEnumerator::isListable(const fs::directory_entry& entry, std::error_code& ec) {
    if (entry.is_symlink(ec)) {
        if (ec) return false;
        fs::file_status target = entry.status(ec);
        if (ec) {
            ec.clear();
            return true;
        }
        return fs::is_regular_file(target);
    }
    if (ec) return false;
    return entry.is_regular_file(ec);
}

Result<void> FileEnumerator::forEachFile(const std::function<void(const std::string&)>& visit) const {
    std::error_code ec;
    fs::file_status status = fs::status(rootDir_, ec);
    if (ec || !fs::exists(status)) {
        return Result<void>::Error(ErrorType::DirectoryError, "Directory does not exist: " + rootDir_);
    }
    if (!fs::is_directory(status)) {
        return Result<void>::Error(ErrorType::DirectoryError, "Not a directory: " + rootDir_);
    }

    fs::recursive_directory_iterator it(rootDir_, fs::directory_options::none, ec);
    if (ec) {
        return Result<void>::Error(ErrorType::DirectoryError,
            "Cannot read directory " + rootDir_ + ": " + ec.message());
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        const fs::directory_entry& entry = *it;
        if (isListable(entry, ec)) {
            visit(entry.path().string());
        } else if (ec) {
            return Result<void>::Error(ErrorType::DirectoryError,
                "Cannot stat " + entry.path().string() + ": " + ec.message());
        }

        // increment opens subdirectories, so unreadable ones surface here
        std::string current = entry.path().string();
        it.increment(ec);
        if (ec) {
            return Result<void>::Error(ErrorType::DirectoryError,
                "Cannot read directory at " + current + ": " + ec.message());
        }
    }

    return Result<void>::Ok();
}

Result<std::vector<std::string>> FileEnumerator::listFiles() const {
    std::vector<std::string> files;
    Result<void> walked = forEachFile([&files](const std::string& path) {
        files.push_back(path);
    });
    if (!walked.success) {
        return Result<std::vector<std::string>>::From(walked);
    }
    return Result<std::vector<std::string>>::Ok(std::move(files));
}

std::string FileEnumerator::relativePath(const std::string& filePath) const {
    return fs::path(filePath).lexically_normal().lexically_relative(base_).generic_string();
}
