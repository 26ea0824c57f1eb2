#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "../common/result.hpp"

// Recursive listing of the files under one root directory.
// Hidden entries are included, directory symlinks are not followed and
// any directory that cannot be read fails the walk.
class FileEnumerator {
public:
    explicit FileEnumerator(const std::string& rootDir);

    // visits every file as the walk reaches it, no ordering guarantee
    Result<void> forEachFile(const std::function<void(const std::string&)>& visit) const;
    Result<std::vector<std::string>> listFiles() const;

    std::string relativePath(const std::string& filePath) const;
    const std::string& root() const { return rootDir_; }

private:
    std::string rootDir_;
    std::filesystem::path base_;

    static bool isListable(const std::filesystem::directory_entry& entry, std::error_code& ec);
};
