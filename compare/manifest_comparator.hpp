#pragma once
#include <set>
#include <string>
#include "../manifest/manifest_entry.hpp"

struct ComparisonResult {
    std::set<std::string> missing;      // only in source
    std::set<std::string> extra;        // only in destination
    std::set<std::string> mismatched;   // in both, digests differ

    bool identical() const {
        return missing.empty() && extra.empty() && mismatched.empty();
    }
};

class ManifestComparator {
public:
    static ComparisonResult compare(const Manifest& source, const Manifest& destination);
};
