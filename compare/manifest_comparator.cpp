#include "manifest_comparator.hpp"

ComparisonResult ManifestComparator::compare(const Manifest& source, const Manifest& destination) {
    ComparisonResult result;

    for (const auto& [path, digest] : source) {
        auto it = destination.find(path);
        if (it == destination.end()) {
            result.missing.insert(path);
        } else if (it->second != digest) {
            // two FAILED entries compare equal, FAILED never equals a digest
            result.mismatched.insert(path);
        }
    }

    for (const auto& entry : destination) {
        if (source.find(entry.first) == source.end())
            result.extra.insert(entry.first);
    }

    return result;
}
