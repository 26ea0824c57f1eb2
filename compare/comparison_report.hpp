#pragma once
#include <ostream>
#include <string>
#include "manifest_comparator.hpp"
#include "../common/result.hpp"

class ComparisonReport {
public:
    explicit ComparisonReport(ComparisonResult result);

    // counts and paths of the three sets
    void print(std::ostream& out) const;

    // columns missing,extra,hash_mismatch; shorter columns padded with empty cells
    void writeCsv(std::ostream& out) const;
    Result<void> writeCsvFile(const std::string& path) const;

    static std::string csvField(const std::string& value);

private:
    ComparisonResult result_;
};
