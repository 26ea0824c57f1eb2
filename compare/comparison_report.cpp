#include "comparison_report.hpp"
#include <algorithm>
#include <fstream>
#include <utility>
#include <vector>

ComparisonReport::ComparisonReport(ComparisonResult result) : result_(std::move(result)) {}

void ComparisonReport::print(std::ostream& out) const {
    out << "Files only in source: " << result_.missing.size() << "\n";
    for (const auto& path : result_.missing) out << path << "\n";

    out << "Files only in destination: " << result_.extra.size() << "\n";
    for (const auto& path : result_.extra) out << path << "\n";

    out << "Files with different md5sum values: " << result_.mismatched.size() << "\n";
    for (const auto& path : result_.mismatched) out << path << "\n";
}

std::string ComparisonReport::csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos)
        return value;

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void ComparisonReport::writeCsv(std::ostream& out) const {
    const std::vector<std::string> missing(result_.missing.begin(), result_.missing.end());
    const std::vector<std::string> extra(result_.extra.begin(), result_.extra.end());
    const std::vector<std::string> mismatched(result_.mismatched.begin(), result_.mismatched.end());

    out << "missing,extra,hash_mismatch\n";
    const size_t rows = std::max({missing.size(), extra.size(), mismatched.size()});
    for (size_t i = 0; i < rows; ++i) {
        out << (i < missing.size() ? csvField(missing[i]) : "") << ","
            << (i < extra.size() ? csvField(extra[i]) : "") << ","
            << (i < mismatched.size() ? csvField(mismatched[i]) : "") << "\n";
    }
}

Result<void> ComparisonReport::writeCsvFile(const std::string& path) const {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        return Result<void>::Error(ErrorType::IOError, "Failed to open CSV output: " + path);
    }
    writeCsv(out);
    out.flush();
    if (!out) {
        return Result<void>::Error(ErrorType::IOError, "Failed to write CSV output: " + path);
    }
    return Result<void>::Ok();
}
