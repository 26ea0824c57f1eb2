#include "command_line.hpp"
#include "../common/reporter.hpp"
#include "../compare/comparison_report.hpp"
#include "../compare/manifest_comparator.hpp"
#include "../manifest/manifest_generator.hpp"
#include "../manifest/manifest_store.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

CommandLine::CommandLine(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

int CommandLine::run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return run(args);
}

int CommandLine::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        err_ << "Insufficient arguments\n";
        printHelp(err_);
        return EXIT_USAGE;
    }

    const std::string& keyword = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());
    if (keyword == "generate") {
        return handleGenerate(rest);
    } else if (keyword == "compare") {
        return handleCompare(rest);
    } else if (keyword == "help" || keyword == "--help" || keyword == "-h") {
        printHelp(out_);
        return EXIT_OK;
    }

    err_ << "Unknown command '" << keyword << "'. Type 'help' for available commands.\n";
    return EXIT_USAGE;
}

int CommandLine::handleGenerate(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    size_t threads = 0;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--threads") {
            if (i + 1 >= args.size()) {
                err_ << "Usage: generate <directory> <output_file> [--threads N]\n";
                return EXIT_USAGE;
            }
            try {
                const std::string& value = args[++i];
                size_t consumed = 0;
                long long n = std::stoll(value, &consumed);
                if (consumed != value.size()) throw std::invalid_argument("trailing characters");
                if (n <= 0) throw std::out_of_range("threads");
                threads = static_cast<size_t>(n);
            } catch (const std::exception&) {
                err_ << "--threads expects a positive integer, got '" << args[i] << "'\n";
                return EXIT_USAGE;
            }
        } else {
            positional.push_back(args[i]);
        }
    }
    if (positional.size() != 2) {
        err_ << "Usage: generate <directory> <output_file> [--threads N]\n";
        return EXIT_USAGE;
    }

    ConsoleReporter reporter(err_);
    ManifestGenerator generator(threads, &reporter);
    FileManifestSink sink(positional[1]);

    Result<GenerateSummary> summary = generator.generate(positional[0], sink);
    if (!summary.success) {
        err_ << "[" << errorTypeName(summary.error) << "] " << summary.message << "\n";
        return EXIT_FAILED;
    }
    if (summary.data.errorCount > 0) {
        reporter.warn(std::to_string(summary.data.errorCount) + " of " + std::to_string(summary.data.fileCount)
                      + " files could not be hashed and are marked FAILED in " + positional[1]);
    }
    return EXIT_OK;
}

int CommandLine::handleCompare(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    std::string outputCsv;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--output_csv") {
            if (i + 1 >= args.size()) {
                err_ << "Usage: compare <source_manifest> <destination_manifest> [--output_csv <file>]\n";
                return EXIT_USAGE;
            }
            outputCsv = args[++i];
        } else {
            positional.push_back(args[i]);
        }
    }
    if (positional.size() != 2) {
        err_ << "Usage: compare <source_manifest> <destination_manifest> [--output_csv <file>]\n";
        return EXIT_USAGE;
    }

    ConsoleReporter reporter(err_, "Compare", false);
    Manifest manifests[2];
    for (int i = 0; i < 2; ++i) {
        Result<Manifest> loaded = ManifestStore::load(positional[i]);
        if (!loaded.success) {
            err_ << "[" << errorTypeName(loaded.error) << "] " << loaded.message << "\n";
            return EXIT_FAILED;
        }
        size_t failed = ManifestStore::failedEntries(loaded.data).size();
        if (failed > 0) {
            reporter.warn(positional[i] + " has " + std::to_string(failed) + " FAILED entries, their contents are unverified");
        }
        manifests[i] = std::move(loaded.data);
    }

    ComparisonResult result = ManifestComparator::compare(manifests[0], manifests[1]);
    ComparisonReport report(result);
    report.print(out_);

    if (!outputCsv.empty()) {
        Result<void> written = report.writeCsvFile(outputCsv);
        if (!written.success) {
            err_ << "[" << errorTypeName(written.error) << "] " << written.message << "\n";
            return EXIT_FAILED;
        }
        out_ << "Results written to " << outputCsv << "\n";
    }
    return EXIT_OK;
}

// Help for commands
void CommandLine::printHelp(std::ostream& os) const {
    os << "Generate and compare md5sum manifests.\n"
       << "Available Commands:\n"
       << " generate <directory> <output_file> [--threads N]      Write the md5sum manifest of a directory\n"
       << " compare <source_manifest> <destination_manifest>      Compare two manifests\n"
       << "         [--output_csv <file>]                         Also write the result as CSV\n"
       << " help                                                  Show this help\n";
}
