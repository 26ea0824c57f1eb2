#include "manifest_store.hpp"
#include "../common/config.hpp"
#include <algorithm>
#include <cctype>

FileManifestSink::FileManifestSink(const std::string& path) : path_(path) {}

Result<void> FileManifestSink::open() {
    std::lock_guard<std::mutex> lock(mtx_);
    out_.open(path_, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out_.is_open()) {
        return Result<void>::Error(ErrorType::IOError, "Failed to open manifest for writing: " + path_);
    }
    return Result<void>::Ok();
}

Result<void> FileManifestSink::write(const ManifestEntry& entry) {
    const std::string line = ManifestStore::formatLine(entry);
    std::lock_guard<std::mutex> lock(mtx_);
    if (!out_.is_open()) {
        return Result<void>::Error(ErrorType::IOError, "Manifest not open: " + path_);
    }
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!out_) {
        return Result<void>::Error(ErrorType::IOError, "Failed to write manifest line to " + path_);
    }
    return Result<void>::Ok();
}

Result<void> FileManifestSink::flush() {
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
    if (!out_) {
        return Result<void>::Error(ErrorType::IOError, "Failed to flush manifest: " + path_);
    }
    return Result<void>::Ok();
}

StreamManifestSink::StreamManifestSink(std::ostream& out) : out_(out) {}

Result<void> StreamManifestSink::open() {
    return Result<void>::Ok();
}

Result<void> StreamManifestSink::write(const ManifestEntry& entry) {
    const std::string line = ManifestStore::formatLine(entry);
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << line;
    if (!out_) {
        return Result<void>::Error(ErrorType::IOError, "Failed to write manifest line");
    }
    return Result<void>::Ok();
}

Result<void> StreamManifestSink::flush() {
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
    if (!out_) {
        return Result<void>::Error(ErrorType::IOError, "Failed to flush manifest stream");
    }
    return Result<void>::Ok();
}

std::string ManifestStore::encodePath(const std::string& path) {
    std::string encoded;
    encoded.reserve(path.size());
    for (char c : path) {
        switch (c) {
        case '%':  encoded += "%25"; break;
        case ' ':  encoded += "%20"; break;
        case '\n': encoded += "%0A"; break;
        case '\r': encoded += "%0D"; break;
        default:   encoded += c;
        }
    }
    return encoded;
}

Result<std::string> ManifestStore::decodePath(const std::string& encoded) {
    std::string path;
    path.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%') {
            path += encoded[i];
            continue;
        }
        if (i + 2 >= encoded.size() ||
            !std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
            return Result<std::string>::Error(ErrorType::ParseError, "invalid escape in path '" + encoded + "'");
        }
        path += static_cast<char>(std::stoi(encoded.substr(i + 1, 2), nullptr, 16));
        i += 2;
    }
    return Result<std::string>::Ok(std::move(path));
}

std::string ManifestStore::formatLine(const ManifestEntry& entry) {
    std::string line = encodePath(entry.relativePath);
    line += ' ';
    line += entry.digest ? *entry.digest : Config::FAILURE_SENTINEL;
    line += '\n';
    return line;
}

Result<ManifestEntry> ManifestStore::parseLine(const std::string& rawLine, size_t lineNumber) {
    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.pop_back();

    auto fail = [lineNumber, &line](const std::string& why) {
        return Result<ManifestEntry>::Error(ErrorType::ParseError,
            "line " + std::to_string(lineNumber) + ": " + why + ": '" + line + "'");
    };

    size_t sep = line.find(' ');
    if (sep == std::string::npos) return fail("no separator");
    if (sep == 0) return fail("empty path");

    std::string digest = line.substr(sep + 1);
    if (digest.empty()) return fail("empty digest");
    if (std::any_of(digest.begin(), digest.end(), [](unsigned char c) { return std::isspace(c); }))
        return fail("digest contains whitespace");

    Result<std::string> path = decodePath(line.substr(0, sep));
    if (!path.success) return fail(path.message);

    if (digest == Config::FAILURE_SENTINEL)
        return Result<ManifestEntry>::Ok(ManifestEntry(std::move(path.data), std::nullopt));
    return Result<ManifestEntry>::Ok(ManifestEntry(std::move(path.data), std::move(digest)));
}

Result<void> ManifestStore::write(ManifestSink& sink, const std::vector<ManifestEntry>& entries) {
    for (const auto& entry : entries) {
        Result<void> written = sink.write(entry);
        if (!written.success) return written;
    }
    return sink.flush();
}

Result<Manifest> ManifestStore::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<Manifest>::Error(ErrorType::IOError, "Failed to open manifest: " + path);
    }

    Manifest manifest;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        Result<ManifestEntry> entry = parseLine(line, lineNumber);
        if (!entry.success) {
            return Result<Manifest>::Error(ErrorType::ParseError, path + ": " + entry.message);
        }
        // last occurrence wins
        manifest[entry.data.relativePath] = std::move(entry.data.digest);
    }

    if (in.bad()) {
        return Result<Manifest>::Error(ErrorType::IOError, "Failed to read manifest: " + path);
    }
    return Result<Manifest>::Ok(std::move(manifest));
}

std::vector<std::string> ManifestStore::failedEntries(const Manifest& manifest) {
    std::vector<std::string> failed;
    for (const auto& [path, digest] : manifest) {
        if (!digest) failed.push_back(path);
    }
    std::sort(failed.begin(), failed.end());
    return failed;
}
