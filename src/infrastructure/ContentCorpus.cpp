/**
 * @file ContentCorpus.cpp
 * @brief Implementation of ContentCorpus.
 */

#include "infrastructure/ContentCorpus.hpp"
#include "domain/ContentKey.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace variantwalker::infrastructure {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

domain::ContentKey DecodeOrThrow(const std::string& contentKey) {
    domain::ContentKey key = domain::ContentKey::Decode(contentKey);
    if (!key.isValid()) {
        throw domain::StructuralError("Invalid content key: '" + contentKey + "'");
    }
    return key;
}

} // namespace

ContentCorpus::ContentCorpus(const std::string& assetsDir)
    : m_assetsDir(assetsDir) {}

std::string ContentCorpus::pathFor(const std::string& contentKey) const {
    return (fs::path(m_assetsDir) / DecodeOrThrow(contentKey).encodePath()).string();
}

std::vector<std::string> ContentCorpus::ReadLines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    if (!in.is_open()) return lines;

    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = Trim(line);
        if (!trimmed.empty()) lines.push_back(trimmed);
    }
    return lines;
}

std::vector<std::string> ContentCorpus::readVariants(const std::string& contentKey) const {
    return ReadLines(pathFor(contentKey));
}

std::vector<std::string> ContentCorpus::collectExemplars(const std::string& contentKey, int maxCount) const {
    std::vector<std::string> out;
    if (maxCount <= 0) return out;

    fs::path dir = fs::path(m_assetsDir) / DecodeOrThrow(contentKey).siblingsDir();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".txt") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        for (auto& line : ReadLines(file.string())) {
            out.push_back(std::move(line));
            if (static_cast<int>(out.size()) >= maxCount) return out;
        }
    }
    return out;
}

void ContentCorpus::appendVariants(const std::string& contentKey, const std::vector<std::string>& lines) const {
    if (lines.empty()) return;
    fs::path path = pathFor(contentKey);
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        throw domain::StructuralError("Cannot append to " + path.string());
    }
    for (const auto& line : lines) {
        out << Trim(line) << "\n";
    }
}

} // namespace variantwalker::infrastructure
