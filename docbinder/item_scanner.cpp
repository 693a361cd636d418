#include "item_scanner.h"

#include <algorithm>
#include <cctype>

#include "binder_errors.h"
#include "binder_log.h"

namespace DocBinder {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static fs::path normalized(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) return p.lexically_normal();
    // "dir/" names the same directory as "dir"
    if (!abs.has_filename() && abs.has_relative_path()) abs = abs.parent_path();
    fs::path canon = fs::weakly_canonical(abs, ec);
    return ec ? abs.lexically_normal() : canon;
}

bool name_less(const fs::path& a, const fs::path& b) {
    std::string an = a.filename().string();
    std::string bn = b.filename().string();
    std::string al = to_lower(an);
    std::string bl = to_lower(bn);
    if (al != bl) return al < bl;
    return an < bn;
}

// ============================================================================
// ItemScanner
// ============================================================================

ItemScanner::ItemScanner(std::vector<fs::path> excludeDirs, std::vector<fs::path> excludeFiles) {
    for (const auto& d : excludeDirs) excludeDirs_.push_back(normalized(d));
    for (const auto& f : excludeFiles) excludeFiles_.push_back(normalized(f));
}

SourceKind ItemScanner::classifyExtension(const fs::path& path) {
    std::string ext = to_lower(path.extension().string());
    if (ext == ".pdf") return SourceKind::PageDocument;
    if (ext == ".docx" || ext == ".doc" || ext == ".odt" || ext == ".rtf") return SourceKind::DocumentSource;
    return SourceKind::None;
}

bool ItemScanner::isExcludedDir(const fs::path& dir) const {
    fs::path p = normalized(dir);
    for (const auto& ex : excludeDirs_) {
        // Same directory or anywhere below it
        auto mismatch = std::mismatch(ex.begin(), ex.end(), p.begin(), p.end());
        if (mismatch.first == ex.end()) return true;
    }
    return false;
}

bool ItemScanner::isExcludedFile(const fs::path& file) const {
    fs::path p = normalized(file);
    return std::find(excludeFiles_.begin(), excludeFiles_.end(), p) != excludeFiles_.end();
}

std::vector<Item> ItemScanner::scan(const fs::path& rootDir) const {
    std::error_code ec;
    if (!fs::is_directory(rootDir, ec)) {
        throw ScanFailure("Not a directory: " + rootDir.string());
    }

    std::vector<Item> items;
    scanDirectory(rootDir, "", items);
    return items;
}

void ItemScanner::scanDirectory(const fs::path& dir, const std::string& prefix, std::vector<Item>& items) const {
    if (isExcludedDir(dir)) return;

    std::vector<fs::path> files;
    std::vector<fs::path> subdirs;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw ScanFailure("Cannot read directory " + dir.string() + ": " + ec.message());
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        const fs::path& p = it->path();
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            if (!isExcludedDir(p)) subdirs.push_back(p);
        } else if (it->is_regular_file(type_ec)) {
            if (classifyExtension(p) != SourceKind::None && !isExcludedFile(p)) {
                files.push_back(p);
            }
        }
    }
    if (ec) {
        throw ScanFailure("Error while reading directory " + dir.string() + ": " + ec.message());
    }

    std::sort(files.begin(), files.end(), name_less);
    std::sort(subdirs.begin(), subdirs.end(), name_less);

    int fileNumber = 1;
    for (const auto& f : files) {
        Item item;
        item.index = prefix + std::to_string(fileNumber++);
        item.path = f;
        item.kind = ItemKind::File;
        item.source = classifyExtension(f);
        items.push_back(item);
    }

    int dirNumber = 1;
    for (const auto& d : subdirs) {
        Item item;
        item.index = prefix + std::to_string(dirNumber++);
        item.path = d;
        item.kind = ItemKind::Directory;
        items.push_back(item);
        scanDirectory(d, item.index + ".", items);
    }

    log_debug("Scanned " + dir.string() + ": " + std::to_string(files.size()) + " file(s), " +
              std::to_string(subdirs.size()) + " subdirectory(ies)");
}

} // namespace DocBinder
