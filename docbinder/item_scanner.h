#ifndef DOCBINDER_ITEM_SCANNER_H
#define DOCBINDER_ITEM_SCANNER_H

#include <filesystem>
#include <string>
#include <vector>

#include "binder_types.h"

namespace DocBinder {

namespace fs = std::filesystem;

// Walks a directory tree and numbers its documents and subdirectories.
//
// At each level files and subdirectories are sorted by case-insensitive name
// and numbered by two independent counters. Files come first; each
// subdirectory is emitted right before its own contents, which are numbered
// under the prefix "{index}.".
class ItemScanner {
public:
    // excludeDirs: skipped together with everything below them.
    // excludeFiles: skipped wherever they appear (the final output).
    ItemScanner(std::vector<fs::path> excludeDirs, std::vector<fs::path> excludeFiles);

    // Throws ScanFailure if rootDir or any directory below it cannot be read
    std::vector<Item> scan(const fs::path& rootDir) const;

    // Kind of document for a file name, SourceKind::None if not eligible
    static SourceKind classifyExtension(const fs::path& path);

private:
    std::vector<fs::path> excludeDirs_;
    std::vector<fs::path> excludeFiles_;

    void scanDirectory(const fs::path& dir, const std::string& prefix, std::vector<Item>& items) const;
    bool isExcludedDir(const fs::path& dir) const;
    bool isExcludedFile(const fs::path& file) const;
};

// Case-insensitive name ordering, exact name as tie breaker
bool name_less(const fs::path& a, const fs::path& b);

} // namespace DocBinder

#endif // DOCBINDER_ITEM_SCANNER_H
