#ifndef DOCBINDER_WORK_FILES_H
#define DOCBINDER_WORK_FILES_H

#include <filesystem>
#include <string>

namespace DocBinder {

namespace fs = std::filesystem;

// Names of the artifacts kept in the work directory
fs::path cover_file(const fs::path& workDir, const std::string& index);
fs::path content_file(const fs::path& workDir, const std::string& index);
fs::path contents_dummy_file(const fs::path& workDir);
fs::path contents_file(const fs::path& workDir);
fs::path assembled_file(const fs::path& workDir);

// Replaces target with source: rename, or copy to target.tmp and rename that
// when source and target are on different file systems. source is gone
// afterwards either way. Returns false with error set on failure.
bool replace_file(const fs::path& source, const fs::path& target, std::string& error);

} // namespace DocBinder

#endif // DOCBINDER_WORK_FILES_H
