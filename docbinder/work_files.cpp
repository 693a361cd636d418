#include "work_files.h"

#include <system_error>

namespace DocBinder {

fs::path cover_file(const fs::path& workDir, const std::string& index) {
    return workDir / ("cover_" + index + ".pdf");
}

fs::path content_file(const fs::path& workDir, const std::string& index) {
    return workDir / ("file_" + index + ".pdf");
}

fs::path contents_dummy_file(const fs::path& workDir) {
    return workDir / "contents_dummy.pdf";
}

fs::path contents_file(const fs::path& workDir) {
    return workDir / "contents.pdf";
}

fs::path assembled_file(const fs::path& workDir) {
    return workDir / "assembled.pdf";
}

bool replace_file(const fs::path& source, const fs::path& target, std::string& error) {
    std::error_code ec;
    fs::rename(source, target, ec);
    if (!ec) return true;

    // Cross-device: stage a copy next to the target, then rename it in place
    fs::path staged = target;
    staged += ".tmp";
    std::error_code copy_ec;
    fs::copy_file(source, staged, fs::copy_options::overwrite_existing, copy_ec);
    if (!copy_ec) fs::rename(staged, target, copy_ec);

    std::error_code cleanup_ec;
    if (copy_ec) {
        fs::remove(staged, cleanup_ec);
        error = "cannot replace " + target.string() + ": " + copy_ec.message();
        return false;
    }
    fs::remove(source, cleanup_ec);
    return true;
}

} // namespace DocBinder
