#ifndef DOCBINDER_BINDER_CONFIG_H
#define DOCBINDER_BINDER_CONFIG_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace DocBinder {

namespace fs = std::filesystem;

// Largest accepted BatesStart
constexpr int MAX_BATES_START = 9999999;

// Everything a run needs to know. Built once by the CLI (or a test) and
// handed to the Orchestrator as const.
struct BinderConfig {
    fs::path root_dir;
    fs::path work_dir;                  // intermediate artifacts, excluded from the scan
    fs::path final_pdf;
    fs::path log_file;
    std::vector<fs::path> exclude_dirs;

    int bates_start = 1;
    int bates_font_size = 14;
    int jobs = 1;                       // unit rendering workers

    std::string converter;              // soffice executable, discovered when empty
    std::string contents_date;          // header date of the contents page

    bool keep_work = false;
    bool allow_drift = false;           // log contents-page drift instead of aborting
    bool nested_outline = false;
    bool verbose = false;
};

// Defaults relative to a root directory: <root>/output, <root>/final_output.pdf,
// <root>/docbinder_log.txt, today's date
BinderConfig make_default_config(const fs::path& root);

// Empty string when valid
std::string validate_config(const BinderConfig& config);

struct ArgParseResult {
    std::optional<BinderConfig> config;
    bool help = false;
    std::string error;
};

// Options are accepted with or without leading dashes, case-insensitively
ArgParseResult parse_binder_args(int argc, char* argv[]);

// "October 19, 2026"
std::string current_date_string();

} // namespace DocBinder

#endif // DOCBINDER_BINDER_CONFIG_H
