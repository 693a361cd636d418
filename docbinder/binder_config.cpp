#include "binder_config.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace DocBinder {

// ============================================================================
// Defaults
// ============================================================================

std::string current_date_string() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%B %d, %Y");
    return ss.str();
}

BinderConfig make_default_config(const fs::path& root) {
    BinderConfig config;
    config.root_dir = fs::absolute(root).lexically_normal();
    config.work_dir = config.root_dir / "output";
    config.final_pdf = config.root_dir / "final_output.pdf";
    config.log_file = config.root_dir / "docbinder_log.txt";
    config.contents_date = current_date_string();
    return config;
}

std::string validate_config(const BinderConfig& config) {
    if (config.root_dir.empty()) {
        return "Root directory is not set";
    }
    std::error_code ec;
    if (!fs::is_directory(config.root_dir, ec)) {
        return "Not a directory: " + config.root_dir.string();
    }
    if (config.bates_start < 0 || config.bates_start > MAX_BATES_START) {
        return "BatesStart must be between 0 and " + std::to_string(MAX_BATES_START);
    }
    if (config.bates_font_size < 6 || config.bates_font_size > 72) {
        return "BatesFontSize must be between 6 and 72";
    }
    if (config.jobs < 1 || config.jobs > 64) {
        return "Jobs must be between 1 and 64";
    }
    if (config.final_pdf.empty() || config.work_dir.empty()) {
        return "Output paths must not be empty";
    }
    return "";
}

// ============================================================================
// Command-Line Argument Parsing
// ============================================================================

static std::string normalize_option(const std::string& arg) {
    std::string normalized = arg;
    while (!normalized.empty() && normalized[0] == '-') normalized.erase(0, 1);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

static bool is_known_option(const std::string& normalized) {
    static const char* const known[] = {
        "outputdir", "finalpdf", "logfile", "exclude", "batesstart", "batesfontsize",
        "jobs", "converter", "keepwork", "allowdrift", "nestedoutline", "verbose",
        "help", "h"
    };
    for (const char* k : known) {
        if (normalized == k) return true;
    }
    return false;
}

static fs::path absolute_path(const std::string& value) {
    return fs::absolute(fs::path(value)).lexically_normal();
}

ArgParseResult parse_binder_args(int argc, char* argv[]) {
    ArgParseResult result;

    // First positional argument (anything that is not an option) is the root
    std::string root_arg;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    for (size_t i = 0; i < args.size(); ++i) {
        std::string normalized = normalize_option(args[i]);
        if (args[i].rfind("-", 0) == 0 || is_known_option(normalized)) {
            if (normalized == "help" || normalized == "h") {
                result.help = true;
                return result;
            }
            // Skip the value of options that take one
            if (normalized == "outputdir" || normalized == "finalpdf" || normalized == "logfile" ||
                normalized == "exclude" || normalized == "batesstart" || normalized == "batesfontsize" ||
                normalized == "jobs" || normalized == "converter") {
                ++i;
            }
            continue;
        }
        if (!root_arg.empty()) {
            result.error = "Unexpected argument: " + args[i];
            return result;
        }
        root_arg = args[i];
    }

    BinderConfig config = make_default_config(root_arg.empty() ? fs::current_path() : fs::path(root_arg));

    try {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string normalized = normalize_option(args[i]);
            bool has_value = i + 1 < args.size();

            if (normalized == "outputdir" && has_value) {
                config.work_dir = absolute_path(args[++i]);
            } else if (normalized == "finalpdf" && has_value) {
                config.final_pdf = absolute_path(args[++i]);
            } else if (normalized == "logfile" && has_value) {
                config.log_file = absolute_path(args[++i]);
            } else if (normalized == "exclude" && has_value) {
                config.exclude_dirs.push_back(absolute_path(args[++i]));
            } else if (normalized == "batesstart" && has_value) {
                config.bates_start = std::stoi(args[++i]);
            } else if (normalized == "batesfontsize" && has_value) {
                config.bates_font_size = std::stoi(args[++i]);
            } else if (normalized == "jobs" && has_value) {
                config.jobs = std::stoi(args[++i]);
            } else if (normalized == "converter" && has_value) {
                config.converter = args[++i];
            } else if (normalized == "keepwork") {
                config.keep_work = true;
            } else if (normalized == "allowdrift") {
                config.allow_drift = true;
            } else if (normalized == "nestedoutline") {
                config.nested_outline = true;
            } else if (normalized == "verbose") {
                config.verbose = true;
            } else if (args[i].rfind("-", 0) == 0 || is_known_option(normalized)) {
                if (is_known_option(normalized)) {
                    result.error = "Missing value for option: " + args[i];
                } else {
                    result.error = "Unknown option: " + args[i];
                }
                return result;
            }
        }
    } catch (const std::exception& e) {
        result.error = std::string("Invalid numeric value: ") + e.what();
        return result;
    }

    std::string problem = validate_config(config);
    if (!problem.empty()) {
        result.error = problem;
        return result;
    }

    result.config = config;
    return result;
}

} // namespace DocBinder
