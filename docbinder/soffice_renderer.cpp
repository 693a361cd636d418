#include "soffice_renderer.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

#include "binder_errors.h"
#include "binder_log.h"

namespace DocBinder {

#if defined(_WIN32)
static const char* const NULL_REDIRECT = " >nul 2>&1";
#else
static const char* const NULL_REDIRECT = " >/dev/null 2>&1";
#endif

#if defined(_WIN32)
static std::string quote(const std::string& s) {
    return "\"" + s + "\"";
}
#else
// Single quotes: the shell expands nothing inside them. An embedded ' closes
// the string, adds an escaped quote and reopens it.
static std::string quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}
#endif

static bool is_pdf(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".pdf";
}

static std::string file_uri(const fs::path& dir) {
    std::string generic = fs::absolute(dir).generic_string();
    if (generic.empty() || generic[0] != '/') generic = "/" + generic;
    return "file://" + generic;
}

// ============================================================================
// Converter Discovery
// ============================================================================

std::string SofficeRenderer::findConverter(const std::string& preferred) {
    std::vector<std::string> paths;
    if (!preferred.empty()) {
        paths.push_back(preferred);
    } else {
        paths = {
            "soffice",
            "libreoffice",
            "/usr/bin/soffice",
            "/usr/lib/libreoffice/program/soffice",
            "/opt/libreoffice/program/soffice",
            "/Applications/LibreOffice.app/Contents/MacOS/soffice",
            "C:\\Program Files\\LibreOffice\\program\\soffice.exe"
        };
    }

    for (const auto& p : paths) {
        std::error_code ec;
        if (fs::exists(p, ec) && fs::is_regular_file(p, ec)) return p;
        // Try executing to see if it's in PATH
        std::string test_cmd = quote(p) + " --version" + NULL_REDIRECT;
        if (std::system(test_cmd.c_str()) == 0) {
            return p;
        }
    }
    return "";
}

// ============================================================================
// SofficeRenderer
// ============================================================================

SofficeRenderer::SofficeRenderer(std::string converter)
    : configured_(std::move(converter)) {}

const std::string& SofficeRenderer::resolveConverter() {
    std::call_once(discovered_, [this]() {
        converter_ = findConverter(configured_);
        if (!converter_.empty()) {
            log_info("Using document converter: " + converter_);
        }
    });
    return converter_;
}

fs::path SofficeRenderer::render(const fs::path& source, const fs::path& outputPdf) {
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        throw RenderFailure(source.string() + " not found.");
    }
    if (is_pdf(source)) {
        return source;
    }

    const std::string& converter = resolveConverter();
    if (converter.empty()) {
        throw RenderFailure("No LibreOffice converter found for " + source.filename().string() +
                            " (install LibreOffice or pass --Converter <path>)");
    }

    log_info("Converting " + source.string() + " -> " + outputPdf.string());

    fs::path scratch = outputPdf.parent_path() / ("_convert_" + outputPdf.stem().string());
    fs::remove_all(scratch, ec);
    fs::create_directories(scratch / "profile", ec);
    if (ec) {
        throw RenderFailure("Cannot create conversion directory " + scratch.string() + ": " + ec.message());
    }

    std::string cmd = quote(converter) +
                      " --headless --norestore --nolockcheck" +
                      " " + quote("-env:UserInstallation=" + file_uri(scratch / "profile")) +
                      " --convert-to pdf --outdir " + quote(scratch.string()) +
                      " " + quote(fs::absolute(source).string()) + NULL_REDIRECT;
    log_debug("Running: " + cmd);

    int rc = std::system(cmd.c_str());
    fs::path produced = scratch / (source.stem().string() + ".pdf");

    if (rc != 0 || !fs::exists(produced, ec)) {
        fs::remove_all(scratch, ec);
        throw RenderFailure("Error converting " + source.string() + " (converter exit code " +
                            std::to_string(rc) + ")");
    }

    fs::remove(outputPdf, ec);
    fs::rename(produced, outputPdf, ec);
    if (ec) {
        ec.clear();
        fs::copy_file(produced, outputPdf, fs::copy_options::overwrite_existing, ec);
    }
    std::error_code cleanup_ec;
    fs::remove_all(scratch, cleanup_ec);

    if (ec || !fs::exists(outputPdf)) {
        throw RenderFailure("Conversion failed: " + outputPdf.string() + " not created.");
    }

    log_info("Converted " + source.filename().string() + " -> " + outputPdf.filename().string());
    return outputPdf;
}

} // namespace DocBinder
