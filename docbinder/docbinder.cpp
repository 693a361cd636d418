// docbinder.cpp - Bind a directory tree of documents into one numbered PDF
//
// Scans a directory for PDF and word-processing documents, gives every file a
// cover page, writes a table of contents, merges everything into one PDF and
// stamps it with sequential Bates numbers. Bookmarks and contents-page links
// point at each document's cover page.
//
// Usage:
//   docbinder [root_dir] [options]
//
// Dependencies:
//   - QPDF: page counting, merging, stamping, outline and links
//   - LibreOffice (soffice): converting .docx/.doc/.odt/.rtf to PDF, found at runtime

#include <iostream>

#include "binder_config.h"
#include "binder_errors.h"
#include "binder_log.h"
#include "orchestrator.h"
#include "page_formatter.h"
#include "qpdf_collaborators.h"
#include "soffice_renderer.h"

using namespace DocBinder;

// ============================================================================
// Usage
// ============================================================================

static void print_usage(const char* prog) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << prog << " [root_dir] [options]\n";
    std::cerr << "\nArguments:\n";
    std::cerr << "  root_dir                   - Directory to bind (default: current directory)\n";
    std::cerr << "\nOptions (all optional, accepted with or without -- prefix):\n";
    std::cerr << "  OutputDir <dir>            - Work directory (default: <root>/output)\n";
    std::cerr << "  FinalPdf <path>            - Output PDF (default: <root>/final_output.pdf)\n";
    std::cerr << "  LogFile <path>             - Log file (default: <root>/docbinder_log.txt)\n";
    std::cerr << "  Exclude <dir>              - Skip a directory, may be repeated\n";
    std::cerr << "  BatesStart <n>             - First Bates number, 0 to 9999999 (default: 1)\n";
    std::cerr << "  BatesFontSize <pt>         - Bates label size, 6 to 72 (default: 14)\n";
    std::cerr << "  Jobs <n>                   - Parallel conversions, 1 to 64 (default: 1)\n";
    std::cerr << "  Converter <path>           - soffice executable (default: search PATH)\n";
    std::cerr << "  KeepWork                   - Keep intermediate files\n";
    std::cerr << "  AllowDrift                 - Warn instead of failing when the contents\n";
    std::cerr << "                               page count changes after numbering\n";
    std::cerr << "  NestedOutline              - Bookmarks follow the directory tree\n";
    std::cerr << "  Verbose                    - Print debug messages\n";
    std::cerr << "\nExit Codes:\n";
    std::cerr << "  0  - Success\n";
    std::cerr << "  1  - Invalid arguments\n";
    std::cerr << "  2  - Directory scan failed\n";
    std::cerr << "  3  - Document rendering failed\n";
    std::cerr << "  4  - Contents page drifted after numbering\n";
    std::cerr << "  5  - Output write failed\n";
    std::cerr << "  10 - Unknown error\n";
}

static void print_banner(const BinderConfig& config) {
    std::cout << "============================================================================\n";
    std::cout << "  DocBinder\n";
    std::cout << "============================================================================\n";
    std::cout << "  Root:       " << config.root_dir.string() << "\n";
    std::cout << "  Work dir:   " << config.work_dir.string() << "\n";
    std::cout << "  Output:     " << config.final_pdf.string() << "\n";
    std::cout << "  Log:        " << config.log_file.string() << "\n";
    std::cout << "  Bates:      start " << format_bates(config.bates_start)
              << ", " << config.bates_font_size << "pt\n";
    std::cout << "  Jobs:       " << config.jobs << "\n";
    std::cout << "============================================================================\n";
}

static void print_summary(const RunSummary& summary) {
    std::cout << "============================================================================\n";
    std::cout << "SUCCESS: Bound " << summary.files << " document(s)\n";
    std::cout << "  Directories:    " << summary.directories << "\n";
    std::cout << "  Contents pages: " << summary.contentsPages << "\n";
    std::cout << "  Total pages:    " << summary.totalPages << "\n";
    std::cout << "  Links:          " << summary.linksInserted;
    if (summary.linksMissing > 0) std::cout << " (" << summary.linksMissing << " not found)";
    std::cout << "\n";
    if (summary.mergeSkipped > 0) {
        std::cout << "  Skipped:        " << summary.mergeSkipped << " empty or missing input(s)\n";
    }
    if (summary.drifted) {
        std::cout << "  WARNING: contents page count changed after numbering\n";
    }
    std::cout << "  Warnings:       " << summary.warnings << "\n";
    std::cout << "  Errors:         " << summary.errors << "\n";
    std::cout << "  Output:         " << summary.output.string() << "\n";
    std::cout << "============================================================================\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    ArgParseResult parsed = parse_binder_args(argc, argv);
    if (parsed.help) {
        print_usage(argv[0]);
        return EC_SUCCESS;
    }
    if (!parsed.config) {
        std::cerr << "ERROR: " << parsed.error << "\n\n";
        print_usage(argv[0]);
        return EC_INVALID_ARGS;
    }
    const BinderConfig& config = *parsed.config;

    Logger& logger = Logger::instance();
    logger.setVerbose(config.verbose);
    if (!logger.openFile(config.log_file)) {
        std::cerr << "WARNING: Cannot open log file " << config.log_file.string() << ", logging to console only\n";
    }

    print_banner(config);

    int rc = EC_SUCCESS;
    try {
        PdfPageFormatter formatter(config.contents_date);
        SofficeRenderer renderer(config.converter);
        QpdfPageCounter counter;
        QpdfMerger merger(counter);
        QpdfPageAnnotator annotator;

        Orchestrator orchestrator(config, formatter, renderer, counter, merger, annotator);
        RunSummary summary = orchestrator.run();

        log_info("Process complete. Check " + summary.output.filename().string() + " and " +
                 config.log_file.filename().string() + ".");
        print_summary(summary);
    } catch (const BinderError& e) {
        log_error(std::string("FATAL: ") + e.what());
        rc = e.exitCode();
    } catch (const std::exception& e) {
        log_error(std::string("FATAL: unexpected error: ") + e.what());
        rc = EC_UNKNOWN_ERROR;
    }

    logger.closeFile();
    return rc;
}
