#include "orchestrator.h"

#include <algorithm>
#include <exception>
#include <sstream>

#include "assembly_sequencer.h"
#include "binder_errors.h"
#include "binder_log.h"
#include "cross_reference.h"
#include "item_scanner.h"
#include "unit_worker_pool.h"
#include "work_files.h"

namespace DocBinder {

namespace fs = std::filesystem;

Orchestrator::Orchestrator(const BinderConfig& config, Formatter& formatter, Renderer& renderer,
                           PageCounter& counter, Merger& merger, PageAnnotator& annotator)
    : config_(config), formatter_(formatter), renderer_(renderer), counter_(counter),
      merger_(merger), annotator_(annotator) {}

// ============================================================================
// Scan
// ============================================================================

std::vector<Item> Orchestrator::scanItems() const {
    std::vector<fs::path> excludeDirs = config_.exclude_dirs;
    excludeDirs.push_back(config_.work_dir);

    std::vector<fs::path> excludeFiles = {config_.final_pdf};
    if (!config_.log_file.empty()) excludeFiles.push_back(config_.log_file);

    ItemScanner scanner(excludeDirs, excludeFiles);
    return scanner.scan(config_.root_dir);
}

// ============================================================================
// Unit Rendering
// ============================================================================

ItemUnits Orchestrator::renderItemUnits(const Item& item) {
    ItemUnits units;

    fs::path coverOut = cover_file(config_.work_dir, item.index);
    fs::path coverSource = formatter_.renderCoverPage(item.index, item.displayName(), coverOut);
    fs::path coverPdf = renderer_.render(coverSource, coverOut);
    int coverPages = counter_.countPages(coverPdf);
    if (coverPages <= 0) {
        log_warning("Cover page for " + item.index + " has 0 pages, it will be skipped");
    }
    units.cover = Unit(UnitKind::Cover, item.index, coverPdf, coverPages);

    fs::path contentPdf = renderer_.render(item.path, content_file(config_.work_dir, item.index));
    int contentPages = counter_.countPages(contentPdf);
    if (contentPages <= 0) {
        log_warning("Skipping " + item.displayName() + ", 0 pages.");
    }
    units.content = Unit(UnitKind::Content, item.index, contentPdf, contentPages, contentPdf != item.path);

    log_debug("Processed " + item.index + ": cover=" + coverPdf.filename().string() + " (" +
              std::to_string(coverPages) + " pages), file=" + contentPdf.filename().string() + " (" +
              std::to_string(contentPages) + " pages)");
    return units;
}

UnitTable Orchestrator::renderUnits(const std::vector<Item>& files) {
    std::vector<ItemUnits> slots(files.size());

    UnitWorkerPool pool(config_.jobs);
    log_info("Rendering " + std::to_string(files.size()) + " document(s) with " +
             std::to_string(std::min<size_t>(pool.workers(), std::max<size_t>(files.size(), 1))) + " worker(s)");

    std::vector<std::exception_ptr> failures = pool.run(files.size(), [&](size_t i) {
        slots[i] = renderItemUnits(files[i]);
    });

    std::vector<std::string> failed;
    for (size_t i = 0; i < failures.size(); ++i) {
        if (!failures[i]) continue;
        try {
            std::rethrow_exception(failures[i]);
        } catch (const std::exception& e) {
            log_error("Item " + files[i].index + " (" + files[i].displayName() + "): " + e.what());
            failed.push_back(files[i].index);
        }
    }
    if (!failed.empty()) {
        std::ostringstream ss;
        ss << failed.size() << " item(s) could not be rendered:";
        for (const auto& index : failed) ss << " " << index;
        throw RenderFailure(ss.str());
    }

    UnitTable table;
    for (size_t i = 0; i < files.size(); ++i) {
        table[files[i].index] = slots[i];
    }
    return table;
}

// ============================================================================
// Publish / Cleanup
// ============================================================================

void Orchestrator::publish(const fs::path& staged) const {
    std::error_code ec;
    if (config_.final_pdf.has_parent_path()) {
        fs::create_directories(config_.final_pdf.parent_path(), ec);
    }
    std::string error;
    if (!replace_file(staged, config_.final_pdf, error)) {
        throw OutputWriteFailure("Final PDF not written: " + error);
    }
    log_info("Final PDF saved: " + config_.final_pdf.string());
}

void Orchestrator::cleanup(const UnitTable& units, const ContentsResolution& resolution) const {
    std::vector<fs::path> owned = {resolution.dryContents.path, resolution.contents.path};
    for (const auto& kv : units) {
        if (kv.second.cover.owned) owned.push_back(kv.second.cover.path);
        if (kv.second.content.owned) owned.push_back(kv.second.content.path);
    }

    for (const auto& path : owned) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            log_debug("Removed temporary file: " + path.string());
        } else if (ec) {
            log_warning("Could not remove " + path.string() + ": " + ec.message());
        }
    }

    // Only goes away when nothing else was left in it
    std::error_code ec;
    if (fs::is_empty(config_.work_dir, ec) && !ec) {
        fs::remove(config_.work_dir, ec);
    }
}

// ============================================================================
// Run
// ============================================================================

RunSummary Orchestrator::run() {
    RunSummary summary;
    Logger& logger = Logger::instance();
    const int warningsBefore = logger.warningCount();
    const int errorsBefore = logger.errorCount();

    std::error_code ec;
    fs::create_directories(config_.work_dir, ec);
    if (ec) {
        throw OutputWriteFailure("Cannot create work directory " + config_.work_dir.string() + ": " + ec.message());
    }
    log_info("Output directory ready: " + config_.work_dir.string());

    std::vector<Item> items = scanItems();
    std::vector<Item> files = file_items(items);
    summary.files = static_cast<int>(files.size());
    summary.directories = static_cast<int>(items.size() - files.size());
    log_info("Found " + std::to_string(summary.files) + " document(s) and " +
             std::to_string(summary.directories) + " directories");
    if (files.empty()) {
        log_warning("No documents found under " + config_.root_dir.string() + ", output has the contents page only");
    }

    UnitTable units = renderUnits(files);

    AssemblySequencer sequencer;
    PaginationResolver resolver(formatter_, renderer_, counter_, sequencer,
                                config_.bates_start, config_.allow_drift);
    ContentsResolution resolution = resolver.resolve(items, units, config_.work_dir);
    summary.bates = resolution.bates;
    summary.contentsPages = resolution.committedPages;
    summary.drifted = resolution.drifted();

    std::vector<Unit> order = sequencer.sequence(items, resolution.contents, units);
    int expectedPages = AssemblySequencer::totalPages(order);

    fs::path staged = assembled_file(config_.work_dir);
    MergeReport report = merger_.merge(AssemblySequencer::paths(order), staged);
    summary.mergeSkipped = static_cast<int>(report.skipped.size());
    summary.totalPages = report.pagesWritten;
    if (report.pagesWritten != expectedPages) {
        log_warning("Merged document has " + std::to_string(report.pagesWritten) + " pages, expected " +
                    std::to_string(expectedPages));
    }

    annotator_.stampSequential(staged, config_.bates_start, config_.bates_font_size);

    CrossReferenceGenerator xref(config_.bates_start, config_.nested_outline);
    annotator_.setOutline(staged, xref.buildOutline(items, resolution.bates));

    std::vector<LinkRequest> requests = xref.buildContentsLinks(items, resolution.bates, resolution.contents.pageCount);
    std::vector<LinkStatus> statuses = annotator_.insertLinks(staged, requests);
    for (size_t i = 0; i < requests.size() && i < statuses.size(); ++i) {
        if (statuses[i] == LinkStatus::Linked) {
            ++summary.linksInserted;
        } else {
            ++summary.linksMissing;
            log_warning("Link target not found on contents page: \"" + requests[i].text + "\"");
        }
    }

    publish(staged);
    summary.output = config_.final_pdf;

    if (config_.keep_work) {
        log_info("Keeping work files in " + config_.work_dir.string());
    } else {
        cleanup(units, resolution);
    }

    summary.warnings = logger.warningCount() - warningsBefore;
    summary.errors = logger.errorCount() - errorsBefore;
    return summary;
}

} // namespace DocBinder
