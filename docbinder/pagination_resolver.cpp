#include "pagination_resolver.h"

#include <limits>
#include <sstream>

#include "binder_errors.h"
#include "binder_log.h"
#include "work_files.h"

namespace DocBinder {

namespace fs = std::filesystem;

PaginationResolver::PaginationResolver(Formatter& formatter, Renderer& renderer, PageCounter& counter,
                                       const AssemblySequencer& sequencer, int batesStart, bool allowDrift)
    : formatter_(formatter), renderer_(renderer), counter_(counter), sequencer_(sequencer),
      batesStart_(batesStart), allowDrift_(allowDrift) {}

BatesMap PaginationResolver::computeBatesMap(const std::vector<Unit>& assemblyOrder, int batesStart) {
    std::map<std::string, int> entries;
    long long current = batesStart;
    for (const auto& unit : assemblyOrder) {
        if (unit.kind == UnitKind::Cover) {
            if (current > std::numeric_limits<int>::max()) {
                throw OutputWriteFailure("Bates number for item " + unit.index + " exceeds " +
                                         std::to_string(std::numeric_limits<int>::max()));
            }
            entries[unit.index] = static_cast<int>(current);
        }
        current += unit.pageCount;
    }
    return BatesMap(std::move(entries));
}

Unit PaginationResolver::renderContents(const std::vector<Item>& items, const BatesMap& bates,
                                        const fs::path& output) {
    fs::path source = formatter_.renderContentsPage(items, bates, output);
    fs::path pdf = renderer_.render(source, output);
    int pages = counter_.countPages(pdf);
    if (pages <= 0) {
        throw RenderFailure("Contents page has no readable pages: " + pdf.string());
    }
    return Unit(UnitKind::Contents, "", pdf, pages);
}

ContentsResolution PaginationResolver::resolve(const std::vector<Item>& items, const UnitTable& units,
                                               const fs::path& workDir) {
    ContentsResolution resolution;

    // Dry pass: empty number column
    resolution.dryContents = renderContents(items, BatesMap(), contents_dummy_file(workDir));
    resolution.dryPages = resolution.dryContents.pageCount;
    log_debug("Dummy contents PDF pages: " + std::to_string(resolution.dryPages));

    std::vector<Unit> order = sequencer_.sequence(items, resolution.dryContents, units);
    resolution.bates = computeBatesMap(order, batesStart_);

    {
        std::ostringstream ss;
        ss << "Bates mapping:";
        for (const auto& kv : resolution.bates.entries()) {
            ss << " " << kv.first << "=" << format_bates(kv.second);
        }
        log_debug(ss.str());
    }

    // Commit pass: same layout with the numbers filled in
    resolution.contents = renderContents(items, resolution.bates, contents_file(workDir));
    resolution.committedPages = resolution.contents.pageCount;

    if (resolution.drifted()) {
        int delta = resolution.committedPages - resolution.dryPages;
        std::ostringstream ss;
        ss << "Contents page count changed from " << resolution.dryPages << " to "
           << resolution.committedPages << " once page numbers were filled in; Bates numbers are off by "
           << delta << " page(s)";
        if (!allowDrift_) {
            throw PaginationDrift(ss.str(), resolution.dryPages, resolution.committedPages);
        }
        log_warning(ss.str());
    }

    return resolution;
}

} // namespace DocBinder
