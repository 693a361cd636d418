#ifndef DOCBINDER_ORCHESTRATOR_H
#define DOCBINDER_ORCHESTRATOR_H

#include <filesystem>
#include <vector>

#include "binder_config.h"
#include "binder_types.h"
#include "collaborators.h"
#include "pagination_resolver.h"

namespace DocBinder {

struct RunSummary {
    int files = 0;
    int directories = 0;
    int contentsPages = 0;
    int totalPages = 0;
    int linksInserted = 0;
    int linksMissing = 0;
    int mergeSkipped = 0;
    bool drifted = false;
    int warnings = 0;           // logged during the run
    int errors = 0;
    BatesMap bates;
    std::filesystem::path output;
};

// Runs one binding job end to end:
//   scan -> render units -> dry contents -> Bates map -> commit contents
//   -> merge -> stamp -> outline -> links -> publish -> cleanup
//
// Everything is assembled in the work directory and moved to the final path
// only after the last annotation succeeded. Any BinderError aborts the run
// and leaves the final path untouched.
class Orchestrator {
public:
    Orchestrator(const BinderConfig& config, Formatter& formatter, Renderer& renderer,
                 PageCounter& counter, Merger& merger, PageAnnotator& annotator);

    RunSummary run();

private:
    const BinderConfig& config_;
    Formatter& formatter_;
    Renderer& renderer_;
    PageCounter& counter_;
    Merger& merger_;
    PageAnnotator& annotator_;

    std::vector<Item> scanItems() const;
    UnitTable renderUnits(const std::vector<Item>& files);
    ItemUnits renderItemUnits(const Item& item);
    void publish(const std::filesystem::path& staged) const;
    void cleanup(const UnitTable& units, const ContentsResolution& resolution) const;
};

} // namespace DocBinder

#endif // DOCBINDER_ORCHESTRATOR_H
