#ifndef DOCBINDER_PAGINATION_RESOLVER_H
#define DOCBINDER_PAGINATION_RESOLVER_H

#include <filesystem>
#include <vector>

#include "assembly_sequencer.h"
#include "binder_types.h"
#include "collaborators.h"

namespace DocBinder {

struct ContentsResolution {
    BatesMap bates;
    Unit contents;          // committed contents page, goes into the assembly
    Unit dryContents;       // placeholder render, only used for measuring
    int dryPages = 0;
    int committedPages = 0;

    bool drifted() const { return dryPages != committedPages; }
};

// Breaks the contents-page circularity with exactly two renders:
//   dry pass     - placeholders for every number, measure C0
//   commit pass  - numbers computed with C0 as the offset, render again
// The commit render is measured once to detect drift, never to re-resolve.
class PaginationResolver {
public:
    PaginationResolver(Formatter& formatter, Renderer& renderer, PageCounter& counter,
                       const AssemblySequencer& sequencer, int batesStart, bool allowDrift);

    // Throws RenderFailure if a contents page cannot be rendered or has no
    // pages, PaginationDrift if the two renders differ and drift is not allowed
    ContentsResolution resolve(const std::vector<Item>& items, const UnitTable& units,
                               const std::filesystem::path& workDir);

    // Walks an assembly order (contents unit first) and records the running
    // page number at every cover unit
    static BatesMap computeBatesMap(const std::vector<Unit>& assemblyOrder, int batesStart);

private:
    Formatter& formatter_;
    Renderer& renderer_;
    PageCounter& counter_;
    const AssemblySequencer& sequencer_;
    int batesStart_;
    bool allowDrift_;

    Unit renderContents(const std::vector<Item>& items, const BatesMap& bates,
                        const std::filesystem::path& output);
};

} // namespace DocBinder

#endif // DOCBINDER_PAGINATION_RESOLVER_H
