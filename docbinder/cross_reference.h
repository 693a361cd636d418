#ifndef DOCBINDER_CROSS_REFERENCE_H
#define DOCBINDER_CROSS_REFERENCE_H

#include <vector>

#include "binder_types.h"
#include "collaborators.h"

namespace DocBinder {

// Outline and contents-page links derived from a resolved Bates map.
// Page targets are 0-based: bates - batesStart.
class CrossReferenceGenerator {
public:
    CrossReferenceGenerator(int batesStart, bool nestedOutline);

    // One level-1 entry per File item, "{index} - {name}". In nested mode
    // directories are added and levels follow the index depth; a directory
    // points at its first descendant file and is dropped if it has none.
    std::vector<OutlineEntry> buildOutline(const std::vector<Item>& items, const BatesMap& bates) const;

    // One request per File item, searched on every contents page
    std::vector<LinkRequest> buildContentsLinks(const std::vector<Item>& items, const BatesMap& bates,
                                                int contentsPages) const;

private:
    int batesStart_;
    bool nestedOutline_;

    std::vector<OutlineEntry> buildNestedOutline(const std::vector<Item>& items, const BatesMap& bates) const;
};

} // namespace DocBinder

#endif // DOCBINDER_CROSS_REFERENCE_H
