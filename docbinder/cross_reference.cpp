#include "cross_reference.h"

#include "binder_log.h"

namespace DocBinder {

CrossReferenceGenerator::CrossReferenceGenerator(int batesStart, bool nestedOutline)
    : batesStart_(batesStart), nestedOutline_(nestedOutline) {}

std::vector<OutlineEntry> CrossReferenceGenerator::buildOutline(const std::vector<Item>& items,
                                                                const BatesMap& bates) const {
    if (nestedOutline_) return buildNestedOutline(items, bates);

    std::vector<OutlineEntry> outline;
    for (const auto& item : items) {
        if (!item.isFile()) continue;
        auto page = bates.find(item.index);
        if (!page) {
            log_warning("No Bates number for " + item.index + ", bookmark skipped");
            continue;
        }
        OutlineEntry entry;
        entry.level = 1;
        entry.title = item.index + " - " + item.displayName();
        entry.pageIndex = *page - batesStart_;
        outline.push_back(entry);
    }
    return outline;
}

std::vector<OutlineEntry> CrossReferenceGenerator::buildNestedOutline(const std::vector<Item>& items,
                                                                      const BatesMap& bates) const {
    std::vector<OutlineEntry> outline;
    for (size_t i = 0; i < items.size(); ++i) {
        const Item& item = items[i];
        std::optional<int> page;

        if (item.isFile()) {
            page = bates.find(item.index);
        } else {
            // Descendants follow the directory in pre-order
            std::string prefix = item.index + ".";
            for (size_t j = i + 1; j < items.size(); ++j) {
                const Item& next = items[j];
                if (next.index.compare(0, prefix.size(), prefix) != 0) break;
                if (next.isFile()) {
                    page = bates.find(next.index);
                    if (page) break;
                }
            }
        }
        if (!page) continue;

        OutlineEntry entry;
        entry.level = item.depth() + 1;
        entry.title = item.index + " - " + item.displayName();
        entry.pageIndex = *page - batesStart_;
        outline.push_back(entry);
    }
    return outline;
}

std::vector<LinkRequest> CrossReferenceGenerator::buildContentsLinks(const std::vector<Item>& items,
                                                                     const BatesMap& bates,
                                                                     int contentsPages) const {
    std::vector<LinkRequest> requests;
    for (const auto& item : items) {
        if (!item.isFile()) continue;
        auto page = bates.find(item.index);
        if (!page) continue;

        LinkRequest request;
        for (int p = 0; p < contentsPages; ++p) request.searchPages.push_back(p);
        request.text = contents_line_text(item);
        request.targetPage = *page - batesStart_;
        requests.push_back(request);
    }
    return requests;
}

} // namespace DocBinder
