#include "binder_types.h"

#include <algorithm>
#include <cstdio>

namespace DocBinder {

int Item::depth() const {
    return static_cast<int>(std::count(index.begin(), index.end(), '.'));
}

std::optional<int> BatesMap::find(const std::string& index) const {
    auto it = entries_.find(index);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::string format_bates(int number) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%03d", number);
    return std::string(buf);
}

std::string contents_line_text(const std::string& index, const std::string& displayName) {
    size_t depth = static_cast<size_t>(std::count(index.begin(), index.end(), '.'));
    return std::string(depth * 4, ' ') + index + " - " + displayName;
}

std::string contents_line_text(const Item& item) {
    return contents_line_text(item.index, item.displayName());
}

std::vector<ContentsEntry> build_contents_entries(const std::vector<Item>& items, const BatesMap& bates) {
    std::vector<ContentsEntry> entries;
    entries.reserve(items.size());
    for (const auto& item : items) {
        ContentsEntry entry;
        entry.index = item.index;
        entry.displayName = item.displayName();
        entry.isDirectory = item.isDirectory();
        if (item.isFile()) {
            entry.page = bates.find(item.index);
        }
        entries.push_back(entry);
    }
    return entries;
}

std::vector<Item> file_items(const std::vector<Item>& items) {
    std::vector<Item> files;
    for (const auto& item : items) {
        if (item.isFile()) files.push_back(item);
    }
    return files;
}

} // namespace DocBinder
