#include "assembly_sequencer.h"

#include <stdexcept>

namespace DocBinder {

std::vector<Unit> AssemblySequencer::sequence(const std::vector<Item>& scanOrder, const Unit& contents,
                                              const UnitTable& units) const {
    std::vector<Unit> order;
    order.reserve(1 + 2 * units.size());
    order.push_back(contents);

    for (const auto& item : scanOrder) {
        if (!item.isFile()) continue;
        auto it = units.find(item.index);
        if (it == units.end()) {
            throw std::logic_error("No rendered units for item " + item.index);
        }
        order.push_back(it->second.cover);
        order.push_back(it->second.content);
    }
    return order;
}

std::vector<std::filesystem::path> AssemblySequencer::paths(const std::vector<Unit>& order) {
    std::vector<std::filesystem::path> result;
    result.reserve(order.size());
    for (const auto& unit : order) result.push_back(unit.path);
    return result;
}

int AssemblySequencer::totalPages(const std::vector<Unit>& order) {
    int total = 0;
    for (const auto& unit : order) total += unit.pageCount;
    return total;
}

} // namespace DocBinder
