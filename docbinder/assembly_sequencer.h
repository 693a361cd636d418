#ifndef DOCBINDER_ASSEMBLY_SEQUENCER_H
#define DOCBINDER_ASSEMBLY_SEQUENCER_H

#include <filesystem>
#include <vector>

#include "binder_types.h"

namespace DocBinder {

// Final linear order of the assembled document:
//   [contents] + for each File item in scan order: [cover, content]
// Both the merge and the Bates arithmetic walk this sequence.
class AssemblySequencer {
public:
    // Directory items are ignored. Throws std::logic_error if a File item has
    // no entry in units.
    std::vector<Unit> sequence(const std::vector<Item>& scanOrder, const Unit& contents,
                               const UnitTable& units) const;

    static std::vector<std::filesystem::path> paths(const std::vector<Unit>& order);
    static int totalPages(const std::vector<Unit>& order);
};

} // namespace DocBinder

#endif // DOCBINDER_ASSEMBLY_SEQUENCER_H
