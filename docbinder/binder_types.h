#ifndef DOCBINDER_BINDER_TYPES_H
#define DOCBINDER_BINDER_TYPES_H

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace DocBinder {

namespace fs = std::filesystem;

enum class ItemKind {
    File,
    Directory
};

// What a File item needs before it can be merged
enum class SourceKind {
    None,            // directories
    DocumentSource,  // word-processing file, needs conversion
    PageDocument     // already a PDF
};

// A scanned file or directory with its hierarchical index
struct Item {
    std::string index;      // "1", "2.1", "2.1.3"
    fs::path path;
    ItemKind kind = ItemKind::File;
    SourceKind source = SourceKind::None;

    bool isFile() const { return kind == ItemKind::File; }
    bool isDirectory() const { return kind == ItemKind::Directory; }

    std::string displayName() const { return path.filename().string(); }

    // Number of dots in the index (root level = 0)
    int depth() const;
};

enum class UnitKind {
    Contents,
    Cover,
    Content
};

// A page-producing artifact in the assembly
struct Unit {
    UnitKind kind = UnitKind::Content;
    std::string index;      // owning item index, empty for the contents unit
    fs::path path;
    int pageCount = 0;
    bool owned = true;      // false for user PDFs merged in place

    Unit() = default;
    Unit(UnitKind k, std::string idx, fs::path p, int pages, bool isOwned = true)
        : kind(k), index(std::move(idx)), path(std::move(p)), pageCount(pages), owned(isOwned) {}
};

// Cover and content units of one File item
struct ItemUnits {
    Unit cover;
    Unit content;
};

using UnitTable = std::map<std::string, ItemUnits>;

// File index -> first absolute page number of the item's unit pair.
// Immutable once constructed.
class BatesMap {
public:
    BatesMap() = default;
    explicit BatesMap(std::map<std::string, int> entries) : entries_(std::move(entries)) {}

    std::optional<int> find(const std::string& index) const;
    bool contains(const std::string& index) const { return entries_.count(index) != 0; }
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    const std::map<std::string, int>& entries() const { return entries_; }

    bool operator==(const BatesMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const BatesMap& other) const { return !(*this == other); }

private:
    std::map<std::string, int> entries_;
};

// One row of the contents page
struct ContentsEntry {
    std::string index;
    std::string displayName;
    bool isDirectory = false;
    std::optional<int> page;
};

// Bates label: zero padded to three digits
std::string format_bates(int number);

// "{indent}{index} - {name}" exactly as it is drawn on the contents page
std::string contents_line_text(const std::string& index, const std::string& displayName);
std::string contents_line_text(const Item& item);

// Rows for the contents page; numbers only where the map has them
std::vector<ContentsEntry> build_contents_entries(const std::vector<Item>& items, const BatesMap& bates);

// File items in scan order
std::vector<Item> file_items(const std::vector<Item>& items);

} // namespace DocBinder

#endif // DOCBINDER_BINDER_TYPES_H
