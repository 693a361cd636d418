#include <gtest/gtest.h>

#include "cross_reference.h"

using namespace DocBinder;

namespace {

Item make_item(const std::string& index, const std::string& path, ItemKind kind) {
    Item item;
    item.index = index;
    item.path = path;
    item.kind = kind;
    return item;
}

std::vector<Item> sample_items() {
    return {
        make_item("1", "/r/a.pdf", ItemKind::File),
        make_item("2", "/r/b.docx", ItemKind::File),
        make_item("1", "/r/Sub", ItemKind::Directory),
        make_item("1.1", "/r/Sub/c.pdf", ItemKind::File),
        make_item("1.1", "/r/Sub/Deep", ItemKind::Directory),
        make_item("1.1.1", "/r/Sub/Deep/d.pdf", ItemKind::File),
        make_item("2", "/r/Empty", ItemKind::Directory),
    };
}

BatesMap sample_bates() {
    return BatesMap({{"1", 3}, {"2", 5}, {"1.1", 9}, {"1.1.1", 12}});
}

} // namespace

TEST(CrossReference, FlatOutlineHasOneEntryPerFile) {
    CrossReferenceGenerator xref(1, false);
    std::vector<OutlineEntry> outline = xref.buildOutline(sample_items(), sample_bates());

    ASSERT_EQ(outline.size(), 4u);
    EXPECT_EQ(outline[0].title, "1 - a.pdf");
    EXPECT_EQ(outline[0].pageIndex, 2);
    EXPECT_EQ(outline[1].title, "2 - b.docx");
    EXPECT_EQ(outline[1].pageIndex, 4);
    EXPECT_EQ(outline[2].title, "1.1 - c.pdf");
    EXPECT_EQ(outline[2].pageIndex, 8);
    EXPECT_EQ(outline[3].title, "1.1.1 - d.pdf");
    for (const auto& e : outline) EXPECT_EQ(e.level, 1);
}

TEST(CrossReference, TargetsAreRelativeToTheStartNumber) {
    CrossReferenceGenerator xref(100, false);
    BatesMap bates({{"1", 102}});
    std::vector<Item> items = {make_item("1", "/r/a.pdf", ItemKind::File)};

    std::vector<OutlineEntry> outline = xref.buildOutline(items, bates);
    ASSERT_EQ(outline.size(), 1u);
    EXPECT_EQ(outline[0].pageIndex, 2);

    std::vector<LinkRequest> links = xref.buildContentsLinks(items, bates, 2);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].targetPage, 2);
}

TEST(CrossReference, FilesWithoutNumbersAreSkipped) {
    CrossReferenceGenerator xref(1, false);
    BatesMap bates({{"1", 2}});
    std::vector<Item> items = {
        make_item("1", "/r/a.pdf", ItemKind::File),
        make_item("2", "/r/b.pdf", ItemKind::File),
    };
    EXPECT_EQ(xref.buildOutline(items, bates).size(), 1u);
    EXPECT_EQ(xref.buildContentsLinks(items, bates, 1).size(), 1u);
}

TEST(CrossReference, NestedOutlineFollowsIndexDepth) {
    CrossReferenceGenerator xref(1, true);
    std::vector<OutlineEntry> outline = xref.buildOutline(sample_items(), sample_bates());

    // Empty directory has nothing to point at
    ASSERT_EQ(outline.size(), 6u);
    EXPECT_EQ(outline[2].title, "1 - Sub");
    EXPECT_EQ(outline[2].level, 1);
    EXPECT_EQ(outline[2].pageIndex, 8);
    EXPECT_EQ(outline[3].title, "1.1 - c.pdf");
    EXPECT_EQ(outline[3].level, 2);
    EXPECT_EQ(outline[4].title, "1.1 - Deep");
    EXPECT_EQ(outline[4].level, 2);
    EXPECT_EQ(outline[4].pageIndex, 11);
    EXPECT_EQ(outline[5].title, "1.1.1 - d.pdf");
    EXPECT_EQ(outline[5].level, 3);
}

TEST(CrossReference, LinkTextMatchesRenderedContentsLine) {
    CrossReferenceGenerator xref(1, false);
    std::vector<LinkRequest> links = xref.buildContentsLinks(sample_items(), sample_bates(), 2);

    ASSERT_EQ(links.size(), 4u);
    EXPECT_EQ(links[0].text, "1 - a.pdf");
    EXPECT_EQ(links[2].text, "    1.1 - c.pdf");
    EXPECT_EQ(links[3].text, "        1.1.1 - d.pdf");
    EXPECT_EQ(links[3].targetPage, 11);
    std::vector<int> pages = {0, 1};
    for (const auto& l : links) EXPECT_EQ(l.searchPages, pages);
}
