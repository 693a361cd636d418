#include <gtest/gtest.h>

#include <map>
#include <set>

#include "binder_errors.h"
#include "binder_fakes.h"
#include "item_scanner.h"

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace DocBinder;
using DocBinder::fakes::TempDir;
using DocBinder::fakes::write_fake_pdf;

namespace {

std::map<std::string, std::string> index_by_name(const std::vector<Item>& items) {
    std::map<std::string, std::string> m;
    for (const auto& item : items) m[item.displayName()] = item.index;
    return m;
}

} // namespace

TEST(ItemScanner, NumbersFilesAndDirectoriesIndependently) {
    TempDir tmp;
    write_fake_pdf(tmp.path() / "b.docx", 1);
    write_fake_pdf(tmp.path() / "a.pdf", 1);
    write_fake_pdf(tmp.path() / "Sub" / "c.pdf", 1);

    ItemScanner scanner({}, {});
    std::vector<Item> items = scanner.scan(tmp.path());

    ASSERT_EQ(items.size(), 4u);
    EXPECT_EQ(items[0].displayName(), "a.pdf");
    EXPECT_EQ(items[0].index, "1");
    EXPECT_EQ(items[0].source, SourceKind::PageDocument);
    EXPECT_EQ(items[1].displayName(), "b.docx");
    EXPECT_EQ(items[1].index, "2");
    EXPECT_EQ(items[1].source, SourceKind::DocumentSource);
    EXPECT_EQ(items[2].displayName(), "Sub");
    EXPECT_EQ(items[2].index, "1");
    EXPECT_TRUE(items[2].isDirectory());
    EXPECT_EQ(items[3].displayName(), "c.pdf");
    EXPECT_EQ(items[3].index, "1.1");
}

TEST(ItemScanner, SortsCaseInsensitively) {
    TempDir tmp;
    write_fake_pdf(tmp.path() / "beta.pdf", 1);
    write_fake_pdf(tmp.path() / "Alpha.pdf", 1);
    write_fake_pdf(tmp.path() / "gamma.docx", 1);
    write_fake_pdf(tmp.path() / "Delta.DOCX", 1);

    std::vector<Item> items = ItemScanner({}, {}).scan(tmp.path());
    ASSERT_EQ(items.size(), 4u);
    EXPECT_EQ(items[0].displayName(), "Alpha.pdf");
    EXPECT_EQ(items[1].displayName(), "beta.pdf");
    EXPECT_EQ(items[2].displayName(), "Delta.DOCX");
    EXPECT_EQ(items[3].displayName(), "gamma.docx");
    EXPECT_EQ(items[3].index, "4");
}

TEST(ItemScanner, DirectoryChildrenUseDirectoryPrefix) {
    TempDir tmp;
    write_fake_pdf(tmp.path() / "x.pdf", 1);
    write_fake_pdf(tmp.path() / "A" / "a1.pdf", 1);
    write_fake_pdf(tmp.path() / "B" / "b1.pdf", 1);
    write_fake_pdf(tmp.path() / "B" / "b2.docx", 1);
    write_fake_pdf(tmp.path() / "B" / "Inner" / "deep.pdf", 1);

    std::vector<Item> items = ItemScanner({}, {}).scan(tmp.path());
    auto idx = index_by_name(items);

    EXPECT_EQ(idx["x.pdf"], "1");
    EXPECT_EQ(idx["A"], "1");
    EXPECT_EQ(idx["a1.pdf"], "1.1");
    EXPECT_EQ(idx["B"], "2");
    EXPECT_EQ(idx["b1.pdf"], "2.1");
    EXPECT_EQ(idx["b2.docx"], "2.2");
    EXPECT_EQ(idx["Inner"], "2.1");
    EXPECT_EQ(idx["deep.pdf"], "2.1.1");

    // Pre-order: each directory directly before its contents
    std::vector<std::string> order;
    for (const auto& item : items) order.push_back(item.displayName());
    std::vector<std::string> expected = {"x.pdf", "A", "a1.pdf", "B", "b1.pdf", "b2.docx", "Inner", "deep.pdf"};
    EXPECT_EQ(order, expected);
}

TEST(ItemScanner, EveryParentPrefixNamesOneAncestor) {
    TempDir tmp;
    write_fake_pdf(tmp.path() / "r.pdf", 1);
    write_fake_pdf(tmp.path() / "One" / "Two" / "t.pdf", 1);
    write_fake_pdf(tmp.path() / "One" / "o.pdf", 1);
    write_fake_pdf(tmp.path() / "Three" / "s.docx", 1);

    std::vector<Item> items = ItemScanner({}, {}).scan(tmp.path());

    std::set<std::string> fileIndices;
    std::map<std::string, fs::path> dirs;
    for (const auto& item : items) {
        if (item.isFile()) {
            EXPECT_TRUE(fileIndices.insert(item.index).second) << item.index;
        } else {
            EXPECT_TRUE(dirs.emplace(item.index, item.path).second) << item.index;
        }
    }
    for (const auto& item : items) {
        size_t dot = item.index.rfind('.');
        if (dot == std::string::npos) continue;
        auto parent = dirs.find(item.index.substr(0, dot));
        ASSERT_NE(parent, dirs.end()) << item.index;
        EXPECT_EQ(parent->second, item.path.parent_path());
    }
}

TEST(ItemScanner, IgnoresIneligibleFiles) {
    TempDir tmp;
    write_fake_pdf(tmp.path() / "keep.pdf", 1);
    write_fake_pdf(tmp.path() / "notes.txt", 1);
    write_fake_pdf(tmp.path() / "image.png", 1);
    write_fake_pdf(tmp.path() / "letter.rtf", 1);

    std::vector<Item> items = ItemScanner({}, {}).scan(tmp.path());
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].displayName(), "keep.pdf");
    EXPECT_EQ(items[1].displayName(), "letter.rtf");
}

TEST(ItemScanner, ExcludesWorkDirectoryAndFinalOutput) {
    TempDir tmp;
    write_fake_pdf(tmp.path() / "a.pdf", 1);
    write_fake_pdf(tmp.path() / "final_output.pdf", 5);
    write_fake_pdf(tmp.path() / "output" / "cover_1.pdf", 1);
    write_fake_pdf(tmp.path() / "output" / "nested" / "x.pdf", 1);
    write_fake_pdf(tmp.path() / "Docs" / "final_output.pdf", 1);

    ItemScanner scanner({tmp.path() / "output"}, {tmp.path() / "final_output.pdf"});
    std::vector<Item> items = scanner.scan(tmp.path());

    auto idx = index_by_name(items);
    EXPECT_EQ(items.size(), 3u);
    EXPECT_EQ(idx.count("output"), 0u);
    EXPECT_EQ(idx.count("cover_1.pdf"), 0u);
    EXPECT_EQ(idx["a.pdf"], "1");
    EXPECT_EQ(idx["Docs"], "1");
    // Only the designated output file is excluded, not every file with its name
    EXPECT_EQ(items[2].path, tmp.path() / "Docs" / "final_output.pdf");
}

TEST(ItemScanner, ExcludedDirectoryWithTrailingSeparator) {
    TempDir tmp;
    write_fake_pdf(tmp.path() / "a.pdf", 1);
    write_fake_pdf(tmp.path() / "skip" / "b.pdf", 1);

    ItemScanner scanner({(tmp.path() / "skip").string() + "/"}, {});
    std::vector<Item> items = scanner.scan(tmp.path());
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].displayName(), "a.pdf");
}

TEST(ItemScanner, SimilarlyNamedDirectoryIsNotExcluded) {
    TempDir tmp;
    write_fake_pdf(tmp.path() / "output" / "x.pdf", 1);
    write_fake_pdf(tmp.path() / "output2" / "y.pdf", 1);

    ItemScanner scanner({tmp.path() / "output"}, {});
    std::vector<Item> items = scanner.scan(tmp.path());
    auto idx = index_by_name(items);
    EXPECT_EQ(idx["output2"], "1");
    EXPECT_EQ(idx["y.pdf"], "1.1");
    EXPECT_EQ(idx.count("x.pdf"), 0u);
}

TEST(ItemScanner, EmptyDirectoriesStillGetAnIndex) {
    TempDir tmp;
    fs::create_directories(tmp.path() / "Empty");
    write_fake_pdf(tmp.path() / "Full" / "f.pdf", 1);

    std::vector<Item> items = ItemScanner({}, {}).scan(tmp.path());
    auto idx = index_by_name(items);
    EXPECT_EQ(idx["Empty"], "1");
    EXPECT_EQ(idx["Full"], "2");
    EXPECT_EQ(idx["f.pdf"], "2.1");
}

TEST(ItemScanner, MissingRootIsScanFailure) {
    TempDir tmp;
    ItemScanner scanner({}, {});
    EXPECT_THROW(scanner.scan(tmp.path() / "does_not_exist"), ScanFailure);

    write_fake_pdf(tmp.path() / "file.pdf", 1);
    EXPECT_THROW(scanner.scan(tmp.path() / "file.pdf"), ScanFailure);
}

#ifndef _WIN32

TEST(ItemScanner, UnreadableSubdirectoryIsScanFailure) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "running as root: directory permissions are not enforced";
    }
    TempDir tmp;
    write_fake_pdf(tmp.path() / "a.pdf", 1);
    write_fake_pdf(tmp.path() / "Locked" / "secret.pdf", 1);

    fs::path locked = tmp.path() / "Locked";
    fs::permissions(locked, fs::perms::none);

    // Restored before TempDir cleans up
    struct Restore {
        fs::path dir;
        ~Restore() {
            std::error_code ec;
            fs::permissions(dir, fs::perms::owner_all, ec);
        }
    } restore{locked};

    ItemScanner scanner({}, {});
    EXPECT_THROW(scanner.scan(tmp.path()), ScanFailure);

    // Excluding it makes the tree scannable again
    ItemScanner excluding({locked}, {});
    std::vector<Item> items = excluding.scan(tmp.path());
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].displayName(), "a.pdf");
}

#endif

TEST(ItemScanner, ScanIsRepeatable) {
    TempDir tmp;
    write_fake_pdf(tmp.path() / "z.pdf", 1);
    write_fake_pdf(tmp.path() / "m" / "k.docx", 1);

    ItemScanner scanner({}, {});
    std::vector<Item> first = scanner.scan(tmp.path());
    std::vector<Item> second = scanner.scan(tmp.path());
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].index, second[i].index);
        EXPECT_EQ(first[i].path, second[i].path);
    }
}

TEST(ItemScanner, ClassifiesExtensions) {
    EXPECT_EQ(ItemScanner::classifyExtension("a.PDF"), SourceKind::PageDocument);
    EXPECT_EQ(ItemScanner::classifyExtension("a.docx"), SourceKind::DocumentSource);
    EXPECT_EQ(ItemScanner::classifyExtension("a.odt"), SourceKind::DocumentSource);
    EXPECT_EQ(ItemScanner::classifyExtension("a.xlsx"), SourceKind::None);
    EXPECT_EQ(ItemScanner::classifyExtension("README"), SourceKind::None);
}

TEST(ItemScanner, NameOrderBreaksTiesOnExactName) {
    EXPECT_TRUE(name_less("a.pdf", "B.pdf"));
    EXPECT_FALSE(name_less("B.pdf", "a.pdf"));
    EXPECT_TRUE(name_less("A.pdf", "a.pdf"));
    EXPECT_FALSE(name_less("a.pdf", "A.pdf"));
}
