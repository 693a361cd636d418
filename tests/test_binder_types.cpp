#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "binder_fakes.h"
#include "binder_log.h"
#include "binder_types.h"
#include "work_files.h"

using namespace DocBinder;
using DocBinder::fakes::TempDir;
using DocBinder::fakes::write_fake_pdf;
using DocBinder::fakes::read_fake_pages;

TEST(BinderTypes, BatesLabelsArePaddedToThreeDigits) {
    EXPECT_EQ(format_bates(1), "001");
    EXPECT_EQ(format_bates(42), "042");
    EXPECT_EQ(format_bates(999), "999");
    EXPECT_EQ(format_bates(1000), "1000");
    EXPECT_EQ(format_bates(0), "000");
}

TEST(BinderTypes, ContentsLineIndentsFourSpacesPerLevel) {
    EXPECT_EQ(contents_line_text("1", "a.pdf"), "1 - a.pdf");
    EXPECT_EQ(contents_line_text("2.1", "Sub"), "    2.1 - Sub");
    EXPECT_EQ(contents_line_text("2.1.3", "x.docx"), "        2.1.3 - x.docx");

    Item item;
    item.index = "1.2";
    item.path = "/root/Docs/report.pdf";
    EXPECT_EQ(item.depth(), 1);
    EXPECT_EQ(contents_line_text(item), "    1.2 - report.pdf");
}

TEST(BinderTypes, ContentsEntriesCarryNumbersForFilesOnly) {
    Item file;
    file.index = "1";
    file.path = "/r/a.pdf";
    Item dir;
    dir.index = "1";
    dir.path = "/r/Sub";
    dir.kind = ItemKind::Directory;
    Item child;
    child.index = "1.1";
    child.path = "/r/Sub/c.pdf";

    BatesMap bates({{"1", 3}, {"1.1", 7}});
    std::vector<ContentsEntry> entries = build_contents_entries({file, dir, child}, bates);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].page, 3);
    EXPECT_FALSE(entries[0].isDirectory);
    // The directory shares index "1" with the file but never gets a number
    EXPECT_TRUE(entries[1].isDirectory);
    EXPECT_FALSE(entries[1].page.has_value());
    EXPECT_EQ(entries[2].page, 7);
    EXPECT_EQ(entries[2].displayName, "c.pdf");

    std::vector<ContentsEntry> dry = build_contents_entries({file, dir, child}, BatesMap());
    for (const auto& e : dry) EXPECT_FALSE(e.page.has_value());
}

TEST(BinderTypes, FileItemsKeepScanOrder) {
    Item a;
    a.index = "1";
    a.path = "a.pdf";
    Item d;
    d.index = "1";
    d.path = "D";
    d.kind = ItemKind::Directory;
    Item b;
    b.index = "1.1";
    b.path = "D/b.pdf";

    std::vector<Item> files = file_items({a, d, b});
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].index, "1");
    EXPECT_EQ(files[1].index, "1.1");
}

TEST(WorkFiles, NamesFollowTheItemIndex) {
    fs::path work = "/tmp/work";
    EXPECT_EQ(cover_file(work, "2.1"), work / "cover_2.1.pdf");
    EXPECT_EQ(content_file(work, "3"), work / "file_3.pdf");
    EXPECT_EQ(contents_dummy_file(work), work / "contents_dummy.pdf");
    EXPECT_EQ(contents_file(work), work / "contents.pdf");
    EXPECT_EQ(assembled_file(work), work / "assembled.pdf");
}

TEST(WorkFiles, ReplaceFileOverwritesTarget) {
    TempDir tmp;
    write_fake_pdf(tmp.path() / "new.pdf", 7);
    write_fake_pdf(tmp.path() / "old.pdf", 2);

    std::string error;
    ASSERT_TRUE(replace_file(tmp.path() / "new.pdf", tmp.path() / "old.pdf", error)) << error;
    EXPECT_FALSE(fs::exists(tmp.path() / "new.pdf"));
    EXPECT_EQ(read_fake_pages(tmp.path() / "old.pdf"), 7);
}

TEST(WorkFiles, ReplaceFileReportsMissingSource) {
    TempDir tmp;
    std::string error;
    EXPECT_FALSE(replace_file(tmp.path() / "missing.pdf", tmp.path() / "out.pdf", error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(fs::exists(tmp.path() / "out.pdf"));
}

TEST(BinderLog, FileGetsEveryLevelWithTimestamp) {
    TempDir tmp;
    fs::path log_path = tmp.path() / "run_log.txt";

    Logger& logger = Logger::instance();
    logger.setConsole(false);
    logger.resetCounters();
    ASSERT_TRUE(logger.openFile(log_path));
    log_debug("scanning");
    log_info("merged");
    log_warning("skipped a page");
    log_error("missing file");
    logger.closeFile();
    logger.setConsole(true);

    EXPECT_EQ(logger.warningCount(), 1);
    EXPECT_EQ(logger.errorCount(), 1);

    std::ifstream in(log_path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_NE(lines[0].find(" [LOG] DEBUG: scanning"), std::string::npos);
    EXPECT_NE(lines[1].find(" [LOG] INFO: merged"), std::string::npos);
    EXPECT_NE(lines[2].find(" [LOG] WARNING: skipped a page"), std::string::npos);
    EXPECT_NE(lines[3].find(" [LOG] ERROR: missing file"), std::string::npos);
    // "YYYY-MM-DD HH:MM:SS"
    EXPECT_EQ(lines[0][4], '-');
    EXPECT_EQ(lines[0][10], ' ');
    EXPECT_EQ(lines[0][13], ':');
}
