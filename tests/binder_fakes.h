#ifndef DOCBINDER_TESTS_BINDER_FAKES_H
#define DOCBINDER_TESTS_BINDER_FAKES_H

// In-memory stand-ins for the page services. A "PDF" here is a text file
// holding "pages=N", which is all the engine needs to know about it.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "binder_errors.h"
#include "collaborators.h"

namespace DocBinder {
namespace fakes {

namespace fs = std::filesystem;

inline void write_fake_pdf(const fs::path& path, int pages) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << "pages=" << pages << "\n";
}

inline int read_fake_pages(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return 0;
    std::string line;
    std::getline(in, line);
    if (line.rfind("pages=", 0) != 0) return 0;
    return std::stoi(line.substr(6));
}

// Unique scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("docbinder_test_" + std::to_string(stamp) + "_" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

class FakeFormatter : public Formatter {
public:
    int coverPages = 1;
    // Contents page count for a given map; one page by default
    std::function<int(const std::vector<Item>&, const BatesMap&)> contentsPages =
        [](const std::vector<Item>&, const BatesMap&) { return 1; };

    std::atomic<int> coverCalls{0};
    int contentsCalls = 0;
    std::vector<BatesMap> contentsMaps;

    fs::path renderCoverPage(const std::string&, const std::string&, const fs::path& output) override {
        ++coverCalls;
        write_fake_pdf(output, coverPages);
        return output;
    }

    fs::path renderContentsPage(const std::vector<Item>& items, const BatesMap& bates,
                                const fs::path& output) override {
        ++contentsCalls;
        contentsMaps.push_back(bates);
        write_fake_pdf(output, contentsPages(items, bates));
        return output;
    }
};

// PDFs and generated pages pass through; other sources are "converted" by
// copying their pages= line to the output
class FakeRenderer : public Renderer {
public:
    std::set<std::string> failing;    // file names that fail to convert

    fs::path render(const fs::path& source, const fs::path& outputPdf) override {
        if (!fs::exists(source)) throw RenderFailure(source.string() + " not found.");
        if (failing.count(source.filename().string())) {
            throw RenderFailure("converter crashed on " + source.filename().string());
        }
        if (source == outputPdf || source.extension() == ".pdf") return source;

        write_fake_pdf(outputPdf, read_fake_pages(source));
        std::lock_guard<std::mutex> lock(mutex_);
        converted_.push_back(source.filename().string());
        return outputPdf;
    }

    std::vector<std::string> converted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return converted_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> converted_;
};

class FakePageCounter : public PageCounter {
public:
    int countPages(const fs::path& pdf) override { return read_fake_pages(pdf); }
};

class FakeMerger : public Merger {
public:
    std::vector<fs::path> inputs;

    MergeReport merge(const std::vector<fs::path>& in, const fs::path& output) override {
        inputs = in;
        MergeReport report;
        for (const auto& p : in) {
            int pages = read_fake_pages(p);
            if (pages <= 0) {
                report.skipped.push_back(p);
                continue;
            }
            report.merged.push_back(p);
            report.pagesWritten += pages;
        }
        if (report.merged.empty()) throw OutputWriteFailure("nothing to merge");
        write_fake_pdf(output, report.pagesWritten);
        return report;
    }
};

class FakeAnnotator : public PageAnnotator {
public:
    int stampStart = -1;
    int stampFontSize = -1;
    std::vector<OutlineEntry> outline;
    std::vector<LinkRequest> links;
    std::set<std::string> missingText;   // requests with this text report NotFound
    bool failOutline = false;
    std::vector<std::string> calls;

    void stampSequential(const fs::path& pdf, int startNumber, int fontSize) override {
        requireFile(pdf);
        calls.push_back("stamp");
        stampStart = startNumber;
        stampFontSize = fontSize;
    }

    void setOutline(const fs::path& pdf, const std::vector<OutlineEntry>& entries) override {
        requireFile(pdf);
        calls.push_back("outline");
        if (failOutline) throw OutputWriteFailure("outline write failed");
        outline = entries;
    }

    std::vector<LinkStatus> insertLinks(const fs::path& pdf, const std::vector<LinkRequest>& requests) override {
        requireFile(pdf);
        calls.push_back("links");
        links = requests;
        std::vector<LinkStatus> statuses;
        for (const auto& r : requests) {
            statuses.push_back(missingText.count(r.text) ? LinkStatus::NotFound : LinkStatus::Linked);
        }
        return statuses;
    }

private:
    static void requireFile(const fs::path& pdf) {
        if (!fs::exists(pdf)) throw OutputWriteFailure(pdf.string() + " does not exist");
    }
};

} // namespace fakes
} // namespace DocBinder

#endif // DOCBINDER_TESTS_BINDER_FAKES_H
