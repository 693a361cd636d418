#include "qpdf_collaborators.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <memory>
#include <sstream>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFJob.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include "binder_errors.h"
#include "binder_log.h"
#include "pdf_page_writer.h"
#include "text_locator.h"
#include "work_files.h"

namespace DocBinder {

static const char* const PRODUCER = "docbinder";
static const char* const BATES_FONT = "/DBBates";

static std::string fmt2(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v;
    return ss.str();
}

// ============================================================================
// Page Counting
// ============================================================================

int QpdfPageCounter::countPages(const fs::path& pdf) {
    std::error_code ec;
    if (!fs::exists(pdf, ec)) {
        log_warning("Cannot count pages, file missing: " + pdf.string());
        return 0;
    }
    try {
        QPDF qpdf;
        qpdf.processFile(pdf.string().c_str());
        QPDFPageDocumentHelper dh(qpdf);
        return static_cast<int>(dh.getAllPages().size());
    } catch (const std::exception& e) {
        log_warning("Could not read page count of " + pdf.filename().string() + ": " + e.what());
        return 0;
    }
}

// ============================================================================
// Merging
// ============================================================================

QpdfMerger::QpdfMerger(PageCounter& counter) : counter_(counter) {}

MergeReport QpdfMerger::merge(const std::vector<fs::path>& inputs, const fs::path& output) {
    MergeReport report;

    for (const auto& input : inputs) {
        std::error_code ec;
        if (!fs::exists(input, ec)) {
            log_error("File missing: " + input.filename().string() + ", skipped from merge");
            report.skipped.push_back(input);
            continue;
        }
        if (counter_.countPages(input) <= 0) {
            log_warning("Skipping " + input.filename().string() + ", 0 pages.");
            report.skipped.push_back(input);
            continue;
        }
        report.merged.push_back(input);
    }

    if (report.merged.empty()) {
        throw OutputWriteFailure("Nothing to merge into " + output.string() + ": every input was missing or empty");
    }

    log_info("Merging " + std::to_string(report.merged.size()) + " PDF(s) into " + output.filename().string());

    fs::path temp = output;
    temp += ".tmp";
    bool written = false;
    try {
        // Scope the QPDFJob so it releases all file handles before the rename
        {
            QPDFJob j;
            auto c = j.config();
            c->emptyInput();
            c->outputFile(temp.string());
            auto pages = c->pages();
            for (const auto& input : report.merged) {
                pages->pageSpec(input.string(), "1-z");
            }
            pages->endPages();
            c->checkConfiguration();
            j.run();
        }
        written = true;
    } catch (const std::filesystem::filesystem_error& e) {
        // QPDFJob may throw filesystem_error during internal cleanup even when
        // the merge itself succeeded. Check if output was actually written.
        std::error_code ec;
        if (fs::exists(temp, ec) && fs::file_size(temp, ec) > 0) {
            written = true;
            log_warning(std::string("QPDF temp cleanup issue (merge succeeded): ") + e.what());
        } else {
            log_error(std::string("QPDF merge failed: ") + e.what());
        }
    } catch (const std::exception& e) {
        log_error(std::string("QPDF merge failed: ") + e.what());
    }

    std::error_code ec;
    if (!written) {
        fs::remove(temp, ec);
        throw OutputWriteFailure("Merged PDF not created: " + output.string());
    }

    std::string error;
    if (!replace_file(temp, output, error)) {
        fs::remove(temp, ec);
        throw OutputWriteFailure("Merged PDF not saved: " + error);
    }

    report.pagesWritten = counter_.countPages(output);
    if (report.pagesWritten <= 0) {
        throw OutputWriteFailure("Merged PDF is unreadable: " + output.string());
    }
    log_info("Merged PDF saved: " + output.filename().string() + " (" +
             std::to_string(report.pagesWritten) + " pages)");
    return report;
}

// ============================================================================
// Annotation
// ============================================================================

static void set_pdf_metadata(QPDF& qpdf) {
    // Get or create /Info dictionary
    auto trailer = qpdf.getTrailer();
    QPDFObjectHandle info;
    if (trailer.hasKey("/Info") && trailer.getKey("/Info").isDictionary()) {
        info = trailer.getKey("/Info");
    } else {
        info = qpdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
        trailer.replaceKey("/Info", info);
    }

    info.replaceKey("/Producer", QPDFObjectHandle::newString(PRODUCER));
    info.replaceKey("/Creator", QPDFObjectHandle::newString(PRODUCER));
}

void QpdfPageAnnotator::editInPlace(const fs::path& pdf, const std::string& action,
                                    const std::function<void(QPDF&)>& edit) {
    std::error_code ec;
    if (!fs::exists(pdf, ec)) {
        throw OutputWriteFailure(action + ": " + pdf.string() + " does not exist");
    }

    fs::path temp = pdf;
    temp += ".edit.tmp";
    try {
        QPDF qpdf;
        qpdf.processFile(pdf.string().c_str());
        edit(qpdf);
        set_pdf_metadata(qpdf);

        QPDFWriter writer(qpdf, temp.string().c_str());
        writer.write();
    } catch (const BinderError&) {
        fs::remove(temp, ec);
        throw;
    } catch (const std::exception& e) {
        fs::remove(temp, ec);
        throw OutputWriteFailure(action + " failed for " + pdf.filename().string() + ": " + e.what());
    }

    std::string error;
    if (!replace_file(temp, pdf, error)) {
        fs::remove(temp, ec);
        throw OutputWriteFailure(action + " failed: " + error);
    }
}

void QpdfPageAnnotator::stampSequential(const fs::path& pdf, int startNumber, int fontSize) {
    log_info("Applying Bates numbering to " + pdf.filename().string());

    int stamped = 0;
    editInPlace(pdf, "Bates numbering", [&](QPDF& qpdf) {
        QPDFPageDocumentHelper dh(qpdf);
        dh.pushInheritedAttributesToPage();

        QPDFObjectHandle font = qpdf.makeIndirectObject(QPDFObjectHandle::parse(
            "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>"));

        int number = startNumber;
        for (auto& page : dh.getAllPages()) {
            QPDFObjectHandle obj = page.getObjectHandle();

            QPDFObjectHandle resources = obj.getKey("/Resources");
            if (!resources.isDictionary()) {
                resources = QPDFObjectHandle::newDictionary();
                obj.replaceKey("/Resources", resources);
            }
            QPDFObjectHandle fonts = resources.getKey("/Font");
            if (!fonts.isDictionary()) {
                fonts = QPDFObjectHandle::newDictionary();
                resources.replaceKey("/Font", fonts);
            }
            fonts.replaceKey(BATES_FONT, font);

            double x0 = 0, y0 = 0, width = 612;
            QPDFObjectHandle mediabox = obj.getKey("/MediaBox");
            if (mediabox.isRectangle()) {
                QPDFObjectHandle::Rectangle r = mediabox.getArrayAsRectangle();
                x0 = std::min(r.llx, r.urx);
                y0 = std::min(r.lly, r.ury);
                width = std::abs(r.urx - r.llx);
            }

            // Label 80pt from the right edge, 40pt above the bottom, on a light grey box
            double x = x0 + width - 80;
            double y = y0 + 40;
            std::string label = format_bates(number++);

            std::string stamp =
                "Q\nq\n"
                "0.9 g\n" +
                fmt2(x - 10) + " " + fmt2(y - 5) + " 70 30 re f\n"
                "0 g\n"
                "BT " + std::string(BATES_FONT) + " " + std::to_string(fontSize) + " Tf " +
                fmt2(x) + " " + fmt2(y) + " Td (" + pdf_escape_string(label) + ") Tj ET\n"
                "Q\n";

            // Existing content runs inside its own q/Q so its state cannot leak into the label
            page.addPageContents(QPDFObjectHandle::newStream(&qpdf, "q\n"), true);
            page.addPageContents(QPDFObjectHandle::newStream(&qpdf, stamp), false);
            ++stamped;
        }
    });

    log_info("Bates numbering applied to " + pdf.filename().string() + " (" + std::to_string(stamped) + " pages)");
}

void QpdfPageAnnotator::setOutline(const fs::path& pdf, const std::vector<OutlineEntry>& entries) {
    log_info("Adding PDF bookmarks (outline)...");

    editInPlace(pdf, "Outline", [&](QPDF& qpdf) {
        QPDFPageDocumentHelper dh(qpdf);
        std::vector<QPDFPageObjectHelper> pages = dh.getAllPages();
        QPDFObjectHandle root = qpdf.getRoot();

        // Pre-order nodes with their parent (-1 = outline root)
        struct Node {
            const OutlineEntry* entry;
            int parent;
            int descendants;
            QPDFObjectHandle obj;
        };
        std::vector<Node> nodes;
        std::vector<int> open;
        for (const auto& entry : entries) {
            if (entry.pageIndex < 0 || entry.pageIndex >= static_cast<int>(pages.size())) {
                log_warning("Bookmark \"" + entry.title + "\" targets page " + std::to_string(entry.pageIndex + 1) +
                            " of " + std::to_string(pages.size()) + ", skipped");
                continue;
            }
            size_t level = static_cast<size_t>(std::max(1, entry.level));
            level = std::min(level, open.size() + 1);
            open.resize(level - 1);
            int parent = open.empty() ? -1 : open.back();
            nodes.push_back(Node{&entry, parent, 0, QPDFObjectHandle()});
            open.push_back(static_cast<int>(nodes.size()) - 1);
        }

        root.removeKey("/Outlines");
        if (nodes.empty()) return;

        for (size_t i = nodes.size(); i-- > 0;) {
            if (nodes[i].parent >= 0) nodes[nodes[i].parent].descendants += 1 + nodes[i].descendants;
        }

        QPDFObjectHandle outlines = qpdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
        outlines.replaceKey("/Type", QPDFObjectHandle::newName("/Outlines"));
        outlines.replaceKey("/Count", QPDFObjectHandle::newInteger(static_cast<long long>(nodes.size())));

        for (auto& node : nodes) {
            QPDFObjectHandle dest = QPDFObjectHandle::newArray();
            dest.appendItem(pages[node.entry->pageIndex].getObjectHandle());
            dest.appendItem(QPDFObjectHandle::newName("/Fit"));

            node.obj = qpdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
            node.obj.replaceKey("/Title", QPDFObjectHandle::newUnicodeString(node.entry->title));
            node.obj.replaceKey("/Dest", dest);
            node.obj.replaceKey("/Parent", node.parent >= 0 ? nodes[node.parent].obj : outlines);
            if (node.descendants > 0) {
                node.obj.replaceKey("/Count", QPDFObjectHandle::newInteger(node.descendants));
            }
        }

        // Sibling chains and first/last children
        std::map<int, int> lastChild;
        for (size_t i = 0; i < nodes.size(); ++i) {
            Node& node = nodes[i];
            QPDFObjectHandle parentObj = node.parent >= 0 ? nodes[node.parent].obj : outlines;
            auto it = lastChild.find(node.parent);
            if (it == lastChild.end()) {
                parentObj.replaceKey("/First", node.obj);
            } else {
                Node& prev = nodes[it->second];
                prev.obj.replaceKey("/Next", node.obj);
                node.obj.replaceKey("/Prev", prev.obj);
            }
            parentObj.replaceKey("/Last", node.obj);
            lastChild[node.parent] = static_cast<int>(i);
        }

        root.replaceKey("/Outlines", outlines);
        root.replaceKey("/PageMode", QPDFObjectHandle::newName("/UseOutlines"));
        log_debug("Outline written with " + std::to_string(nodes.size()) + " entries");
    });

    log_info("PDF bookmarks added.");
}

std::vector<LinkStatus> QpdfPageAnnotator::insertLinks(const fs::path& pdf, const std::vector<LinkRequest>& requests) {
    std::vector<LinkStatus> statuses(requests.size(), LinkStatus::NotFound);
    if (requests.empty()) return statuses;

    log_info("Adding contents page links...");

    editInPlace(pdf, "Link insertion", [&](QPDF& qpdf) {
        QPDFPageDocumentHelper dh(qpdf);
        std::vector<QPDFPageObjectHelper> pages = dh.getAllPages();
        const int pageCount = static_cast<int>(pages.size());

        // Each searched page is parsed once
        std::map<int, std::unique_ptr<TextLocator>> locators;
        auto locatorFor = [&](int p) -> TextLocator& {
            auto it = locators.find(p);
            if (it == locators.end()) {
                auto locator = std::make_unique<TextLocator>(pages[p]);
                pages[p].parseContents(locator.get());
                it = locators.emplace(p, std::move(locator)).first;
            }
            return *it->second;
        };

        for (size_t r = 0; r < requests.size(); ++r) {
            const LinkRequest& request = requests[r];
            if (request.targetPage < 0 || request.targetPage >= pageCount) {
                log_warning("Link target page " + std::to_string(request.targetPage + 1) + " out of range for \"" +
                            request.text + "\"");
                continue;
            }
            QPDFObjectHandle target = pages[request.targetPage].getObjectHandle();

            for (int p : request.searchPages) {
                if (p < 0 || p >= pageCount) continue;

                for (const auto& match : locatorFor(p).find(request.text)) {
                    for (const auto& rect : match.rects) {
                        QPDFObjectHandle dest = QPDFObjectHandle::newArray();
                        dest.appendItem(target);
                        dest.appendItem(QPDFObjectHandle::newName("/Fit"));

                        QPDFObjectHandle annot = qpdf.makeIndirectObject(QPDFObjectHandle::parse(
                            "<< /Type /Annot /Subtype /Link /Border [0 0 0] >>"));
                        annot.replaceKey("/Rect", QPDFObjectHandle::newArray(
                            QPDFObjectHandle::Rectangle(rect.x0, rect.y0, rect.x1, rect.y1)));
                        annot.replaceKey("/Dest", dest);

                        QPDFObjectHandle pageObj = pages[p].getObjectHandle();
                        QPDFObjectHandle annots = pageObj.getKey("/Annots");
                        if (!annots.isArray()) {
                            annots = QPDFObjectHandle::newArray();
                            pageObj.replaceKey("/Annots", annots);
                        }
                        annots.appendItem(annot);
                    }
                    statuses[r] = LinkStatus::Linked;
                }
            }
            if (statuses[r] == LinkStatus::Linked) {
                log_debug("Linked \"" + request.text + "\" to page " + std::to_string(request.targetPage + 1));
            }
        }
    });

    return statuses;
}

} // namespace DocBinder
