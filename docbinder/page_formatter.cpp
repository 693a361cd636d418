#include "page_formatter.h"

#include "binder_errors.h"
#include "binder_log.h"
#include "font_metrics.h"

namespace DocBinder {

// ============================================================================
// Page geometry (Letter, 1 inch margins, Normal style 11pt / 1.15 / 8pt after)
// ============================================================================

static constexpr double PAGE_WIDTH = 612.0;
static constexpr double PAGE_HEIGHT = 792.0;
static constexpr double MARGIN = 72.0;
static constexpr double CONTENT_WIDTH = PAGE_WIDTH - 2 * MARGIN;
static constexpr double LINE_SPACING = 1.15;
static constexpr double BODY_SIZE = 11.0;
static constexpr double SPACE_AFTER = 8.0;

// Contents table: 6" + 1" centred, 5pt top/bottom cell margins
static constexpr double TABLE_DOC_WIDTH = 432.0;
static constexpr double TABLE_PAGE_WIDTH = 72.0;
static constexpr double TABLE_X = (PAGE_WIDTH - TABLE_DOC_WIDTH - TABLE_PAGE_WIDTH) / 2;
static constexpr double CELL_PAD_V = 5.0;
static constexpr double CELL_PAD_H = 5.4;

static constexpr double HEADER_GRAY = 100.0 / 255.0;
static constexpr double RULE_GRAY = 180.0 / 255.0;

enum class Align {
    Left,
    Center,
    Right
};

// Top-down cursor over the pages of a PdfPageWriter
class FlowLayout {
public:
    explicit FlowLayout(PdfPageWriter& writer) : writer_(writer) {
        writer_.newPage();
        y_ = PAGE_HEIGHT - MARGIN;
    }

    // Reserves height on the current page, or on a fresh one if it does not
    // fit and the current page already has content. Returns the top edge.
    double take(double height) {
        if (y_ - height < MARGIN && y_ < PAGE_HEIGHT - MARGIN) {
            writer_.newPage();
            y_ = PAGE_HEIGHT - MARGIN;
        }
        double top = y_;
        y_ -= height;
        return top;
    }

    void skip(double height) { y_ -= height; }

    void paragraph(const std::string& winAnsi, FontFace face, double size, Align align,
                   double spaceAfter, double gray = 0.0) {
        double lineHeight = size * LINE_SPACING;
        for (const auto& line : wrap_text(winAnsi, face, size, CONTENT_WIDTH)) {
            double top = take(lineHeight);
            double baseline = top - size;
            double w = text_width(line, face, size);
            double x = MARGIN;
            if (align == Align::Center) x = MARGIN + (CONTENT_WIDTH - w) / 2;
            if (align == Align::Right) x = MARGIN + CONTENT_WIDTH - w;
            if (!line.empty()) writer_.drawText(x, baseline, line, face, size, gray);
        }
        skip(spaceAfter);
    }

    void emptyParagraph() {
        take(BODY_SIZE * LINE_SPACING);
        skip(SPACE_AFTER);
    }

    void rule(double width, double gray, double spaceAfter) {
        double top = take(BODY_SIZE * LINE_SPACING);
        double y = top - BODY_SIZE * LINE_SPACING / 2;
        double x0 = MARGIN + (CONTENT_WIDTH - width) / 2;
        writer_.drawLine(x0, y, x0 + width, y, gray);
        skip(spaceAfter);
    }

    PdfPageWriter& writer() { return writer_; }

private:
    PdfPageWriter& writer_;
    double y_;
};

// ============================================================================
// PdfPageFormatter
// ============================================================================

PdfPageFormatter::PdfPageFormatter(std::string contentsDate)
    : contentsDate_(std::move(contentsDate)) {}

int PdfPageFormatter::layoutCover(PdfPageWriter& writer, const std::string& index,
                                  const std::string& displayName) const {
    FlowLayout flow(writer);

    flow.paragraph("DOCUMENT INDEX", FontFace::Bold, 12, Align::Center, SPACE_AFTER, HEADER_GRAY);
    for (int i = 0; i < 6; ++i) flow.emptyParagraph();

    flow.paragraph(" " + to_win_ansi(index) + " ", FontFace::Bold, 18, Align::Center, 12);
    flow.paragraph(to_win_ansi(displayName), FontFace::Bold, 24, Align::Center, 24);
    flow.rule(200, HEADER_GRAY, SPACE_AFTER);

    return writer.pageCount();
}

int PdfPageFormatter::layoutContents(PdfPageWriter& writer, const std::vector<ContentsEntry>& entries) const {
    FlowLayout flow(writer);

    flow.paragraph("TABLE OF CONTENTS", FontFace::Bold, 16, Align::Center, 20);
    flow.paragraph(to_win_ansi(contentsDate_), FontFace::Italic, 12, Align::Center, 20);
    flow.rule(300, RULE_GRAY, 20);

    const double textWidth = TABLE_DOC_WIDTH - 2 * CELL_PAD_H;
    const double pageColumnRight = TABLE_X + TABLE_DOC_WIDTH + TABLE_PAGE_WIDTH - CELL_PAD_H;

    // Header row
    {
        double lineHeight = 12 * LINE_SPACING;
        double top = flow.take(CELL_PAD_V * 2 + lineHeight + SPACE_AFTER);
        double baseline = top - CELL_PAD_V - 12;
        writer.drawText(TABLE_X + CELL_PAD_H, baseline, "Document", FontFace::Bold, 12);
        double w = text_width("Page", FontFace::Bold, 12);
        writer.drawText(pageColumnRight - w, baseline, "Page", FontFace::Bold, 12);
    }

    for (const auto& entry : entries) {
        FontFace face = entry.isDirectory ? FontFace::Bold : FontFace::Regular;
        std::string text = to_win_ansi(contents_line_text(entry.index, entry.displayName));
        std::vector<std::string> lines = wrap_text(text, face, BODY_SIZE, textWidth);

        double lineHeight = BODY_SIZE * LINE_SPACING;
        double rowHeight = CELL_PAD_V * 2 + lines.size() * lineHeight + SPACE_AFTER;
        double top = flow.take(rowHeight);

        double baseline = top - CELL_PAD_V - BODY_SIZE;
        for (size_t i = 0; i < lines.size(); ++i) {
            writer.drawText(TABLE_X + CELL_PAD_H, baseline - i * lineHeight, lines[i], face, BODY_SIZE);
        }

        if (!entry.isDirectory && entry.page) {
            std::string label = format_bates(*entry.page);
            double w = text_width(label, FontFace::Regular, BODY_SIZE);
            writer.drawText(pageColumnRight - w, baseline, label, FontFace::Regular, BODY_SIZE);
        }
    }

    return writer.pageCount();
}

fs::path PdfPageFormatter::renderCoverPage(const std::string& index, const std::string& displayName,
                                           const fs::path& output) {
    log_info("Creating cover page: " + output.filename().string());
    PdfPageWriter writer(PAGE_WIDTH, PAGE_HEIGHT);
    writer.setTitle(to_win_ansi(index + " - " + displayName));
    layoutCover(writer, index, displayName);
    if (!writer.write(output)) {
        throw RenderFailure("Cover page for " + index + " not written: " + writer.getLastError());
    }
    return output;
}

fs::path PdfPageFormatter::renderContentsPage(const std::vector<Item>& items, const BatesMap& bates,
                                              const fs::path& output) {
    log_info("Creating contents page: " + output.filename().string());
    PdfPageWriter writer(PAGE_WIDTH, PAGE_HEIGHT);
    writer.setTitle("Table of Contents");
    int pages = layoutContents(writer, build_contents_entries(items, bates));
    if (!writer.write(output)) {
        throw RenderFailure("Contents page not written: " + writer.getLastError());
    }
    log_debug("Contents layout: " + std::to_string(items.size()) + " row(s) on " + std::to_string(pages) + " page(s)");
    return output;
}

} // namespace DocBinder
