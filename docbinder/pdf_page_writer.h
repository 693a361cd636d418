#ifndef DOCBINDER_PDF_PAGE_WRITER_H
#define DOCBINDER_PDF_PAGE_WRITER_H

#include <filesystem>
#include <string>
#include <vector>

#include "font_metrics.h"

namespace DocBinder {

// Minimal PDF generator for text pages: standard Helvetica faces with
// WinAnsiEncoding, grey rules, Flate compressed content streams.
// Coordinates are PDF points with the origin at the bottom-left corner.
class PdfPageWriter {
public:
    PdfPageWriter(double pageWidth = 612.0, double pageHeight = 792.0);

    void newPage();
    int pageCount() const { return static_cast<int>(pages_.size()); }

    // gray: 0 = black, 1 = white. Text is WinAnsi encoded.
    void drawText(double x, double y, const std::string& winAnsi, FontFace face, double size, double gray = 0.0);
    void drawLine(double x0, double y0, double x1, double y1, double gray, double lineWidth = 0.75);

    void setTitle(const std::string& title) { title_ = title; }

    // Starts a page if none was started; returns false on I/O error
    bool write(const std::filesystem::path& path);

    const std::string& getLastError() const { return lastError_; }

private:
    double width_;
    double height_;
    std::vector<std::string> pages_;   // uncompressed content streams
    std::string title_;
    std::string lastError_;

    std::string& current();
};

// PDF literal string body for a byte string: escapes ( ) \ and non-printables
std::string pdf_escape_string(const std::string& bytes);

} // namespace DocBinder

#endif // DOCBINDER_PDF_PAGE_WRITER_H
