#include "pdf_page_writer.h"

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <zlib.h>

namespace DocBinder {

namespace fs = std::filesystem;

// First object numbers: 1 Catalog, 2 Pages, 3 Info, 4-6 fonts, then page/content pairs
static constexpr int FIRST_PAGE_OBJECT = 7;

static std::string num(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v;
    std::string s = ss.str();
    // Trim trailing zeros to keep content streams compact
    while (s.size() > 1 && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

static const char* font_resource(FontFace face) {
    switch (face) {
        case FontFace::Regular: return "/F1";
        case FontFace::Bold:    return "/F2";
        case FontFace::Italic:  return "/F3";
    }
    return "/F1";
}

std::string pdf_escape_string(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() + 8);
    for (unsigned char c : bytes) {
        if (c == '(' || c == ')' || c == '\\') {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c < 32 || c >= 127) {
            char buf[8];
            snprintf(buf, sizeof(buf), "\\%03o", c);
            out += buf;
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

// Compress data using zlib (for PDF streams); false leaves the data as is
static bool compress_zlib(const std::string& data, std::string& compressed) {
    uLongf compressed_size = compressBound(static_cast<uLong>(data.size()));
    std::vector<unsigned char> buffer(compressed_size);
    int result = compress(buffer.data(), &compressed_size,
                          reinterpret_cast<const Bytef*>(data.data()), static_cast<uLong>(data.size()));
    if (result != Z_OK) return false;
    compressed.assign(reinterpret_cast<const char*>(buffer.data()), compressed_size);
    return true;
}

// ============================================================================
// PdfPageWriter
// ============================================================================

PdfPageWriter::PdfPageWriter(double pageWidth, double pageHeight)
    : width_(pageWidth), height_(pageHeight) {}

void PdfPageWriter::newPage() {
    pages_.emplace_back();
}

std::string& PdfPageWriter::current() {
    if (pages_.empty()) newPage();
    return pages_.back();
}

void PdfPageWriter::drawText(double x, double y, const std::string& winAnsi, FontFace face, double size, double gray) {
    std::ostringstream ss;
    ss << "BT " << font_resource(face) << " " << num(size) << " Tf "
       << num(gray) << " g "
       << num(x) << " " << num(y) << " Td ("
       << pdf_escape_string(winAnsi) << ") Tj ET\n";
    current() += ss.str();
}

void PdfPageWriter::drawLine(double x0, double y0, double x1, double y1, double gray, double lineWidth) {
    std::ostringstream ss;
    ss << "q " << num(gray) << " G " << num(lineWidth) << " w "
       << num(x0) << " " << num(y0) << " m " << num(x1) << " " << num(y1) << " l S Q\n";
    current() += ss.str();
}

bool PdfPageWriter::write(const fs::path& path) {
    if (pages_.empty()) newPage();

    std::ofstream pdf(path, std::ios::binary | std::ios::trunc);
    if (!pdf) {
        lastError_ = "Cannot open " + path.string() + " for writing";
        return false;
    }

    pdf << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";

    std::vector<long> obj_offsets;

    obj_offsets.push_back(static_cast<long>(pdf.tellp()));
    pdf << "1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n";

    obj_offsets.push_back(static_cast<long>(pdf.tellp()));
    pdf << "2 0 obj\n<< /Type /Pages /Kids [";
    for (size_t i = 0; i < pages_.size(); ++i) {
        if (i > 0) pdf << " ";
        pdf << (FIRST_PAGE_OBJECT + 2 * i) << " 0 R";
    }
    pdf << "] /Count " << pages_.size() << " >>\nendobj\n";

    obj_offsets.push_back(static_cast<long>(pdf.tellp()));
    pdf << "3 0 obj\n<< /Producer (docbinder) /Creator (docbinder)";
    if (!title_.empty()) pdf << " /Title (" << pdf_escape_string(title_) << ")";
    pdf << " >>\nendobj\n";

    const FontFace faces[] = {FontFace::Regular, FontFace::Bold, FontFace::Italic};
    int font_obj = 4;
    for (FontFace face : faces) {
        obj_offsets.push_back(static_cast<long>(pdf.tellp()));
        pdf << font_obj++ << " 0 obj\n<< /Type /Font /Subtype /Type1 /BaseFont /"
            << font_base_name(face) << " /Encoding /WinAnsiEncoding >>\nendobj\n";
    }

    for (size_t i = 0; i < pages_.size(); ++i) {
        size_t page_obj = FIRST_PAGE_OBJECT + 2 * i;

        obj_offsets.push_back(static_cast<long>(pdf.tellp()));
        pdf << page_obj << " 0 obj\n<< /Type /Page /Parent 2 0 R /MediaBox [0 0 "
            << num(width_) << " " << num(height_) << "]\n"
            << "   /Contents " << (page_obj + 1) << " 0 R"
            << " /Resources << /Font << /F1 4 0 R /F2 5 0 R /F3 6 0 R >> >> >>\nendobj\n";

        std::string stream;
        bool compressed = compress_zlib(pages_[i], stream);
        if (!compressed) stream = pages_[i];

        obj_offsets.push_back(static_cast<long>(pdf.tellp()));
        pdf << (page_obj + 1) << " 0 obj\n<< /Length " << stream.size();
        if (compressed) pdf << " /Filter /FlateDecode";
        pdf << " >>\nstream\n";
        pdf.write(stream.data(), static_cast<std::streamsize>(stream.size()));
        pdf << "\nendstream\nendobj\n";
    }

    long xref_offset = static_cast<long>(pdf.tellp());
    pdf << "xref\n0 " << (obj_offsets.size() + 1) << "\n0000000000 65535 f \n";
    for (long offset : obj_offsets) {
        pdf << std::setfill('0') << std::setw(10) << offset << " 00000 n \n";
    }

    pdf << "trailer\n<< /Size " << (obj_offsets.size() + 1) << " /Root 1 0 R /Info 3 0 R >>\n";
    pdf << "startxref\n" << xref_offset << "\n%%EOF\n";

    pdf.close();
    if (!pdf) {
        lastError_ = "Write error on " + path.string();
        return false;
    }
    return true;
}

} // namespace DocBinder
