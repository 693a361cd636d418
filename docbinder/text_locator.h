#ifndef DOCBINDER_TEXT_LOCATOR_H
#define DOCBINDER_TEXT_LOCATOR_H

#include <string>
#include <vector>

#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include "font_metrics.h"

namespace DocBinder {

// Axis aligned box in default user space
struct TextRect {
    double x0 = 0, y0 = 0, x1 = 0, y1 = 0;
};

// One occurrence of the searched text; one rect per shown line it spans
struct TextMatch {
    std::vector<TextRect> rects;
};

// Finds literal text in a page's content stream.
//
// Glyph boxes come from the Helvetica metrics, which is exact for the pages
// this program generates and approximate for anything else. Only simple
// single-byte fonts are understood. Separate text-showing operators are
// joined by a soft break so text wrapped over several lines still matches;
// a match must start and end on a word boundary.
class TextLocator : public QPDFObjectHandle::ParserCallbacks {
public:
    explicit TextLocator(QPDFPageObjectHelper page);

    void handleObject(QPDFObjectHandle obj) override;
    void handleEOF() override;

    // Every occurrence of utf8 (matched after conversion to WinAnsi)
    std::vector<TextMatch> find(const std::string& utf8) const;

    // Parses the page and searches it
    static std::vector<TextMatch> search(QPDFPageObjectHelper page, const std::string& utf8);

private:
    struct Matrix {
        double a = 1, b = 0, c = 0, d = 1, e = 0, f = 0;
    };

    struct GraphicsState {
        Matrix ctm;
        FontFace face = FontFace::Regular;
        double fontSize = 0;
        double charSpacing = 0;
        double wordSpacing = 0;
        double horizScale = 1;
        double leading = 0;
        double rise = 0;
    };

    struct Glyph {
        char c;
        TextRect box;
        int run;        // text-showing operator it came from, -1 for a break
    };

    QPDFObjectHandle fonts_;
    std::vector<QPDFObjectHandle> operands_;
    std::vector<GraphicsState> stack_;
    GraphicsState gs_;
    Matrix tm_;
    Matrix tlm_;
    int runs_ = 0;
    std::vector<Glyph> glyphs_;

    static Matrix multiply(const Matrix& m1, const Matrix& m2);
    static Matrix translation(double tx, double ty);

    void handleOperator(const std::string& op);
    void nextLine(double tx, double ty);
    void showText(const std::string& bytes, int run);
    void addBreak();
    FontFace resolveFace(const std::string& fontName) const;
    double operand(size_t i) const;
};

} // namespace DocBinder

#endif // DOCBINDER_TEXT_LOCATOR_H
