#include "text_locator.h"

#include <algorithm>

namespace DocBinder {

// Glyph box above and below the baseline, in units of the font size
static constexpr double GLYPH_ASCENT = 0.85;
static constexpr double GLYPH_DESCENT = 0.25;

TextLocator::TextLocator(QPDFPageObjectHelper page) {
    QPDFObjectHandle resources = page.getAttribute("/Resources", false);
    if (resources.isDictionary()) {
        QPDFObjectHandle fonts = resources.getKey("/Font");
        if (fonts.isDictionary()) fonts_ = fonts;
    }
}

std::vector<TextMatch> TextLocator::search(QPDFPageObjectHelper page, const std::string& utf8) {
    TextLocator locator(page);
    page.parseContents(&locator);
    return locator.find(utf8);
}

// ============================================================================
// Content stream callbacks
// ============================================================================

void TextLocator::handleObject(QPDFObjectHandle obj) {
    if (obj.isOperator()) {
        handleOperator(obj.getOperatorValue());
        operands_.clear();
    } else {
        operands_.push_back(obj);
    }
}

void TextLocator::handleEOF() {
    operands_.clear();
}

double TextLocator::operand(size_t i) const {
    if (i >= operands_.size() || !operands_[i].isNumber()) return 0.0;
    return operands_[i].getNumericValue();
}

void TextLocator::handleOperator(const std::string& op) {
    const size_t n = operands_.size();

    if (op == "q") {
        stack_.push_back(gs_);
    } else if (op == "Q") {
        if (!stack_.empty()) {
            gs_ = stack_.back();
            stack_.pop_back();
        }
    } else if (op == "cm" && n >= 6) {
        Matrix m{operand(0), operand(1), operand(2), operand(3), operand(4), operand(5)};
        gs_.ctm = multiply(m, gs_.ctm);
    } else if (op == "BT") {
        tm_ = Matrix();
        tlm_ = Matrix();
    } else if (op == "Tf" && n >= 2) {
        if (operands_[0].isName()) gs_.face = resolveFace(operands_[0].getName());
        gs_.fontSize = operand(1);
    } else if (op == "Tc" && n >= 1) {
        gs_.charSpacing = operand(0);
    } else if (op == "Tw" && n >= 1) {
        gs_.wordSpacing = operand(0);
    } else if (op == "Tz" && n >= 1) {
        gs_.horizScale = operand(0) / 100.0;
    } else if (op == "TL" && n >= 1) {
        gs_.leading = operand(0);
    } else if (op == "Ts" && n >= 1) {
        gs_.rise = operand(0);
    } else if (op == "Td" && n >= 2) {
        nextLine(operand(0), operand(1));
    } else if (op == "TD" && n >= 2) {
        gs_.leading = -operand(1);
        nextLine(operand(0), operand(1));
    } else if (op == "Tm" && n >= 6) {
        tlm_ = Matrix{operand(0), operand(1), operand(2), operand(3), operand(4), operand(5)};
        tm_ = tlm_;
    } else if (op == "T*") {
        nextLine(0, -gs_.leading);
    } else if (op == "Tj" && n >= 1) {
        if (operands_[0].isString()) showText(operands_[0].getStringValue(), runs_++);
    } else if (op == "'" && n >= 1) {
        nextLine(0, -gs_.leading);
        if (operands_[0].isString()) showText(operands_[0].getStringValue(), runs_++);
    } else if (op == "\"" && n >= 3) {
        gs_.wordSpacing = operand(0);
        gs_.charSpacing = operand(1);
        nextLine(0, -gs_.leading);
        if (operands_[2].isString()) showText(operands_[2].getStringValue(), runs_++);
    } else if (op == "TJ" && n >= 1 && operands_[0].isArray()) {
        int run = runs_++;
        for (const auto& part : operands_[0].getArrayAsVector()) {
            if (part.isString()) {
                showText(part.getStringValue(), run);
            } else if (part.isNumber()) {
                double tx = -part.getNumericValue() / 1000.0 * gs_.fontSize * gs_.horizScale;
                tm_ = multiply(translation(tx, 0), tm_);
            }
        }
    }
}

void TextLocator::nextLine(double tx, double ty) {
    tlm_ = multiply(translation(tx, ty), tlm_);
    tm_ = tlm_;
}

void TextLocator::addBreak() {
    if (glyphs_.empty() || glyphs_.back().run == -1) return;
    glyphs_.push_back(Glyph{' ', TextRect(), -1});
}

void TextLocator::showText(const std::string& bytes, int run) {
    if (!glyphs_.empty() && glyphs_.back().run != run) addBreak();

    const double size = gs_.fontSize;
    for (unsigned char ch : bytes) {
        double advance = glyph_width(gs_.face, ch) / 1000.0 * size + gs_.charSpacing;
        if (ch == ' ') advance += gs_.wordSpacing;
        advance *= gs_.horizScale;

        // Box corners in text space, then through Tm and the CTM
        Matrix trm = multiply(tm_, gs_.ctm);
        double xs[2] = {0.0, advance};
        double ys[2] = {gs_.rise - GLYPH_DESCENT * size, gs_.rise + GLYPH_ASCENT * size};
        TextRect box;
        bool first = true;
        for (double x : xs) {
            for (double y : ys) {
                double ux = trm.a * x + trm.c * y + trm.e;
                double uy = trm.b * x + trm.d * y + trm.f;
                if (first) {
                    box.x0 = box.x1 = ux;
                    box.y0 = box.y1 = uy;
                    first = false;
                } else {
                    box.x0 = std::min(box.x0, ux);
                    box.x1 = std::max(box.x1, ux);
                    box.y0 = std::min(box.y0, uy);
                    box.y1 = std::max(box.y1, uy);
                }
            }
        }
        glyphs_.push_back(Glyph{static_cast<char>(ch), box, run});

        tm_ = multiply(translation(advance, 0), tm_);
    }
}

FontFace TextLocator::resolveFace(const std::string& fontName) const {
    if (!fonts_.isDictionary() || !fonts_.hasKey(fontName)) return FontFace::Regular;
    QPDFObjectHandle font = fonts_.getKey(fontName);
    if (!font.isDictionary()) return FontFace::Regular;
    QPDFObjectHandle base = font.getKey("/BaseFont");
    if (!base.isName()) return FontFace::Regular;

    std::string name = base.getName();
    if (name.find("Bold") != std::string::npos) return FontFace::Bold;
    if (name.find("Oblique") != std::string::npos || name.find("Italic") != std::string::npos) {
        return FontFace::Italic;
    }
    return FontFace::Regular;
}

TextLocator::Matrix TextLocator::multiply(const Matrix& m1, const Matrix& m2) {
    Matrix r;
    r.a = m1.a * m2.a + m1.b * m2.c;
    r.b = m1.a * m2.b + m1.b * m2.d;
    r.c = m1.c * m2.a + m1.d * m2.c;
    r.d = m1.c * m2.b + m1.d * m2.d;
    r.e = m1.e * m2.a + m1.f * m2.c + m2.e;
    r.f = m1.e * m2.b + m1.f * m2.d + m2.f;
    return r;
}

TextLocator::Matrix TextLocator::translation(double tx, double ty) {
    Matrix m;
    m.e = tx;
    m.f = ty;
    return m;
}

// ============================================================================
// Search
// ============================================================================

std::vector<TextMatch> TextLocator::find(const std::string& utf8) const {
    std::vector<TextMatch> matches;

    // Needle: trimmed, inner space runs collapsed
    std::string needle;
    for (char ch : to_win_ansi(utf8)) {
        if (ch == ' ' && (needle.empty() || needle.back() == ' ')) continue;
        needle += ch;
    }
    while (!needle.empty() && needle.back() == ' ') needle.pop_back();
    if (needle.empty()) return matches;

    // Page text with space runs collapsed; keeps the first glyph of a run
    std::vector<const Glyph*> text;
    for (const auto& g : glyphs_) {
        if (g.c == ' ' && !text.empty() && text.back()->c == ' ') continue;
        text.push_back(&g);
    }

    for (size_t start = 0; start < text.size(); ++start) {
        if (text[start]->c != needle[0]) continue;
        if (start > 0 && text[start - 1]->c != ' ') continue;

        // A soft break may stand where the needle has no space
        size_t i = start;
        size_t j = 0;
        while (j < needle.size() && i < text.size()) {
            if (text[i]->c == needle[j]) {
                ++i;
                ++j;
            } else if (text[i]->run == -1) {
                ++i;
            } else {
                break;
            }
        }
        if (j < needle.size()) continue;
        if (i < text.size() && text[i]->c != ' ') continue;

        TextMatch match;
        int currentRun = -1;
        for (size_t k = start; k < i; ++k) {
            const Glyph& g = *text[k];
            if (g.run == -1) continue;
            if (g.run != currentRun) {
                match.rects.push_back(g.box);
                currentRun = g.run;
                continue;
            }
            TextRect& r = match.rects.back();
            r.x0 = std::min(r.x0, g.box.x0);
            r.y0 = std::min(r.y0, g.box.y0);
            r.x1 = std::max(r.x1, g.box.x1);
            r.y1 = std::max(r.y1, g.box.y1);
        }
        matches.push_back(match);
    }
    return matches;
}

} // namespace DocBinder
