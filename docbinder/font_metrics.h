#ifndef DOCBINDER_FONT_METRICS_H
#define DOCBINDER_FONT_METRICS_H

#include <string>
#include <vector>

namespace DocBinder {

// The standard Type 1 faces used on generated pages
enum class FontFace {
    Regular,     // Helvetica
    Bold,        // Helvetica-Bold
    Italic       // Helvetica-Oblique
};

const char* font_base_name(FontFace face);

// Advance width of a WinAnsi byte in 1/1000 em
int glyph_width(FontFace face, unsigned char c);

// Width in points of a WinAnsi encoded string
double text_width(const std::string& winAnsi, FontFace face, double size);

// UTF-8 to WinAnsi (CP1252); characters outside it become '?'
std::string to_win_ansi(const std::string& utf8);

// Greedy word wrap of a WinAnsi string. Leading spaces stay on the first
// line, words longer than the width are broken by character.
std::vector<std::string> wrap_text(const std::string& winAnsi, FontFace face, double size, double maxWidth);

} // namespace DocBinder

#endif // DOCBINDER_FONT_METRICS_H
