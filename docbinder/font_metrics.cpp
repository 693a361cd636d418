#include "font_metrics.h"

#include <cstdint>

namespace DocBinder {

// ============================================================================
// Standard 14 font widths, printable ASCII 32..126 (from the Adobe AFM files)
// ============================================================================

static const int HELVETICA_WIDTHS[95] = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,  // space../
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556,                                // 0..9
    278, 278, 584, 584, 584, 556, 1015,                                              // :..@
    667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833,                 // A..M
    722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,                 // N..Z
    278, 278, 278, 469, 556, 333,                                                    // [..`
    556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833,                 // a..m
    556, 556, 556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500,                 // n..z
    334, 260, 334, 584                                                               // {..~
};

static const int HELVETICA_BOLD_WIDTHS[95] = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556,
    333, 333, 584, 584, 584, 611, 975,
    722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833,
    722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,
    333, 278, 333, 584, 556, 333,
    556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889,
    611, 611, 611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500,
    389, 280, 389, 584
};

const char* font_base_name(FontFace face) {
    switch (face) {
        case FontFace::Regular: return "Helvetica";
        case FontFace::Bold:    return "Helvetica-Bold";
        case FontFace::Italic:  return "Helvetica-Oblique";
    }
    return "Helvetica";
}

int glyph_width(FontFace face, unsigned char c) {
    if (c >= 32 && c <= 126) {
        // Oblique shares the upright metrics
        return face == FontFace::Bold ? HELVETICA_BOLD_WIDTHS[c - 32] : HELVETICA_WIDTHS[c - 32];
    }
    if (c == 0xA0) return 278;
    return 556;
}

double text_width(const std::string& winAnsi, FontFace face, double size) {
    long total = 0;
    for (unsigned char c : winAnsi) total += glyph_width(face, c);
    return total * size / 1000.0;
}

// ============================================================================
// UTF-8 -> WinAnsi
// ============================================================================

static char cp1252_from_codepoint(uint32_t cp) {
    if (cp < 0x20) return '?';
    if (cp < 0x80) return static_cast<char>(cp);
    if (cp >= 0xA0 && cp <= 0xFF) return static_cast<char>(cp);
    switch (cp) {
        case 0x20AC: return '\x80';
        case 0x201A: return '\x82';
        case 0x0192: return '\x83';
        case 0x201E: return '\x84';
        case 0x2026: return '\x85';
        case 0x2020: return '\x86';
        case 0x2021: return '\x87';
        case 0x02C6: return '\x88';
        case 0x2030: return '\x89';
        case 0x0160: return '\x8A';
        case 0x2039: return '\x8B';
        case 0x0152: return '\x8C';
        case 0x017D: return '\x8E';
        case 0x2018: return '\x91';
        case 0x2019: return '\x92';
        case 0x201C: return '\x93';
        case 0x201D: return '\x94';
        case 0x2022: return '\x95';
        case 0x2013: return '\x96';
        case 0x2014: return '\x97';
        case 0x02DC: return '\x98';
        case 0x2122: return '\x99';
        case 0x0161: return '\x9A';
        case 0x203A: return '\x9B';
        case 0x0153: return '\x9C';
        case 0x017E: return '\x9E';
        case 0x0178: return '\x9F';
        default:     return '?';
    }
}

std::string to_win_ansi(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.size()) {
        unsigned char c = static_cast<unsigned char>(utf8[i]);
        uint32_t cp = 0;
        size_t len = 0;
        if (c < 0x80) {
            cp = c; len = 1;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F; len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F; len = 3;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07; len = 4;
        } else {
            out += '?';
            ++i;
            continue;
        }
        if (i + len > utf8.size()) {
            out += '?';
            break;
        }
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(utf8[i + k]);
            if ((cc & 0xC0) != 0x80) { valid = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            out += '?';
            ++i;
            continue;
        }
        out += cp1252_from_codepoint(cp);
        i += len;
    }
    return out;
}

// ============================================================================
// Word wrap
// ============================================================================

std::vector<std::string> wrap_text(const std::string& winAnsi, FontFace face, double size, double maxWidth) {
    std::vector<std::string> lines;

    size_t leading = winAnsi.find_first_not_of(' ');
    if (leading == std::string::npos) {
        lines.push_back(winAnsi);
        return lines;
    }
    if (text_width(winAnsi, face, size) <= maxWidth) {
        lines.push_back(winAnsi);
        return lines;
    }

    std::string indent = winAnsi.substr(0, leading);
    std::vector<std::string> words;
    std::string word;
    for (size_t i = leading; i < winAnsi.size(); ++i) {
        if (winAnsi[i] == ' ') {
            if (!word.empty()) words.push_back(word);
            word.clear();
        } else {
            word += winAnsi[i];
        }
    }
    if (!word.empty()) words.push_back(word);

    std::string current = indent;
    bool has_word = false;
    for (const auto& w : words) {
        std::string candidate = has_word ? current + " " + w : current + w;
        if (text_width(candidate, face, size) <= maxWidth) {
            current = candidate;
            has_word = true;
            continue;
        }
        if (has_word) {
            lines.push_back(current);
            current.clear();
        }
        current += w;
        has_word = true;

        // A single word wider than the line is split by character
        while (text_width(current, face, size) > maxWidth && current.size() > 1) {
            size_t fit = 1;
            while (fit < current.size() && text_width(current.substr(0, fit + 1), face, size) <= maxWidth) {
                ++fit;
            }
            lines.push_back(current.substr(0, fit));
            current = current.substr(fit);
        }
    }
    if (has_word) lines.push_back(current);
    return lines;
}

} // namespace DocBinder
