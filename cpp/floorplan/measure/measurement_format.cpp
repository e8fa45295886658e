#include "floorplan/measure/measurement_format.h"
#include "floorplan/core/string_utils.h"

#include <cmath>
#include <cstdlib>
#include <limits>

namespace floorplan {

namespace {

const char* const kFractionGlyphs[8] = { "", "⅛", "¼", "⅜", "½", "⅝", "¾", "⅞" };

// Eighths for a vulgar-fraction code point, or -1.
int glyphEighths(std::uint32_t cp) {
    switch (cp) {
        case 0x215B: return 1; // ⅛
        case 0x00BC: return 2; // ¼
        case 0x215C: return 3; // ⅜
        case 0x00BD: return 4; // ½
        case 0x215D: return 5; // ⅝
        case 0x00BE: return 6; // ¾
        case 0x215E: return 7; // ⅞
        default: return -1;
    }
}

bool isFootMark(std::uint32_t cp) { return cp == '\'' || cp == 0x2019 || cp == 0x2032; }
bool isInchMark(std::uint32_t cp) { return cp == '"' || cp == 0x201D || cp == 0x2033; }

class Scanner {
public:
    explicit Scanner(std::string_view text) : text_(text) {}

    bool atEnd() const { return pos_ >= text_.size(); }
    std::size_t mark() const { return pos_; }
    void reset(std::size_t pos) { pos_ = pos; }

    std::uint32_t peek() const {
        std::uint32_t len = 0;
        return decodeUtf8Codepoint(text_, pos_, len);
    }

    void advance() {
        std::uint32_t len = 0;
        decodeUtf8Codepoint(text_, pos_, len);
        pos_ += len;
    }

    void skipSpaces() {
        while (!atEnd() && isAsciiSpace(peek())) advance();
    }

    // Up to nine digits; longer runs are rejected.
    bool readUInt(int& out) {
        int value = 0;
        int digits = 0;
        while (!atEnd() && isAsciiDigit(peek())) {
            if (digits == 9) return false;
            value = value * 10 + static_cast<int>(peek() - '0');
            ++digits;
            advance();
        }
        out = value;
        return digits > 0;
    }

private:
    std::string_view text_;
    std::size_t pos_{0};
};

// n/d with a non-zero denominator, as eighths.
bool readSlashFraction(Scanner& sc, int numerator, double& eighths) {
    if (sc.peek() != '/') return false;
    sc.advance();
    int denominator = 0;
    if (!sc.readUInt(denominator) || denominator == 0) return false;
    eighths = std::round(static_cast<double>(numerator) / denominator * 8.0);
    return true;
}

// Optional trailing fraction after whole inches: a glyph or n/d.
bool readTrailingFraction(Scanner& sc, double& eighths) {
    const std::size_t start = sc.mark();
    sc.skipSpaces();
    const int glyph = glyphEighths(sc.peek());
    if (glyph > 0) {
        sc.advance();
        eighths = glyph;
        return true;
    }
    int numerator = 0;
    if (sc.readUInt(numerator) && readSlashFraction(sc, numerator, eighths)) return true;
    sc.reset(start);
    eighths = 0.0;
    return false;
}

// Inches portion: glyph | n/d | w.f | w [fraction]
bool readInches(Scanner& sc, double& eighths) {
    const int glyph = glyphEighths(sc.peek());
    if (glyph > 0) {
        sc.advance();
        eighths = glyph;
        return true;
    }

    int whole = 0;
    if (!sc.readUInt(whole)) return false;

    if (sc.peek() == '/') return readSlashFraction(sc, whole, eighths);

    if (sc.peek() == '.') {
        sc.advance();
        double scale = 0.1;
        double frac = 0.0;
        int digits = 0;
        while (!sc.atEnd() && isAsciiDigit(sc.peek())) {
            frac += static_cast<double>(sc.peek() - '0') * scale;
            scale *= 0.1;
            ++digits;
            sc.advance();
        }
        if (digits == 0) return false;
        eighths = (whole + frac) * 8.0;
        return true;
    }

    double fraction = 0.0;
    readTrailingFraction(sc, fraction);
    eighths = whole * 8.0 + fraction;
    return true;
}

} // namespace

std::string formatEighths(int eighths) {
    // INT_MIN has no int magnitude.
    const long long value = eighths;
    const long long magnitude = value < 0 ? -value : value;

    const long long totalInches = magnitude / 8;
    const int remaining = static_cast<int>(magnitude % 8);
    const long long feet = totalInches / 12;
    const long long inches = totalInches % 12;

    std::string out = value < 0 ? "-" : "";
    if (feet > 0) {
        out += std::to_string(feet);
        out += '\'';
    }
    if (inches > 0 || remaining > 0 || feet == 0) {
        if (inches > 0 || remaining == 0) out += std::to_string(inches);
        out += kFractionGlyphs[remaining];
        out += '"';
    }
    return out;
}

std::optional<int> parseToEighths(std::string_view text) {
    Scanner sc(text);
    sc.skipSpaces();
    if (sc.atEnd()) return std::nullopt;

    double total = 0.0;
    bool haveFeet = false;

    const std::size_t start = sc.mark();
    int feet = 0;
    if (sc.readUInt(feet)) {
        sc.skipSpaces();
        if (isFootMark(sc.peek())) {
            sc.advance();
            sc.skipSpaces();
            total = feet * 96.0;
            haveFeet = true;
        }
    }
    if (!haveFeet) sc.reset(start);

    double inches = 0.0;
    const std::size_t inchesStart = sc.mark();
    const bool haveInches = readInches(sc, inches);
    if (!haveInches) {
        if (!haveFeet) return std::nullopt;
        sc.reset(inchesStart);
        inches = 0.0;
    }
    total += inches;

    sc.skipSpaces();
    if (isInchMark(sc.peek())) {
        if (!haveInches) return std::nullopt;
        sc.advance();
        sc.skipSpaces();
    }
    if (!sc.atEnd()) return std::nullopt;

    const double rounded = std::round(total);
    if (rounded > static_cast<double>(std::numeric_limits<int>::max())) return std::nullopt;
    return static_cast<int>(rounded);
}

int inchesToEighths(float inches) noexcept {
    return static_cast<int>(std::lround(static_cast<double>(inches) * 8.0));
}

float eighthsToInches(int eighths) noexcept {
    return static_cast<float>(eighths) / 8.0f;
}

} // namespace floorplan
