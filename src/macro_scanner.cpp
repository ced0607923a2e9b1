#include "macro_scanner.h"

#include <cctype>
#include <cstring>

bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

namespace {

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && isSpace(s[start])) start++;
    while (end > start && isSpace(s[end - 1])) end--;
    return s.substr(start, end - start);
}

} // namespace

MacroScanner::MacroScanner(const std::string& text)
    : text(text)
    , pos(0)
{}

void MacroScanner::skipWhitespace() {
    while (pos < text.size() && isSpace(text[pos])) {
        pos++;
    }
}

bool MacroScanner::seekMacro(const char* const* names, size_t nameCount,
                             bool allowSpaceBeforeParen, std::string* matchedName) {
    const size_t size = text.size();

    while (pos < size) {
        bool boundary = (pos == 0) || !isIdentifierChar(text[pos - 1]);
        if (!boundary || !isIdentifierStart(text[pos])) {
            pos++;
            continue;
        }

        size_t start = pos;
        while (pos < size && isIdentifierChar(text[pos])) {
            pos++;
        }
        size_t length = pos - start;

        for (size_t i = 0; i < nameCount; i++) {
            if (std::strlen(names[i]) != length || text.compare(start, length, names[i]) != 0) {
                continue;
            }

            size_t p = pos;
            if (allowSpaceBeforeParen) {
                while (p < size && isSpace(text[p])) p++;
            }
            if (p < size && text[p] == '(') {
                pos = p + 1;
                if (matchedName) {
                    *matchedName = names[i];
                }
                return true;
            }
            break;
        }
    }
    return false;
}

bool MacroScanner::seekMacro(const char* name, bool allowSpaceBeforeParen) {
    const char* names[] = { name };
    return seekMacro(names, 1, allowSpaceBeforeParen);
}

// =============================================================================
// Field readers
// =============================================================================

ScanStatus MacroScanner::readInteger(bool allowSign, int64_t& value) {
    skipWhitespace();
    const size_t size = text.size();
    size_t start = pos;

    bool negative = false;
    if (allowSign && pos < size && text[pos] == '-') {
        negative = true;
        pos++;
    }

    if (pos >= size || !isDigit(text[pos])) {
        pos = start;
        return ScanStatus::NO_MATCH;
    }

    // Magnitude limit: 2^63 for negatives, 2^63 - 1 otherwise
    const uint64_t limit = negative ? 9223372036854775808ULL : 9223372036854775807ULL;
    uint64_t magnitude = 0;
    bool overflow = false;

    while (pos < size && isDigit(text[pos])) {
        uint64_t digit = static_cast<uint64_t>(text[pos] - '0');
        if (magnitude > (limit - digit) / 10) {
            overflow = true;
        } else {
            magnitude = magnitude * 10 + digit;
        }
        pos++;
    }

    // "12abc", "0x1F" and "1.5" start like a number but are not decimal integers
    if (pos < size && (isIdentifierChar(text[pos]) || text[pos] == '.')) {
        while (pos < size && (isIdentifierChar(text[pos]) || text[pos] == '.')) {
            pos++;
        }
        return ScanStatus::MALFORMED;
    }

    if (overflow) {
        return ScanStatus::MALFORMED;
    }

    if (negative) {
        value = (magnitude == 9223372036854775808ULL)
            ? INT64_MIN
            : -static_cast<int64_t>(magnitude);
    } else {
        value = static_cast<int64_t>(magnitude);
    }
    return ScanStatus::MATCH;
}

ScanStatus MacroScanner::readSymbol(std::string& symbol) {
    size_t start = pos;
    size_t end = pos;
    while (end < text.size() && text[end] != ',' && text[end] != ')') {
        end++;
    }

    std::string trimmed = trim(text.substr(start, end - start));
    if (trimmed.empty()) {
        return ScanStatus::NO_MATCH;
    }

    symbol = trimmed;
    pos = end;
    return ScanStatus::MATCH;
}

ScanStatus MacroScanner::readIdentifier(std::string& identifier) {
    skipWhitespace();
    if (pos >= text.size() || !isIdentifierStart(text[pos])) {
        return ScanStatus::NO_MATCH;
    }

    size_t start = pos;
    while (pos < text.size() && isIdentifierChar(text[pos])) {
        pos++;
    }
    identifier = text.substr(start, pos - start);
    return ScanStatus::MATCH;
}

bool MacroScanner::expect(char c) {
    skipWhitespace();
    if (pos < text.size() && text[pos] == c) {
        pos++;
        return true;
    }
    return false;
}

bool MacroScanner::readBlockComment(std::string& contents) {
    size_t saved = pos;
    skipWhitespace();

    if (text.compare(pos, 2, "/*") != 0) {
        pos = saved;
        return false;
    }

    size_t close = text.find("*/", pos + 2);
    if (close == std::string::npos) {
        pos = saved;
        return false;
    }

    contents = trim(text.substr(pos + 2, close - pos - 2));
    pos = close + 2;
    return true;
}

bool MacroScanner::readLabel(std::string& label) {
    size_t saved = pos;

    std::string identifier;
    if (readIdentifier(identifier) != ScanStatus::MATCH) {
        pos = saved;
        return false;
    }

    skipWhitespace();
    if (pos >= text.size() || text[pos] != ':') {
        pos = saved;
        return false;
    }

    pos++;
    label = identifier;
    return true;
}

size_t MacroScanner::lineNumber() const {
    size_t line = 1;
    for (size_t i = 0; i < pos && i < text.size(); i++) {
        if (text[i] == '\n') {
            line++;
        }
    }
    return line;
}
