#ifndef COLINSPECT_MACRO_SCANNER_H
#define COLINSPECT_MACRO_SCANNER_H

#include <cstddef>
#include <cstdint>
#include <string>

// =============================================================================
// Macro Scanner
// =============================================================================
//
// A forward-only cursor over C-like source text that recognises macro
// invocations such as
//
//   COL_VERTEX(-1024, 512, 0x10)
//   OBJECT(/*model*/ MODEL_NONE, /*pos*/ 0, 0, 0, ...)
//
// and reads their arguments one at a time. This is not a C parser: it only
// understands identifiers, decimal integers, symbols, block comments and
// punctuation, which is all the collision grammar needs.
//
// =============================================================================

// Outcome of reading one field or one statement
enum class ScanStatus {
    MATCH,      // Field read successfully
    NO_MATCH,   // Text is not this kind of field (statement is not a match)
    MALFORMED   // Looks like a number but is not a valid decimal integer
};

class MacroScanner {
public:
    explicit MacroScanner(const std::string& text);

    // Advance to the next invocation of one of the given macro names.
    // The name must be a whole identifier followed by '(' (optional
    // whitespace in between if allowSpaceBeforeParen). On success the cursor
    // is just after '(' and matchedName (if given) holds the name.
    bool seekMacro(const char* const* names, size_t nameCount,
                   bool allowSpaceBeforeParen, std::string* matchedName = nullptr);

    // Convenience for a single macro name
    bool seekMacro(const char* name, bool allowSpaceBeforeParen);

    // Read a decimal integer, optionally signed with '-'
    ScanStatus readInteger(bool allowSign, int64_t& value);

    // Read everything up to the next ',' or ')' (trimmed, must be non-empty)
    ScanStatus readSymbol(std::string& symbol);

    // Read an identifier (letters, digits, underscores)
    ScanStatus readIdentifier(std::string& identifier);

    // Consume a punctuation character after optional whitespace
    bool expect(char c);

    // Consume a /* ... */ comment after optional whitespace, returning its
    // trimmed contents. Returns false (cursor unchanged) if none.
    bool readBlockComment(std::string& contents);

    // Consume a "label:" prefix after optional whitespace.
    // Returns false (cursor unchanged) if the next token is not a label.
    bool readLabel(std::string& label);

    void skipWhitespace();
    bool atEnd() const { return pos >= text.size(); }
    size_t position() const { return pos; }

    // 1-based line number of the current position
    size_t lineNumber() const;

private:
    const std::string& text;
    size_t pos;
};

bool isIdentifierStart(char c);
bool isIdentifierChar(char c);

#endif // COLINSPECT_MACRO_SCANNER_H
