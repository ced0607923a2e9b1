#include "preprocessor.h"
#include "macro_scanner.h"

#include <cctype>
#include <vector>

namespace {

enum class DirectiveKind {
    NONE,    // Not a directive line
    IFDEF,
    IFNDEF,
    IF,
    ELIF,
    ELSE,
    ENDIF,
    OTHER    // #include, #define, #pragma, ...
};

struct Directive {
    DirectiveKind kind = DirectiveKind::NONE;
    std::string symbol;  // First identifier after the keyword (may be empty)
};

// One open #if-family block
struct ConditionalBlock {
    bool versionBlock;   // Keyed on VERSION_JP (otherwise transparent)
    bool parentActive;   // Lines were being kept when the block opened
    bool branchActive;   // Current branch applies to the selected variant
    bool seenElse;
    size_t openLine;
};

size_t skipBlanks(const std::string& line, size_t pos) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
        pos++;
    }
    return pos;
}

std::string readIdentifier(const std::string& line, size_t& pos) {
    size_t start = pos;
    while (pos < line.size() && isIdentifierChar(line[pos])) {
        pos++;
    }
    return line.substr(start, pos - start);
}

Directive classifyLine(const std::string& line) {
    Directive directive;

    size_t pos = skipBlanks(line, 0);
    if (pos >= line.size() || line[pos] != '#') {
        return directive;
    }

    pos = skipBlanks(line, pos + 1);
    std::string keyword = readIdentifier(line, pos);
    pos = skipBlanks(line, pos);
    directive.symbol = readIdentifier(line, pos);

    if (keyword == "ifdef") {
        directive.kind = DirectiveKind::IFDEF;
    } else if (keyword == "ifndef") {
        directive.kind = DirectiveKind::IFNDEF;
    } else if (keyword == "if") {
        directive.kind = DirectiveKind::IF;
    } else if (keyword == "elif") {
        directive.kind = DirectiveKind::ELIF;
    } else if (keyword == "else") {
        directive.kind = DirectiveKind::ELSE;
    } else if (keyword == "endif") {
        directive.kind = DirectiveKind::ENDIF;
    } else {
        directive.kind = DirectiveKind::OTHER;
    }
    return directive;
}

bool isVersionDirective(const Directive& directive) {
    return (directive.kind == DirectiveKind::IFDEF || directive.kind == DirectiveKind::IFNDEF)
        && directive.symbol == VERSION_SYMBOL;
}

// Split on '\n' keeping empty trailing segments ("a\n" -> "a", "")
std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

bool isActive(const std::vector<ConditionalBlock>& stack) {
    if (stack.empty()) {
        return true;
    }
    const ConditionalBlock& top = stack.back();
    return top.parentActive && top.branchActive;
}

} // namespace

bool parseVariant(const std::string& text, Variant& variant) {
    std::string upper;
    for (char c : text) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upper == "JP") {
        variant = Variant::JP;
        return true;
    }
    if (upper == "US") {
        variant = Variant::US;
        return true;
    }
    return false;
}

const char* variantName(Variant variant) {
    return variant == Variant::JP ? "JP" : "US";
}

const char* preprocessErrorName(PreprocessError error) {
    switch (error) {
        case PreprocessError::NONE:
            return "none";
        case PreprocessError::ELSE_WITHOUT_IF:
            return "#else without matching #if";
        case PreprocessError::ENDIF_WITHOUT_IF:
            return "#endif without matching #if";
        case PreprocessError::DUPLICATE_ELSE:
            return "duplicate #else in VERSION_JP block";
        case PreprocessError::ELIF_IN_VERSION_BLOCK:
            return "#elif inside VERSION_JP block";
        case PreprocessError::UNTERMINATED_BLOCK:
            return "unterminated conditional block";
    }
    return "unknown";
}

bool usesVersionDirectives(const std::string& text) {
    // Cheap rejection before splitting into lines
    if (text.find(VERSION_SYMBOL) == std::string::npos) {
        return false;
    }

    for (const std::string& line : splitLines(text)) {
        if (isVersionDirective(classifyLine(line))) {
            return true;
        }
    }
    return false;
}

bool preprocessSource(const std::string& text, Variant variant,
                      std::string& output, PreprocessResult& result) {
    result = PreprocessResult();
    output.clear();

    if (!usesVersionDirectives(text)) {
        output = text;
        return true;
    }

    const bool versionDefined = (variant == Variant::JP);

    std::vector<ConditionalBlock> stack;
    std::string filtered;
    bool firstKept = true;
    size_t lineNumber = 0;

    for (const std::string& line : splitLines(text)) {
        lineNumber++;
        Directive directive = classifyLine(line);

        switch (directive.kind) {
            case DirectiveKind::NONE:
                if (isActive(stack)) {
                    if (!firstKept) {
                        filtered += '\n';
                    }
                    filtered += line;
                    firstKept = false;
                }
                break;

            case DirectiveKind::IFDEF:
            case DirectiveKind::IFNDEF:
                if (directive.symbol == VERSION_SYMBOL) {
                    bool branch = (directive.kind == DirectiveKind::IFDEF) ? versionDefined : !versionDefined;
                    stack.push_back({true, isActive(stack), branch, false, lineNumber});
                } else {
                    stack.push_back({false, isActive(stack), true, false, lineNumber});
                }
                break;

            case DirectiveKind::IF:
                stack.push_back({false, isActive(stack), true, false, lineNumber});
                break;

            case DirectiveKind::ELIF:
                if (stack.empty()) {
                    result.error = PreprocessError::ELSE_WITHOUT_IF;
                    result.errorLine = lineNumber;
                    return false;
                }
                if (stack.back().versionBlock) {
                    result.error = PreprocessError::ELIF_IN_VERSION_BLOCK;
                    result.errorLine = lineNumber;
                    return false;
                }
                break;

            case DirectiveKind::ELSE:
                if (stack.empty()) {
                    result.error = PreprocessError::ELSE_WITHOUT_IF;
                    result.errorLine = lineNumber;
                    return false;
                }
                if (stack.back().versionBlock) {
                    if (stack.back().seenElse) {
                        result.error = PreprocessError::DUPLICATE_ELSE;
                        result.errorLine = lineNumber;
                        return false;
                    }
                    stack.back().branchActive = !stack.back().branchActive;
                }
                stack.back().seenElse = true;
                break;

            case DirectiveKind::ENDIF:
                if (stack.empty()) {
                    result.error = PreprocessError::ENDIF_WITHOUT_IF;
                    result.errorLine = lineNumber;
                    return false;
                }
                stack.pop_back();
                break;

            case DirectiveKind::OTHER:
                break;
        }
    }

    if (!stack.empty()) {
        result.error = PreprocessError::UNTERMINATED_BLOCK;
        result.errorLine = stack.back().openLine;
        return false;
    }

    output = filtered;
    return true;
}
