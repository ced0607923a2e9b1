#ifndef COLINSPECT_PREPROCESSOR_H
#define COLINSPECT_PREPROCESSOR_H

#include <cstddef>
#include <string>

// =============================================================================
// Source Text Preprocessor
// =============================================================================
//
// Collision and script sources can contain regional build branches:
//
//   #ifdef VERSION_JP          #ifndef VERSION_JP
//   ...                        ...
//   #else                      #endif
//   ...
//   #endif
//
// The preprocessor keeps the lines that apply to one build variant and drops
// every directive line. Blocks are tracked on a stack, so a VERSION_JP block
// nested inside another is resolved correctly. Conditionals on any other
// symbol are not evaluated: both of their branches are kept (subject to the
// enclosing VERSION_JP blocks), but their #else/#endif still pair with them.
//
// Input that never mentions "#ifdef VERSION_JP" or "#ifndef VERSION_JP" is
// returned unchanged.
//
// =============================================================================

// Build variant. VARIANT A (JP) defines VERSION_JP, variant B (US) does not.
enum class Variant {
    JP,
    US
};

constexpr const char* VERSION_SYMBOL = "VERSION_JP";

// Parse "JP"/"US" (case-insensitive). Returns false if unrecognised.
bool parseVariant(const std::string& text, Variant& variant);

// "JP" or "US"
const char* variantName(Variant variant);

// Directive nesting errors. Any of these rejects the whole input.
enum class PreprocessError {
    NONE,
    ELSE_WITHOUT_IF,        // #else with no open block
    ENDIF_WITHOUT_IF,       // More #endif than openers
    DUPLICATE_ELSE,         // Second #else in a VERSION_JP block
    ELIF_IN_VERSION_BLOCK,  // #elif cannot be resolved against VERSION_JP
    UNTERMINATED_BLOCK      // Input ended inside a block
};

const char* preprocessErrorName(PreprocessError error);

struct PreprocessResult {
    PreprocessError error = PreprocessError::NONE;
    size_t errorLine = 0;  // 1-based line of the offending directive (0 if none)
};

// True if the text uses the VERSION_JP directive vocabulary at all
bool usesVersionDirectives(const std::string& text);

// Filter text for one variant
// Returns true on success and fills output; on failure output is left empty
bool preprocessSource(const std::string& text, Variant variant,
                      std::string& output, PreprocessResult& result);

#endif // COLINSPECT_PREPROCESSOR_H
