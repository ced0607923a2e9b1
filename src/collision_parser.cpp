#include "collision_parser.h"
#include "log.h"
#include "macro_scanner.h"
#include "numeric_replica.h"

#include <cstdint>
#include <sstream>

namespace {

// Read "a, b, c)" into values
// MALFORMED wins over NO_MATCH so that a bad number is always reported
ScanStatus readIntegerArguments(MacroScanner& scanner, bool allowSign, int64_t* values, int count) {
    for (int i = 0; i < count; i++) {
        if (i > 0 && !scanner.expect(',')) {
            return ScanStatus::NO_MATCH;
        }
        ScanStatus status = scanner.readInteger(allowSign, values[i]);
        if (status != ScanStatus::MATCH) {
            return status;
        }
    }
    return scanner.expect(')') ? ScanStatus::MATCH : ScanStatus::NO_MATCH;
}

bool toIndex(int64_t value, uint32_t& index) {
    if (value < 0 || value > static_cast<int64_t>(UINT32_MAX)) {
        return false;
    }
    index = static_cast<uint32_t>(value);
    return true;
}

void parseVertices(const std::string& text, CollisionSet& set, ParseReport& report) {
    MacroScanner scanner(text);

    while (scanner.seekMacro(CollisionMacros::VERTEX, false)) {
        int64_t coords[3] = {0, 0, 0};
        ScanStatus status = readIntegerArguments(scanner, true, coords, 3);

        if (status == ScanStatus::MALFORMED) {
            report.malformedStatements++;
            SDL_LogWarn(LogCategory::PARSER, "Malformed number in %s on line %zu, statement dropped",
                        CollisionMacros::VERTEX, scanner.lineNumber());
            continue;
        }
        if (status == ScanStatus::NO_MATCH) {
            continue;
        }

        // Coordinates are read as native 32-bit integers
        set.addVertex({
            truncateToInt32(coords[0]),
            truncateToInt32(coords[1]),
            truncateToInt32(coords[2])
        });
        report.vertexStatements++;
    }
}

void parseTriangles(const std::string& text, CollisionSet& set, ParseReport& report) {
    static const char* const statementNames[] = {
        CollisionMacros::TRI_INIT,
        CollisionMacros::TRI
    };

    std::string currentSurface = DEFAULT_SURFACE_TYPE;
    std::istringstream stream(text);
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(stream, line)) {
        lineNumber++;

        MacroScanner scanner(line);
        std::string macro;

        while (scanner.seekMacro(statementNames, 2, false, &macro)) {
            if (macro == CollisionMacros::TRI_INIT) {
                // COL_TRI_INIT(SYMBOL, count)
                std::string symbol;
                int64_t count = 0;
                if (scanner.readSymbol(symbol) != ScanStatus::MATCH || !scanner.expect(',')) {
                    continue;
                }
                ScanStatus status = scanner.readInteger(false, count);
                if (status == ScanStatus::MALFORMED) {
                    report.malformedStatements++;
                    SDL_LogWarn(LogCategory::PARSER, "Malformed number in %s on line %zu, statement dropped",
                                CollisionMacros::TRI_INIT, lineNumber);
                    continue;
                }
                if (status == ScanStatus::NO_MATCH || !scanner.expect(')')) {
                    continue;
                }

                currentSurface = symbol;
                report.surfaceMarkers++;
                continue;
            }

            // COL_TRI(a, b, c)
            int64_t indices[3] = {0, 0, 0};
            ScanStatus status = readIntegerArguments(scanner, false, indices, 3);
            if (status == ScanStatus::MALFORMED) {
                report.malformedStatements++;
                SDL_LogWarn(LogCategory::PARSER, "Malformed number in %s on line %zu, statement dropped",
                            CollisionMacros::TRI, lineNumber);
                continue;
            }
            if (status == ScanStatus::NO_MATCH) {
                continue;
            }

            report.triangleStatements++;

            Triangle triangle;
            triangle.surfaceType = currentSurface;
            bool accepted = toIndex(indices[0], triangle.vertex0)
                         && toIndex(indices[1], triangle.vertex1)
                         && toIndex(indices[2], triangle.vertex2)
                         && set.addTriangle(triangle);

            if (!accepted) {
                report.droppedTriangles++;
                SDL_LogDebug(LogCategory::PARSER,
                             "Line %zu: triangle (%lld, %lld, %lld) out of range for %zu vertices, dropped",
                             lineNumber,
                             static_cast<long long>(indices[0]),
                             static_cast<long long>(indices[1]),
                             static_cast<long long>(indices[2]),
                             set.vertexCount());
            }
        }
    }
}

} // namespace

const char* parseErrorName(ParseError error) {
    switch (error) {
        case ParseError::NONE:
            return "none";
        case ParseError::PREPROCESS_FAILED:
            return "preprocessing failed";
        case ParseError::EMPTY_RESULT:
            return "no triangles recovered";
    }
    return "unknown";
}

bool parseCollision(const std::string& text, CollisionSet& set, ParseReport& report) {
    set.clear();
    report = ParseReport();

    // Every vertex must be known before triangles are range-checked
    parseVertices(text, set, report);
    parseTriangles(text, set, report);

    SDL_LogDebug(LogCategory::PARSER,
                 "Parsed %zu vertices, %zu/%zu triangles (%zu dropped, %zu malformed statements)",
                 set.vertexCount(), set.triangleCount(), report.triangleStatements,
                 report.droppedTriangles, report.malformedStatements);

    if (set.triangleCount() == 0) {
        report.error = ParseError::EMPTY_RESULT;
        SDL_LogError(LogCategory::PARSER, "No triangles recovered (%zu vertices, %zu triangle statements)",
                     set.vertexCount(), report.triangleStatements);
        return false;
    }
    return true;
}

bool parseCollisionSource(const std::string& text, Variant variant,
                          CollisionSet& set, ParseReport& report) {
    std::string resolved;
    PreprocessResult preprocess;

    if (!preprocessSource(text, variant, resolved, preprocess)) {
        set.clear();
        report = ParseReport();
        report.error = ParseError::PREPROCESS_FAILED;
        report.preprocess = preprocess;
        SDL_LogError(LogCategory::PARSER, "Preprocessing failed on line %zu: %s",
                     preprocess.errorLine, preprocessErrorName(preprocess.error));
        return false;
    }

    return parseCollision(resolved, set, report);
}
