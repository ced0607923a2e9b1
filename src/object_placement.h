#ifndef COLINSPECT_OBJECT_PLACEMENT_H
#define COLINSPECT_OBJECT_PLACEMENT_H

#include <map>
#include <string>
#include <vector>

#include "collision_types.h"
#include "math3d.h"

// =============================================================================
// Object Placement
// =============================================================================
//
// Level scripts place object models with statements such as
//
//   OBJECT(/*model*/ MODEL_BOB_CHAIN_CHOMP_GATE, /*pos*/ 1456, 768, 446,
//          /*angle*/ 0, 326, 0, /*behParam*/ 0x00000000, /*beh*/ bhvChainChompGate),
//   OBJECT_WITH_ACTS(model: MODEL_STAR, pos: 0, 500, 0, angle: 0, 0, 0, ...)
//
// Each statement is expected on a single line. The model, position and angle
// fields are read in that order; anything after the angle is ignored. Field
// labels may be written as /*comments*/, as "label:" prefixes, or left out.
//
// An object descriptor names the model symbols that may place it. They are
// tried in priority order and the first one with at least one placement
// wins. No match means the object is not present in this configuration,
// which is not an error.
//
// =============================================================================

namespace PlacementMacros {
    constexpr const char* OBJECT = "OBJECT";
    constexpr const char* OBJECT_WITH_ACTS = "OBJECT_WITH_ACTS";
    constexpr const char* MODEL_PREFIX = "MODEL_";
}

// Model symbol (without MODEL_) -> placements in script order
typedef std::map<std::string, std::vector<ObjectPlacement>> PlacementTable;

// What the level manifest knows about one collision object
struct ObjectDescriptor {
    std::string id;                       // e.g. "chain_chomp_gate"
    std::string name;                     // Display name
    std::string collisionFile;            // Relative to the level directory
    int area = 0;                         // 0 = present in every area
    std::vector<std::string> modelNames;  // Explicit script model symbols, priority order
};

// Scan a level script for OBJECT / OBJECT_WITH_ACTS statements
PlacementTable parseObjectPlacements(const std::string& scriptText);

// Candidate model symbols for a descriptor, in priority order:
// explicit names, then LEVEL_ID, LEVEL_GEOMETRY_ID and ID (upper case)
std::vector<std::string> candidateModelNames(const ObjectDescriptor& descriptor,
                                             const std::string& levelId);

// First non-empty placement list among the candidates, or an empty list
std::vector<ObjectPlacement> resolvePlacements(const PlacementTable& table,
                                               const std::vector<std::string>& candidates);

// Convenience: candidateModelNames + resolvePlacements, logging when unresolved
std::vector<ObjectPlacement> findObjectPlacements(const PlacementTable& table,
                                                  const ObjectDescriptor& descriptor,
                                                  const std::string& levelId);

// =============================================================================
// World transform
// =============================================================================
//
// Object collision is authored in object-local coordinates. A placed vertex
// is rotated by the placement's Euler angles (degrees, intrinsic X then Y
// then Z) and then translated by the placement position.
//
// =============================================================================

Mat3x3 placementRotation(const ObjectPlacement& placement);

Vec3 placeVertex(const ObjectPlacement& placement, const Vertex& local);

// All vertices of a local set, in order, moved into the world
std::vector<Vec3> placeVertices(const ObjectPlacement& placement, const std::vector<Vertex>& local);

#endif // COLINSPECT_OBJECT_PLACEMENT_H
