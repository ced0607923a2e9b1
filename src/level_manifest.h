#ifndef COLINSPECT_LEVEL_MANIFEST_H
#define COLINSPECT_LEVEL_MANIFEST_H

#include <string>
#include <vector>

#include "object_placement.h"

// =============================================================================
// Level Manifest
// =============================================================================
//
// Each level directory carries a level.cfg naming its collision files:
//
//   # Bob-omb Battlefield
//   id=bob
//   name=Bob-omb Battlefield
//   area.1.file=areas/1/collision.inc.c
//   area.1.name=Main
//   object.chain_chomp_gate.file=chain_chomp_gate/collision.inc.c
//   object.chain_chomp_gate.name=Chain Chomp Gate
//   object.chain_chomp_gate.model=BOB_CHAIN_CHOMP_GATE
//
// Areas and objects are listed in the order they first appear. The model key
// may repeat; its values are tried in order before the names derived from
// the level and object ids.
//
// =============================================================================

struct AreaEntry {
    int id = 0;
    std::string file;  // Relative to the level directory
    std::string name;
};

struct LevelManifest {
    std::string id;
    std::string name;
    std::vector<AreaEntry> areas;
    std::vector<ObjectDescriptor> objects;

    // nullptr if the manifest has no such area
    const AreaEntry* findArea(int areaId) const;
};

// Parse manifest text. Unknown keys and malformed lines are skipped.
// Returns false if the result has no id or no area.
bool parseLevelManifest(const std::string& text, LevelManifest& manifest);

// Read and parse a manifest file
bool loadLevelManifest(const std::string& path, LevelManifest& manifest);

#endif // COLINSPECT_LEVEL_MANIFEST_H
