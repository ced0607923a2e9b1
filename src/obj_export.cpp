#include "obj_export.h"
#include "log.h"

#include <fstream>

void writeObj(const CollisionSet& set, std::ostream& out) {
    out << "# Collision mesh export\n";
    out << "# " << set.vertexCount() << " vertices, " << set.triangleCount() << " triangles\n\n";

    for (const Vertex& v : set.vertices()) {
        out << "v " << v.x << " " << v.y << " " << v.z << "\n";
    }

    out << "\n";

    for (const Triangle& t : set.triangles()) {
        out << "f " << (t.vertex0 + 1) << " " << (t.vertex1 + 1) << " " << (t.vertex2 + 1) << "\n";
    }
}

bool exportObj(const CollisionSet& set, const std::string& path) {
    std::ofstream file(path);

    if (!file.is_open()) {
        SDL_LogError(LogCategory::TOOL, "Cannot open %s for writing", path.c_str());
        return false;
    }

    writeObj(set, file);
    file.close();

    if (file.fail()) {
        SDL_LogError(LogCategory::TOOL, "Failed writing %s", path.c_str());
        return false;
    }

    SDL_Log("Exported %zu vertices, %zu triangles to %s",
            set.vertexCount(), set.triangleCount(), path.c_str());
    return true;
}
