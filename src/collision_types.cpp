#include "collision_types.h"

const char* orientationClassName(OrientationClass orientation) {
    switch (orientation) {
        case OrientationClass::FLOOR:
            return "floor";
        case OrientationClass::WALL:
            return "wall";
        case OrientationClass::CEILING:
            return "ceiling";
    }
    return "wall";
}

uint32_t CollisionSet::addVertex(const Vertex& vertex) {
    vertexList.push_back(vertex);
    return static_cast<uint32_t>(vertexList.size() - 1);
}

bool CollisionSet::addTriangle(const Triangle& triangle) {
    size_t count = vertexList.size();
    if (triangle.vertex0 >= count || triangle.vertex1 >= count || triangle.vertex2 >= count) {
        return false;
    }
    triangleList.push_back(triangle);
    return true;
}

Vec3 CollisionSet::centroid(const Triangle& triangle) const {
    const Vertex& a = corner0(triangle);
    const Vertex& b = corner1(triangle);
    const Vertex& c = corner2(triangle);
    return Vec3(
        (static_cast<double>(a.x) + b.x + c.x) / 3.0,
        (static_cast<double>(a.y) + b.y + c.y) / 3.0,
        (static_cast<double>(a.z) + b.z + c.z) / 3.0
    );
}

void CollisionSet::clear() {
    vertexList.clear();
    triangleList.clear();
}
