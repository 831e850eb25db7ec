#include "PainterSorter.hpp"
#include "Math.hpp"
#include <algorithm>

void PainterSorter::computeDepths(Mesh3D &mesh, const glm::mat4 &modelView) {
    for (Triangle &tri : mesh.getTriangles()) {
        glm::vec3 a = Math::transformPoint(modelView, tri.v[0]);
        glm::vec3 b = Math::transformPoint(modelView, tri.v[1]);
        glm::vec3 c = Math::transformPoint(modelView, tri.v[2]);
        tri.depth = (a.z + b.z + c.z) / 3.0f;
    }
}

bool PainterSorter::drawsBefore(const Triangle &a, const Triangle &b) {
    if (a.depth != b.depth) {
        return a.depth < b.depth;
    }
    return a.id < b.id;
}

void PainterSorter::sortBackToFront(Mesh3D &mesh) {
    std::vector<Triangle> &triangles = mesh.getTriangles();
    if (triangles.size() < 2) {
        return;
    }
    std::sort(triangles.begin(), triangles.end(), drawsBefore);
}
