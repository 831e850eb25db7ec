#pragma once

#include "Mesh3D.hpp"
#include <glm/glm.hpp>

// Painter's algorithm visibility ordering.
//
// Each triangle gets one depth key, the mean view-space z of its three
// vertices. A single key per triangle cannot order triangles whose planes
// intersect inside the frustum; such pairs may be drawn in the wrong order.
class PainterSorter {
public:
    // Stores the mean view-space z of every triangle in Triangle::depth.
    static void computeDepths(Mesh3D &mesh, const glm::mat4 &modelView);

    // Reorders the mesh by ascending depth (farthest first, the camera looks
    // down -Z). Equal depths keep ascending id order, so the result is a total
    // order and sorting twice yields the same sequence.
    static void sortBackToFront(Mesh3D &mesh);

    // Strict weak ordering used by sortBackToFront.
    static bool drawsBefore(const Triangle &a, const Triangle &b);
};
