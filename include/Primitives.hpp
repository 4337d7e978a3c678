#pragma once

#include "Mesh.hpp"

#include <glm/glm.hpp>

#include <vector>

// Basic geometry generation
namespace prim {

struct MeshData {
    std::vector<VertexPN> verts;
    std::vector<unsigned int> indices;
};

// Line-list points; the first axisVertexCount points are the two lines through the origin.
struct GridData {
    std::vector<glm::vec3> points;
    int axisVertexCount = 0;
};

// CPU-side generators (no GL context needed)
MeshData cubeVertices(float size);                               // 24 verts, per-face normals
MeshData sphereVertices(float radius, int rings, int slices);    // UV sphere
GridData gridVertices(int slices, float spacing);                // XZ plane, y = 0

// GPU uploads
Mesh makeCube(float size = 1.0f);
Mesh makeSphere(float radius, int rings = 16, int slices = 16);
Mesh makeGrid(const GridData& grid);

} // namespace prim
