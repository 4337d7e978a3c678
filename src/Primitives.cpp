#include "Primitives.hpp"
#include "Mesh.hpp"

#include <glm/glm.hpp>

#include <vector>
#include <cmath>

namespace prim {

static constexpr float PI = 3.14159265358979323846f;

// One cube face: n is the outward normal, u x v == n keeps CCW winding from outside.
static void addQuad(MeshData& d, const glm::vec3& n, const glm::vec3& u, const glm::vec3& v, float h) {
    unsigned int base = (unsigned int)d.verts.size();
    const glm::vec3 c = n * h;
    d.verts.push_back(VertexPN{c + (-u - v) * h, n});
    d.verts.push_back(VertexPN{c + ( u - v) * h, n});
    d.verts.push_back(VertexPN{c + ( u + v) * h, n});
    d.verts.push_back(VertexPN{c + (-u + v) * h, n});
    d.indices.push_back(base + 0);
    d.indices.push_back(base + 1);
    d.indices.push_back(base + 2);
    d.indices.push_back(base + 0);
    d.indices.push_back(base + 2);
    d.indices.push_back(base + 3);
}

MeshData cubeVertices(float size) {
    const float h = size * 0.5f;

    MeshData d;
    d.verts.reserve(24);
    d.indices.reserve(36);

    addQuad(d, glm::vec3( 1, 0, 0), glm::vec3(0, 0, -1), glm::vec3(0, 1,  0), h);
    addQuad(d, glm::vec3(-1, 0, 0), glm::vec3(0, 0,  1), glm::vec3(0, 1,  0), h);
    addQuad(d, glm::vec3( 0, 1, 0), glm::vec3(1, 0,  0), glm::vec3(0, 0, -1), h);
    addQuad(d, glm::vec3( 0,-1, 0), glm::vec3(1, 0,  0), glm::vec3(0, 0,  1), h);
    addQuad(d, glm::vec3( 0, 0, 1), glm::vec3(1, 0,  0), glm::vec3(0, 1,  0), h);
    addQuad(d, glm::vec3( 0, 0,-1), glm::vec3(-1, 0, 0), glm::vec3(0, 1,  0), h);

    return d;
}

MeshData sphereVertices(float radius, int rings, int slices) {
    if (rings < 2) rings = 2;
    if (slices < 3) slices = 3;

    MeshData d;
    d.verts.reserve((size_t)(rings + 1) * (size_t)(slices + 1));
    d.indices.reserve((size_t)rings * (size_t)slices * 6);

    // Latitude -90..90, longitude 0..360 (seam duplicated)
    for (int i = 0; i <= rings; ++i) {
        float lat = -0.5f * PI + (float)i / (float)rings * PI;
        for (int j = 0; j <= slices; ++j) {
            float lon = (float)j / (float)slices * 2.0f * PI;
            glm::vec3 n(std::cos(lat) * std::cos(lon), std::sin(lat), std::cos(lat) * std::sin(lon));
            d.verts.push_back(VertexPN{n * radius, n});
        }
    }

    const unsigned int stride = (unsigned int)slices + 1;
    for (int i = 0; i < rings; ++i) {
        for (int j = 0; j < slices; ++j) {
            unsigned int a = (unsigned int)i * stride + (unsigned int)j;
            unsigned int b = a + stride;
            d.indices.push_back(a);
            d.indices.push_back(b);
            d.indices.push_back(a + 1);
            d.indices.push_back(a + 1);
            d.indices.push_back(b);
            d.indices.push_back(b + 1);
        }
    }

    return d;
}

GridData gridVertices(int slices, float spacing) {
    if (slices < 1) slices = 1;

    const int half = slices / 2;
    const float extent = (float)half * spacing;

    GridData g;
    g.points.reserve((size_t)(slices + 1) * 4);

    // Axis lines first so they can be drawn in their own color
    g.points.push_back(glm::vec3(0.0f, 0.0f, -extent));
    g.points.push_back(glm::vec3(0.0f, 0.0f,  extent));
    g.points.push_back(glm::vec3(-extent, 0.0f, 0.0f));
    g.points.push_back(glm::vec3( extent, 0.0f, 0.0f));
    g.axisVertexCount = 4;

    for (int i = -half; i <= half; ++i) {
        if (i == 0) continue;
        float t = (float)i * spacing;
        g.points.push_back(glm::vec3(t, 0.0f, -extent));
        g.points.push_back(glm::vec3(t, 0.0f,  extent));
        g.points.push_back(glm::vec3(-extent, 0.0f, t));
        g.points.push_back(glm::vec3( extent, 0.0f, t));
    }

    return g;
}

Mesh makeCube(float size) {
    MeshData d = cubeVertices(size);
    return Mesh::fromTriangles(d.verts, d.indices);
}

Mesh makeSphere(float radius, int rings, int slices) {
    MeshData d = sphereVertices(radius, rings, slices);
    return Mesh::fromTriangles(d.verts, d.indices);
}

Mesh makeGrid(const GridData& grid) {
    return Mesh::fromLines(grid.points);
}

} // namespace prim
