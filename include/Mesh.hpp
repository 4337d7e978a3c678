#pragma once

#include <glad/gl.h>
#include <glm/glm.hpp>

#include <vector>

// Attribute 0 = position, 1 = normal
struct VertexPN {
    glm::vec3 pos;
    glm::vec3 normal;
};

class Mesh {
public:
    Mesh() = default;
    ~Mesh();

    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;

    Mesh(Mesh&& other) noexcept;
    Mesh& operator=(Mesh&& other) noexcept;

    static Mesh fromTriangles(const std::vector<VertexPN>& verts, const std::vector<unsigned int>& indices);
    // GL_LINES, position only
    static Mesh fromLines(const std::vector<glm::vec3>& points);

    GLsizei elementCount() const { return m_elemCount; }

    void draw() const;
    // Sub-range of a non-indexed mesh
    void drawRange(GLint first, GLsizei count) const;

private:
    void release();

    GLuint m_vao = 0;
    GLuint m_vbo = 0;
    GLuint m_ebo = 0;
    GLsizei m_elemCount = 0;
    GLenum m_mode = GL_TRIANGLES;
    bool m_indexed = false;
};
