#include "Mesh.hpp"

#include <cstddef>
#include <stdexcept>

Mesh::~Mesh() {
    release();
}

void Mesh::release() {
    if (m_ebo) glDeleteBuffers(1, &m_ebo);
    if (m_vbo) glDeleteBuffers(1, &m_vbo);
    if (m_vao) glDeleteVertexArrays(1, &m_vao);
    m_ebo = m_vbo = m_vao = 0;
    m_elemCount = 0;
}

Mesh::Mesh(Mesh&& other) noexcept
    : m_vao(other.m_vao),
      m_vbo(other.m_vbo),
      m_ebo(other.m_ebo),
      m_elemCount(other.m_elemCount),
      m_mode(other.m_mode),
      m_indexed(other.m_indexed) {
    other.m_vao = other.m_vbo = other.m_ebo = 0;
    other.m_elemCount = 0;
}

Mesh& Mesh::operator=(Mesh&& other) noexcept {
    if (this != &other) {
        release();
        m_vao = other.m_vao;
        m_vbo = other.m_vbo;
        m_ebo = other.m_ebo;
        m_elemCount = other.m_elemCount;
        m_mode = other.m_mode;
        m_indexed = other.m_indexed;
        other.m_vao = other.m_vbo = other.m_ebo = 0;
        other.m_elemCount = 0;
    }
    return *this;
}

Mesh Mesh::fromTriangles(const std::vector<VertexPN>& verts, const std::vector<unsigned int>& indices) {
    if (verts.empty() || indices.empty()) {
        throw std::runtime_error("Mesh::fromTriangles: empty vertex or index data");
    }

    Mesh m;
    m.m_indexed = true;
    m.m_mode = GL_TRIANGLES;
    m.m_elemCount = static_cast<GLsizei>(indices.size());

    glGenVertexArrays(1, &m.m_vao);
    glGenBuffers(1, &m.m_vbo);
    glGenBuffers(1, &m.m_ebo);
    if (!m.m_vao || !m.m_vbo || !m.m_ebo) {
        throw std::runtime_error("Mesh::fromTriangles: failed to allocate GL buffers");
    }

    glBindVertexArray(m.m_vao);

    glBindBuffer(GL_ARRAY_BUFFER, m.m_vbo);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(verts.size() * sizeof(VertexPN)), verts.data(), GL_STATIC_DRAW);

    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, m.m_ebo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, (GLsizeiptr)(indices.size() * sizeof(unsigned int)), indices.data(), GL_STATIC_DRAW);

    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(VertexPN), (void*)offsetof(VertexPN, pos));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(VertexPN), (void*)offsetof(VertexPN, normal));

    glBindVertexArray(0);
    return m;
}

Mesh Mesh::fromLines(const std::vector<glm::vec3>& points) {
    if (points.empty()) {
        throw std::runtime_error("Mesh::fromLines: empty point data");
    }

    Mesh m;
    m.m_indexed = false;
    m.m_mode = GL_LINES;
    m.m_elemCount = static_cast<GLsizei>(points.size());

    glGenVertexArrays(1, &m.m_vao);
    glGenBuffers(1, &m.m_vbo);
    if (!m.m_vao || !m.m_vbo) {
        throw std::runtime_error("Mesh::fromLines: failed to allocate GL buffers");
    }

    glBindVertexArray(m.m_vao);

    glBindBuffer(GL_ARRAY_BUFFER, m.m_vbo);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(points.size() * sizeof(glm::vec3)), points.data(), GL_STATIC_DRAW);

    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(glm::vec3), (void*)0);

    glBindVertexArray(0);
    return m;
}

void Mesh::draw() const {
    glBindVertexArray(m_vao);
    if (m_indexed) {
        glDrawElements(m_mode, m_elemCount, GL_UNSIGNED_INT, nullptr);
    } else {
        glDrawArrays(m_mode, 0, m_elemCount);
    }
    glBindVertexArray(0);
}

void Mesh::drawRange(GLint first, GLsizei count) const {
    if (m_indexed || count <= 0) return;
    glBindVertexArray(m_vao);
    glDrawArrays(m_mode, first, count);
    glBindVertexArray(0);
}
