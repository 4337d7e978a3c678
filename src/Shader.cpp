#include "Shader.hpp"

#include "Util.hpp"

#include <stdexcept>
#include <utility>

// Compile a single stage
static GLuint compile(GLenum type, const std::string& src, const std::string& path) {
    GLuint s = glCreateShader(type);
    const char* c = src.c_str();
    glShaderSource(s, 1, &c, nullptr);
    glCompileShader(s);

    GLint ok = 0;
    glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        char log[2048];
        glGetShaderInfoLog(s, sizeof(log), nullptr, log);
        glDeleteShader(s);
        throw std::runtime_error(path + ": compile failed: " + log);
    }
    return s;
}

// Read sources, compile and link
Shader::Shader(const std::string& vertexPath, const std::string& fragmentPath) {
    std::string vs = util::readTextFile(vertexPath);
    std::string fs = util::readTextFile(fragmentPath);

    GLuint v = compile(GL_VERTEX_SHADER, vs, vertexPath);
    GLuint f = 0;
    try {
        f = compile(GL_FRAGMENT_SHADER, fs, fragmentPath);
    } catch (...) {
        glDeleteShader(v);
        throw;
    }

    m_program = glCreateProgram();
    glAttachShader(m_program, v);
    glAttachShader(m_program, f);
    glLinkProgram(m_program);

    glDeleteShader(v);
    glDeleteShader(f);

    GLint ok = 0;
    glGetProgramiv(m_program, GL_LINK_STATUS, &ok);
    if (!ok) {
        char log[2048];
        glGetProgramInfoLog(m_program, sizeof(log), nullptr, log);
        glDeleteProgram(m_program);
        m_program = 0;
        throw std::runtime_error("Shader program link failed (" + vertexPath + ", " + fragmentPath + "): " + log);
    }

    util::logInfo("Shader loaded: " + vertexPath + " + " + fragmentPath);
}

Shader::~Shader() {
    if (m_program) {
        glDeleteProgram(m_program);
        m_program = 0;
    }
}

Shader::Shader(Shader&& other) noexcept
    : m_program(other.m_program), m_locations(std::move(other.m_locations)) {
    other.m_program = 0;
    other.m_locations.clear();
}

Shader& Shader::operator=(Shader&& other) noexcept {
    if (this != &other) {
        if (m_program) glDeleteProgram(m_program);
        m_program = other.m_program;
        m_locations = std::move(other.m_locations);
        other.m_program = 0;
        other.m_locations.clear();
    }
    return *this;
}

void Shader::use() const {
    glUseProgram(m_program);
}

// Looked up once, then cached
GLint Shader::uniformLocation(const std::string& name) const {
    auto it = m_locations.find(name);
    if (it != m_locations.end()) return it->second;

    GLint loc = glGetUniformLocation(m_program, name.c_str());
    m_locations.emplace(name, loc);
    return loc;
}

GLint Shader::requireUniform(const std::string& name) const {
    GLint loc = uniformLocation(name);
    if (loc < 0) {
        throw std::runtime_error("Shader is missing required uniform: " + name);
    }
    return loc;
}

void Shader::setMat4(const std::string& name, const glm::mat4& m) const {
    glUniformMatrix4fv(uniformLocation(name), 1, GL_FALSE, &m[0][0]);
}

void Shader::setMat3(const std::string& name, const glm::mat3& m) const {
    glUniformMatrix3fv(uniformLocation(name), 1, GL_FALSE, &m[0][0]);
}

void Shader::setVec3(const std::string& name, const glm::vec3& v) const {
    setVec3(uniformLocation(name), v);
}

void Shader::setVec3(GLint loc, const glm::vec3& v) const {
    glUniform3f(loc, v.x, v.y, v.z);
}

void Shader::setFloat(const std::string& name, float f) const {
    glUniform1f(uniformLocation(name), f);
}

void Shader::setInt(const std::string& name, int i) const {
    glUniform1i(uniformLocation(name), i);
}
