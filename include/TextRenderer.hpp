#pragma once

#include "Shader.hpp"
#include "Types.hpp"

#include <glad/gl.h>
#include <glm/glm.hpp>
#include <string>
#include <unordered_map>

// Cached glyph
struct Glyph {
    GLuint texture = 0;
    glm::ivec2 size{};
    glm::ivec2 bearing{};
    unsigned int advance = 0;
};

// FreeType text renderer; positions are top-left window coordinates
class TextRenderer {
public:
    TextRenderer() = default;
    ~TextRenderer();

    TextRenderer(const TextRenderer&) = delete;
    TextRenderer& operator=(const TextRenderer&) = delete;

    // Shader failure is fatal (returns false); a missing font only disables drawing.
    // Glyphs are rasterized at pixelSize * scale and drawn at pixelSize window units.
    bool init(const std::string& fontPath, int pixelSize, int windowW, int windowH, float scale);

    bool hasFont() const { return m_ftFace != nullptr; }

    void drawText(const std::string& text, int x, int yTop, const Color8& color);

private:
    bool loadGlyph(unsigned char c);
    void preload(const std::string& text);

    Shader m_shader;
    GLuint m_vao = 0;
    GLuint m_vbo = 0;

    // Window units, not framebuffer pixels
    int m_w = 1;
    int m_h = 1;
    float m_scale = 1.0f;
    int m_ascender = 0; // raster pixels

    void* m_ftLib = nullptr;
    void* m_ftFace = nullptr;

    std::unordered_map<unsigned char, Glyph> m_glyphs;
};
