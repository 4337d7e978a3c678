#include "TextRenderer.hpp"

#include "Config.hpp"
#include "Util.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <glm/gtc/matrix_transform.hpp>

#include <cmath>

TextRenderer::~TextRenderer() {
    for (auto& [c, g] : m_glyphs) {
        if (g.texture) glDeleteTextures(1, &g.texture);
    }
    m_glyphs.clear();

    if (m_vbo) glDeleteBuffers(1, &m_vbo);
    if (m_vao) glDeleteVertexArrays(1, &m_vao);
    m_vbo = m_vao = 0;

    if (m_ftFace) {
        FT_Done_Face((FT_Face)m_ftFace);
        m_ftFace = nullptr;
    }
    if (m_ftLib) {
        FT_Done_FreeType((FT_Library)m_ftLib);
        m_ftLib = nullptr;
    }
}

bool TextRenderer::init(const std::string& fontPath, int pixelSize, int windowW, int windowH, float scale) {
    m_w = windowW;
    m_h = windowH;
    m_scale = scale > 0.0f ? scale : 1.0f;

    try {
        m_shader = Shader(cfg::TEXT_VERT, cfg::TEXT_FRAG);
    } catch (const std::exception& e) {
        util::logError(e.what());
        return false;
    }

    // One dynamic quad (6 verts x vec4) reused per glyph
    glGenVertexArrays(1, &m_vao);
    glGenBuffers(1, &m_vbo);
    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(float) * 6 * 4, nullptr, GL_DYNAMIC_DRAW);

    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 4, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)0);

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);

    if (fontPath.empty()) {
        util::logWarn("No overlay font found; text disabled");
        return true;
    }

    FT_Library ft;
    if (FT_Init_FreeType(&ft)) {
        util::logWarn("Failed to init FreeType; text disabled");
        return true;
    }

    FT_Face face;
    if (FT_New_Face(ft, fontPath.c_str(), 0, &face)) {
        util::logWarn("Failed to load font: " + fontPath + "; text disabled");
        FT_Done_FreeType(ft);
        return true;
    }

    FT_Set_Pixel_Sizes(face, 0, (FT_UInt)std::lround(pixelSize * m_scale));

    m_ftLib = (void*)ft;
    m_ftFace = (void*)face;
    m_ascender = (int)(face->size->metrics.ascender >> 6);

    // Printable ASCII up front
    std::string ascii;
    for (int c = 32; c < 127; ++c) ascii.push_back((char)c);
    preload(ascii);

    util::logInfo("Font loaded: " + fontPath);
    return true;
}

// Rasterize one glyph into a GL_RED texture
bool TextRenderer::loadGlyph(unsigned char c) {
    if (!m_ftFace) return false;
    FT_Face face = (FT_Face)m_ftFace;

    if (FT_Load_Char(face, (FT_ULong)c, FT_LOAD_RENDER)) {
        return false;
    }

    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

    GLuint tex;
    glGenTextures(1, &tex);
    glBindTexture(GL_TEXTURE_2D, tex);

    glTexImage2D(
        GL_TEXTURE_2D,
        0,
        GL_RED,
        face->glyph->bitmap.width,
        face->glyph->bitmap.rows,
        0,
        GL_RED,
        GL_UNSIGNED_BYTE,
        face->glyph->bitmap.buffer
    );

    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glBindTexture(GL_TEXTURE_2D, 0);

    Glyph g;
    g.texture = tex;
    g.size = glm::ivec2((int)face->glyph->bitmap.width, (int)face->glyph->bitmap.rows);
    g.bearing = glm::ivec2((int)face->glyph->bitmap_left, (int)face->glyph->bitmap_top);
    g.advance = (unsigned int)face->glyph->advance.x;

    m_glyphs[c] = g;
    return true;
}

void TextRenderer::preload(const std::string& text) {
    for (char ch : text) {
        unsigned char c = (unsigned char)ch;
        if (m_glyphs.find(c) == m_glyphs.end()) {
            loadGlyph(c);
        }
    }
}

void TextRenderer::drawText(const std::string& text, int x, int yTop, const Color8& color) {
    if (!m_ftFace) return;

    preload(text);

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glDisable(GL_DEPTH_TEST);

    m_shader.use();
    // Ortho in window units; GL origin is bottom-left
    glm::mat4 proj = glm::ortho(0.0f, (float)m_w, 0.0f, (float)m_h);
    m_shader.setMat4("projection", proj);
    m_shader.setVec3("textColor", color.toVec3());
    m_shader.setInt("text", 0);

    glActiveTexture(GL_TEXTURE0);
    glBindVertexArray(m_vao);

    float xCursor = (float)x;
    // Raster metrics are divided back into window units
    const float inv = 1.0f / m_scale;
    const float baseline = (float)(m_h - yTop) - (float)m_ascender * inv;

    for (char ch : text) {
        auto it = m_glyphs.find((unsigned char)ch);
        if (it == m_glyphs.end()) continue;
        const Glyph& g = it->second;

        float xpos = xCursor + (float)g.bearing.x * inv;
        float ypos = baseline - (float)(g.size.y - g.bearing.y) * inv;
        float w = (float)g.size.x * inv;
        float h = (float)g.size.y * inv;

        float vertices[6][4] = {
            {xpos,     ypos + h,   0.0f, 0.0f},
            {xpos,     ypos,       0.0f, 1.0f},
            {xpos + w, ypos,       1.0f, 1.0f},

            {xpos,     ypos + h,   0.0f, 0.0f},
            {xpos + w, ypos,       1.0f, 1.0f},
            {xpos + w, ypos + h,   1.0f, 0.0f},
        };

        glBindTexture(GL_TEXTURE_2D, g.texture);
        glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
        glBufferSubData(GL_ARRAY_BUFFER, 0, sizeof(vertices), vertices);
        glBindBuffer(GL_ARRAY_BUFFER, 0);

        glDrawArrays(GL_TRIANGLES, 0, 6);

        xCursor += (g.advance / 64.0f) * inv;
    }

    glBindVertexArray(0);
    glBindTexture(GL_TEXTURE_2D, 0);
    glEnable(GL_DEPTH_TEST);
}
