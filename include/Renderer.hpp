#pragma once

#include "DemoScene.hpp"
#include "Mesh.hpp"
#include "Overlay.hpp"
#include "Primitives.hpp"
#include "Shader.hpp"
#include "TextRenderer.hpp"

#include <glad/gl.h>
#include <glm/glm.hpp>

class Renderer {
public:
    // Framebuffer size drives the viewport; window size drives the overlay layout.
    bool init(int framebufferW, int framebufferH, int windowW, int windowH);

    void draw(const DemoScene& scene, int fps);

private:
    void pushLightingUniforms(const DemoScene& scene);
    void drawCube(const DemoScene& scene, const glm::mat4& V, const glm::mat4& P);
    void drawLightMarker(const DemoScene& scene, const glm::mat4& V, const glm::mat4& P);
    void drawGrid(const glm::mat4& V, const glm::mat4& P);
    void drawOverlay(const DemoScene& scene, int fps);

    int m_w = 1;
    int m_h = 1;
    int m_winH = 1;

    Shader m_lightingShader;
    Shader m_flatShader;

    // viewPos / lightPos / lightColor
    GLint m_viewPosLoc = -1;
    GLint m_lightPosLoc = -1;
    GLint m_lightColorLoc = -1;

    TextRenderer m_text;

    Mesh m_cube;
    Mesh m_marker;
    Mesh m_grid;
    int m_gridAxisVerts = 0;
};
