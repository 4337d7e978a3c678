#include "Renderer.hpp"

#include "Config.hpp"
#include "Util.hpp"

#include <glm/gtc/matrix_transform.hpp>

bool Renderer::init(int framebufferW, int framebufferH, int windowW, int windowH) {
    m_w = framebufferW;
    m_h = framebufferH;
    m_winH = windowH;

    try {
        m_lightingShader = Shader(cfg::LIGHTING_VERT, cfg::LIGHTING_FRAG);
        m_flatShader     = Shader(cfg::FLAT_VERT,     cfg::FLAT_FRAG);

        m_viewPosLoc    = m_lightingShader.requireUniform("viewPos");
        m_lightPosLoc   = m_lightingShader.requireUniform("lightPos");
        m_lightColorLoc = m_lightingShader.requireUniform("lightColor");
        m_lightingShader.requireUniform("model");
        m_lightingShader.requireUniform("view");
        m_lightingShader.requireUniform("projection");

        m_cube = prim::makeCube(cfg::CUBE_SIZE);
        m_marker = prim::makeSphere(cfg::LIGHT_MARKER_RADIUS);

        prim::GridData grid = prim::gridVertices(cfg::GRID_SLICES, cfg::GRID_SPACING);
        m_gridAxisVerts = grid.axisVertexCount;
        m_grid = prim::makeGrid(grid);
    } catch (const std::exception& e) {
        util::logError(e.what());
        return false;
    }

    // Constant Phong terms
    m_lightingShader.use();
    m_lightingShader.setFloat("ambientStrength", cfg::AMBIENT_STRENGTH);
    m_lightingShader.setFloat("specularStrength", cfg::SPECULAR_STRENGTH);
    m_lightingShader.setFloat("shininess", cfg::SHININESS);
    m_lightingShader.setVec3("baseColor", colors::WHITE.toVec3());
    glUseProgram(0);

    const float scale = overlay::contentScale(framebufferW, windowW);
    if (!m_text.init(util::firstExisting(cfg::FONT_CANDIDATES), cfg::FONT_PIXEL_SIZE, windowW, windowH, scale)) {
        util::logError("Text renderer init failed");
        return false;
    }

    glViewport(0, 0, m_w, m_h);
    util::logInfo("Renderer ready");
    return true;
}

void Renderer::pushLightingUniforms(const DemoScene& scene) {
    m_lightingShader.use();
    m_lightingShader.setVec3(m_viewPosLoc, scene.cameraPosition());
    m_lightingShader.setVec3(m_lightPosLoc, scene.lightPosition());
    m_lightingShader.setVec3(m_lightColorLoc, scene.lightColor().toVec3());
}

void Renderer::drawCube(const DemoScene& scene, const glm::mat4& V, const glm::mat4& P) {
    const glm::vec3 axis = glm::normalize(glm::vec3(cfg::CUBE_AXIS_X, cfg::CUBE_AXIS_Y, cfg::CUBE_AXIS_Z));
    glm::mat4 M = glm::rotate(glm::mat4(1.0f), glm::radians(scene.cubeAngleDeg()), axis);

    m_lightingShader.use();
    m_lightingShader.setMat4("model", M);
    m_lightingShader.setMat4("view", V);
    m_lightingShader.setMat4("projection", P);
    m_lightingShader.setMat3("normalMatrix", glm::mat3(glm::transpose(glm::inverse(M))));
    m_cube.draw();
}

void Renderer::drawLightMarker(const DemoScene& scene, const glm::mat4& V, const glm::mat4& P) {
    glm::mat4 M = glm::translate(glm::mat4(1.0f), scene.lightPosition());

    m_flatShader.use();
    m_flatShader.setMat4("model", M);
    m_flatShader.setMat4("view", V);
    m_flatShader.setMat4("projection", P);
    m_flatShader.setVec3("color", scene.lightColor().toVec3());
    m_marker.draw();
}

void Renderer::drawGrid(const glm::mat4& V, const glm::mat4& P) {
    m_flatShader.use();
    m_flatShader.setMat4("model", glm::mat4(1.0f));
    m_flatShader.setMat4("view", V);
    m_flatShader.setMat4("projection", P);

    // Lines through the origin are darker
    m_flatShader.setVec3("color", glm::vec3(0.5f));
    m_grid.drawRange(0, m_gridAxisVerts);
    m_flatShader.setVec3("color", glm::vec3(0.75f));
    m_grid.drawRange(m_gridAxisVerts, m_grid.elementCount() - m_gridAxisVerts);
}

void Renderer::drawOverlay(const DemoScene& scene, int fps) {
    if (!m_text.hasFont()) return;

    for (const auto& line : overlay::layout(scene, fps, m_winH)) {
        m_text.drawText(line.text, line.x, line.y, colors::RAYWHITE);
    }
}

void Renderer::draw(const DemoScene& scene, int fps) {
    glViewport(0, 0, m_w, m_h);
    glEnable(GL_DEPTH_TEST);
    glDisable(GL_CULL_FACE);

    const glm::vec3 clear = colors::BLACK.toVec3();
    glClearColor(clear.r, clear.g, clear.b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    const glm::mat4 V = scene.camera().view();
    const glm::mat4 P = scene.camera().projection((float)m_w / (float)m_h);

    pushLightingUniforms(scene);
    drawCube(scene, V, P);

    if (scene.drawLightMarker()) {
        drawLightMarker(scene, V, P);
    }
    drawGrid(V, P);

    glUseProgram(0);
    drawOverlay(scene, fps);
}
