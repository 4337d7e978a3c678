#include <glad/gl.h>

#include <GLFW/glfw3.h>

#include "Config.hpp"
#include "DemoScene.hpp"
#include "FrameTimer.hpp"
#include "Input.hpp"
#include "Renderer.hpp"
#include "Types.hpp"
#include "Util.hpp"

#include <chrono>
#include <string>
#include <thread>

struct App {
    GLFWwindow* window = nullptr;
    int w = cfg::WINDOW_WIDTH;   // framebuffer
    int h = cfg::WINDOW_HEIGHT;
    int winW = cfg::WINDOW_WIDTH; // window units
    int winH = cfg::WINDOW_HEIGHT;

    DemoScene scene;
    Renderer renderer;
    FrameTimer timer;

    InputAccumulator input;
};

// Owns the GLFW library and window; released on every exit path.
struct GlfwSession {
    bool initialized = false;
    GLFWwindow* window = nullptr;

    ~GlfwSession() {
        if (window) glfwDestroyWindow(window);
        if (initialized) glfwTerminate();
    }
};

static void applyCursorMode(App& app) {
    glfwSetInputMode(app.window, GLFW_CURSOR,
                     app.scene.mouseLocked() ? GLFW_CURSOR_DISABLED : GLFW_CURSOR_NORMAL);
    // First delta after a mode switch starts from here
    double x = 0.0, y = 0.0;
    glfwGetCursorPos(app.window, &x, &y);
    app.input.reseed(x, y);
}

static void glfwErrorCallback(int error, const char* description) {
    util::logError(std::string("GLFW error ") + std::to_string(error) + ": " + (description ? description : ""));
}

static void cursorPosCallback(GLFWwindow* window, double x, double y) {
    auto* app = (App*)glfwGetWindowUserPointer(window);
    if (!app) return;

    app->input.cursorMoved(x, y);
}

static void scrollCallback(GLFWwindow* window, double xoffset, double yoffset) {
    (void)xoffset;
    auto* app = (App*)glfwGetWindowUserPointer(window);
    if (!app) return;
    app->input.addScroll(yoffset);
}

static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;
    auto* app = (App*)glfwGetWindowUserPointer(window);
    if (!app) return;
    if (action != GLFW_PRESS) return;

    switch (key) {
        case GLFW_KEY_L: app->input.pressLock(); break;
        case GLFW_KEY_S: app->input.pressSpin(); break;
        case GLFW_KEY_D: app->input.pressMarker(); break;
        case GLFW_KEY_ESCAPE: glfwSetWindowShouldClose(window, GLFW_TRUE); break;
        default: break;
    }
}

int main() {
    glfwSetErrorCallback(glfwErrorCallback);

    GlfwSession glfw;
    if (!glfwInit()) {
        util::logError("Failed to init GLFW");
        return 1;
    }
    glfw.initialized = true;

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    glfw.window = glfwCreateWindow(cfg::WINDOW_WIDTH, cfg::WINDOW_HEIGHT, cfg::WINDOW_TITLE, nullptr, nullptr);
    if (!glfw.window) {
        util::logError("Failed to create window");
        return 1;
    }

    glfwMakeContextCurrent(glfw.window);
    // Frame rate is paced by FrameTimer
    glfwSwapInterval(0);

    if (!gladLoadGL(glfwGetProcAddress)) {
        util::logError("Failed to load OpenGL via glad");
        return 1;
    }

    util::logInfo(std::string("OpenGL: ") + (const char*)glGetString(GL_VERSION));

    // GL objects inside App are destroyed before the session tears down the context
    App app;
    app.window = glfw.window;

    glfwSetWindowUserPointer(app.window, &app);
    glfwSetCursorPosCallback(app.window, cursorPosCallback);
    glfwSetScrollCallback(app.window, scrollCallback);
    glfwSetKeyCallback(app.window, keyCallback);
    double cx = 0.0, cy = 0.0;
    glfwGetCursorPos(app.window, &cx, &cy);
    app.input.reseed(cx, cy);

    glEnable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    // HiDPI: framebuffer may be larger than the window
    int fbw = 0, fbh = 0;
    glfwGetFramebufferSize(app.window, &fbw, &fbh);
    app.w = fbw > 0 ? fbw : app.w;
    app.h = fbh > 0 ? fbh : app.h;
    int ww = 0, wh = 0;
    glfwGetWindowSize(app.window, &ww, &wh);
    app.winW = ww > 0 ? ww : app.winW;
    app.winH = wh > 0 ? wh : app.winH;
    util::logInfo("Framebuffer: " + std::to_string(app.w) + "x" + std::to_string(app.h) +
                  ", window: " + std::to_string(app.winW) + "x" + std::to_string(app.winH));

    if (!app.renderer.init(app.w, app.h, app.winW, app.winH)) {
        util::logError("Renderer init failed");
        return 1;
    }

    app.timer.start(glfwGetTime());
    while (!glfwWindowShouldClose(app.window)) {
        glfwPollEvents();

        FrameInput in = app.input.drain();
        in.dt = app.timer.tick(glfwGetTime());

        StepEvents ev = app.scene.step(in);
        if (ev.lockChanged) {
            applyCursorMode(app);
        }

        app.renderer.draw(app.scene, app.timer.fps());
        glfwSwapBuffers(app.window);

        double wait = app.timer.remaining(glfwGetTime());
        if (wait > 0.0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(wait));
        }
    }

    util::logInfo("Shutting down after " + std::to_string(app.timer.frameCount()) + " frames");
    return 0;
}
