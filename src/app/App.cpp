#include "app/App.h"

#include <SDL.h>
#include <glad/gl.h>
#include <imgui.h>
#include <imgui_impl_sdl2.h>

#include "animation/Animation.h"
#include "app/Config.h"
#include "core/PlatformUtils.h"
#include "ui/ImGuiBackend.h"
#include "ui/MainWindow.h"
#include "ui/ThemeManager.h"

#include <iostream>

namespace clustermap {

App* App::instance_ = nullptr;

App::App() {
    instance_ = this;
}

App::~App() {
    instance_ = nullptr;
}

App& App::instance() {
    return *instance_;
}

bool App::init(int argc, char* argv[]) {
    // Load config first: window size and data paths come from it
    Config& config = Config::instance();
    config.load();

    // Command line: clustermap [hierarchy.json [topics.json]]
    if (argc > 1) {
        config.hierarchyPath = argv[1];
    }
    if (argc > 2) {
        config.topicsPath = argv[2];
    }
    if (config.windowWidth > 0 && config.windowHeight > 0) {
        windowWidth_ = config.windowWidth;
        windowHeight_ = config.windowHeight;
    }

    // Initialize SDL
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        SDL_Log("SDL_Init failed: %s", SDL_GetError());
        return false;
    }

    // Request OpenGL 3.3 Core
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);

    Uint32 windowFlags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI;
    window_ = SDL_CreateWindow(
        "clustermap - Cluster Explorer",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        windowWidth_, windowHeight_,
        windowFlags
    );
    if (!window_) {
        SDL_Log("SDL_CreateWindow failed: %s", SDL_GetError());
        return false;
    }

    glContext_ = SDL_GL_CreateContext(window_);
    if (!glContext_) {
        SDL_Log("SDL_GL_CreateContext failed: %s", SDL_GetError());
        return false;
    }
    SDL_GL_MakeCurrent(window_, glContext_);
    SDL_GL_SetSwapInterval(1); // vsync

    // Load OpenGL functions via glad
    int version = gladLoadGL((GLADloadfunc)SDL_GL_GetProcAddress);
    if (!version) {
        SDL_Log("gladLoadGL failed");
        return false;
    }

    ImGuiBackend::init(window_, glContext_, config.fontPath);

    // Category colours, then user overrides on top
    config.applyPalette();

    ThemeManager::instance().init();
    ThemeManager::instance().setThemeById(config.themeName);

    Animation::instance().init();

    MainWindow::instance().init(config.hierarchyPath, config.topicsPath, config.syncModeDefault);

    std::cout << "App: OpenGL " << GLAD_VERSION_MAJOR(version) << "."
              << GLAD_VERSION_MINOR(version) << ", window " << windowWidth_ << "x"
              << windowHeight_ << std::endl;

    running_ = true;
    return true;
}

void App::run() {
    Animation& animation = Animation::instance();

    while (running_) {
        // Sleep in the event queue while nothing is moving
        bool idle = !animation.isActive() && settleFrames_ == 0 &&
                    !MainWindow::instance().isBusy();
        processEvents(idle);
        if (!running_) break;

        // Topic completions and the hierarchy loader feed the UI between frames
        MainWindow::instance().pump();

        animation.tick(PlatformUtils::getTime());
        if (animation.needsRedraw()) {
            settleFrames_ = SETTLE_FRAMES;
            animation.clearRedrawFlag();
        }

        beginFrame();
        MainWindow::instance().draw();
        endFrame();

        if (settleFrames_ > 0) {
            --settleFrames_;
        }
    }
}

void App::shutdown() {
    Config& config = Config::instance();
    config.themeName = ThemeManager::instance().currentTheme().id;
    config.syncModeDefault = MainWindow::instance().syncModeEnabled();
    if (window_) {
        SDL_GetWindowSize(window_, &config.windowWidth, &config.windowHeight);
    }
    config.save();

    MainWindow::instance().shutdown();
    ImGuiBackend::shutdown();

    if (glContext_) {
        SDL_GL_DeleteContext(glContext_);
        glContext_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
    SDL_Quit();
}

void App::processEvents(bool wait) {
    SDL_Event event;
    bool haveEvent = wait ? SDL_WaitEventTimeout(&event, IDLE_WAIT_MS) != 0
                          : SDL_PollEvent(&event) != 0;

    while (haveEvent) {
        ImGui_ImplSDL2_ProcessEvent(&event);
        settleFrames_ = SETTLE_FRAMES;

        if (event.type == SDL_QUIT) {
            running_ = false;
        }
        if (event.type == SDL_WINDOWEVENT &&
            event.window.event == SDL_WINDOWEVENT_CLOSE &&
            event.window.windowID == SDL_GetWindowID(window_)) {
            running_ = false;
        }
        if (event.type == SDL_WINDOWEVENT &&
            event.window.event == SDL_WINDOWEVENT_RESIZED) {
            windowWidth_ = event.window.data1;
            windowHeight_ = event.window.data2;
        }

        haveEvent = SDL_PollEvent(&event) != 0;
    }
}

void App::beginFrame() {
    ImGuiBackend::beginFrame();
}

void App::endFrame() {
    ImGuiBackend::endFrame(window_);
}

} // namespace clustermap
