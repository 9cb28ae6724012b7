#pragma once

#include <string>

struct SDL_Window;
typedef void* SDL_GLContext;

namespace clustermap {

class App {
public:
    App();
    ~App();

    bool init(int argc, char* argv[]);
    void run();
    void shutdown();

    SDL_Window* getWindow() const { return window_; }
    int getWindowWidth() const { return windowWidth_; }
    int getWindowHeight() const { return windowHeight_; }

    void requestQuit() { running_ = false; }

    static App& instance();

private:
    // Blocks for up to IDLE_WAIT_MS when wait is set and nothing is queued
    void processEvents(bool wait);
    void beginFrame();
    void endFrame();

    SDL_Window* window_ = nullptr;
    SDL_GLContext glContext_ = nullptr;
    bool running_ = false;
    int windowWidth_ = 1280;
    int windowHeight_ = 800;

    // ImGui settles hover and layout state over a few frames after input
    int settleFrames_ = 0;

    static constexpr int IDLE_WAIT_MS = 250;
    static constexpr int SETTLE_FRAMES = 3;

    static App* instance_;
};

} // namespace clustermap
