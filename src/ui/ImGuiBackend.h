#pragma once

#include <string>

struct SDL_Window;
typedef void* SDL_GLContext;

namespace clustermap {

class ImGuiBackend {
public:
    // fontPath may be empty, in which case ImGui's built-in font is used
    static void init(SDL_Window* window, SDL_GLContext glContext, const std::string& fontPath);
    static void shutdown();
    static void beginFrame();
    static void endFrame(SDL_Window* window);
};

} // namespace clustermap
