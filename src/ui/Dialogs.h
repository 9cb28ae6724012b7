#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <string>

namespace clustermap {

class Dialogs {
public:
    static Dialogs& instance();
    void draw();

    void showOpenHierarchy();
    void showOpenTopics();
    void showPaletteEditor();
    void showContextSummary();
    void showAbout();

private:
    Dialogs() = default;

    // Modal with a single path field. Returns true when OK was pressed.
    bool drawPathPrompt(const char* title, const char* prompt, bool& open, char* buf, size_t bufSize);

    void drawOpenHierarchy();
    void drawOpenTopics();
    void drawPaletteEditor();
    void drawContextSummary();
    void drawAbout();

    bool showOpenHierarchy_ = false;
    bool showOpenTopics_ = false;
    bool showPaletteEditor_ = false;
    bool showContextSummary_ = false;
    bool showAbout_ = false;

    char hierarchyPathBuf_[512] = {};
    char topicsPathBuf_[512] = {};

    // Colours being edited, per top-level l2 id
    std::map<std::string, std::array<float, 3>> paletteEdit_;
};

} // namespace clustermap
