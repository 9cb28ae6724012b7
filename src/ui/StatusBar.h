#pragma once

#include <string>

namespace clustermap {

// Bottom strip: data source on the left, current view in the middle,
// cluster totals on the right
class StatusBar {
public:
    static StatusBar& instance();
    void draw();
    void setMessage(const std::string& left, const std::string& right = "");

    const std::string& leftMessage() const { return leftMessage_; }

private:
    StatusBar() = default;
    std::string viewText() const;

    std::string leftMessage_;
    std::string rightMessage_;
};

} // namespace clustermap
