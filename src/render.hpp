#pragma once
#include "state.hpp"
#include <ostream>
#include <string>

namespace prisma {

// Escape sequences used by the renderer. Passed in rather than global so
// the plain variant can be chosen at startup and tests can render without
// color.
struct RenderStyle {
    std::string header;
    std::string own_message;
    std::string other_message;
    std::string notice;
    std::string tab;
    std::string active_tab;
    std::string error;
    std::string user_header;
    std::string online_user;
    std::string reset;
    bool bracket_active_tab = false; // mark the active tab without color

    static RenderStyle colored();
    static RenderStyle plain();
};

struct ViewSize {
    int width = 80;
    int height = 24;
};

// Full-screen text view of the session state. Redraws everything each time.
class Renderer {
public:
    Renderer(RenderStyle style, std::ostream& out);

    std::string render(const SessionState& state, ViewSize size) const;

    // Clear the screen and write render() followed by the input prompt.
    void draw(const SessionState& state, ViewSize size);

private:
    std::string render_live(const SessionState& state, ViewSize size) const;
    std::string render_tabs(const SessionState& state) const;
    std::string styled(const std::string& style, const std::string& text) const;

    RenderStyle style_;
    std::ostream& out_;
};

// "[HH:MM] user: content" in local time.
std::string format_message_line(const Message& m);

} // namespace prisma
