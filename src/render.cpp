#include "render.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <vector>

namespace prisma {

static constexpr int kUserPaneWidth = 22;
static constexpr const char* kSeparator = " | ";

RenderStyle RenderStyle::colored() {
    RenderStyle s;
    s.header        = "\033[1;97m";
    s.own_message   = "\033[96m";
    s.other_message = "\033[97m";
    s.notice        = "\033[3;92m";
    s.tab           = "\033[100;97m";
    s.active_tab    = "\033[1;104;30m";
    s.error         = "\033[1;91m";
    s.user_header   = "\033[1;4m";
    s.online_user   = "\033[92m";
    s.reset         = "\033[0m";
    return s;
}

RenderStyle RenderStyle::plain() {
    RenderStyle s;
    s.bracket_active_tab = true;
    return s;
}

std::string format_message_line(const Message& m) {
    return "[" + format_clock(m.created_at) + "] " + m.username + ": " + m.content;
}

// Split text into chunks of at most width bytes without cutting a UTF-8
// sequence in half.
static std::vector<std::string> wrap(const std::string& text, size_t width) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (text.size() - pos > width) {
        size_t cut = pos + width;
        while (cut > pos && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
        if (cut == pos) cut = pos + width;
        out.push_back(text.substr(pos, cut - pos));
        pos = cut;
    }
    out.push_back(text.substr(pos));
    return out;
}

// Sanitized text with line breaks folded to spaces, for single-row fields.
static std::string one_line(const std::string& text) {
    std::string out = sanitize_terminal_text(text);
    std::replace(out.begin(), out.end(), '\n', ' ');
    return out;
}

static std::string pad(std::string s, size_t width) {
    if (s.size() < width) s.append(width - s.size(), ' ');
    return s;
}

Renderer::Renderer(RenderStyle style, std::ostream& out)
    : style_(std::move(style)), out_(out)
{}

std::string Renderer::styled(const std::string& style, const std::string& text) const {
    if (style.empty()) return text;
    return style + text + style_.reset;
}

std::string Renderer::render(const SessionState& state, ViewSize size) const {
    switch (state.connection_state) {
    case ConnectionState::Connecting:
        return "Connecting and loading channels...\n";
    case ConnectionState::Error:
        return styled(style_.error, "An error occurred: " + one_line(state.last_error)) +
               "\n\nPress Ctrl+C or type /quit to exit.\n";
    case ConnectionState::Live:
        break;
    }
    return render_live(state, size);
}

std::string Renderer::render_tabs(const SessionState& state) const {
    std::string line;
    for (size_t i = 0; i < state.channels.size(); ++i) {
        bool active = state.active_channel_index && *state.active_channel_index == i;
        std::string label = "#" + one_line(state.channels[i].name);
        if (style_.bracket_active_tab)
            line += active ? "[" + label + "]" : " " + label + " ";
        else
            line += styled(active ? style_.active_tab : style_.tab, " " + label + " ");
    }
    return line;
}

std::string Renderer::render_live(const SessionState& state, ViewSize size) const {
    int body_rows = std::max(1, size.height - 5);
    size_t chat_width = static_cast<size_t>(std::max(10, size.width - kUserPaneWidth - 3));

    // Chat column: newest lines at the bottom.
    std::vector<std::pair<std::string, const std::string*>> chat;
    const Channel* active = state.active_channel();
    const std::vector<Message>* msgs = active ? state.messages_for(active->id) : nullptr;
    size_t hidden = 0;
    if (!msgs) {
        chat.push_back({"Loading...", &style_.notice});
    } else {
        hidden = std::min(state.scroll_offset, msgs->size());
        for (auto it = msgs->begin(); it != msgs->end() - static_cast<std::ptrdiff_t>(hidden); ++it) {
            const std::string* st = it->username == state.self.username
                ? &style_.own_message : &style_.other_message;
            // Embedded line breaks become rows of their own.
            for (const auto& text_line : split(sanitize_terminal_text(format_message_line(*it)), '\n'))
                for (auto& piece : wrap(text_line, chat_width))
                    chat.push_back({std::move(piece), st});
        }
    }
    if (chat.size() > static_cast<size_t>(body_rows))
        chat.erase(chat.begin(), chat.end() - body_rows);

    // User column.
    std::vector<std::pair<std::string, const std::string*>> users;
    users.push_back({"Users Online", &style_.user_header});
    for (const auto& u : state.online_users) // std::set keeps them sorted
        users.push_back({"* " + one_line(u), &style_.online_user});

    std::ostringstream os;
    os << styled(style_.header, "Logged in as: " + one_line(state.self.username)) << "\n";
    os << render_tabs(state) << "\n";
    for (int row = 0; row < body_rows; ++row) {
        auto r = static_cast<size_t>(row);
        std::string left = r < chat.size() ? chat[r].first : "";
        const std::string* left_style = r < chat.size() ? chat[r].second : nullptr;
        os << (left_style ? styled(*left_style, pad(left, chat_width)) : pad(left, chat_width));
        os << kSeparator;
        if (r < users.size()) os << styled(*users[r].second, users[r].first);
        os << "\n";
    }
    if (!state.notice.empty())
        os << styled(style_.notice, one_line(state.notice));
    else if (hidden > 0)
        os << styled(style_.notice, std::to_string(hidden) + " newer message" +
                                    (hidden == 1 ? "" : "s") + " below, /bottom to return");
    os << "\n";
    os << "/next /prev channel, /up /down /top /bottom scroll, /quit exit\n";
    return os.str();
}

void Renderer::draw(const SessionState& state, ViewSize size) {
    out_ << "\033[H\033[2J" << render(state, size);
    if (state.connection_state == ConnectionState::Live) out_ << "> ";
    out_.flush();
}

} // namespace prisma
