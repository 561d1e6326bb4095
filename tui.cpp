#include "tui.hpp"
#include "icons.hpp"
#include "launcher.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/loop.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

namespace {

const std::chrono::milliseconds POLL_INTERVAL {50};

ftxui::Decorator entry_style(const Entry& entry) {
    if (entry.is_directory()) {
        return ftxui::color(ftxui::Color::Blue);
    }
    if (entry.is_symlink()) {
        return ftxui::color(ftxui::Color::Cyan);
    }
    if (entry.is_executable) {
        return ftxui::color(ftxui::Color::Green);
    }
    if (entry.is_hidden) {
        return ftxui::color(ftxui::Color::GrayDark);
    }
    return ftxui::nothing;
}

std::string root_title(const std::filesystem::path& root) {
    std::string name = root.filename().string();
    if (name.empty()) {
        name = root.string();
    }
    return " " + name + " ";
}

}

Key translate_event(const ftxui::Event& e) {
    if (e == ftxui::Event::ArrowUp)    return make_key(KeyCode::Up);
    if (e == ftxui::Event::ArrowDown)  return make_key(KeyCode::Down);
    if (e == ftxui::Event::ArrowLeft)  return make_key(KeyCode::Left);
    if (e == ftxui::Event::ArrowRight) return make_key(KeyCode::Right);
    if (e == ftxui::Event::Return)     return make_key(KeyCode::Enter);
    if (e == ftxui::Event::Escape)     return make_key(KeyCode::Escape);
    if (e == ftxui::Event::Backspace)  return make_key(KeyCode::Backspace);
    if (e == ftxui::Event::Home)       return make_key(KeyCode::Home);
    if (e == ftxui::Event::End)        return make_key(KeyCode::End);
    if (e == ftxui::Event::PageUp)     return make_key(KeyCode::PageUp);
    if (e == ftxui::Event::PageDown)   return make_key(KeyCode::PageDown);
    if (e == ftxui::Event::Tab)        return make_key(KeyCode::Tab);
    if (e == ftxui::Event::TabReverse) return make_key(KeyCode::BackTab);

    if (e.is_character()) {
        return make_char(e.character());
    }
    return make_key(KeyCode::Other);
}

ftxui::Element render_tree(std::shared_ptr<AppState> state, TreeLayout& layout) {
    const auto& entries = state->entries();
    layout.rows.resize(entries.size());

    ftxui::Elements lines;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const Entry& entry = entries[i];

        std::string indent;
        indent.append(static_cast<std::size_t>(entry.depth) * 2, ' ');

        ftxui::Element label = ftxui::text(icon_for(entry) + entry.name) | entry_style(entry);
        if (state->is_search_match(i)) {
            label = label | ftxui::underlined;
        }

        ftxui::Element row = ftxui::hbox({ftxui::text(indent), label, ftxui::filler()});
        if (i == state->cursor()) {
            row = row | ftxui::bgcolor(ftxui::Color::GrayDark) | ftxui::bold | ftxui::focus;
        }
        lines.push_back(row | ftxui::reflect(layout.rows[i]));
    }

    if (lines.empty()) {
        lines.push_back(ftxui::text("(empty)") | ftxui::dim);
    }

    return ftxui::window(ftxui::text(root_title(state->root())),
                         ftxui::vbox(std::move(lines)) | ftxui::vscroll_indicator | ftxui::yframe
                             | ftxui::reflect(layout.viewport))
           | ftxui::flex;
}

ftxui::Element render_status_line(std::shared_ptr<AppState> state) {
    const Mode& mode = state->mode();
    ftxui::Element left;

    if (const auto* input = std::get_if<InputMode>(&mode)) {
        std::string label;
        switch (input->kind) {
            case InputKind::CreateFile: label = "New file: "; break;
            case InputKind::CreateDir:  label = "New directory: "; break;
            case InputKind::Rename:     label = "Rename: "; break;
        }
        left = ftxui::hbox({
            ftxui::text(label + state->input_buffer()),
            ftxui::text(" ") | ftxui::inverted,
        }) | ftxui::color(ftxui::Color::Yellow);
    }
    else if (std::holds_alternative<SearchMode>(mode)) {
        const std::size_t count = state->search_matches().size();
        const std::size_t index = count > 0 ? state->search_index() + 1 : 0;
        left = ftxui::text("/" + state->search_query() + " (" + std::to_string(index) + "/" + std::to_string(count) + ")")
               | ftxui::color(ftxui::Color::Yellow);
    }
    else if (const auto* confirm = std::get_if<ConfirmMode>(&mode)) {
        std::string msg;
        if (confirm->kind == ConfirmKind::Delete) {
            const Entry* entry = state->current_entry();
            msg = "Delete \"" + (entry ? entry->name : std::string{}) + "\"? [y/N]";
        }
        else {
            const auto& pending = state->pending_paste();
            const std::string name = pending ? pending->destination.filename().string() : std::string{};
            msg = "\"" + name + "\" exists. Overwrite? [y/N]";
        }
        left = ftxui::text(msg) | ftxui::color(ftxui::Color::Red);
    }
    else if (const auto& status = state->status()) {
        left = ftxui::text(status->text)
               | ftxui::color(status->is_error ? ftxui::Color::Red : ftxui::Color::Green);
    }
    else {
        left = ftxui::text("");
    }

    ftxui::Element right = ftxui::text("");
    if (const auto& clip = state->clipboard()) {
        right = ftxui::text((clip->is_cut ? "[cut: " : "[copy: ") + clip->path.filename().string() + "]")
                | ftxui::dim;
    }

    return ftxui::hbox({left, ftxui::filler(), right});
}

ftxui::Element render_help_bar(std::shared_ptr<AppState> state, int width) {
    const Mode& mode = state->mode();
    std::string help;

    if (std::holds_alternative<NormalMode>(mode)) {
        if (width >= 95) {
            help = "[a]dd [A]dir [r]ename [d]el [y]ank [x]cut [p]aste [/]search [H]idden [R]efresh [?]help [q]uit";
        }
        else if (width >= 70) {
            help = "[a]dd [A]dir [r]en [d]el [y]ank [x] [p]aste [/] [H] [R]efresh [?] [q]";
        }
        else if (width >= 50) {
            help = "a:add A:dir r:ren d:del y/x/p:clip /:search ?:help q:quit";
        }
        else {
            help = "?:help q:quit";
        }
    }
    else if (std::holds_alternative<SearchMode>(mode)) {
        help = width >= 50 ? "[Enter]confirm [Down]next [Up]prev [Esc]cancel" : "Enter:ok Up/Down:nav Esc:cancel";
    }
    else if (std::holds_alternative<InputMode>(mode)) {
        help = "[Enter]confirm [Esc]cancel";
    }
    else if (std::holds_alternative<ConfirmMode>(mode)) {
        help = "[y]es [n]o";
    }
    else {
        help = "[Esc]close";
    }

    return ftxui::text(help) | ftxui::color(ftxui::Color::GrayDark);
}

ftxui::Element render_help_overlay() {
    auto heading = [](const std::string& s) { return ftxui::text(s) | ftxui::bold; };
    auto line = [](const std::string& s) { return ftxui::text(s); };

    return ftxui::window(ftxui::text(" Help "), ftxui::vbox({
        heading("Navigation"),
        line("  j/Down      Move down"),
        line("  k/Up        Move up"),
        line("  h/Left      Collapse / go to parent"),
        line("  l/Right/Ret Expand / open file"),
        line("  g/Home      Go to top"),
        line("  G/End       Go to bottom"),
        line("  E / W       Expand all / collapse all"),
        line(""),
        heading("File Operations"),
        line("  a           Create file"),
        line("  A           Create directory"),
        line("  r           Rename"),
        line("  d           Delete"),
        line("  y           Copy (yank)"),
        line("  x           Cut"),
        line("  p           Paste"),
        line(""),
        heading("Other"),
        line("  /           Search (n/N: next/previous match)"),
        line("  H           Toggle hidden files"),
        line("  P           Toggle preview"),
        line("  O           Open in file manager"),
        line("  R           Refresh tree"),
        line("  ?           Show this help"),
        line("  q           Quit"),
        line("  Mouse       Click: select, double/right click: open, wheel: scroll"),
        line(""),
        ftxui::text("Press Esc or ? to close") | ftxui::dim,
    })) | ftxui::clear_under | ftxui::center;
}

ftxui::Element render_preview_popup(const Preview& preview) {
    std::string name = preview.path.filename().string();

    std::string summary;
    if (preview.kind == PreviewKind::Directory) {
        summary = std::to_string(preview.children.size()) + " items";
    }
    else {
        summary = format_size(preview.size);
    }
    summary += "  " + format_permissions(preview.permissions);
    summary += "  " + (preview.has_modified ? format_time(preview.modified) : std::string{"---"});

    ftxui::Elements body;
    switch (preview.kind) {
        case PreviewKind::Text:
            for (const auto& l : preview.lines) {
                body.push_back(ftxui::text(l));
            }
            break;
        case PreviewKind::Directory:
            for (const auto& child : preview.children) {
                ftxui::Element e = ftxui::text(child.name + (child.is_directory ? "/" : ""));
                if (child.is_directory) {
                    e = e | ftxui::color(ftxui::Color::Blue);
                }
                body.push_back(e);
            }
            break;
        case PreviewKind::Binary:
            body.push_back(ftxui::text("(binary file)") | ftxui::dim);
            break;
        case PreviewKind::TooLarge:
            body.push_back(ftxui::text("(file too large)") | ftxui::dim);
            break;
        case PreviewKind::Empty:
            body.push_back(ftxui::text("(empty)") | ftxui::dim);
            break;
        case PreviewKind::Error:
            body.push_back(ftxui::text("Error: " + preview.error) | ftxui::color(ftxui::Color::Red));
            break;
    }

    return ftxui::window(ftxui::text(" Preview: " + name + " "), ftxui::vbox({
        ftxui::text(summary) | ftxui::dim,
        ftxui::separator(),
        ftxui::vbox(std::move(body)) | ftxui::yframe | ftxui::flex,
    })) | ftxui::size(ftxui::WIDTH, ftxui::LESS_THAN, 100)
        | ftxui::size(ftxui::HEIGHT, ftxui::LESS_THAN, 36)
        | ftxui::clear_under
        | ftxui::center;
}

ftxui::Element render_app(std::shared_ptr<AppState> state, TreeLayout& layout) {
    const int width = ftxui::Terminal::Size().dimx;

    ftxui::Element base = ftxui::vbox({
        render_tree(state, layout),
        render_status_line(state),
        render_help_bar(state, width),
    });

    if (std::holds_alternative<HelpMode>(state->mode())) {
        return ftxui::dbox({base, render_help_overlay()});
    }
    if (const Preview* preview = state->current_preview()) {
        return ftxui::dbox({base, render_preview_popup(*preview)});
    }
    return base;
}

bool handle_mouse(ftxui::Event e, std::shared_ptr<AppState> state, const TreeLayout& layout) {
    const ftxui::Mouse& mouse = e.mouse();

    if (mouse.button == ftxui::Mouse::WheelUp) {
        state->scroll(-1);
        return true;
    }
    if (mouse.button == ftxui::Mouse::WheelDown) {
        state->scroll(1);
        return true;
    }
    if (mouse.motion != ftxui::Mouse::Pressed || !layout.viewport.Contain(mouse.x, mouse.y)) {
        return false;
    }

    // Rows scrolled out of the viewport keep boxes outside it, so only visible rows match.
    for (std::size_t i = 0; i < layout.rows.size(); ++i) {
        if (!layout.rows[i].Contain(mouse.x, mouse.y)) {
            continue;
        }
        if (mouse.button == ftxui::Mouse::Left) {
            state->click(i, std::chrono::steady_clock::now());
            return true;
        }
        if (mouse.button == ftxui::Mouse::Right) {
            state->activate(i);
            return true;
        }
        return false;
    }
    return false;
}

bool handle_event(ftxui::Event e, ftxui::ScreenInteractive& screen, std::shared_ptr<AppState> state, const TreeLayout& layout) {
    bool handled { false };
    if (e.is_mouse()) {
        handled = handle_mouse(e, state, layout);
    }
    else {
        const Key key = translate_event(e);
        if (key.code == KeyCode::Other) {
            return false;
        }
        handled = state->handle_key(key);
    }

    if (state->should_quit()) {
        screen.Exit();
        return true;
    }

    if (auto file = state->take_pending_editor_file()) {
        std::string error;
        bool ok { false };
        screen.WithRestoredIO([&] { ok = run_editor(*file, error); })();
        if (ok) {
            state->refresh();
        }
        else {
            state->set_status("Editor: " + error, true);
        }
    }

    if (auto dir = state->take_pending_reveal()) {
        std::string error;
        if (open_in_file_manager(*dir, error)) {
            state->set_status("Opened in file manager: " + dir->string());
        }
        else {
            state->set_status("Cannot open file manager: " + error, true);
        }
    }

    return handled;
}

void run_tui(std::shared_ptr<AppState> state) {
    auto screen = ftxui::ScreenInteractive::Fullscreen();

    TreeLayout layout {};

    ftxui::Component renderer = ftxui::Renderer([state, &layout] {
        return render_app(state, layout);
    });

    ftxui::Component app = ftxui::CatchEvent(renderer, [&screen, state, &layout](ftxui::Event e) {
        return handle_event(e, screen, state, layout);
    });

    // One poll cycle: drain input, redraw if the status message just expired.
    ftxui::Loop loop(&screen, app);
    while (!loop.HasQuitted()) {
        loop.RunOnce();
        if (state->clear_expired_status(std::chrono::steady_clock::now())) {
            screen.PostEvent(ftxui::Event::Custom);
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
    spdlog::debug("event loop finished");
}
