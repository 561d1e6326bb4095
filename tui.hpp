#ifndef TUI_H
#define TUI_H

#include "app_state.hpp"

#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/box.hpp>

#include <memory>
#include <vector>

// Screen boxes of the tree viewport and of each entry row from the last render,
// used to map mouse positions back to entries.
struct TreeLayout {
    ftxui::Box viewport {};
    std::vector<ftxui::Box> rows {};
};

Key translate_event(const ftxui::Event& e);

ftxui::Element render_tree(std::shared_ptr<AppState> state, TreeLayout& layout);

ftxui::Element render_status_line(std::shared_ptr<AppState> state);

ftxui::Element render_help_bar(std::shared_ptr<AppState> state, int width);

ftxui::Element render_help_overlay();

ftxui::Element render_preview_popup(const Preview& preview);

ftxui::Element render_app(std::shared_ptr<AppState> state, TreeLayout& layout);

bool handle_mouse(ftxui::Event e, std::shared_ptr<AppState> state, const TreeLayout& layout);

bool handle_event(ftxui::Event e, ftxui::ScreenInteractive& screen, std::shared_ptr<AppState> state, const TreeLayout& layout);

void run_tui(std::shared_ptr<AppState> state);

#endif
