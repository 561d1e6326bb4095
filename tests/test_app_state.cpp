#include "test_util.hpp"

#include "app_state.hpp"
#include "file_ops.hpp"

#include <chrono>

namespace fs = std::filesystem;

static void press(AppState& state, const std::string& keys) {
    for (char c : keys) {
        state.handle_key(make_char(std::string(1, c)));
    }
}

static bool status_is_error(const AppState& state) {
    return state.status() && state.status()->is_error;
}

static bool status_contains(const AppState& state, const std::string& text) {
    return state.status() && state.status()->text.find(text) != std::string::npos;
}

static void test_create_inside_expanded_directory() {
    TempDir tmp;
    tmp.mkdir("A");
    tmp.touch("b.txt");

    AppState state(tmp.path());
    assert(names_of(state.entries()) == names({"A", "b.txt"}));
    assert(state.cursor() == 0);

    state.toggle_expand();
    assert(state.expanded().count(tmp.path() / "A") == 1);

    assert(state.create(InputKind::CreateFile, "x.txt"));
    assert(fs::is_regular_file(tmp.path() / "A" / "x.txt"));
    assert(names_of(state.entries()) == names({"A", "x.txt", "b.txt"}));
    assert(state.entries()[1].depth == 1);
    assert(state.cursor() == 1);
    assert(status_contains(state, "Created: x.txt"));
    assert(!status_is_error(state));
}

static void test_create_in_collapsed_directory_expands_it() {
    TempDir tmp;
    tmp.mkdir("A");

    AppState state(tmp.path());
    assert(state.create(InputKind::CreateDir, "sub"));
    assert(fs::is_directory(tmp.path() / "A" / "sub"));
    assert(names_of(state.entries()) == names({"A", "sub"}));
    assert(state.current_entry()->path == tmp.path() / "A" / "sub");
    assert(status_contains(state, "Created directory: sub"));
}

static void test_yank_paste_keeps_clipboard() {
    TempDir tmp;
    tmp.mkdir("dest");
    tmp.touch("f.txt", "data");

    AppState state(tmp.path());
    state.move_cursor(1);
    state.yank();
    assert(state.clipboard() && !state.clipboard()->is_cut);

    state.go_to_top();
    assert(state.paste());
    assert(tmp.read("dest/f.txt") == "data");
    assert(tmp.read("f.txt") == "data");
    assert(state.clipboard().has_value());
    assert(names_of(state.entries()) == names({"dest", "f.txt", "f.txt"}));
    assert(state.current_entry()->path == tmp.path() / "dest" / "f.txt");
    assert(status_contains(state, "Pasted: f.txt"));
}

static void test_cut_paste_clears_clipboard() {
    TempDir tmp;
    tmp.mkdir("dest");
    tmp.touch("g.txt", "moved");

    AppState state(tmp.path());
    state.move_cursor(1);
    state.cut();
    assert(state.clipboard() && state.clipboard()->is_cut);

    state.go_to_top();
    assert(state.paste());
    assert(!path_exists(tmp.path() / "g.txt"));
    assert(tmp.read("dest/g.txt") == "moved");
    assert(!state.clipboard().has_value());
    assert(names_of(state.entries()) == names({"dest", "g.txt"}));
    assert(state.entries()[1].depth == 1);
    assert(status_contains(state, "Moved: g.txt"));
}

static void test_search_wraps() {
    TempDir tmp;
    tmp.touch("apple");
    tmp.touch("box");
    tmp.touch("taxi");

    AppState state(tmp.path());
    state.set_search_query("x");
    assert(state.search_matches() == std::vector<std::size_t>({1, 2}));
    assert(state.cursor() == 1);
    assert(!state.is_search_match(0) && state.is_search_match(2));

    state.search_next();
    assert(state.cursor() == 2);
    state.search_next();
    assert(state.cursor() == 1);
    state.search_previous();
    assert(state.cursor() == 2);

    state.set_search_query("zzz");
    assert(state.search_matches().empty());
    assert(state.cursor() == 2);
}

static void test_search_through_keys() {
    TempDir tmp;
    tmp.touch("apple");
    tmp.touch("BOX");
    tmp.touch("taxi");

    AppState state(tmp.path());
    press(state, "/");
    assert(std::holds_alternative<SearchMode>(state.mode()));
    press(state, "x");
    assert(state.search_query() == "x");
    assert(state.cursor() == 1);

    state.handle_key(make_key(KeyCode::Tab));
    assert(state.cursor() == 2);
    state.handle_key(make_key(KeyCode::BackTab));
    assert(state.cursor() == 1);
    state.handle_key(make_key(KeyCode::Down));
    state.handle_key(make_key(KeyCode::Enter));
    assert(std::holds_alternative<NormalMode>(state.mode()));
    assert(state.cursor() == 2);
    assert(state.search_query() == "x");

    press(state, "n");
    assert(state.cursor() == 1);
    press(state, "N");
    assert(state.cursor() == 2);

    state.handle_key(make_key(KeyCode::Escape));
    assert(state.search_query().empty());
    assert(state.search_matches().empty());

    press(state, "/p");
    state.handle_key(make_key(KeyCode::Escape));
    assert(std::holds_alternative<NormalMode>(state.mode()));
    assert(state.search_query().empty());
}

static void test_cursor_stays_in_bounds() {
    TempDir tmp;
    tmp.touch("a");
    tmp.touch("b");
    tmp.touch("c");

    AppState state(tmp.path());
    state.move_cursor(-5);
    assert(state.cursor() == 0);
    state.move_cursor(100);
    assert(state.cursor() == 2);
    state.handle_key(make_key(KeyCode::PageUp));
    assert(state.cursor() == 0);
    state.handle_key(make_key(KeyCode::End));
    assert(state.cursor() == 2);
    press(state, "g");
    assert(state.cursor() == 0);
    press(state, "jj");
    assert(state.cursor() == 2);
    press(state, "k");
    assert(state.cursor() == 1);

    // Removing the last entry out of band clamps the cursor on refresh.
    state.go_to_bottom();
    fs::remove(tmp.path() / "c");
    assert(state.refresh());
    assert(state.entries().size() == 2);
    assert(state.cursor() == 1);
}

static void test_empty_directory() {
    TempDir tmp;
    AppState state(tmp.path());
    assert(state.entries().empty());
    assert(state.cursor() == 0);
    assert(state.current_entry() == nullptr);

    state.move_cursor(3);
    assert(state.cursor() == 0);
    assert(!state.enter_mode(InputMode{InputKind::Rename}));
    assert(!state.enter_mode(ConfirmMode{ConfirmKind::Delete}));
    assert(!state.enter_mode(ConfirmMode{ConfirmKind::Overwrite}));
    assert(std::holds_alternative<NormalMode>(state.mode()));

    assert(state.create(InputKind::CreateFile, "first"));
    assert(names_of(state.entries()) == names({"first"}));
}

static void test_input_mode_keys() {
    TempDir tmp;
    tmp.touch("old.txt");

    AppState state(tmp.path());
    press(state, "r");
    const auto* input = std::get_if<InputMode>(&state.mode());
    assert(input && input->kind == InputKind::Rename);
    assert(state.input_buffer() == "old.txt");

    state.handle_key(make_key(KeyCode::Escape));
    assert(std::holds_alternative<NormalMode>(state.mode()));
    assert(state.input_buffer().empty());

    press(state, "a");
    assert(state.input_buffer().empty());
    press(state, "neww");
    state.handle_key(make_key(KeyCode::Backspace));
    assert(state.input_buffer() == "new");
    state.handle_key(make_key(KeyCode::Enter));
    assert(std::holds_alternative<NormalMode>(state.mode()));
    assert(fs::is_regular_file(tmp.path() / "new"));

    // Multi-byte characters are removed whole.
    press(state, "A");
    state.handle_key(make_char("d"));
    state.handle_key(make_char("\xc3\xa9"));
    state.handle_key(make_key(KeyCode::Backspace));
    assert(state.input_buffer() == "d");
    state.handle_key(make_key(KeyCode::Escape));

    // Enter on an empty buffer does nothing.
    const std::size_t before = state.entries().size();
    press(state, "a");
    state.handle_key(make_key(KeyCode::Enter));
    assert(std::holds_alternative<NormalMode>(state.mode()));
    assert(state.entries().size() == before);
}

static void test_help_and_quit() {
    TempDir tmp;
    tmp.touch("a");

    AppState state(tmp.path());
    press(state, "?");
    assert(std::holds_alternative<HelpMode>(state.mode()));
    press(state, "j");
    assert(std::holds_alternative<HelpMode>(state.mode()));
    press(state, "q");
    assert(std::holds_alternative<NormalMode>(state.mode()));
    assert(!state.should_quit());

    press(state, "q");
    assert(state.should_quit());
}

static void test_delete_confirmation() {
    TempDir tmp;
    tmp.touch("a.txt");
    tmp.touch("b.txt");

    AppState state(tmp.path());
    press(state, "d");
    assert(std::holds_alternative<ConfirmMode>(state.mode()));
    press(state, "n");
    assert(std::holds_alternative<NormalMode>(state.mode()));
    assert(path_exists(tmp.path() / "a.txt"));
    assert(status_contains(state, "Delete cancelled"));

    press(state, "dy");
    assert(!path_exists(tmp.path() / "a.txt"));
    assert(names_of(state.entries()) == names({"b.txt"}));
    assert(state.cursor() == 0);
    assert(status_contains(state, "Deleted: a.txt"));
}

static void test_delete_directory_clears_state() {
    TempDir tmp;
    tmp.touch("dir/inner/file");
    tmp.touch("z.txt");
    const fs::path dir = tmp.path() / "dir";

    AppState state(tmp.path());
    state.toggle_expand();
    state.move_cursor(1);
    state.toggle_expand();
    assert(state.expanded().size() == 2);
    state.move_cursor(1);
    state.yank();
    assert(state.clipboard()->path == dir / "inner" / "file");

    state.go_to_top();
    assert(state.remove());
    assert(!path_exists(dir));
    assert(state.expanded().empty());
    assert(!state.clipboard().has_value());
    assert(names_of(state.entries()) == names({"z.txt"}));
}

static void test_paste_overwrite_flow() {
    TempDir tmp;
    tmp.touch("dest/f.txt", "old");
    tmp.touch("f.txt", "new");

    AppState state(tmp.path());
    state.move_cursor(1);
    state.yank();
    state.go_to_top();

    assert(!state.paste());
    const auto* confirm = std::get_if<ConfirmMode>(&state.mode());
    assert(confirm && confirm->kind == ConfirmKind::Overwrite);
    assert(state.pending_paste().has_value());
    assert(state.pending_paste()->destination == tmp.path() / "dest" / "f.txt");

    press(state, "n");
    assert(std::holds_alternative<NormalMode>(state.mode()));
    assert(!state.pending_paste().has_value());
    assert(tmp.read("dest/f.txt") == "old");
    assert(status_contains(state, "Paste cancelled"));

    state.go_to_top();
    assert(!state.paste());
    press(state, "y");
    assert(std::holds_alternative<NormalMode>(state.mode()));
    assert(tmp.read("dest/f.txt") == "new");
    assert(state.clipboard().has_value());
}

static void test_paste_refusals() {
    TempDir tmp;
    tmp.mkdir("d");
    tmp.touch("f.txt");

    AppState state(tmp.path());
    state.yank();
    state.toggle_expand();
    assert(state.current_entry()->name == "d");
    assert(!state.paste());
    assert(status_is_error(state));
    assert(status_contains(state, "into itself"));
    assert(!path_exists(tmp.path() / "d" / "d"));

    state.go_to_bottom();
    state.yank();
    assert(!state.paste());
    assert(status_contains(state, "same"));

    AppState empty_clip(tmp.path());
    assert(!empty_clip.paste());
    assert(status_contains(empty_clip, "Clipboard is empty"));

    // The source vanished after it was yanked.
    state.yank();
    fs::remove(tmp.path() / "f.txt");
    state.go_to_top();
    assert(!state.paste());
    assert(status_is_error(state));
    assert(!state.clipboard().has_value());
}

static void test_invalid_names() {
    TempDir tmp;
    tmp.touch("a.txt");
    tmp.touch("b.txt");

    AppState state(tmp.path());
    assert(!state.create(InputKind::CreateFile, "x/y"));
    assert(status_is_error(state));
    assert(status_contains(state, "invalid name"));

    assert(!state.create(InputKind::CreateDir, ".."));
    assert(!state.rename(""));

    assert(!state.rename("b.txt"));
    assert(status_contains(state, "already exists"));
    assert(path_exists(tmp.path() / "a.txt"));

    assert(!state.create(InputKind::CreateFile, "b.txt"));
    assert(status_contains(state, "already exists"));
}

static void test_rename_updates_expansion_and_clipboard() {
    TempDir tmp;
    tmp.touch("old/inner/f.txt");

    AppState state(tmp.path());
    state.toggle_expand();
    state.move_cursor(1);
    state.toggle_expand();
    assert(names_of(state.entries()) == names({"old", "inner", "f.txt"}));
    state.move_cursor(1);
    state.yank();

    state.go_to_top();
    assert(state.rename("new"));
    const fs::path renamed = tmp.path() / "new";
    assert(state.expanded().count(renamed) == 1);
    assert(state.expanded().count(renamed / "inner") == 1);
    assert(state.expanded().count(tmp.path() / "old") == 0);
    assert(names_of(state.entries()) == names({"new", "inner", "f.txt"}));
    assert(state.cursor() == 0);
    assert(state.clipboard()->path == renamed / "inner" / "f.txt");
    assert(status_contains(state, "Renamed to: new"));
}

static void test_refresh_failure_keeps_snapshot() {
    TempDir tmp;
    tmp.touch("root/a");
    tmp.touch("root/b");
    const fs::path root = tmp.path() / "root";

    AppState state(root);
    state.move_cursor(1);
    fs::remove_all(root);

    assert(!state.refresh());
    assert(names_of(state.entries()) == names({"a", "b"}));
    assert(state.cursor() == 1);
    assert(status_is_error(state));
    assert(!state.status()->expires_at.has_value());
    assert(status_contains(state, "Refresh failed"));
    assert(!state.clear_expired_status(std::chrono::steady_clock::now() + std::chrono::hours(1)));

    tmp.touch("root/c");
    assert(state.refresh());
    assert(!state.status().has_value());
    assert(names_of(state.entries()) == names({"c"}));
    assert(state.cursor() == 0);
}

static void test_status_expiry() {
    TempDir tmp;
    AppState state(tmp.path());
    assert(!state.status_remaining(std::chrono::steady_clock::now()).has_value());

    state.set_status("hello");
    const auto now = std::chrono::steady_clock::now();
    auto left = state.status_remaining(now);
    assert(left && left->count() > 0 && *left <= STATUS_LIFETIME);

    assert(!state.clear_expired_status(now));
    assert(state.status().has_value());
    assert(state.clear_expired_status(now + STATUS_LIFETIME + std::chrono::seconds(1)));
    assert(!state.status().has_value());
}

static void test_hidden_toggle() {
    TempDir tmp;
    tmp.touch(".h");
    tmp.touch("a");

    AppState state(tmp.path());
    assert(names_of(state.entries()) == names({"a"}));
    press(state, "H");
    assert(state.show_hidden());
    assert(names_of(state.entries()) == names({".h", "a"}));
    assert(state.current_entry()->name == "a");
    assert(status_contains(state, "Showing hidden files"));
    press(state, "H");
    assert(names_of(state.entries()) == names({"a"}));
    assert(status_contains(state, "Hiding hidden files"));

    AppState shown(tmp.path(), true);
    assert(shown.entries().size() == 2);
}

static void test_collapse_or_parent() {
    TempDir tmp;
    tmp.touch("A/x.txt");
    tmp.touch("b.txt");

    AppState state(tmp.path());
    state.handle_key(make_key(KeyCode::Right));
    assert(names_of(state.entries()) == names({"A", "x.txt", "b.txt"}));
    state.move_cursor(1);

    state.handle_key(make_key(KeyCode::Left));
    assert(state.cursor() == 0);
    state.handle_key(make_key(KeyCode::Left));
    assert(names_of(state.entries()) == names({"A", "b.txt"}));
    assert(state.cursor() == 0);

    state.go_to_bottom();
    press(state, "h");
    assert(state.cursor() == 1);
}

static void test_expand_and_collapse_all() {
    TempDir tmp;
    tmp.touch("A/B/c.txt");
    tmp.touch("d.txt");

    AppState state(tmp.path());
    press(state, "E");
    assert(names_of(state.entries()) == names({"A", "B", "c.txt", "d.txt"}));
    assert(state.expanded().count(tmp.path() / "A") == 1);
    assert(state.expanded().count(tmp.path() / "A" / "B") == 1);
    assert(status_contains(state, "Expanded all (4 entries)"));

    press(state, "W");
    assert(names_of(state.entries()) == names({"A", "d.txt"}));
    assert(state.expanded().empty());
}

static void test_open_and_reveal_requests() {
    TempDir tmp;
    tmp.touch("dir/inside.txt");
    tmp.touch("file.txt");

    AppState state(tmp.path());
    state.go_to_bottom();
    state.handle_key(make_key(KeyCode::Enter));
    auto file = state.take_pending_editor_file();
    assert(file && *file == tmp.path() / "file.txt");
    assert(!state.take_pending_editor_file().has_value());

    press(state, "O");
    auto reveal = state.take_pending_reveal();
    assert(reveal && *reveal == tmp.path());

    state.go_to_top();
    state.handle_key(make_key(KeyCode::Enter));
    assert(!state.take_pending_editor_file().has_value());
    assert(state.entries().size() == 3);
}

static void test_preview_follows_cursor() {
    TempDir tmp;
    tmp.touch("a.txt", "line1\nline2\n");
    tmp.touch("b.txt", "other");

    AppState state(tmp.path());
    assert(state.current_preview() == nullptr);
    press(state, "P");
    assert(state.show_preview());

    const Preview* preview = state.current_preview();
    assert(preview && preview->kind == PreviewKind::Text);
    assert(preview->lines.size() == 2);

    press(state, "j");
    preview = state.current_preview();
    assert(preview && preview->path == tmp.path() / "b.txt");

    press(state, "P");
    assert(state.current_preview() == nullptr);
}

static void test_overwrite_replaces_link_not_its_target() {
    TempDir tmp;
    TempDir outside;
    outside.touch("secret.txt", "SECRET");
    tmp.touch("root/f.txt", "payload");
    tmp.mkdir("root/dest");
    const fs::path root = tmp.path() / "root";
    const fs::path link = root / "dest" / "f.txt";
    fs::create_symlink(outside.path() / "secret.txt", link);

    AppState state(root);
    state.move_cursor(1);
    state.yank();
    state.go_to_top();

    assert(!state.paste());
    assert(std::holds_alternative<ConfirmMode>(state.mode()));
    press(state, "y");

    assert(outside.read("secret.txt") == "SECRET");
    assert(!fs::is_symlink(link));
    assert(tmp.read("root/dest/f.txt") == "payload");
}

static void test_failed_delete_keeps_refresh_error() {
    TempDir tmp;
    tmp.touch("root/a.txt");
    const fs::path root = tmp.path() / "root";

    AppState state(root);
    fs::remove_all(root);

    assert(!state.remove());
    assert(names_of(state.entries()) == names({"a.txt"}));
    assert(status_is_error(state));
    assert(!state.status()->expires_at.has_value());
    assert(status_contains(state, "Refresh failed"));
}

static void test_mouse_selection() {
    TempDir tmp;
    tmp.touch("D/x");
    tmp.touch("a");
    tmp.touch("b");
    tmp.touch("c");

    AppState state(tmp.path());
    assert(names_of(state.entries()) == names({"D", "a", "b", "c"}));
    assert(!state.select_index(4));
    assert(state.cursor() == 0);
    assert(state.select_index(2));
    assert(state.cursor() == 2);

    const auto t0 = std::chrono::steady_clock::now();
    state.click(1, t0);
    assert(state.cursor() == 1);
    state.click(0, t0);
    assert(state.cursor() == 0);
    assert(state.entries().size() == 4);

    // Second click on the same row inside the interval opens the directory.
    state.click(0, t0 + std::chrono::milliseconds(100));
    assert(names_of(state.entries()) == names({"D", "x", "a", "b", "c"}));

    // The pair was consumed; a slow second click does nothing either.
    state.click(0, t0 + std::chrono::milliseconds(200));
    state.click(0, t0 + std::chrono::milliseconds(200) + DOUBLE_CLICK_INTERVAL);
    assert(state.entries().size() == 5);

    state.click(7, t0);
    assert(state.cursor() == 0);

    state.activate(1);
    auto file = state.take_pending_editor_file();
    assert(file && *file == tmp.path() / "D" / "x");

    state.activate(0);
    assert(names_of(state.entries()) == names({"D", "a", "b", "c"}));
    assert(state.cursor() == 0);
}

static void test_mouse_scroll_and_modes() {
    TempDir tmp;
    for (const char* n : {"a", "b", "c", "d", "e"}) {
        tmp.touch(n);
    }

    AppState state(tmp.path());
    state.scroll(1);
    assert(state.cursor() == static_cast<std::size_t>(SCROLL_STEP));
    state.scroll(1);
    assert(state.cursor() == 4);
    state.scroll(-1);
    assert(state.cursor() == 1);

    press(state, "/");
    state.click(3, std::chrono::steady_clock::now());
    state.activate(3);
    state.scroll(1);
    assert(state.cursor() == 1);
    assert(!state.take_pending_editor_file().has_value());
}

int main() {
    test_create_inside_expanded_directory();
    test_create_in_collapsed_directory_expands_it();
    test_yank_paste_keeps_clipboard();
    test_cut_paste_clears_clipboard();
    test_search_wraps();
    test_search_through_keys();
    test_cursor_stays_in_bounds();
    test_empty_directory();
    test_input_mode_keys();
    test_help_and_quit();
    test_delete_confirmation();
    test_delete_directory_clears_state();
    test_paste_overwrite_flow();
    test_paste_refusals();
    test_invalid_names();
    test_rename_updates_expansion_and_clipboard();
    test_refresh_failure_keeps_snapshot();
    test_status_expiry();
    test_hidden_toggle();
    test_collapse_or_parent();
    test_expand_and_collapse_all();
    test_open_and_reveal_requests();
    test_preview_follows_cursor();
    test_overwrite_replaces_link_not_its_target();
    test_failed_delete_keeps_refresh_error();
    test_mouse_selection();
    test_mouse_scroll_and_modes();
    return 0;
}
