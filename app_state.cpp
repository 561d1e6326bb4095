#include "app_state.hpp"
#include "file_ops.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace fs = std::filesystem;

namespace {

const char* mode_name(const Mode& mode) {
    static const char* names[] = {"normal", "search", "input", "confirm", "help"};
    return names[mode.index()];
}

void pop_utf8(std::string& s) {
    if (s.empty()) {
        return;
    }
    std::size_t i = s.size() - 1;
    while (i > 0 && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) {
        --i;
    }
    s.erase(i);
}

// Re-roots `path` from `from` onto `to`; `path` must lie within `from`.
fs::path rebase(const fs::path& path, const fs::path& from, const fs::path& to) {
    const fs::path rel = path.lexically_relative(from);
    if (rel.empty() || rel == ".") {
        return to;
    }
    return to / rel;
}

bool is_yes(const Key& key) {
    return key.code == KeyCode::Character && (key.text == "y" || key.text == "Y");
}

}

Key make_key(KeyCode code) {
    return Key{code, {}};
}

Key make_char(const std::string& text) {
    return Key{KeyCode::Character, text};
}

AppState::AppState(const fs::path& root, bool show_hidden)
    : m_root {root}, m_show_hidden {show_hidden}
{
    reload(std::nullopt);
}

const Entry* AppState::current_entry() const {
    if (m_cursor >= m_entries.size()) {
        return nullptr;
    }
    return &m_entries[m_cursor];
}

bool AppState::is_search_match(std::size_t index) const {
    return std::binary_search(m_search_matches.begin(), m_search_matches.end(), index);
}

std::optional<std::chrono::milliseconds> AppState::status_remaining(std::chrono::steady_clock::time_point now) const {
    if (!m_status || !m_status->expires_at) {
        return std::nullopt;
    }
    if (now >= *m_status->expires_at) {
        return std::chrono::milliseconds {0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*m_status->expires_at - now);
}

const Preview* AppState::current_preview() const {
    const Entry* entry = current_entry();
    if (!m_show_preview || !entry) {
        return nullptr;
    }
    auto it = m_preview_cache.find(entry->path);
    if (it == m_preview_cache.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<fs::path> AppState::take_pending_editor_file() {
    std::optional<fs::path> out = std::move(m_pending_editor_file);
    m_pending_editor_file.reset();
    return out;
}

std::optional<fs::path> AppState::take_pending_reveal() {
    std::optional<fs::path> out = std::move(m_pending_reveal);
    m_pending_reveal.reset();
    return out;
}

bool AppState::handle_key(const Key& key) {
    bool handled { false };

    if (std::holds_alternative<NormalMode>(m_mode)) {
        handled = handle_normal_key(key);
    }
    else if (std::holds_alternative<SearchMode>(m_mode)) {
        handled = handle_search_key(key);
    }
    else if (const auto* input = std::get_if<InputMode>(&m_mode)) {
        handled = handle_input_key(input->kind, key);
    }
    else if (const auto* confirm = std::get_if<ConfirmMode>(&m_mode)) {
        handled = handle_confirm_key(confirm->kind, key);
    }
    else {
        handled = handle_help_key(key);
    }

    sync_preview();
    return handled;
}

bool AppState::handle_normal_key(const Key& key) {
    auto activate = [this] {
        const Entry* entry = current_entry();
        if (!entry) {
            return;
        }
        if (entry->is_directory()) {
            toggle_expand();
        }
        else {
            request_open();
        }
    };

    if (key.code == KeyCode::Character) {
        const std::string& c = key.text;
        if (c == "q") {
            m_should_quit = true;
        }
        else if (c == "j") { move_cursor(1); }
        else if (c == "k") { move_cursor(-1); }
        else if (c == "h") { collapse_or_parent(); }
        else if (c == "l") { activate(); }
        else if (c == "g") { go_to_top(); }
        else if (c == "G") { go_to_bottom(); }
        else if (c == "H") { toggle_hidden(); }
        else if (c == "R") {
            if (refresh()) {
                set_status("Refreshed");
            }
        }
        else if (c == "E") { expand_all(); }
        else if (c == "W") { collapse_all(); }
        else if (c == "P") { toggle_preview(); }
        else if (c == "O") { request_reveal(); }
        else if (c == "/") { enter_mode(SearchMode{}); }
        else if (c == "a") { enter_mode(InputMode{InputKind::CreateFile}); }
        else if (c == "A") { enter_mode(InputMode{InputKind::CreateDir}); }
        else if (c == "r") { enter_mode(InputMode{InputKind::Rename}); }
        else if (c == "d") { enter_mode(ConfirmMode{ConfirmKind::Delete}); }
        else if (c == "?") { enter_mode(HelpMode{}); }
        else if (c == "y") { yank(); }
        else if (c == "x") { cut(); }
        else if (c == "p") { paste(); }
        else if (c == "n") { search_next(); }
        else if (c == "N") { search_previous(); }
        else {
            return false;
        }
        return true;
    }

    switch (key.code) {
        case KeyCode::Down:     move_cursor(1); return true;
        case KeyCode::Up:       move_cursor(-1); return true;
        case KeyCode::PageDown: move_cursor(PAGE_SIZE); return true;
        case KeyCode::PageUp:   move_cursor(-PAGE_SIZE); return true;
        case KeyCode::Home:     go_to_top(); return true;
        case KeyCode::End:      go_to_bottom(); return true;
        case KeyCode::Left:     collapse_or_parent(); return true;
        case KeyCode::Right:
        case KeyCode::Enter:    activate(); return true;
        case KeyCode::Escape:
            set_search_query("");
            return true;
        default:
            return false;
    }
}

bool AppState::handle_search_key(const Key& key) {
    switch (key.code) {
        case KeyCode::Escape:
            m_search_query.clear();
            m_search_matches.clear();
            m_search_index = 0;
            m_mode = NormalMode{};
            return true;
        case KeyCode::Enter:
            m_mode = NormalMode{};
            if (!m_search_matches.empty()) {
                m_cursor = m_search_matches[m_search_index];
            }
            return true;
        case KeyCode::Backspace:
            pop_utf8(m_search_query);
            update_search_results(true);
            return true;
        case KeyCode::Down:
        case KeyCode::Tab:
            search_next();
            return true;
        case KeyCode::Up:
        case KeyCode::BackTab:
            search_previous();
            return true;
        case KeyCode::Character:
            m_search_query += key.text;
            update_search_results(true);
            return true;
        default:
            return false;
    }
}

bool AppState::handle_input_key(InputKind kind, const Key& key) {
    switch (key.code) {
        case KeyCode::Escape:
            m_input_buffer.clear();
            m_mode = NormalMode{};
            return true;
        case KeyCode::Enter: {
            const std::string name = m_input_buffer;
            m_input_buffer.clear();
            m_mode = NormalMode{};
            if (name.empty()) {
                return true;
            }
            if (kind == InputKind::Rename) {
                rename(name);
            }
            else {
                create(kind, name);
            }
            return true;
        }
        case KeyCode::Backspace:
            pop_utf8(m_input_buffer);
            return true;
        case KeyCode::Character:
            m_input_buffer += key.text;
            return true;
        default:
            return false;
    }
}

bool AppState::handle_confirm_key(ConfirmKind kind, const Key& key) {
    const bool yes = is_yes(key);
    m_mode = NormalMode{};

    if (kind == ConfirmKind::Delete) {
        if (yes) {
            remove();
        }
        else {
            set_status("Delete cancelled");
        }
        return true;
    }

    if (yes) {
        confirm_overwrite();
    }
    else {
        m_pending_paste.reset();
        set_status("Paste cancelled");
    }
    return true;
}

bool AppState::handle_help_key(const Key& key) {
    if (key.code == KeyCode::Escape || (key.code == KeyCode::Character && (key.text == "q" || key.text == "?"))) {
        m_mode = NormalMode{};
        return true;
    }
    return false;
}

bool AppState::enter_mode(const Mode& mode) {
    if (std::holds_alternative<SearchMode>(mode)) {
        m_search_query.clear();
        m_search_matches.clear();
        m_search_index = 0;
    }
    else if (const auto* input = std::get_if<InputMode>(&mode)) {
        if (input->kind == InputKind::Rename) {
            const Entry* entry = current_entry();
            if (!entry) {
                return false;
            }
            m_input_buffer = entry->name;
        }
        else {
            m_input_buffer.clear();
        }
    }
    else if (const auto* confirm = std::get_if<ConfirmMode>(&mode)) {
        if (confirm->kind == ConfirmKind::Delete && !current_entry()) {
            return false;
        }
        if (confirm->kind == ConfirmKind::Overwrite && !m_pending_paste) {
            return false;
        }
    }

    spdlog::debug("mode {} -> {}", mode_name(m_mode), mode_name(mode));
    m_mode = mode;
    return true;
}

void AppState::move_cursor(int delta) {
    if (m_entries.empty()) {
        m_cursor = 0;
        return;
    }
    const long long last = static_cast<long long>(m_entries.size()) - 1;
    long long next = static_cast<long long>(m_cursor) + delta;
    next = std::max(0LL, std::min(next, last));
    m_cursor = static_cast<std::size_t>(next);
}

void AppState::go_to_top() {
    m_cursor = 0;
}

void AppState::go_to_bottom() {
    m_cursor = m_entries.empty() ? 0 : m_entries.size() - 1;
}

bool AppState::select_index(std::size_t index) {
    if (index >= m_entries.size()) {
        return false;
    }
    m_cursor = index;
    return true;
}

void AppState::click(std::size_t index, std::chrono::steady_clock::time_point now) {
    if (!std::holds_alternative<NormalMode>(m_mode) || !select_index(index)) {
        return;
    }

    const bool is_double = m_last_click && m_last_click->index == index
                           && now - m_last_click->at < DOUBLE_CLICK_INTERVAL;
    if (is_double) {
        m_last_click.reset();
        if (m_entries[index].is_directory()) {
            toggle_expand();
        }
    }
    else {
        m_last_click = LastClick{now, index};
    }
    sync_preview();
}

void AppState::activate(std::size_t index) {
    if (!std::holds_alternative<NormalMode>(m_mode) || !select_index(index)) {
        return;
    }

    if (m_entries[index].is_directory()) {
        toggle_expand();
    }
    else {
        request_open();
    }
    sync_preview();
}

void AppState::scroll(int steps) {
    if (!std::holds_alternative<NormalMode>(m_mode)) {
        return;
    }
    move_cursor(steps * SCROLL_STEP);
    sync_preview();
}

void AppState::toggle_expand() {
    const Entry* entry = current_entry();
    if (!entry || !entry->is_directory()) {
        return;
    }

    const fs::path path = entry->path;
    const std::string name = entry->name;
    const bool was_expanded = m_expanded.count(path) > 0;
    if (was_expanded) {
        m_expanded.erase(path);
    }
    else {
        m_expanded.insert(path);
    }

    FsError err = rebuild(path);
    if (err != FsError::None) {
        if (was_expanded) {
            m_expanded.insert(path);
        }
        else {
            m_expanded.erase(path);
        }
        report_failure("Cannot open", name, err);
    }
}

void AppState::collapse_or_parent() {
    const Entry* entry = current_entry();
    if (!entry) {
        return;
    }

    if (entry->is_directory() && entry->is_expanded) {
        toggle_expand();
        return;
    }

    const int depth = entry->depth;
    if (depth == 0) {
        return;
    }
    for (std::size_t i = m_cursor; i-- > 0;) {
        if (m_entries[i].is_directory() && m_entries[i].depth < depth) {
            m_cursor = i;
            return;
        }
    }
}

void AppState::toggle_hidden() {
    m_show_hidden = !m_show_hidden;

    FsError err = rebuild(std::nullopt);
    if (err != FsError::None) {
        m_show_hidden = !m_show_hidden;
        report_failure("Cannot reload", m_root.string(), err);
        return;
    }
    set_status(m_show_hidden ? "Showing hidden files" : "Hiding hidden files");
}

void AppState::expand_all() {
    std::vector<Entry> fresh {};
    ExpansionSet expanded {};
    bool truncated { false };
    FsError err = build_tree_fully_expanded(m_root, m_show_hidden, EXPAND_ALL_LIMIT, fresh, expanded, truncated);
    if (err != FsError::None) {
        report_failure("Cannot expand", m_root.string(), err);
        return;
    }

    m_expanded = std::move(expanded);
    install_snapshot(std::move(fresh), std::nullopt);

    const std::size_t n = m_entries.size();
    if (truncated) {
        set_status("Expanded all (limited to " + std::to_string(n) + " entries)");
    }
    else {
        set_status("Expanded all (" + std::to_string(n) + " entries)");
    }
}

void AppState::collapse_all() {
    ExpansionSet previous = std::move(m_expanded);
    m_expanded.clear();

    FsError err = rebuild(std::nullopt);
    if (err != FsError::None) {
        m_expanded = std::move(previous);
        report_failure("Cannot reload", m_root.string(), err);
        return;
    }
    set_status("Collapsed all directories");
}

bool AppState::refresh() {
    return reload(std::nullopt);
}

FsError AppState::rebuild(const std::optional<fs::path>& focus) {
    prune_expanded();

    std::vector<Entry> fresh {};
    FsError err = build_tree(m_root, m_expanded, m_show_hidden, fresh);
    if (err != FsError::None) {
        spdlog::error("rebuild of {} failed: {}", m_root.string(), fs_error_message(err));
        return err;
    }

    install_snapshot(std::move(fresh), focus);
    return FsError::None;
}

bool AppState::reload(const std::optional<fs::path>& focus) {
    FsError err = rebuild(focus);
    if (err != FsError::None) {
        set_persistent_error("Refresh failed: " + fs_error_message(err));
        return false;
    }
    return true;
}

void AppState::install_snapshot(std::vector<Entry> fresh, const std::optional<fs::path>& focus) {
    std::optional<fs::path> keep = focus;
    if (!keep) {
        if (const Entry* entry = current_entry()) {
            keep = entry->path;
        }
    }

    const std::size_t previous = m_cursor;
    m_entries = std::move(fresh);
    m_preview_cache.clear();
    place_cursor(keep, previous);

    if (m_status_persistent_error) {
        m_status.reset();
        m_status_persistent_error = false;
    }

    update_search_results(false);
    sync_preview();
}

void AppState::place_cursor(const std::optional<fs::path>& focus, std::size_t previous_index) {
    if (focus) {
        for (std::size_t i = 0; i < m_entries.size(); ++i) {
            if (m_entries[i].path == *focus) {
                m_cursor = i;
                return;
            }
        }
    }

    if (m_entries.empty()) {
        m_cursor = 0;
    }
    else {
        m_cursor = std::min(previous_index, m_entries.size() - 1);
    }
}

void AppState::prune_expanded() {
    for (auto it = m_expanded.begin(); it != m_expanded.end();) {
        std::error_code ec;
        if (!fs::is_directory(fs::symlink_status(*it, ec))) {
            spdlog::debug("dropping vanished directory {}", it->string());
            it = m_expanded.erase(it);
        }
        else {
            ++it;
        }
    }
}

void AppState::forget_path(const fs::path& path) {
    for (auto it = m_expanded.begin(); it != m_expanded.end();) {
        if (is_within(*it, path)) {
            it = m_expanded.erase(it);
        }
        else {
            ++it;
        }
    }
}

void AppState::move_expanded(const fs::path& from, const fs::path& to) {
    ExpansionSet moved {};
    for (auto it = m_expanded.begin(); it != m_expanded.end();) {
        if (is_within(*it, from)) {
            moved.insert(rebase(*it, from, to));
            it = m_expanded.erase(it);
        }
        else {
            ++it;
        }
    }
    m_expanded.insert(moved.begin(), moved.end());
}

void AppState::update_search_results(bool jump) {
    m_search_matches.clear();
    if (m_search_query.empty()) {
        m_search_index = 0;
        return;
    }

    const std::string query = to_lower_ascii(m_search_query);
    for (std::size_t i = 0; i < m_entries.size(); ++i) {
        if (to_lower_ascii(m_entries[i].name).find(query) != std::string::npos) {
            m_search_matches.push_back(i);
        }
    }

    if (m_search_matches.empty()) {
        m_search_index = 0;
        return;
    }

    if (jump) {
        m_search_index = 0;
        m_cursor = m_search_matches.front();
    }
    else if (m_search_index >= m_search_matches.size()) {
        m_search_index = 0;
    }
}

void AppState::set_search_query(const std::string& query) {
    m_search_query = query;
    update_search_results(true);
}

void AppState::search_next() {
    if (m_search_matches.empty()) {
        return;
    }
    m_search_index = (m_search_index + 1) % m_search_matches.size();
    m_cursor = m_search_matches[m_search_index];
}

void AppState::search_previous() {
    if (m_search_matches.empty()) {
        return;
    }
    m_search_index = m_search_index == 0 ? m_search_matches.size() - 1 : m_search_index - 1;
    m_cursor = m_search_matches[m_search_index];
}

fs::path AppState::target_directory() const {
    const Entry* entry = current_entry();
    if (!entry) {
        return m_root;
    }
    if (entry->is_directory()) {
        return entry->path;
    }
    return entry->path.parent_path();
}

bool AppState::create(InputKind kind, const std::string& name) {
    if (kind == InputKind::Rename) {
        return rename(name);
    }

    FsError err = validate_name(name);
    if (err != FsError::None) {
        report_failure("Cannot create", name, err);
        return false;
    }

    const fs::path dir = target_directory();
    const fs::path target = dir / name;
    err = kind == InputKind::CreateDir ? make_directory(target) : make_file(target);
    if (err != FsError::None) {
        report_failure("Cannot create", name, err);
        return false;
    }

    // Open the containing directory so the new entry is visible.
    if (dir != m_root) {
        m_expanded.insert(dir);
    }
    if (reload(target)) {
        set_status(kind == InputKind::CreateDir ? "Created directory: " + name : "Created: " + name);
    }
    return true;
}

bool AppState::rename(const std::string& new_name) {
    const Entry* entry = current_entry();
    if (!entry) {
        return false;
    }

    const fs::path old_path = entry->path;
    const std::string old_name = entry->name;

    FsError err = validate_name(new_name);
    if (err != FsError::None) {
        report_failure("Cannot rename to", new_name, err);
        return false;
    }
    if (new_name == old_name) {
        return true;
    }

    const fs::path new_path = old_path.parent_path() / new_name;
    err = rename_path(old_path, new_path);
    if (err != FsError::None) {
        report_failure("Cannot rename " + old_name + " to", new_name, err);
        return false;
    }

    move_expanded(old_path, new_path);
    if (m_clipboard && is_within(m_clipboard->path, old_path)) {
        m_clipboard->path = rebase(m_clipboard->path, old_path, new_path);
    }

    if (reload(new_path)) {
        set_status("Renamed to: " + new_name);
    }
    return true;
}

bool AppState::remove() {
    const Entry* entry = current_entry();
    if (!entry) {
        return false;
    }

    const fs::path path = entry->path;
    const std::string name = entry->name;

    FsError err = remove_path(path);
    if (err != FsError::None) {
        // A recursive delete may have removed part of the tree already.
        report_failure("Cannot delete", name, err);
        reload(std::nullopt);
        return false;
    }

    forget_path(path);
    if (m_clipboard && is_within(m_clipboard->path, path)) {
        m_clipboard.reset();
    }
    if (reload(std::nullopt)) {
        set_status("Deleted: " + name);
    }
    return true;
}

void AppState::yank() {
    const Entry* entry = current_entry();
    if (!entry) {
        return;
    }
    m_clipboard = ClipboardEntry{entry->path, false};
    set_status("Copied: " + entry->name);
}

void AppState::cut() {
    const Entry* entry = current_entry();
    if (!entry) {
        return;
    }
    m_clipboard = ClipboardEntry{entry->path, true};
    set_status("Cut: " + entry->name);
}

bool AppState::paste() {
    if (!m_clipboard) {
        set_status("Clipboard is empty");
        return false;
    }

    const ClipboardEntry clip = *m_clipboard;
    const std::string name = clip.path.filename().string();

    if (!path_exists(clip.path)) {
        m_clipboard.reset();
        report_failure("Cannot paste", name, FsError::NotFound);
        return false;
    }

    const fs::path dest = target_directory() / clip.path.filename();
    if (dest.lexically_normal() == clip.path.lexically_normal()) {
        set_status("Cannot paste " + name + ": source and destination are the same", true);
        return false;
    }
    if (is_within(dest, clip.path)) {
        set_status("Cannot paste " + name + " into itself", true);
        return false;
    }

    PendingPaste pending {clip.path, dest, clip.is_cut};
    if (path_exists(dest)) {
        if (is_within(clip.path, dest)) {
            set_status("Cannot replace " + name + ": it contains the source", true);
            return false;
        }
        m_pending_paste = pending;
        enter_mode(ConfirmMode{ConfirmKind::Overwrite});
        return false;
    }

    return execute_paste(pending, false);
}

bool AppState::confirm_overwrite() {
    if (!m_pending_paste) {
        return false;
    }
    const PendingPaste pending = *m_pending_paste;
    m_pending_paste.reset();
    m_mode = NormalMode{};
    return execute_paste(pending, true);
}

bool AppState::execute_paste(const PendingPaste& paste, bool overwrite) {
    const std::string name = paste.source.filename().string();
    FsError err { FsError::None };

    if (overwrite && path_exists(paste.destination)) {
        std::error_code ec;
        const bool source_is_dir = fs::is_directory(fs::symlink_status(paste.source, ec));
        const bool dest_is_dir = fs::is_directory(fs::symlink_status(paste.destination, ec));

        // A copied directory merges into a real directory; anything else, links
        // included, is replaced.
        if (paste.is_cut || !source_is_dir || !dest_is_dir) {
            err = remove_path(paste.destination);
            if (err != FsError::None) {
                report_failure("Cannot replace", name, err);
                reload(std::nullopt);
                return false;
            }
            forget_path(paste.destination);
        }
    }

    err = paste.is_cut ? move_path(paste.source, paste.destination)
                       : copy_path(paste.source, paste.destination, overwrite);
    if (err != FsError::None) {
        report_failure(paste.is_cut ? "Cannot move" : "Cannot paste", name, err);
        reload(std::nullopt);
        return false;
    }

    if (paste.is_cut) {
        move_expanded(paste.source, paste.destination);
        m_clipboard.reset();
    }

    const fs::path dest_dir = paste.destination.parent_path();
    if (dest_dir != m_root) {
        m_expanded.insert(dest_dir);
    }

    if (reload(paste.destination)) {
        set_status((paste.is_cut ? "Moved: " : "Pasted: ") + name);
    }
    return true;
}

void AppState::request_open() {
    const Entry* entry = current_entry();
    if (!entry || entry->is_directory()) {
        return;
    }
    m_pending_editor_file = entry->path;
}

void AppState::request_reveal() {
    m_pending_reveal = target_directory();
}

void AppState::toggle_preview() {
    m_show_preview = !m_show_preview;
    sync_preview();
}

void AppState::sync_preview() {
    if (!m_show_preview) {
        return;
    }
    const Entry* entry = current_entry();
    if (!entry) {
        return;
    }
    if (m_preview_cache.count(entry->path) == 0) {
        m_preview_cache.emplace(entry->path, load_preview(entry->path));
    }
}

void AppState::set_status(const std::string& text, bool is_error) {
    m_status = StatusMessage{text, is_error, std::chrono::steady_clock::now() + STATUS_LIFETIME};
    m_status_persistent_error = false;
    if (is_error) {
        spdlog::warn("{}", text);
    }
}

void AppState::set_persistent_error(const std::string& text) {
    m_status = StatusMessage{text, true, std::nullopt};
    m_status_persistent_error = true;
    spdlog::error("{}", text);
}

bool AppState::clear_expired_status(std::chrono::steady_clock::time_point now) {
    if (m_status && m_status->expires_at && now >= *m_status->expires_at) {
        m_status.reset();
        return true;
    }
    return false;
}

void AppState::report_failure(const std::string& action, const std::string& name, FsError err) {
    set_status(action + " " + name + ": " + fs_error_message(err), true);
}
