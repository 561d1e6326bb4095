#ifndef APP_STATE_H
#define APP_STATE_H

#include "entry.hpp"
#include "file_tree.hpp"
#include "fs_error.hpp"
#include "preview.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class InputKind {
    CreateFile,
    CreateDir,
    Rename
};

enum class ConfirmKind {
    Delete,
    Overwrite
};

struct NormalMode {};
struct SearchMode {};
struct InputMode { InputKind kind; };
struct ConfirmMode { ConfirmKind kind; };
struct HelpMode {};

using Mode = std::variant<NormalMode, SearchMode, InputMode, ConfirmMode, HelpMode>;

enum class KeyCode {
    Character,
    Up,
    Down,
    Left,
    Right,
    Enter,
    Escape,
    Backspace,
    Home,
    End,
    PageUp,
    PageDown,
    Tab,
    BackTab,
    Other
};

// Terminal-independent keystroke. `text` holds the UTF-8 character for KeyCode::Character.
struct Key {
    KeyCode code { KeyCode::Other };
    std::string text {};
};

Key make_key(KeyCode code);
Key make_char(const std::string& text);

struct ClipboardEntry {
    std::filesystem::path path {};
    bool is_cut { false };
};

struct PendingPaste {
    std::filesystem::path source {};
    std::filesystem::path destination {};
    bool is_cut { false };
};

struct StatusMessage {
    std::string text {};
    bool is_error { false };
    // Unset for persistent messages.
    std::optional<std::chrono::steady_clock::time_point> expires_at {};
};

constexpr std::chrono::seconds STATUS_LIFETIME {3};
constexpr std::size_t EXPAND_ALL_LIMIT = 5000;
constexpr int PAGE_SIZE = 10;
constexpr std::chrono::milliseconds DOUBLE_CLICK_INTERVAL {400};
constexpr int SCROLL_STEP = 3;

// Owns everything the explorer shows. Every public operation leaves the cursor
// inside the entry list (or at 0 on an empty list) and never throws filesystem
// errors; failures become status messages.
class AppState
{
public:
    explicit AppState(const std::filesystem::path& root, bool show_hidden = false);

    const std::filesystem::path& root() const { return m_root; }
    const std::vector<Entry>& entries() const { return m_entries; }
    std::size_t cursor() const { return m_cursor; }
    const Entry* current_entry() const;
    const Mode& mode() const { return m_mode; }
    const std::string& input_buffer() const { return m_input_buffer; }
    const std::string& search_query() const { return m_search_query; }
    const std::vector<std::size_t>& search_matches() const { return m_search_matches; }
    std::size_t search_index() const { return m_search_index; }
    const std::optional<ClipboardEntry>& clipboard() const { return m_clipboard; }
    const std::optional<PendingPaste>& pending_paste() const { return m_pending_paste; }
    const std::optional<StatusMessage>& status() const { return m_status; }
    const ExpansionSet& expanded() const { return m_expanded; }
    bool show_hidden() const { return m_show_hidden; }
    bool show_preview() const { return m_show_preview; }
    bool should_quit() const { return m_should_quit; }
    bool is_search_match(std::size_t index) const;

    // Time left before the status message disappears; nullopt when there is
    // no message or it is persistent.
    std::optional<std::chrono::milliseconds> status_remaining(std::chrono::steady_clock::time_point now) const;

    // Preview of the entry under the cursor, if the preview pane is on.
    const Preview* current_preview() const;

    // Files the UI loop has to hand to external programs.
    std::optional<std::filesystem::path> take_pending_editor_file();
    std::optional<std::filesystem::path> take_pending_reveal();

    bool handle_key(const Key& key);
    bool enter_mode(const Mode& mode);

    void move_cursor(int delta);
    void go_to_top();
    void go_to_bottom();
    // False, with the cursor unchanged, when `index` is past the last entry.
    bool select_index(std::size_t index);

    // Mouse input. Ignored outside normal mode. A second click on the same row
    // within DOUBLE_CLICK_INTERVAL toggles a directory; `activate` opens a file
    // or toggles a directory straight away.
    void click(std::size_t index, std::chrono::steady_clock::time_point now);
    void activate(std::size_t index);
    void scroll(int steps);

    void toggle_expand();
    void collapse_or_parent();
    void toggle_hidden();
    void expand_all();
    void collapse_all();
    bool refresh();

    bool create(InputKind kind, const std::string& name);
    bool rename(const std::string& new_name);
    bool remove();
    void yank();
    void cut();
    bool paste();
    bool confirm_overwrite();

    void set_search_query(const std::string& query);
    void search_next();
    void search_previous();

    void request_open();
    void request_reveal();
    void toggle_preview();

    void set_status(const std::string& text, bool is_error = false);
    bool clear_expired_status(std::chrono::steady_clock::time_point now);

private:
    std::filesystem::path m_root {};
    std::vector<Entry> m_entries {};
    std::size_t m_cursor {};
    ExpansionSet m_expanded {};
    bool m_show_hidden { false };

    Mode m_mode { NormalMode{} };
    std::string m_input_buffer {};

    std::string m_search_query {};
    std::vector<std::size_t> m_search_matches {};
    std::size_t m_search_index {};

    std::optional<ClipboardEntry> m_clipboard {};
    std::optional<PendingPaste> m_pending_paste {};
    std::optional<StatusMessage> m_status {};
    bool m_status_persistent_error { false };

    bool m_show_preview { false };
    std::map<std::filesystem::path, Preview> m_preview_cache {};

    std::optional<std::filesystem::path> m_pending_editor_file {};
    std::optional<std::filesystem::path> m_pending_reveal {};
    bool m_should_quit { false };

    struct LastClick {
        std::chrono::steady_clock::time_point at {};
        std::size_t index {};
    };
    std::optional<LastClick> m_last_click {};

    bool handle_normal_key(const Key& key);
    bool handle_search_key(const Key& key);
    bool handle_input_key(InputKind kind, const Key& key);
    bool handle_confirm_key(ConfirmKind kind, const Key& key);
    bool handle_help_key(const Key& key);

    // Rebuilds the snapshot, keeping the cursor on `focus` (or on the current
    // entry) when it is still visible. The old snapshot survives a failure.
    FsError rebuild(const std::optional<std::filesystem::path>& focus);
    // rebuild() that turns a failure into a persistent error status.
    bool reload(const std::optional<std::filesystem::path>& focus);
    void install_snapshot(std::vector<Entry> fresh, const std::optional<std::filesystem::path>& focus);
    void place_cursor(const std::optional<std::filesystem::path>& focus, std::size_t previous_index);
    void prune_expanded();
    void forget_path(const std::filesystem::path& path);
    void move_expanded(const std::filesystem::path& from, const std::filesystem::path& to);
    void update_search_results(bool jump);
    void sync_preview();
    std::filesystem::path target_directory() const;
    bool execute_paste(const PendingPaste& paste, bool overwrite);
    void report_failure(const std::string& action, const std::string& name, FsError err);
    void set_persistent_error(const std::string& text);
};

#endif
