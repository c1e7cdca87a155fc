// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "directory_listing_cache.h"
#include "frame_range_scanner.h"
#include "keyboard_shortcuts.h"
#include "node_sort.h"
#include "session_config.h"
#include "thumbnail_cache.h"
#include "version_error.h"
#include "version_resolver.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @file navigation_session.h
 * @brief Interaction state of one version navigation dialog
 *
 * ```
 *            nav cmd (preview on)
 *   Idle ─────────────────────────▶ Previewing
 *    │  ◀───────────────────────────   │
 *    │       preview turned off        │
 *    ├── confirm ──▶ Confirmed ◀── confirm
 *    └── cancel ───▶ Cancelled ◀── cancel
 * ```
 *
 * Confirmed and Cancelled are terminal. Everything runs on the interactive
 * thread; only thumbnail generation is asynchronous.
 */

namespace vnav {

enum class SessionState { Idle, Previewing, Confirmed, Cancelled };

const char* session_state_name(SessionState state);

/**
 * @brief Discrete commands mapped from keyboard input
 */
enum class NavCommand { MaxVersion, MinVersion, NextVersion, PrevVersion, Confirm, Cancel, OpenFolder };

const char* nav_command_name(NavCommand command);

/// Parse "next" / "prev" / "min" / "max" / "confirm" / "cancel" / "open"
std::optional<NavCommand> parse_nav_command(const std::string& text);

/**
 * @brief Outcome of confirm()
 */
struct ConfirmReport {
    int version = 0;                    ///< Target version number
    std::vector<std::string> updated;   ///< Names of nodes switched to the target version
    std::vector<std::string> unchanged; ///< Names of nodes left with their original values
};

using ThumbnailListener = std::function<void(const ThumbnailHandle& handle)>;

class NavigationSession {
  public:
    /**
     * @param nodes Selected nodes, in selection order
     * @param config Session options
     * @param base_dir Directory relative node paths are resolved against
     * @param thumbnails Shared preview cache (may be null: no previews)
     */
    NavigationSession(std::vector<SelectedNode> nodes, SessionConfig config, std::string base_dir,
                      std::shared_ptr<ThumbnailCache> thumbnails = nullptr);
    ~NavigationSession();

    NavigationSession(const NavigationSession&) = delete;
    NavigationSession& operator=(const NavigationSession&) = delete;

    /**
     * @brief Pick the display candidate and resolve every node's versions
     *
     * Nothing is written to any node. Fails with NO_DISPLAYABLE_NODE when no
     * selected node has a non-empty path with a version marker.
     *
     * @param error Set on failure (may be null)
     * @return true if the session can navigate
     */
    bool open(VersionError* error = nullptr);

    bool is_open() const {
        return opened_;
    }

    /**
     * @brief Run a command
     *
     * @return false if the command was rejected (not open, terminal state)
     */
    bool handle(NavCommand command);

    bool next_version();
    bool prev_version();
    bool min_version();
    bool max_version();

    /**
     * @brief Commit the current version to every node that has it
     *
     * Each node resolves the target version number among its own versions.
     * Nodes without it keep their original values, unless `set_missing` is
     * on: a versioned node then gets the version written into its path.
     */
    bool confirm(ConfirmReport* report = nullptr);

    /// Restore every node's original values
    bool cancel();

    /// Reveal the directory of the current version through the display node
    bool open_folder();

    /**
     * @brief Toggle live preview
     *
     * Off restores the original node values and returns to Idle. On pushes
     * the current version immediately when it differs from the initial one.
     */
    void set_preview_enabled(bool enabled);

    bool preview_enabled() const {
        return config_.preview_enabled;
    }

    SessionState state() const {
        return state_;
    }

    bool is_terminal() const {
        return state_ == SessionState::Confirmed || state_ == SessionState::Cancelled;
    }

    /// Entry shown by the dialog
    const VersionEntry& current() const {
        return current_;
    }

    /// Entry the session opened on
    const VersionEntry& initial() const {
        return initial_;
    }

    /// Versions of the display candidate, ascending
    const std::vector<VersionEntry>& versions() const;

    const PathTemplate& display_template() const;

    /// Display candidate node
    const NodeAdapter& display_node() const;

    /// Frame range of a version path (scanned once per session)
    FrameRange frame_range(const VersionEntry& entry);

    /// Modification date of a version
    std::string format_date(const VersionEntry& entry);

    /// Preview key of the current version, or nullopt when previews are off
    std::optional<ThumbnailKey> current_thumbnail_key();

    /// State of the current preview, if one was requested
    std::optional<ThumbnailHandle> current_thumbnail() const;

    /**
     * @brief Called (from ThumbnailCache::process_completions) when the
     * preview of the still-current version completes
     */
    void set_thumbnail_listener(ThumbnailListener listener) {
        thumbnail_listener_ = std::move(listener);
    }

    /// Recoverable problems met so far (IO_ERROR listing failures)
    std::vector<VersionError> warnings() const;

    /**
     * @brief Why the last open() or command failed
     *
     * NO_DISPLAYABLE_NODE from open(), INVALID_STATE for a rejected command.
     * Cleared by every accepted command.
     */
    const VersionError& last_error() const {
        return last_error_;
    }

    const SessionConfig& config() const {
        return config_;
    }

  private:
    struct NodeState {
        SelectedNode selected;
        std::string original_path;
        std::optional<NodeFrameRange> original_range;
        std::optional<PathTemplate> tmpl; ///< nullopt: never touched
        std::vector<VersionEntry> versions;
        bool modified = false;
    };

    bool accepts_commands(const char* what);
    bool navigate(NavDirection direction);
    const VersionEntry* find_version(const NodeState& node, int version) const;
    void apply_entry(NodeState& node, const VersionEntry& entry);
    void apply_missing(NodeState& node);
    /// Push the current version to one node; true if the node now shows it
    bool update_node(NodeState& node);
    void restore_node(NodeState& node);
    void push_preview();
    void restore_all();
    void request_thumbnail();
    void end_session();

    std::vector<SelectedNode> selection_;
    SessionConfig config_;
    std::string base_dir_;
    std::shared_ptr<ThumbnailCache> thumbnails_;

    DirectoryListingCache listings_;
    VersionSetResolver resolver_;
    FrameRangeScanner scanner_;
    std::map<std::string, FrameRange> ranges_;

    std::vector<NodeState> nodes_;
    size_t display_index_ = 0;
    VersionEntry initial_;
    VersionEntry current_;
    SessionState state_ = SessionState::Idle;
    bool opened_ = false;
    VersionError last_error_;

    std::optional<ThumbnailKey> thumbnail_key_;
    ThumbnailListener thumbnail_listener_;
    std::shared_ptr<std::atomic<bool>> alive_ = std::make_shared<std::atomic<bool>>(true);
};

/**
 * @brief Bind the dialog keys to a session
 *
 * Max {Ctrl+Up, Ctrl+Right}, Next {Up, Right}, Prev {Down, Left},
 * Min {Ctrl+Down, Ctrl+Left}, Confirm {Enter, Return}, Cancel {Escape},
 * Open folder {Ctrl+O}.
 */
void register_navigation_shortcuts(input::KeyboardShortcuts& shortcuts,
                                   NavigationSession& session);

} // namespace vnav
