// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigation_session.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace vnav {

const char* session_state_name(SessionState state) {
    switch (state) {
    case SessionState::Idle:
        return "Idle";
    case SessionState::Previewing:
        return "Previewing";
    case SessionState::Confirmed:
        return "Confirmed";
    case SessionState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

const char* nav_command_name(NavCommand command) {
    switch (command) {
    case NavCommand::MaxVersion:
        return "maxVersion";
    case NavCommand::MinVersion:
        return "minVersion";
    case NavCommand::NextVersion:
        return "nextVersion";
    case NavCommand::PrevVersion:
        return "prevVersion";
    case NavCommand::Confirm:
        return "confirm";
    case NavCommand::Cancel:
        return "cancel";
    case NavCommand::OpenFolder:
        return "openFolder";
    }
    return "unknown";
}

std::optional<NavCommand> parse_nav_command(const std::string& text) {
    if (text == "next") {
        return NavCommand::NextVersion;
    }
    if (text == "prev") {
        return NavCommand::PrevVersion;
    }
    if (text == "min") {
        return NavCommand::MinVersion;
    }
    if (text == "max") {
        return NavCommand::MaxVersion;
    }
    if (text == "confirm") {
        return NavCommand::Confirm;
    }
    if (text == "cancel") {
        return NavCommand::Cancel;
    }
    if (text == "open") {
        return NavCommand::OpenFolder;
    }
    return std::nullopt;
}

NavigationSession::NavigationSession(std::vector<SelectedNode> nodes, SessionConfig config,
                                     std::string base_dir,
                                     std::shared_ptr<ThumbnailCache> thumbnails)
    : selection_(std::move(nodes)), config_(std::move(config)), base_dir_(std::move(base_dir)),
      thumbnails_(std::move(thumbnails)), resolver_(listings_), scanner_(listings_) {}

NavigationSession::~NavigationSession() {
    alive_->store(false);

    // Closing the dialog without a decision is a cancel
    if (opened_ && !is_terminal()) {
        spdlog::debug("[NavigationSession] Closed while {}, restoring nodes",
                      session_state_name(state_));
        restore_all();
    }
}

// ============================================================================
// Opening
// ============================================================================

bool NavigationSession::open(VersionError* error) {
    if (opened_) {
        return true;
    }

    NodeSortKeyEvaluator sorter(config_.node_sort_key_fct);
    std::vector<SelectedNode> sorted = sorter.sort(selection_);

    VersionError pick_error;
    auto candidate = NodeSortKeyEvaluator::pick_display_candidate(sorted, base_dir_, &pick_error);
    if (!candidate) {
        spdlog::warn("[NavigationSession] {}", pick_error.message);
        last_error_ = pick_error;
        if (error) {
            *error = pick_error;
        }
        return false;
    }
    last_error_ = VersionError{};

    nodes_.clear();
    nodes_.reserve(sorted.size());
    for (auto& selected : sorted) {
        NodeState node;
        node.selected = selected;
        node.original_path = selected.node->get_path_value();
        node.original_range = selected.node->get_frame_range();
        if (!node.original_path.empty()) {
            node.tmpl = PathTemplateParser::parse(node.original_path, base_dir_);
        }
        if (node.tmpl) {
            node.versions = resolver_.resolve(*node.tmpl);
        }
        nodes_.push_back(std::move(node));
    }

    display_index_ = candidate->position;
    const NodeState& display = nodes_[display_index_];
    initial_ = VersionSetResolver::current_entry(*display.tmpl, display.versions);
    current_ = initial_;
    state_ = SessionState::Idle;
    opened_ = true;

    spdlog::info("[NavigationSession] Opened on {} v{} ({} version(s), {} node(s))",
                 display.selected.node->name(), current_.version, display.versions.size(),
                 nodes_.size());

    if (config_.preview_enabled) {
        request_thumbnail();
    }
    return true;
}

// ============================================================================
// Commands
// ============================================================================

bool NavigationSession::accepts_commands(const char* what) {
    if (!opened_) {
        spdlog::debug("[NavigationSession] Ignoring {}: session not open", what);
        last_error_ = VersionError::invalid_state(std::string("Cannot ") + what +
                                                  ": session is not open");
        return false;
    }
    if (is_terminal()) {
        spdlog::debug("[NavigationSession] Ignoring {}: session is {}", what,
                      session_state_name(state_));
        last_error_ = VersionError::invalid_state(std::string("Cannot ") + what +
                                                  ": session is " + session_state_name(state_));
        return false;
    }
    last_error_ = VersionError{};
    return true;
}

bool NavigationSession::handle(NavCommand command) {
    switch (command) {
    case NavCommand::MaxVersion:
        return max_version();
    case NavCommand::MinVersion:
        return min_version();
    case NavCommand::NextVersion:
        return next_version();
    case NavCommand::PrevVersion:
        return prev_version();
    case NavCommand::Confirm:
        return confirm();
    case NavCommand::Cancel:
        return cancel();
    case NavCommand::OpenFolder:
        return open_folder();
    }
    return false;
}

bool NavigationSession::next_version() {
    return navigate(NavDirection::NEXT);
}

bool NavigationSession::prev_version() {
    return navigate(NavDirection::PREV);
}

bool NavigationSession::min_version() {
    return navigate(NavDirection::MIN);
}

bool NavigationSession::max_version() {
    return navigate(NavDirection::MAX);
}

bool NavigationSession::navigate(NavDirection direction) {
    if (!accepts_commands(nav_direction_name(direction))) {
        return false;
    }

    const VersionEntry target = VersionSetResolver::navigate(versions(), current_, direction);
    spdlog::debug("[NavigationSession] {}: v{} -> v{}", nav_direction_name(direction),
                  current_.version, target.version);
    current_ = target;

    if (config_.preview_enabled) {
        state_ = SessionState::Previewing;
        request_thumbnail();
        push_preview();
    }
    return true;
}

bool NavigationSession::confirm(ConfirmReport* report) {
    if (!accepts_commands("confirm")) {
        return false;
    }

    ConfirmReport result;
    result.version = current_.version;
    for (auto& node : nodes_) {
        const std::string name = node.selected.node->name();
        if (update_node(node)) {
            result.updated.push_back(name);
        } else {
            result.unchanged.push_back(name);
        }
    }

    state_ = SessionState::Confirmed;
    spdlog::info("[NavigationSession] Confirmed v{}: {} updated, {} unchanged", result.version,
                 result.updated.size(), result.unchanged.size());
    for (const auto& name : result.unchanged) {
        spdlog::debug("[NavigationSession]   unchanged: {}", name);
    }

    end_session();
    if (report) {
        *report = std::move(result);
    }
    return true;
}

bool NavigationSession::cancel() {
    if (!accepts_commands("cancel")) {
        return false;
    }

    restore_all();
    state_ = SessionState::Cancelled;
    spdlog::info("[NavigationSession] Cancelled, original values restored");
    end_session();
    return true;
}

bool NavigationSession::open_folder() {
    if (!accepts_commands("openFolder")) {
        return false;
    }

    const size_t slash = current_.path.find_last_of('/');
    std::string dir;
    if (slash == std::string::npos) {
        dir = base_dir_;
    } else {
        dir = slash == 0 ? "/" : current_.path.substr(0, slash);
    }

    spdlog::debug("[NavigationSession] Revealing {}", dir);
    nodes_[display_index_].selected.node->reveal_in_file_browser(dir);
    return true;
}

void NavigationSession::set_preview_enabled(bool enabled) {
    if (is_terminal() || config_.preview_enabled == enabled) {
        return;
    }
    config_.preview_enabled = enabled;
    if (!opened_) {
        return;
    }

    if (!enabled) {
        restore_all();
        thumbnail_key_.reset();
        state_ = SessionState::Idle;
        spdlog::debug("[NavigationSession] Preview off");
        return;
    }

    spdlog::debug("[NavigationSession] Preview on");
    request_thumbnail();
    if (current_.version != initial_.version) {
        state_ = SessionState::Previewing;
        push_preview();
    }
}

// ============================================================================
// Node updates
// ============================================================================

const VersionEntry* NavigationSession::find_version(const NodeState& node, int version) const {
    for (const auto& entry : node.versions) {
        if (entry.version == version) {
            return entry.exists ? &entry : nullptr;
        }
    }
    return nullptr;
}

void NavigationSession::apply_entry(NodeState& node, const VersionEntry& entry) {
    NodeAdapter& adapter = *node.selected.node;
    if (adapter.get_path_value() != entry.source_path) {
        adapter.set_path_value(entry.source_path);
        node.modified = true;
    }

    // A node without a range (still image, host default) keeps having none
    if (config_.change_range && node.original_range) {
        const FrameRange range = frame_range(entry);
        if (!range.empty()) {
            const NodeFrameRange value{range.first, range.last};
            if (adapter.get_frame_range() != value) {
                adapter.set_frame_range(range.first, range.last);
                node.modified = true;
            }
        }
    }
}

void NavigationSession::restore_node(NodeState& node) {
    if (!node.modified) {
        return;
    }

    NodeAdapter& adapter = *node.selected.node;
    if (adapter.get_path_value() != node.original_path) {
        adapter.set_path_value(node.original_path);
    }
    if (node.original_range && adapter.get_frame_range() != node.original_range) {
        adapter.set_frame_range(node.original_range->first, node.original_range->second);
    }
    node.modified = false;
}

void NavigationSession::apply_missing(NodeState& node) {
    NodeAdapter& adapter = *node.selected.node;
    const std::string value = PathTemplateParser::build(*node.tmpl, current_.version);
    if (adapter.get_path_value() != value) {
        adapter.set_path_value(value);
        node.modified = true;
    }
    // No frames to read a range from
    if (node.original_range && adapter.get_frame_range() != node.original_range) {
        adapter.set_frame_range(node.original_range->first, node.original_range->second);
    }
}

bool NavigationSession::update_node(NodeState& node) {
    if (!node.tmpl) {
        restore_node(node);
        return false;
    }

    const VersionEntry* entry = find_version(node, current_.version);
    if (entry) {
        apply_entry(node, *entry);
        return true;
    }
    if (config_.set_missing && !node.versions.empty()) {
        spdlog::debug("[NavigationSession] {} has no v{}, writing the version name anyway",
                      node.selected.node->name(), current_.version);
        apply_missing(node);
        return true;
    }

    // Nodes lacking the version show their own values
    restore_node(node);
    return false;
}

void NavigationSession::push_preview() {
    for (auto& node : nodes_) {
        update_node(node);
    }
}

void NavigationSession::restore_all() {
    for (auto& node : nodes_) {
        restore_node(node);
    }
}

void NavigationSession::end_session() {
    thumbnail_key_.reset();
    ranges_.clear();
    listings_.clear();
}

// ============================================================================
// Queries
// ============================================================================

const std::vector<VersionEntry>& NavigationSession::versions() const {
    static const std::vector<VersionEntry> EMPTY;
    return opened_ ? nodes_[display_index_].versions : EMPTY;
}

const PathTemplate& NavigationSession::display_template() const {
    return *nodes_.at(display_index_).tmpl;
}

const NodeAdapter& NavigationSession::display_node() const {
    return *nodes_.at(display_index_).selected.node;
}

FrameRange NavigationSession::frame_range(const VersionEntry& entry) {
    auto it = ranges_.find(entry.path);
    if (it != ranges_.end()) {
        return it->second;
    }
    FrameRange range = scanner_.scan(entry.path);
    ranges_.emplace(entry.path, range);
    return range;
}

std::string NavigationSession::format_date(const VersionEntry& entry) {
    return VersionSetResolver::format_date(entry, frame_range(entry));
}

std::optional<ThumbnailKey> NavigationSession::current_thumbnail_key() {
    if (!opened_ || !config_.thumb_enabled) {
        return std::nullopt;
    }
    ThumbnailKey key;
    key.path = current_.path;
    key.frame = select_frame(frame_range(current_), config_.thumb_frame_mode);
    key.mode = config_.thumb_reformat;
    return key;
}

std::optional<ThumbnailHandle> NavigationSession::current_thumbnail() const {
    if (!thumbnails_ || !thumbnail_key_) {
        return std::nullopt;
    }
    return thumbnails_->peek(*thumbnail_key_);
}

void NavigationSession::request_thumbnail() {
    if (!thumbnails_) {
        return;
    }
    auto key = current_thumbnail_key();
    if (!key) {
        return;
    }
    thumbnail_key_ = key;

    auto alive = alive_; // Capture shared_ptr by value for destruction detection
    thumbnails_->request(*key, [this, alive](const ThumbnailHandle& handle) {
        if (!alive->load()) {
            return;
        }
        if (!thumbnail_key_ || *thumbnail_key_ != handle.key) {
            spdlog::trace("[NavigationSession] Dropping stale preview {}@{}", handle.key.path,
                          handle.key.frame);
            return;
        }
        if (thumbnail_listener_) {
            thumbnail_listener_(handle);
        }
    });
}

std::vector<VersionError> NavigationSession::warnings() const {
    std::vector<VersionError> all = resolver_.warnings();
    all.insert(all.end(), scanner_.warnings().begin(), scanner_.warnings().end());
    return all;
}

// ============================================================================
// Keyboard
// ============================================================================

void register_navigation_shortcuts(input::KeyboardShortcuts& shortcuts,
                                   NavigationSession& session) {
    using input::Key;
    using input::MOD_CTRL;

    shortcuts.register_combo(MOD_CTRL, Key::Up, [&session]() { session.max_version(); });
    shortcuts.register_combo(MOD_CTRL, Key::Right, [&session]() { session.max_version(); });
    shortcuts.register_key(Key::Up, [&session]() { session.next_version(); });
    shortcuts.register_key(Key::Right, [&session]() { session.next_version(); });
    shortcuts.register_key(Key::Down, [&session]() { session.prev_version(); });
    shortcuts.register_key(Key::Left, [&session]() { session.prev_version(); });
    shortcuts.register_combo(MOD_CTRL, Key::Down, [&session]() { session.min_version(); });
    shortcuts.register_combo(MOD_CTRL, Key::Left, [&session]() { session.min_version(); });
    shortcuts.register_key(Key::Enter, [&session]() { session.confirm(); });
    shortcuts.register_key(Key::Return, [&session]() { session.confirm(); });
    shortcuts.register_key(Key::Escape, [&session]() { session.cancel(); });
    shortcuts.register_combo(MOD_CTRL, Key::O, [&session]() { session.open_folder(); });
}

} // namespace vnav
