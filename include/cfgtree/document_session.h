// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file document_session.h
/// @brief Per-document editing session on top of a lager store.
///
/// A session owns everything derived for one open document: the current and
/// original trees, the serialized text, the set of edited paths, the change
/// map, the expansion state and the visible rows. Every action goes through
/// the pure reducer session_update(), which recomputes the derived state in
/// full; nothing is patched incrementally.
///
/// Usage:
/// @code
///   DocumentSession session;
///   session.configure_from_text(current_text, original_text);
///   session.set_value("settings.enabled", true);
///   for (const auto& row : session.nodes()) { ... }
///   auto payload = session.save();
///   write(payload.text);
///   session.mark_saved(payload);
/// @endcode

#pragma once

#include <cfgtree/api.h>
#include <cfgtree/flatten.h>
#include <cfgtree/path.h>
#include <cfgtree/value.h>
#include <cfgtree/value_diff.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cfgtree {

struct SessionConfig {
    bool expand_all_by_default = true;
    PathSet manually_collapsed;  ///< restored from a previous visit of the document
    bool show_changed_only = false;

    bool operator==(const SessionConfig& other) const = default;
};

struct SavePayload {
    std::string text;
    bool sparse = false;  ///< text holds only the edited paths
};

// ============================================================
// Actions
// ============================================================

namespace actions {

// ===== Document lifecycle =====

/// Load a document. Replaces all previous session state.
struct Configure {
    Value current;
    std::optional<Value> original;      ///< absent for new or untracked files
    std::optional<std::string> text;    ///< source text of current; serialized when absent
    DocumentStatus status = DocumentStatus::Unchanged;
    SessionConfig config;
};

/// @p persisted was written to disk. A sparse payload becomes the session's
/// document, and a document deleted upstream is tracked as Added from now on.
struct MarkSaved {
    SavePayload persisted;
};

/// Drop the document (switching to another one)
struct Reset {};

// ===== View state =====

struct ToggleExpand {
    std::string path;
};

struct ExpandAll {};

struct CollapseAllExceptRoot {};

struct SetManuallyCollapsed {
    PathSet paths;
};

/// Reveal and flag a search hit; std::nullopt clears the search
struct SetSearchMatch {
    std::optional<std::string> path;
};

struct SetChangeFilter {
    bool show_changed_only = false;
};

// ===== Edits =====

struct SetValue {
    std::string path;
    Value value;
};

struct AddField {
    std::string object_path;
    std::string key;
    Value value;
};

struct RemoveValue {
    std::string path;
};

struct InsertElement {
    std::string array_path;
    std::size_t index = 0;
    Value element;
};

struct MoveElement {
    std::string array_path;
    std::size_t from = 0;
    std::size_t to = 0;
};

} // namespace actions

using SessionAction = std::variant<
    // Lifecycle
    actions::Configure, actions::MarkSaved, actions::Reset,
    // View state
    actions::ToggleExpand, actions::ExpandAll, actions::CollapseAllExceptRoot, actions::SetManuallyCollapsed,
    actions::SetSearchMatch, actions::SetChangeFilter,
    // Edits
    actions::SetValue, actions::AddField, actions::RemoveValue, actions::InsertElement, actions::MoveElement>;

// ============================================================
// Model
// ============================================================

struct SessionModel {
    Value current;
    std::optional<Value> original;
    std::string text;  ///< serialized current, kept minimal-diff against the loaded text
    DocumentStatus status = DocumentStatus::Unchanged;
    SessionConfig config;

    ExpansionState expansion;
    PathSet edited;  ///< cumulative since configure or the last save
    bool show_changed_only = false;
    std::optional<std::string> current_match;

    // Derived, recomputed after every action
    ChangeMap changes;
    NodeList nodes;

    bool configured = false;
    bool dirty = false;
    std::string last_error;  ///< message of the last rejected edit, empty otherwise

    [[nodiscard]] const Value* original_ptr() const { return original ? &*original : nullptr; }

    bool operator==(const SessionModel& other) const = default;
};

/// Pure reducer of the session store
[[nodiscard]] CFGTREE_API SessionModel session_update(SessionModel model, SessionAction action);

/// What to persist for @p model: the sparse document when the file was
/// deleted upstream and some paths were edited, the session text otherwise
[[nodiscard]] CFGTREE_API SavePayload save_payload(const SessionModel& model);

// ============================================================
// DocumentSession - high-level interface
// ============================================================

class CFGTREE_API DocumentSession {
public:
    DocumentSession();
    ~DocumentSession();

    DocumentSession(const DocumentSession&) = delete;
    DocumentSession& operator=(const DocumentSession&) = delete;

    void configure(Value current,
                   std::optional<Value> original = std::nullopt,
                   DocumentStatus status = DocumentStatus::Unchanged,
                   SessionConfig config = {},
                   std::optional<std::string> text = std::nullopt);

    /// Parse and configure. A current text that does not parse rejects the
    /// call; an original that does not parse is treated as absent.
    bool configure_from_text(std::string_view current_text,
                             std::optional<std::string_view> original_text = std::nullopt,
                             DocumentStatus status = DocumentStatus::Unchanged,
                             SessionConfig config = {},
                             std::string* error_out = nullptr);

    void dispatch(SessionAction action);

    [[nodiscard]] const SessionModel& model() const;
    [[nodiscard]] const NodeList& nodes() const { return model().nodes; }
    [[nodiscard]] const ChangeMap& changes() const { return model().changes; }
    [[nodiscard]] const Value& current() const { return model().current; }
    [[nodiscard]] const std::string& text() const { return model().text; }
    [[nodiscard]] const PathSet& edited_paths() const { return model().edited; }
    [[nodiscard]] const PathSet& manually_collapsed() const { return model().expansion.manually_collapsed; }
    [[nodiscard]] const std::string& last_error() const { return model().last_error; }
    [[nodiscard]] bool is_dirty() const { return model().dirty; }
    [[nodiscard]] bool is_expanded(const std::string& path) const;

    // View state
    void toggle_expand(const std::string& path);
    void expand_all();
    void collapse_all_except_root();
    void set_manually_collapsed(PathSet paths);
    void reveal(const std::string& path);
    void clear_search();
    void set_show_changed_only(bool enabled);

    // Edits; false when the edit was rejected (see last_error())
    bool set_value(const std::string& path, Value value);
    bool add_field(const std::string& object_path, const std::string& key, Value value);
    bool remove_value(const std::string& path);
    bool insert_element(const std::string& array_path, std::size_t index, Value element);
    bool move_element(const std::string& array_path, std::size_t from, std::size_t to);

    [[nodiscard]] SavePayload save() const { return save_payload(model()); }

    /// Record that save() was written
    void mark_saved();
    void mark_saved(SavePayload persisted);
    void reset();

    /// Called whenever an action changes the model; the returned function
    /// unsubscribes
    using WatchCallback = std::function<void(const SessionModel&)>;
    [[nodiscard]] std::function<void()> watch(WatchCallback callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cfgtree
