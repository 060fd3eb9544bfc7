// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <cfgtree/document_session.h>
#include <cfgtree/patcher.h>
#include <cfgtree/path_utils.h>
#include <cfgtree/serialization.h>
#include <cfgtree/sparse.h>

#include <lager/event_loop/manual.hpp>
#include <lager/reader.hpp>
#include <lager/store.hpp>
#include <lager/watch.hpp>

#include <type_traits>
#include <utility>
#include <vector>

namespace cfgtree {

namespace {

// ============================================================
// Derived state
// ============================================================

[[nodiscard]] bool uses_hybrid_diff(DocumentStatus status)
{
    return status == DocumentStatus::Added || status == DocumentStatus::Deleted;
}

SessionModel refresh(SessionModel model)
{
    if (!model.configured) {
        return model;
    }

    model.changes = uses_hybrid_diff(model.status)
                        ? compare_hybrid(model.current, model.original_ptr(), model.status, model.edited)
                        : compare(model.current, model.original_ptr());

    FlattenOptions options;
    if (model.show_changed_only) {
        options.keep_only = changed_paths_with_ancestors(model.changes);
    }
    options.current_match = model.current_match;

    model.nodes = flatten(model.current, model.original_ptr(), model.changes, model.expansion, options);
    return model;
}

PathSet inventory_of(const SessionModel& model)
{
    return collect_container_paths(model.current, model.original_ptr());
}

SessionModel configure(actions::Configure act)
{
    SessionModel model;
    model.current = std::move(act.current);
    model.original = std::move(act.original);
    model.text = act.text ? std::move(*act.text) : to_json(model.current);
    model.status = act.status;
    model.config = std::move(act.config);
    model.show_changed_only = model.config.show_changed_only;
    model.configured = true;

    ExpansionState expansion;
    expansion.manually_collapsed = model.config.manually_collapsed;
    if (model.config.expand_all_by_default) {
        expansion.expanded = inventory_of(model);
    } else {
        expansion.expanded = PathSet{}.insert("");
    }
    model.expansion = std::move(expansion);
    return model;
}

// ============================================================
// Edits
// ============================================================

SessionModel reject(SessionModel model, std::string message)
{
    detail::log_access_error("session_update", message);
    model.last_error = std::move(message);
    return model;
}

/// Adopt an accepted edit: new tree, new text, one more edited path
SessionModel accept(SessionModel model, Value tree, const PatchResult& patch, const std::string& edited_path)
{
    if (patch.ok) {
        model.text = patch.text;
    } else {
        detail::log_path_error("session_update", edited_path, "text patch failed; re-serializing");
        JsonWriteOptions opts;
        opts.indent = detect_indentation(model.text);
        model.text = to_json(tree, opts);
    }
    model.current = std::move(tree);
    model.edited = model.edited.insert(edited_path);
    model.dirty = true;
    model.last_error.clear();
    return model;
}

std::optional<Path> parse_edit_path(const std::string& canonical, std::string& error)
{
    auto path = Path::parse(canonical);
    if (!path) {
        error = "malformed path '" + canonical + "'";
    }
    return path;
}

SessionModel set_value_at(SessionModel model, const Path& path, const Value& value)
{
    std::string error;
    auto tree = set_value(model.current, path, value, &error);
    if (!tree) return reject(std::move(model), error);

    auto patch = apply_minimal_edit(model.text, path, value, &model.current);
    return accept(std::move(model), std::move(*tree), patch, path.to_string());
}

/// Replace the whole array at @p array_path after an element-level edit
SessionModel replace_array(SessionModel model, const Path& array_path, std::optional<Value> tree, std::string error)
{
    if (!tree) return reject(std::move(model), error);

    const Value* new_array = find_at_path(*tree, array_path);
    if (!new_array) return reject(std::move(model), "array vanished after edit");

    auto patch = apply_minimal_edit(model.text, array_path, *new_array, &model.current);
    return accept(std::move(model), std::move(*tree), patch, array_path.to_string());
}

SessionModel apply_edit(SessionModel model, const actions::SetValue& act)
{
    std::string error;
    auto path = parse_edit_path(act.path, error);
    if (!path) return reject(std::move(model), error);
    return set_value_at(std::move(model), *path, act.value);
}

SessionModel apply_edit(SessionModel model, const actions::AddField& act)
{
    std::string error;
    auto parent = parse_edit_path(act.object_path, error);
    if (!parent) return reject(std::move(model), error);

    const Value* target = find_at_path(model.current, *parent);
    if (!target || !target->is_object()) {
        return reject(std::move(model), "'" + path_to_display(act.object_path) + "' is not an object");
    }
    if (target->contains(act.key)) {
        return reject(std::move(model), "field '" + act.key + "' already exists");
    }
    return set_value_at(std::move(model), parent->child(act.key), act.value);
}

SessionModel apply_edit(SessionModel model, const actions::RemoveValue& act)
{
    std::string error;
    auto path = parse_edit_path(act.path, error);
    if (!path) return reject(std::move(model), error);

    auto tree = remove_value(model.current, *path, &error);
    if (!tree) return reject(std::move(model), error);

    // Removing an element shifts its siblings, so the array is what changed
    const bool is_element = std::holds_alternative<std::size_t>(path->back());
    const std::string edited_path = is_element ? path->parent().to_string() : path->to_string();

    auto patch = apply_minimal_delete(model.text, *path, &model.current);
    return accept(std::move(model), std::move(*tree), patch, edited_path);
}

SessionModel apply_edit(SessionModel model, const actions::InsertElement& act)
{
    std::string error;
    auto path = parse_edit_path(act.array_path, error);
    if (!path) return reject(std::move(model), error);

    auto tree = insert_element(model.current, *path, act.index, act.element, &error);
    return replace_array(std::move(model), *path, std::move(tree), std::move(error));
}

SessionModel apply_edit(SessionModel model, const actions::MoveElement& act)
{
    std::string error;
    auto path = parse_edit_path(act.array_path, error);
    if (!path) return reject(std::move(model), error);

    auto tree = move_element(model.current, *path, act.from, act.to, &error);
    return replace_array(std::move(model), *path, std::move(tree), std::move(error));
}

/// The written payload becomes the document the session edits from now on.
/// A file deleted upstream exists again once saved, so it turns Added and
/// has no original to compare against.
SessionModel adopt_saved(SessionModel model, SavePayload persisted)
{
    if (persisted.sparse) {
        std::string error;
        auto saved = parse_json(persisted.text, &error);
        if (!saved) return reject(std::move(model), "saved payload does not parse: " + error);
        model.current = std::move(*saved);
        model.text = std::move(persisted.text);
    }
    if (model.status == DocumentStatus::Deleted) {
        model.status = DocumentStatus::Added;
        model.original.reset();
    }
    model.edited = PathSet{};
    model.dirty = false;
    model.last_error.clear();
    return model;
}

template <typename T>
inline constexpr bool is_edit_action_v =
    std::is_same_v<T, actions::SetValue> || std::is_same_v<T, actions::AddField> ||
    std::is_same_v<T, actions::RemoveValue> || std::is_same_v<T, actions::InsertElement> ||
    std::is_same_v<T, actions::MoveElement>;

} // anonymous namespace

// ============================================================
// Reducer
// ============================================================

SessionModel session_update(SessionModel model, SessionAction action)
{
    return std::visit(
        [&model](auto&& act) -> SessionModel {
            using T = std::decay_t<decltype(act)>;

            // ===== Lifecycle =====

            if constexpr (std::is_same_v<T, actions::Configure>) {
                return refresh(configure(std::move(act)));
            }

            else if constexpr (std::is_same_v<T, actions::Reset>) {
                return SessionModel{};
            }

            else if constexpr (std::is_same_v<T, actions::MarkSaved>) {
                if (!model.configured) return model;
                return refresh(adopt_saved(std::move(model), std::move(act.persisted)));
            }

            // ===== View state =====

            else if constexpr (std::is_same_v<T, actions::ToggleExpand>) {
                model.expansion = model.expansion.toggle(act.path);
                return refresh(std::move(model));
            }

            else if constexpr (std::is_same_v<T, actions::ExpandAll>) {
                model.expansion = expand_all(model.expansion, inventory_of(model));
                return refresh(std::move(model));
            }

            else if constexpr (std::is_same_v<T, actions::CollapseAllExceptRoot>) {
                model.expansion = collapse_all_except_root(model.expansion, inventory_of(model));
                return refresh(std::move(model));
            }

            else if constexpr (std::is_same_v<T, actions::SetManuallyCollapsed>) {
                model.expansion.manually_collapsed = act.paths;
                return refresh(std::move(model));
            }

            else if constexpr (std::is_same_v<T, actions::SetSearchMatch>) {
                model.expansion.search_expanded = act.path ? paths_to_expand(*act.path) : PathSet{};
                model.current_match = act.path;
                return refresh(std::move(model));
            }

            else if constexpr (std::is_same_v<T, actions::SetChangeFilter>) {
                model.show_changed_only = act.show_changed_only;
                return refresh(std::move(model));
            }

            // ===== Edits =====

            else if constexpr (is_edit_action_v<T>) {
                if (!model.configured) {
                    return reject(std::move(model), "no document is loaded");
                }
                return refresh(apply_edit(std::move(model), act));
            }

            return model;
        },
        std::move(action));
}

// ============================================================
// Save payload
// ============================================================

SavePayload save_payload(const SessionModel& model)
{
    SavePayload payload;
    if (model.status == DocumentStatus::Deleted && !model.edited.empty()) {
        std::vector<std::string> skipped;
        Value sparse = reconstruct_sparse(model.current, model.edited, &skipped);

        JsonWriteOptions opts;
        opts.indent = detect_indentation(model.text);
        opts.sort_keys = true;
        payload.text = to_json(sparse, opts);
        if (!model.text.empty() && model.text.back() == '\n') payload.text += '\n';
        payload.sparse = true;
        return payload;
    }
    payload.text = model.text;
    return payload;
}

// Store type deduction helper
inline auto make_session_store_impl(SessionModel initial)
{
    return lager::make_store<SessionAction>(std::move(initial), lager::with_manual_event_loop{},
                                            lager::with_reducer(session_update));
}

using SessionStoreType = decltype(make_session_store_impl(std::declval<SessionModel>()));

// ============================================================
// DocumentSession Implementation
// ============================================================

struct DocumentSession::Impl {
    using SessionReader = lager::reader<SessionModel>;

    std::unique_ptr<SessionStoreType> store;
    std::vector<std::shared_ptr<SessionReader>> watchers;  ///< each holds its own lager connections

    Impl() : store(std::make_unique<SessionStoreType>(make_session_store_impl(SessionModel{}))) {}
};

DocumentSession::DocumentSession() : impl_(std::make_unique<Impl>()) {}
DocumentSession::~DocumentSession() = default;

void DocumentSession::configure(Value current,
                                std::optional<Value> original,
                                DocumentStatus status,
                                SessionConfig config,
                                std::optional<std::string> text)
{
    dispatch(actions::Configure{std::move(current), std::move(original), std::move(text), status, std::move(config)});
}

bool DocumentSession::configure_from_text(std::string_view current_text,
                                          std::optional<std::string_view> original_text,
                                          DocumentStatus status,
                                          SessionConfig config,
                                          std::string* error_out)
{
    std::string error;
    auto current = parse_json(current_text, &error);
    if (!current) {
        detail::log_access_error("DocumentSession::configure_from_text", "current document: " + error);
        if (error_out) *error_out = error;
        return false;
    }

    std::optional<Value> original;
    if (original_text) {
        std::string original_error;
        original = parse_json(*original_text, &original_error);
        if (!original) {
            detail::log_access_error("DocumentSession::configure_from_text",
                                     "original document ignored: " + original_error);
        }
    }

    configure(std::move(*current), std::move(original), status, std::move(config), std::string{current_text});
    return true;
}

void DocumentSession::dispatch(SessionAction action)
{
    impl_->store->dispatch(std::move(action));
}

const SessionModel& DocumentSession::model() const
{
    return impl_->store->get();
}

bool DocumentSession::is_expanded(const std::string& path) const
{
    return model().expansion.is_expanded(path);
}

void DocumentSession::toggle_expand(const std::string& path)
{
    dispatch(actions::ToggleExpand{path});
}

void DocumentSession::expand_all()
{
    dispatch(actions::ExpandAll{});
}

void DocumentSession::collapse_all_except_root()
{
    dispatch(actions::CollapseAllExceptRoot{});
}

void DocumentSession::set_manually_collapsed(PathSet paths)
{
    dispatch(actions::SetManuallyCollapsed{std::move(paths)});
}

void DocumentSession::reveal(const std::string& path)
{
    dispatch(actions::SetSearchMatch{path});
}

void DocumentSession::clear_search()
{
    dispatch(actions::SetSearchMatch{std::nullopt});
}

void DocumentSession::set_show_changed_only(bool enabled)
{
    dispatch(actions::SetChangeFilter{enabled});
}

bool DocumentSession::set_value(const std::string& path, Value value)
{
    dispatch(actions::SetValue{path, std::move(value)});
    return last_error().empty();
}

bool DocumentSession::add_field(const std::string& object_path, const std::string& key, Value value)
{
    dispatch(actions::AddField{object_path, key, std::move(value)});
    return last_error().empty();
}

bool DocumentSession::remove_value(const std::string& path)
{
    dispatch(actions::RemoveValue{path});
    return last_error().empty();
}

bool DocumentSession::insert_element(const std::string& array_path, std::size_t index, Value element)
{
    dispatch(actions::InsertElement{array_path, index, std::move(element)});
    return last_error().empty();
}

bool DocumentSession::move_element(const std::string& array_path, std::size_t from, std::size_t to)
{
    dispatch(actions::MoveElement{array_path, from, to});
    return last_error().empty();
}

void DocumentSession::mark_saved()
{
    mark_saved(save());
}

void DocumentSession::mark_saved(SavePayload persisted)
{
    dispatch(actions::MarkSaved{std::move(persisted)});
}

void DocumentSession::reset()
{
    dispatch(actions::Reset{});
}

std::function<void()> DocumentSession::watch(WatchCallback callback)
{
    auto observed = std::make_shared<Impl::SessionReader>(*impl_->store);
    observed->watch(std::move(callback));
    impl_->watchers.push_back(observed);

    std::weak_ptr<Impl::SessionReader> weak = observed;
    return [weak]() {
        if (auto reader = weak.lock()) reader->unwatch();
    };
}

} // namespace cfgtree
