/// @file global_key_registry.cpp
/// @brief Global key registration and finalize-time duplicate detection

#include <arbor/widgets/global_key_registry.hpp>

#include <arbor/core/error.hpp>
#include <arbor/widgets/element.hpp>
#include <arbor/widgets/render_object.hpp>
#include <arbor/widgets/widget.hpp>

#include <algorithm>

namespace arbor_widgets {

using arbor_core::TreeError;
using arbor_core::TreeException;

namespace {

constexpr const char* k_single_use_hint =
    "A GlobalKey can only be specified on one widget at a time in the widget tree.";

bool is_live(const Element* element) {
    return element && element->lifecycle() != ElementLifecycle::Defunct;
}

/// Drop child from parent's child list if parent still lists it
void forget_if_listed(Element& parent, Element& child) {
    bool listed = false;
    parent.visit_children([&](Element& candidate) {
        if (&candidate == &child) {
            listed = true;
        }
    });
    if (listed) {
        parent.forget_child(child);
    }
}

} // anonymous namespace

GlobalKeyRegistry::GlobalKeyRegistry(ElementArena& arena) : m_arena(arena) {}

// =============================================================================
// Registration
// =============================================================================

void GlobalKeyRegistry::register_element(const KeyPtr& key, Element& element) {
    auto it = m_registry.find(key);
    if (it == m_registry.end()) {
        m_registry.emplace(key, element.handle());
        return;
    }
    if (it->second != element.handle() && m_arena.get(it->second)) {
        m_ill_fated.insert(it->second);
    }
    it->second = element.handle();
}

void GlobalKeyRegistry::unregister_element(const KeyPtr& key, const Element& element) {
    auto it = m_registry.find(key);
    if (it != m_registry.end() && it->second == element.handle()) {
        m_registry.erase(it);
    }
}

Element* GlobalKeyRegistry::current_element(const Key& key) const {
    // Non-owning probe; KeyHash and KeyEqual only look through the pointer
    const KeyPtr probe(KeyPtr{}, &key);
    auto it = m_registry.find(probe);
    return it != m_registry.end() ? m_arena.get(it->second) : nullptr;
}

// =============================================================================
// Reservations
// =============================================================================

void GlobalKeyRegistry::reserve_for(Element& parent, Element& child) {
    m_reservations[parent.handle()][child.handle()] = child.widget()->key();
}

void GlobalKeyRegistry::remove_reservation_for(ElementHandle parent, ElementHandle child) {
    auto it = m_reservations.find(parent);
    if (it == m_reservations.end()) {
        return;
    }
    it->second.erase(child);
    if (it->second.empty()) {
        m_reservations.erase(it);
    }
}

std::size_t GlobalKeyRegistry::reservation_count() const {
    std::size_t count = 0;
    for (const auto& [parent, children] : m_reservations) {
        count += children.size();
    }
    return count;
}

// =============================================================================
// Reparenting bookkeeping
// =============================================================================

void GlobalKeyRegistry::track_parent_needing_rebuild(Element& parent, const KeyPtr& key) {
    m_parents_needing_rebuild[parent.handle()].push_back(key);
}

void GlobalKeyRegistry::element_was_rebuilt(const Element& parent) {
    m_parents_needing_rebuild.erase(parent.handle());
}

// =============================================================================
// Verification
// =============================================================================

void GlobalKeyRegistry::verify_reservations() {
    std::unordered_map<KeyPtr, ElementHandle, KeyHash, KeyEqual> key_to_parent;

    for (const auto& [parent_handle, child_to_key] : m_reservations) {
        Element* parent = m_arena.get(parent_handle);
        if (!is_live(parent)) {
            continue;
        }
        // A parent whose render object left the render tree no longer owns anything
        RenderObject* render_object = parent->render_object();
        if (render_object && !render_object->attached()) {
            continue;
        }

        for (const auto& [child_handle, key] : child_to_key) {
            Element* child = m_arena.get(child_handle);
            if (!is_live(child) || !child->parent()) {
                continue;
            }

            auto found = key_to_parent.find(key);
            if (found == key_to_parent.end() || found->second == parent_handle) {
                key_to_parent[key] = parent_handle;
                continue;
            }

            Element* older = m_arena.get(found->second);
            Element* newer = parent;
            // Both parents may still list the child; keep the tree consistent
            // for teardown after the failure surfaces
            if (older && child->parent() != older) {
                forget_if_listed(*older, *child);
            }
            if (child->parent() != newer) {
                forget_if_listed(*newer, *child);
            }

            TreeError error = TreeError::duplicate_global_key(
                "Multiple widgets used the same GlobalKey.",
                {"The key " + key->to_string() + " was used by multiple widgets. The parents of those widgets were:"},
                {});
            if (older) {
                error.with_detail("- " + older->to_string_short());
                error.with_chain(older->describe_chain());
            }
            error.with_detail("- " + newer->to_string_short());
            error.with_chain(newer->describe_chain());
            error.with_detail(k_single_use_hint);
            throw TreeException(std::move(error));
        }
    }
    m_reservations.clear();
}

void GlobalKeyRegistry::verify_ill_fated_population() {
    std::unordered_map<KeyPtr, std::vector<Element*>, KeyHash, KeyEqual> duplicates;

    for (ElementHandle handle : m_ill_fated) {
        Element* element = m_arena.get(handle);
        if (!is_live(element)) {
            continue;
        }
        const KeyPtr& key = element->widget()->key();
        auto& elements = duplicates[key];
        if (std::find(elements.begin(), elements.end(), element) == elements.end()) {
            elements.push_back(element);
        }
        Element* current = current_element(*key);
        if (current && std::find(elements.begin(), elements.end(), current) == elements.end()) {
            elements.push_back(current);
        }
    }
    m_ill_fated.clear();

    if (duplicates.empty()) {
        return;
    }

    TreeError error = TreeError::duplicate_global_key("Multiple widgets used the same GlobalKey.", {}, {});
    for (const auto& [key, elements] : duplicates) {
        error.with_detail("The key " + key->to_string() + " was used by " + std::to_string(elements.size()) +
                          " widgets:");
        for (const Element* element : elements) {
            error.with_detail("- " + element->to_string_short());
            error.with_chain(element->describe_chain());
        }
    }
    error.with_detail(k_single_use_hint);
    throw TreeException(std::move(error));
}

void GlobalKeyRegistry::verify_reparented_parents() {
    TreeError error = TreeError::duplicate_global_key("Duplicate GlobalKey detected in widget tree.", {}, {});
    bool failed = false;

    for (const auto& [parent_handle, keys] : m_parents_needing_rebuild) {
        Element* parent = m_arena.get(parent_handle);
        if (!is_live(parent)) {
            continue;
        }
        failed = true;
        for (const KeyPtr& key : keys) {
            error.with_detail("The key " + key->to_string() +
                              " was moved out of its previous parent, which never rebuilt afterwards "
                              "and still expects a child with that key.");
        }
        error.with_detail("The parent that did not rebuild after losing a child to GlobalKey reparenting is:");
        error.with_detail("- " + parent->to_string_short());
        error.with_chain(parent->describe_chain());
    }
    m_parents_needing_rebuild.clear();

    if (failed) {
        error.with_detail(k_single_use_hint);
        throw TreeException(std::move(error));
    }
}

void GlobalKeyRegistry::clear_frame_state() {
    m_reservations.clear();
    m_ill_fated.clear();
    m_parents_needing_rebuild.clear();
}

} // namespace arbor_widgets
