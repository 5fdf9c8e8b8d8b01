#pragma once

/// @file global_key_registry.hpp
/// @brief Per-tree registry of global keys and deferred duplicate detection
///
/// Registering a key that is already registered does not fail. The element
/// losing the registration is remembered as "ill-fated" and checked at
/// finalize time: if it was unmounted in the meantime the key was handed over
/// legitimately, otherwise two active elements share the key.
///
/// Reservations record, per parent, which child it last reconciled under a
/// global key, so two parents claiming the same keyed child in one update
/// cycle can be reported with both parents named.
///
/// All bookkeeping refers to elements by handle; an element unmounted since
/// it was recorded resolves to nullptr and counts as defunct.

#include "fwd.hpp"
#include "element_arena.hpp"
#include "key.hpp"

#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace arbor_widgets {

class GlobalKeyRegistry {
public:
    explicit GlobalKeyRegistry(ElementArena& arena);

    GlobalKeyRegistry(const GlobalKeyRegistry&) = delete;
    GlobalKeyRegistry& operator=(const GlobalKeyRegistry&) = delete;

    // -------------------------------------------------------------------------
    // Registration
    // -------------------------------------------------------------------------

    void register_element(const KeyPtr& key, Element& element);

    /// No-op unless element is the one currently registered for key
    void unregister_element(const KeyPtr& key, const Element& element);

    /// Element registered for key, or nullptr
    [[nodiscard]] Element* current_element(const Key& key) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_registry.size(); }

    // -------------------------------------------------------------------------
    // Reservations
    // -------------------------------------------------------------------------

    void reserve_for(Element& parent, Element& child);
    void remove_reservation_for(ElementHandle parent, ElementHandle child);

    [[nodiscard]] std::size_t reservation_count() const;

    // -------------------------------------------------------------------------
    // Reparenting bookkeeping
    // -------------------------------------------------------------------------

    /// parent lost a keyed child to another parent and must rebuild this frame
    void track_parent_needing_rebuild(Element& parent, const KeyPtr& key);

    /// parent rebuilt, so it no longer expects the moved child
    void element_was_rebuilt(const Element& parent);

    // -------------------------------------------------------------------------
    // Verification (finalize_tree)
    // -------------------------------------------------------------------------

    /// Throws TreeException when two parents reserved the same key
    void verify_reservations();

    /// Throws TreeException when a key lost its registration to another
    /// element while its previous element is still alive
    void verify_ill_fated_population();

    /// Throws TreeException when a parent that lost a keyed child never rebuilt
    void verify_reparented_parents();

    /// Drop every reservation, ill-fated record and pending parent
    void clear_frame_state();

private:
    ElementArena& m_arena;
    std::unordered_map<KeyPtr, ElementHandle, KeyHash, KeyEqual> m_registry;
    std::unordered_set<ElementHandle> m_ill_fated;
    std::unordered_map<ElementHandle, std::unordered_map<ElementHandle, KeyPtr>> m_reservations;
    std::unordered_map<ElementHandle, std::vector<KeyPtr>> m_parents_needing_rebuild;
};

} // namespace arbor_widgets
