#pragma once

/// @file element_arena.hpp
/// @brief Generational storage owning every element of one tree
///
/// Elements are owned by the arena of their BuildOwner and addressed by
/// ElementHandle. Parents, the inactive set and the dirty list refer to
/// elements through non-owning pointers; the global key registry stores
/// handles, so a lookup after teardown yields nullptr instead of a dangling
/// pointer.
///
/// Retiring an element (after unmount) parks it until release_retired(),
/// which BuildOwner calls at the very end of finalize_tree once no
/// bookkeeping refers to it any more.

#include "fwd.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace arbor_widgets {

// =============================================================================
// ElementHandle
// =============================================================================

/// Generational index addressing an element slot.
/// Layout: [Generation(32 bits) | Index(32 bits)]
struct ElementHandle {
    static constexpr std::uint64_t NULL_BITS = UINT64_MAX;

    std::uint64_t bits = NULL_BITS;

    [[nodiscard]] static constexpr ElementHandle create(std::uint32_t index, std::uint32_t generation) noexcept {
        ElementHandle h;
        h.bits = (static_cast<std::uint64_t>(generation) << 32) | index;
        return h;
    }

    [[nodiscard]] static constexpr ElementHandle null() noexcept { return ElementHandle{}; }

    [[nodiscard]] constexpr bool is_null() const noexcept { return bits == NULL_BITS; }
    [[nodiscard]] constexpr std::uint32_t index() const noexcept { return static_cast<std::uint32_t>(bits); }
    [[nodiscard]] constexpr std::uint32_t generation() const noexcept {
        return static_cast<std::uint32_t>(bits >> 32);
    }

    constexpr bool operator==(const ElementHandle&) const noexcept = default;

    explicit constexpr operator bool() const noexcept { return !is_null(); }
};

// =============================================================================
// ElementArena
// =============================================================================

/// Arena statistics
struct ArenaStats {
    std::size_t live = 0;
    std::size_t retired = 0;
    std::size_t capacity = 0;
    std::size_t peak_live = 0;
    std::uint64_t total_adopted = 0;
    std::uint64_t total_released = 0;
};

class ElementArena {
public:
    ElementArena() = default;
    ~ElementArena();

    ElementArena(const ElementArena&) = delete;
    ElementArena& operator=(const ElementArena&) = delete;

    /// Take ownership of a freshly created element and assign its handle
    Element& adopt(std::unique_ptr<Element> element);

    /// Element for a handle, or nullptr when the handle is stale
    [[nodiscard]] Element* get(ElementHandle handle) const;

    [[nodiscard]] bool contains(ElementHandle handle) const { return get(handle) != nullptr; }

    /// Invalidate the handle and park the element until release_retired()
    void retire(ElementHandle handle);

    /// Destroy every retired element; returns how many were freed
    std::size_t release_retired();

    [[nodiscard]] std::size_t live_count() const noexcept { return m_live; }
    [[nodiscard]] std::size_t retired_count() const noexcept { return m_retired.size(); }
    [[nodiscard]] ArenaStats stats() const;

    /// Visit every live element in slot order
    void for_each(const std::function<void(Element&)>& visitor) const;

private:
    struct Slot {
        std::unique_ptr<Element> element;
        std::uint32_t generation = 0;
    };

    std::vector<Slot> m_slots;
    std::vector<std::uint32_t> m_free_list;
    std::vector<std::unique_ptr<Element>> m_retired;
    std::size_t m_live = 0;
    std::size_t m_peak_live = 0;
    std::uint64_t m_total_adopted = 0;
    std::uint64_t m_total_released = 0;
};

} // namespace arbor_widgets

template<>
struct std::hash<arbor_widgets::ElementHandle> {
    std::size_t operator()(const arbor_widgets::ElementHandle& h) const noexcept {
        return std::hash<std::uint64_t>{}(h.bits);
    }
};
