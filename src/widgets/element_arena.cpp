/// @file element_arena.cpp
/// @brief Generational element storage

#include <arbor/widgets/element_arena.hpp>

#include <arbor/core/error.hpp>
#include <arbor/widgets/element.hpp>

namespace arbor_widgets {

using arbor_core::TreeError;
using arbor_core::TreeException;

ElementArena::~ElementArena() {
    // Drop parked elements first; live ones are destroyed with their slots
    m_retired.clear();
}

Element& ElementArena::adopt(std::unique_ptr<Element> element) {
    if (!element) {
        throw TreeException(TreeError::internal_consistency("Cannot adopt a null element"));
    }

    std::uint32_t index;
    if (!m_free_list.empty()) {
        index = m_free_list.back();
        m_free_list.pop_back();
    } else {
        index = static_cast<std::uint32_t>(m_slots.size());
        m_slots.emplace_back();
    }

    Slot& slot = m_slots[index];
    slot.element = std::move(element);
    slot.element->m_handle = ElementHandle::create(index, slot.generation);

    ++m_live;
    ++m_total_adopted;
    if (m_live > m_peak_live) {
        m_peak_live = m_live;
    }
    return *slot.element;
}

Element* ElementArena::get(ElementHandle handle) const {
    if (handle.is_null() || handle.index() >= m_slots.size()) {
        return nullptr;
    }
    const Slot& slot = m_slots[handle.index()];
    if (slot.generation != handle.generation()) {
        return nullptr;
    }
    return slot.element.get();
}

void ElementArena::retire(ElementHandle handle) {
    if (get(handle) == nullptr) {
        throw TreeException(TreeError::internal_consistency("Retiring an element with a stale handle"));
    }
    Slot& slot = m_slots[handle.index()];
    m_retired.push_back(std::move(slot.element));
    ++slot.generation;
    m_free_list.push_back(handle.index());
    --m_live;
}

std::size_t ElementArena::release_retired() {
    std::size_t count = m_retired.size();
    m_retired.clear();
    m_total_released += count;
    return count;
}

ArenaStats ElementArena::stats() const {
    ArenaStats stats;
    stats.live = m_live;
    stats.retired = m_retired.size();
    stats.capacity = m_slots.size();
    stats.peak_live = m_peak_live;
    stats.total_adopted = m_total_adopted;
    stats.total_released = m_total_released;
    return stats;
}

void ElementArena::for_each(const std::function<void(Element&)>& visitor) const {
    for (const auto& slot : m_slots) {
        if (slot.element) {
            visitor(*slot.element);
        }
    }
}

} // namespace arbor_widgets
