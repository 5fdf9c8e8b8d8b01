/// @file render_object.cpp
/// @brief Backing node contract implementation

#include <arbor/widgets/render_object.hpp>

#include <arbor/core/error.hpp>

namespace arbor_widgets {

using arbor_core::TreeError;
using arbor_core::TreeException;

// =============================================================================
// RenderObject
// =============================================================================

void RenderObject::attach() {
    m_attached = true;
    visit_children([](RenderObject& child) { child.attach(); });
}

void RenderObject::detach() {
    m_attached = false;
    visit_children([](RenderObject& child) { child.detach(); });
}

void RenderObject::adopt_child(RenderObject& child) {
    if (child.m_parent != nullptr) {
        throw TreeException(TreeError::internal_consistency(
            "Render object " + child.debug_name() + " already has a parent"));
    }
    setup_parent_data(child);
    child.m_parent = this;
    redepth_child(child);
    if (m_attached) {
        child.attach();
    }
}

void RenderObject::drop_child(RenderObject& child) {
    if (child.m_parent != this) {
        throw TreeException(TreeError::internal_consistency(
            "Render object " + child.debug_name() + " is not a child of " + debug_name()));
    }
    child.m_parent = nullptr;
    if (child.m_attached) {
        child.detach();
    }
}

void RenderObject::redepth_child(RenderObject& child) {
    if (child.m_depth <= m_depth) {
        child.m_depth = m_depth + 1;
        child.visit_children([&child](RenderObject& grandchild) { child.redepth_child(grandchild); });
    }
}

// =============================================================================
// RenderObjectWithChild
// =============================================================================

void RenderObjectWithChild::set_child(RenderObject* child) {
    if (m_child != nullptr) {
        drop_child(*m_child);
    }
    m_child = child;
    if (m_child != nullptr) {
        adopt_child(*m_child);
    }
}

void RenderObjectWithChild::visit_children(const RenderObjectVisitor& visitor) {
    if (m_child != nullptr) {
        visitor(*m_child);
    }
}

// =============================================================================
// ContainerRenderObject
// =============================================================================

ContainerParentData& ContainerRenderObject::links(const RenderObject& child) {
    auto* data = dynamic_cast<ContainerParentData*>(child.parent_data());
    if (data == nullptr) {
        throw TreeException(TreeError::internal_consistency(
            "Child " + child.debug_name() + " has no container parent data"));
    }
    return *data;
}

void ContainerRenderObject::setup_parent_data(RenderObject& child) {
    if (dynamic_cast<ContainerParentData*>(child.parent_data()) == nullptr) {
        child.set_parent_data(std::make_unique<ContainerParentData>());
    }
}

void ContainerRenderObject::insert_into_list(RenderObject& child, RenderObject* after) {
    auto& child_links = links(child);
    ++m_child_count;
    if (after == nullptr) {
        child_links.next_sibling = m_first_child;
        if (m_first_child != nullptr) {
            links(*m_first_child).previous_sibling = &child;
        }
        m_first_child = &child;
        if (m_last_child == nullptr) {
            m_last_child = &child;
        }
        return;
    }

    if (after->parent() != this) {
        throw TreeException(TreeError::internal_consistency(
            "Insertion anchor " + after->debug_name() + " is not a child of " + debug_name()));
    }
    auto& after_links = links(*after);
    child_links.previous_sibling = after;
    child_links.next_sibling = after_links.next_sibling;
    if (after_links.next_sibling != nullptr) {
        links(*after_links.next_sibling).previous_sibling = &child;
    } else {
        m_last_child = &child;
    }
    after_links.next_sibling = &child;
}

void ContainerRenderObject::remove_from_list(RenderObject& child) {
    auto& child_links = links(child);
    if (child_links.previous_sibling == nullptr) {
        m_first_child = child_links.next_sibling;
    } else {
        links(*child_links.previous_sibling).next_sibling = child_links.next_sibling;
    }
    if (child_links.next_sibling == nullptr) {
        m_last_child = child_links.previous_sibling;
    } else {
        links(*child_links.next_sibling).previous_sibling = child_links.previous_sibling;
    }
    child_links.previous_sibling = nullptr;
    child_links.next_sibling = nullptr;
    --m_child_count;
}

void ContainerRenderObject::insert(RenderObject& child, RenderObject* after) {
    if (&child == this || &child == after) {
        throw TreeException(TreeError::internal_consistency(
            "Render object " + child.debug_name() + " cannot be inserted relative to itself"));
    }
    adopt_child(child);
    insert_into_list(child, after);
}

void ContainerRenderObject::move(RenderObject& child, RenderObject* after) {
    if (child.parent() != this) {
        throw TreeException(TreeError::internal_consistency(
            "Cannot move " + child.debug_name() + ": not a child of " + debug_name()));
    }
    if (links(child).previous_sibling == after) {
        return;
    }
    remove_from_list(child);
    insert_into_list(child, after);
}

void ContainerRenderObject::remove(RenderObject& child) {
    if (child.parent() != this) {
        throw TreeException(TreeError::internal_consistency(
            "Cannot remove " + child.debug_name() + ": not a child of " + debug_name()));
    }
    remove_from_list(child);
    drop_child(child);
}

RenderObject* ContainerRenderObject::child_after(const RenderObject& child) const {
    return links(child).next_sibling;
}

RenderObject* ContainerRenderObject::child_before(const RenderObject& child) const {
    return links(child).previous_sibling;
}

std::vector<RenderObject*> ContainerRenderObject::children() const {
    std::vector<RenderObject*> result;
    result.reserve(m_child_count);
    for (RenderObject* child = m_first_child; child != nullptr; child = links(*child).next_sibling) {
        result.push_back(child);
    }
    return result;
}

void ContainerRenderObject::visit_children(const RenderObjectVisitor& visitor) {
    RenderObject* child = m_first_child;
    while (child != nullptr) {
        RenderObject* next = links(*child).next_sibling;
        visitor(*child);
        child = next;
    }
}

// =============================================================================
// RootRenderObject
// =============================================================================

RootRenderObject::RootRenderObject() {
    attach();
}

} // namespace arbor_widgets
