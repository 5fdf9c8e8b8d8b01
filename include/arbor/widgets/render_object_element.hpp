#pragma once

/// @file render_object_element.hpp
/// @brief Elements that own a render object
///
/// A RenderObjectElement creates its render object at mount and inserts it
/// into the render object of its nearest render-backed ancestor. Structural
/// changes (insert, move, remove) are always performed by that ancestor
/// element, which knows how its render object arranges children.

#include "element.hpp"

#include <memory>
#include <unordered_set>
#include <vector>

namespace arbor_widgets {

// =============================================================================
// RenderObjectElement
// =============================================================================

class RenderObjectElement : public Element {
public:
    explicit RenderObjectElement(std::shared_ptr<const RenderObjectWidget> widget);
    ~RenderObjectElement() override;

    [[nodiscard]] const RenderObjectWidget& render_object_widget() const { return widget_as<RenderObjectWidget>(); }

    [[nodiscard]] RenderObject* render_object() const override { return m_render_object.get(); }

    void mount(Element* parent, Slot new_slot) override;
    void update(WidgetPtr new_widget) override;
    void deactivate() override;
    void unmount() override;
    void attach_render_object(Slot new_slot) override;
    void detach_render_object() override;

    /// Apply a ParentDataWidget to this element's render object
    void update_parent_data(const ParentDataWidget& parent_data_widget);

    // -------------------------------------------------------------------------
    // Child render object maintenance
    // -------------------------------------------------------------------------

    virtual void insert_child_render_object(RenderObject& child, const Slot& slot) = 0;
    virtual void move_child_render_object(RenderObject& child, const Slot& slot) = 0;
    virtual void remove_child_render_object(RenderObject& child) = 0;

protected:
    void perform_rebuild() override;
    void update_slot(Slot new_slot) override;

    /// Six-phase reconciliation of an ordered child list.
    ///
    /// Keeps matching prefixes and suffixes in place, matches the middle by
    /// key and inflates whatever is left. Every resulting child receives an
    /// IndexedSlot naming its new predecessor.
    ///
    /// @p new_children is filled in as children are placed, so after a throw
    /// it holds every child reconciled before the failure (null elsewhere).
    void update_children(const std::vector<Element*>& old_children,
                         const WidgetList& new_widgets,
                         std::vector<Element*>& new_children,
                         const std::unordered_set<Element*>* forgotten_children = nullptr);

private:
    [[nodiscard]] RenderObjectElement* find_ancestor_render_object_element() const;
    [[nodiscard]] ParentDataElement* find_ancestor_parent_data_element() const;

    std::unique_ptr<RenderObject> m_render_object;
    RenderObjectElement* m_ancestor_render_object_element = nullptr;
};

// =============================================================================
// Leaf
// =============================================================================

class LeafRenderObjectElement : public RenderObjectElement {
public:
    explicit LeafRenderObjectElement(std::shared_ptr<const LeafRenderObjectWidget> widget);

    void forget_child(Element& child) override;
    void insert_child_render_object(RenderObject& child, const Slot& slot) override;
    void move_child_render_object(RenderObject& child, const Slot& slot) override;
    void remove_child_render_object(RenderObject& child) override;
};

// =============================================================================
// Single child
// =============================================================================

/// Requires the render object to be a RenderObjectWithChild
class SingleChildRenderObjectElement : public RenderObjectElement {
public:
    explicit SingleChildRenderObjectElement(std::shared_ptr<const SingleChildRenderObjectWidget> widget);

    [[nodiscard]] Element* child() const noexcept { return m_child; }

    void visit_children(const ElementVisitor& visitor) override;
    void forget_child(Element& child) override;
    void mount(Element* parent, Slot new_slot) override;
    void update(WidgetPtr new_widget) override;

    void insert_child_render_object(RenderObject& child, const Slot& slot) override;
    void move_child_render_object(RenderObject& child, const Slot& slot) override;
    void remove_child_render_object(RenderObject& child) override;

private:
    [[nodiscard]] RenderObjectWithChild& container() const;

    Element* m_child = nullptr;
};

// =============================================================================
// Multiple children
// =============================================================================

/// Requires the render object to be a ContainerRenderObject
class MultiChildRenderObjectElement : public RenderObjectElement {
public:
    explicit MultiChildRenderObjectElement(std::shared_ptr<const MultiChildRenderObjectWidget> widget);

    /// Current children, skipping those claimed by another parent
    [[nodiscard]] std::vector<Element*> children() const;

    void visit_children(const ElementVisitor& visitor) override;
    void forget_child(Element& child) override;
    void mount(Element* parent, Slot new_slot) override;
    void update(WidgetPtr new_widget) override;

    void insert_child_render_object(RenderObject& child, const Slot& slot) override;
    void move_child_render_object(RenderObject& child, const Slot& slot) override;
    void remove_child_render_object(RenderObject& child) override;

private:
    [[nodiscard]] ContainerRenderObject& container() const;
    [[nodiscard]] static RenderObject* previous_render_object(const Slot& slot);
    void salvage_children(const std::vector<Element*>& placed);

    std::vector<Element*> m_children;
    std::unordered_set<Element*> m_forgotten_children;
};

} // namespace arbor_widgets
