#pragma once

/// @file root.hpp
/// @brief Top of an element tree, bridging it to a RootRenderObject
///
/// @code
/// BuildOwner owner;
/// auto root = std::make_shared<RootWidget>(std::make_shared<App>());
/// RootElement& element = root->attach_to_render_tree(owner);
/// owner.finalize_tree();
///
/// // Next frame with a new configuration
/// std::make_shared<RootWidget>(next)->attach_to_render_tree(owner, &element);
/// @endcode

#include "render_object_element.hpp"

namespace arbor_widgets {

// =============================================================================
// RootWidget
// =============================================================================

class RootWidget : public RenderObjectWidget {
public:
    explicit RootWidget(WidgetPtr child, KeyPtr key = nullptr);

    [[nodiscard]] const WidgetPtr& child() const noexcept { return m_child; }

    [[nodiscard]] std::unique_ptr<Element> create_element() const override;
    [[nodiscard]] std::unique_ptr<RenderObject> create_render_object(BuildContext& context) const override;
    [[nodiscard]] std::string type_name() const override { return "RootWidget"; }

    /// Mount a new root under owner, or update existing with this widget.
    ///
    /// Both paths run inside a build scope of owner.
    RootElement& attach_to_render_tree(BuildOwner& owner, RootElement* existing = nullptr) const;

private:
    WidgetPtr m_child;
};

// =============================================================================
// RootElement
// =============================================================================

class RootElement final : public RenderObjectElement {
public:
    explicit RootElement(std::shared_ptr<const RootWidget> widget);

    [[nodiscard]] Element* child() const noexcept { return m_child; }
    [[nodiscard]] RootRenderObject& root_render_object() const;

    /// Give a parentless element its owner; must precede mount()
    void assign_owner(BuildOwner& owner);

    void visit_children(const ElementVisitor& visitor) override;
    void forget_child(Element& child) override;
    void mount(Element* parent, Slot new_slot) override;
    void update(WidgetPtr new_widget) override;

    void insert_child_render_object(RenderObject& child, const Slot& slot) override;
    void move_child_render_object(RenderObject& child, const Slot& slot) override;
    void remove_child_render_object(RenderObject& child) override;

protected:
    void perform_rebuild() override;

private:
    void rebuild_child();

    Element* m_child = nullptr;
};

} // namespace arbor_widgets
