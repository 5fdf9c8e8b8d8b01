/// @file root.cpp
/// @brief Root widget and element

#include <arbor/widgets/root.hpp>

#include <arbor/core/error.hpp>
#include <arbor/widgets/build_owner.hpp>

namespace arbor_widgets {

using arbor_core::TreeError;
using arbor_core::TreeException;

// =============================================================================
// RootWidget
// =============================================================================

RootWidget::RootWidget(WidgetPtr child, KeyPtr key)
    : RenderObjectWidget(std::move(key)), m_child(std::move(child)) {}

std::unique_ptr<Element> RootWidget::create_element() const {
    return std::make_unique<RootElement>(shared_as<RootWidget>());
}

std::unique_ptr<RenderObject> RootWidget::create_render_object(BuildContext& context) const {
    (void)context;
    return std::make_unique<RootRenderObject>();
}

RootElement& RootWidget::attach_to_render_tree(BuildOwner& owner, RootElement* existing) const {
    if (existing) {
        owner.build_scope(*existing, [&] { existing->update(shared_as<RootWidget>()); });
        return *existing;
    }

    auto& element = static_cast<RootElement&>(owner.arena().adopt(create_element()));
    owner.lock_state([&] { element.assign_owner(owner); });
    owner.build_scope(element, [&] { element.mount(nullptr, std::monostate{}); });
    return element;
}

// =============================================================================
// RootElement
// =============================================================================

RootElement::RootElement(std::shared_ptr<const RootWidget> widget)
    : RenderObjectElement(std::move(widget)) {}

RootRenderObject& RootElement::root_render_object() const {
    return static_cast<RootRenderObject&>(*render_object());
}

void RootElement::assign_owner(BuildOwner& owner) {
    if (m_lifecycle != ElementLifecycle::Initial) {
        throw TreeException(TreeError::contract_violation(
            "assign_owner() called on a root element that is already mounted."));
    }
    m_owner = &owner;
}

void RootElement::visit_children(const ElementVisitor& visitor) {
    if (m_child) {
        visitor(*m_child);
    }
}

void RootElement::forget_child(Element& child) {
    m_child = nullptr;
    RenderObjectElement::forget_child(child);
}

void RootElement::mount(Element* parent, Slot new_slot) {
    if (parent) {
        throw TreeException(TreeError::contract_violation(
            "A root element cannot be mounted under another element.")
                                .with_chain(parent->describe_chain()));
    }
    RenderObjectElement::mount(nullptr, std::move(new_slot));
    rebuild_child();
}

void RootElement::update(WidgetPtr new_widget) {
    RenderObjectElement::update(std::move(new_widget));
    rebuild_child();
}

void RootElement::perform_rebuild() {
    RenderObjectElement::perform_rebuild();
    rebuild_child();
}

void RootElement::rebuild_child() {
    const WidgetPtr& child_widget = widget_as<RootWidget>().child();
    try {
        m_child = update_child(m_child, child_widget, std::monostate{});
    } catch (...) {
        WidgetPtr error_widget = m_owner->build_error_widget(
            m_owner->report_exception("attaching to the render tree", std::current_exception(), this));
        if (m_child && m_child->active() && m_child->parent() == this) {
            deactivate_child(*m_child);
        }
        m_child = update_child(nullptr, error_widget, std::monostate{});
    }
}

void RootElement::insert_child_render_object(RenderObject& child, const Slot& slot) {
    (void)slot;
    root_render_object().set_child(&child);
}

void RootElement::move_child_render_object(RenderObject& child, const Slot& slot) {
    (void)child;
    (void)slot;
    throw TreeException(TreeError::internal_consistency("The child of the root element cannot move."));
}

void RootElement::remove_child_render_object(RenderObject& child) {
    if (root_render_object().child() != &child) {
        throw TreeException(TreeError::internal_consistency(
            "Removing a render object that is not the child of the root render object."));
    }
    root_render_object().set_child(nullptr);
}

} // namespace arbor_widgets
