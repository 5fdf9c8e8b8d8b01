/// @file render_object_element.cpp
/// @brief Render object attachment and ordered child list reconciliation

#include <arbor/widgets/render_object_element.hpp>

#include <arbor/core/error.hpp>
#include <arbor/widgets/build_owner.hpp>
#include <arbor/widgets/proxy_element.hpp>

#include <cstddef>
#include <unordered_map>

namespace arbor_widgets {

using arbor_core::TreeError;
using arbor_core::TreeException;

// =============================================================================
// RenderObjectElement
// =============================================================================

RenderObjectElement::RenderObjectElement(std::shared_ptr<const RenderObjectWidget> widget)
    : Element(std::move(widget)) {}

RenderObjectElement::~RenderObjectElement() = default;

void RenderObjectElement::mount(Element* parent, Slot new_slot) {
    Element::mount(parent, new_slot);
    m_render_object = render_object_widget().create_render_object(*this);
    if (!m_render_object) {
        throw TreeException(TreeError::contract_violation(
            widget()->type_name() + ".create_render_object() returned a null render object.")
                                .with_chain(describe_chain()));
    }
    attach_render_object(std::move(new_slot));
    set_dirty(false);
}

void RenderObjectElement::update(WidgetPtr new_widget) {
    Element::update(std::move(new_widget));
    render_object_widget().update_render_object(*this, *m_render_object);
    set_dirty(false);
}

void RenderObjectElement::perform_rebuild() {
    render_object_widget().update_render_object(*this, *m_render_object);
    set_dirty(false);
}

void RenderObjectElement::deactivate() {
    Element::deactivate();
    if (m_render_object && m_render_object->attached()) {
        throw TreeException(TreeError::internal_consistency(
            "A render object was still attached when its element was deactivated.",
            {"The render object was " + m_render_object->debug_name() + "."})
                                .with_chain(describe_chain()));
    }
}

void RenderObjectElement::unmount() {
    WidgetPtr old_widget = widget();
    Element::unmount();
    if (!m_render_object) {
        return;
    }
    if (m_render_object->attached()) {
        throw TreeException(TreeError::internal_consistency(
            "A render object was still attached when its element was unmounted.",
            {"The render object was " + m_render_object->debug_name() + "."})
                                .with_chain(describe_chain()));
    }
    static_cast<const RenderObjectWidget&>(*old_widget).did_unmount_render_object(*m_render_object);
}

void RenderObjectElement::attach_render_object(Slot new_slot) {
    m_slot = new_slot;
    m_ancestor_render_object_element = find_ancestor_render_object_element();
    if (m_ancestor_render_object_element && m_render_object) {
        m_ancestor_render_object_element->insert_child_render_object(*m_render_object, new_slot);
    }
    if (ParentDataElement* parent_data_element = find_ancestor_parent_data_element()) {
        update_parent_data(parent_data_element->parent_data_widget());
    }
}

void RenderObjectElement::detach_render_object() {
    if (m_ancestor_render_object_element) {
        if (m_render_object) {
            m_ancestor_render_object_element->remove_child_render_object(*m_render_object);
        }
        m_ancestor_render_object_element = nullptr;
    }
    m_slot = std::monostate{};
}

void RenderObjectElement::update_slot(Slot new_slot) {
    Element::update_slot(std::move(new_slot));
    if (m_ancestor_render_object_element && m_render_object) {
        m_ancestor_render_object_element->move_child_render_object(*m_render_object, slot());
    }
}

void RenderObjectElement::update_parent_data(const ParentDataWidget& parent_data_widget) {
    if (!m_render_object) {
        return;
    }
    if (!parent_data_widget.is_valid_render_object(*m_render_object)) {
        // Reported rather than thrown: an error widget here would break the tree further
        auto failure = std::make_exception_ptr(TreeException(TreeError::contract_violation(
            "Incorrect use of ParentDataWidget.",
            {"The ParentDataWidget " + parent_data_widget.to_string_short() + " wants to apply parent data of type " +
                 parent_data_widget.expected_parent_data_type() + " to a render object which has been set up to "
                 "accept incompatible parent data.",
             "Usually this means the ParentDataWidget has the wrong ancestor render object widget."})
                                                                  .with_chain(describe_chain())));
        owner()->report_exception("applying parent data", failure, this);
        return;
    }
    parent_data_widget.apply_parent_data(*m_render_object);
}

RenderObjectElement* RenderObjectElement::find_ancestor_render_object_element() const {
    Element* ancestor = parent();
    while (ancestor && !dynamic_cast<RenderObjectElement*>(ancestor)) {
        ancestor = ancestor->parent();
    }
    return static_cast<RenderObjectElement*>(ancestor);
}

ParentDataElement* RenderObjectElement::find_ancestor_parent_data_element() const {
    for (Element* ancestor = parent(); ancestor; ancestor = ancestor->parent()) {
        if (dynamic_cast<RenderObjectElement*>(ancestor)) {
            break;
        }
        if (auto* parent_data_element = dynamic_cast<ParentDataElement*>(ancestor)) {
            return parent_data_element;
        }
    }
    return nullptr;
}

// -----------------------------------------------------------------------------
// Ordered child list reconciliation
// -----------------------------------------------------------------------------

void RenderObjectElement::update_children(const std::vector<Element*>& old_children,
                                          const WidgetList& new_widgets,
                                          std::vector<Element*>& new_children,
                                          const std::unordered_set<Element*>* forgotten_children) {
    auto replace_with_null_if_forgotten = [forgotten_children](Element* child) -> Element* {
        return forgotten_children && forgotten_children->count(child) ? nullptr : child;
    };

    std::ptrdiff_t new_children_top = 0;
    std::ptrdiff_t old_children_top = 0;
    std::ptrdiff_t new_children_bottom = static_cast<std::ptrdiff_t>(new_widgets.size()) - 1;
    std::ptrdiff_t old_children_bottom = static_cast<std::ptrdiff_t>(old_children.size()) - 1;

    new_children.assign(new_widgets.size(), nullptr);
    Element* previous_child = nullptr;

    auto slot_for = [&previous_child](std::ptrdiff_t index) {
        return Slot{IndexedSlot{static_cast<std::size_t>(index), previous_child}};
    };

    // Phase 1: sync the compatible prefix in place
    while (old_children_top <= old_children_bottom && new_children_top <= new_children_bottom) {
        Element* old_child = replace_with_null_if_forgotten(old_children[old_children_top]);
        const WidgetPtr& new_widget = new_widgets[new_children_top];
        if (!old_child || !Widget::can_update(*old_child->widget(), *new_widget)) {
            break;
        }
        Element* new_child = update_child(old_child, new_widget, slot_for(new_children_top));
        new_children[new_children_top] = new_child;
        previous_child = new_child;
        ++new_children_top;
        ++old_children_top;
    }

    // Phase 2: find the compatible suffix, syncing it later in forward order
    while (old_children_top <= old_children_bottom && new_children_top <= new_children_bottom) {
        Element* old_child = replace_with_null_if_forgotten(old_children[old_children_bottom]);
        const WidgetPtr& new_widget = new_widgets[new_children_bottom];
        if (!old_child || !Widget::can_update(*old_child->widget(), *new_widget)) {
            break;
        }
        --old_children_bottom;
        --new_children_bottom;
    }

    // Phase 3: index the old middle by key, dropping unkeyed children
    const bool have_old_children = old_children_top <= old_children_bottom;
    std::unordered_map<KeyPtr, Element*, KeyHash, KeyEqual> old_keyed_children;
    if (have_old_children) {
        while (old_children_top <= old_children_bottom) {
            Element* old_child = replace_with_null_if_forgotten(old_children[old_children_top]);
            if (old_child) {
                if (old_child->widget()->key()) {
                    old_keyed_children[old_child->widget()->key()] = old_child;
                } else {
                    deactivate_child(*old_child);
                }
            }
            ++old_children_top;
        }
    }

    // Phase 4: walk the new middle, matching by key
    while (new_children_top <= new_children_bottom) {
        Element* old_child = nullptr;
        const WidgetPtr& new_widget = new_widgets[new_children_top];
        if (have_old_children && new_widget->key()) {
            auto it = old_keyed_children.find(new_widget->key());
            if (it != old_keyed_children.end() && Widget::can_update(*it->second->widget(), *new_widget)) {
                old_child = it->second;
                old_keyed_children.erase(it);
            }
        }
        Element* new_child = update_child(old_child, new_widget, slot_for(new_children_top));
        new_children[new_children_top] = new_child;
        previous_child = new_child;
        ++new_children_top;
    }

    // Phase 5: sync the suffix found in phase 2
    new_children_bottom = static_cast<std::ptrdiff_t>(new_widgets.size()) - 1;
    old_children_bottom = static_cast<std::ptrdiff_t>(old_children.size()) - 1;
    while (old_children_top <= old_children_bottom && new_children_top <= new_children_bottom) {
        Element* old_child = old_children[old_children_top];
        const WidgetPtr& new_widget = new_widgets[new_children_top];
        Element* new_child = update_child(old_child, new_widget, slot_for(new_children_top));
        new_children[new_children_top] = new_child;
        previous_child = new_child;
        ++new_children_top;
        ++old_children_top;
    }

    // Phase 6: drop keyed children nobody claimed
    for (const auto& [key, old_child] : old_keyed_children) {
        if (!forgotten_children || !forgotten_children->count(old_child)) {
            deactivate_child(*old_child);
        }
    }
}

// =============================================================================
// LeafRenderObjectElement
// =============================================================================

namespace {

[[noreturn]] void throw_leaf_has_no_children(const Element& element) {
    throw TreeException(TreeError::internal_consistency(
        "A leaf render object element was asked to manage a child.")
                            .with_chain(element.describe_chain()));
}

} // anonymous namespace

LeafRenderObjectElement::LeafRenderObjectElement(std::shared_ptr<const LeafRenderObjectWidget> widget)
    : RenderObjectElement(std::move(widget)) {}

void LeafRenderObjectElement::forget_child(Element& child) {
    (void)child;
    throw_leaf_has_no_children(*this);
}

void LeafRenderObjectElement::insert_child_render_object(RenderObject& child, const Slot& slot) {
    (void)child;
    (void)slot;
    throw_leaf_has_no_children(*this);
}

void LeafRenderObjectElement::move_child_render_object(RenderObject& child, const Slot& slot) {
    (void)child;
    (void)slot;
    throw_leaf_has_no_children(*this);
}

void LeafRenderObjectElement::remove_child_render_object(RenderObject& child) {
    (void)child;
    throw_leaf_has_no_children(*this);
}

// =============================================================================
// SingleChildRenderObjectElement
// =============================================================================

SingleChildRenderObjectElement::SingleChildRenderObjectElement(
    std::shared_ptr<const SingleChildRenderObjectWidget> widget)
    : RenderObjectElement(std::move(widget)) {}

RenderObjectWithChild& SingleChildRenderObjectElement::container() const {
    auto* with_child = dynamic_cast<RenderObjectWithChild*>(render_object());
    if (!with_child) {
        throw TreeException(TreeError::contract_violation(
            "A single-child render object widget must create a RenderObjectWithChild.")
                                .with_chain(describe_chain()));
    }
    return *with_child;
}

void SingleChildRenderObjectElement::visit_children(const ElementVisitor& visitor) {
    if (m_child) {
        visitor(*m_child);
    }
}

void SingleChildRenderObjectElement::forget_child(Element& child) {
    m_child = nullptr;
    RenderObjectElement::forget_child(child);
}

void SingleChildRenderObjectElement::mount(Element* parent, Slot new_slot) {
    RenderObjectElement::mount(parent, std::move(new_slot));
    m_child = update_child(m_child, widget_as<SingleChildRenderObjectWidget>().child(), std::monostate{});
}

void SingleChildRenderObjectElement::update(WidgetPtr new_widget) {
    RenderObjectElement::update(std::move(new_widget));
    m_child = update_child(m_child, widget_as<SingleChildRenderObjectWidget>().child(), std::monostate{});
}

void SingleChildRenderObjectElement::insert_child_render_object(RenderObject& child, const Slot& slot) {
    (void)slot;
    container().set_child(&child);
}

void SingleChildRenderObjectElement::move_child_render_object(RenderObject& child, const Slot& slot) {
    (void)child;
    (void)slot;
    throw TreeException(TreeError::internal_consistency(
        "The only child of a single-child render object element cannot move.")
                            .with_chain(describe_chain()));
}

void SingleChildRenderObjectElement::remove_child_render_object(RenderObject& child) {
    RenderObjectWithChild& with_child = container();
    if (with_child.child() != &child) {
        throw TreeException(TreeError::internal_consistency(
            "Removing a render object that is not the child of this element's render object.")
                                .with_chain(describe_chain()));
    }
    with_child.set_child(nullptr);
}

// =============================================================================
// MultiChildRenderObjectElement
// =============================================================================

MultiChildRenderObjectElement::MultiChildRenderObjectElement(
    std::shared_ptr<const MultiChildRenderObjectWidget> widget)
    : RenderObjectElement(std::move(widget)) {}

ContainerRenderObject& MultiChildRenderObjectElement::container() const {
    auto* container = dynamic_cast<ContainerRenderObject*>(render_object());
    if (!container) {
        throw TreeException(TreeError::contract_violation(
            "A multi-child render object widget must create a ContainerRenderObject.")
                                .with_chain(describe_chain()));
    }
    return *container;
}

RenderObject* MultiChildRenderObjectElement::previous_render_object(const Slot& slot) {
    const auto* indexed = std::get_if<IndexedSlot>(&slot);
    if (!indexed || !indexed->previous) {
        return nullptr;
    }
    return indexed->previous->render_object();
}

std::vector<Element*> MultiChildRenderObjectElement::children() const {
    std::vector<Element*> result;
    result.reserve(m_children.size());
    for (Element* child : m_children) {
        if (!m_forgotten_children.count(child)) {
            result.push_back(child);
        }
    }
    return result;
}

void MultiChildRenderObjectElement::visit_children(const ElementVisitor& visitor) {
    for (Element* child : m_children) {
        if (!m_forgotten_children.count(child)) {
            visitor(*child);
        }
    }
}

void MultiChildRenderObjectElement::forget_child(Element& child) {
    m_forgotten_children.insert(&child);
    RenderObjectElement::forget_child(child);
}

void MultiChildRenderObjectElement::mount(Element* parent, Slot new_slot) {
    RenderObjectElement::mount(parent, std::move(new_slot));
    const WidgetList& widgets = widget_as<MultiChildRenderObjectWidget>().children();
    m_children.reserve(widgets.size());
    Element* previous_child = nullptr;
    for (std::size_t i = 0; i < widgets.size(); ++i) {
        Element* new_child = update_child(nullptr, widgets[i], IndexedSlot{i, previous_child});
        m_children.push_back(new_child);
        previous_child = new_child;
    }
}

void MultiChildRenderObjectElement::update(WidgetPtr new_widget) {
    RenderObjectElement::update(std::move(new_widget));
    std::vector<Element*> new_children;
    try {
        update_children(m_children, widget_as<MultiChildRenderObjectWidget>().children(), new_children,
                        &m_forgotten_children);
    } catch (...) {
        salvage_children(new_children);
        throw;
    }
    m_children = std::move(new_children);
    m_forgotten_children.clear();
}

void MultiChildRenderObjectElement::salvage_children(const std::vector<Element*>& placed) {
    // Keep exactly the children still attached here: those placed before the
    // failure, then old children the diff had not reached yet
    std::vector<Element*> kept;
    std::unordered_set<Element*> seen;
    auto keep = [&](Element* child) {
        if (child && child->parent() == this && child->lifecycle() == ElementLifecycle::Active &&
            seen.insert(child).second) {
            kept.push_back(child);
        }
    };
    for (Element* child : placed) {
        keep(child);
    }
    for (Element* child : m_children) {
        keep(child);
    }
    m_children = std::move(kept);
    m_forgotten_children.clear();
}

void MultiChildRenderObjectElement::insert_child_render_object(RenderObject& child, const Slot& slot) {
    container().insert(child, previous_render_object(slot));
}

void MultiChildRenderObjectElement::move_child_render_object(RenderObject& child, const Slot& slot) {
    container().move(child, previous_render_object(slot));
}

void MultiChildRenderObjectElement::remove_child_render_object(RenderObject& child) {
    container().remove(child);
}

} // namespace arbor_widgets
