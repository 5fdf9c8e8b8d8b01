/// @file proxy_element.cpp
/// @brief Ambient data providers and parent data elements

#include <arbor/widgets/proxy_element.hpp>

#include <arbor/widgets/render_object_element.hpp>

#include <vector>

namespace arbor_widgets {

// =============================================================================
// ProxyElement
// =============================================================================

void ProxyElement::update(WidgetPtr new_widget) {
    WidgetPtr old_widget = widget();
    Element::update(std::move(new_widget));
    updated(static_cast<const ProxyWidget&>(*old_widget));
    set_dirty(true);
    rebuild();
}

WidgetPtr ProxyElement::build() {
    return widget_as<ProxyWidget>().child();
}

void ProxyElement::updated(const ProxyWidget& old_widget) {
    notify_clients(old_widget);
}

// =============================================================================
// InheritedElement
// =============================================================================

InheritedElement::InheritedElement(std::shared_ptr<const InheritedWidget> widget)
    : ProxyElement(std::move(widget)) {}

void InheritedElement::update_inheritance() {
    const auto& incoming = parent() ? parent()->inherited_elements() : nullptr;
    auto map = incoming ? std::make_shared<InheritedElementMap>(*incoming)
                        : std::make_shared<InheritedElementMap>();
    (*map)[std::type_index(typeid(*widget()))] = this;
    set_inherited_elements(std::move(map));
}

bool InheritedElement::has_dependent(const Element& dependent) const {
    return m_dependents.find(const_cast<Element*>(&dependent)) != m_dependents.end();
}

std::any InheritedElement::get_dependencies(const Element& dependent) const {
    auto it = m_dependents.find(const_cast<Element*>(&dependent));
    return it != m_dependents.end() ? it->second : std::any{};
}

void InheritedElement::set_dependencies(Element& dependent, std::any value) {
    m_dependents[&dependent] = std::move(value);
}

void InheritedElement::update_dependencies(Element& dependent, const std::any& aspect) {
    (void)aspect;
    set_dependencies(dependent, std::any{});
}

void InheritedElement::notify_dependent(const InheritedWidget& old_widget, Element& dependent) {
    (void)old_widget;
    dependent.did_change_dependencies();
}

void InheritedElement::remove_dependent(Element& dependent) {
    m_dependents.erase(&dependent);
}

void InheritedElement::updated(const ProxyWidget& old_widget) {
    if (inherited_widget().update_should_notify(static_cast<const InheritedWidget&>(old_widget))) {
        ProxyElement::updated(old_widget);
    }
}

void InheritedElement::notify_clients(const ProxyWidget& old_widget) {
    const auto& old_inherited = static_cast<const InheritedWidget&>(old_widget);

    std::vector<Element*> dependents;
    dependents.reserve(m_dependents.size());
    for (const auto& [dependent, aspect] : m_dependents) {
        dependents.push_back(dependent);
    }
    for (Element* dependent : dependents) {
        notify_dependent(old_inherited, *dependent);
    }
}

// =============================================================================
// ParentDataElement
// =============================================================================

ParentDataElement::ParentDataElement(std::shared_ptr<const ParentDataWidget> widget)
    : ProxyElement(std::move(widget)) {}

void ParentDataElement::apply_widget_out_of_turn(const ParentDataWidget& widget) {
    apply_parent_data(widget);
}

void ParentDataElement::notify_clients(const ProxyWidget& old_widget) {
    (void)old_widget;
    apply_parent_data(parent_data_widget());
}

void ParentDataElement::apply_parent_data(const ParentDataWidget& widget) {
    std::function<void(Element&)> apply_to_child = [&](Element& child) {
        if (auto* render_element = dynamic_cast<RenderObjectElement*>(&child)) {
            render_element->update_parent_data(widget);
        } else {
            child.visit_children(apply_to_child);
        }
    };
    visit_children(apply_to_child);
}

} // namespace arbor_widgets
