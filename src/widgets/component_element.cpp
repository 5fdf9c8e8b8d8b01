/// @file component_element.cpp
/// @brief Build protocol for stateless and stateful elements

#include <arbor/widgets/component_element.hpp>

#include <arbor/core/error.hpp>
#include <arbor/widgets/build_owner.hpp>

namespace arbor_widgets {

using arbor_core::TreeError;
using arbor_core::TreeException;

// =============================================================================
// ComponentElement
// =============================================================================

void ComponentElement::mount(Element* parent, Slot new_slot) {
    Element::mount(parent, std::move(new_slot));
    first_build();
}

void ComponentElement::first_build() {
    rebuild();
}

void ComponentElement::visit_children(const ElementVisitor& visitor) {
    if (m_child) {
        visitor(*m_child);
    }
}

void ComponentElement::forget_child(Element& child) {
    m_child = nullptr;
    Element::forget_child(child);
}

void ComponentElement::perform_rebuild() {
    BuildOwner& build_owner = *owner();
    const std::string context = "building " + to_string_short();

    WidgetPtr built;
    {
        AllowIgnoredMarkNeedsBuild allow(*this);
        try {
            built = build();
        } catch (...) {
            built = build_owner.build_error_widget(
                build_owner.report_exception(context, std::current_exception(), this));
        }
        if (!built) {
            auto failure = std::make_exception_ptr(TreeException(TreeError::build_failure(
                to_string_short() + " returned a null widget from build().")));
            built = build_owner.build_error_widget(build_owner.report_exception(context, failure, this));
        }
    }

    // Cleared after build() so markNeedsBuild() calls made while building are ignored
    set_dirty(false);

    try {
        m_child = update_child(m_child, built, slot());
    } catch (...) {
        WidgetPtr error_widget = build_owner.build_error_widget(
            build_owner.report_exception(context, std::current_exception(), this));
        if (m_child && m_child->active() && m_child->parent() == this) {
            deactivate_child(*m_child);
        }
        // A failure here is fatal for the build scope
        m_child = update_child(nullptr, error_widget, slot());
    }
}

// =============================================================================
// StatelessElement
// =============================================================================

void StatelessElement::update(WidgetPtr new_widget) {
    Element::update(std::move(new_widget));
    set_dirty(true);
    rebuild();
}

WidgetPtr StatelessElement::build() {
    return widget_as<StatelessWidget>().build(*this);
}

// =============================================================================
// State
// =============================================================================

const char* state_lifecycle_name(StateLifecycle lifecycle) {
    switch (lifecycle) {
        case StateLifecycle::Created: return "created";
        case StateLifecycle::Initialized: return "initialized";
        case StateLifecycle::Ready: return "ready";
        case StateLifecycle::Defunct: return "defunct";
    }
    return "unknown";
}

BuildContext& State::context() const {
    if (!m_element) {
        throw TreeException(TreeError::contract_violation(
            "This State is not mounted, so it has no context.",
            {std::string("The State is ") + state_lifecycle_name(m_lifecycle) + "."}));
    }
    return *m_element;
}

void State::check_can_set_state() const {
    const std::string type = demangle_type_name(typeid(*this).name());
    if (m_lifecycle == StateLifecycle::Defunct) {
        throw TreeException(TreeError::contract_violation(
            "setState() called after dispose(): " + type,
            {"This error happens if you call set_state() on a State object for a widget that no longer "
             "appears in the widget tree.",
             "Cancel timers and stop listening to other objects in dispose(), or check mounted() "
             "before calling set_state()."}));
    }
    if (!m_element) {
        throw TreeException(TreeError::contract_violation(
            "setState() called before the State was mounted: " + type,
            {"set_state() may only be called once the framework has inserted the State into the tree."}));
    }
}

void State::reject_deferred_set_state() const {
    throw TreeException(TreeError::contract_violation(
        "setState() callback argument returned a deferred result.",
        {"The set_state() method on " + demangle_type_name(typeid(*this).name()) +
             " was called with a callable that returned a std::future.",
         "Perform the asynchronous work first, then update the state inside a synchronous "
         "set_state() call."}));
}

void State::mark_element_needs_build() {
    m_element->mark_needs_build();
}

// =============================================================================
// StatefulElement
// =============================================================================

StatefulElement::StatefulElement(std::shared_ptr<const StatefulWidget> widget)
    : ComponentElement(widget), m_state(widget->create_state()) {
    if (!m_state) {
        throw TreeException(TreeError::contract_violation(
            widget->type_name() + ".create_state() returned a null State."));
    }
    if (m_state->m_element || m_state->m_widget) {
        throw TreeException(TreeError::contract_violation(
            widget->type_name() + ".create_state() returned a State that is already in use.",
            {"create_state() must return a new State every time it is called."}));
    }
    m_state->m_widget = std::move(widget);
}

StatefulElement::~StatefulElement() {
    // States may outlive their element through user references
    if (m_state) {
        m_state->m_element = nullptr;
    }
}

WidgetPtr StatefulElement::build() {
    return m_state->build(*this);
}

void StatefulElement::first_build() {
    m_state->m_element = this;
    {
        AllowIgnoredMarkNeedsBuild allow(*this);
        m_state->init_state();
    }
    m_state->m_lifecycle = StateLifecycle::Initialized;
    m_state->did_change_dependencies();
    m_state->m_lifecycle = StateLifecycle::Ready;
    ComponentElement::first_build();
}

void StatefulElement::perform_rebuild() {
    if (m_did_change_dependencies) {
        m_state->did_change_dependencies();
        m_did_change_dependencies = false;
    }
    ComponentElement::perform_rebuild();
}

void StatefulElement::update(WidgetPtr new_widget) {
    Element::update(std::move(new_widget));
    std::shared_ptr<const StatefulWidget> old_widget = std::move(m_state->m_widget);
    m_state->m_widget = std::static_pointer_cast<const StatefulWidget>(widget());
    set_dirty(true);
    {
        AllowIgnoredMarkNeedsBuild allow(*this);
        m_state->did_update_widget(*old_widget);
    }
    rebuild();
}

void StatefulElement::activate() {
    ComponentElement::activate();
    mark_needs_build();
}

void StatefulElement::deactivate() {
    if (m_state->m_lifecycle != StateLifecycle::Created) {
        m_state->deactivate();
    }
    ComponentElement::deactivate();
}

void StatefulElement::unmount() {
    ComponentElement::unmount();
    if (m_state->m_lifecycle != StateLifecycle::Created) {
        m_state->dispose();
    }
    m_state->m_lifecycle = StateLifecycle::Defunct;
    m_state->m_element = nullptr;
    m_state.reset();
}

void StatefulElement::reassemble() {
    m_state->reassemble();
    ComponentElement::reassemble();
}

void StatefulElement::did_change_dependencies() {
    ComponentElement::did_change_dependencies();
    m_did_change_dependencies = true;
}

void StatefulElement::check_can_depend() const {
    if (m_state) {
        if (m_state->m_lifecycle == StateLifecycle::Created) {
            throw TreeException(TreeError::contract_violation(
                "dependOnInheritedWidgetOfExactType() or dependOnInheritedElement() was called before " +
                    demangle_type_name(typeid(*m_state).name()) + ".init_state() completed.",
                {"Ambient data lookups that register a dependency must happen in did_change_dependencies() "
                 "or build(), not in init_state()."})
                                    .with_chain(describe_chain()));
        }
        if (m_state->m_lifecycle == StateLifecycle::Defunct) {
            throw TreeException(TreeError::contract_violation(
                "dependOnInheritedWidgetOfExactType() or dependOnInheritedElement() was called after dispose().")
                                    .with_chain(describe_chain()));
        }
    }
    ComponentElement::check_can_depend();
}

} // namespace arbor_widgets
