/// @file element.cpp
/// @brief Element lifecycle, ambient data lookups and single-child reconciliation

#include <arbor/widgets/element.hpp>

#include <arbor/core/error.hpp>
#include <arbor/core/log.hpp>
#include <arbor/widgets/build_owner.hpp>
#include <arbor/widgets/component_element.hpp>
#include <arbor/widgets/proxy_element.hpp>
#include <arbor/widgets/render_object_element.hpp>

namespace arbor_widgets {

using arbor_core::TreeError;
using arbor_core::TreeException;

namespace {

bool has_global_key(const Widget& widget) {
    return widget.key() && widget.key()->is_global();
}

} // anonymous namespace

const char* element_lifecycle_name(ElementLifecycle lifecycle) {
    switch (lifecycle) {
        case ElementLifecycle::Initial: return "initial";
        case ElementLifecycle::Active: return "active";
        case ElementLifecycle::Inactive: return "inactive";
        case ElementLifecycle::Defunct: return "defunct";
    }
    return "unknown";
}

// =============================================================================
// Construction
// =============================================================================

Element::Element(WidgetPtr widget) : m_widget(std::move(widget)) {
    if (!m_widget) {
        throw TreeException(TreeError::contract_violation("An element requires a non-null widget."));
    }
}

Element::~Element() = default;

bool Element::build_order(const Element* a, const Element* b) {
    if (a->m_depth != b->m_depth) {
        return a->m_depth < b->m_depth;
    }
    return a->m_dirty && !b->m_dirty;
}

// =============================================================================
// Tree walking
// =============================================================================

void Element::visit_child_elements(const ElementVisitor& visitor) {
    if (m_owner && m_owner->building()) {
        throw TreeException(TreeError::contract_violation(
            "visit_child_elements() called during build.",
            {"The child list of an element is not stable while the tree is being built.",
             "Walk the children after the build scope returns."}));
    }
    visit_children(visitor);
}

void Element::visit_ancestor_elements(const ConditionalElementVisitor& visitor) const {
    Element* ancestor = m_parent;
    while (ancestor && visitor(*ancestor)) {
        ancestor = ancestor->m_parent;
    }
}

RenderObject* Element::find_render_object() const {
    if (m_lifecycle != ElementLifecycle::Active) {
        throw TreeException(TreeError::contract_violation(
            "Cannot get the render object of an element that is not active.",
            {std::string("The element is ") + element_lifecycle_name(m_lifecycle) + "."})
                                .with_chain(describe_chain()));
    }
    return render_object();
}

RenderObject* Element::render_object() const {
    // Component and proxy elements have a single child
    RenderObject* result = nullptr;
    const_cast<Element*>(this)->visit_children([&result](Element& child) {
        if (!result) {
            result = child.render_object();
        }
    });
    return result;
}

// =============================================================================
// Ambient data
// =============================================================================

void Element::check_can_depend() const {
    if (m_lifecycle != ElementLifecycle::Active) {
        throw TreeException(TreeError::contract_violation(
            "Looking up a deactivated widget's ancestor is unsafe.",
            {"The element's ancestors are only valid while the element is active.",
             "Save a reference to the ancestor in did_change_dependencies() instead."})
                                .with_chain(describe_chain()));
    }
}

const InheritedWidget& Element::depend_on_inherited_element(InheritedElement& ancestor, std::any aspect) {
    check_can_depend();
    m_dependencies.insert(&ancestor);
    ancestor.update_dependencies(*this, aspect);
    return ancestor.inherited_widget();
}

const InheritedWidget* Element::depend_on_inherited_widget_of_type(std::type_index type, std::any aspect) {
    check_can_depend();
    InheritedElement* ancestor = get_element_for_inherited_widget_of_type(type);
    if (ancestor) {
        return &depend_on_inherited_element(*ancestor, std::move(aspect));
    }
    m_had_unsatisfied_dependencies = true;
    return nullptr;
}

InheritedElement* Element::get_element_for_inherited_widget_of_type(std::type_index type) const {
    Element::check_can_depend();
    if (!m_inherited_elements) {
        return nullptr;
    }
    auto it = m_inherited_elements->find(type);
    return it != m_inherited_elements->end() ? it->second : nullptr;
}

const Widget* Element::find_ancestor_widget(const std::function<bool(const Widget&)>& predicate) const {
    Element::check_can_depend();
    for (Element* ancestor = m_parent; ancestor; ancestor = ancestor->m_parent) {
        if (predicate(*ancestor->m_widget)) {
            return ancestor->m_widget.get();
        }
    }
    return nullptr;
}

State* Element::find_ancestor_state(const std::function<bool(const State&)>& predicate, bool root_most) const {
    Element::check_can_depend();
    State* found = nullptr;
    for (Element* ancestor = m_parent; ancestor; ancestor = ancestor->m_parent) {
        auto* stateful = dynamic_cast<StatefulElement*>(ancestor);
        if (stateful && stateful->state() && predicate(*stateful->state())) {
            found = stateful->state();
            if (!root_most) {
                break;
            }
        }
    }
    return found;
}

RenderObject* Element::find_ancestor_render_object(const std::function<bool(const RenderObject&)>& predicate) const {
    Element::check_can_depend();
    for (Element* ancestor = m_parent; ancestor; ancestor = ancestor->m_parent) {
        auto* render_element = dynamic_cast<RenderObjectElement*>(ancestor);
        if (render_element && render_element->render_object() && predicate(*render_element->render_object())) {
            return render_element->render_object();
        }
    }
    return nullptr;
}

void Element::did_change_dependencies() {
    mark_needs_build();
}

void Element::update_inheritance() {
    m_inherited_elements = m_parent ? m_parent->m_inherited_elements : nullptr;
}

// =============================================================================
// Lifecycle
// =============================================================================

void Element::mount(Element* parent, Slot new_slot) {
    if (m_lifecycle != ElementLifecycle::Initial) {
        throw TreeException(TreeError::internal_consistency(
            std::string("mount() called on an element that is ") + element_lifecycle_name(m_lifecycle) + ".")
                                .with_chain(describe_chain()));
    }
    if (parent && !parent->active()) {
        throw TreeException(TreeError::internal_consistency(
            "Cannot mount an element under a parent that is not active.")
                                .with_chain(parent->describe_chain()));
    }

    m_parent = parent;
    m_slot = std::move(new_slot);
    m_depth = parent ? parent->m_depth + 1 : 1;
    m_lifecycle = ElementLifecycle::Active;
    if (parent) {
        m_owner = parent->m_owner;
    }
    if (!m_owner) {
        throw TreeException(TreeError::internal_consistency(
            "Element mounted without an owner.",
            {"Root elements must be given their BuildOwner before mount()."}));
    }

    if (has_global_key(*m_widget)) {
        m_owner->global_keys().register_element(m_widget->key(), *this);
        if (m_owner->config().print_global_key_lifecycle) {
            arbor_core::log_fields(*arbor_core::widgets_logger(), spdlog::level::debug, "Registered global key",
                                   {{"key", m_widget->key()->to_string()}, {"element", to_string_short()}});
        }
    }
    update_inheritance();
}

void Element::update(WidgetPtr new_widget) {
    if (!active() || !new_widget || !Widget::can_update(*m_widget, *new_widget)) {
        throw TreeException(TreeError::internal_consistency(
            "update() called with an incompatible widget or on an inactive element.")
                                .with_chain(describe_chain()));
    }

    release_forgotten_reservations();
    m_widget = std::move(new_widget);
}

void Element::activate() {
    if (m_lifecycle != ElementLifecycle::Inactive) {
        throw TreeException(TreeError::internal_consistency(
            std::string("activate() called on an element that is ") + element_lifecycle_name(m_lifecycle) + ".")
                                .with_chain(describe_chain()));
    }

    const bool had_dependencies = !m_dependencies.empty() || m_had_unsatisfied_dependencies;
    m_lifecycle = ElementLifecycle::Active;
    // Providers already dropped us in deactivate(); the set was kept only to decide this
    m_dependencies.clear();
    m_had_unsatisfied_dependencies = false;
    update_inheritance();

    if (m_dirty) {
        m_owner->schedule_build_for(*this);
    }
    if (had_dependencies) {
        did_change_dependencies();
    }
}

void Element::deactivate() {
    if (m_lifecycle != ElementLifecycle::Active) {
        throw TreeException(TreeError::internal_consistency(
            std::string("deactivate() called on an element that is ") + element_lifecycle_name(m_lifecycle) + ".")
                                .with_chain(describe_chain()));
    }
    for (InheritedElement* dependency : m_dependencies) {
        dependency->remove_dependent(*this);
    }
    m_inherited_elements.reset();
    m_lifecycle = ElementLifecycle::Inactive;
}

void Element::unmount() {
    if (m_lifecycle != ElementLifecycle::Inactive) {
        throw TreeException(TreeError::internal_consistency(
            std::string("unmount() called on an element that is ") + element_lifecycle_name(m_lifecycle) + ".")
                                .with_chain(describe_chain()));
    }
    if (has_global_key(*m_widget)) {
        m_owner->global_keys().unregister_element(m_widget->key(), *this);
        if (m_owner->config().print_global_key_lifecycle) {
            arbor_core::log_fields(*arbor_core::widgets_logger(), spdlog::level::debug, "Unregistered global key",
                                   {{"key", m_widget->key()->to_string()}, {"element", to_string_short()}});
        }
    }
    if (m_in_dirty_list) {
        m_owner->forget_dirty_element(*this);
    }
    m_dependencies.clear();
    m_forgotten_global_key_children.clear();
    m_lifecycle = ElementLifecycle::Defunct;
}

void Element::attach_render_object(Slot new_slot) {
    visit_children([&new_slot](Element& child) { child.attach_render_object(new_slot); });
    m_slot = std::move(new_slot);
}

void Element::detach_render_object() {
    visit_children([](Element& child) { child.detach_render_object(); });
    m_slot = std::monostate{};
}

void Element::release_forgotten_reservations() {
    // Forgotten children stop counting as ours once we update or rebuild
    if (m_owner->config().verify_global_keys) {
        for (ElementHandle forgotten : m_forgotten_global_key_children) {
            m_owner->global_keys().remove_reservation_for(m_handle, forgotten);
        }
    }
    m_forgotten_global_key_children.clear();
}

void Element::forget_child(Element& child) {
    // The reservation stays until this element is updated; if it never is,
    // the child still counts as a duplicate at finalize time
    if (has_global_key(*child.m_widget)) {
        m_forgotten_global_key_children.push_back(child.m_handle);
    }
}

void Element::reassemble() {
    mark_needs_build();
    visit_children([](Element& child) { child.reassemble(); });
}

// =============================================================================
// Rebuilding
// =============================================================================

bool Element::is_in_scope(const Element* target) const {
    for (const Element* node = this; node; node = node->m_parent) {
        if (node == target) {
            return true;
        }
    }
    return false;
}

void Element::mark_needs_build() {
    if (m_lifecycle == ElementLifecycle::Defunct) {
        throw TreeException(TreeError::contract_violation(
            "markNeedsBuild() called on a defunct element.",
            {"The element was unmounted and can no longer be rebuilt."})
                                .with_chain(describe_chain()));
    }
    if (m_lifecycle != ElementLifecycle::Active) {
        return;
    }

    if (m_owner->building()) {
        if (!is_in_scope(m_owner->current_build_target()) && !m_allow_ignored_mark_needs_build) {
            TreeError error = TreeError::contract_violation(
                "setState() or markNeedsBuild() called during build.",
                {"This " + m_widget->type_name() + " widget cannot be marked as needing to build because "
                 "the framework is already in the process of building widgets.",
                 "A widget can be marked as needing to be built during the build phase only if one of "
                 "its ancestors is currently building."});
            error.with_chain(describe_chain());
            if (Element* target = m_owner->current_build_target()) {
                error.with_detail("The widget being built when the call was made was " + target->to_string_short());
            }
            throw TreeException(std::move(error));
        }
    } else if (m_owner->state_locked()) {
        throw TreeException(TreeError::contract_violation(
            "setState() or markNeedsBuild() called when widget tree was locked.",
            {"This " + m_widget->type_name() + " widget cannot be marked as needing to build "
             "because the framework is locked."})
                                .with_chain(describe_chain()));
    }

    if (m_dirty) {
        return;
    }
    m_dirty = true;
    m_owner->schedule_build_for(*this);
}

void Element::rebuild() {
    if (m_lifecycle == ElementLifecycle::Initial) {
        throw TreeException(TreeError::internal_consistency("rebuild() called before mount()."));
    }
    if (!active() || !m_dirty) {
        return;
    }
    if (!m_owner->building()) {
        throw TreeException(TreeError::contract_violation(
            "rebuild() called outside of a build scope.",
            {"Schedule the element with mark_needs_build() and let BuildOwner::build_scope() rebuild it."})
                                .with_chain(describe_chain()));
    }

    if (m_owner->config().print_rebuild_dirty_widgets) {
        arbor_core::build_logger()->debug("Rebuilding {}", to_string_short());
    }

    {
        BuildOwner::BuildTargetScope scope(*m_owner, this);
        perform_rebuild();
    }
    release_forgotten_reservations();
    m_owner->global_keys().element_was_rebuilt(*this);
}

// =============================================================================
// Reconciliation
// =============================================================================

Element* Element::update_child(Element* child, const WidgetPtr& new_widget, Slot new_slot) {
    if (!new_widget) {
        if (child) {
            deactivate_child(*child);
        }
        return nullptr;
    }

    Element* new_child = nullptr;
    if (child) {
        if (child->m_widget == new_widget) {
            if (child->m_slot != new_slot) {
                update_slot_for_child(*child, new_slot);
            }
            new_child = child;
        } else if (Widget::can_update(*child->m_widget, *new_widget)) {
            if (child->m_slot != new_slot) {
                update_slot_for_child(*child, new_slot);
            }
            child->update(new_widget);
            m_owner->global_keys().element_was_rebuilt(*child);
            new_child = child;
        } else {
            deactivate_child(*child);
            new_child = &inflate_widget(new_widget, new_slot);
        }
    } else {
        new_child = &inflate_widget(new_widget, new_slot);
    }

    if (m_owner->config().verify_global_keys) {
        if (child) {
            m_owner->global_keys().remove_reservation_for(m_handle, child->m_handle);
        }
        if (has_global_key(*new_widget)) {
            m_owner->global_keys().reserve_for(*this, *new_child);
        }
    }
    return new_child;
}

Element& Element::inflate_widget(const WidgetPtr& new_widget, Slot new_slot) {
    if (has_global_key(*new_widget)) {
        if (Element* reclaimed = retake_inactive_element(new_widget->key(), new_widget)) {
            if (m_owner->config().check_for_cycles) {
                check_for_cycles(*reclaimed);
            }
            try {
                reclaimed->activate_with_parent(*this, new_slot);
            } catch (...) {
                discard_failed_child(*reclaimed);
                throw;
            }
            Element* updated = update_child(reclaimed, new_widget, std::move(new_slot));
            return *updated;
        }
    }

    Element& child = m_owner->arena().adopt(new_widget->create_element());
    try {
        child.mount(this, std::move(new_slot));
    } catch (...) {
        discard_failed_child(child);
        throw;
    }
    return child;
}

Element* Element::retake_inactive_element(const KeyPtr& key, const WidgetPtr& new_widget) {
    Element* element = m_owner->global_keys().current_element(*key);
    if (!element || !Widget::can_update(*element->m_widget, *new_widget)) {
        return nullptr;
    }

    if (Element* parent = element->m_parent) {
        if (parent == this) {
            throw TreeException(TreeError::duplicate_global_key(
                "A GlobalKey was used multiple times inside one widget's child list.",
                {"The offending GlobalKey was: " + key->to_string(),
                 "A GlobalKey can only be specified on one widget at a time in the widget tree."},
                {describe_chain(), element->describe_chain()}));
        }
        if (m_owner->config().verify_global_keys) {
            m_owner->global_keys().track_parent_needing_rebuild(*parent, key);
        }
        parent->forget_child(*element);
        parent->deactivate_child(*element);
    }

    m_owner->inactive_elements().remove(*element);
    if (m_owner->config().print_global_key_lifecycle) {
        arbor_core::log_fields(*arbor_core::widgets_logger(), spdlog::level::debug, "Reclaimed global key",
                               {{"key", key->to_string()},
                                {"element", element->to_string_short()},
                                {"parent", to_string_short()}});
    }
    return element;
}

void Element::activate_with_parent(Element& parent, Slot new_slot) {
    m_parent = &parent;
    m_owner = parent.m_owner;
    update_depth(parent.m_depth);
    activate_recursively(*this);
    attach_render_object(std::move(new_slot));
}

void Element::activate_recursively(Element& element) {
    element.activate();
    element.visit_children([](Element& child) { activate_recursively(child); });
}

void Element::update_depth(int parent_depth) {
    const int expected = parent_depth + 1;
    if (m_depth < expected) {
        m_depth = expected;
        visit_children([expected](Element& child) { child.update_depth(expected); });
    }
}

void Element::check_for_cycles(const Element& new_child) const {
    for (const Element* node = this; node; node = node->m_parent) {
        if (node == &new_child) {
            throw TreeException(TreeError::internal_consistency(
                "Cycle detected: an element was attached beneath itself.",
                {"The element " + new_child.to_string_short() + " is an ancestor of its new parent."})
                                    .with_chain(describe_chain()));
        }
    }
}

void Element::deactivate_child(Element& child) {
    child.m_parent = nullptr;
    child.detach_render_object();
    m_owner->inactive_elements().add(child);
    if (m_owner->config().print_global_key_lifecycle && has_global_key(*child.m_widget)) {
        arbor_core::log_fields(*arbor_core::widgets_logger(), spdlog::level::debug, "Deactivated keyed child",
                               {{"key", child.m_widget->key()->to_string()},
                                {"element", child.to_string_short()},
                                {"parent", to_string_short()}});
    }
}

void Element::discard_failed_child(Element& child) {
    switch (child.m_lifecycle) {
        case ElementLifecycle::Active:
            child.m_parent = nullptr;
            child.detach_render_object();
            m_owner->inactive_elements().add(child);
            break;
        case ElementLifecycle::Inactive:
            // Reclaimed but never reactivated; park it again so finalize_tree unmounts it
            child.m_parent = nullptr;
            if (!m_owner->inactive_elements().contains(child)) {
                m_owner->inactive_elements().add(child);
            }
            break;
        case ElementLifecycle::Initial:
            m_owner->arena().retire(child.m_handle);
            break;
        case ElementLifecycle::Defunct:
            break;
    }
}

void Element::update_slot_for_child(Element& child, Slot new_slot) {
    // Walk down to the first render-backed element, which owns the placement
    Element* current = &child;
    while (current) {
        current->update_slot(new_slot);
        if (dynamic_cast<RenderObjectElement*>(current)) {
            break;
        }
        Element* next = nullptr;
        current->visit_children([&next](Element& c) { next = &c; });
        current = next;
    }
}

void Element::update_slot(Slot new_slot) {
    m_slot = std::move(new_slot);
}

// =============================================================================
// Diagnostics
// =============================================================================

std::string Element::to_string_short() const {
    return m_widget->to_string_short();
}

std::string Element::describe_chain(std::size_t max_depth) const {
    std::string result = to_string_short();
    std::size_t count = 1;
    for (const Element* node = m_parent; node; node = node->m_parent) {
        if (count >= max_depth) {
            result += " ← ⋯";
            break;
        }
        result += " ← " + node->to_string_short();
        ++count;
    }
    return result;
}

} // namespace arbor_widgets
