#pragma once

/// @file proxy_element.hpp
/// @brief Pass-through elements: ambient data providers and parent data
///
/// A ProxyElement builds the child its widget already carries. On update it
/// swaps in the new widget, calls updated(old) and rebuilds.
///
/// InheritedElement tracks the elements that read it. Each dependent maps to
/// an opaque aspect value; subclasses can override the dependency hooks to
/// notify only the dependents whose aspects changed.

#include "component_element.hpp"

#include <any>
#include <unordered_map>

namespace arbor_widgets {

// =============================================================================
// ProxyElement
// =============================================================================

class ProxyElement : public ComponentElement {
public:
    using ComponentElement::ComponentElement;

    void update(WidgetPtr new_widget) override;

protected:
    [[nodiscard]] WidgetPtr build() override;

    /// Called after the widget was replaced, before rebuilding
    virtual void updated(const ProxyWidget& old_widget);

    /// Tell interested parties that the widget changed
    virtual void notify_clients(const ProxyWidget& old_widget) = 0;
};

// =============================================================================
// InheritedElement
// =============================================================================

class InheritedElement : public ProxyElement {
public:
    explicit InheritedElement(std::shared_ptr<const InheritedWidget> widget);

    [[nodiscard]] const InheritedWidget& inherited_widget() const { return widget_as<InheritedWidget>(); }

    /// Number of elements currently depending on this provider
    [[nodiscard]] std::size_t dependent_count() const noexcept { return m_dependents.size(); }

    [[nodiscard]] bool has_dependent(const Element& dependent) const;

    // -------------------------------------------------------------------------
    // Dependency hooks
    // -------------------------------------------------------------------------

    /// Aspect value recorded for dependent (empty when none)
    [[nodiscard]] virtual std::any get_dependencies(const Element& dependent) const;

    virtual void set_dependencies(Element& dependent, std::any value);

    /// Record that dependent read this provider with aspect
    virtual void update_dependencies(Element& dependent, const std::any& aspect);

    /// Tell one dependent that the provider changed
    virtual void notify_dependent(const InheritedWidget& old_widget, Element& dependent);

    /// Drop dependent (it is deactivating)
    void remove_dependent(Element& dependent);

protected:
    void update_inheritance() override;
    void updated(const ProxyWidget& old_widget) override;
    void notify_clients(const ProxyWidget& old_widget) override;

private:
    std::unordered_map<Element*, std::any> m_dependents;
};

// =============================================================================
// ParentDataElement
// =============================================================================

class ParentDataElement : public ProxyElement {
public:
    explicit ParentDataElement(std::shared_ptr<const ParentDataWidget> widget);

    [[nodiscard]] const ParentDataWidget& parent_data_widget() const { return widget_as<ParentDataWidget>(); }

    /// Apply widget's parent data to the nearest render-backed descendants
    void apply_widget_out_of_turn(const ParentDataWidget& widget);

protected:
    void notify_clients(const ProxyWidget& old_widget) override;

private:
    void apply_parent_data(const ParentDataWidget& widget);
};

} // namespace arbor_widgets
