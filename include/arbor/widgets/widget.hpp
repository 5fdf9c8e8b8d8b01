#pragma once

/// @file widget.hpp
/// @brief Immutable configuration nodes
///
/// A widget describes one node of the desired tree. Widgets are shared and
/// never mutated after construction; an Element binds a widget to a live
/// position in the tree and is updated in place whenever a compatible widget
/// replaces the old one.
///
/// Widgets must be owned by std::shared_ptr (create them with make_shared),
/// since elements keep a shared reference to their current configuration.
///
/// @code
/// class Greeting : public StatelessWidget {
/// public:
///     explicit Greeting(std::string name) : m_name(std::move(name)) {}
///     WidgetPtr build(BuildContext&) const override {
///         return std::make_shared<Label>("hello " + m_name);
///     }
/// private:
///     std::string m_name;
/// };
/// @endcode

#include "fwd.hpp"
#include "key.hpp"
#include "render_object.hpp"

#include <functional>
#include <memory>
#include <string>
#include <typeinfo>

namespace arbor_widgets {

using WidgetBuilder = std::function<WidgetPtr(BuildContext&)>;

// =============================================================================
// Widget
// =============================================================================

class Widget : public std::enable_shared_from_this<Widget> {
public:
    explicit Widget(KeyPtr key = nullptr) : m_key(std::move(key)) {}
    virtual ~Widget() = default;

    Widget(const Widget&) = delete;
    Widget& operator=(const Widget&) = delete;

    [[nodiscard]] const KeyPtr& key() const noexcept { return m_key; }

    /// Inflate this configuration into a new element
    [[nodiscard]] virtual std::unique_ptr<Element> create_element() const = 0;

    /// Readable type name used in diagnostics
    [[nodiscard]] virtual std::string type_name() const;

    /// Type name followed by the key, if any
    [[nodiscard]] std::string to_string_short() const;

    /// True when an element built from old_widget may be updated with new_widget
    [[nodiscard]] static bool can_update(const Widget& old_widget, const Widget& new_widget);

protected:
    template<typename W>
    [[nodiscard]] std::shared_ptr<const W> shared_as() const {
        return std::static_pointer_cast<const W>(shared_from_this());
    }

private:
    KeyPtr m_key;
};

/// Demangled name of a type, for diagnostics
[[nodiscard]] std::string demangle_type_name(const char* mangled);

// =============================================================================
// Component widgets
// =============================================================================

/// Widget whose subtree depends only on its configuration and ambient data
class StatelessWidget : public Widget {
public:
    using Widget::Widget;

    [[nodiscard]] std::unique_ptr<Element> create_element() const override;

    [[nodiscard]] virtual WidgetPtr build(BuildContext& context) const = 0;
};

/// Stateless widget delegating to a callback
class Builder final : public StatelessWidget {
public:
    explicit Builder(WidgetBuilder builder, KeyPtr key = nullptr)
        : StatelessWidget(std::move(key)), m_builder(std::move(builder)) {}

    [[nodiscard]] WidgetPtr build(BuildContext& context) const override { return m_builder(context); }
    [[nodiscard]] std::string type_name() const override { return "Builder"; }

private:
    WidgetBuilder m_builder;
};

/// Widget with a mutable State object that outlives configuration updates
class StatefulWidget : public Widget {
public:
    using Widget::Widget;

    [[nodiscard]] std::unique_ptr<Element> create_element() const override;

    [[nodiscard]] virtual std::shared_ptr<State> create_state() const = 0;
};

// =============================================================================
// Proxy widgets
// =============================================================================

/// Widget that passes a pre-built child through unchanged
class ProxyWidget : public Widget {
public:
    explicit ProxyWidget(WidgetPtr child, KeyPtr key = nullptr);

    [[nodiscard]] const WidgetPtr& child() const noexcept { return m_child; }

private:
    WidgetPtr m_child;
};

/// Publishes ambient data to its descendants.
///
/// Descendants that read it through BuildContext are rebuilt whenever an
/// update replaces this widget and update_should_notify() returns true.
class InheritedWidget : public ProxyWidget {
public:
    using ProxyWidget::ProxyWidget;

    [[nodiscard]] std::unique_ptr<Element> create_element() const override;

    [[nodiscard]] virtual bool update_should_notify(const InheritedWidget& old_widget) const = 0;
};

/// Applies parent data to the render objects of the nearest render-backed
/// descendants.
class ParentDataWidget : public ProxyWidget {
public:
    using ProxyWidget::ProxyWidget;

    [[nodiscard]] std::unique_ptr<Element> create_element() const override;

    virtual void apply_parent_data(RenderObject& render_object) const = 0;

    /// Whether the parent of render_object installed the expected parent data
    [[nodiscard]] virtual bool is_valid_render_object(const RenderObject& render_object) const = 0;

    [[nodiscard]] virtual std::string expected_parent_data_type() const { return "ParentData"; }
};

/// ParentDataWidget for a concrete parent data type
template<typename T>
class ParentDataWidgetOf : public ParentDataWidget {
public:
    using ParentDataWidget::ParentDataWidget;

    void apply_parent_data(RenderObject& render_object) const final;

    [[nodiscard]] bool is_valid_render_object(const RenderObject& render_object) const final;

    [[nodiscard]] std::string expected_parent_data_type() const override {
        return demangle_type_name(typeid(T).name());
    }

protected:
    virtual void apply(T& data, RenderObject& render_object) const = 0;
};

// =============================================================================
// Render object widgets
// =============================================================================

/// Widget backed by a render object
class RenderObjectWidget : public Widget {
public:
    using Widget::Widget;

    [[nodiscard]] virtual std::unique_ptr<RenderObject> create_render_object(BuildContext& context) const = 0;

    /// Copy this configuration onto an existing render object
    virtual void update_render_object(BuildContext& context, RenderObject& render_object) const {
        (void)context;
        (void)render_object;
    }

    /// Called after the owning element unmounted render_object
    virtual void did_unmount_render_object(RenderObject& render_object) const { (void)render_object; }
};

class LeafRenderObjectWidget : public RenderObjectWidget {
public:
    using RenderObjectWidget::RenderObjectWidget;

    [[nodiscard]] std::unique_ptr<Element> create_element() const override;
};

/// Render object widget with an optional single child
class SingleChildRenderObjectWidget : public RenderObjectWidget {
public:
    explicit SingleChildRenderObjectWidget(WidgetPtr child = nullptr, KeyPtr key = nullptr)
        : RenderObjectWidget(std::move(key)), m_child(std::move(child)) {}

    [[nodiscard]] const WidgetPtr& child() const noexcept { return m_child; }

    [[nodiscard]] std::unique_ptr<Element> create_element() const override;

private:
    WidgetPtr m_child;
};

/// Render object widget with an ordered list of children.
///
/// The constructor rejects null children and duplicate keys.
class MultiChildRenderObjectWidget : public RenderObjectWidget {
public:
    explicit MultiChildRenderObjectWidget(WidgetList children, KeyPtr key = nullptr);

    [[nodiscard]] const WidgetList& children() const noexcept { return m_children; }

    [[nodiscard]] std::unique_ptr<Element> create_element() const override;

private:
    WidgetList m_children;
};

// =============================================================================
// ParentDataWidgetOf implementation
// =============================================================================

template<typename T>
void ParentDataWidgetOf<T>::apply_parent_data(RenderObject& render_object) const {
    if (auto* data = dynamic_cast<T*>(render_object.parent_data())) {
        apply(*data, render_object);
    }
}

template<typename T>
bool ParentDataWidgetOf<T>::is_valid_render_object(const RenderObject& render_object) const {
    return dynamic_cast<const T*>(render_object.parent_data()) != nullptr;
}

} // namespace arbor_widgets
