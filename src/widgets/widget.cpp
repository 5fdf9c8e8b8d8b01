/// @file widget.cpp
/// @brief Widget base behaviour and element factories

#include <arbor/widgets/widget.hpp>

#include <arbor/core/error.hpp>
#include <arbor/widgets/component_element.hpp>
#include <arbor/widgets/proxy_element.hpp>
#include <arbor/widgets/render_object_element.hpp>

#include <cxxabi.h>

#include <cstdlib>
#include <unordered_set>

namespace arbor_widgets {

using arbor_core::TreeError;
using arbor_core::TreeException;

std::string demangle_type_name(const char* mangled) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status != 0 || demangled == nullptr) {
        return mangled;
    }
    std::string name(demangled);
    std::free(demangled);

    // Drop namespace qualification; diagnostics only need the class name
    auto template_start = name.find('<');
    auto scope = name.rfind("::", template_start);
    if (scope != std::string::npos) {
        name.erase(0, scope + 2);
    }
    return name;
}

// =============================================================================
// Widget
// =============================================================================

std::string Widget::type_name() const {
    return demangle_type_name(typeid(*this).name());
}

std::string Widget::to_string_short() const {
    if (!m_key) {
        return type_name();
    }
    return type_name() + "-" + m_key->to_string();
}

bool Widget::can_update(const Widget& old_widget, const Widget& new_widget) {
    return typeid(old_widget) == typeid(new_widget) && keys_equal(old_widget.key(), new_widget.key());
}

// =============================================================================
// Element factories
// =============================================================================

std::unique_ptr<Element> StatelessWidget::create_element() const {
    return std::make_unique<StatelessElement>(shared_from_this());
}

std::unique_ptr<Element> StatefulWidget::create_element() const {
    return std::make_unique<StatefulElement>(shared_as<StatefulWidget>());
}

ProxyWidget::ProxyWidget(WidgetPtr child, KeyPtr key)
    : Widget(std::move(key)), m_child(std::move(child)) {
    if (!m_child) {
        throw TreeException(TreeError::contract_violation(
            "A proxy widget requires a non-null child.",
            {"Inherited and parent data widgets pass their child through unchanged."}));
    }
}

std::unique_ptr<Element> InheritedWidget::create_element() const {
    return std::make_unique<InheritedElement>(shared_as<InheritedWidget>());
}

std::unique_ptr<Element> ParentDataWidget::create_element() const {
    return std::make_unique<ParentDataElement>(shared_as<ParentDataWidget>());
}

std::unique_ptr<Element> LeafRenderObjectWidget::create_element() const {
    return std::make_unique<LeafRenderObjectElement>(shared_as<LeafRenderObjectWidget>());
}

std::unique_ptr<Element> SingleChildRenderObjectWidget::create_element() const {
    return std::make_unique<SingleChildRenderObjectElement>(shared_as<SingleChildRenderObjectWidget>());
}

// =============================================================================
// MultiChildRenderObjectWidget
// =============================================================================

MultiChildRenderObjectWidget::MultiChildRenderObjectWidget(WidgetList children, KeyPtr key)
    : RenderObjectWidget(std::move(key)), m_children(std::move(children)) {
    std::unordered_set<KeyPtr, KeyHash, KeyEqual> seen;
    for (std::size_t i = 0; i < m_children.size(); ++i) {
        const WidgetPtr& child = m_children[i];
        if (!child) {
            throw TreeException(TreeError::contract_violation(
                "Child " + std::to_string(i) + " of a multi-child widget is null."));
        }
        if (child->key() && !seen.insert(child->key()).second) {
            throw TreeException(TreeError::duplicate_keys(
                "Duplicate keys found: " + child->key()->to_string() +
                " is used by more than one child of the same parent."));
        }
    }
}

std::unique_ptr<Element> MultiChildRenderObjectWidget::create_element() const {
    return std::make_unique<MultiChildRenderObjectElement>(shared_as<MultiChildRenderObjectWidget>());
}

} // namespace arbor_widgets
