#pragma once

/// @file element.hpp
/// @brief Live instances of widgets and the reconciliation algorithm
///
/// An Element is the mutable counterpart of a Widget. Elements form the
/// persistent tree: on every rebuild a parent reconciles the child widgets it
/// produced against its existing child elements through update_child(),
/// reusing elements whose widget is compatible (same runtime type, equal key)
/// and replacing the others.
///
/// Lifecycle:
///   Initial  --mount-->      Active
///   Active   --deactivate--> Inactive   (parked in the owner's inactive set)
///   Inactive --activate-->   Active     (reclaimed through a global key)
///   Inactive --unmount-->    Defunct    (at finalize_tree)

#include "fwd.hpp"
#include "key.hpp"
#include "render_object.hpp"
#include "widget.hpp"

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include "element_arena.hpp"

namespace arbor_widgets {

// =============================================================================
// Lifecycle and slots
// =============================================================================

enum class ElementLifecycle : std::uint8_t {
    Initial,
    Active,
    Inactive,
    Defunct,
};

[[nodiscard]] const char* element_lifecycle_name(ElementLifecycle lifecycle);

/// Position of a child inside a multi-child parent.
///
/// Carries the previous sibling element so the parent render object can
/// re-link the child after its predecessor without scanning its list.
struct IndexedSlot {
    std::size_t index = 0;
    Element* previous = nullptr;

    bool operator==(const IndexedSlot&) const = default;
};

/// Opaque parent-defined position token
using Slot = std::variant<std::monostate, IndexedSlot, std::int64_t>;

using ElementVisitor = std::function<void(Element&)>;

/// Returns false to stop the walk
using ConditionalElementVisitor = std::function<bool(Element&)>;

/// Nearest provider per inherited widget type
using InheritedElementMap = std::unordered_map<std::type_index, InheritedElement*>;

// =============================================================================
// BuildContext
// =============================================================================

/// Handle through which build code reaches the tree around it
class BuildContext {
public:
    virtual ~BuildContext() = default;

    [[nodiscard]] virtual const WidgetPtr& widget() const = 0;
    [[nodiscard]] virtual BuildOwner* owner() const = 0;
    [[nodiscard]] virtual bool mounted() const = 0;

    /// Render object of this element, or of the nearest render-backed descendant
    [[nodiscard]] virtual RenderObject* find_render_object() const = 0;

    /// Register this context as a dependent of ancestor
    virtual const InheritedWidget& depend_on_inherited_element(InheritedElement& ancestor,
                                                               std::any aspect = {}) = 0;

    /// Nearest provider of the given widget type, registering a dependency
    virtual const InheritedWidget* depend_on_inherited_widget_of_type(std::type_index type,
                                                                      std::any aspect = {}) = 0;

    /// Nearest provider element of the given widget type, without registering
    [[nodiscard]] virtual InheritedElement* get_element_for_inherited_widget_of_type(std::type_index type) const = 0;

    [[nodiscard]] virtual const Widget* find_ancestor_widget(
        const std::function<bool(const Widget&)>& predicate) const = 0;

    /// Nearest (or, with root_most, farthest) ancestor state matching predicate
    [[nodiscard]] virtual State* find_ancestor_state(
        const std::function<bool(const State&)>& predicate, bool root_most) const = 0;

    [[nodiscard]] virtual RenderObject* find_ancestor_render_object(
        const std::function<bool(const RenderObject&)>& predicate) const = 0;

    virtual void visit_ancestor_elements(const ConditionalElementVisitor& visitor) const = 0;

    /// Visit direct children; not allowed while a build is running
    virtual void visit_child_elements(const ElementVisitor& visitor) = 0;

    // -------------------------------------------------------------------------
    // Typed lookups
    // -------------------------------------------------------------------------

    template<typename T>
    const T* depend_on_inherited_widget_of_exact_type(std::any aspect = {}) {
        return static_cast<const T*>(depend_on_inherited_widget_of_type(std::type_index(typeid(T)), std::move(aspect)));
    }

    template<typename T>
    [[nodiscard]] InheritedElement* get_element_for_inherited_widget_of_exact_type() const {
        return get_element_for_inherited_widget_of_type(std::type_index(typeid(T)));
    }

    template<typename T>
    [[nodiscard]] const T* find_ancestor_widget_of_exact_type() const {
        return static_cast<const T*>(
            find_ancestor_widget([](const Widget& widget) { return typeid(widget) == typeid(T); }));
    }

    template<typename S>
    [[nodiscard]] S* find_ancestor_state_of_type() const {
        return static_cast<S*>(find_ancestor_state(
            [](const State& state) { return dynamic_cast<const S*>(&state) != nullptr; }, false));
    }

    template<typename S>
    [[nodiscard]] S* find_root_ancestor_state_of_type() const {
        return static_cast<S*>(find_ancestor_state(
            [](const State& state) { return dynamic_cast<const S*>(&state) != nullptr; }, true));
    }

    template<typename R>
    [[nodiscard]] R* find_ancestor_render_object_of_type() const {
        return static_cast<R*>(find_ancestor_render_object(
            [](const RenderObject& render_object) { return dynamic_cast<const R*>(&render_object) != nullptr; }));
    }
};

// =============================================================================
// Element
// =============================================================================

class Element : public BuildContext {
public:
    explicit Element(WidgetPtr widget);
    ~Element() override;

    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    // -------------------------------------------------------------------------
    // Identity and position
    // -------------------------------------------------------------------------

    [[nodiscard]] const WidgetPtr& widget() const override { return m_widget; }
    [[nodiscard]] BuildOwner* owner() const override { return m_owner; }
    [[nodiscard]] bool mounted() const override { return m_lifecycle != ElementLifecycle::Initial &&
                                                         m_lifecycle != ElementLifecycle::Defunct; }

    template<typename W>
    [[nodiscard]] const W& widget_as() const { return static_cast<const W&>(*m_widget); }

    [[nodiscard]] Element* parent() const noexcept { return m_parent; }
    [[nodiscard]] const Slot& slot() const noexcept { return m_slot; }
    [[nodiscard]] int depth() const noexcept { return m_depth; }
    [[nodiscard]] ElementLifecycle lifecycle() const noexcept { return m_lifecycle; }
    [[nodiscard]] bool active() const noexcept { return m_lifecycle == ElementLifecycle::Active; }
    [[nodiscard]] bool dirty() const noexcept { return m_dirty; }
    [[nodiscard]] ElementHandle handle() const noexcept { return m_handle; }

    /// Ordering used by build scopes: shallower first, dirty before clean
    [[nodiscard]] static bool build_order(const Element* a, const Element* b);

    // -------------------------------------------------------------------------
    // Tree walking
    // -------------------------------------------------------------------------

    /// Visit children that are part of this element's current child list
    virtual void visit_children(const ElementVisitor& visitor) { (void)visitor; }

    void visit_child_elements(const ElementVisitor& visitor) override;
    void visit_ancestor_elements(const ConditionalElementVisitor& visitor) const override;

    [[nodiscard]] RenderObject* find_render_object() const override;

    /// Render object of this element or its nearest render-backed descendant
    [[nodiscard]] virtual RenderObject* render_object() const;

    // -------------------------------------------------------------------------
    // Ambient data
    // -------------------------------------------------------------------------

    const InheritedWidget& depend_on_inherited_element(InheritedElement& ancestor, std::any aspect = {}) override;
    const InheritedWidget* depend_on_inherited_widget_of_type(std::type_index type, std::any aspect = {}) override;
    [[nodiscard]] InheritedElement* get_element_for_inherited_widget_of_type(std::type_index type) const override;

    [[nodiscard]] const Widget* find_ancestor_widget(
        const std::function<bool(const Widget&)>& predicate) const override;
    [[nodiscard]] State* find_ancestor_state(
        const std::function<bool(const State&)>& predicate, bool root_most) const override;
    [[nodiscard]] RenderObject* find_ancestor_render_object(
        const std::function<bool(const RenderObject&)>& predicate) const override;

    /// Providers this element currently depends on
    [[nodiscard]] const std::unordered_set<InheritedElement*>& dependencies() const noexcept { return m_dependencies; }

    /// Called when a provider this element depends on changed
    virtual void did_change_dependencies();

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// Place this element under parent (nullptr for a root)
    virtual void mount(Element* parent, Slot new_slot);

    /// Replace the configuration with a compatible widget
    virtual void update(WidgetPtr new_widget);

    virtual void activate();
    virtual void deactivate();
    virtual void unmount();

    /// Attach the render objects of this subtree at new_slot
    virtual void attach_render_object(Slot new_slot);

    /// Detach the render objects of this subtree from the render tree
    virtual void detach_render_object();

    /// Drop child from the child list without deactivating it; the child has
    /// been claimed by another parent through its global key
    virtual void forget_child(Element& child);

    /// Hot reload hook; marks the element dirty
    virtual void reassemble();

    // -------------------------------------------------------------------------
    // Rebuilding
    // -------------------------------------------------------------------------

    /// Mark dirty and schedule a rebuild with the owner
    void mark_needs_build();

    /// Rebuild if dirty; must run inside a build scope
    void rebuild();

    // -------------------------------------------------------------------------
    // Diagnostics
    // -------------------------------------------------------------------------

    [[nodiscard]] std::string to_string_short() const;

    /// "Self ← Parent ← Grandparent ..." limited to max_depth entries
    [[nodiscard]] std::string describe_chain(std::size_t max_depth = 10) const;

    /// Reconcile one child (the single path through which parents update children)
    Element* update_child(Element* child, const WidgetPtr& new_widget, Slot new_slot);

protected:
    virtual void perform_rebuild() = 0;

    /// Inflate new_widget, reclaiming an inactive element through its global key if possible
    Element& inflate_widget(const WidgetPtr& new_widget, Slot new_slot);

    /// Detach child and park it in the owner's inactive set
    void deactivate_child(Element& child);

    /// Give child a new slot, moving its render object if needed
    void update_slot_for_child(Element& child, Slot new_slot);

    virtual void update_slot(Slot new_slot);
    virtual void update_inheritance();

    void set_dirty(bool dirty) noexcept { m_dirty = dirty; }
    void set_widget(WidgetPtr widget) { m_widget = std::move(widget); }

    [[nodiscard]] const std::shared_ptr<const InheritedElementMap>& inherited_elements() const noexcept {
        return m_inherited_elements;
    }
    void set_inherited_elements(std::shared_ptr<const InheritedElementMap> map) {
        m_inherited_elements = std::move(map);
    }

    /// Throws unless this element may register dependencies right now
    virtual void check_can_depend() const;

    /// Whether mark_needs_build() may be called while this element builds
    bool m_allow_ignored_mark_needs_build = false;

    friend class AllowIgnoredMarkNeedsBuild;

private:
    friend class BuildOwner;
    friend class InactiveElements;
    friend class ElementArena;
    friend class GlobalKeyRegistry;
    friend class InheritedElement;
    friend class RenderObjectElement;
    friend class RootElement;

    Element* retake_inactive_element(const KeyPtr& key, const WidgetPtr& new_widget);
    void activate_with_parent(Element& parent, Slot new_slot);
    void update_depth(int parent_depth);
    void check_for_cycles(const Element& new_child) const;
    void discard_failed_child(Element& child);
    void release_forgotten_reservations();
    [[nodiscard]] bool is_in_scope(const Element* target) const;

    static void activate_recursively(Element& element);

    WidgetPtr m_widget;
    Element* m_parent = nullptr;
    BuildOwner* m_owner = nullptr;
    Slot m_slot;
    int m_depth = 0;
    ElementHandle m_handle;
    ElementLifecycle m_lifecycle = ElementLifecycle::Initial;

    bool m_dirty = true;
    bool m_in_dirty_list = false;
    bool m_had_unsatisfied_dependencies = false;

    std::shared_ptr<const InheritedElementMap> m_inherited_elements;
    std::unordered_set<InheritedElement*> m_dependencies;

    /// Children that were reserved with a global key in the previous update
    std::vector<ElementHandle> m_forgotten_global_key_children;
};

// =============================================================================
// AllowIgnoredMarkNeedsBuild
// =============================================================================

/// RAII window in which an element may mark itself dirty while it builds
class AllowIgnoredMarkNeedsBuild {
public:
    explicit AllowIgnoredMarkNeedsBuild(Element& element)
        : m_element(element), m_previous(element.m_allow_ignored_mark_needs_build) {
        m_element.m_allow_ignored_mark_needs_build = true;
    }

    ~AllowIgnoredMarkNeedsBuild() { m_element.m_allow_ignored_mark_needs_build = m_previous; }

    AllowIgnoredMarkNeedsBuild(const AllowIgnoredMarkNeedsBuild&) = delete;
    AllowIgnoredMarkNeedsBuild& operator=(const AllowIgnoredMarkNeedsBuild&) = delete;

private:
    Element& m_element;
    bool m_previous;
};

} // namespace arbor_widgets
