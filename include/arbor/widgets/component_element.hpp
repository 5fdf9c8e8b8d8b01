#pragma once

/// @file component_element.hpp
/// @brief Elements that build their single child from code
///
/// ComponentElement drives the build protocol: build() produces one child
/// widget, the element marks itself clean, then reconciles that child. A
/// build that throws is replaced by the owner's error widget.
///
/// StatefulElement additionally owns a State whose lifecycle is nested inside
/// the element's active period:
///
///   Created --init_state--> Initialized --did_change_dependencies--> Ready
///   Ready   --dispose-->    Defunct

#include "element.hpp"

#include <future>
#include <memory>
#include <type_traits>

namespace arbor_widgets {

// =============================================================================
// ComponentElement
// =============================================================================

class ComponentElement : public Element {
public:
    using Element::Element;

    void mount(Element* parent, Slot new_slot) override;
    void visit_children(const ElementVisitor& visitor) override;
    void forget_child(Element& child) override;

    [[nodiscard]] Element* child() const noexcept { return m_child; }

protected:
    /// Produce the child widget for the current configuration
    [[nodiscard]] virtual WidgetPtr build() = 0;

    /// First build right after mount
    virtual void first_build();

    void perform_rebuild() override;

private:
    Element* m_child = nullptr;
};

// =============================================================================
// StatelessElement
// =============================================================================

class StatelessElement : public ComponentElement {
public:
    using ComponentElement::ComponentElement;

    void update(WidgetPtr new_widget) override;

protected:
    [[nodiscard]] WidgetPtr build() override;
};

// =============================================================================
// State
// =============================================================================

enum class StateLifecycle : std::uint8_t {
    Created,
    Initialized,
    Ready,
    Defunct,
};

[[nodiscard]] const char* state_lifecycle_name(StateLifecycle lifecycle);

/// Deferred results a set_state callback must not return
template<typename T>
struct is_deferred_result : std::false_type {};

template<typename T>
struct is_deferred_result<std::future<T>> : std::true_type {};

template<typename T>
struct is_deferred_result<std::shared_future<T>> : std::true_type {};

template<typename T>
inline constexpr bool is_deferred_result_v = is_deferred_result<std::decay_t<T>>::value;

/// Mutable state attached to a StatefulElement.
///
/// States are shared so callbacks may keep one alive past disposal; any
/// set_state() after dispose is then reported instead of touching a dead
/// element.
///
/// @code
/// class CounterState : public StateOf<Counter> {
/// public:
///     void increment() { set_state([this] { ++m_count; }); }
///     WidgetPtr build(BuildContext&) override {
///         return std::make_shared<Label>(std::to_string(m_count));
///     }
/// private:
///     int m_count = 0;
/// };
/// @endcode
class State {
public:
    State() = default;
    virtual ~State() = default;

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    [[nodiscard]] StateLifecycle lifecycle() const noexcept { return m_lifecycle; }

    /// True between mount and dispose
    [[nodiscard]] bool mounted() const noexcept { return m_element != nullptr; }

    /// Build context of the owning element; throws when not mounted
    [[nodiscard]] BuildContext& context() const;

    [[nodiscard]] const StatefulWidget& widget_base() const { return *m_widget; }

    // -------------------------------------------------------------------------
    // Hooks
    // -------------------------------------------------------------------------

    /// Runs once after mount, before the first build
    virtual void init_state() {}

    /// Runs after init_state and whenever a provider this state reads changes
    virtual void did_change_dependencies() {}

    /// Runs when a compatible widget replaces the current one, before rebuilding
    virtual void did_update_widget(const StatefulWidget& old_widget) { (void)old_widget; }

    /// Hot reload
    virtual void reassemble() {}

    /// Runs when the element leaves the tree (it may come back this frame)
    virtual void deactivate() {}

    /// Runs once when the element is unmounted for good
    virtual void dispose() {}

    [[nodiscard]] virtual WidgetPtr build(BuildContext& context) = 0;

protected:
    /// Apply fn synchronously and schedule a rebuild.
    ///
    /// fn must not return a std::future or std::shared_future; state changes
    /// have to be complete when set_state returns.
    template<typename F>
    void set_state(F&& fn) {
        check_can_set_state();
        using Ret = std::invoke_result_t<F&>;
        if constexpr (is_deferred_result_v<Ret>) {
            auto deferred = fn();
            (void)deferred;
            reject_deferred_set_state();
        } else {
            fn();
            mark_element_needs_build();
        }
    }

private:
    friend class StatefulElement;

    void check_can_set_state() const;
    [[noreturn]] void reject_deferred_set_state() const;
    void mark_element_needs_build();

    StateLifecycle m_lifecycle = StateLifecycle::Created;
    std::shared_ptr<const StatefulWidget> m_widget;
    StatefulElement* m_element = nullptr;
};

/// State with typed access to its widget
template<typename W>
class StateOf : public State {
public:
    [[nodiscard]] const W& widget() const { return static_cast<const W&>(widget_base()); }
};

// =============================================================================
// StatefulElement
// =============================================================================

class StatefulElement : public ComponentElement {
public:
    explicit StatefulElement(std::shared_ptr<const StatefulWidget> widget);
    ~StatefulElement() override;

    [[nodiscard]] State* state() const noexcept { return m_state.get(); }

    void update(WidgetPtr new_widget) override;
    void activate() override;
    void deactivate() override;
    void unmount() override;
    void reassemble() override;
    void did_change_dependencies() override;

protected:
    [[nodiscard]] WidgetPtr build() override;
    void first_build() override;
    void perform_rebuild() override;
    void check_can_depend() const override;

private:
    std::shared_ptr<State> m_state;
    bool m_did_change_dependencies = false;
};

} // namespace arbor_widgets
