#pragma once

/// @file build_owner.hpp
/// @brief Per-tree scheduler: dirty tracking, build scopes and teardown
///
/// One BuildOwner manages one element tree. It owns every element (through
/// its ElementArena), keeps the dirty list, parks deactivated elements until
/// the end of the frame, and holds the global key registry of the tree.
///
/// A frame typically looks like:
/// @code
/// owner.build_scope(root);   // rebuild every dirty element, parents first
/// owner.finalize_tree();     // unmount what was not reclaimed, verify keys
/// @endcode

#include "fwd.hpp"
#include "element_arena.hpp"
#include "framework_config.hpp"
#include "global_key_registry.hpp"

#include <exception>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace arbor_widgets {

// =============================================================================
// Error reporting
// =============================================================================

/// Everything known about a failure caught by the framework
struct FrameworkErrorDetails {
    std::exception_ptr exception;
    std::string summary;
    std::string context;
    std::string library = "arbor widgets";
    std::string chain;

    /// "summary" plus context and chain lines
    [[nodiscard]] std::string format() const;
};

using ErrorReporter = std::function<void(const FrameworkErrorDetails&)>;
using ErrorWidgetBuilder = std::function<WidgetPtr(const FrameworkErrorDetails&)>;

// =============================================================================
// InactiveElements
// =============================================================================

/// Elements deactivated during the current frame.
///
/// Only subtree roots are stored; their descendants were deactivated with
/// them. unmount_all() runs at finalize_tree and unmounts deepest roots
/// first, each subtree children-first.
class InactiveElements {
public:
    explicit InactiveElements(ElementArena& arena) : m_arena(arena) {}

    InactiveElements(const InactiveElements&) = delete;
    InactiveElements& operator=(const InactiveElements&) = delete;

    /// Deactivate element's subtree and park it
    void add(Element& element);

    /// Take element back for reactivation
    void remove(Element& element);

    [[nodiscard]] bool contains(const Element& element) const;
    [[nodiscard]] std::size_t size() const noexcept { return m_elements.size(); }

    /// Unmount every parked subtree; returns the number of elements unmounted
    std::size_t unmount_all();

private:
    std::size_t unmount(Element& element);
    static void deactivate_recursively(Element& element);

    ElementArena& m_arena;
    std::unordered_set<Element*> m_elements;
    bool m_locked = false;
};

// =============================================================================
// BuildOwner
// =============================================================================

class BuildOwner {
public:
    explicit BuildOwner(FrameworkConfig config = {});
    ~BuildOwner();

    BuildOwner(const BuildOwner&) = delete;
    BuildOwner& operator=(const BuildOwner&) = delete;

    // -------------------------------------------------------------------------
    // Scheduling
    // -------------------------------------------------------------------------

    /// Called the first time an element becomes dirty after a build scope
    void set_on_build_scheduled(std::function<void()> callback) { m_on_build_scheduled = std::move(callback); }

    /// Add a dirty element to the dirty list
    void schedule_build_for(Element& element);

    /// Run callback with the tree locked against new dirtying requests
    void lock_state(const std::function<void()>& callback);

    /// Rebuild every dirty element, shallowest first.
    ///
    /// Runs callback first with context as the current build target. Build
    /// failures that are not TreeExceptions are reported and the loop goes on;
    /// a TreeException aborts the scope and propagates.
    void build_scope(Element& context, const std::function<void()>& callback = {});

    /// Unmount every element still inactive, then verify global keys.
    ///
    /// Bookkeeping is cleared and unmounted elements are freed even when a
    /// verification fails; the first failure is then rethrown.
    void finalize_tree();

    /// Hot reload: mark every element under root dirty
    void reassemble(Element& root);

    // -------------------------------------------------------------------------
    // State
    // -------------------------------------------------------------------------

    [[nodiscard]] bool state_locked() const noexcept { return m_state_lock_level > 0; }
    [[nodiscard]] bool building() const noexcept { return m_building; }
    [[nodiscard]] Element* current_build_target() const noexcept { return m_current_build_target; }
    [[nodiscard]] std::size_t dirty_count() const noexcept { return m_dirty_elements.size(); }
    [[nodiscard]] bool build_scheduled() const noexcept { return m_scheduled_flush_dirty_elements; }
    [[nodiscard]] const FrameworkConfig& config() const noexcept { return m_config; }

    [[nodiscard]] ElementArena& arena() noexcept { return m_arena; }
    [[nodiscard]] const ElementArena& arena() const noexcept { return m_arena; }
    [[nodiscard]] GlobalKeyRegistry& global_keys() noexcept { return m_global_keys; }
    [[nodiscard]] const GlobalKeyRegistry& global_keys() const noexcept { return m_global_keys; }
    [[nodiscard]] InactiveElements& inactive_elements() noexcept { return m_inactive_elements; }

    // -------------------------------------------------------------------------
    // Errors
    // -------------------------------------------------------------------------

    void set_error_reporter(ErrorReporter reporter) { m_error_reporter = std::move(reporter); }

    /// Describe a caught exception and hand it to the error reporter
    FrameworkErrorDetails report_exception(const std::string& context,
                                           std::exception_ptr exception,
                                           const Element* element);

    void set_error_widget_builder(ErrorWidgetBuilder builder) { m_error_widget_builder = std::move(builder); }

    /// Stand-in widget for a failed build
    [[nodiscard]] WidgetPtr build_error_widget(const FrameworkErrorDetails& details) const;

    /// Default reporter: logs the details through the widgets logger
    static void log_error(const FrameworkErrorDetails& details);

private:
    friend class Element;

    /// RAII swap of the current build target
    class BuildTargetScope {
    public:
        BuildTargetScope(BuildOwner& owner, Element* target)
            : m_owner(owner), m_previous(owner.m_current_build_target) {
            m_owner.m_current_build_target = target;
        }
        ~BuildTargetScope() { m_owner.m_current_build_target = m_previous; }

        BuildTargetScope(const BuildTargetScope&) = delete;
        BuildTargetScope& operator=(const BuildTargetScope&) = delete;

    private:
        BuildOwner& m_owner;
        Element* m_previous;
    };

    /// Drop an unmounted element from the dirty list
    void forget_dirty_element(Element& element);

    void sort_dirty_elements();
    void check_dirty_list_clean() const;
    void end_build_scope(bool aborted);

    FrameworkConfig m_config;
    ElementArena m_arena;
    GlobalKeyRegistry m_global_keys;
    InactiveElements m_inactive_elements;

    std::vector<Element*> m_dirty_elements;
    bool m_scheduled_flush_dirty_elements = false;
    bool m_dirty_elements_needs_resorting = false;
    bool m_building = false;
    int m_state_lock_level = 0;
    Element* m_current_build_target = nullptr;

    std::function<void()> m_on_build_scheduled;
    ErrorReporter m_error_reporter;
    ErrorWidgetBuilder m_error_widget_builder;
};

} // namespace arbor_widgets
