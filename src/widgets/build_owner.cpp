/// @file build_owner.cpp
/// @brief Dirty list, build scopes, inactive elements and frame teardown

#include <arbor/widgets/build_owner.hpp>

#include <arbor/core/error.hpp>
#include <arbor/core/log.hpp>
#include <arbor/widgets/element.hpp>
#include <arbor/widgets/error_widget.hpp>

#include <algorithm>
#include <string>

namespace arbor_widgets {

using arbor_core::TreeError;
using arbor_core::TreeException;

namespace {

/// Classify a caught exception for the error statistics
arbor_core::Error to_error(const std::exception_ptr& exception) {
    try {
        std::rethrow_exception(exception);
    } catch (const TreeException& e) {
        return arbor_core::Error(e.error());
    } catch (const std::exception& e) {
        return arbor_core::Error(arbor_core::ErrorCode::BuildFailure, e.what());
    } catch (...) {
        return arbor_core::Error(arbor_core::ErrorCode::BuildFailure, "Unknown exception");
    }
}

} // anonymous namespace

// =============================================================================
// FrameworkErrorDetails
// =============================================================================

std::string FrameworkErrorDetails::format() const {
    std::string out = "Exception caught by " + library;
    if (!context.empty()) {
        out += " while " + context;
    }
    out += ":\n" + summary;
    if (!chain.empty()) {
        out += "\nThe relevant element chain was:\n  " + chain;
    }
    return out;
}

// =============================================================================
// InactiveElements
// =============================================================================

void InactiveElements::add(Element& element) {
    if (m_locked) {
        throw TreeException(TreeError::internal_consistency(
            "An element was deactivated while inactive elements were being unmounted."));
    }
    if (element.parent()) {
        throw TreeException(TreeError::internal_consistency(
            "Only detached subtree roots may be parked as inactive.")
                                .with_chain(element.describe_chain()));
    }
    if (!m_elements.insert(&element).second) {
        throw TreeException(TreeError::internal_consistency(
            "Element is already in the inactive set.")
                                .with_chain(element.describe_chain()));
    }
    if (element.active()) {
        deactivate_recursively(element);
    }
}

void InactiveElements::remove(Element& element) {
    if (m_locked) {
        throw TreeException(TreeError::internal_consistency(
            "An element was reactivated while inactive elements were being unmounted."));
    }
    if (m_elements.erase(&element) == 0) {
        throw TreeException(TreeError::internal_consistency(
            "Element is not in the inactive set.")
                                .with_chain(element.describe_chain()));
    }
}

bool InactiveElements::contains(const Element& element) const {
    return m_elements.count(const_cast<Element*>(&element)) > 0;
}

std::size_t InactiveElements::unmount_all() {
    std::vector<Element*> elements(m_elements.begin(), m_elements.end());
    m_elements.clear();
    std::sort(elements.begin(), elements.end(), Element::build_order);

    m_locked = true;
    std::size_t count = 0;
    try {
        for (auto it = elements.rbegin(); it != elements.rend(); ++it) {
            count += unmount(**it);
        }
    } catch (...) {
        m_locked = false;
        throw;
    }
    m_locked = false;
    return count;
}

std::size_t InactiveElements::unmount(Element& element) {
    std::size_t count = 0;
    element.visit_children([&](Element& child) {
        count += unmount(child);
    });
    element.unmount();
    m_arena.retire(element.handle());
    return count + 1;
}

void InactiveElements::deactivate_recursively(Element& element) {
    if (element.active()) {
        element.deactivate();
    }
    element.visit_children(deactivate_recursively);
}

// =============================================================================
// BuildOwner
// =============================================================================

BuildOwner::BuildOwner(FrameworkConfig config)
    : m_config(std::move(config))
    , m_global_keys(m_arena)
    , m_inactive_elements(m_arena) {}

BuildOwner::~BuildOwner() = default;

// -----------------------------------------------------------------------------
// Scheduling
// -----------------------------------------------------------------------------

void BuildOwner::schedule_build_for(Element& element) {
    if (element.m_owner != this) {
        throw TreeException(TreeError::internal_consistency(
            "schedule_build_for() called for an element owned by another BuildOwner.")
                                .with_chain(element.describe_chain()));
    }
    if (!element.m_dirty) {
        throw TreeException(TreeError::internal_consistency(
            "schedule_build_for() called for an element that is not marked as dirty.")
                                .with_chain(element.describe_chain()));
    }

    if (m_config.print_schedule_build) {
        arbor_core::log_fields(*arbor_core::build_logger(), spdlog::level::debug, "schedule_build_for()",
                               {{"element", element.to_string_short()},
                                {"in_dirty_list", element.m_in_dirty_list ? "true" : "false"}});
    }

    if (element.m_in_dirty_list) {
        if (!m_building) {
            throw TreeException(TreeError::internal_consistency(
                "schedule_build_for() called inappropriately.",
                {"An element already in the dirty list can only be rescheduled while build_scope() is "
                 "rebuilding the tree."})
                                    .with_chain(element.describe_chain()));
        }
        m_dirty_elements_needs_resorting = true;
        return;
    }

    if (!m_scheduled_flush_dirty_elements && m_on_build_scheduled) {
        m_scheduled_flush_dirty_elements = true;
        m_on_build_scheduled();
    }
    m_dirty_elements.push_back(&element);
    element.m_in_dirty_list = true;
}

void BuildOwner::lock_state(const std::function<void()>& callback) {
    ++m_state_lock_level;
    try {
        callback();
    } catch (...) {
        --m_state_lock_level;
        throw;
    }
    --m_state_lock_level;
}

void BuildOwner::build_scope(Element& context, const std::function<void()>& callback) {
    if (!callback && m_dirty_elements.empty()) {
        return;
    }
    if (m_building) {
        throw TreeException(TreeError::contract_violation(
            "build_scope() called while another build scope is running.",
            {"Build scopes do not nest; schedule the work with mark_needs_build() instead."}));
    }

    arbor_core::PassTrace trace(arbor_core::LogChannel::Build, "build_scope()", m_config.print_build_scope);
    if (trace.enabled()) {
        trace.add_field("context", context.to_string_short());
        trace.add_field("scheduled", std::to_string(m_dirty_elements.size()));
    }

    ++m_state_lock_level;
    m_building = true;
    try {
        m_scheduled_flush_dirty_elements = true;
        if (callback) {
            AllowIgnoredMarkNeedsBuild allow(context);
            BuildTargetScope target(*this, &context);
            m_dirty_elements_needs_resorting = false;
            callback();
        }
        m_global_keys.element_was_rebuilt(context);

        sort_dirty_elements();
        std::size_t dirty_count = m_dirty_elements.size();
        std::size_t index = 0;
        std::size_t rebuilt = 0;
        while (index < dirty_count) {
            Element* element = m_dirty_elements[index];
            if (element->active() && !element->is_in_scope(&context)) {
                throw TreeException(TreeError::internal_consistency(
                    "Tried to build a dirty element in the wrong build scope.",
                    {"The element is not a descendant of the build scope context " + context.to_string_short() +
                     "."})
                                        .with_chain(element->describe_chain()));
            }
            try {
                ++rebuilt;
                element->rebuild();
            } catch (const TreeException&) {
                throw;
            } catch (...) {
                report_exception("rebuilding dirty elements", std::current_exception(), element);
                element->m_dirty = false;
            }
            ++index;
            if (dirty_count < m_dirty_elements.size() || m_dirty_elements_needs_resorting) {
                sort_dirty_elements();
                dirty_count = m_dirty_elements.size();
                // Elements that slid in before the cursor still need building
                while (index > 0 && m_dirty_elements[index - 1]->dirty()) {
                    --index;
                }
            }
        }
        check_dirty_list_clean();
        trace.add_field("rebuilt", std::to_string(rebuilt));
    } catch (...) {
        end_build_scope(true);
        throw;
    }
    end_build_scope(false);
}

void BuildOwner::finalize_tree() {
    arbor_core::PassTrace trace(arbor_core::LogChannel::Build, "finalize_tree()", m_config.print_build_scope);
    std::exception_ptr failure;
    try {
        std::size_t unmounted = 0;
        lock_state([&] { unmounted = m_inactive_elements.unmount_all(); });
        trace.add_field("unmounted", std::to_string(unmounted));
        if (m_config.verify_global_keys) {
            m_global_keys.verify_reservations();
            m_global_keys.verify_ill_fated_population();
            m_global_keys.verify_reparented_parents();
        }
    } catch (...) {
        failure = std::current_exception();
    }

    m_global_keys.clear_frame_state();
    trace.add_field("released", std::to_string(m_arena.release_retired()));

    if (failure) {
        arbor_core::debug::record_error(to_error(failure));
        std::rethrow_exception(failure);
    }
}

void BuildOwner::reassemble(Element& root) {
    arbor_core::build_logger()->info("Reassembling tree from {}", root.to_string_short());
    root.reassemble();
}

// -----------------------------------------------------------------------------
// Errors
// -----------------------------------------------------------------------------

FrameworkErrorDetails BuildOwner::report_exception(const std::string& context,
                                                   std::exception_ptr exception,
                                                   const Element* element) {
    FrameworkErrorDetails details;
    details.exception = exception;
    details.context = context;
    arbor_core::Error error = to_error(exception);
    details.summary = error.message();
    if (element) {
        details.chain = element->describe_chain();
        error.with_context("element", element->to_string_short());
    }
    error.with_context("context", context);
    arbor_core::debug::record_error(error);

    if (m_error_reporter) {
        m_error_reporter(details);
    } else {
        log_error(details);
    }
    return details;
}

WidgetPtr BuildOwner::build_error_widget(const FrameworkErrorDetails& details) const {
    if (m_error_widget_builder) {
        if (WidgetPtr widget = m_error_widget_builder(details)) {
            return widget;
        }
        arbor_core::widgets_logger()->warn("Error widget builder returned null; using the default stand-in");
    }
    return ErrorWidget::default_builder(details, m_config.error_widget_details);
}

void BuildOwner::log_error(const FrameworkErrorDetails& details) {
    auto logger = arbor_core::widgets_logger();
    arbor_core::LogFields fields{{"context", details.context}, {"summary", details.summary}};
    if (!details.chain.empty()) {
        fields.emplace_back("chain", details.chain);
    }
    arbor_core::log_fields(*logger, spdlog::level::err, "Exception caught by " + details.library, fields);
    logger->debug("{}", details.format());
}

// -----------------------------------------------------------------------------
// Dirty list
// -----------------------------------------------------------------------------

void BuildOwner::forget_dirty_element(Element& element) {
    auto it = std::find(m_dirty_elements.begin(), m_dirty_elements.end(), &element);
    if (it != m_dirty_elements.end()) {
        m_dirty_elements.erase(it);
    }
    element.m_in_dirty_list = false;
}

void BuildOwner::sort_dirty_elements() {
    std::sort(m_dirty_elements.begin(), m_dirty_elements.end(), Element::build_order);
    m_dirty_elements_needs_resorting = false;
}

void BuildOwner::check_dirty_list_clean() const {
    TreeError error = TreeError::internal_consistency(
        "build_scope() missed some dirty elements.",
        {"The dirty list should have been resorted but was not."});
    bool missed = false;
    for (const Element* element : m_dirty_elements) {
        if (element->active() && element->dirty()) {
            missed = true;
            error.with_chain(element->describe_chain());
        }
    }
    if (missed) {
        throw TreeException(std::move(error));
    }
}

void BuildOwner::end_build_scope(bool aborted) {
    if (aborted) {
        // Active elements that never got built stay scheduled for the next scope
        std::vector<Element*> kept;
        for (Element* element : m_dirty_elements) {
            if (element->active() && element->dirty()) {
                kept.push_back(element);
            } else {
                element->m_in_dirty_list = false;
            }
        }
        m_dirty_elements = std::move(kept);
    } else {
        for (Element* element : m_dirty_elements) {
            element->m_in_dirty_list = false;
        }
        m_dirty_elements.clear();
    }

    m_scheduled_flush_dirty_elements = false;
    m_dirty_elements_needs_resorting = false;
    m_building = false;
    --m_state_lock_level;
}

} // namespace arbor_widgets
