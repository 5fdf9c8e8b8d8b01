#pragma once

/// @file render_object.hpp
/// @brief Backing node contract consumed by render-backed elements
///
/// Layout, painting and hit-testing live outside this library. The reconciler
/// only needs parent links, parent data, attachment and structural child
/// maintenance, which are defined here.
///
/// Ownership: each RenderObjectElement owns its render object. Parents hold
/// non-owning pointers to their children.

#include "fwd.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace arbor_widgets {

// =============================================================================
// ParentData
// =============================================================================

/// Data a parent stores on each of its children
class ParentData {
public:
    virtual ~ParentData() = default;
};

/// Sibling links for children of a ContainerRenderObject
class ContainerParentData : public ParentData {
public:
    RenderObject* previous_sibling = nullptr;
    RenderObject* next_sibling = nullptr;
};

using RenderObjectVisitor = std::function<void(RenderObject&)>;

// =============================================================================
// RenderObject
// =============================================================================

class RenderObject {
public:
    RenderObject() = default;
    virtual ~RenderObject() = default;

    RenderObject(const RenderObject&) = delete;
    RenderObject& operator=(const RenderObject&) = delete;

    [[nodiscard]] RenderObject* parent() const noexcept { return m_parent; }
    [[nodiscard]] bool attached() const noexcept { return m_attached; }
    [[nodiscard]] ParentData* parent_data() const noexcept { return m_parent_data.get(); }
    void set_parent_data(std::unique_ptr<ParentData> data) { m_parent_data = std::move(data); }

    /// Depth of this node below the topmost ancestor
    [[nodiscard]] int depth() const noexcept { return m_depth; }

    /// Mark this subtree as part of the active render tree
    void attach();

    /// Remove this subtree from the active render tree
    void detach();

    virtual void visit_children(const RenderObjectVisitor& visitor) { (void)visitor; }

    /// Install the parent data this node expects on its children
    virtual void setup_parent_data(RenderObject& child) { (void)child; }

    [[nodiscard]] virtual std::string debug_name() const { return "RenderObject"; }

protected:
    /// Link a child under this node; attaches it if this node is attached
    void adopt_child(RenderObject& child);

    /// Unlink a child; detaches it if it was attached
    void drop_child(RenderObject& child);

private:
    void redepth_child(RenderObject& child);

    RenderObject* m_parent = nullptr;
    std::unique_ptr<ParentData> m_parent_data;
    bool m_attached = false;
    int m_depth = 0;
};

// =============================================================================
// Single child
// =============================================================================

class RenderObjectWithChild : public RenderObject {
public:
    [[nodiscard]] RenderObject* child() const noexcept { return m_child; }

    /// Replace the child (nullptr clears it)
    void set_child(RenderObject* child);

    void visit_children(const RenderObjectVisitor& visitor) override;
    [[nodiscard]] std::string debug_name() const override { return "RenderObjectWithChild"; }

private:
    RenderObject* m_child = nullptr;
};

// =============================================================================
// Ordered children
// =============================================================================

/// Render object with a doubly linked list of children.
///
/// Children are positioned relative to a preceding sibling, which lets the
/// reconciler move one child without touching unrelated siblings.
class ContainerRenderObject : public RenderObject {
public:
    /// Insert child after `after` (nullptr inserts at the front)
    void insert(RenderObject& child, RenderObject* after = nullptr);

    /// Reposition an existing child after `after`
    void move(RenderObject& child, RenderObject* after);

    /// Unlink an existing child
    void remove(RenderObject& child);

    [[nodiscard]] RenderObject* first_child() const noexcept { return m_first_child; }
    [[nodiscard]] RenderObject* last_child() const noexcept { return m_last_child; }
    [[nodiscard]] RenderObject* child_after(const RenderObject& child) const;
    [[nodiscard]] RenderObject* child_before(const RenderObject& child) const;
    [[nodiscard]] std::size_t child_count() const noexcept { return m_child_count; }

    /// Children in list order
    [[nodiscard]] std::vector<RenderObject*> children() const;

    void visit_children(const RenderObjectVisitor& visitor) override;
    void setup_parent_data(RenderObject& child) override;
    [[nodiscard]] std::string debug_name() const override { return "ContainerRenderObject"; }

private:
    [[nodiscard]] static ContainerParentData& links(const RenderObject& child);
    void insert_into_list(RenderObject& child, RenderObject* after);
    void remove_from_list(RenderObject& child);

    RenderObject* m_first_child = nullptr;
    RenderObject* m_last_child = nullptr;
    std::size_t m_child_count = 0;
};

// =============================================================================
// Root and error nodes
// =============================================================================

/// Topmost render object; attached from construction
class RootRenderObject final : public RenderObjectWithChild {
public:
    RootRenderObject();
    [[nodiscard]] std::string debug_name() const override { return "RootRenderObject"; }
};

/// Leaf node standing in for a subtree whose build failed
class RenderErrorBox final : public RenderObject {
public:
    explicit RenderErrorBox(std::string message) : m_message(std::move(message)) {}

    [[nodiscard]] const std::string& message() const noexcept { return m_message; }
    [[nodiscard]] std::string debug_name() const override { return "RenderErrorBox"; }

private:
    std::string m_message;
};

} // namespace arbor_widgets
