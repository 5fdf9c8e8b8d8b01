#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for arbor_widgets module

#include <cstdint>
#include <memory>
#include <vector>

namespace arbor_widgets {

// =============================================================================
// Keys
// =============================================================================

class Key;
class UniqueKey;
template<typename T>
class ValueKey;
class ObjectKey;
class GlobalKey;
class LabeledGlobalKey;
class GlobalObjectKey;

using KeyPtr = std::shared_ptr<const Key>;

// =============================================================================
// Widgets
// =============================================================================

class Widget;
class StatelessWidget;
class Builder;
class StatefulWidget;
class ProxyWidget;
class InheritedWidget;
class ParentDataWidget;
class RenderObjectWidget;
class LeafRenderObjectWidget;
class SingleChildRenderObjectWidget;
class MultiChildRenderObjectWidget;
class RootWidget;
class ErrorWidget;

using WidgetPtr = std::shared_ptr<const Widget>;
using WidgetList = std::vector<WidgetPtr>;

// =============================================================================
// Elements
// =============================================================================

enum class ElementLifecycle : std::uint8_t;
struct IndexedSlot;
class BuildContext;
class Element;
class ComponentElement;
class StatelessElement;
class StatefulElement;
class State;
class ProxyElement;
class InheritedElement;
class ParentDataElement;
class RenderObjectElement;
class LeafRenderObjectElement;
class SingleChildRenderObjectElement;
class MultiChildRenderObjectElement;
class RootElement;

// =============================================================================
// Ownership and scheduling
// =============================================================================

struct ElementHandle;
class ElementArena;
class GlobalKeyRegistry;
class InactiveElements;
class BuildOwner;
struct FrameworkConfig;
struct FrameworkErrorDetails;

// =============================================================================
// Render contract
// =============================================================================

class ParentData;
class ContainerParentData;
class RenderObject;
class RenderObjectWithChild;
class ContainerRenderObject;
class RootRenderObject;
class RenderErrorBox;

} // namespace arbor_widgets
