#pragma once

/// @file widgets.hpp
/// @brief Main include header for arbor_widgets
///
/// Retained-mode reconciliation: immutable widgets, persistent elements,
/// per-tree BuildOwner scheduling and the render object contract.

#include "fwd.hpp"
#include "key.hpp"
#include "widget.hpp"
#include "render_object.hpp"
#include "element_arena.hpp"
#include "element.hpp"
#include "component_element.hpp"
#include "proxy_element.hpp"
#include "render_object_element.hpp"
#include "root.hpp"
#include "error_widget.hpp"
#include "framework_config.hpp"
#include "global_key_registry.hpp"
#include "build_owner.hpp"
