#pragma once

/// @file error_widget.hpp
/// @brief Stand-in widget shown where a build failed

#include "widget.hpp"

#include <string>

namespace arbor_widgets {

/// Leaf widget rendering a diagnostic message.
///
/// Every instance carries a fresh UniqueKey, so a new failure never reuses
/// the element of an earlier stand-in.
class ErrorWidget final : public LeafRenderObjectWidget {
public:
    explicit ErrorWidget(std::string message);

    [[nodiscard]] const std::string& message() const noexcept { return m_message; }

    [[nodiscard]] std::unique_ptr<RenderObject> create_render_object(BuildContext& context) const override;
    [[nodiscard]] std::string type_name() const override { return "ErrorWidget"; }

    /// Builder installed on every BuildOwner unless replaced.
    ///
    /// With show_details the message is the exception's text, otherwise it
    /// is empty.
    [[nodiscard]] static WidgetPtr default_builder(const FrameworkErrorDetails& details, bool show_details);

private:
    std::string m_message;
};

} // namespace arbor_widgets
