/// @file error_widget.cpp
/// @brief Default stand-in for failed builds

#include <arbor/widgets/error_widget.hpp>

#include <arbor/widgets/build_owner.hpp>

namespace arbor_widgets {

ErrorWidget::ErrorWidget(std::string message)
    : LeafRenderObjectWidget(make_unique_key()), m_message(std::move(message)) {}

std::unique_ptr<RenderObject> ErrorWidget::create_render_object(BuildContext& context) const {
    (void)context;
    return std::make_unique<RenderErrorBox>(m_message);
}

WidgetPtr ErrorWidget::default_builder(const FrameworkErrorDetails& details, bool show_details) {
    return std::make_shared<ErrorWidget>(show_details ? details.summary : std::string());
}

} // namespace arbor_widgets
