#ifndef PANELAYOUT_LAYOUT_ERROR_HPP
#define PANELAYOUT_LAYOUT_ERROR_HPP

#include <expected>
#include <string>

namespace panelayout {

    struct LayoutError {
        std::string context;
        std::string message;
    };

    inline std::string format_layout_error(const LayoutError& error) {
        std::string text = error.context;
        if (!text.empty() && !error.message.empty()) {
            text.append(": ");
        }
        text.append(error.message);
        return text;
    }

    using LayoutResult = std::expected<void, LayoutError>;

} // namespace panelayout

#endif // PANELAYOUT_LAYOUT_ERROR_HPP
