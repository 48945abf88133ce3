#ifndef PANELAYOUT_FOCUS_HISTORY_HPP
#define PANELAYOUT_FOCUS_HISTORY_HPP

#include <optional>
#include <string>
#include <string_view>

namespace panelayout {

    class FocusHistory {
      public:
        void                       record(std::string_view slot_id);
        void                       forget(std::string_view slot_id);
        void                       clear();

        std::optional<std::string> current() const;
        std::optional<std::string> previous() const;

      private:
        std::optional<std::string> current_;
        std::optional<std::string> previous_;
    };

} // namespace panelayout

#endif // PANELAYOUT_FOCUS_HISTORY_HPP
