#include "panelayout/focus_history.hpp"

#include <utility>

namespace panelayout {

    void FocusHistory::record(std::string_view slot_id) {
        if (slot_id.empty()) {
            return;
        }
        if (current_ && *current_ == slot_id) {
            return;
        }
        previous_ = std::move(current_);
        current_  = std::string(slot_id);
    }

    void FocusHistory::forget(std::string_view slot_id) {
        if (previous_ && *previous_ == slot_id) {
            previous_.reset();
        }
        if (current_ && *current_ == slot_id) {
            current_ = std::move(previous_);
            previous_.reset();
        }
    }

    void FocusHistory::clear() {
        current_.reset();
        previous_.reset();
    }

    std::optional<std::string> FocusHistory::current() const {
        return current_;
    }

    std::optional<std::string> FocusHistory::previous() const {
        return previous_;
    }

} // namespace panelayout
