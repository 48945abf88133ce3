#include "panelayout/strings.hpp"

#include <algorithm>
#include <cctype>

namespace panelayout {

    std::string_view trim_view(std::string_view value) {
        const auto is_space = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
        const auto begin    = std::find_if_not(value.begin(), value.end(), is_space);
        const auto end      = std::find_if_not(value.rbegin(), std::string_view::reverse_iterator(begin), is_space).base();
        return value.substr(static_cast<size_t>(begin - value.begin()), static_cast<size_t>(end - begin));
    }

    std::string to_lower_copy(std::string_view value) {
        std::string lowered(value);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](char ch) { return static_cast<char>(std::tolower(static_cast<unsigned char>(ch))); });
        return lowered;
    }

}
