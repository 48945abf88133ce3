#pragma once

#include <string>
#include <string_view>

namespace panelayout {

    std::string_view trim_view(std::string_view value);
    std::string      to_lower_copy(std::string_view value);

}
