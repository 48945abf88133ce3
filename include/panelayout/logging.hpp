#ifndef PANELAYOUT_LOGGING_HPP
#define PANELAYOUT_LOGGING_HPP

#include <source_location>
#include <string>
#include <string_view>

namespace panelayout {

    enum class LogLevel {
        kDebug,
        kError,
    };

    using LogSink = void (*)(std::string_view message);

    std::string format_log_entry(LogLevel level, std::string_view context, std::string_view message);
    std::string format_log_entry_with_location(LogLevel level, std::string_view context, std::string_view message,
                                               const std::source_location& location = std::source_location::current());

    // One sink per level. Without a sink, entries of that level are dropped.
    void set_log_sink(LogLevel level, LogSink sink);
    void clear_log_sink(LogLevel level);

    void debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());
    void error_log(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

} // namespace panelayout

#endif // PANELAYOUT_LOGGING_HPP
