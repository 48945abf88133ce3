#include "panelayout/logging.hpp"

#include <array>
#include <cstddef>

namespace panelayout {

    namespace {

        std::array<LogSink, 2> sinks = {nullptr, nullptr};

        LogSink&               sink_for(LogLevel level) {
            return sinks[static_cast<std::size_t>(level)];
        }

        std::string_view prefix_for(LogLevel level) {
            switch (level) {
                case LogLevel::kDebug: return "[panelayout][debug]";
                case LogLevel::kError: return "[panelayout]";
            }
            return "[panelayout]";
        }

        std::string_view basename(std::string_view path) {
            const auto slash = path.find_last_of("/\\");
            if (slash == std::string_view::npos) {
                return path;
            }
            return path.substr(slash + 1);
        }

        void emit(LogLevel level, std::string_view context, std::string_view message, const std::source_location& location) {
            const LogSink sink = sink_for(level);
            if (!sink) {
                return;
            }
            const auto text = format_log_entry_with_location(level, context, message, location);
            sink(text);
        }

    } // namespace

    std::string format_log_entry(LogLevel level, std::string_view context, std::string_view message) {
        const auto  prefix = prefix_for(level);
        std::string text;
        text.reserve(prefix.size() + context.size() + message.size() + 4);
        text.append(prefix);
        text.push_back(' ');
        if (!context.empty()) {
            text.append(context);
            text.append(": ");
        }
        text.append(message);
        return text;
    }

    std::string format_log_entry_with_location(LogLevel level, std::string_view context, std::string_view message, const std::source_location& location) {
        auto text = format_log_entry(level, context, message);
        text.append(" @");
        text.append(basename(location.file_name()));
        text.push_back(':');
        text.append(std::to_string(location.line()));
        const std::string_view function = location.function_name();
        if (!function.empty()) {
            text.push_back(' ');
            text.append(function);
        }
        return text;
    }

    void set_log_sink(LogLevel level, LogSink sink) {
        sink_for(level) = sink;
    }

    void clear_log_sink(LogLevel level) {
        sink_for(level) = nullptr;
    }

    void debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location) {
        if (!enabled) {
            return;
        }
        emit(LogLevel::kDebug, context, message, location);
    }

    void error_log(std::string_view context, std::string_view message, const std::source_location& location) {
        emit(LogLevel::kError, context, message, location);
    }

} // namespace panelayout
