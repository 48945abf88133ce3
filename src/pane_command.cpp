#include "panelayout/pane_command.hpp"

#include <cctype>
#include <charconv>
#include <system_error>
#include <utility>
#include <vector>

namespace panelayout {

    namespace {

        std::optional<std::string> split_tokens(std::string_view args, std::vector<std::string>* tokens) {
            std::string current;
            bool        in_quotes = false;
            bool        escaped   = false;
            char        quote     = '\0';
            for (const char ch : args) {
                if (escaped) {
                    current.push_back(ch);
                    escaped = false;
                    continue;
                }
                if (in_quotes) {
                    if (ch == '\\') {
                        escaped = true;
                    } else if (ch == quote) {
                        in_quotes = false;
                    } else {
                        current.push_back(ch);
                    }
                    continue;
                }
                if (ch == '"' || ch == '\'') {
                    in_quotes = true;
                    quote     = ch;
                    continue;
                }
                if (std::isspace(static_cast<unsigned char>(ch))) {
                    if (!current.empty()) {
                        tokens->push_back(std::move(current));
                        current.clear();
                    }
                    continue;
                }
                current.push_back(ch);
            }
            if (escaped || in_quotes) {
                return std::string("unterminated quote");
            }
            if (!current.empty()) {
                tokens->push_back(std::move(current));
            }
            return std::nullopt;
        }

        template <typename T>
        std::optional<T> parse_number(const std::string& text) {
            T          value{};
            const auto end    = text.data() + text.size();
            const auto result = std::from_chars(text.data(), end, value);
            if (result.ec != std::errc() || result.ptr != end) {
                return std::nullopt;
            }
            return value;
        }

        std::variant<PaneCommand, ParseError> parse_split(const std::vector<std::string>& tokens) {
            if (tokens.size() < 2) {
                return ParseError{"missing slot id"};
            }
            if (tokens.size() < 3) {
                return ParseError{"missing new slot id"};
            }
            if (tokens.size() > 4) {
                return ParseError{"unexpected extra arguments"};
            }
            PaneCommand command{.kind = PaneCommandKind::kSplit, .slot_id = tokens[1], .new_slot_id = tokens[2]};
            if (tokens.size() == 4) {
                command.direction = parse_split_direction(tokens[3]);
                if (!command.direction) {
                    return ParseError{"invalid direction"};
                }
            }
            return command;
        }

        std::variant<PaneCommand, ParseError> parse_resize(const std::vector<std::string>& tokens) {
            if (tokens.size() < 2) {
                return ParseError{"missing node id"};
            }
            if (tokens.size() < 3) {
                return ParseError{"invalid ratio"};
            }
            if (tokens.size() > 3) {
                return ParseError{"unexpected extra arguments"};
            }
            const auto ratio = parse_number<float>(tokens[2]);
            if (!ratio) {
                return ParseError{"invalid ratio"};
            }
            return PaneCommand{.kind = PaneCommandKind::kResize, .node_id = tokens[1], .ratio = *ratio};
        }

        std::variant<PaneCommand, ParseError> parse_focus(const std::vector<std::string>& tokens) {
            if (tokens.size() < 2) {
                return ParseError{"missing focus target"};
            }
            const auto& target = tokens[1];
            if (target == "slot") {
                if (tokens.size() < 3) {
                    return ParseError{"missing slot id"};
                }
                if (tokens.size() > 3) {
                    return ParseError{"unexpected extra arguments"};
                }
                return PaneCommand{.kind = PaneCommandKind::kFocusSlot, .slot_id = tokens[2]};
            }
            if (target == "index") {
                if (tokens.size() < 3) {
                    return ParseError{"invalid index"};
                }
                if (tokens.size() > 3) {
                    return ParseError{"unexpected extra arguments"};
                }
                const auto index = parse_number<int>(tokens[2]);
                if (!index || *index < 1) {
                    return ParseError{"invalid index"};
                }
                return PaneCommand{.kind = PaneCommandKind::kFocusIndex, .index = *index};
            }
            if (tokens.size() > 2) {
                return ParseError{"unexpected extra arguments"};
            }
            if (target == "next") {
                return PaneCommand{.kind = PaneCommandKind::kFocusNext};
            }
            if (target == "prev") {
                return PaneCommand{.kind = PaneCommandKind::kFocusPrevious};
            }
            if (target == "last") {
                return PaneCommand{.kind = PaneCommandKind::kFocusLast};
            }
            if (target == "sibling") {
                return PaneCommand{.kind = PaneCommandKind::kFocusSibling};
            }
            return PaneCommand{.kind = PaneCommandKind::kFocusSlot, .slot_id = target};
        }

    } // namespace

    std::variant<PaneCommand, ParseError> parse_pane_command(std::string_view args) {
        std::vector<std::string> tokens;
        if (const auto error = split_tokens(args, &tokens)) {
            return ParseError{*error};
        }
        if (tokens.empty()) {
            return ParseError{"missing command"};
        }

        if (tokens[0] == "split") {
            return parse_split(tokens);
        }
        if (tokens[0] == "close") {
            if (tokens.size() < 2) {
                return ParseError{"missing slot id"};
            }
            if (tokens.size() > 2) {
                return ParseError{"unexpected extra arguments"};
            }
            return PaneCommand{.kind = PaneCommandKind::kClose, .slot_id = tokens[1]};
        }
        if (tokens[0] == "resize") {
            return parse_resize(tokens);
        }
        if (tokens[0] == "focus") {
            return parse_focus(tokens);
        }
        return ParseError{"unknown command: " + tokens[0]};
    }

} // namespace panelayout
