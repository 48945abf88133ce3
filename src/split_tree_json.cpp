#include "panelayout/split_tree_json.hpp"

#include <exception>
#include <unordered_set>
#include <utility>

#include <nlohmann/json.hpp>

#include "panelayout/json_utils.hpp"

namespace panelayout {
    namespace {

        constexpr int kPaneTreeVersion = 1;

        void          set_error(std::string* error, std::string message) {
            if (!error) {
                return;
            }
            *error = std::move(message);
        }

        nlohmann::json node_to_json(const PaneNode& node) {
            nlohmann::json entry;
            entry["id"] = node.id;
            if (node.is_leaf()) {
                entry["type"]    = "leaf";
                entry["slot_id"] = node.slot_id;
                return entry;
            }
            entry["type"]      = "split";
            entry["direction"] = std::string(split_direction_name(node.direction));
            entry["ratio"]     = node.ratio;
            entry["children"]  = nlohmann::json::array();
            entry["children"].push_back(node.first ? node_to_json(*node.first) : nlohmann::json(nullptr));
            entry["children"].push_back(node.second ? node_to_json(*node.second) : nlohmann::json(nullptr));
            return entry;
        }

        PaneTree node_from_json(const nlohmann::json& entry, std::unordered_set<std::string>* seen_slots, std::string* error) {
            if (!entry.is_object()) {
                set_error(error, "pane node is not an object");
                return nullptr;
            }
            const auto type = optional_string_field(entry, "type");
            if (type == "leaf") {
                auto slot_id = optional_string_field(entry, "slot_id");
                if (!slot_id) {
                    set_error(error, "pane leaf slot_id must be non-empty string");
                    return nullptr;
                }
                if (!seen_slots->insert(*slot_id).second) {
                    set_error(error, "pane tree has duplicate slot id: " + *slot_id);
                    return nullptr;
                }
                return create_leaf(std::move(*slot_id));
            }
            if (type != "split") {
                set_error(error, "pane node type is invalid");
                return nullptr;
            }

            const auto direction_name = optional_string_field(entry, "direction");
            const auto direction      = direction_name ? parse_split_direction(*direction_name) : std::nullopt;
            if (!direction) {
                set_error(error, "pane split direction is invalid");
                return nullptr;
            }
            const auto ratio = optional_float_field(entry, "ratio");
            if (!ratio) {
                set_error(error, "pane split ratio must be number");
                return nullptr;
            }
            if (!entry.contains("children") || !entry.at("children").is_array() || entry.at("children").size() != 2) {
                set_error(error, "pane split must have two children");
                return nullptr;
            }
            const auto& children = entry.at("children");
            auto        first    = node_from_json(children.at(0), seen_slots, error);
            if (!first) {
                return nullptr;
            }
            auto second = node_from_json(children.at(1), seen_slots, error);
            if (!second) {
                return nullptr;
            }
            return make_split(*direction, std::move(first), std::move(second), *ratio);
        }

    } // namespace

    std::optional<std::string> pane_tree_to_json(const PaneTree& tree, std::string* error) {
        if (error) {
            error->clear();
        }
        try {
            nlohmann::json root;
            root["version"] = kPaneTreeVersion;
            if (tree) {
                root["root"] = node_to_json(*tree);
            } else {
                root["root"] = nullptr;
            }
            return root.dump();
        } catch (const std::exception& exc) {
            set_error(error, std::string("pane tree encode failed: ") + exc.what());
            return std::nullopt;
        }
    }

    std::optional<PaneTree> pane_tree_from_json(std::string_view json_text, std::string* error) {
        if (error) {
            error->clear();
        }
        try {
            const auto root = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, false);
            if (root.is_discarded()) {
                set_error(error, "pane tree invalid json");
                return std::nullopt;
            }
            if (!root.is_object()) {
                set_error(error, "pane tree root must be object");
                return std::nullopt;
            }
            if (root.value("version", 0) != kPaneTreeVersion) {
                set_error(error, "pane tree version mismatch");
                return std::nullopt;
            }
            if (!root.contains("root")) {
                set_error(error, "pane tree root is missing");
                return std::nullopt;
            }
            if (root.at("root").is_null()) {
                return PaneTree{};
            }

            std::unordered_set<std::string> seen_slots;
            auto                            tree = node_from_json(root.at("root"), &seen_slots, error);
            if (!tree) {
                return std::nullopt;
            }
            return tree;
        } catch (const std::exception& exc) {
            set_error(error, std::string("pane tree decode failed: ") + exc.what());
            return std::nullopt;
        }
    }

} // namespace panelayout
