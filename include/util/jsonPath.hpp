#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::util::jsonPath {

using Segment = std::variant<std::string, size_t>;

// "player.stats.health" or "inventory.items[3].id"
inline std::vector<Segment> split(const std::string_view path) {
    std::vector<Segment> out;
    std::string cur;

    for (size_t i = 0; i < path.size(); ++i) {
        const char c = path[i];
        if (c == '.') {
            if (!cur.empty()) out.emplace_back(std::move(cur));
            cur.clear();
        } else if (c == '[') {
            if (!cur.empty()) out.emplace_back(std::move(cur));
            cur.clear();
            const auto close = path.find(']', i);
            if (close == std::string_view::npos) {
                cur.assign(path.substr(i));
                break;
            }
            out.emplace_back(static_cast<size_t>(std::stoull(std::string(path.substr(i + 1, close - i - 1)))));
            i = close;
        } else {
            cur.push_back(c);
        }
    }

    if (!cur.empty()) out.emplace_back(std::move(cur));
    return out;
}

// nullptr when any segment is missing or the value is null
inline const nlohmann::json* find(const nlohmann::json& root, const std::string_view path) {
    const nlohmann::json* node = &root;
    for (const auto& seg : split(path)) {
        if (const auto* key = std::get_if<std::string>(&seg)) {
            if (!node->is_object()) return nullptr;
            const auto it = node->find(*key);
            if (it == node->end()) return nullptr;
            node = &*it;
        } else {
            const auto idx = std::get<size_t>(seg);
            if (!node->is_array() || idx >= node->size()) return nullptr;
            node = &(*node)[idx];
        }
    }
    return node->is_null() ? nullptr : node;
}

inline bool has(const nlohmann::json& root, const std::string_view path) {
    return find(root, path) != nullptr;
}

// Creates intermediate objects as needed; non-object intermediates are replaced
inline void set(nlohmann::json& root, const std::string_view path, nlohmann::json value) {
    const auto segs = split(path);
    if (segs.empty()) {
        root = std::move(value);
        return;
    }

    nlohmann::json* node = &root;
    for (size_t i = 0; i < segs.size(); ++i) {
        const bool last = i + 1 == segs.size();
        if (const auto* key = std::get_if<std::string>(&segs[i])) {
            if (!node->is_object()) *node = nlohmann::json::object();
            node = &(*node)[*key];
        } else {
            const auto idx = std::get<size_t>(segs[i]);
            if (!node->is_array()) *node = nlohmann::json::array();
            while (node->size() <= idx) node->push_back(nullptr);
            node = &(*node)[idx];
        }
        if (last) *node = std::move(value);
    }
}

}
