#include "integrity/Schema.hpp"

#include <cmath>

namespace cs::integrity {

std::string kindToString(const Kind k) {
    switch (k) {
        case Kind::String: return "string";
        case Kind::Number: return "number";
        case Kind::Boolean: return "boolean";
        case Kind::Object: return "object";
        case Kind::Array: return "array";
    }
    return "unknown";
}

std::string describeKind(const nlohmann::json& v) {
    if (v.is_null()) return "null";
    if (v.is_string()) return "string";
    if (v.is_boolean()) return "boolean";
    if (v.is_number()) return "number";
    if (v.is_array()) return "array";
    if (v.is_object()) return "object";
    return "binary";
}

bool matchesKind(const nlohmann::json& v, const Kind k) {
    switch (k) {
        case Kind::String: return v.is_string();
        case Kind::Number: return v.is_number() && !(v.is_number_float() && std::isnan(v.get<double>()));
        case Kind::Boolean: return v.is_boolean();
        case Kind::Object: return v.is_object();
        case Kind::Array: return v.is_array();
    }
    return true;
}

Schema defaultGameStateSchema() {
    Schema s;
    s.version = "1.0.0";
    s.required = {"player", "inventory", "story", "gameFlags", "version", "timestamp"};
    s.kinds = {
        {"player", Kind::Object},
        {"player.name", Kind::String},
        {"player.level", Kind::Number},
        {"player.experience", Kind::Number},
        {"player.currentArea", Kind::String},
        {"player.stats", Kind::Object},
        {"inventory", Kind::Object},
        {"inventory.items", Kind::Array},
        {"story", Kind::Object},
        {"story.currentChapter", Kind::Number},
        {"story.completedQuests", Kind::Array},
        {"gameFlags", Kind::Object},
        {"version", Kind::String},
        {"timestamp", Kind::String},
    };
    s.constraints = {
        {"player.level", {.min = 1, .max = 999}},
        {"player.experience", {.min = 0, .max = 999999999}},
        {"story.currentChapter", {.min = 0, .max = 100}},
        {"inventory.items", {.maxLength = 1000}},
    };
    s.deprecated = {"oldPlayerData", "legacyFlags", "tempData"};
    s.defaults = {
        {"player.name", "Unknown Player"},
        {"player.level", 1},
        {"player.experience", 0},
        {"player.currentArea", "starting_area"},
        {"player.stats", {
            {"health", 100},
            {"mana", 50},
            {"strength", 10},
            {"agility", 10},
            {"intelligence", 10},
            {"defense", 10}
        }},
        {"inventory.items", nlohmann::json::array()},
        {"story.currentChapter", 0},
        {"story.completedQuests", nlohmann::json::array()},
        {"gameFlags", nlohmann::json::object()},
        {"version", "1.0.0"},
    };
    s.nowDefaults = {"timestamp"};

    s.arrayElements = {{
        .path = "inventory.items",
        .requiredKeys = {{"id", Kind::String}},
        .nonNegativeNumbers = {"quantity"},
    }};
    s.recordFields = {{.path = "gameFlags"}};
    s.objectShapes = {{
        .path = "player.stats",
        .nonNegativeNumbers = {"health", "mana", "strength", "agility", "intelligence", "defense"},
    }};

    return s;
}

}
