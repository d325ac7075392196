#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/core.h>

namespace cs::cli {

// "cloudsave <command> [positionals] [--key value] [--flag]"
struct Args {
    std::string command;
    std::vector<std::string> positionals;
    std::map<std::string, std::string> options;
    std::set<std::string> flags;

    [[nodiscard]] bool has(const std::string& flag) const { return flags.contains(flag) || options.contains(flag); }

    [[nodiscard]] std::optional<std::string> opt(const std::string& key) const {
        if (const auto it = options.find(key); it != options.end()) return it->second;
        return std::nullopt;
    }

    [[nodiscard]] std::string required(const std::string& key) const {
        if (auto v = opt(key)) return *v;
        throw std::invalid_argument("missing required option --" + key);
    }
};

// Options that never take a value; everything else consumes the next token
inline Args parseArgs(const int argc, char** argv, const std::set<std::string>& booleanFlags) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok(argv[i]);
        if (tok.starts_with("--")) {
            std::string key(tok.substr(2));
            if (const auto eq = key.find('='); eq != std::string::npos) {
                a.options[key.substr(0, eq)] = key.substr(eq + 1);
            } else if (booleanFlags.contains(key) || i + 1 >= argc) {
                a.flags.insert(key);
            } else {
                a.options[key] = argv[++i];
            }
        } else if (a.command.empty()) {
            a.command = tok;
        } else {
            a.positionals.emplace_back(tok);
        }
    }
    return a;
}

inline unsigned int parseUnsigned(const std::string& s, const std::string& what) {
    size_t idx = 0;
    unsigned long v = 0;
    try {
        v = std::stoul(s, &idx);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid " + what + ": " + s);
    }
    if (idx != s.size()) throw std::invalid_argument("invalid " + what + ": " + s);
    return static_cast<unsigned int>(v);
}

inline std::string human_bytes(uint64_t b) {
    static const char* kUnits[] = {"B","KiB","MiB","GiB","TiB","PiB"};
    int u = 0;
    auto v = static_cast<double>(b);
    while (v >= 1024.0 && u < 5) { v /= 1024.0; ++u; }
    // show 0 decimals for B/KiB, 1 for others
    if (u <= 1) return fmt::format("{} {}", static_cast<uint64_t>(u==0 ? b : static_cast<uint64_t>(v)), kUnits[u]);
    return fmt::format("{:.1f} {}", v, kUnits[u]);
}

inline std::string ellipsize_middle(std::string s, size_t maxw) {
    if (s.size() <= maxw || maxw < 5) return s;
    const size_t keep = (maxw - 3) / 2;
    const size_t tail = maxw - 3 - keep;
    return s.substr(0, keep) + "..." + s.substr(s.size() - tail);
}

}
