#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace cs::util {

inline std::string readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(size, '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

// Writes to "<path>.tmp.<pid>" and renames over the target, so readers see the old or the new file, never half of one
inline void writeFileAtomic(const std::filesystem::path& path, const std::string& contents) {
    namespace fs = std::filesystem;

    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    auto tmp = path;
    tmp += ".tmp." + std::to_string(::getpid());

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open temp file: " + tmp.string());
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) throw std::runtime_error("Failed to write temp file: " + tmp.string());
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        const auto reason = ec.message();
        fs::remove(tmp, ec);
        throw std::runtime_error("Failed to replace " + path.string() + ": " + reason);
    }
}

}
