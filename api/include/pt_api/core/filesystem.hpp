#pragma once
#include <filesystem>
#include <vector>
#include <string>
#include <span>
#include <cstdint>

namespace pt_api::filesystem {
    // Path utilities
    std::filesystem::path NormalizePath(const std::filesystem::path& path) noexcept;

    // File operations (throw std::runtime_error on failure)
    std::vector<uint8_t> ReadBytes(const std::filesystem::path& path);
    std::string ReadText(const std::filesystem::path& path);
    void WriteBytes(const std::filesystem::path& path, std::span<const uint8_t> data, bool append = false);
    bool FileExists(const std::filesystem::path& path) noexcept;
}
