#include "pt_api/core/filesystem.hpp"
#include "pt_api/core/debug.hpp"

#include <fstream>
#include <system_error>

namespace pt_api::filesystem {

    std::filesystem::path NormalizePath(const std::filesystem::path& path) noexcept {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
            return path.lexically_normal();
        return absolute.lexically_normal();
    }

    std::vector<uint8_t> ReadBytes(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary | std::ios::ate);
        if (!in)
            PT_LOG_THROW("Cannot open file '{}'", path.string());

        const std::streamsize size = in.tellg();
        if (size < 0)
            PT_LOG_THROW("Cannot determine size of '{}'", path.string());

        std::vector<uint8_t> bytes(static_cast<size_t>(size));
        in.seekg(0, std::ios::beg);
        if (size > 0 && !in.read(reinterpret_cast<char*>(bytes.data()), size))
            PT_LOG_THROW("Failed to read {} bytes from '{}'", size, path.string());

        return bytes;
    }

    std::string ReadText(const std::filesystem::path& path) {
        const std::vector<uint8_t> bytes = ReadBytes(path);
        return std::string(bytes.begin(), bytes.end());
    }

    void WriteBytes(const std::filesystem::path& path, std::span<const uint8_t> data, bool append) {
        auto mode = std::ios::binary | std::ios::out | (append ? std::ios::app : std::ios::trunc);
        std::ofstream out(path, mode);
        if (!out)
            PT_LOG_THROW("Cannot open '{}' for writing", path.string());

        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out)
            PT_LOG_THROW("Failed to write {} bytes to '{}'", data.size(), path.string());
    }

    bool FileExists(const std::filesystem::path& path) noexcept {
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec);
    }
}
