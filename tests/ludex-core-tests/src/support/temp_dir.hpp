#pragma once

#include <ludex/core/types.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace testutil {

/// @brief A uniquely named directory under the system temp directory, removed with its contents on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<uint32> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 ("ludex-tests-" + std::to_string(stamp) + "-" + std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(m_path);
        m_path = std::filesystem::canonical(m_path);
    }

    ~TempDir() {
        std::error_code error{};
        std::filesystem::remove_all(m_path, error);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &Path() const {
        return m_path;
    }

    std::filesystem::path operator/(std::string_view relative) const {
        return m_path / std::filesystem::path{relative};
    }

    /// @brief Creates a file of `size` bytes at `relative`, creating parent directories as needed.
    std::filesystem::path MakeFile(std::string_view relative, uintmax_t size = 0) const {
        const std::filesystem::path path = *this / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        const std::string chunk(4096, '\0');
        for (uintmax_t remaining = size; remaining > 0;) {
            const auto count = std::min<uintmax_t>(remaining, chunk.size());
            out.write(chunk.data(), static_cast<std::streamsize>(count));
            remaining -= count;
        }
        return path;
    }

    /// @brief Writes text to a file at `relative`, creating parent directories as needed.
    std::filesystem::path WriteText(std::string_view relative, std::string_view text) const {
        const std::filesystem::path path = *this / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        return path;
    }

    std::filesystem::path MakeDir(std::string_view relative) const {
        const std::filesystem::path path = *this / relative;
        std::filesystem::create_directories(path);
        return path;
    }

private:
    std::filesystem::path m_path;
};

} // namespace testutil
