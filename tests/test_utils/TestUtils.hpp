#ifndef JOPLINREADER_TESTS_TEST_UTILS_TESTUTILS_HPP
#define JOPLINREADER_TESTS_TEST_UTILS_TESTUTILS_HPP

#include "joplinreader/security/SecureRandom.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace joplinreader::test_utils
{

// Throwaway sync directory for tests that need real files. Created with a random name under the system temp
// dir and removed, contents included, on destruction.
class ScratchDir final
{
public:
    explicit ScratchDir(std::string_view prefix)
    {
        constexpr int kAttempts{ 8 };
        const auto root{ std::filesystem::temp_directory_path() };
        for (int attempt{}; attempt < kAttempts; ++attempt)
        {
            auto candidate{ root / (std::string{ "joplinreader_" } + std::string{ prefix } + randomToken()) };
            std::error_code ec{};
            if (std::filesystem::create_directory(candidate, ec) && !ec)
            {
                m_dir = std::move(candidate);
                return;
            }
        }
        throw std::runtime_error("ScratchDir: could not create a temp directory");
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&&) = delete;
    ScratchDir& operator=(ScratchDir&&) = delete;

    ~ScratchDir()
    {
        std::error_code ec{};
        std::filesystem::remove_all(m_dir, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return m_dir;
    }

    // Writes `text` byte for byte to `<dir>/<name>` and returns the full path.
    std::filesystem::path write(const std::filesystem::path& name, std::string_view text) const
    {
        const auto target{ m_dir / name };
        std::ofstream out{ target, std::ios::binary | std::ios::trunc };
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!out)
        {
            throw std::runtime_error("ScratchDir: failed to write " + target.string());
        }
        return target;
    }

private:
    [[nodiscard]] static std::string randomToken()
    {
        std::array<std::uint8_t, 8U> bytes{};
        if (!joplinreader::security::secureRandomFill(std::span<std::uint8_t>{ bytes }))
        {
            throw std::runtime_error("ScratchDir: no randomness available");
        }
        constexpr std::string_view kHex{ "0123456789abcdef" };
        std::string token{};
        for (const auto b : bytes)
        {
            token.push_back(kHex[b >> 4U]);
            token.push_back(kHex[b & 0x0FU]);
        }
        return token;
    }

    std::filesystem::path m_dir;
};

} // namespace joplinreader::test_utils

#endif // JOPLINREADER_TESTS_TEST_UTILS_TESTUTILS_HPP
