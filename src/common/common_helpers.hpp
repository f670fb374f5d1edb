//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_COMMON_HELPERS_HPP_INCLUDED
#define POSSYNC_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <exception>
#include <limits>
#include <random>
#include <string>
#include <utility>

namespace possync
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

/// @brief Performs the given action, and if it throws performs `rollback` before rethrowing.
///
/// The rollback must not throw.
///
template <typename Action, typename Rollback>
auto performWithRollback(Action&& action, Rollback&& rollback) -> decltype(std::forward<Action>(action)())
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        return std::forward<Action>(action)();

#if defined(__cpp_exceptions)
    } catch (...)
    {
        std::forward<Rollback>(rollback)();
        throw;
    }
#endif
}

/// Generates a random (version 4) UUID in its canonical lowercase text form.
///
inline std::string makeUuid()
{
    std::array<std::uint8_t, 16> bytes{};  // NOLINT(*-magic-numbers)

    std::random_device                      rd;         // Seed for the random number engine
    std::mt19937                            gen{rd()};  // Mersenne Twister engine
    std::uniform_int_distribution<unsigned> dis{std::numeric_limits<std::uint8_t>::min(),
                                                std::numeric_limits<std::uint8_t>::max()};
    for (auto& b : bytes)
    {
        b = static_cast<std::uint8_t>(dis(gen));
    }

    // NOLINTBEGIN(*-magic-numbers)
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0FU) | 0x40U);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3FU) | 0x80U);  // RFC 4122 variant
    // NOLINTEND(*-magic-numbers)

    std::string out;
    out.reserve(36);  // NOLINT(*-magic-numbers)
    for (std::size_t i = 0; i < bytes.size(); ++i)
    {
        if ((i == 4) || (i == 6) || (i == 8) || (i == 10))  // NOLINT(*-magic-numbers)
        {
            out += '-';
        }
        out += fmt::format("{:02x}", bytes[i]);
    }
    return out;
}

/// Formats the given time point as an RFC 3339 UTC timestamp with millisecond precision.
///
/// For example: `2024-05-01T12:30:45.123Z`.
///
inline std::string toRfc3339(const std::chrono::system_clock::time_point time_point)
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    const auto since_epoch = duration_cast<milliseconds>(time_point.time_since_epoch());
    const auto secs        = static_cast<std::time_t>(since_epoch.count() / 1000);  // NOLINT(*-magic-numbers)
    const auto millis      = static_cast<int>(since_epoch.count() % 1000);           // NOLINT(*-magic-numbers)

    std::tm utc{};
    ::gmtime_r(&secs, &utc);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       utc.tm_year + 1900,  // NOLINT(*-magic-numbers)
                       utc.tm_mon + 1,
                       utc.tm_mday,
                       utc.tm_hour,
                       utc.tm_min,
                       utc.tm_sec,
                       millis);
}

inline std::string nowRfc3339()
{
    return toRfc3339(std::chrono::system_clock::now());
}

/// Takes at most `max_chars` leading characters of the given UTF-8 text.
///
/// The cut never splits a multi-byte sequence: continuation bytes (`10xxxxxx`) are
/// counted together with their lead byte.
///
inline std::string utf8Prefix(const std::string& text, const std::size_t max_chars)
{
    std::size_t chars = 0;
    std::size_t pos   = 0;
    for (; pos < text.size(); ++pos)
    {
        const auto byte = static_cast<std::uint8_t>(text[pos]);
        if ((byte & 0xC0U) != 0x80U)  // NOLINT(*-magic-numbers)
        {
            if (chars == max_chars)
            {
                break;
            }
            ++chars;
        }
    }
    return text.substr(0, pos);
}

}  // namespace common
}  // namespace possync

#endif  // POSSYNC_COMMON_HELPERS_HPP_INCLUDED
