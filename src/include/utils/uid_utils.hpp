#pragma once
/**
 * @file uid_utils.hpp
 * @brief Generators for worker instance and request identifiers.
 *
 * ## Format
 *
 *   Instance: INST-{LABEL}-{SUFFIX}
 *   Request:  REQ-{SUFFIX}{SEQ}
 *
 * Where:
 *   {LABEL}  -- Up to 8 uppercase alphanumeric characters derived from the
 *               instance label. Non-alphanumeric runs collapse to a single
 *               "-"; leading/trailing "-" are stripped. Falls back to "WORKER".
 *   {SUFFIX} -- 8 uppercase hex digits from a 32-bit random value.
 *   {SEQ}    -- process-wide counter, 6 hex digits.
 *
 * Examples:
 *   "chat session" -> INST-CHATSESS-3A7F2B1C
 *   (empty label)  -> INST-WORKER-B3F12E9A
 */
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>

#include <fmt/format.h>

namespace workerpool::uid
{

namespace detail
{

inline std::string sanitize_label(const std::string &label, std::size_t max_len = 8)
{
    std::string out;
    out.reserve(max_len + 1);
    for (unsigned char c : label)
    {
        if (out.size() >= max_len)
        {
            break;
        }
        if (std::isalpha(c) != 0)
        {
            out += static_cast<char>(std::toupper(c));
        }
        else if (std::isdigit(c) != 0)
        {
            out += static_cast<char>(c);
        }
        else if (!out.empty() && out.back() != '-')
        {
            out += '-';
        }
    }
    while (!out.empty() && out.back() == '-')
    {
        out.pop_back();
    }
    return out.empty() ? "WORKER" : out;
}

/// 32-bit random value from a per-thread engine seeded once from
/// std::random_device mixed with the high-resolution clock.
inline uint32_t random_u32()
{
    thread_local std::mt19937 engine{[] {
        std::random_device rd;
        const auto ns = static_cast<uint64_t>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count());
        std::seed_seq seq{rd(), static_cast<uint32_t>(ns), static_cast<uint32_t>(ns >> 32U)};
        return std::mt19937(seq);
    }()};
    return static_cast<uint32_t>(engine());
}

} // namespace detail

/**
 * @brief Generate an instance id: @c "INST-{LABEL}-{8HEX}".
 * @param label Human-readable label of the worker kind. May be empty.
 */
inline std::string generate_instance_id(const std::string &label = "")
{
    return fmt::format("INST-{}-{:08X}", detail::sanitize_label(label, 8U), detail::random_u32());
}

/// Generate a request id, unique within the process.
inline std::string generate_request_id()
{
    static std::atomic<uint32_t> seq{0};
    return fmt::format("REQ-{:08X}{:06X}", detail::random_u32(),
                       seq.fetch_add(1, std::memory_order_relaxed) & 0xFFFFFFU);
}

} // namespace workerpool::uid
