module;

#include <cstdint>
#include <string_view>
#include <expected>

export module Core.Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    //
    // 1. std::expected<T, E>  - For FALLIBLE operations at the inbound boundary,
    //                          where the caller MUST handle a rejected value:
    //                          - Parsing mode / effector discriminators
    //                          - Parsing enum field names and hex colors
    //
    // 2. std::optional<T>    - For values that may legitimately be absent:
    //                          - Optional configuration features
    //                          - Per-instance color
    //
    // 3. Graceful degradation - The generation and effector path never fails.
    //                          Degenerate input falls back to a safe default
    //                          (t = 0, skip normalization, shorter scatter list).
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidFormat = 301,

        // Generic
        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:         return "Success";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::InvalidFormat:   return "InvalidFormat";
            default:                         return "Unknown";
        }
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
