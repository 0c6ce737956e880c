#pragma once

#include "engine/Errors.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pb::engine
{

// Per-transfer state carried in the remote transfer's callback URL. The
// URL uses a reserved .test host so nothing ever dereferences it.
struct CallbackState
{
    std::string download_dir;
    // Empty when the instance runs without a friend token.
    std::string owner_token;

    bool operator==(CallbackState const &) const = default;
};

inline constexpr char const kCallbackScheme[] = "test";
inline constexpr char const kCallbackHost[] = "put.test";
inline constexpr char const kCallbackPath[] = "/arr";

struct CallbackDecodeResult
{
    std::optional<CallbackState> state;
    // Meaningful only when state is empty: UnrecognizedCallback or
    // OwnershipMismatch.
    ErrorCode error = ErrorCode::UnrecognizedCallback;
    std::string reason;

    bool ok() const noexcept
    {
        return state.has_value();
    }
};

std::string encode_callback_url(CallbackState const &state);

// With an empty expected_token every URL on the callback host/path is
// accepted whatever its fragment; otherwise the fragment must match it
// exactly.
CallbackDecodeResult decode_callback_url(std::string_view url,
                                         std::string_view expected_token);

bool is_owned(std::string_view callback_url, std::string_view expected_token);

} // namespace pb::engine
