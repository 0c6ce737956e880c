#pragma once

#ifndef PB_BUILD_VERSION
#define PB_BUILD_VERSION "0.0.0-dev"
#endif

namespace pb::version
{

// Compile-time helpers derived from PB_BUILD_VERSION that keep user-facing
// strings consistent.
inline constexpr char const kSemanticVersion[] = PB_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] = "PutBridge " PB_BUILD_VERSION;
inline constexpr char const kUserAgentVersion[] =
    "PutBridge/" PB_BUILD_VERSION;

// Values reported through session-get; clients gate features on these.
inline constexpr char const kTransmissionVersion[] = "14.0.0";
inline constexpr char const kTransmissionRpcVersion[] = "18";

} // namespace pb::version
