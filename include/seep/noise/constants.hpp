#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace seep::protocol::noise {

inline constexpr size_t kDhLength = 32;
inline constexpr size_t kCipherKeyBytes = 32;
inline constexpr size_t kCipherNonceBytes = 12;
inline constexpr size_t kAeadTagBytes = 16;
inline constexpr size_t kNonceCounterOffset = 4;
inline constexpr size_t kMaxHashLength = 64;
inline constexpr size_t kMaxMessageBytes = 65535;
inline constexpr uint64_t kMaxNonce = std::numeric_limits<uint64_t>::max();

inline constexpr std::string_view kProtocolPrefix = "Noise";
inline constexpr char kNameSeparator = '_';

}
