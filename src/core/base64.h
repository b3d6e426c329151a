// Copyright 2026 The snapbridge Authors

#ifndef SNAPBRIDGE_CORE_BASE64_H_
#define SNAPBRIDGE_CORE_BASE64_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace snapbridge {
namespace internal {

/// Standard base64 (RFC 4648) with '=' padding.
std::string Base64Encode(const uint8_t* data, size_t len);
std::string Base64Encode(const std::vector<uint8_t>& data);

/// Decode standard base64.  ASCII whitespace is skipped; padding is
/// optional.  Returns false on any other invalid character or a dangling
/// single sextet.
bool Base64Decode(const std::string& text, std::vector<uint8_t>* out);

/// True for A-Z a-z 0-9 + / =.
bool IsBase64Char(char c);

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_CORE_BASE64_H_
