// CROWDFUND - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#ifndef CROWDFUND_CORE_HEX_H
#define CROWDFUND_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crowdfund {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes (throws std::invalid_argument)
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

/// Strip an optional "0x"/"0X" prefix
std::string StripHexPrefix(const std::string& str);

} // namespace crowdfund

#endif // CROWDFUND_CORE_HEX_H
