#pragma once

#include "upl/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace upl::core {

/// FNV-1a 64-bit digest of a byte buffer, as 16 lowercase hex characters.
std::string fnv1a_hex(const std::vector<std::uint8_t>& data);

std::string fnv1a_hex(const std::string& text);

/// Streams the file through FNV-1a without loading it whole.
Result<std::string> fnv1a_file(const std::filesystem::path& path);

/// Random hex identifier with an optional prefix, e.g. "ses_3f9a0c..."
std::string generate_id(const std::string& prefix, std::size_t random_bytes = 12);

} // namespace upl::core
