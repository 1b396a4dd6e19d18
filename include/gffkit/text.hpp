#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gffkit {

// ------------------------------
// Windows-1252 <-> UTF-8
// ------------------------------

// Every byte value decodes to a code point. The five bytes that 1252 leaves
// unassigned map to the C1 control of the same value so decode/encode is
// lossless for arbitrary input.
std::string decode_cp1252(const std::uint8_t* data, std::size_t len);
std::string decode_cp1252(const std::vector<std::uint8_t>& bytes);

// Throws GffError(InvalidEncoding) on malformed UTF-8. Code points with no
// 1252 byte are written as '?'.
std::vector<std::uint8_t> encode_cp1252(const std::string& utf8);

// ------------------------------
// Labels
// ------------------------------

constexpr std::size_t kLabelSize = 16;

using LabelBytes = std::array<std::uint8_t, kLabelSize>;

// Text ends at the first NUL, or fills the whole slot when there is none.
std::string decode_label(const LabelBytes& raw);

// Left-justified, NUL padded. Encodings longer than 16 bytes are cut at 16.
LabelBytes encode_label(const std::string& label);

// ------------------------------
// Header tags
// ------------------------------

// Four printable ASCII characters, e.g. "IFO " or "V3.2".
bool is_valid_tag(const std::string& tag) noexcept;

} // namespace gffkit
