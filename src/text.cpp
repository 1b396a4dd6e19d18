#include "gffkit/text.hpp"

#include "gffkit/gff.hpp"

#include <algorithm>
#include <array>

namespace gffkit {

// ------------------------------
// Code page table
// ------------------------------

// 0x80..0x9F; the rest of 1252 coincides with Latin-1. Unassigned slots hold
// their own byte value.
static constexpr std::array<std::uint16_t, 32> kHighControls = {
    0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F,
    0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178,
};

static std::uint32_t cp1252_to_code_point(std::uint8_t b) {
    if (b >= 0x80 && b <= 0x9F) return kHighControls[b - 0x80];
    return b;
}

static int code_point_to_cp1252(std::uint32_t cp) {
    if (cp < 0x80 || (cp >= 0xA0 && cp <= 0xFF)) return static_cast<int>(cp);
    for (std::size_t i = 0; i < kHighControls.size(); ++i) {
        if (kHighControls[i] == cp) return static_cast<int>(0x80 + i);
    }
    return -1;
}

static void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Decodes one code point starting at s[i] and advances i past it.
static std::uint32_t next_code_point(const std::string& s, std::size_t& i) {
    const auto lead = static_cast<unsigned char>(s[i]);
    std::size_t extra = 0;
    std::uint32_t cp = 0;
    std::uint32_t min = 0;
    if (lead < 0x80) {
        ++i;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        extra = 1; cp = lead & 0x1F; min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2; cp = lead & 0x0F; min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3; cp = lead & 0x07; min = 0x10000;
    } else {
        throw GffError(ErrorKind::InvalidEncoding, "invalid UTF-8 lead byte at offset " + std::to_string(i));
    }
    if (i + extra >= s.size()) {
        throw GffError(ErrorKind::InvalidEncoding, "truncated UTF-8 sequence at offset " + std::to_string(i));
    }
    for (std::size_t k = 1; k <= extra; ++k) {
        const auto c = static_cast<unsigned char>(s[i + k]);
        if ((c & 0xC0) != 0x80) {
            throw GffError(ErrorKind::InvalidEncoding, "invalid UTF-8 continuation at offset " + std::to_string(i + k));
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        throw GffError(ErrorKind::InvalidEncoding, "invalid UTF-8 code point at offset " + std::to_string(i));
    }
    i += extra + 1;
    return cp;
}

// ------------------------------
// Windows-1252 <-> UTF-8
// ------------------------------

std::string decode_cp1252(const std::uint8_t* data, std::size_t len) {
    std::string out;
    out.reserve(len);
    for (std::size_t i = 0; i < len; ++i) {
        append_utf8(out, cp1252_to_code_point(data[i]));
    }
    return out;
}

std::string decode_cp1252(const std::vector<std::uint8_t>& bytes) {
    return decode_cp1252(bytes.data(), bytes.size());
}

std::vector<std::uint8_t> encode_cp1252(const std::string& utf8) {
    std::vector<std::uint8_t> out;
    out.reserve(utf8.size());
    std::size_t i = 0;
    while (i < utf8.size()) {
        const int b = code_point_to_cp1252(next_code_point(utf8, i));
        out.push_back(b < 0 ? static_cast<std::uint8_t>('?') : static_cast<std::uint8_t>(b));
    }
    return out;
}

// ------------------------------
// Labels
// ------------------------------

std::string decode_label(const LabelBytes& raw) {
    const auto end = std::find(raw.begin(), raw.end(), std::uint8_t{0});
    return decode_cp1252(raw.data(), static_cast<std::size_t>(end - raw.begin()));
}

LabelBytes encode_label(const std::string& label) {
    LabelBytes out{};
    const std::vector<std::uint8_t> bytes = encode_cp1252(label);
    std::copy_n(bytes.begin(), std::min(bytes.size(), out.size()), out.begin());
    return out;
}

// ------------------------------
// Header tags
// ------------------------------

bool is_valid_tag(const std::string& tag) noexcept {
    if (tag.size() != 4) return false;
    return std::all_of(tag.begin(), tag.end(), [](char c) { return c >= 0x20 && c <= 0x7E; });
}

} // namespace gffkit
