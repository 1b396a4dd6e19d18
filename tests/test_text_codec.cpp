#include "gffkit/text.hpp"

#include "test_common.hpp"

#include <iostream>
#include <string>
#include <vector>

int main() {
    using namespace gffkit;

    // ASCII passes through unchanged.
    {
        const std::string s = "Mod_PlayerList 123";
        CHECK(decode_cp1252(encode_cp1252(s)) == s);
        CHECK(encode_cp1252(s).size() == s.size());
    }

    // 1252 specials and Latin-1 letters map to their Unicode code points.
    {
        CHECK(decode_cp1252(std::vector<std::uint8_t>{0x80}) == "\xE2\x82\xAC");       // EURO SIGN
        CHECK(decode_cp1252(std::vector<std::uint8_t>{0x9F}) == "\xC5\xB8");           // Y WITH DIAERESIS
        CHECK(decode_cp1252(std::vector<std::uint8_t>{0xE9}) == "\xC3\xA9");           // e acute
        CHECK(encode_cp1252("\xE2\x82\xAC") == std::vector<std::uint8_t>{0x80});
        CHECK(encode_cp1252("caf\xC3\xA9") == (std::vector<std::uint8_t>{'c', 'a', 'f', 0xE9}));
        CHECK(encode_cp1252("\xE2\x80\x94") == std::vector<std::uint8_t>{0x97});       // EM DASH
    }

    // Every byte value survives decode then encode, unassigned slots included.
    {
        std::vector<std::uint8_t> all(256);
        for (int i = 0; i < 256; ++i) all[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(i);
        CHECK(encode_cp1252(decode_cp1252(all)) == all);
        CHECK(decode_cp1252(std::vector<std::uint8_t>{0x81}) == "\xC2\x81");
    }

    // Code points outside the code page become '?'.
    {
        CHECK(encode_cp1252("\xE6\xBC\xA2") == std::vector<std::uint8_t>{'?'});
        CHECK(encode_cp1252("a\xF0\x9F\x98\x80z") == (std::vector<std::uint8_t>{'a', '?', 'z'}));
    }

    // Malformed UTF-8 is rejected.
    {
        CHECK_THROWS_KIND(encode_cp1252("\xC3"), ErrorKind::InvalidEncoding);
        CHECK_THROWS_KIND(encode_cp1252("\xC0\x80"), ErrorKind::InvalidEncoding);
        CHECK_THROWS_KIND(encode_cp1252("ab\x80"), ErrorKind::InvalidEncoding);
        CHECK_THROWS_KIND(encode_cp1252("\xED\xA0\x80"), ErrorKind::InvalidEncoding);
    }

    // Label encode then decode returns the original for short labels.
    {
        for (const std::string s : {"", "a", "hello", "Mod_PlayerList", "ABCDEFGHIJKLMNO"}) {
            CHECK(decode_label(encode_label(s)) == s);
        }
        const LabelBytes raw = encode_label("Str");
        CHECK(raw[0] == 'S' && raw[1] == 't' && raw[2] == 'r');
        for (std::size_t i = 3; i < raw.size(); ++i) CHECK(raw[i] == 0);
    }

    // All-zero slot is empty; a full slot without NUL keeps all 16 characters.
    {
        LabelBytes zero{};
        CHECK(decode_label(zero).empty());

        LabelBytes full{};
        for (std::size_t i = 0; i < full.size(); ++i) full[i] = static_cast<std::uint8_t>('a' + i);
        CHECK(decode_label(full) == "abcdefghijklmnop");
        CHECK(encode_label("abcdefghijklmnop") == full);
    }

    // Text after the first NUL is ignored; long labels are cut at 16 bytes.
    {
        LabelBytes raw{};
        raw[0] = 'H'; raw[1] = 'P'; raw[2] = 0; raw[3] = 'x';
        CHECK(decode_label(raw) == "HP");
        CHECK(decode_label(encode_label("abcdefghijklmnopqrstuvwxyz")) == "abcdefghijklmnop");
    }

    // Non-ASCII label text goes through the code page.
    {
        const std::string s = "Na\xC3\xAFve";
        const LabelBytes raw = encode_label(s);
        CHECK(raw[2] == 0xEF);
        CHECK(decode_label(raw) == s);
    }

    // Header tags.
    {
        CHECK(is_valid_tag("GFF "));
        CHECK(is_valid_tag("V3.2"));
        CHECK(!is_valid_tag("GFF"));
        CHECK(!is_valid_tag("GFF  "));
        CHECK(!is_valid_tag(std::string("GF\0 ", 4)));
        CHECK(!is_valid_tag("GF\xC3\xA9"));
    }

    std::cout << "All tests passed.\n";
    return 0;
}
