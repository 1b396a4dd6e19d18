#include "gffkit/binary.hpp"
#include "gffkit/string_resolver.hpp"

#include "test_common.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using testing_util::RawGff;
using testing_util::put_u32;
using testing_util::put_u64;
using testing_util::put_bytes;
using testing_util::single_field;

static gffkit::Field only_value(const RawGff& g, const gffkit::StringResolver* r = nullptr,
                                const gffkit::ReadOptions& opts = gffkit::ReadOptions{}) {
    gffkit::Gff doc = gffkit::read(g.bytes(), r, opts);
    CHECK(doc.root.field_count() == 1);
    return doc.root.fields[0]->get();
}

static std::vector<std::uint8_t> loc_string_heap(std::uint32_t string_ref,
                                                 const std::vector<std::pair<std::uint32_t, std::string>>& subs) {
    std::vector<std::uint8_t> body;
    put_u32(body, string_ref);
    put_u32(body, static_cast<std::uint32_t>(subs.size()));
    for (const auto& s : subs) {
        put_u32(body, s.first);
        put_u32(body, static_cast<std::uint32_t>(s.second.size()));
        put_bytes(body, s.second);
    }
    std::vector<std::uint8_t> out;
    put_u32(out, static_cast<std::uint32_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

int main() {
    using namespace gffkit;
    using bin::BinaryGff;

    // Header and sections of a minimal file.
    {
        RawGff g;
        g.file_type = "IFO ";
        g.structs.push_back({0xFFFFFFFFu, 7, 0});
        const BinaryGff img = BinaryGff::read(g.bytes());
        CHECK(img.header.file_type == "IFO ");
        CHECK(img.header.file_version == "V3.2");
        CHECK(img.header.structs.offset == bin::kHeaderSize);
        CHECK(img.header.structs.count == 1);
        CHECK(img.header.fields.offset == bin::kHeaderSize + bin::kStructSize);
        CHECK(img.structs.size() == 1);
        CHECK(img.structs[0].data == bin::StructData{bin::Literal{7}});

        const Gff doc = img.to_tree(nullptr);
        CHECK(doc.file_type == "IFO ");
        CHECK(doc.root.id == 0xFFFFFFFFu);
        CHECK(doc.root.field_count() == 0);
        CHECK(doc.root.origin.empty_struct_offset() == 7);
        CHECK(!doc.root.origin.is_synthesized());
    }

    // get_field returns nothing for any index >= field_count.
    {
        RawGff g;
        g.structs.push_back({0, 0, 0});                 // no fields
        g.structs.push_back({1, 1, 1});                 // field 1
        g.structs.push_back({2, 4, 3});                 // field_indices[1..3]
        g.fields = {{5, 0, 10}, {5, 0, 11}, {5, 0, 12}, {5, 0, 13}};
        g.labels = {"X"};
        g.field_indices = {99, 3, 2, 0};
        const BinaryGff img = BinaryGff::read(g.bytes());

        for (std::uint32_t i = 0; i < 4; ++i) CHECK(img.get_field(img.structs[0], i) == nullptr);

        CHECK(img.get_field(img.structs[1], 0) == &img.fields[1]);
        CHECK(img.get_field(img.structs[1], 1) == nullptr);

        CHECK(img.get_field(img.structs[2], 0) == &img.fields[3]);
        CHECK(img.get_field(img.structs[2], 1) == &img.fields[2]);
        CHECK(img.get_field(img.structs[2], 2) == &img.fields[0]);
        CHECK(img.get_field(img.structs[2], 3) == nullptr);
        CHECK(img.get_field(img.structs[2], 100) == nullptr);
    }

    // A multi-field struct whose offset is not a multiple of 4 is an alignment error.
    {
        CHECK_THROWS_KIND(bin::StructRecord::decode(0, 6, 2), ErrorKind::Alignment);
        CHECK(bin::StructRecord::decode(0, 8, 2).data == bin::StructData{bin::IndicesBlock{8}});
        // a single-field struct holds a plain index, any value is fine
        CHECK(bin::StructRecord::decode(0, 3, 1).data == bin::StructData{bin::FieldIndex{3}});

        RawGff g;
        g.structs.push_back({0, 2, 2});
        g.fields = {{0, 0, 1}, {0, 0, 2}};
        g.labels = {"A"};
        g.field_indices = {0, 1};
        CHECK_THROWS_KIND(BinaryGff::read(g.bytes()), ErrorKind::Alignment);

        CHECK_THROWS_KIND(bin::FieldRecord::decode(15, 0, 5), ErrorKind::Alignment);
    }

    // Field type tags outside 0..15 are rejected.
    {
        CHECK_THROWS_KIND(BinaryGff::read(single_field(16, 0).bytes()), ErrorKind::InvalidFieldType);
        CHECK_THROWS_KIND(BinaryGff::read(single_field(255, 0).bytes()), ErrorKind::InvalidFieldType);
        CHECK(bin::FieldRecord::decode(10, 2, 40).data == bin::FieldData{bin::HeapOffset{40}});
        CHECK(bin::FieldRecord::decode(14, 2, 3).data == bin::FieldData{bin::StructIndex{3}});
        CHECK(bin::FieldRecord::decode(8, 2, 3).data == bin::FieldData{bin::InlineBits{3}});
    }

    // Truncated input.
    {
        std::vector<std::uint8_t> bytes = single_field(5, 1).bytes();
        CHECK_THROWS_KIND(BinaryGff::read(std::vector<std::uint8_t>(bytes.begin(), bytes.begin() + 40)),
                          ErrorKind::Truncated);
        CHECK_THROWS_KIND(BinaryGff::read(std::vector<std::uint8_t>(bytes.begin(), bytes.end() - 1)),
                          ErrorKind::Truncated);

        // ExoString declaring more bytes than the heap holds
        std::vector<std::uint8_t> heap;
        put_u32(heap, 50);
        put_bytes(heap, "short");
        CHECK_THROWS_KIND(read(single_field(10, 0, heap).bytes()), ErrorKind::Truncated);

        // heap offset past the end
        std::vector<std::uint8_t> eight;
        put_u64(eight, 1);
        CHECK_THROWS_KIND(read(single_field(6, 4, eight).bytes()), ErrorKind::Truncated);
    }

    // Header tags must be printable ASCII.
    {
        RawGff g = single_field(0, 1);
        g.file_type = std::string("GF\x01 ", 4);
        CHECK_THROWS_KIND(BinaryGff::read(g.bytes()), ErrorKind::InvalidEncoding);
        g.file_type = "GFF ";
        g.file_version = std::string("V3\xFF" "2", 4);
        CHECK_THROWS_KIND(BinaryGff::read(g.bytes()), ErrorKind::InvalidEncoding);
    }

    // Inline kinds reinterpret the low bytes of the record word.
    {
        CHECK(only_value(single_field(0, 0x1FF)).expect_byte() == 0xFF);
        CHECK(only_value(single_field(1, 'A')).expect_char() == 'A');
        CHECK(only_value(single_field(2, 0x1FFFF)).expect_word() == 0xFFFF);
        CHECK(only_value(single_field(3, 0xFFFF)).expect_short() == -1);
        CHECK(only_value(single_field(3, 0x7FFF)).expect_short() == 32767);
        CHECK(only_value(single_field(4, 0xDEADBEEF)).expect_dword() == 0xDEADBEEFu);
        CHECK(only_value(single_field(5, 0xFFFFFFFF)).expect_int() == -1);
        CHECK(only_value(single_field(8, 0x3FC00000)).expect_float() == 1.5f);
    }

    // Heap kinds.
    {
        std::vector<std::uint8_t> heap;
        put_u64(heap, 0x0102030405060708ull);
        CHECK(only_value(single_field(6, 0, heap)).expect_dword64() == 0x0102030405060708ull);

        heap.clear();
        put_u64(heap, static_cast<std::uint64_t>(-2));
        CHECK(only_value(single_field(7, 0, heap)).expect_int64() == -2);

        heap.clear();
        put_u64(heap, 0x4004000000000000ull);
        CHECK(only_value(single_field(9, 0, heap)).expect_double() == 2.5);

        heap.clear();
        put_u32(heap, 0xAAAAAAAA); // padding before the string
        put_u32(heap, 5);
        put_bytes(heap, "caf\xE9!");
        CHECK(only_value(single_field(10, 4, heap)).expect_exo_string() == "caf\xC3\xA9!");

        heap.clear();
        heap.push_back(7);
        put_bytes(heap, "nw_it_1");
        CHECK(only_value(single_field(11, 0, heap)).expect_res_ref() == "nw_it_1");

        // a ResRef length byte above 16 is clamped
        heap.clear();
        heap.push_back(20);
        put_bytes(heap, "abcdefghijklmnopqrst");
        CHECK(only_value(single_field(11, 0, heap)).expect_res_ref() == "abcdefghijklmnop");

        heap.clear();
        put_u32(heap, 3);
        heap.insert(heap.end(), {0x00, 0xFF, 0x10});
        CHECK(only_value(single_field(13, 0, heap)).expect_void() == (std::vector<std::uint8_t>{0x00, 0xFF, 0x10}));

        heap.clear();
        put_u32(heap, 0);
        CHECK(only_value(single_field(13, 0, heap)).expect_void().empty());
    }

    // ExoLocString substrings unpack language and gender from the id.
    {
        const auto heap = loc_string_heap(ExoLocString::kNoStringRef, {{0, "Sword"}, {3, "Ep\xE9" "e"}, {262, "x"}});
        const ExoLocString s = only_value(single_field(12, 0, heap)).expect_exo_loc_string();
        CHECK(!s.has_string_ref());
        CHECK(s.substrings.size() == 3);
        CHECK(s.substrings[0].language == Language::English && s.substrings[0].gender == Gender::Masculine);
        CHECK(s.substrings[1].language == Language::French && s.substrings[1].gender == Gender::Feminine);
        CHECK(s.substrings[1].text == "Ep\xC3\xA9" "e");
        CHECK(s.substrings[2].language == Language::Japanese);
        CHECK(s.substrings[1].string_id() == 3);
        CHECK(s.text() == "Sword");
        CHECK(s.text(Language::French, Gender::Feminine) == "Ep\xC3\xA9" "e");
        CHECK(!s.resolved.has_value());
    }

    // The no-reference sentinel never reaches the resolver.
    {
        MapStringResolver strings;
        strings.add(5, "Hello");
        const auto heap = loc_string_heap(ExoLocString::kNoStringRef, {{0, "literal"}});
        const ExoLocString s = only_value(single_field(12, 0, heap), &strings).expect_exo_loc_string();
        CHECK(strings.lookup_count() == 0);
        CHECK(!s.resolved.has_value());
    }

    // A real reference is resolved, and a missing one is a lookup error.
    {
        MapStringResolver strings;
        strings.add(5, "Hello");
        const ExoLocString s =
            only_value(single_field(12, 0, loc_string_heap(5, {})), &strings).expect_exo_loc_string();
        CHECK(strings.lookup_count() == 1);
        CHECK(s.string_ref == 5);
        CHECK(s.resolved && *s.resolved == "Hello");
        CHECK(s.text() == "Hello");

        CHECK_THROWS_KIND(read(single_field(12, 0, loc_string_heap(6, {})).bytes(), &strings), ErrorKind::Lookup);

        // no resolver, or resolution turned off: the reference is kept as is
        const ExoLocString bare = only_value(single_field(12, 0, loc_string_heap(6, {}))).expect_exo_loc_string();
        CHECK(bare.string_ref == 6 && !bare.resolved);

        ReadOptions ro;
        ro.resolve_strings = false;
        const std::size_t before = strings.lookup_count();
        const ExoLocString off =
            only_value(single_field(12, 0, loc_string_heap(6, {})), &strings, ro).expect_exo_loc_string();
        CHECK(strings.lookup_count() == before);
        CHECK(off.string_ref == 6 && !off.resolved);
    }

    // Struct and List fields resolve through the struct array and list_indices.
    {
        RawGff g;
        g.structs.push_back({0xFFFFFFFFu, 0, 2});   // root: field_indices[0..1]
        g.structs.push_back({10, 2, 1});            // Inner: field 2
        g.structs.push_back({20, 3, 1});            // list element 0: field 3
        g.structs.push_back({21, 0xABCD, 0});       // list element 1: empty
        g.fields = {
            {14, 0, 1},     // Inner -> struct 1
            {15, 1, 4},     // Items -> list_indices byte 4
            {5, 2, 42},     // Int 42
            {0, 3, 9},      // Byte 9
        };
        g.labels = {"Inner", "Items", "Answer", "Flag"};
        g.field_indices = {0, 1};
        g.list_indices = {0xEEEEEEEE, 2, 2, 3};

        const Gff doc = read(g.bytes());
        const Struct inner = doc.root.find("Inner")->get().expect_struct();
        CHECK(inner.id == 10);
        CHECK(inner.find("Answer")->get().expect_int() == 42);

        const List items = doc.root.find("Items")->get().expect_list();
        CHECK(items.size() == 2);
        CHECK(items[0].id == 20);
        CHECK(items[0].find("Flag")->get().expect_byte() == 9);
        CHECK(items[1].id == 21 && items[1].field_count() == 0);
        CHECK(items[1].origin.empty_struct_offset() == 0xABCD);
    }

    // Broken references.
    {
        RawGff g = single_field(14, 0);      // struct field pointing at the root itself
        CHECK_THROWS_KIND(read(g.bytes()), ErrorKind::InvalidStructure);

        g = single_field(14, 5);             // struct index past the array
        CHECK_THROWS_KIND(read(g.bytes()), ErrorKind::OutOfRange);

        g = single_field(15, 0);             // list block with no list_indices
        CHECK_THROWS_KIND(read(g.bytes()), ErrorKind::OutOfRange);

        g = single_field(15, 0);
        g.list_indices = {3, 0};             // declares three entries, holds one
        CHECK_THROWS_KIND(read(g.bytes()), ErrorKind::OutOfRange);

        g = single_field(5, 1);
        g.fields[0][1] = 4;                  // label index past the table
        CHECK_THROWS_KIND(read(g.bytes()), ErrorKind::OutOfRange);

        RawGff two;
        two.structs.push_back({0, 0, 2});
        two.fields = {{5, 0, 1}};
        two.labels = {"A"};
        two.field_indices = {0};            // one entry for a two-field struct
        CHECK_THROWS_KIND(read(two.bytes()), ErrorKind::OutOfRange);

        RawGff empty;
        CHECK_THROWS_KIND(read(empty.bytes()), ErrorKind::InvalidStructure);
    }

    // A struct may have only one parent.
    {
        RawGff g;
        g.structs.push_back({0xFFFFFFFFu, 0, 2});
        g.structs.push_back({5, 0xFFFFFFFFu, 0});
        g.fields = {{14, 0, 1}, {14, 1, 1}};  // A and B both point at struct 1
        g.labels = {"A", "B"};
        g.field_indices = {0, 1};
        CHECK_THROWS_KIND(read(g.bytes()), ErrorKind::InvalidStructure);

        RawGff l;
        l.structs.push_back({0xFFFFFFFFu, 0, 1});
        l.structs.push_back({5, 0xFFFFFFFFu, 0});
        l.fields = {{15, 0, 0}};
        l.labels = {"L"};
        l.list_indices = {2, 1, 1};           // same element listed twice
        CHECK_THROWS_KIND(read(l.bytes()), ErrorKind::InvalidStructure);

        // Each struct links twice to the next; rejected at the first repeat
        // instead of expanding 2^40 copies.
        RawGff chain;
        const std::uint32_t depth = 40;
        for (std::uint32_t i = 0; i < depth; ++i) {
            chain.structs.push_back({i, 2 * i * 4, 2});
            chain.fields.push_back({14, 0, i + 1});
            chain.fields.push_back({14, 1, i + 1});
            chain.field_indices.push_back(2 * i);
            chain.field_indices.push_back(2 * i + 1);
        }
        chain.structs.push_back({depth, 0xFFFFFFFFu, 0});
        chain.labels = {"L", "R"};
        CHECK_THROWS_KIND(read(chain.bytes()), ErrorKind::InvalidStructure);
    }

    // Version gate.
    {
        RawGff g = single_field(5, 1);
        g.file_version = "V3.3";
        CHECK(read(g.bytes()).file_version == "V3.3");
        ReadOptions ro;
        ro.require_v32 = true;
        CHECK_THROWS_KIND(read(g.bytes(), nullptr, ro), ErrorKind::InvalidStructure);
    }

    std::cout << "All tests passed.\n";
    return 0;
}
