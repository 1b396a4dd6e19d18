#pragma once

#include "gffkit/gff.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

// Flat, offset-addressed form of a GFF image. Everything in here mirrors the
// bytes on disk; the resolved tree in gff.hpp is built from it and written
// back through it.
namespace gffkit::bin {

constexpr std::uint32_t kHeaderSize = 56;
constexpr std::uint32_t kStructSize = 12;
constexpr std::uint32_t kFieldSize = 12;
constexpr std::uint32_t kLabelSize = 16;
constexpr std::uint32_t kIndexSize = 4;

// ------------------------------
// Header
// ------------------------------

struct Section {
    std::uint32_t offset{0};
    std::uint32_t count{0}; // records for structs/fields/labels, bytes for the rest
};

bool operator==(const Section& a, const Section& b);

struct Header {
    std::string file_type{"GFF "};
    std::string file_version{"V3.2"};
    Section structs{};
    Section fields{};
    Section labels{};
    Section field_data{};
    Section field_indices{};
    Section list_indices{};
};

bool operator==(const Header& a, const Header& b);

// ------------------------------
// Typed data_or_offset words
// ------------------------------

// Struct with no fields: the word is unused but kept verbatim.
struct Literal {
    std::uint32_t value{0};
};

// Struct with one field: index into the field array.
struct FieldIndex {
    std::uint32_t index{0};
};

// Struct with several fields: byte offset into field_indices.
struct IndicesBlock {
    std::uint32_t byte_offset{0};
};

using StructData = std::variant<Literal, FieldIndex, IndicesBlock>;

// Inline kinds: the value itself (Float as its bit pattern).
struct InlineBits {
    std::uint32_t bits{0};
};

// 8-byte numerics, strings, ResRef, ExoLocString, Void.
struct HeapOffset {
    std::uint32_t offset{0};
};

struct StructIndex {
    std::uint32_t index{0};
};

// Byte offset into list_indices of a [count, index...] block.
struct ListBlock {
    std::uint32_t byte_offset{0};
};

using FieldData = std::variant<InlineBits, HeapOffset, StructIndex, ListBlock>;

bool operator==(const Literal& a, const Literal& b);
bool operator==(const FieldIndex& a, const FieldIndex& b);
bool operator==(const IndicesBlock& a, const IndicesBlock& b);
bool operator==(const InlineBits& a, const InlineBits& b);
bool operator==(const HeapOffset& a, const HeapOffset& b);
bool operator==(const StructIndex& a, const StructIndex& b);
bool operator==(const ListBlock& a, const ListBlock& b);

std::uint32_t raw_value(const StructData& d) noexcept;
std::uint32_t raw_value(const FieldData& d) noexcept;

// ------------------------------
// Records
// ------------------------------

struct StructRecord {
    std::uint32_t type_id{0};
    StructData data{Literal{}};
    std::uint32_t field_count{0};

    /// Interpret a raw record. Throws Alignment when a multi-field offset is not
    /// a multiple of the index width.
    static StructRecord decode(std::uint32_t type_id, std::uint32_t data_or_offset, std::uint32_t field_count);
};

bool operator==(const StructRecord& a, const StructRecord& b);
bool operator!=(const StructRecord& a, const StructRecord& b);

struct FieldRecord {
    FieldType type{FieldType::Byte};
    std::uint32_t label_index{0};
    FieldData data{InlineBits{}};

    /// Throws InvalidFieldType for a tag outside 0..15, Alignment for a
    /// misaligned list offset.
    static FieldRecord decode(std::uint32_t tag, std::uint32_t label_index, std::uint32_t data_or_offset);
};

bool operator==(const FieldRecord& a, const FieldRecord& b);
bool operator!=(const FieldRecord& a, const FieldRecord& b);

// ------------------------------
// Whole image
// ------------------------------

struct BinaryGff {
    Header header{};
    std::vector<StructRecord> structs{};
    std::vector<FieldRecord> fields{};
    std::vector<std::string> labels{};
    std::vector<std::uint8_t> field_data{};
    std::vector<std::uint32_t> field_indices{};
    std::vector<std::uint32_t> list_indices{};

    /// Parse header and the six sections at their declared offsets.
    static BinaryGff read(const std::uint8_t* data, std::size_t len);
    static BinaryGff read(const std::vector<std::uint8_t>& bytes);

    /// Store a resolved tree. Header offsets are the running section sizes.
    static BinaryGff from_tree(const Gff& doc, const WriteOptions& opts = WriteOptions{});

    /// Header followed by the sections, in on-disk order.
    std::vector<std::uint8_t> serialize() const;

    /// Field `index` of `s`, or nullptr when index >= field_count.
    /// Throws OutOfRange when the struct points outside the field tables.
    const FieldRecord* get_field(const StructRecord& s, std::uint32_t index) const;

    const std::string& label_of(const FieldRecord& f) const;

    Field resolve_field(const FieldRecord& f,
                        const StringResolver* resolver,
                        const ReadOptions& opts = ReadOptions{}) const;

    Struct resolve_struct(std::uint32_t struct_index,
                          const StringResolver* resolver,
                          const ReadOptions& opts = ReadOptions{}) const;

    Gff to_tree(const StringResolver* resolver, const ReadOptions& opts = ReadOptions{}) const;
};

// ------------------------------
// Writer
// ------------------------------

// Stores structs and fields into a fresh image. Records are pushed before
// their children so a parent always has the lower index; labels get indices in
// first-seen order.
class TreeEncoder {
public:
    TreeEncoder() = default;

    /// Index of `label` in the label table, appending it on first sight.
    std::uint32_t register_label(const std::string& label);

    /// Returns the field's index in the field array.
    std::uint32_t store_field(const LabeledField& f);

    /// Returns the struct's index in the struct array.
    std::uint32_t store_struct(const Struct& s);

    const BinaryGff& image() const noexcept { return out_; }

    /// Fill in the header and hand the image over. The encoder is left empty.
    BinaryGff finish(const std::string& file_type, const std::string& file_version);

private:
    std::uint32_t store_cell(const FieldCellPtr& cell);
    std::uint32_t store_list(const List& l);

    BinaryGff out_{};
    std::unordered_map<std::string, std::uint32_t> label_index_{};
    std::unordered_set<const FieldCell*> open_cells_{};
};

} // namespace gffkit::bin
