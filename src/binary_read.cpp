#include "gffkit/binary.hpp"

#include "gffkit/string_resolver.hpp"
#include "gffkit/text.hpp"

#include <algorithm>
#include <cstring>

namespace gffkit::bin {

bool operator==(const Section& a, const Section& b) { return a.offset == b.offset && a.count == b.count; }

bool operator==(const Header& a, const Header& b) {
    return a.file_type == b.file_type && a.file_version == b.file_version &&
           a.structs == b.structs && a.fields == b.fields && a.labels == b.labels &&
           a.field_data == b.field_data && a.field_indices == b.field_indices &&
           a.list_indices == b.list_indices;
}

bool operator==(const Literal& a, const Literal& b) { return a.value == b.value; }
bool operator==(const FieldIndex& a, const FieldIndex& b) { return a.index == b.index; }
bool operator==(const IndicesBlock& a, const IndicesBlock& b) { return a.byte_offset == b.byte_offset; }
bool operator==(const InlineBits& a, const InlineBits& b) { return a.bits == b.bits; }
bool operator==(const HeapOffset& a, const HeapOffset& b) { return a.offset == b.offset; }
bool operator==(const StructIndex& a, const StructIndex& b) { return a.index == b.index; }
bool operator==(const ListBlock& a, const ListBlock& b) { return a.byte_offset == b.byte_offset; }

std::uint32_t raw_value(const StructData& d) noexcept {
    if (const auto* p = std::get_if<Literal>(&d)) return p->value;
    if (const auto* p = std::get_if<FieldIndex>(&d)) return p->index;
    if (const auto* p = std::get_if<IndicesBlock>(&d)) return p->byte_offset;
    return 0;
}

std::uint32_t raw_value(const FieldData& d) noexcept {
    if (const auto* p = std::get_if<InlineBits>(&d)) return p->bits;
    if (const auto* p = std::get_if<HeapOffset>(&d)) return p->offset;
    if (const auto* p = std::get_if<StructIndex>(&d)) return p->index;
    if (const auto* p = std::get_if<ListBlock>(&d)) return p->byte_offset;
    return 0;
}

bool operator==(const StructRecord& a, const StructRecord& b) {
    return a.type_id == b.type_id && a.data == b.data && a.field_count == b.field_count;
}

bool operator!=(const StructRecord& a, const StructRecord& b) { return !(a == b); }

bool operator==(const FieldRecord& a, const FieldRecord& b) {
    return a.type == b.type && a.label_index == b.label_index && a.data == b.data;
}

bool operator!=(const FieldRecord& a, const FieldRecord& b) { return !(a == b); }

// ------------------------------
// Record decoding
// ------------------------------

StructRecord StructRecord::decode(std::uint32_t type_id, std::uint32_t data_or_offset, std::uint32_t field_count) {
    StructRecord r;
    r.type_id = type_id;
    r.field_count = field_count;
    if (field_count == 0) {
        r.data = Literal{data_or_offset};
    } else if (field_count == 1) {
        r.data = FieldIndex{data_or_offset};
    } else {
        if (data_or_offset % kIndexSize != 0) {
            throw GffError(ErrorKind::Alignment,
                           "struct field_indices offset " + std::to_string(data_or_offset) +
                           " is not a multiple of " + std::to_string(kIndexSize));
        }
        r.data = IndicesBlock{data_or_offset};
    }
    return r;
}

FieldRecord FieldRecord::decode(std::uint32_t tag, std::uint32_t label_index, std::uint32_t data_or_offset) {
    const std::optional<FieldType> type = field_type_from_tag(tag);
    if (!type) throw GffError(ErrorKind::InvalidFieldType, "invalid field type tag " + std::to_string(tag));

    FieldRecord r;
    r.type = *type;
    r.label_index = label_index;
    if (!is_complex(*type)) {
        r.data = InlineBits{data_or_offset};
    } else if (*type == FieldType::Struct) {
        r.data = StructIndex{data_or_offset};
    } else if (*type == FieldType::List) {
        if (data_or_offset % kIndexSize != 0) {
            throw GffError(ErrorKind::Alignment,
                           "list_indices offset " + std::to_string(data_or_offset) +
                           " is not a multiple of " + std::to_string(kIndexSize));
        }
        r.data = ListBlock{data_or_offset};
    } else {
        r.data = HeapOffset{data_or_offset};
    }
    return r;
}

// ------------------------------
// Bounded cursor
// ------------------------------

namespace {

class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t len, const char* what)
        : data_(data), len_(len), what_(what) {}

    void seek(std::uint64_t pos) {
        if (pos > len_) {
            throw GffError(ErrorKind::Truncated,
                           std::string(what_) + " offset " + std::to_string(pos) +
                           " is past its end (" + std::to_string(len_) + " bytes)");
        }
        pos_ = static_cast<std::size_t>(pos);
    }

    const std::uint8_t* take(std::uint64_t n) {
        if (n > len_ - pos_) {
            throw GffError(ErrorKind::Truncated,
                           "unexpected end of " + std::string(what_) + " reading " + std::to_string(n) +
                           " bytes at offset " + std::to_string(pos_));
        }
        const std::uint8_t* p = data_ + pos_;
        pos_ += static_cast<std::size_t>(n);
        return p;
    }

    std::uint8_t u8() { return *take(1); }

    std::uint32_t u32() {
        const std::uint8_t* p = take(4);
        return (static_cast<std::uint32_t>(p[0])      ) |
               (static_cast<std::uint32_t>(p[1]) <<  8) |
               (static_cast<std::uint32_t>(p[2]) << 16) |
               (static_cast<std::uint32_t>(p[3]) << 24);
    }

    std::uint64_t u64() {
        const std::uint8_t* p = take(8);
        std::uint64_t u = 0;
        for (int i = 0; i < 8; ++i) u |= (static_cast<std::uint64_t>(p[i]) << (8*i));
        return u;
    }

    std::string tag() {
        const std::uint8_t* p = take(4);
        return std::string(reinterpret_cast<const char*>(p), 4);
    }

private:
    const std::uint8_t* data_;
    std::size_t len_;
    std::size_t pos_{0};
    const char* what_;
};

// Positions `r` at the start of a section and checks it lies inside the file.
void enter_section(ByteReader& r, const Section& s, std::uint64_t byte_len, const char* name, std::size_t file_len) {
    const std::uint64_t end = static_cast<std::uint64_t>(s.offset) + byte_len;
    if (end > file_len) {
        throw GffError(ErrorKind::Truncated,
                       std::string(name) + " section [" + std::to_string(s.offset) + ", " + std::to_string(end) +
                       ") exceeds file size " + std::to_string(file_len));
    }
    r.seek(s.offset);
}

std::vector<std::uint32_t> read_index_array(ByteReader& r, const Section& s, const char* name, std::size_t file_len) {
    enter_section(r, s, s.count, name, file_len);
    std::vector<std::uint32_t> out(s.count / kIndexSize);
    for (auto& v : out) v = r.u32();
    return out;
}

// Resolves structs and fields of one image into a tree.
class TreeDecoder {
public:
    TreeDecoder(const BinaryGff& image, const StringResolver* resolver, const ReadOptions& opts)
        : image_(image), resolver_(resolver), opts_(opts),
          open_(image.structs.size(), false), visited_(image.structs.size(), false) {}

    Struct decode_struct(std::uint32_t index) {
        if (index >= image_.structs.size()) {
            throw GffError(ErrorKind::OutOfRange,
                           "struct index " + std::to_string(index) + " out of range (" +
                           std::to_string(image_.structs.size()) + " structs)");
        }
        if (open_[index]) {
            throw GffError(ErrorKind::InvalidStructure, "struct " + std::to_string(index) + " contains itself");
        }
        // struct graphs are trees: each struct has exactly one parent
        if (visited_[index]) {
            throw GffError(ErrorKind::InvalidStructure, "struct " + std::to_string(index) + " is referenced twice");
        }
        open_[index] = true;
        visited_[index] = true;

        const StructRecord& rec = image_.structs[index];
        Struct out(rec.type_id, StructOrigin::from_file(raw_value(rec.data)));
        out.fields.reserve(rec.field_count);
        for (std::uint32_t i = 0; i < rec.field_count; ++i) {
            const FieldRecord* f = image_.get_field(rec, i);
            if (!f) break;
            out.add_field(image_.label_of(*f), decode_field(*f));
        }

        open_[index] = false;
        return out;
    }

    Field decode_field(const FieldRecord& f) {
        const std::uint32_t word = raw_value(f.data);
        switch (f.type) {
            case FieldType::Byte: return Field::make_byte(static_cast<std::uint8_t>(word & 0xFFu));
            case FieldType::Char: return Field::make_char(word);
            case FieldType::Word: return Field::make_word(static_cast<std::uint16_t>(word & 0xFFFFu));
            case FieldType::Short:
                return Field::make_short(static_cast<std::int16_t>(static_cast<std::uint16_t>(word & 0xFFFFu)));
            case FieldType::DWord: return Field::make_dword(word);
            case FieldType::Int: return Field::make_int(static_cast<std::int32_t>(word));
            case FieldType::Float: {
                float v = 0.0f;
                std::memcpy(&v, &word, sizeof(v));
                return Field::make_float(v);
            }
            case FieldType::Struct: return Field::make_struct(decode_struct(word));
            case FieldType::List: return Field::make_list(decode_list(word));
            default: break;
        }

        ByteReader heap(image_.field_data.data(), image_.field_data.size(), "field data");
        heap.seek(word);
        switch (f.type) {
            case FieldType::DWord64: return Field::make_dword64(heap.u64());
            case FieldType::Int64: return Field::make_int64(static_cast<std::int64_t>(heap.u64()));
            case FieldType::Double: {
                const std::uint64_t bits = heap.u64();
                double v = 0.0;
                std::memcpy(&v, &bits, sizeof(v));
                return Field::make_double(v);
            }
            case FieldType::ExoString: {
                const std::uint32_t len = heap.u32();
                return Field::make_exo_string(decode_cp1252(heap.take(len), len));
            }
            case FieldType::ResRef: {
                const std::size_t len = std::min<std::size_t>(heap.u8(), ResRef::kMaxLength);
                return Field::make_res_ref(decode_cp1252(heap.take(len), len));
            }
            case FieldType::ExoLocString: return Field::make_exo_loc_string(decode_loc_string(heap));
            case FieldType::Void: {
                const std::uint32_t len = heap.u32();
                const std::uint8_t* p = heap.take(len);
                return Field::make_void(std::vector<std::uint8_t>(p, p + len));
            }
            default: break;
        }
        throw GffError(ErrorKind::InvalidFieldType, "unhandled field type " + to_string(f.type));
    }

private:
    List decode_list(std::uint32_t byte_offset) {
        const std::size_t pos = byte_offset / kIndexSize;
        const auto& idx = image_.list_indices;
        if (pos >= idx.size()) {
            throw GffError(ErrorKind::OutOfRange,
                           "list offset " + std::to_string(byte_offset) + " is past list_indices");
        }
        const std::uint32_t count = idx[pos];
        if (count > idx.size() - pos - 1) {
            throw GffError(ErrorKind::OutOfRange,
                           "list at offset " + std::to_string(byte_offset) + " declares " +
                           std::to_string(count) + " entries past the end of list_indices");
        }
        List out;
        out.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            out.push_back(decode_struct(idx[pos + 1 + i]));
        }
        return out;
    }

    ExoLocString decode_loc_string(ByteReader& heap) {
        ExoLocString s;
        heap.u32(); // total size, implied by the substrings
        s.string_ref = heap.u32();
        const std::uint32_t count = heap.u32();
        for (std::uint32_t i = 0; i < count; ++i) {
            const std::uint32_t id = heap.u32();
            const std::uint32_t len = heap.u32();
            s.substrings.push_back(LocSubstring::from_string_id(id, decode_cp1252(heap.take(len), len)));
        }
        if (s.has_string_ref() && opts_.resolve_strings && resolver_) {
            s.resolved = resolver_->resolve(s.string_ref);
        }
        return s;
    }

    const BinaryGff& image_;
    const StringResolver* resolver_;
    const ReadOptions& opts_;
    std::vector<bool> open_;
    std::vector<bool> visited_;
};

} // namespace

// ------------------------------
// BinaryGff (read side)
// ------------------------------

BinaryGff BinaryGff::read(const std::uint8_t* data, std::size_t len) {
    if (len < kHeaderSize) {
        throw GffError(ErrorKind::Truncated,
                       "file is " + std::to_string(len) + " bytes, shorter than the " +
                       std::to_string(kHeaderSize) + "-byte header");
    }
    ByteReader r(data, len, "file");

    BinaryGff g;
    Header& h = g.header;
    h.file_type = r.tag();
    h.file_version = r.tag();
    if (!is_valid_tag(h.file_type)) throw GffError(ErrorKind::InvalidEncoding, "file type is not printable ASCII");
    if (!is_valid_tag(h.file_version)) throw GffError(ErrorKind::InvalidEncoding, "file version is not printable ASCII");

    for (Section* s : {&h.structs, &h.fields, &h.labels, &h.field_data, &h.field_indices, &h.list_indices}) {
        s->offset = r.u32();
        s->count = r.u32();
    }

    enter_section(r, h.structs, static_cast<std::uint64_t>(h.structs.count) * kStructSize, "struct", len);
    g.structs.reserve(h.structs.count);
    for (std::uint32_t i = 0; i < h.structs.count; ++i) {
        const std::uint32_t type_id = r.u32();
        const std::uint32_t data_or_offset = r.u32();
        const std::uint32_t field_count = r.u32();
        g.structs.push_back(StructRecord::decode(type_id, data_or_offset, field_count));
    }

    enter_section(r, h.fields, static_cast<std::uint64_t>(h.fields.count) * kFieldSize, "field", len);
    g.fields.reserve(h.fields.count);
    for (std::uint32_t i = 0; i < h.fields.count; ++i) {
        const std::uint32_t tag = r.u32();
        const std::uint32_t label_index = r.u32();
        const std::uint32_t data_or_offset = r.u32();
        g.fields.push_back(FieldRecord::decode(tag, label_index, data_or_offset));
    }

    enter_section(r, h.labels, static_cast<std::uint64_t>(h.labels.count) * kLabelSize, "label", len);
    g.labels.reserve(h.labels.count);
    for (std::uint32_t i = 0; i < h.labels.count; ++i) {
        LabelBytes raw{};
        std::memcpy(raw.data(), r.take(kLabelSize), kLabelSize);
        g.labels.push_back(decode_label(raw));
    }

    enter_section(r, h.field_data, h.field_data.count, "field data", len);
    const std::uint8_t* heap = r.take(h.field_data.count);
    g.field_data.assign(heap, heap + h.field_data.count);

    g.field_indices = read_index_array(r, h.field_indices, "field indices", len);
    g.list_indices = read_index_array(r, h.list_indices, "list indices", len);
    return g;
}

BinaryGff BinaryGff::read(const std::vector<std::uint8_t>& bytes) {
    return read(bytes.data(), bytes.size());
}

const FieldRecord* BinaryGff::get_field(const StructRecord& s, std::uint32_t index) const {
    if (index >= s.field_count) return nullptr;

    std::uint32_t field_index = 0;
    if (const auto* one = std::get_if<FieldIndex>(&s.data)) {
        if (index != 0) return nullptr;
        field_index = one->index;
    } else if (const auto* block = std::get_if<IndicesBlock>(&s.data)) {
        const std::size_t pos = static_cast<std::size_t>(block->byte_offset / kIndexSize) + index;
        if (pos >= field_indices.size()) {
            throw GffError(ErrorKind::OutOfRange,
                           "field_indices entry " + std::to_string(pos) + " out of range (" +
                           std::to_string(field_indices.size()) + " entries)");
        }
        field_index = field_indices[pos];
    } else {
        return nullptr;
    }

    if (field_index >= fields.size()) {
        throw GffError(ErrorKind::OutOfRange,
                       "field index " + std::to_string(field_index) + " out of range (" +
                       std::to_string(fields.size()) + " fields)");
    }
    return &fields[field_index];
}

const std::string& BinaryGff::label_of(const FieldRecord& f) const {
    if (f.label_index >= labels.size()) {
        throw GffError(ErrorKind::OutOfRange,
                       "label index " + std::to_string(f.label_index) + " out of range (" +
                       std::to_string(labels.size()) + " labels)");
    }
    return labels[f.label_index];
}

Field BinaryGff::resolve_field(const FieldRecord& f, const StringResolver* resolver, const ReadOptions& opts) const {
    TreeDecoder dec(*this, resolver, opts);
    return dec.decode_field(f);
}

Struct BinaryGff::resolve_struct(std::uint32_t struct_index, const StringResolver* resolver, const ReadOptions& opts) const {
    TreeDecoder dec(*this, resolver, opts);
    return dec.decode_struct(struct_index);
}

Gff BinaryGff::to_tree(const StringResolver* resolver, const ReadOptions& opts) const {
    if (opts.require_v32 && header.file_version != "V3.2") {
        throw GffError(ErrorKind::InvalidStructure, "unsupported GFF version '" + header.file_version + "'");
    }
    if (structs.empty()) throw GffError(ErrorKind::InvalidStructure, "file has no root struct");

    Gff doc;
    doc.file_type = header.file_type;
    doc.file_version = header.file_version;
    doc.root = resolve_struct(0, resolver, opts);
    return doc;
}

} // namespace gffkit::bin
