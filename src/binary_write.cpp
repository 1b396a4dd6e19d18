#include "gffkit/binary.hpp"

#include "gffkit/text.hpp"

#include <cstring>
#include <limits>

namespace gffkit::bin {

// ------------------------------
// Small helpers
// ------------------------------

static void append_u32_le(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
}

static void append_u64_le(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<std::uint8_t>((v >> (8*i)) & 0xFFu));
}

static std::uint32_t checked_u32(std::uint64_t v, const char* what) {
    if (v > std::numeric_limits<std::uint32_t>::max()) {
        throw GffError(ErrorKind::Write, std::string(what) + " exceeds the 32-bit offset range");
    }
    return static_cast<std::uint32_t>(v);
}

// Short tags are padded with spaces, e.g. "IFO" -> "IFO ".
static std::string normalize_tag(const std::string& tag, const char* what) {
    std::string t = tag;
    if (t.size() < 4) t.append(4 - t.size(), ' ');
    if (!is_valid_tag(t)) {
        throw GffError(ErrorKind::InvalidEncoding,
                       std::string(what) + " '" + tag + "' must be at most 4 printable ASCII characters");
    }
    return t;
}

// Counts and offsets for the current contents, sections packed in order
// directly after the header.
static Header compute_layout(const BinaryGff& g) {
    Header h;
    h.file_type = g.header.file_type;
    h.file_version = g.header.file_version;

    h.structs.count = checked_u32(g.structs.size(), "struct count");
    h.fields.count = checked_u32(g.fields.size(), "field count");
    h.labels.count = checked_u32(g.labels.size(), "label count");
    h.field_data.count = checked_u32(g.field_data.size(), "field data");
    h.field_indices.count = checked_u32(static_cast<std::uint64_t>(g.field_indices.size()) * kIndexSize, "field indices");
    h.list_indices.count = checked_u32(static_cast<std::uint64_t>(g.list_indices.size()) * kIndexSize, "list indices");

    std::uint64_t at = kHeaderSize;
    h.structs.offset = checked_u32(at, "struct offset");
    at += static_cast<std::uint64_t>(h.structs.count) * kStructSize;
    h.fields.offset = checked_u32(at, "field offset");
    at += static_cast<std::uint64_t>(h.fields.count) * kFieldSize;
    h.labels.offset = checked_u32(at, "label offset");
    at += static_cast<std::uint64_t>(h.labels.count) * kLabelSize;
    h.field_data.offset = checked_u32(at, "field data offset");
    at += h.field_data.count;
    h.field_indices.offset = checked_u32(at, "field indices offset");
    at += h.field_indices.count;
    h.list_indices.offset = checked_u32(at, "list indices offset");
    return h;
}

static std::uint32_t float_bits(float f) {
    std::uint32_t u = 0;
    std::memcpy(&u, &f, sizeof(u));
    return u;
}

// ------------------------------
// TreeEncoder
// ------------------------------

std::uint32_t TreeEncoder::register_label(const std::string& label) {
    const LabelBytes raw = encode_label(label);
    std::string key(raw.begin(), raw.end());

    auto it = label_index_.find(key);
    if (it != label_index_.end()) return it->second;

    const auto index = checked_u32(out_.labels.size(), "label count");
    out_.labels.push_back(decode_label(raw));
    label_index_.emplace(std::move(key), index);
    return index;
}

std::uint32_t TreeEncoder::store_struct(const Struct& s) {
    const auto index = checked_u32(out_.structs.size(), "struct count");
    const auto n = checked_u32(s.fields.size(), "struct field count");

    StructRecord rec;
    rec.type_id = s.id;
    rec.field_count = n;
    out_.structs.push_back(rec);

    StructData data;
    if (n == 0) {
        data = Literal{s.origin.empty_struct_offset()};
    } else if (n == 1) {
        data = FieldIndex{store_cell(s.fields[0])};
    } else {
        const std::size_t block = out_.field_indices.size();
        out_.field_indices.resize(block + n, 0);
        for (std::uint32_t i = 0; i < n; ++i) {
            const std::uint32_t field_index = store_cell(s.fields[i]);
            out_.field_indices[block + i] = field_index;
        }
        data = IndicesBlock{checked_u32(static_cast<std::uint64_t>(block) * kIndexSize, "field indices")};
    }

    out_.structs[index].data = data;
    return index;
}

std::uint32_t TreeEncoder::store_cell(const FieldCellPtr& cell) {
    if (!cell) throw GffError(ErrorKind::InvalidStructure, "struct holds a null field cell");
    if (!open_cells_.insert(cell.get()).second) {
        throw GffError(ErrorKind::InvalidStructure, "field '" + cell->label() + "' contains itself");
    }
    std::uint32_t index = 0;
    try {
        index = cell->read([this](const LabeledField& lf) { return store_field(lf); });
    } catch (...) {
        open_cells_.erase(cell.get());
        throw;
    }
    open_cells_.erase(cell.get());
    return index;
}

std::uint32_t TreeEncoder::store_list(const List& l) {
    const std::size_t block = out_.list_indices.size();
    out_.list_indices.push_back(checked_u32(l.size(), "list length"));
    out_.list_indices.resize(block + 1 + l.size(), 0);
    for (std::size_t i = 0; i < l.size(); ++i) {
        const std::uint32_t struct_index = store_struct(l[i]);
        out_.list_indices[block + 1 + i] = struct_index;
    }
    return checked_u32(static_cast<std::uint64_t>(block) * kIndexSize, "list indices");
}

std::uint32_t TreeEncoder::store_field(const LabeledField& lf) {
    const std::uint32_t label_index = register_label(lf.label);
    const auto index = checked_u32(out_.fields.size(), "field count");

    FieldRecord rec;
    rec.type = lf.field.type();
    rec.label_index = label_index;
    out_.fields.push_back(rec);

    std::vector<std::uint8_t>& heap = out_.field_data;
    const auto heap_at = [&heap]() { return HeapOffset{checked_u32(heap.size(), "field data")}; };

    const Field& f = lf.field;
    FieldData data;
    switch (f.type()) {
        case FieldType::Byte: data = InlineBits{f.expect_byte()}; break;
        case FieldType::Char: data = InlineBits{f.expect_char()}; break;
        case FieldType::Word: data = InlineBits{f.expect_word()}; break;
        case FieldType::Short:
            data = InlineBits{static_cast<std::uint32_t>(static_cast<std::int32_t>(f.expect_short()))};
            break;
        case FieldType::DWord: data = InlineBits{f.expect_dword()}; break;
        case FieldType::Int: data = InlineBits{static_cast<std::uint32_t>(f.expect_int())}; break;
        case FieldType::Float: data = InlineBits{float_bits(f.expect_float())}; break;
        case FieldType::DWord64:
            data = heap_at();
            append_u64_le(heap, f.expect_dword64());
            break;
        case FieldType::Int64:
            data = heap_at();
            append_u64_le(heap, static_cast<std::uint64_t>(f.expect_int64()));
            break;
        case FieldType::Double: {
            const double d = f.expect_double();
            std::uint64_t bits = 0;
            std::memcpy(&bits, &d, sizeof(bits));
            data = heap_at();
            append_u64_le(heap, bits);
            break;
        }
        case FieldType::ExoString: {
            const std::vector<std::uint8_t> bytes = encode_cp1252(f.expect_exo_string());
            data = heap_at();
            append_u32_le(heap, checked_u32(bytes.size(), "ExoString length"));
            heap.insert(heap.end(), bytes.begin(), bytes.end());
            break;
        }
        case FieldType::ResRef: {
            std::vector<std::uint8_t> bytes = encode_cp1252(f.expect_res_ref());
            if (bytes.size() > ResRef::kMaxLength) bytes.resize(ResRef::kMaxLength);
            data = heap_at();
            heap.push_back(static_cast<std::uint8_t>(bytes.size()));
            heap.insert(heap.end(), bytes.begin(), bytes.end());
            break;
        }
        case FieldType::ExoLocString: {
            const ExoLocString& s = f.expect_exo_loc_string();
            std::vector<std::vector<std::uint8_t>> texts;
            texts.reserve(s.substrings.size());
            std::uint64_t total = 8;
            for (const auto& sub : s.substrings) {
                texts.push_back(encode_cp1252(sub.text));
                total += 8 + texts.back().size();
            }
            data = heap_at();
            append_u32_le(heap, checked_u32(total, "ExoLocString size"));
            append_u32_le(heap, s.string_ref);
            append_u32_le(heap, checked_u32(s.substrings.size(), "ExoLocString substring count"));
            for (std::size_t i = 0; i < texts.size(); ++i) {
                append_u32_le(heap, s.substrings[i].string_id());
                append_u32_le(heap, static_cast<std::uint32_t>(texts[i].size()));
                heap.insert(heap.end(), texts[i].begin(), texts[i].end());
            }
            break;
        }
        case FieldType::Void: {
            const auto& bytes = f.expect_void();
            data = heap_at();
            append_u32_le(heap, checked_u32(bytes.size(), "Void length"));
            heap.insert(heap.end(), bytes.begin(), bytes.end());
            break;
        }
        case FieldType::Struct: data = StructIndex{store_struct(f.expect_struct())}; break;
        case FieldType::List: data = ListBlock{store_list(f.expect_list())}; break;
    }

    out_.fields[index].data = data;
    return index;
}

BinaryGff TreeEncoder::finish(const std::string& file_type, const std::string& file_version) {
    out_.header.file_type = normalize_tag(file_type, "file type");
    out_.header.file_version = normalize_tag(file_version, "file version");
    out_.header = compute_layout(out_);

    BinaryGff done = std::move(out_);
    out_ = BinaryGff{};
    label_index_.clear();
    open_cells_.clear();
    return done;
}

// ------------------------------
// BinaryGff (write side)
// ------------------------------

BinaryGff BinaryGff::from_tree(const Gff& doc, const WriteOptions& opts) {
    TreeEncoder enc;
    enc.store_struct(doc.root);
    return enc.finish(opts.file_type.empty() ? doc.file_type : opts.file_type,
                      opts.file_version.empty() ? doc.file_version : opts.file_version);
}

std::vector<std::uint8_t> BinaryGff::serialize() const {
    const Header h = compute_layout(*this);
    const std::string file_type = normalize_tag(h.file_type, "file type");
    const std::string file_version = normalize_tag(h.file_version, "file version");

    std::vector<std::uint8_t> out;
    out.reserve(static_cast<std::size_t>(h.list_indices.offset) + h.list_indices.count);

    out.insert(out.end(), file_type.begin(), file_type.end());
    out.insert(out.end(), file_version.begin(), file_version.end());
    for (const Section* s : {&h.structs, &h.fields, &h.labels, &h.field_data, &h.field_indices, &h.list_indices}) {
        append_u32_le(out, s->offset);
        append_u32_le(out, s->count);
    }

    for (const auto& s : structs) {
        append_u32_le(out, s.type_id);
        append_u32_le(out, raw_value(s.data));
        append_u32_le(out, s.field_count);
    }
    for (const auto& f : fields) {
        append_u32_le(out, static_cast<std::uint32_t>(f.type));
        append_u32_le(out, f.label_index);
        append_u32_le(out, raw_value(f.data));
    }
    for (const auto& l : labels) {
        const LabelBytes raw = encode_label(l);
        out.insert(out.end(), raw.begin(), raw.end());
    }
    out.insert(out.end(), field_data.begin(), field_data.end());
    for (std::uint32_t v : field_indices) append_u32_le(out, v);
    for (std::uint32_t v : list_indices) append_u32_le(out, v);
    return out;
}

} // namespace gffkit::bin
