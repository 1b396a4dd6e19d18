#include "gffkit/gff.hpp"

#include "gffkit/binary.hpp"
#include "gffkit/string_resolver.hpp"
#include "gffkit/text.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <mutex>
#include <sstream>
#include <type_traits>

#include <zlib.h>

namespace gffkit {

GffError::GffError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind GffError::kind() const noexcept { return kind_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "Io";
        case ErrorKind::Truncated: return "Truncated";
        case ErrorKind::InvalidEncoding: return "InvalidEncoding";
        case ErrorKind::InvalidFieldType: return "InvalidFieldType";
        case ErrorKind::InvalidNumber: return "InvalidNumber";
        case ErrorKind::Alignment: return "Alignment";
        case ErrorKind::OutOfRange: return "OutOfRange";
        case ErrorKind::InvalidStructure: return "InvalidStructure";
        case ErrorKind::Lookup: return "Lookup";
        case ErrorKind::TypeMismatch: return "TypeMismatch";
        case ErrorKind::InvalidPath: return "InvalidPath";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Write: return "Write";
    }
    return "Unknown";
}

// ------------------------------
// Field kinds
// ------------------------------

static const char* const kFieldTypeNames[kFieldTypeCount] = {
    "Byte", "Char", "Word", "Short", "DWord", "Int", "DWord64", "Int64",
    "Float", "Double", "ExoString", "ResRef", "ExoLocString", "Void", "Struct", "List",
};

std::string to_string(FieldType t) {
    const auto i = static_cast<std::uint32_t>(t);
    if (i < kFieldTypeCount) return kFieldTypeNames[i];
    return "FieldType(" + std::to_string(i) + ")";
}

std::optional<FieldType> field_type_from_string(const std::string& s) {
    for (std::uint32_t i = 0; i < kFieldTypeCount; ++i) {
        if (s == kFieldTypeNames[i]) return static_cast<FieldType>(i);
    }
    return std::nullopt;
}

std::optional<FieldType> field_type_from_tag(std::uint32_t tag) noexcept {
    if (tag < kFieldTypeCount) return static_cast<FieldType>(tag);
    return std::nullopt;
}

bool is_complex(FieldType t) noexcept {
    switch (t) {
        case FieldType::Byte:
        case FieldType::Char:
        case FieldType::Word:
        case FieldType::Short:
        case FieldType::DWord:
        case FieldType::Int:
        case FieldType::Float:
            return false;
        default:
            return true;
    }
}

// ------------------------------
// Localized strings
// ------------------------------

std::string to_string(Language l) {
    switch (l) {
        case Language::English: return "English";
        case Language::French: return "French";
        case Language::German: return "German";
        case Language::Italian: return "Italian";
        case Language::Spanish: return "Spanish";
        case Language::Polish: return "Polish";
        case Language::Korean: return "Korean";
        case Language::ChineseTraditional: return "ChineseTraditional";
        case Language::ChineseSimplified: return "ChineseSimplified";
        case Language::Japanese: return "Japanese";
    }
    return "Language(" + std::to_string(static_cast<std::uint32_t>(l)) + ")";
}

std::string to_string(Gender g) {
    switch (g) {
        case Gender::Masculine: return "Masculine";
        case Gender::Feminine: return "Feminine";
    }
    return "Gender(" + std::to_string(static_cast<std::uint32_t>(g)) + ")";
}

std::uint32_t LocSubstring::string_id() const noexcept {
    return static_cast<std::uint32_t>(language) * 2u + static_cast<std::uint32_t>(gender);
}

LocSubstring LocSubstring::from_string_id(std::uint32_t id, std::string text) {
    LocSubstring s;
    s.language = static_cast<Language>(id / 2u);
    s.gender = static_cast<Gender>(id % 2u);
    s.text = std::move(text);
    return s;
}

bool operator==(const LocSubstring& a, const LocSubstring& b) {
    return a.language == b.language && a.gender == b.gender && a.text == b.text;
}

bool operator!=(const LocSubstring& a, const LocSubstring& b) { return !(a == b); }

std::string ExoLocString::text(Language language, Gender gender) const {
    for (const auto& s : substrings) {
        if (s.language == language && s.gender == gender) return s.text;
    }
    return resolved.value_or(std::string());
}

bool operator==(const ExoLocString& a, const ExoLocString& b) {
    return a.string_ref == b.string_ref && a.substrings == b.substrings;
}

bool operator!=(const ExoLocString& a, const ExoLocString& b) { return !(a == b); }

bool operator==(const CharCode& a, const CharCode& b) { return a.code == b.code; }
bool operator==(const ExoString& a, const ExoString& b) { return a.value == b.value; }
bool operator==(const ResRef& a, const ResRef& b) { return a.value == b.value; }
bool operator==(const Void& a, const Void& b) { return a.data == b.data; }

// ------------------------------
// Struct
// ------------------------------

StructOrigin StructOrigin::from_file(std::uint32_t data_or_offset) {
    StructOrigin o;
    o.original_data_or_offset = data_or_offset;
    return o;
}

StructOrigin StructOrigin::synthesized() { return StructOrigin{}; }

Struct::Struct(std::uint32_t id, StructOrigin origin)
    : id(id), origin(origin) {}

FieldCellPtr Struct::find(const std::string& label) const {
    for (const auto& cell : fields) {
        if (cell->has_label(label)) return cell;
    }
    return nullptr;
}

namespace {

struct PathSegment {
    std::string label;
    std::vector<std::size_t> indices;
};

std::vector<PathSegment> parse_path(const std::string& path) {
    std::vector<PathSegment> out;
    std::size_t i = 0;
    const auto bad = [&](const std::string& why) {
        return GffError(ErrorKind::InvalidPath, "bad path '" + path + "': " + why);
    };
    while (true) {
        PathSegment seg;
        while (i < path.size() && path[i] != '.' && path[i] != '[') {
            seg.label.push_back(path[i++]);
        }
        if (seg.label.empty()) throw bad("empty label at offset " + std::to_string(i));
        while (i < path.size() && path[i] == '[') {
            const std::size_t close = path.find(']', i);
            if (close == std::string::npos) throw bad("missing ']'");
            const std::string digits = path.substr(i + 1, close - i - 1);
            if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                               [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
                throw bad("list index '" + digits + "' is not a number");
            }
            try {
                seg.indices.push_back(static_cast<std::size_t>(std::stoull(digits)));
            } catch (const std::out_of_range&) {
                throw bad("list index '" + digits + "' is too large");
            }
            i = close + 1;
        }
        out.push_back(std::move(seg));
        if (i == path.size()) break;
        if (path[i] != '.') throw bad("unexpected '" + std::string(1, path[i]) + "'");
        ++i;
    }
    if (!out.back().indices.empty()) throw bad("path must end at a field, not a list element");
    return out;
}

} // namespace

FieldCellPtr Struct::find_path(const std::string& path) const {
    const std::vector<PathSegment> segs = parse_path(path);

    Struct current = *this;
    for (std::size_t s = 0; s < segs.size(); ++s) {
        FieldCellPtr cell = current.find(segs[s].label);
        if (!cell) return nullptr;
        if (s + 1 == segs.size()) return cell;

        // Step into the container for the next segment.
        std::optional<Struct> next = cell->read([&](const LabeledField& lf) -> std::optional<Struct> {
            const Field& f = lf.field;
            if (segs[s].indices.empty()) {
                if (f.type() != FieldType::Struct) return std::nullopt;
                return f.expect_struct();
            }
            // a[1][2] would need a list of lists, which GFF cannot express
            if (f.type() != FieldType::List || segs[s].indices.size() != 1) return std::nullopt;
            const List& list = f.expect_list();
            const std::size_t idx = segs[s].indices.front();
            if (idx >= list.size()) return std::nullopt;
            return list[idx];
        });
        if (!next) return nullptr;
        current = std::move(*next);
    }
    return nullptr;
}

FieldCellPtr Struct::add_field(std::string label, Field field) {
    FieldCellPtr cell = FieldCell::make(std::move(label), std::move(field));
    fields.push_back(cell);
    return cell;
}

bool Struct::remove_field(const std::string& label) {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const FieldCellPtr& c) { return c->has_label(label); });
    if (it == fields.end()) return false;
    fields.erase(it);
    return true;
}

bool operator==(const Struct& a, const Struct& b) {
    if (a.id != b.id || a.fields.size() != b.fields.size()) return false;
    for (std::size_t i = 0; i < a.fields.size(); ++i) {
        if (a.fields[i] == b.fields[i]) continue;
        if (a.fields[i]->snapshot() != b.fields[i]->snapshot()) return false;
    }
    return true;
}

bool operator!=(const Struct& a, const Struct& b) { return !(a == b); }

// ------------------------------
// Field
// ------------------------------

Field Field::make_byte(std::uint8_t x) { return Field{x}; }
Field Field::make_char(std::uint32_t code) { return Field{CharCode{code}}; }
Field Field::make_word(std::uint16_t x) { return Field{x}; }
Field Field::make_short(std::int16_t x) { return Field{x}; }
Field Field::make_dword(std::uint32_t x) { return Field{x}; }
Field Field::make_int(std::int32_t x) { return Field{x}; }
Field Field::make_dword64(std::uint64_t x) { return Field{x}; }
Field Field::make_int64(std::int64_t x) { return Field{x}; }
Field Field::make_float(float x) { return Field{x}; }
Field Field::make_double(double x) { return Field{x}; }
Field Field::make_exo_string(std::string s) { return Field{ExoString{std::move(s)}}; }
Field Field::make_res_ref(std::string s) { return Field{ResRef{std::move(s)}}; }
Field Field::make_exo_loc_string(ExoLocString s) { return Field{std::move(s)}; }
Field Field::make_void(std::vector<std::uint8_t> data) { return Field{Void{std::move(data)}}; }
Field Field::make_struct(Struct s) { return Field{std::move(s)}; }
Field Field::make_list(List l) { return Field{std::move(l)}; }

bool Field::is_container() const noexcept {
    return type() == FieldType::Struct || type() == FieldType::List;
}

template <typename T>
static const T& expect_alt(const Field& f, FieldType want) {
    if (const T* p = std::get_if<T>(&f.v)) return *p;
    throw GffError(ErrorKind::TypeMismatch,
                   "expected " + to_string(want) + ", field holds " + to_string(f.type()));
}

template <typename T>
static T& expect_alt(Field& f, FieldType want) {
    if (T* p = std::get_if<T>(&f.v)) return *p;
    throw GffError(ErrorKind::TypeMismatch,
                   "expected " + to_string(want) + ", field holds " + to_string(f.type()));
}

std::uint8_t Field::expect_byte() const { return expect_alt<std::uint8_t>(*this, FieldType::Byte); }
std::uint32_t Field::expect_char() const { return expect_alt<CharCode>(*this, FieldType::Char).code; }
std::uint16_t Field::expect_word() const { return expect_alt<std::uint16_t>(*this, FieldType::Word); }
std::int16_t Field::expect_short() const { return expect_alt<std::int16_t>(*this, FieldType::Short); }
std::uint32_t Field::expect_dword() const { return expect_alt<std::uint32_t>(*this, FieldType::DWord); }
std::int32_t Field::expect_int() const { return expect_alt<std::int32_t>(*this, FieldType::Int); }
std::uint64_t Field::expect_dword64() const { return expect_alt<std::uint64_t>(*this, FieldType::DWord64); }
std::int64_t Field::expect_int64() const { return expect_alt<std::int64_t>(*this, FieldType::Int64); }
float Field::expect_float() const { return expect_alt<float>(*this, FieldType::Float); }
double Field::expect_double() const { return expect_alt<double>(*this, FieldType::Double); }

const std::string& Field::expect_exo_string() const {
    return expect_alt<ExoString>(*this, FieldType::ExoString).value;
}

const std::string& Field::expect_res_ref() const {
    return expect_alt<ResRef>(*this, FieldType::ResRef).value;
}

const ExoLocString& Field::expect_exo_loc_string() const {
    return expect_alt<ExoLocString>(*this, FieldType::ExoLocString);
}

const std::vector<std::uint8_t>& Field::expect_void() const {
    return expect_alt<Void>(*this, FieldType::Void).data;
}

const Struct& Field::expect_struct() const { return expect_alt<Struct>(*this, FieldType::Struct); }
const List& Field::expect_list() const { return expect_alt<List>(*this, FieldType::List); }

ExoLocString& Field::expect_exo_loc_string() {
    return expect_alt<ExoLocString>(*this, FieldType::ExoLocString);
}

Struct& Field::expect_struct() { return expect_alt<Struct>(*this, FieldType::Struct); }
List& Field::expect_list() { return expect_alt<List>(*this, FieldType::List); }

static std::uint32_t float_bits(float f) {
    std::uint32_t u = 0;
    std::memcpy(&u, &f, sizeof(u));
    return u;
}

static std::uint64_t double_bits(double d) {
    std::uint64_t u = 0;
    std::memcpy(&u, &d, sizeof(u));
    return u;
}

bool operator==(const Field& a, const Field& b) {
    if (a.v.index() != b.v.index()) return false;
    return std::visit([&](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        const T& y = std::get<T>(b.v);
        if constexpr (std::is_same_v<T, float>) {
            return float_bits(x) == float_bits(y);
        } else if constexpr (std::is_same_v<T, double>) {
            return double_bits(x) == double_bits(y);
        } else {
            return x == y;
        }
    }, a.v);
}

bool operator!=(const Field& a, const Field& b) { return !(a == b); }

bool operator==(const LabeledField& a, const LabeledField& b) {
    return a.label == b.label && a.field == b.field;
}

bool operator!=(const LabeledField& a, const LabeledField& b) { return !(a == b); }

// ------------------------------
// FieldCell
// ------------------------------

FieldCell::FieldCell(LabeledField value) : value_(std::move(value)) {}

FieldCellPtr FieldCell::make(std::string label, Field field) {
    return std::make_shared<FieldCell>(LabeledField{std::move(label), std::move(field)});
}

LabeledField FieldCell::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return value_;
}

std::string FieldCell::label() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return value_.label;
}

Field FieldCell::get() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return value_.field;
}

FieldType FieldCell::type() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return value_.field.type();
}

bool FieldCell::has_label(const std::string& label) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return value_.label == label;
}

void FieldCell::set(Field field) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    value_.field = std::move(field);
}

// ------------------------------
// Traversal
// ------------------------------

FieldWalker::FieldWalker(const Struct& root, Traversal order)
    : roots_(root.fields), order_(order) {
    reset();
}

void FieldWalker::reset() {
    pending_.assign(roots_.begin(), roots_.end());
    seen_.clear();
}

void FieldWalker::push_children(const FieldCellPtr& cell) {
    std::vector<FieldCellPtr> children = cell->read([](const LabeledField& lf) {
        std::vector<FieldCellPtr> out;
        if (const Struct* s = std::get_if<Struct>(&lf.field.v)) {
            out = s->fields;
        } else if (const List* l = std::get_if<List>(&lf.field.v)) {
            for (const auto& elem : *l) {
                out.insert(out.end(), elem.fields.begin(), elem.fields.end());
            }
        }
        return out;
    });
    if (children.empty()) return;
    if (order_ == Traversal::BreadthFirst) {
        pending_.insert(pending_.end(), children.begin(), children.end());
    } else {
        pending_.insert(pending_.begin(), children.begin(), children.end());
    }
}

FieldCellPtr FieldWalker::next() {
    while (!pending_.empty()) {
        FieldCellPtr cell = std::move(pending_.front());
        pending_.pop_front();
        if (!seen_.insert(cell.get()).second) continue;
        push_children(cell);
        return cell;
    }
    return nullptr;
}

FieldCellPtr find_by_label(const Struct& root, const std::string& label, Traversal order) {
    FieldWalker walker(root, order);
    while (FieldCellPtr cell = walker.next()) {
        if (cell->has_label(label)) return cell;
    }
    return nullptr;
}

// ------------------------------
// Document
// ------------------------------

FieldCellPtr Gff::find_by_label(const std::string& label, Traversal order) const {
    return gffkit::find_by_label(root, label, order);
}

bool operator==(const Gff& a, const Gff& b) {
    return a.file_type == b.file_type && a.file_version == b.file_version && a.root == b.root;
}

bool operator!=(const Gff& a, const Gff& b) { return !(a == b); }

// ------------------------------
// API implementations
// ------------------------------

Gff read(const std::vector<std::uint8_t>& bytes, const StringResolver* resolver, const ReadOptions& opts) {
    const bin::BinaryGff image = bin::BinaryGff::read(bytes);
    return image.to_tree(resolver, opts);
}

Gff read_file(const std::filesystem::path& file, const StringResolver* resolver, const ReadOptions& opts) {
    std::ifstream is(file, std::ios::binary);
    if (!is) throw GffError(ErrorKind::Io, "failed to open file: " + file.string());
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    if (is.bad()) throw GffError(ErrorKind::Io, "failed reading file: " + file.string());
    return read(bytes, resolver, opts);
}

std::vector<std::uint8_t> write(const Gff& doc, const WriteOptions& opts) {
    return bin::BinaryGff::from_tree(doc, opts).serialize();
}

void write_file(const std::filesystem::path& file, const Gff& doc, const WriteOptions& opts) {
    const std::vector<std::uint8_t> bytes = write(doc, opts);

    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) throw GffError(ErrorKind::Io, "failed to open for write: " + file.string());
    os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) throw GffError(ErrorKind::Write, "failed writing GFF file: " + file.string());
}

// ------------------------------
// Display / edit helpers
// ------------------------------

static std::string quoted(const std::string& s) {
    std::ostringstream oss;
    oss << std::quoted(s);
    return oss.str();
}

static std::string hex_bytes(const std::vector<std::uint8_t>& data, std::size_t limit) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const std::size_t n = std::min(limit, data.size());
    for (std::size_t i = 0; i < n; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    if (data.size() > n) oss << "...";
    return oss.str();
}

std::string display_value(const Field& f) {
    std::ostringstream oss;
    switch (f.type()) {
        case FieldType::Byte: oss << static_cast<unsigned>(f.expect_byte()); break;
        case FieldType::Char: {
            const std::uint32_t c = f.expect_char();
            if (c >= 0x20 && c < 0x7F) oss << "'" << static_cast<char>(c) << "' ";
            oss << "(" << c << ")";
            break;
        }
        case FieldType::Word: oss << f.expect_word(); break;
        case FieldType::Short: oss << f.expect_short(); break;
        case FieldType::DWord: oss << f.expect_dword(); break;
        case FieldType::Int: oss << f.expect_int(); break;
        case FieldType::DWord64: oss << f.expect_dword64(); break;
        case FieldType::Int64: oss << f.expect_int64(); break;
        case FieldType::Float:
            oss << std::setprecision(std::numeric_limits<float>::max_digits10) << f.expect_float();
            break;
        case FieldType::Double:
            oss << std::setprecision(std::numeric_limits<double>::max_digits10) << f.expect_double();
            break;
        case FieldType::ExoString: oss << quoted(f.expect_exo_string()); break;
        case FieldType::ResRef: oss << f.expect_res_ref(); break;
        case FieldType::ExoLocString: {
            const ExoLocString& s = f.expect_exo_loc_string();
            if (s.has_string_ref()) {
                oss << "strref " << s.string_ref;
                if (s.resolved) oss << " " << quoted(*s.resolved);
            } else {
                oss << "no strref";
            }
            for (const auto& sub : s.substrings) {
                oss << ", " << to_string(sub.language) << "/" << to_string(sub.gender)
                    << " " << quoted(sub.text);
            }
            break;
        }
        case FieldType::Void: {
            const auto& d = f.expect_void();
            oss << d.size() << " bytes";
            if (!d.empty()) oss << " " << hex_bytes(d, 16);
            break;
        }
        case FieldType::Struct: {
            const Struct& s = f.expect_struct();
            oss << "struct " << s.id << ", " << s.field_count() << " fields";
            break;
        }
        case FieldType::List:
            oss << "list of " << f.expect_list().size();
            break;
    }
    return oss.str();
}

static std::int64_t parse_signed(const std::string& text, std::int64_t lo, std::int64_t hi) {
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text.c_str(), &end, 0);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE || v < lo || v > hi) {
        throw GffError(ErrorKind::InvalidNumber,
                       "'" + text + "' is not an integer in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
    return static_cast<std::int64_t>(v);
}

static std::uint64_t parse_unsigned(const std::string& text, std::uint64_t hi) {
    errno = 0;
    char* end = nullptr;
    const bool negative = text.find('-') != std::string::npos;
    const unsigned long long v = std::strtoull(text.c_str(), &end, 0);
    if (text.empty() || negative || end != text.c_str() + text.size() || errno == ERANGE || v > hi) {
        throw GffError(ErrorKind::InvalidNumber,
                       "'" + text + "' is not an integer in [0, " + std::to_string(hi) + "]");
    }
    return static_cast<std::uint64_t>(v);
}

static double parse_real(const std::string& text, bool single) {
    errno = 0;
    char* end = nullptr;
    double v = 0.0;
    if (single) v = static_cast<double>(std::strtof(text.c_str(), &end));
    else v = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
        throw GffError(ErrorKind::InvalidNumber, "'" + text + "' is not a number");
    }
    return v;
}

static std::vector<std::uint8_t> parse_hex(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            throw GffError(ErrorKind::InvalidNumber, "'" + text + "' is not a hex byte string");
        }
        digits.push_back(c);
    }
    if (digits.size() % 2 != 0) {
        throw GffError(ErrorKind::InvalidNumber, "hex byte string has an odd number of digits");
    }
    std::vector<std::uint8_t> out;
    out.reserve(digits.size() / 2);
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        out.push_back(static_cast<std::uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    }
    return out;
}

Field parse_field_value(FieldType type, const std::string& text) {
    switch (type) {
        case FieldType::Byte:
            return Field::make_byte(static_cast<std::uint8_t>(parse_unsigned(text, 0xFF)));
        case FieldType::Char:
            if (text.size() == 1 && !std::isdigit(static_cast<unsigned char>(text[0]))) {
                return Field::make_char(static_cast<unsigned char>(text[0]));
            }
            return Field::make_char(static_cast<std::uint32_t>(parse_unsigned(text, 0xFFFFFFFFu)));
        case FieldType::Word:
            return Field::make_word(static_cast<std::uint16_t>(parse_unsigned(text, 0xFFFF)));
        case FieldType::Short:
            return Field::make_short(static_cast<std::int16_t>(parse_signed(text, -32768, 32767)));
        case FieldType::DWord:
            return Field::make_dword(static_cast<std::uint32_t>(parse_unsigned(text, 0xFFFFFFFFu)));
        case FieldType::Int:
            return Field::make_int(static_cast<std::int32_t>(
                parse_signed(text, std::numeric_limits<std::int32_t>::min(), std::numeric_limits<std::int32_t>::max())));
        case FieldType::DWord64:
            return Field::make_dword64(parse_unsigned(text, std::numeric_limits<std::uint64_t>::max()));
        case FieldType::Int64:
            return Field::make_int64(parse_signed(text, std::numeric_limits<std::int64_t>::min(),
                                                  std::numeric_limits<std::int64_t>::max()));
        case FieldType::Float:
            return Field::make_float(static_cast<float>(parse_real(text, true)));
        case FieldType::Double:
            return Field::make_double(parse_real(text, false));
        case FieldType::ExoString:
            return Field::make_exo_string(text);
        case FieldType::ResRef:
            if (encode_cp1252(text).size() > ResRef::kMaxLength) {
                throw GffError(ErrorKind::InvalidEncoding, "ResRef '" + text + "' is longer than 16 characters");
            }
            return Field::make_res_ref(text);
        case FieldType::ExoLocString: {
            ExoLocString s;
            s.substrings.push_back(LocSubstring{Language::English, Gender::Masculine, text});
            return Field::make_exo_loc_string(std::move(s));
        }
        case FieldType::Void:
            return Field::make_void(parse_hex(text));
        case FieldType::Struct:
        case FieldType::List:
            break;
    }
    throw GffError(ErrorKind::TypeMismatch, to_string(type) + " fields cannot be set from text");
}

std::uint32_t crc32(const std::vector<std::uint8_t>& bytes) {
    uLong c = ::crc32(0L, Z_NULL, 0);
    if (!bytes.empty()) {
        c = ::crc32(c, reinterpret_cast<const Bytef*>(bytes.data()), static_cast<uInt>(bytes.size()));
    }
    return static_cast<std::uint32_t>(c);
}

} // namespace gffkit
