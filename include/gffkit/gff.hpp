#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace gffkit {

class StringResolver;

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    Truncated,
    InvalidEncoding,
    InvalidFieldType,
    InvalidNumber,
    Alignment,
    OutOfRange,
    InvalidStructure,
    Lookup,
    TypeMismatch,
    InvalidPath,
    NotFound,
    Write,
};

class GffError : public std::runtime_error {
public:
    GffError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

std::string to_string(ErrorKind k);

// ------------------------------
// Field kinds
// ------------------------------

// Numbering is the on-disk field_type tag.
enum class FieldType : std::uint32_t {
    Byte = 0,
    Char = 1,
    Word = 2,
    Short = 3,
    DWord = 4,
    Int = 5,
    DWord64 = 6,
    Int64 = 7,
    Float = 8,
    Double = 9,
    ExoString = 10,
    ResRef = 11,
    ExoLocString = 12,
    Void = 13,
    Struct = 14,
    List = 15,
};

constexpr std::uint32_t kFieldTypeCount = 16;

std::string to_string(FieldType t);
std::optional<FieldType> field_type_from_string(const std::string& s);
std::optional<FieldType> field_type_from_tag(std::uint32_t tag) noexcept;

// A type is complex when its value does not fit in the 4-byte record slot.
bool is_complex(FieldType t) noexcept;

// ------------------------------
// Localized strings
// ------------------------------

enum class Language : std::uint32_t {
    English = 0,
    French = 1,
    German = 2,
    Italian = 3,
    Spanish = 4,
    Polish = 5,
    Korean = 128,
    ChineseTraditional = 129,
    ChineseSimplified = 130,
    Japanese = 131,
};

enum class Gender : std::uint32_t {
    Masculine = 0,
    Feminine = 1,
};

std::string to_string(Language l);
std::string to_string(Gender g);

struct LocSubstring {
    Language language{Language::English};
    Gender gender{Gender::Masculine};
    std::string text{};

    // Packed on disk as language * 2 + gender.
    std::uint32_t string_id() const noexcept;
    static LocSubstring from_string_id(std::uint32_t id, std::string text);
};

bool operator==(const LocSubstring& a, const LocSubstring& b);
bool operator!=(const LocSubstring& a, const LocSubstring& b);

struct ExoLocString {
    static constexpr std::uint32_t kNoStringRef = 0xFFFFFFFFu;

    std::uint32_t string_ref{kNoStringRef};
    std::vector<LocSubstring> substrings{};

    // Text looked up through the StringResolver while reading. Never written
    // back and not part of equality.
    std::optional<std::string> resolved{};

    bool has_string_ref() const noexcept { return string_ref != kNoStringRef; }

    // First substring for (language, gender), falling back to the resolved text.
    std::string text(Language language = Language::English, Gender gender = Gender::Masculine) const;
};

bool operator==(const ExoLocString& a, const ExoLocString& b);
bool operator!=(const ExoLocString& a, const ExoLocString& b);

// ------------------------------
// Leaf payload types
// ------------------------------

// Char is stored as a code point so that it stays distinct from DWord.
struct CharCode {
    std::uint32_t code{0};
};

struct ExoString {
    std::string value{};
};

// Resource name, at most 16 characters on disk.
struct ResRef {
    static constexpr std::size_t kMaxLength = 16;
    std::string value{};
};

struct Void {
    std::vector<std::uint8_t> data{};
};

bool operator==(const CharCode& a, const CharCode& b);
bool operator==(const ExoString& a, const ExoString& b);
bool operator==(const ResRef& a, const ResRef& b);
bool operator==(const Void& a, const Void& b);

// ------------------------------
// Resolved tree
// ------------------------------

class FieldCell;
struct Field;
using FieldCellPtr = std::shared_ptr<FieldCell>;

enum class Traversal {
    BreadthFirst,
    DepthFirst,
};

// Where a struct came from. Parsed structs remember the data_or_offset word
// they were read with; for an empty struct that word carries no meaning but is
// echoed back on write.
struct StructOrigin {
    static constexpr std::uint32_t kSynthesizedOffset = 0xFFFFFFFFu;

    std::optional<std::uint32_t> original_data_or_offset{};

    static StructOrigin from_file(std::uint32_t data_or_offset);
    static StructOrigin synthesized();

    bool is_synthesized() const noexcept { return !original_data_or_offset.has_value(); }
    std::uint32_t empty_struct_offset() const noexcept {
        return original_data_or_offset.value_or(kSynthesizedOffset);
    }
};

class Struct {
public:
    Struct() = default;
    explicit Struct(std::uint32_t id, StructOrigin origin = StructOrigin::synthesized());

    std::uint32_t id{0};
    StructOrigin origin{};

    // Copies of a Struct share these cells.
    std::vector<FieldCellPtr> fields{};

    std::size_t field_count() const noexcept { return fields.size(); }

    /// Direct child with the given label, or nullptr.
    FieldCellPtr find(const std::string& label) const;

    /// Navigate "A.B[2].C": labels separated by '.', "[n]" selects a list element.
    /// Returns nullptr when a segment does not exist; throws InvalidPath on bad syntax.
    FieldCellPtr find_path(const std::string& path) const;

    FieldCellPtr add_field(std::string label, Field field);
    bool remove_field(const std::string& label);
};

bool operator==(const Struct& a, const Struct& b);
bool operator!=(const Struct& a, const Struct& b);

using List = std::vector<Struct>;

struct Field {
    // Alternative index == FieldType tag.
    std::variant<
        std::uint8_t,   // Byte
        CharCode,       // Char
        std::uint16_t,  // Word
        std::int16_t,   // Short
        std::uint32_t,  // DWord
        std::int32_t,   // Int
        std::uint64_t,  // DWord64
        std::int64_t,   // Int64
        float,          // Float
        double,         // Double
        ExoString,
        ResRef,
        ExoLocString,
        Void,
        Struct,
        List
    > v;

    static Field make_byte(std::uint8_t x);
    static Field make_char(std::uint32_t code);
    static Field make_word(std::uint16_t x);
    static Field make_short(std::int16_t x);
    static Field make_dword(std::uint32_t x);
    static Field make_int(std::int32_t x);
    static Field make_dword64(std::uint64_t x);
    static Field make_int64(std::int64_t x);
    static Field make_float(float x);
    static Field make_double(double x);
    static Field make_exo_string(std::string s);
    static Field make_res_ref(std::string s);
    static Field make_exo_loc_string(ExoLocString s);
    static Field make_void(std::vector<std::uint8_t> data);
    static Field make_struct(Struct s);
    static Field make_list(List l);

    FieldType type() const noexcept { return static_cast<FieldType>(v.index()); }
    bool is_container() const noexcept;

    std::uint8_t expect_byte() const;
    std::uint32_t expect_char() const;
    std::uint16_t expect_word() const;
    std::int16_t expect_short() const;
    std::uint32_t expect_dword() const;
    std::int32_t expect_int() const;
    std::uint64_t expect_dword64() const;
    std::int64_t expect_int64() const;
    float expect_float() const;
    double expect_double() const;
    const std::string& expect_exo_string() const;
    const std::string& expect_res_ref() const;
    const ExoLocString& expect_exo_loc_string() const;
    const std::vector<std::uint8_t>& expect_void() const;
    const Struct& expect_struct() const;
    const List& expect_list() const;

    ExoLocString& expect_exo_loc_string();
    Struct& expect_struct();
    List& expect_list();
};

// Floats compare by bit pattern so NaN payloads survive a round trip.
bool operator==(const Field& a, const Field& b);
bool operator!=(const Field& a, const Field& b);

struct LabeledField {
    std::string label{};
    Field field{};
};

bool operator==(const LabeledField& a, const LabeledField& b);
bool operator!=(const LabeledField& a, const LabeledField& b);

// A shared, lock-guarded slot of the tree. Readers take a shared lock, the
// editor takes an exclusive one. Handles obtained from the tree or from a
// traversal observe every later write.
class FieldCell {
public:
    explicit FieldCell(LabeledField value);

    FieldCell(const FieldCell&) = delete;
    FieldCell& operator=(const FieldCell&) = delete;

    static FieldCellPtr make(std::string label, Field field);

    LabeledField snapshot() const;
    std::string label() const;
    Field get() const;
    FieldType type() const;
    bool has_label(const std::string& label) const;

    void set(Field field);

    template <typename Fn>
    auto read(Fn&& fn) const -> decltype(fn(std::declval<const LabeledField&>())) {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return fn(static_cast<const LabeledField&>(value_));
    }

    template <typename Fn>
    auto write(Fn&& fn) -> decltype(fn(std::declval<LabeledField&>())) {
        std::unique_lock<std::shared_mutex> lock(mu_);
        return fn(value_);
    }

private:
    mutable std::shared_mutex mu_;
    LabeledField value_;
};

// Lazy, restartable walk over the live tree. Every field cell is produced once;
// a Struct or List cell is produced before the cells beneath it, whose handles
// are taken from the container when it is produced. A cell reached again (shared
// by two struct copies, or held inside itself) is skipped.
class FieldWalker {
public:
    FieldWalker(const Struct& root, Traversal order);

    /// Next cell, or nullptr when the walk is exhausted.
    FieldCellPtr next();

    /// Restart from the root cells captured at construction.
    void reset();

    Traversal order() const noexcept { return order_; }

private:
    void push_children(const FieldCellPtr& cell);

    std::vector<FieldCellPtr> roots_;
    Traversal order_;
    std::deque<FieldCellPtr> pending_;
    std::unordered_set<const FieldCell*> seen_;
};

FieldCellPtr find_by_label(const Struct& root, const std::string& label, Traversal order = Traversal::BreadthFirst);

// ------------------------------
// Document
// ------------------------------

struct Gff {
    std::string file_type{"GFF "};
    std::string file_version{"V3.2"};
    Struct root{0xFFFFFFFFu};

    FieldCellPtr find_by_label(const std::string& label, Traversal order = Traversal::BreadthFirst) const;
    FieldWalker walk(Traversal order) const { return FieldWalker(root, order); }
};

bool operator==(const Gff& a, const Gff& b);
bool operator!=(const Gff& a, const Gff& b);

// ------------------------------
// Options
// ------------------------------

struct ReadOptions {
    bool resolve_strings{true}; // consult the StringResolver for ExoLocString references
    bool require_v32{false};    // reject any file_version other than "V3.2"
};

struct WriteOptions {
    std::string file_type{};    // empty keeps the document's file type
    std::string file_version{}; // empty keeps the document's version
};

// ------------------------------
// API
// ------------------------------

/// Parse a complete GFF image. `resolver` may be null.
Gff read(const std::vector<std::uint8_t>& bytes,
         const StringResolver* resolver = nullptr,
         const ReadOptions& opts = ReadOptions{});

/// Read a file fully into memory and parse it.
Gff read_file(const std::filesystem::path& file,
              const StringResolver* resolver = nullptr,
              const ReadOptions& opts = ReadOptions{});

/// Re-encode the current state of the tree.
std::vector<std::uint8_t> write(const Gff& doc, const WriteOptions& opts = WriteOptions{});

/// Encode in memory first, then emit the bytes to `file`.
void write_file(const std::filesystem::path& file, const Gff& doc, const WriteOptions& opts = WriteOptions{});

// ------------------------------
// Utilities
// ------------------------------

/// One-line human rendering of a field value.
std::string display_value(const Field& f);

/// Parse editor text into a value of the given leaf kind. Throws InvalidNumber
/// for malformed or out-of-range numbers, TypeMismatch for Struct/List.
/// ExoLocString text becomes a fresh value with one English/Masculine substring
/// and no string reference; loc_string_ref edits an existing one in place.
Field parse_field_value(FieldType type, const std::string& text);

std::uint32_t crc32(const std::vector<std::uint8_t>& bytes);

} // namespace gffkit
