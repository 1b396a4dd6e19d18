#pragma once

#include "gffkit/gff.hpp"

#include <functional>
#include <utility>

namespace gffkit {

// Typed view of one shared cell for an editor widget. `get` projects the
// current field value to T; `put` writes a T back into the field. The cached
// value is what the widget shows and edits; `set` and `modify` write through,
// `refresh` picks up changes made through other handles.
template <typename T>
class FieldRef {
public:
    using Getter = std::function<T(const Field&)>;
    using Putter = std::function<void(Field&, const T&)>;

    FieldRef(FieldCellPtr cell, Getter get, Putter put)
        : cell_(std::move(cell)), get_(std::move(get)), put_(std::move(put)) {
        if (!cell_) throw GffError(ErrorKind::NotFound, "FieldRef bound to a null cell");
        refresh();
    }

    const T& get() const noexcept { return value_; }

    void set(T value) {
        cell_->write([&](LabeledField& lf) { put_(lf.field, value); });
        value_ = std::move(value);
    }

    template <typename Fn>
    void modify(Fn&& fn) {
        T next = value_;
        fn(next);
        set(std::move(next));
    }

    void refresh() {
        value_ = cell_->read([&](const LabeledField& lf) { return get_(lf.field); });
    }

    const FieldCellPtr& cell() const noexcept { return cell_; }

private:
    FieldCellPtr cell_;
    Getter get_;
    Putter put_;
    T value_{};
};

// Ready-made projections for the common leaf kinds.

inline FieldRef<std::int32_t> int_ref(FieldCellPtr cell) {
    return FieldRef<std::int32_t>(
        std::move(cell),
        [](const Field& f) { return f.expect_int(); },
        [](Field& f, const std::int32_t& v) { f = Field::make_int(v); });
}

inline FieldRef<std::uint8_t> byte_ref(FieldCellPtr cell) {
    return FieldRef<std::uint8_t>(
        std::move(cell),
        [](const Field& f) { return f.expect_byte(); },
        [](Field& f, const std::uint8_t& v) { f = Field::make_byte(v); });
}

inline FieldRef<std::string> exo_string_ref(FieldCellPtr cell) {
    return FieldRef<std::string>(
        std::move(cell),
        [](const Field& f) { return f.expect_exo_string(); },
        [](Field& f, const std::string& v) { f = Field::make_exo_string(v); });
}

// Edits the substring for (language, gender), adding one if it is missing.
inline FieldRef<std::string> loc_string_ref(FieldCellPtr cell,
                                            Language language = Language::English,
                                            Gender gender = Gender::Masculine) {
    return FieldRef<std::string>(
        std::move(cell),
        [language, gender](const Field& f) { return f.expect_exo_loc_string().text(language, gender); },
        [language, gender](Field& f, const std::string& v) {
            ExoLocString& s = f.expect_exo_loc_string();
            for (auto& sub : s.substrings) {
                if (sub.language == language && sub.gender == gender) {
                    sub.text = v;
                    return;
                }
            }
            s.substrings.push_back(LocSubstring{language, gender, v});
        });
}

} // namespace gffkit
