#pragma once

#include "gffkit/gff.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace gffkit::easy {

// Struct built from (label, value) pairs, in the given order.
inline Struct make_struct(std::uint32_t id, std::initializer_list<std::pair<std::string, Field>> fields) {
    Struct s(id);
    for (const auto& kv : fields) {
        s.add_field(kv.first, kv.second);
    }
    return s;
}

inline ExoLocString make_loc_string(std::string english) {
    ExoLocString s;
    s.substrings.push_back(LocSubstring{Language::English, Gender::Masculine, std::move(english)});
    return s;
}

// Talk-table reference with no literal overrides.
inline ExoLocString make_loc_ref(std::uint32_t string_ref) {
    ExoLocString s;
    s.string_ref = string_ref;
    return s;
}

inline void set(Struct& s, const std::string& label, Field value) {
    if (FieldCellPtr cell = s.find(label)) {
        cell->set(std::move(value));
        return;
    }
    s.add_field(label, std::move(value));
}

// Append an element to the List field `label`, creating the list if needed.
inline void push_back(Struct& s, const std::string& label, Struct element) {
    FieldCellPtr cell = s.find(label);
    if (!cell) cell = s.add_field(label, Field::make_list({}));
    cell->write([&](LabeledField& lf) { lf.field.expect_list().push_back(std::move(element)); });
}

} // namespace gffkit::easy
