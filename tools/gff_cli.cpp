#include "gffkit/binary.hpp"
#include "gffkit/field_ref.hpp"
#include "gffkit/gff.hpp"
#include "gffkit/string_resolver.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static std::vector<std::uint8_t> load_bytes(const std::string& file) {
    std::ifstream is(file, std::ios::binary);
    if (!is) throw gffkit::GffError(gffkit::ErrorKind::Io, "failed to open file: " + file);
    return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
}

static void usage() {
    std::cerr <<
        "gffkit - GFF V3.2 inspector and editor\n"
        "\n"
        "Usage:\n"
        "  gffkit header    <FILE> [--no-color]\n"
        "  gffkit tree      <FILE> [--max-depth N] [--details] [--strings <TLK.txt>] [--no-color]\n"
        "  gffkit get       <FILE> <PATH> [--strings <TLK.txt>] [--no-color]\n"
        "  gffkit set       <FILE> <PATH> <VALUE> [-o <OUT>] [--no-color]\n"
        "  gffkit find      <FILE> <LABEL> [--dfs] [--strings <TLK.txt>] [--no-color]\n"
        "  gffkit roundtrip <FILE> [--no-color]\n"
        "  gffkit show      <FILE> [-o <OUT>] [--strings <TLK.txt>]\n"
        "\n"
        "Common options:\n"
        "  --strings <FILE>  string table, one \"<id><TAB><text>\" per line\n"
        "  --no-resolve      do not look up ExoLocString references\n"
        "  --require-v32     reject files whose version is not V3.2\n"
        "\n"
        "PATH is a dotted label path, \"[n]\" selects a list element: ClassList[0].Class\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::vector<std::string> positional;
    std::string out;
    std::string strings;
    bool details{false};
    bool dfs{false};
    bool no_color{false};
    bool no_resolve{false};
    bool require_v32{false};
    std::size_t max_depth{static_cast<std::size_t>(-1)};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--details") a.details = true;
        else if (opt == "--dfs") a.dfs = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--no-resolve") a.no_resolve = true;
        else if (opt == "--require-v32") a.require_v32 = true;
        else if ((opt == "-o" || opt == "--out") && i < argc) a.out = argv[i++];
        else if (opt == "--strings" && i < argc) a.strings = argv[i++];
        else if (opt == "--max-depth" && i < argc) {
            const std::string n = argv[i++];
            if (n.empty() || n.find_first_not_of("0123456789") != std::string::npos) {
                std::cerr << "--max-depth expects a number, got '" << n << "'\n";
                return false;
            }
            a.max_depth = static_cast<std::size_t>(std::strtoull(n.c_str(), nullptr, 10));
        }
        else if (opt.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        } else {
            a.positional.push_back(opt);
        }
    }

    std::size_t want = 0;
    if (a.cmd == "header" || a.cmd == "tree" || a.cmd == "roundtrip" || a.cmd == "show") want = 0;
    else if (a.cmd == "get" || a.cmd == "find") want = 1;
    else if (a.cmd == "set") want = 2;
    else {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    if (a.positional.size() != want) {
        std::cerr << a.cmd << " expects " << want << " argument(s) after <FILE>\n";
        return false;
    }
    return true;
}

// Text the editor starts from for a leaf value.
static std::string edit_text(const gffkit::Field& f) {
    using gffkit::FieldType;
    switch (f.type()) {
        case FieldType::Char: return std::to_string(f.expect_char());
        case FieldType::ExoString: return f.expect_exo_string();
        case FieldType::ResRef: return f.expect_res_ref();
        case FieldType::ExoLocString: return f.expect_exo_loc_string().text();
        case FieldType::Void: {
            std::ostringstream oss;
            oss << std::hex << std::setfill('0');
            for (std::uint8_t b : f.expect_void()) oss << std::setw(2) << static_cast<unsigned>(b);
            return oss.str();
        }
        default: return gffkit::display_value(f);
    }
}

// ExoLocString edits replace the English text and keep the string reference.
static void apply_text(const gffkit::FieldCellPtr& cell, const std::string& text) {
    const gffkit::FieldType t = cell->type();
    if (t == gffkit::FieldType::ExoLocString) {
        gffkit::loc_string_ref(cell).set(text);
        return;
    }
    cell->set(gffkit::parse_field_value(t, text));
}

// ----------------- Tree printer -----------------

static void print_struct(const gffkit::Struct& s,
                         const Ansi& ansi,
                         std::size_t indent,
                         std::size_t depth,
                         std::size_t max_depth,
                         bool details);

static void print_cell(const gffkit::FieldCellPtr& cell,
                       const Ansi& ansi,
                       std::size_t indent,
                       std::size_t depth,
                       std::size_t max_depth,
                       bool details) {
    const gffkit::LabeledField lf = cell->snapshot();
    const std::string pad(indent, ' ');
    const gffkit::Field& f = lf.field;

    if (f.type() == gffkit::FieldType::Struct) {
        const auto& s = f.expect_struct();
        std::cout << pad << ansi.magenta() << lf.label << "/" << ansi.reset()
                  << " " << ansi.gray() << "struct " << s.id << ansi.reset() << "\n";
        print_struct(s, ansi, indent + 2, depth + 1, max_depth, details);
        return;
    }
    if (f.type() == gffkit::FieldType::List) {
        const auto& l = f.expect_list();
        std::cout << pad << ansi.magenta() << lf.label << "[]" << ansi.reset()
                  << " " << ansi.gray() << l.size() << " elements" << ansi.reset() << "\n";
        if (depth + 1 > max_depth) return;
        for (std::size_t i = 0; i < l.size(); ++i) {
            std::cout << pad << "  " << ansi.magenta() << "[" << i << "]" << ansi.reset()
                      << " " << ansi.gray() << "struct " << l[i].id << ansi.reset() << "\n";
            print_struct(l[i], ansi, indent + 4, depth + 2, max_depth, details);
        }
        return;
    }

    std::cout << pad
              << ansi.cyan() << lf.label << ansi.reset()
              << " " << ansi.yellow() << gffkit::to_string(f.type()) << ansi.reset()
              << " " << gffkit::display_value(f);
    if (details) {
        std::cout << " " << ansi.dim() << (gffkit::is_complex(f.type()) ? "heap" : "inline") << ansi.reset();
    }
    std::cout << "\n";
}

static void print_struct(const gffkit::Struct& s,
                         const Ansi& ansi,
                         std::size_t indent,
                         std::size_t depth,
                         std::size_t max_depth,
                         bool details) {
    if (depth > max_depth) return;
    if (details && s.field_count() == 0) {
        std::cout << std::string(indent, ' ') << ansi.dim() << "(empty, data_or_offset="
                  << s.origin.empty_struct_offset() << ")" << ansi.reset() << "\n";
    }
    for (const auto& cell : s.fields) {
        print_cell(cell, ansi, indent, depth, max_depth, details);
    }
}

// ----------------- Interactive UI tree (FTXUI) -----------------

struct UiRow {
    gffkit::FieldCellPtr cell; // null for list element rows
    std::string name;
    std::string full_path;
    int depth{0};
    bool is_dir{false};
};

static void flatten_rows(const gffkit::Struct& s,
                         const std::string& prefix,
                         const std::set<std::string>& expanded,
                         int depth,
                         std::vector<UiRow>& out) {
    for (const auto& cell : s.fields) {
        const gffkit::LabeledField lf = cell->snapshot();
        const std::string path = prefix.empty() ? lf.label : prefix + "." + lf.label;
        const bool is_dir = lf.field.is_container();
        out.push_back(UiRow{cell, lf.label, path, depth, is_dir});
        if (!is_dir || expanded.find(path) == expanded.end()) continue;

        if (lf.field.type() == gffkit::FieldType::Struct) {
            flatten_rows(lf.field.expect_struct(), path, expanded, depth + 1, out);
            continue;
        }
        const auto& list = lf.field.expect_list();
        for (std::size_t i = 0; i < list.size(); ++i) {
            const std::string elem = path + "[" + std::to_string(i) + "]";
            out.push_back(UiRow{nullptr, "[" + std::to_string(i) + "]", elem, depth + 1, true});
            if (expanded.find(elem) != expanded.end()) {
                flatten_rows(list[i], elem, expanded, depth + 2, out);
            }
        }
    }
}

static const UiRow* safe_row_at(const std::vector<UiRow>& rows, int idx) {
    if (idx < 0 || idx >= static_cast<int>(rows.size())) return nullptr;
    return &rows[static_cast<std::size_t>(idx)];
}

static int run_show(const Args& a, gffkit::Gff& doc) {
    using namespace ftxui;

    const std::string save_to = a.out.empty() ? a.file : a.out;

    std::set<std::string> expanded;
    int selected = 0;
    int left_scroll = 0;

    bool editing = false;
    bool dirty = false;
    std::string edit_buffer;
    std::string status;

    auto rebuild = [&]() -> std::vector<UiRow> {
        std::vector<UiRow> out;
        flatten_rows(doc.root, "", expanded, 0, out);
        if (out.empty()) {
            selected = 0;
        } else {
            if (selected < 0) selected = 0;
            if (selected >= (int)out.size()) selected = (int)out.size() - 1;
        }
        return out;
    };

    auto rows = rebuild();

    auto left_pane = Renderer([&] {
        rows = rebuild();

        auto dim = ftxui::Terminal::Size();
        int term_h = std::max(10, dim.dimy);
        int visible_rows = std::max(3, term_h - 6);

        int total = (int)rows.size();
        if (total <= 0) {
            left_scroll = 0;
        } else {
            left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));
            if (selected < left_scroll) left_scroll = selected;
            if (selected >= left_scroll + visible_rows) left_scroll = selected - visible_rows + 1;
            left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));
        }

        int begin = left_scroll;
        int end = std::min(total, begin + visible_rows);

        std::vector<Element> items;
        items.reserve((std::size_t)std::max(0, end - begin) + 2);

        constexpr int kLeftLineMax = 58;

        if (begin > 0) {
            items.push_back(text("↑ more") | color(Color::GrayDark));
        }

        for (int i = begin; i < end; ++i) {
            const UiRow& r = rows[(std::size_t)i];

            std::string glyph = "• ";
            if (r.is_dir) glyph = (expanded.find(r.full_path) != expanded.end()) ? "▾ " : "▸ ";

            std::string indent((std::size_t)r.depth * 2, ' ');

            std::string meta;
            if (r.cell) meta = gffkit::to_string(r.cell->type());

            Element left_txt = text(indent + glyph + r.name) | color(r.is_dir ? Color::Magenta : Color::Cyan) | flex;
            Element right_txt = text(meta) | color(Color::Yellow);
            Element line = hbox({ left_txt, right_txt }) | size(WIDTH, LESS_THAN, kLeftLineMax);

            if (i == selected) {
                line = line | inverted;
            }
            items.push_back(line);
        }

        if (end < total) {
            items.push_back(text("↓ more") | color(Color::GrayDark));
        }

        auto header = hbox({
            text(doc.file_type + doc.file_version) | bold | color(Color::White),
            text("  "),
            text(a.file) | color(Color::GrayDark),
            dirty ? text(" *") | bold | color(Color::Red) : text(""),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("←→") | bold | color(Color::Yellow),
            text(" collapse/expand  ") | color(Color::GrayDark),
            text("Enter") | bold | color(Color::Yellow),
            text(" edit  ") | color(Color::GrayDark),
            text("w") | bold | color(Color::Yellow),
            text(" save") | color(Color::GrayDark),
        });

        return vbox({
                   header,
                   separator(),
                   vbox(std::move(items)) | flex,
               }) |
               flex |
               border;
    });

    auto right_pane = Renderer([&] {
        const UiRow* r = safe_row_at(rows, selected);

        std::vector<Element> lines;
        std::string title = "<root>";
        if (r) {
            title = r->full_path;
            if (r->cell) {
                const gffkit::LabeledField lf = r->cell->snapshot();
                const gffkit::Field& f = lf.field;
                lines.push_back(hbox({text("type") | bold | color(Color::Yellow),
                                      text(": ") | color(Color::GrayDark),
                                      text(gffkit::to_string(f.type())) | color(Color::GrayLight)}));
                lines.push_back(hbox({text("storage") | bold | color(Color::Yellow),
                                      text(": ") | color(Color::GrayDark),
                                      text(gffkit::is_complex(f.type()) ? "heap" : "inline") | color(Color::GrayLight)}));
                lines.push_back(separator());
                lines.push_back(paragraph(gffkit::display_value(f)) | color(Color::GrayLight));
            } else {
                lines.push_back(text("list element") | color(Color::GrayDark));
            }
        }

        Element edit_box = editing
            ? hbox({text("edit> ") | bold | color(Color::Green), text(edit_buffer), text("_") | blink})
            : text("");

        return vbox({
                   text(title) | bold | color(Color::Green),
                   separator(),
                   vbox(std::move(lines)) | vscroll_indicator | frame | flex,
                   separator(),
                   edit_box,
                   text(status) | color(Color::GrayDark),
               }) |
               flex |
               border;
    });

    auto layout = Renderer([&] {
        int left_w = 60;
        auto dim = ftxui::Terminal::Size();
        int term_w = std::max(20, dim.dimx);
        int term_h = std::max(10, dim.dimy);

        auto ui = hbox({
            left_pane->Render() | size(WIDTH, EQUAL, left_w),
            right_pane->Render() | flex,
        }) | flex;

        return ui
            | size(WIDTH, EQUAL, term_w)
            | size(HEIGHT, EQUAL, term_h);
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto app = CatchEvent(layout, [&](Event e) {
        rows = rebuild();
        const UiRow* pr = safe_row_at(rows, selected);

        if (editing) {
            if (e == Event::Escape) {
                editing = false;
                status = "edit cancelled";
                return true;
            }
            if (e == Event::Return) {
                try {
                    if (pr && pr->cell) {
                        apply_text(pr->cell, edit_buffer);
                        dirty = true;
                        status = "updated " + pr->full_path;
                    }
                } catch (const gffkit::GffError& err) {
                    status = gffkit::to_string(err.kind()) + ": " + err.what();
                }
                editing = false;
                return true;
            }
            if (e == Event::Backspace) {
                if (!edit_buffer.empty()) {
                    // drop a whole UTF-8 sequence
                    std::size_t n = edit_buffer.size() - 1;
                    while (n > 0 && (static_cast<unsigned char>(edit_buffer[n]) & 0xC0) == 0x80) --n;
                    edit_buffer.erase(n);
                }
                return true;
            }
            if (e.is_character()) {
                edit_buffer += e.character();
                return true;
            }
            return false;
        }

        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (e == Event::Character('w')) {
            try {
                gffkit::write_file(save_to, doc);
                dirty = false;
                status = "saved " + save_to;
            } catch (const gffkit::GffError& err) {
                status = gffkit::to_string(err.kind()) + ": " + err.what();
            }
            return true;
        }
        if (!pr) return false;
        const UiRow& r = *pr;

        if (e == Event::ArrowUp) {
            if (selected > 0) selected--;
            return true;
        }
        if (e == Event::ArrowDown) {
            if (selected + 1 < (int)rows.size()) selected++;
            return true;
        }
        if (e == Event::PageUp) {
            selected = std::max(0, selected - 25);
            return true;
        }
        if (e == Event::PageDown) {
            selected = std::min((int)rows.size() - 1, selected + 25);
            return true;
        }

        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                selected = std::max(0, selected - 3);
                return true;
            }
            if (m.button == Mouse::WheelDown) {
                selected = std::min((int)rows.size() - 1, selected + 3);
                return true;
            }
        }

        if (e == Event::ArrowRight) {
            if (r.is_dir) expanded.insert(r.full_path);
            return true;
        }
        if (e == Event::ArrowLeft) {
            if (r.is_dir) expanded.erase(r.full_path);
            return true;
        }
        if (e == Event::Return) {
            if (r.is_dir) {
                if (expanded.count(r.full_path)) expanded.erase(r.full_path);
                else expanded.insert(r.full_path);
            } else if (r.cell) {
                edit_buffer = edit_text(r.cell->get());
                editing = true;
                status = "Enter to apply, Esc to cancel";
            }
            return true;
        }

        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        gffkit::ReadOptions ro;
        ro.resolve_strings = !a.no_resolve;
        ro.require_v32 = a.require_v32;

        gffkit::MapStringResolver strings;
        const gffkit::StringResolver* resolver = nullptr;
        if (!a.strings.empty()) {
            const std::size_t n = strings.load(a.strings);
            resolver = &strings;
            std::cerr << ansi.dim() << "loaded " << n << " strings from " << a.strings << ansi.reset() << "\n";
        }

        if (a.cmd == "header") {
            const std::vector<std::uint8_t> bytes = load_bytes(a.file);
            const gffkit::bin::BinaryGff image = gffkit::bin::BinaryGff::read(bytes);
            const gffkit::bin::Header& h = image.header;

            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "Type" << ansi.reset() << ": '" << h.file_type << "'\n";
            std::cout << ansi.bold() << "Version" << ansi.reset() << ": '" << h.file_version << "'\n";
            std::cout << ansi.bold() << "File size" << ansi.reset() << ": " << bytes.size() << "\n";
            std::cout << ansi.bold() << "CRC32" << ansi.reset() << ": " << hex8(gffkit::crc32(bytes)) << "\n";

            const std::pair<const char*, const gffkit::bin::Section*> sections[] = {
                {"structs", &h.structs},
                {"fields", &h.fields},
                {"labels", &h.labels},
                {"field data", &h.field_data},
                {"field indices", &h.field_indices},
                {"list indices", &h.list_indices},
            };
            for (const auto& s : sections) {
                std::cout << "  " << ansi.cyan() << std::left << std::setw(14) << s.first << ansi.reset()
                          << " offset=" << s.second->offset
                          << " count=" << s.second->count << "\n";
            }
            return 0;
        }

        if (a.cmd == "roundtrip") {
            const std::vector<std::uint8_t> bytes = load_bytes(a.file);
            const gffkit::Gff doc = gffkit::read(bytes, nullptr, ro);
            const std::vector<std::uint8_t> again = gffkit::write(doc);

            std::cout << ansi.bold() << "original" << ansi.reset() << ": " << bytes.size()
                      << " bytes, crc32 " << hex8(gffkit::crc32(bytes)) << "\n";
            std::cout << ansi.bold() << "rewritten" << ansi.reset() << ": " << again.size()
                      << " bytes, crc32 " << hex8(gffkit::crc32(again)) << "\n";
            if (bytes == again) {
                std::cout << ansi.green() << "identical" << ansi.reset() << "\n";
                return 0;
            }
            const auto diff = std::mismatch(bytes.begin(), bytes.end(), again.begin(), again.end());
            std::cout << ansi.red() << "differs" << ansi.reset() << " at offset "
                      << std::distance(bytes.begin(), diff.first) << "\n";
            return 1;
        }

        gffkit::Gff doc = gffkit::read_file(a.file, resolver, ro);

        if (a.cmd == "tree") {
            std::cout << ansi.bold() << doc.file_type << doc.file_version << ansi.reset() << ": " << a.file << "\n";
            print_struct(doc.root, ansi, 0, 0, a.max_depth, a.details);
            return 0;
        }

        if (a.cmd == "get" || a.cmd == "set") {
            const std::string& path = a.positional[0];
            gffkit::FieldCellPtr cell = doc.root.find_path(path);
            if (!cell) throw gffkit::GffError(gffkit::ErrorKind::NotFound, "no field at path: " + path);

            if (a.cmd == "set") {
                apply_text(cell, a.positional[1]);
                const std::string out = a.out.empty() ? a.file : a.out;
                gffkit::write_file(out, doc);
                std::cerr << ansi.dim() << "wrote " << out << ansi.reset() << "\n";
            }

            const gffkit::LabeledField lf = cell->snapshot();
            std::cout << ansi.cyan() << path << ansi.reset()
                      << " " << ansi.yellow() << gffkit::to_string(lf.field.type()) << ansi.reset()
                      << " " << gffkit::display_value(lf.field) << "\n";
            return 0;
        }

        if (a.cmd == "find") {
            const std::string& label = a.positional[0];
            const auto order = a.dfs ? gffkit::Traversal::DepthFirst : gffkit::Traversal::BreadthFirst;
            gffkit::FieldCellPtr cell = doc.find_by_label(label, order);
            if (!cell) throw gffkit::GffError(gffkit::ErrorKind::NotFound, "no field labelled " + label);

            const gffkit::LabeledField lf = cell->snapshot();
            std::cout << ansi.cyan() << lf.label << ansi.reset()
                      << " " << ansi.yellow() << gffkit::to_string(lf.field.type()) << ansi.reset()
                      << " " << gffkit::display_value(lf.field) << "\n";
            return 0;
        }

        if (a.cmd == "show") {
            return run_show(a, doc);
        }

    } catch (const gffkit::GffError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " (" << gffkit::to_string(e.kind()) << "): "
                  << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
