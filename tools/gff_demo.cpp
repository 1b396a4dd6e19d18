#include "gffkit/field_ref.hpp"
#include "gffkit/gff_easy.hpp"
#include "gffkit/string_resolver.hpp"

#include <cstdint>
#include <iostream>
#include <string>

// A save-game style player record: a list of players, each with a class list.
static gffkit::Struct make_player() {
    using namespace gffkit;

    Struct player = easy::make_struct(0, {
        {"FirstName", Field::make_exo_loc_string(easy::make_loc_string("Aribeth"))},
        {"LastName", Field::make_exo_loc_string(easy::make_loc_string("de Tylmarande"))},
        {"Description", Field::make_exo_loc_string(easy::make_loc_ref(6000))},
        {"Str", Field::make_byte(14)},
        {"Dex", Field::make_byte(12)},
        {"HitPoints", Field::make_short(42)},
        {"Gold", Field::make_dword(1250)},
        {"Experience", Field::make_dword64(36000)},
        {"Portrait", Field::make_res_ref("po_hu_f_99_")},
    });

    easy::push_back(player, "ClassList", easy::make_struct(2, {
        {"Class", Field::make_int(6)},
        {"ClassLevel", Field::make_short(8)},
    }));
    easy::push_back(player, "ClassList", easy::make_struct(2, {
        {"Class", Field::make_int(3)},
        {"ClassLevel", Field::make_short(1)},
    }));
    for (std::uint16_t feat : {2, 4, 28, 32}) {
        easy::push_back(player, "FeatList", easy::make_struct(1, {{"Feat", Field::make_word(feat)}}));
    }
    return player;
}

int main() {
    try {
        using namespace gffkit;

        Gff doc;
        doc.file_type = "IFO ";
        easy::set(doc.root, "Mod_Name", Field::make_exo_loc_string(easy::make_loc_string("Demo Module")));
        easy::push_back(doc.root, "Mod_PlayerList", make_player());

        const std::string file = "demo_out.ifo";
        write_file(file, doc);
        std::cout << "Wrote: " << file << "\n";

        MapStringResolver strings;
        strings.add(6000, "A paladin of Tyr.");

        Gff back = read_file(file, &strings);
        std::cout << "Read back " << (back == doc ? "equal" : "DIFFERENT") << " tree\n";

        FieldCellPtr players = back.find_by_label("Mod_PlayerList");
        if (!players) throw GffError(ErrorKind::NotFound, "Mod_PlayerList missing");
        const Struct player = players->get().expect_list().at(0);

        auto name = loc_string_ref(player.find("FirstName"));
        auto str = byte_ref(player.find("Str"));
        std::cout << "Player: " << name.get() << ", Str " << static_cast<unsigned>(str.get()) << "\n";
        std::cout << "Description: " << player.find("Description")->get().expect_exo_loc_string().text() << "\n";

        str.modify([](std::uint8_t& v) { v = static_cast<std::uint8_t>(v + 2); });
        FieldCellPtr level = back.root.find_path("Mod_PlayerList[0].ClassList[0].ClassLevel");
        level->set(Field::make_short(9));

        write_file(file, back);
        Gff edited = read_file(file, &strings);
        std::cout << "After edit: Str "
                  << display_value(edited.root.find_path("Mod_PlayerList[0].Str")->get())
                  << ", level "
                  << display_value(edited.root.find_path("Mod_PlayerList[0].ClassList[0].ClassLevel")->get())
                  << "\n";

        std::cout << "OK\n";
        return 0;

    } catch (const gffkit::GffError& e) {
        std::cerr << "GFF error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
