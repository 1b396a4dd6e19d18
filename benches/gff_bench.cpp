#include "gffkit/gff_easy.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

// `items` list entries, each a struct mixing inline, heap and nested fields.
static gffkit::Gff make_payload(std::size_t items) {
    using namespace gffkit;

    std::mt19937 rng(123);
    std::uniform_int_distribution<std::int32_t> ints(-100000, 100000);
    std::uniform_real_distribution<float> reals(0.0f, 1.0f);

    Gff doc;
    doc.file_type = "UTI ";
    List list;
    list.reserve(items);
    for (std::size_t i = 0; i < items; ++i) {
        Struct s = easy::make_struct(static_cast<std::uint32_t>(i % 7), {
            {"Tag", Field::make_exo_string("item_" + std::to_string(i))},
            {"TemplateResRef", Field::make_res_ref("it_gen_" + std::to_string(i % 1000))},
            {"LocName", Field::make_exo_loc_string(easy::make_loc_string("Item number " + std::to_string(i)))},
            {"Cost", Field::make_int(ints(rng))},
            {"Weight", Field::make_float(reals(rng))},
            {"Id", Field::make_dword64(i)},
            {"Props", Field::make_struct(easy::make_struct(9, {
                {"Charges", Field::make_byte(static_cast<std::uint8_t>(i & 0xFF))},
                {"Blob", Field::make_void(std::vector<std::uint8_t>(16, static_cast<std::uint8_t>(i)))},
            }))},
        });
        list.push_back(std::move(s));
    }
    doc.root.add_field("ItemList", Field::make_list(std::move(list)));
    return doc;
}

static void bench_one(const std::filesystem::path& file, std::size_t items) {
    gffkit::Gff doc = make_payload(items);

    std::cout << "=== items=" << items << " ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    gffkit::write_file(file, doc);
    double w_ms = ms_since(t0);

    std::uintmax_t sz = std::filesystem::file_size(file);
    double mb = static_cast<double>(sz) / (1024.0 * 1024.0);

    std::cout << "write: " << w_ms << " ms, file=" << mb << " MiB, throughput=" << (mb / (w_ms / 1000.0)) << " MiB/s\n";

    t0 = std::chrono::high_resolution_clock::now();
    gffkit::Gff read = gffkit::read_file(file);
    double r_ms = ms_since(t0);
    std::cout << "read : " << r_ms << " ms, throughput=" << (mb / (r_ms / 1000.0)) << " MiB/s\n";

    t0 = std::chrono::high_resolution_clock::now();
    std::size_t visited = 0;
    gffkit::FieldWalker walker = read.walk(gffkit::Traversal::BreadthFirst);
    while (walker.next()) ++visited;
    double t_ms = ms_since(t0);
    std::cout << "walk : " << t_ms << " ms, " << visited << " fields\n";
}

int main(int argc, char** argv) {
    std::filesystem::path file = (argc >= 2) ? argv[1] : (std::filesystem::temp_directory_path() / "gffkit_bench.gff");
    try {
        bench_one(file, 1000);
        bench_one(file, 20000);
        bench_one(file, 100000);
    } catch (const std::exception& e) {
        std::cerr << "bench error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
