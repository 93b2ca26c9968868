// =============================================================================
// celio - Zarr Layout Tests
// =============================================================================
//
// On-disk form of the Zarr v2 backend: .zarray / .zattrs content, codec ids,
// and arrays written by other producers (fixed-width text, big-endian data,
// nested chunk keys, a custom fill value).
//
// =============================================================================

#include "test.hpp"

#include "celio/spec/registry.hpp"
#include "celio/spec/tag.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <fstream>

using namespace celio;
using namespace celio::spec;
using json = nlohmann::json;
namespace fs = std::filesystem;

CELIO_TEST_BEGIN

namespace {

json load_json(const fs::path& file) {
    std::ifstream in(file);
    return json::parse(in);
}

void save_json(const fs::path& file, const json& doc) {
    std::ofstream out(file);
    out << doc.dump();
}

void save_bytes(const fs::path& file, const std::vector<std::uint8_t>& bytes) {
    std::ofstream out(file, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

/// Uncompressed array metadata as a foreign producer would write it.
json foreign_meta(std::vector<Size> shape, std::vector<Size> chunks, const std::string& dtype) {
    return json{{"zarr_format", 2}, {"shape", shape},     {"chunks", chunks},
                {"dtype", dtype},   {"compressor", nullptr}, {"fill_value", nullptr},
                {"order", "C"},     {"filters", nullptr}};
}

} // namespace

// =============================================================================
// Written Layout
// =============================================================================

CELIO_TEST_UNIT(array_metadata_and_tag_attributes) {
    test::Store store(BackendKind::Zarr);
    write_elem(*store.root(), "a", DenseArray::from<float>({1, 2, 3, 4, 5, 6}, {2, 3}),
               WriteOptions{}.compressed(Compression::Zstd, 3).with_chunks({1, 3}));

    const fs::path dir = store.file_path() / "a";
    const json meta = load_json(dir / ".zarray");
    CELIO_ASSERT_EQ(meta.at("zarr_format").get<int>(), 2);
    CELIO_ASSERT_EQ(meta.at("dtype").get<std::string>(), std::string("<f4"));
    CELIO_ASSERT_EQ(meta.at("shape").get<std::vector<Size>>(), (std::vector<Size>{2, 3}));
    CELIO_ASSERT_EQ(meta.at("chunks").get<std::vector<Size>>(), (std::vector<Size>{1, 3}));
    CELIO_ASSERT_EQ(meta.at("compressor").at("id").get<std::string>(), std::string("zstd"));
    CELIO_ASSERT_EQ(meta.at("order").get<std::string>(), std::string("C"));
    CELIO_ASSERT_TRUE(fs::exists(dir / "0.0"));
    CELIO_ASSERT_TRUE(fs::exists(dir / "1.0"));

    const json attrs = load_json(dir / ".zattrs");
    CELIO_ASSERT_EQ(attrs.at("encoding-type").get<std::string>(), std::string("array"));
    CELIO_ASSERT_EQ(attrs.at("encoding-version").get<std::string>(), std::string("0.2.0"));
}

CELIO_TEST_UNIT(gzip_is_stored_as_zlib) {
    test::Store store(BackendKind::Zarr);
    const auto a = DenseArray::from<std::int64_t>({9, 8, 7});
    write_elem(*store.root(), "a", a, WriteOptions{}.compressed(Compression::Gzip, 4));

    const json meta = load_json(store.file_path() / "a" / ".zarray");
    CELIO_ASSERT_EQ(meta.at("compressor").at("id").get<std::string>(), std::string("zlib"));
    CELIO_ASSERT_TRUE(read_elem(*store.reopen()->open("a")).as<DenseArray>() == a);
}

CELIO_TEST_UNIT(text_arrays_use_vlen_utf8_filter) {
    test::Store store(BackendKind::Zarr);
    write_elem(*store.root(), "names", DenseArray::strings({"α", "beta", ""}));

    const json meta = load_json(store.file_path() / "names" / ".zarray");
    CELIO_ASSERT_EQ(meta.at("dtype").get<std::string>(), std::string("|O"));
    CELIO_ASSERT_EQ(meta.at("filters").at(0).at("id").get<std::string>(), std::string("vlen-utf8"));

    const Element back = read_elem(*store.reopen()->open("names"));
    CELIO_ASSERT_EQ(back.as<DenseArray>(), DenseArray::strings({"α", "beta", ""}));
}

CELIO_TEST_UNIT(groups_carry_zgroup_and_tag) {
    test::Store store(BackendKind::Zarr);
    write_elem(*store.root(), "uns", Mapping{{"x", Scalar(1.5)}});

    const fs::path dir = store.file_path() / "uns";
    CELIO_ASSERT_EQ(load_json(dir / ".zgroup").at("zarr_format").get<int>(), 2);
    CELIO_ASSERT_EQ(load_json(dir / ".zattrs").at("encoding-type").get<std::string>(), std::string("dict"));
    CELIO_ASSERT_EQ(load_json(dir / "x" / ".zarray").at("shape").size(), Size{0});
}

// =============================================================================
// Foreign Arrays
// =============================================================================

CELIO_TEST_UNIT(reads_fixed_width_utf32_text) {
    test::Store store(BackendKind::Zarr);
    const fs::path dir = store.file_path() / "u";
    fs::create_directories(dir);
    save_json(dir / ".zarray", foreign_meta({2}, {2}, "<U3"));

    // "ab" padded to three code points, then "xyz"
    std::vector<std::uint8_t> chunk(24, 0);
    const char32_t cells[2][3] = {{U'a', U'b', 0}, {U'x', U'y', U'z'}};
    for (int i = 0; i < 2; ++i) {
        for (int j = 0; j < 3; ++j) {
            const auto cp = static_cast<std::uint32_t>(cells[i][j]);
            std::memcpy(chunk.data() + (i * 3 + j) * 4, &cp, 4);
        }
    }
    save_bytes(dir / "0", chunk);

    test::WarningCapture warnings;
    const Element back = read_elem(*store.reopen()->open("u"));
    CELIO_ASSERT_EQ(back.as<DenseArray>().strings(), (std::vector<std::string>{"ab", "xyz"}));
    CELIO_ASSERT_EQ(warnings.count(WarningCategory::OldFormat), Size{1});
}

CELIO_TEST_UNIT(reads_big_endian_with_nested_chunk_keys) {
    test::Store store(BackendKind::Zarr);
    const fs::path dir = store.file_path() / "be";
    fs::create_directories(dir / "0");

    json meta = foreign_meta({2, 2}, {1, 2}, ">i4");
    meta["dimension_separator"] = "/";
    save_json(dir / ".zarray", meta);
    save_bytes(dir / "0" / "0", {0, 0, 0, 1, 0, 0, 1, 0});
    fs::create_directories(dir / "1");
    save_bytes(dir / "1" / "0", {0xff, 0xff, 0xff, 0xff, 0, 0, 0, 2});

    test::WarningCapture warnings;
    const Element back = read_elem(*store.reopen()->open("be"));
    CELIO_ASSERT_EQ(back.as<DenseArray>(), DenseArray::from<std::int32_t>({1, 256, -1, 2}, {2, 2}));
}

CELIO_TEST_UNIT(missing_chunks_use_declared_fill_value) {
    test::Store store(BackendKind::Zarr);
    const fs::path dir = store.file_path() / "f";
    fs::create_directories(dir);
    json meta = foreign_meta({4}, {2}, "<f8");
    meta["fill_value"] = -1.0;
    save_json(dir / ".zarray", meta);

    const double first[2] = {0.5, 1.5};
    std::vector<std::uint8_t> chunk(sizeof(first));
    std::memcpy(chunk.data(), first, sizeof(first));
    save_bytes(dir / "0", chunk);

    test::WarningCapture warnings;
    const Element back = read_elem(*store.reopen()->open("f"));
    CELIO_ASSERT_EQ(back.as<DenseArray>(), DenseArray::from<double>({0.5, 1.5, -1.0, -1.0}));
}

CELIO_TEST_UNIT(open_without_root_group_fails) {
    test::TempDir dir;
    CELIO_ASSERT_THROWS((void)ZarrStore::open(dir.path() / "absent.zarr"), FileNotFoundError);
}

CELIO_TEST_END

CELIO_TEST_MAIN()
