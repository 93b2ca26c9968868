// =============================================================================
// celio - Legacy Format Tests
// =============================================================================
//
// Data written before encoding metadata existed: untagged groups and arrays,
// h5sparse-style sparse groups, dataframe 0.1.0 with sibling categories, and
// nodes carrying only half a tag.
//
// =============================================================================

#include "test.hpp"

#include "celio/config.hpp"
#include "celio/spec/registry.hpp"
#include "celio/spec/tag.hpp"

using namespace celio;
using namespace celio::spec;

CELIO_TEST_BEGIN

namespace {

const WriteOptions kPlain = WriteOptions{}.without_compression();

/// Dense form of the 3 x 4 matrix stored by write_h5sparse.
DenseArray h5sparse_dense() {
    return DenseArray::from<double>({1, 0, 0, 2, 0, 3, 0, 0, 0, 0, 0, 0}, {3, 4});
}

/// Untagged h5sparse-style group holding h5sparse_dense() in `format`.
void write_h5sparse(GroupNode& parent, const std::string& key, const std::string& format) {
    const bool csr = format == "csr";
    auto g = parent.create_group(key);
    g->set_attr(config::kLegacySparseAttr, format);
    g->set_attr(config::kLegacySparseShapeAttr, std::vector<std::int64_t>{3, 4});
    if (csr) {
        g->create_array("data", DenseArray::from<double>({1.0, 2.0, 3.0}), kPlain);
        g->create_array("indices", DenseArray::from<std::int32_t>({0, 3, 1}), kPlain);
        g->create_array("indptr", DenseArray::from<std::int32_t>({0, 2, 3, 3}), kPlain);
    } else {
        g->create_array("data", DenseArray::from<double>({1.0, 3.0, 2.0}), kPlain);
        g->create_array("indices", DenseArray::from<std::int32_t>({0, 1, 0}), kPlain);
        g->create_array("indptr", DenseArray::from<std::int32_t>({0, 1, 2, 2, 3}), kPlain);
    }
}

} // namespace

// =============================================================================
// Tags
// =============================================================================

CELIO_TEST_UNIT(tag_display_form) {
    CELIO_ASSERT_EQ((Tag{"csr_matrix", "0.1.0"}.str()), std::string("csr_matrix@0.1.0"));
    CELIO_ASSERT_EQ(Tag{}.str(), std::string("<untagged>"));
    CELIO_ASSERT_TRUE(Tag{}.is_legacy());
    CELIO_ASSERT_FALSE((Tag{"dict", ""}.is_legacy()));
}

CELIO_TEST_UNIT(untagged_node_reads_as_legacy_tag) {
    for (auto kind : test::all_backends()) {
        test::Store store(kind);
        auto g = store.root()->create_group("plain");
        CELIO_ASSERT_TRUE(read_tag(*g).is_legacy());

        write_tag(*g, Tag{"dict", "0.1.0"});
        CELIO_ASSERT_TRUE((read_tag(*store.reopen()->open("plain")) == Tag{"dict", "0.1.0"}));
    }
}

CELIO_TEST_UNIT(half_tag_warns_and_reads_as_untagged) {
    for (auto kind : test::all_backends()) {
        test::Store store(kind);
        auto a = store.root()->create_array("a", DenseArray::from<std::int64_t>({1, 2}), kPlain);
        a->set_attr(config::kEncodingTypeAttr, "array");

        test::WarningCapture warnings;
        const Element back = read_elem(*store.reopen()->open("a"));
        CELIO_ASSERT_EQ(warnings.count(WarningCategory::MalformedTag), Size{1});
        CELIO_ASSERT_EQ(warnings.count(WarningCategory::OldFormat), Size{1});
        CELIO_ASSERT_TRUE(back.as<DenseArray>() == DenseArray::from<std::int64_t>({1, 2}));
    }
}

// =============================================================================
// Untagged Groups and Arrays
// =============================================================================

CELIO_TEST_UNIT(h5sparse_group_reads_as_sparse_with_one_warning) {
    for (auto kind : test::all_backends()) {
        test::Store store(kind);
        write_h5sparse(*store.root(), "X", "csr");

        test::WarningCapture warnings;
        const Element back = read_elem(*store.reopen()->open("X"));
        CELIO_ASSERT_EQ(warnings.size(), Size{1});
        CELIO_ASSERT_EQ(warnings.count(WarningCategory::OldFormat), Size{1});
        CELIO_ASSERT_STR_CONTAINS(warnings.message(0), "X");

        const auto& m = back.as<SparseMatrix>();
        CELIO_ASSERT_TRUE(m.format() == SparseFormat::Csr);
        CELIO_ASSERT_EQ(m.rows(), Size{3});
        CELIO_ASSERT_EQ(m.cols(), Size{4});
        CELIO_ASSERT_EQ(m.nnz(), Size{3});
        CELIO_ASSERT_TRUE(m.to_dense() == h5sparse_dense());
    }
}

CELIO_TEST_UNIT(h5sparse_csc_format_attribute) {
    for (auto kind : test::all_backends()) {
        test::Store store(kind);
        write_h5sparse(*store.root(), "X", "csc");

        test::WarningCapture warnings;
        const Element back = read_elem(*store.reopen()->open("X"));
        CELIO_ASSERT_EQ(warnings.count(WarningCategory::OldFormat), Size{1});

        const auto& m = back.as<SparseMatrix>();
        CELIO_ASSERT_TRUE(m.format() == SparseFormat::Csc);
        CELIO_ASSERT_EQ(m.rows(), Size{3});
        CELIO_ASSERT_EQ(m.cols(), Size{4});
        CELIO_ASSERT_EQ(m.nnz(), Size{3});
        CELIO_ASSERT_TRUE(m.to_dense() == h5sparse_dense());
    }
}

CELIO_TEST_UNIT(untagged_group_reads_as_mapping) {
    for (auto kind : test::all_backends()) {
        test::Store store(kind);
        auto g = store.root()->create_group("uns");
        g->create_array("a", DenseArray::from<std::int32_t>({1, 2, 3}), kPlain);
        g->create_array("b", DenseArray::from<float>({0.5f}), kPlain);

        test::WarningCapture warnings;
        const auto back = read_elem(*store.reopen()->open("uns")).as<Mapping>();
        CELIO_ASSERT_EQ(back.keys(), (std::vector<std::string>{"a", "b"}));
        CELIO_ASSERT_TRUE(back.at("a").as<DenseArray>() == DenseArray::from<std::int32_t>({1, 2, 3}));
        // the group and each of its two arrays
        CELIO_ASSERT_EQ(warnings.count(WarningCategory::OldFormat), Size{3});
    }
}

CELIO_TEST_UNIT(untagged_zero_dim_arrays_become_scalars) {
    for (auto kind : test::all_backends()) {
        test::Store store(kind);
        auto root = store.root();
        root->create_array("s", DenseArray::strings({"hello"}).reshape({}), kPlain);
        root->create_array("n", DenseArray::from<std::int64_t>({7}).reshape({}), kPlain);

        test::WarningCapture warnings;
        auto back = store.reopen();
        CELIO_ASSERT_EQ(read_elem(*back->open("s")).as<std::string>(), std::string("hello"));

        const Element n = read_elem(*back->open("n"));
        CELIO_ASSERT_TRUE(n.is<Scalar>());
        CELIO_ASSERT_EQ(n.as<Scalar>().as_double(), 7.0);
        CELIO_ASSERT_EQ(warnings.size(), Size{2});
    }
}

CELIO_TEST_UNIT(untagged_compound_reads_as_records) {
    for (auto kind : test::all_backends()) {
        test::Store store(kind);
        RecordArray rec;
        rec.add_field("x", DenseArray::from<double>({1.0, 2.0}));
        rec.add_field("y", DenseArray::from<std::int32_t>({3, 4}));
        store.root()->create_records("rec", rec, kPlain);

        test::WarningCapture warnings;
        const Element back = read_elem(*store.reopen()->open("rec"));
        CELIO_ASSERT_TRUE(back.as<RecordArray>() == rec);
    }
}

// =============================================================================
// dataframe 0.1.0
// =============================================================================

CELIO_TEST_UNIT(dataframe_0_1_0_with_sibling_categories) {
    for (auto kind : test::all_backends()) {
        test::Store store(kind);
        auto df = store.root()->create_group("obs");
        df->set_attr(config::kIndexAttr, "_index");
        df->set_attr(config::kColumnOrderAttr, std::vector<std::string>{"cell_type", "n_counts"});
        df->create_array("_index", DenseArray::strings({"c0", "c1", "c2"}), kPlain);

        auto codes = df->create_array("cell_type", DenseArray::from<std::int8_t>({1, 0, -1}), kPlain);
        codes->set_attr(config::kLegacyCategoriesAttr, "__categories/cell_type");
        auto cats_group = df->create_group("__categories");
        auto cats = cats_group->create_array("cell_type", DenseArray::strings({"B", "T"}), kPlain);
        cats->set_attr(config::kLegacyOrderedAttr, true);

        df->create_array("n_counts", DenseArray::from<double>({10.0, 20.0, 30.0}), kPlain);
        write_tag(*df, Tag{"dataframe", "0.1.0"});

        test::WarningCapture warnings;
        auto root = store.reopen();
        const auto back = read_elem(*root->open("obs")).as<DataFrame>();
        CELIO_ASSERT_EQ(back.column_names(), (std::vector<std::string>{"cell_type", "n_counts"}));
        CELIO_ASSERT_FALSE(back.index_name().has_value());
        CELIO_ASSERT_EQ(back.index(), DenseArray::strings({"c0", "c1", "c2"}));

        const auto& ct = back.column("cell_type").as<Categorical>();
        CELIO_ASSERT_TRUE(ct.ordered());
        CELIO_ASSERT_TRUE(ct.is_missing(2));
        CELIO_ASSERT_EQ(ct.categories(), DenseArray::strings({"B", "T"}));

        // only the first axis applies to a 0.1.0 table
        const auto part = read_elem_partial(*root->open("obs"), ItemFilter{"n_counts"},
                                            Indices{std::vector<Index>{2, 0}}).as<DataFrame>();
        CELIO_ASSERT_EQ(part.column_names(), (std::vector<std::string>{"n_counts"}));
        CELIO_ASSERT_EQ(part.column("n_counts").as<DenseArray>(), DenseArray::from<double>({30.0, 10.0}));
    }
}

CELIO_TEST_UNIT(dataframe_without_index_attribute_is_a_read_error) {
    for (auto kind : test::all_backends()) {
        test::Store store(kind);
        auto df = store.root()->create_group("obs");
        df->set_attr(config::kColumnOrderAttr, std::vector<std::string>{});
        write_tag(*df, Tag{"dataframe", "0.2.0"});

        CELIO_ASSERT_THROWS((void)read_elem(*store.reopen()->open("obs")), ReadError);
    }
}

// =============================================================================
// bytes
// =============================================================================

CELIO_TEST_UNIT(bytes_tag_reads_uint8_payload) {
    for (auto kind : test::all_backends()) {
        test::Store store(kind);
        auto a = store.root()->create_array("blob", DenseArray::from<std::uint8_t>({0x61, 0x00, 0x62}), kPlain);
        write_tag(*a, Tag{"bytes", "0.2.0"});

        const Element back = read_elem(*store.reopen()->open("blob"));
        CELIO_ASSERT_EQ(back.as<Bytes>().data, std::string("a\0b", 3));
    }
}

CELIO_TEST_END

CELIO_TEST_MAIN()
