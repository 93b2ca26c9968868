// =============================================================================
// celio - Value Model Tests
// =============================================================================
//
// In-memory element types: selection semantics, construction invariants,
// equality and element-kind classification.
//
// =============================================================================

#include "test.hpp"

#include "celio/core/element.hpp"

#include <cmath>
#include <limits>

using namespace celio;

CELIO_TEST_BEGIN

// =============================================================================
// Selection
// =============================================================================

CELIO_TEST_UNIT(slice_negative_bounds_count_from_end) {
    const auto sel = resolve_selector(Slice::range(-3, -1), 10);
    CELIO_ASSERT_TRUE(sel.is_range);
    CELIO_ASSERT_EQ(sel.start, Size{7});
    CELIO_ASSERT_EQ(sel.size(), Size{2});
}

CELIO_TEST_UNIT(slice_bounds_are_clamped) {
    const auto sel = resolve_selector(Slice::range(5, 100, 2), 10);
    CELIO_ASSERT_EQ(sel.size(), Size{3});
    CELIO_ASSERT_EQ(sel[2], Size{9});

    const auto empty = resolve_selector(Slice::range(8, 2), 10);
    CELIO_ASSERT_EQ(empty.size(), Size{0});
}

CELIO_TEST_UNIT(index_list_wraps_and_keeps_order) {
    const auto sel = resolve_selector(std::vector<Index>{4, -1, 0, 4}, 5);
    CELIO_ASSERT_FALSE(sel.is_range);
    CELIO_ASSERT_EQ(sel.size(), Size{4});
    CELIO_ASSERT_EQ(sel[1], Size{4});
    CELIO_ASSERT_FALSE(sel.is_monotone());

    CELIO_ASSERT_TRUE(resolve_selector(std::vector<Index>{0, 2, -1}, 5).is_monotone());
    CELIO_ASSERT_TRUE(resolve_selector(Slice::range(1, 4), 5).is_monotone());
}

CELIO_TEST_UNIT(index_list_out_of_bounds) {
    CELIO_ASSERT_THROWS(resolve_selector(std::vector<Index>{5}, 5), IndexOutOfBoundsError);
    CELIO_ASSERT_THROWS(resolve_selector(std::vector<Index>{-6}, 5), IndexOutOfBoundsError);
}

CELIO_TEST_UNIT(too_many_indices) {
    CELIO_ASSERT_THROWS(resolve_indices({Slice::all(), Slice::all()}, {3}), IndexOutOfBoundsError);
}

// =============================================================================
// DenseArray
// =============================================================================

CELIO_TEST_UNIT(dense_take_two_axes) {
    // 3 x 4, row-major 0..11
    std::vector<std::int32_t> v(12);
    for (int i = 0; i < 12; ++i) v[i] = i;
    const auto a = DenseArray::from(v, {3, 4});

    const auto t = a.take(Indices{std::vector<Index>{2, 0}, Slice::range(1, 4, 2)});
    CELIO_ASSERT_EQ(t.shape(), (std::vector<Size>{2, 2}));
    CELIO_ASSERT_EQ(t.values<std::int32_t>()[0], 9);
    CELIO_ASSERT_EQ(t.values<std::int32_t>()[1], 11);
    CELIO_ASSERT_EQ(t.values<std::int32_t>()[2], 1);
    CELIO_ASSERT_EQ(t.values<std::int32_t>()[3], 3);
}

CELIO_TEST_UNIT(dense_equality_treats_nan_as_equal) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const auto a = DenseArray::from<double>({1.0, nan});
    const auto b = DenseArray::from<double>({1.0, nan});
    CELIO_ASSERT_TRUE(a == b);
    CELIO_ASSERT_FALSE(a == DenseArray::from<float>({1.0f, 2.0f}));
}

CELIO_TEST_UNIT(string_and_object_arrays_compare_as_text) {
    const auto s = DenseArray::strings({"a", "b"});
    const auto o = DenseArray::strings({"a", "b"}, {}, DType::Object);
    CELIO_ASSERT_TRUE(s == o);
    CELIO_ASSERT_EQ(s.kind(), ElementKind::Text);
    CELIO_ASSERT_EQ(o.kind(), ElementKind::Object);
}

// =============================================================================
// Columns
// =============================================================================

CELIO_TEST_UNIT(categorical_rejects_out_of_range_codes) {
    const auto cats = DenseArray::strings({"a", "b"});
    CELIO_ASSERT_THROWS(Categorical(DenseArray::from<std::int8_t>({0, 2}), cats), ValueError);
    CELIO_ASSERT_THROWS(Categorical(DenseArray::from<std::int8_t>({-2}), cats), ValueError);
    CELIO_ASSERT_NO_THROW(Categorical(DenseArray::from<std::int8_t>({-1, 1}), cats));
}

CELIO_TEST_UNIT(categorical_from_values_sorts_categories) {
    const auto c = Categorical::from_values({"z", "a", "z", "na"}, false, std::string("na"));
    CELIO_ASSERT_EQ(c.categories(), DenseArray::strings({"a", "z"}));
    CELIO_ASSERT_TRUE(c.is_missing(3));
    CELIO_ASSERT_EQ(c.codes().as_index(0), Index{1});
}

CELIO_TEST_UNIT(nullable_kind_follows_values) {
    NullableArray ints(DenseArray::from<std::int64_t>({1, 2, 3}),
                       DenseArray::from<bool>({false, true, false}));
    CELIO_ASSERT_TRUE(ints.kind() == NullableKind::Integer);
    CELIO_ASSERT_FALSE(ints.is_valid(1));

    NullableArray flags(DenseArray::from<bool>({true, false}));
    CELIO_ASSERT_TRUE(flags.kind() == NullableKind::Boolean);
    CELIO_ASSERT_THROWS(NullableArray(DenseArray::from<double>({1.0})), TypeError);
}

// =============================================================================
// DataFrame
// =============================================================================

CELIO_TEST_UNIT(dataframe_column_length_checked) {
    DataFrame df(DenseArray::strings({"r0", "r1"}));
    CELIO_ASSERT_NO_THROW(df.add_column("x", DenseArray::from<double>({1.0, 2.0})));
    CELIO_ASSERT_THROWS(df.add_column("y", DenseArray::from<double>({1.0})), DimensionError);
}

CELIO_TEST_UNIT(dataframe_take_rows_slices_every_column) {
    DataFrame df(DenseArray::strings({"r0", "r1", "r2"}), std::string("cell"));
    df.add_column("n", DenseArray::from<std::int32_t>({10, 11, 12}));
    df.add_column("c", Categorical::from_values({"b", "a", "b"}));

    const DataFrame sub = df.take_rows(std::vector<Index>{2, 0});
    CELIO_ASSERT_EQ(sub.num_rows(), Size{2});
    CELIO_ASSERT_EQ(sub.index(), DenseArray::strings({"r2", "r0"}));
    CELIO_ASSERT_EQ(sub.column("n").as<DenseArray>(), DenseArray::from<std::int32_t>({12, 10}));
    CELIO_ASSERT_EQ(sub.index_name().value_or(""), std::string("cell"));
}

// =============================================================================
// Sparse
// =============================================================================

CELIO_TEST_UNIT(sparse_constructor_validates_structure) {
    const auto data = DenseArray::from<float>({1.0f, 2.0f});
    const auto indices = DenseArray::from<std::int32_t>({0, 5});
    const auto indptr = DenseArray::from<std::int32_t>({0, 1, 2});
    // column 5 does not exist in a 2 x 3 matrix
    CELIO_ASSERT_THROWS(SparseMatrix(SparseFormat::Csr, 2, 3, data, indices, indptr), ValueError);
}

CELIO_TEST_UNIT(sparse_slice_matches_dense_oracle) {
    const auto eigen = test::random_csr(12, 9, 0.3);
    const SparseMatrix m = test::from_eigen(eigen);
    const auto rows = std::vector<Index>{7, 1, 1, 11};

    const SparseMatrix s = m.slice(Indices{rows, Slice::range(2, 8)});
    const auto expected = test::take_block(test::EigenDense(eigen.toDense()), rows, test::range_positions(2, 8));
    CELIO_ASSERT_TRUE(test::matrices_equal(test::to_eigen_dense(s), expected));
}

// =============================================================================
// Element
// =============================================================================

CELIO_TEST_UNIT(element_type_splits_sparse_and_nullable) {
    const Element csr = SparseMatrix::empty(SparseFormat::Csr, 2, 2);
    const Element csc = SparseMatrix::empty(SparseFormat::Csc, 2, 2);
    CELIO_ASSERT_TRUE(csr.type() == ElementType::CsrMatrix);
    CELIO_ASSERT_TRUE(csc.type() == ElementType::CscMatrix);

    const Element flags = NullableArray(DenseArray::from<bool>({true}));
    CELIO_ASSERT_TRUE(flags.type() == ElementType::NullableBoolean);
}

CELIO_TEST_UNIT(element_kind_only_for_array_like_values) {
    const Element text = DenseArray::strings({"a"});
    CELIO_ASSERT_TRUE(text.element_kind() == ElementKind::Text);

    const Element rec = RecordArray{};
    CELIO_ASSERT_TRUE(rec.element_kind() == ElementKind::Record);

    const Element map = Mapping{};
    CELIO_ASSERT_FALSE(map.element_kind().has_value());
}

CELIO_TEST_UNIT(mapping_equality_ignores_key_order) {
    const Mapping a{{"x", Scalar(1.0)}, {"y", std::string("s")}};
    const Mapping b{{"y", std::string("s")}, {"x", Scalar(1.0)}};
    CELIO_ASSERT_TRUE(a == b);
}

CELIO_TEST_END

CELIO_TEST_MAIN()
