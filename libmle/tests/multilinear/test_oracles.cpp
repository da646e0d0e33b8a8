#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <gtest/gtest.h>
#include <random>
#include <utility>
#include <vector>

#include <libff/algebra/curves/edwards/edwards_pp.hpp>
#include <libff/algebra/fields/binary/gf64.hpp>
#include <libff/common/profiling.hpp>
#include "libmle/multilinear/oracles.hpp"
#include "libmle/tests/common/small_prime_field.hpp"

namespace libmle {

template<typename FieldT>
std::vector<FieldT> values_up_to(const std::size_t n)
{
    std::vector<FieldT> values;
    for (std::size_t i = 0; i < n; ++i)
    {
        values.emplace_back(FieldT(i + 1));
    }
    return values;
}

template<typename FieldT>
hypercube_map<FieldT> canonical_entries(const std::vector<FieldT> &values, const std::size_t dim)
{
    hypercube_map<FieldT> entries;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        entries.emplace_back(hypercube_point<FieldT>(dim, i), values[i]);
    }
    return entries;
}

template<typename FieldT>
std::vector<std::size_t> visited_indices(const boolean_hypercube_oracle<FieldT> &oracle)
{
    std::vector<std::size_t> indices;
    oracle.for_each_point([&indices](const std::size_t index, const FieldT &) {
        indices.emplace_back(index);
    });
    return indices;
}

TEST(DenseOracleTest, ConstructionAndQuery) {
    typedef gf7 FieldT;
    const std::vector<FieldT> values({FieldT(1), FieldT(2), FieldT(3), FieldT(4)});
    const dense_hypercube_oracle<FieldT> oracle(2, values);

    EXPECT_EQ(oracle.dimension(), 2ull);
    EXPECT_EQ(oracle.num_points(), 4ull);
    EXPECT_TRUE(oracle.evaluations() == values);
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        EXPECT_TRUE(oracle.query(i) == values[i]);
        EXPECT_TRUE(oracle.query_point(hypercube_point<FieldT>(2, i)) == values[i]);
    }

    /* index 1 is the point (1, 0) */
    EXPECT_TRUE(oracle.query_point(std::vector<FieldT>({FieldT::one(), FieldT::zero()})) == FieldT(2));

    const std::vector<std::size_t> indices = visited_indices(oracle);
    EXPECT_EQ(indices, std::vector<std::size_t>({0, 1, 2, 3}));
}

TEST(DenseOracleTest, IncorrectSize) {
    typedef gf7 FieldT;
    for (std::size_t dim = 0; dim < 5; ++dim)
    {
        const std::size_t n = 1ull << dim;
        EXPECT_EQ(dense_hypercube_oracle<FieldT>(dim, values_up_to<FieldT>(n)).num_points(), n);
        for (const std::size_t wrong : {n - 1, n + 1, 2 * n})
        {
            try
            {
                dense_hypercube_oracle<FieldT> oracle(dim, values_up_to<FieldT>(wrong));
                FAIL() << "accepted " << wrong << " values for dimension " << dim;
            }
            catch (const oracle_error &e)
            {
                EXPECT_EQ(e.type(), incorrect_oracle_size);
            }
        }
    }

    EXPECT_THROW(dense_hypercube_oracle<FieldT>(200, values_up_to<FieldT>(4)), oracle_error);
}

TEST(DenseOracleTest, QueryErrors) {
    typedef gf7 FieldT;
    const dense_hypercube_oracle<FieldT> oracle(2, values_up_to<FieldT>(4));

    try
    {
        oracle.query(4);
        FAIL() << "out of range index was accepted";
    }
    catch (const oracle_error &e)
    {
        EXPECT_EQ(e.type(), point_not_found);
    }

    try
    {
        oracle.query_point(std::vector<FieldT>({FieldT::one()}));
        FAIL() << "short point was accepted";
    }
    catch (const oracle_error &e)
    {
        EXPECT_EQ(e.type(), incorrect_oracle_point_dimension);
        EXPECT_EQ(e.expected(), 2ull);
        EXPECT_EQ(e.found(), 1ull);
    }

    try
    {
        oracle.query_point(std::vector<FieldT>({FieldT::one(), FieldT(5)}));
        FAIL() << "nonboolean point was accepted";
    }
    catch (const oracle_error &e)
    {
        EXPECT_EQ(e.type(), nonboolean_oracle_point);
    }
}

TEST(DenseOracleTest, RandomOracle) {
    libff::inhibit_profiling_info = true;
    libff::edwards_pp::init_public_params();
    typedef libff::edwards_Fr FieldT;

    for (std::size_t dim = 0; dim < 8; ++dim)
    {
        const dense_hypercube_oracle<FieldT> oracle = dense_hypercube_oracle<FieldT>::random_oracle(dim);
        EXPECT_EQ(oracle.dimension(), dim);
        EXPECT_EQ(oracle.evaluations().size(), 1ull << dim);
        EXPECT_EQ(visited_indices(oracle).size(), 1ull << dim);
    }
}

TEST(SparseOracleTest, ConstructionAndQuery) {
    typedef gf7 FieldT;
    const std::size_t dim = 3;
    const std::vector<FieldT> values = values_up_to<FieldT>(8);
    hypercube_map<FieldT> entries = canonical_entries(values, dim);
    std::reverse(entries.begin(), entries.end());

    const sparse_hypercube_oracle<FieldT> oracle(dim, entries);
    EXPECT_EQ(oracle.dimension(), dim);
    EXPECT_EQ(oracle.entries().size(), 8ull);
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        EXPECT_TRUE(oracle.query(i) == values[i]);
        EXPECT_TRUE(oracle.query_point(hypercube_point<FieldT>(dim, i)) == values[i]);
    }

    /* Traversal follows insertion order. */
    EXPECT_EQ(visited_indices(oracle), std::vector<std::size_t>({7, 6, 5, 4, 3, 2, 1, 0}));

    oracle.for_each_point([&values](const std::size_t index, const FieldT &value) {
        EXPECT_TRUE(value == values[index]);
    });
}

TEST(SparseOracleTest, IncorrectSize) {
    typedef gf7 FieldT;
    hypercube_map<FieldT> entries = canonical_entries(values_up_to<FieldT>(4), 2);
    entries.pop_back();

    try
    {
        sparse_hypercube_oracle<FieldT> oracle(2, entries);
        FAIL() << "three entries accepted for dimension 2";
    }
    catch (const oracle_error &e)
    {
        EXPECT_EQ(e.type(), incorrect_oracle_size);
    }

    /* A repeated key leaves a point of the hypercube without a value. */
    const std::pair<std::vector<FieldT>, FieldT> repeated = entries[0];
    entries.emplace_back(repeated);
    try
    {
        sparse_hypercube_oracle<FieldT> oracle(2, entries);
        FAIL() << "repeated key accepted";
    }
    catch (const oracle_error &e)
    {
        EXPECT_EQ(e.type(), incorrect_oracle_size);
    }
}

TEST(SparseOracleTest, IncorrectPointDimension) {
    typedef gf7 FieldT;
    hypercube_map<FieldT> entries = canonical_entries(values_up_to<FieldT>(4), 2);
    entries[2].first.emplace_back(FieldT::zero());

    try
    {
        sparse_hypercube_oracle<FieldT> oracle(2, entries);
        FAIL() << "key of length 3 accepted for dimension 2";
    }
    catch (const oracle_error &e)
    {
        EXPECT_EQ(e.type(), incorrect_oracle_point_dimension);
        EXPECT_EQ(e.expected(), 2ull);
        EXPECT_EQ(e.found(), 3ull);
    }
}

TEST(SparseOracleTest, NonbooleanPoint) {
    typedef gf7 FieldT;
    hypercube_map<FieldT> entries = canonical_entries(values_up_to<FieldT>(4), 2);
    entries[1].first[1] = FieldT(3);

    try
    {
        sparse_hypercube_oracle<FieldT> oracle(2, entries);
        FAIL() << "nonboolean key accepted";
    }
    catch (const oracle_error &e)
    {
        EXPECT_EQ(e.type(), nonboolean_oracle_point);
    }
}

TEST(SparseOracleTest, SizeIsCheckedBeforeKeys) {
    typedef gf7 FieldT;
    hypercube_map<FieldT> entries = canonical_entries(values_up_to<FieldT>(4), 2);
    entries[0].first[0] = FieldT(3);
    entries.pop_back();

    try
    {
        sparse_hypercube_oracle<FieldT> oracle(2, entries);
        FAIL() << "malformed map accepted";
    }
    catch (const oracle_error &e)
    {
        EXPECT_EQ(e.type(), incorrect_oracle_size);
    }
}

TEST(SparseOracleTest, QueryErrors) {
    typedef gf7 FieldT;
    const sparse_hypercube_oracle<FieldT> oracle(1, canonical_entries(values_up_to<FieldT>(2), 1));

    EXPECT_THROW(oracle.query(2), oracle_error);
    try
    {
        oracle.query(17);
        FAIL() << "absent index was found";
    }
    catch (const oracle_error &e)
    {
        EXPECT_EQ(e.type(), point_not_found);
    }

    try
    {
        oracle.query_point(std::vector<FieldT>({FieldT(4)}));
        FAIL() << "nonboolean point was accepted";
    }
    catch (const oracle_error &e)
    {
        EXPECT_EQ(e.type(), nonboolean_oracle_point);
    }
}

TEST(SparseOracleTest, RandomOracle) {
    libff::inhibit_profiling_info = true;
    typedef libff::gf64 FieldT;

    for (std::size_t dim = 0; dim < 8; ++dim)
    {
        const sparse_hypercube_oracle<FieldT> oracle = sparse_hypercube_oracle<FieldT>::random_oracle(dim);
        EXPECT_EQ(oracle.dimension(), dim);
        ASSERT_EQ(oracle.entries().size(), 1ull << dim);

        /* Keys are generated in index order. */
        std::vector<std::size_t> expected(1ull << dim);
        for (std::size_t i = 0; i < expected.size(); ++i)
        {
            expected[i] = i;
            EXPECT_TRUE(oracle.entries()[i].first == hypercube_point<FieldT>(dim, i));
        }
        EXPECT_EQ(visited_indices(oracle), expected);
    }
}

TEST(OracleTest, DenseAndSparseAgree) {
    typedef gf7 FieldT;
    const std::size_t dim = 4;
    const std::vector<FieldT> values = values_up_to<FieldT>(16);

    hypercube_map<FieldT> entries = canonical_entries(values, dim);
    std::mt19937_64 rng(42);
    std::shuffle(entries.begin(), entries.end(), rng);

    const dense_hypercube_oracle<FieldT> dense(dim, values);
    const sparse_hypercube_oracle<FieldT> sparse(dim, entries);
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        EXPECT_TRUE(dense.query(i) == sparse.query(i));
    }

    std::vector<std::size_t> sparse_indices = visited_indices(sparse);
    std::sort(sparse_indices.begin(), sparse_indices.end());
    EXPECT_EQ(sparse_indices, visited_indices(dense));
}

}
