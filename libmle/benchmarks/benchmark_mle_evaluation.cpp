#include <cstddef>
#include <memory>
#include <vector>
#include <benchmark/benchmark.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libff/algebra/fields/binary/gf64.hpp>
#include <libff/common/profiling.hpp>
#include "libmle/algebra/utils.hpp"
#include "libmle/multilinear/multilinear_extension.hpp"

namespace libmle {

template<typename FieldT, typename oracle_type>
static void BM_naive_mle_evaluation(benchmark::State &state)
{
    libff::inhibit_profiling_info = true;
    const std::size_t dim = state.range(0);

    const multilinear_extension<FieldT> mle(
        std::make_shared<oracle_type>(oracle_type::random_oracle(dim)), dim, naive_evaluation_type);
    const std::vector<FieldT> z = random_FieldT_vector<FieldT>(dim);

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(mle.evaluate(z));
    }

    state.SetItemsProcessed(state.iterations() * hypercube_size(dim));
}

static void BM_alt_bn128_dense_naive_mle(benchmark::State &state)
{
    libff::alt_bn128_pp::init_public_params();
    BM_naive_mle_evaluation<libff::alt_bn128_Fr, dense_hypercube_oracle<libff::alt_bn128_Fr> >(state);
}

BENCHMARK(BM_alt_bn128_dense_naive_mle)->DenseRange(4, 20, 2)->Unit(benchmark::kMillisecond);

static void BM_alt_bn128_sparse_naive_mle(benchmark::State &state)
{
    libff::alt_bn128_pp::init_public_params();
    BM_naive_mle_evaluation<libff::alt_bn128_Fr, sparse_hypercube_oracle<libff::alt_bn128_Fr> >(state);
}

BENCHMARK(BM_alt_bn128_sparse_naive_mle)->DenseRange(4, 16, 2)->Unit(benchmark::kMillisecond);

static void BM_gf64_dense_naive_mle(benchmark::State &state)
{
    BM_naive_mle_evaluation<libff::gf64, dense_hypercube_oracle<libff::gf64> >(state);
}

BENCHMARK(BM_gf64_dense_naive_mle)->DenseRange(4, 20, 2)->Unit(benchmark::kMillisecond);

static void BM_alt_bn128_random_dense_oracle(benchmark::State &state)
{
    libff::inhibit_profiling_info = true;
    libff::alt_bn128_pp::init_public_params();
    typedef libff::alt_bn128_Fr FieldT;
    const std::size_t dim = state.range(0);

    for (auto _ : state)
    {
        const dense_hypercube_oracle<FieldT> oracle = dense_hypercube_oracle<FieldT>::random_oracle(dim);
        benchmark::DoNotOptimize(oracle.evaluations().data());
    }

    state.SetItemsProcessed(state.iterations() * hypercube_size(dim));
}

BENCHMARK(BM_alt_bn128_random_dense_oracle)->DenseRange(4, 16, 4)->Unit(benchmark::kMicrosecond);

}

BENCHMARK_MAIN();
