#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef CPPDEBUG /* Ubuntu's Boost does not provide binaries compatible with libstdc++'s debug mode so we just reduce functionality here */
#include <boost/program_options.hpp>
#endif

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libff/algebra/curves/edwards/edwards_pp.hpp>
#include <libff/algebra/fields/binary/gf64.hpp>
#include <libff/common/profiling.hpp>
#include <libff/common/utils.hpp>

#include "libmle/algebra/utils.hpp"
#include "libmle/multilinear/evaluation_type.hpp"
#include "libmle/multilinear/multilinear_extension.hpp"

using namespace libmle;

struct options {
    std::size_t dim_min = 4;
    std::size_t dim_max = 20;
    std::size_t num_runs = 5;
    std::string strategy = "naive";
    std::string oracle_type = "dense";
    std::string field = "alt_bn128";
    bool print_result = false;
};

#ifndef CPPDEBUG
bool process_command_line(const int argc, const char** argv, options &options)
{
    namespace po = boost::program_options;

    try
    {
        po::options_description desc("Usage");
        desc.add_options()
            ("help", "print this help message")
            ("dim_min", po::value<std::size_t>(&options.dim_min)->default_value(options.dim_min))
            ("dim_max", po::value<std::size_t>(&options.dim_max)->default_value(options.dim_max))
            ("num_runs", po::value<std::size_t>(&options.num_runs)->default_value(options.num_runs),
             "Fresh oracles and points evaluated per dimension")
            ("strategy", po::value<std::string>(&options.strategy)->default_value(options.strategy),
             "naive, zhu, rothblum or ramakrishna")
            ("oracle_type", po::value<std::string>(&options.oracle_type)->default_value(options.oracle_type),
             "dense or sparse")
            ("field", po::value<std::string>(&options.field)->default_value(options.field),
             "alt_bn128, edwards or gf64")
            ("print_result", po::bool_switch(&options.print_result),
             "Print the evaluation point and the value of the last run");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << "\n";
            return false;
        }

        po::notify(vm);
    }
    catch(std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }

    return true;
}
#endif

template<typename FieldT>
std::shared_ptr<const boolean_hypercube_oracle<FieldT> > random_oracle(const std::string &oracle_type,
                                                                         const std::size_t dim)
{
    if (oracle_type == "dense")
    {
        return std::make_shared<dense_hypercube_oracle<FieldT> >(
            dense_hypercube_oracle<FieldT>::random_oracle(dim));
    }
    else if (oracle_type == "sparse")
    {
        return std::make_shared<sparse_hypercube_oracle<FieldT> >(
            sparse_hypercube_oracle<FieldT>::random_oracle(dim));
    }
    throw std::invalid_argument("Oracle type not supported.");
}

template<typename FieldT>
void instrument_mle_evaluation(const options &options, const mle_evaluation_type strategy)
{
    for (std::size_t dim = options.dim_min; dim <= options.dim_max; ++dim)
    {
        libff::print_separator();
        printf("Dimension: %zu\n", dim);
        printf("Number of points: 2^%zu = %zu\n\n", dim, hypercube_size(dim));

        long long total_time = 0;
        for (std::size_t run = 0; run < options.num_runs; ++run)
        {
            const std::shared_ptr<const boolean_hypercube_oracle<FieldT> > oracle =
                random_oracle<FieldT>(options.oracle_type, dim);

            const std::vector<FieldT> z = random_FieldT_vector<FieldT>(dim);

            const multilinear_extension<FieldT> mle(oracle, dim, strategy);

            libff::enter_block("Evaluate multilinear extension");
            const long long start = libff::get_nsec_time();
            const FieldT result = mle.evaluate(z);
            total_time += libff::get_nsec_time() - start;
            libff::leave_block("Evaluate multilinear extension");

            if (options.print_result && run + 1 == options.num_runs)
            {
                printf("Point z:\n");
                for (const FieldT &z_j : z)
                {
                    z_j.print();
                }
                printf("Evaluated MLE at z:\n");
                result.print();
            }
        }

        const double avg_time_ms = options.num_runs == 0 ? 0 :
            total_time * 1e-6 / options.num_runs;
        printf("\n");
        libff::print_indent(); printf("* Oracle type: %s\n", options.oracle_type.c_str());
        libff::print_indent(); printf("* Runs: %zu\n", options.num_runs);
        libff::print_indent(); printf("* Average evaluation time: %.3f ms\n", avg_time_ms);
    }
}

int main(int argc, const char * argv[])
{
    options default_vals;

#ifdef CPPDEBUG
    /* set reasonable defaults */
    if (argc > 1)
    {
        printf("There is no argument parsing in CPPDEBUG mode.");
        exit(1);
    }
    libff::UNUSED(argv);
#else
    if (!process_command_line(argc, argv, default_vals))
    {
        return 1;
    }
#endif

    libff::start_profiling();

    printf("Selected parameters:\n");
    printf("* dim_min = %zu\n", default_vals.dim_min);
    printf("* dim_max = %zu\n", default_vals.dim_max);
    printf("* num_runs = %zu\n", default_vals.num_runs);
    printf("* strategy = %s\n", default_vals.strategy.c_str());
    printf("* oracle_type = %s\n", default_vals.oracle_type.c_str());
    printf("* field = %s\n", default_vals.field.c_str());

    try
    {
        const mle_evaluation_type strategy = mle_evaluation_type_from_name(default_vals.strategy);

        if (default_vals.field == "alt_bn128")
        {
            libff::alt_bn128_pp::init_public_params();
            instrument_mle_evaluation<libff::alt_bn128_Fr>(default_vals, strategy);
        }
        else if (default_vals.field == "edwards")
        {
            libff::edwards_pp::init_public_params();
            instrument_mle_evaluation<libff::edwards_Fr>(default_vals, strategy);
        }
        else if (default_vals.field == "gf64")
        {
            instrument_mle_evaluation<libff::gf64>(default_vals, strategy);
        }
        else
        {
            throw std::invalid_argument("Field not supported.");
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
