/**@file
 *****************************************************************************
 Errors raised when constructing or querying Boolean hypercube oracles and
 when evaluating multilinear extensions.
 *****************************************************************************
 * @author     This file is part of libmle (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBMLE_MULTILINEAR_ERRORS_HPP_
#define LIBMLE_MULTILINEAR_ERRORS_HPP_

#include <cstddef>
#include <stdexcept>
#include <string>

#include "libmle/multilinear/evaluation_type.hpp"

namespace libmle {

enum oracle_error_type {
    /* number of stored entries differs from 2^dim */
    incorrect_oracle_size = 1,
    /* a key or query point has the wrong number of coordinates */
    incorrect_oracle_point_dimension = 2,
    /* a key or query point has a coordinate outside {0, 1} */
    nonboolean_oracle_point = 3,
    point_not_found = 4
};

class oracle_error : public std::invalid_argument {
protected:
    oracle_error_type type_;
    std::size_t expected_;
    std::size_t found_;

public:
    explicit oracle_error(const oracle_error_type type);
    /* Only meaningful for incorrect_oracle_point_dimension. */
    oracle_error(const oracle_error_type type,
                 const std::size_t expected,
                 const std::size_t found);

    oracle_error_type type() const;
    std::size_t expected() const;
    std::size_t found() const;
};

enum mle_error_type {
    /* evaluation point length differs from the extension's dimension */
    wrong_dimension = 1,
    /* Lagrange basis given a hypercube point and an evaluation point of different lengths */
    inconsistent_dimensions = 2,
    /* the oracle failed while the extension was being evaluated */
    oracle_failure = 3,
    strategy_not_implemented = 4
};

static const char* mle_error_type_names[] = {"", "wrong dimension", "inconsistent dimensions",
    "oracle failure", "strategy not implemented"};

class mle_error : public std::runtime_error {
protected:
    mle_error_type type_;
    std::size_t expected_;
    std::size_t found_;
    oracle_error_type inner_type_;
    mle_evaluation_type strategy_;

    mle_error(const mle_error_type type, const std::string &message);

public:
    /* expected/found are (expected, found) for wrong_dimension and (b_dim, z_dim)
       for inconsistent_dimensions. */
    static mle_error wrong_dimension_error(const std::size_t expected, const std::size_t found);
    static mle_error inconsistent_dimensions_error(const std::size_t b_dim, const std::size_t z_dim);
    static mle_error oracle_failure_error(const oracle_error &inner);
    static mle_error strategy_not_implemented_error(const mle_evaluation_type strategy);

    mle_error_type type() const;

    std::size_t expected() const;
    std::size_t found() const;
    std::size_t b_dim() const;
    std::size_t z_dim() const;

    /* Valid only for oracle_failure. */
    oracle_error_type inner_type() const;
    /* Valid only for strategy_not_implemented. */
    mle_evaluation_type strategy() const;
};

} // namespace libmle

#endif // LIBMLE_MULTILINEAR_ERRORS_HPP_
