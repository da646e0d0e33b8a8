/**@file
 *****************************************************************************
    Enum for the algorithms that evaluate a multilinear extension
 *****************************************************************************
 * @author     This file is part of libmle (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBMLE_MULTILINEAR_EVALUATION_TYPE_HPP_
#define LIBMLE_MULTILINEAR_EVALUATION_TYPE_HPP_

#include <string>
#include <vector>

namespace libmle {

/** Every strategy must produce exactly the naive result for the same oracle and point. */
enum mle_evaluation_type {
    /* Brute force sum over the hypercube, O(d * 2^d) time */
    naive_evaluation_type = 1,
    zhu_evaluation_type = 2,
    rothblum_evaluation_type = 3,
    ramakrishna_evaluation_type = 4
};

static const char* mle_evaluation_type_names[] = {"", "naive", "zhu", "rothblum", "ramakrishna"};

extern std::vector<mle_evaluation_type> all_mle_evaluation_types;

/* Inverse of mle_evaluation_type_names, throws std::invalid_argument on an unknown name. */
mle_evaluation_type mle_evaluation_type_from_name(const std::string &name);

} // namespace libmle

#endif // LIBMLE_MULTILINEAR_EVALUATION_TYPE_HPP_
