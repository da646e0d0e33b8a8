/**@file
 *****************************************************************************
 Points of the Boolean hypercube {0,1}^d embedded in F^d, and the
 multilinear Lagrange basis eq(b, z) = prod_j (b_j z_j + (1 - b_j)(1 - z_j)).

 A point is addressed either by its index i in [0, 2^d), where bit j of i
 (least significant first) is coordinate j, or explicitly as a length d
 vector of field elements in {0, 1}.
 *****************************************************************************
 * @author     This file is part of libmle (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBMLE_MULTILINEAR_HYPERCUBE_HPP_
#define LIBMLE_MULTILINEAR_HYPERCUBE_HPP_

#include <cstddef>
#include <vector>

#include "libmle/common/common.hpp"
#include "libmle/multilinear/errors.hpp"

namespace libmle {

template<typename FieldT>
bool is_boolean(const FieldT &x);

template<typename FieldT>
bool is_boolean_point(const std::vector<FieldT> &point);

/* Explicit encoding of the point with the given index. Coordinates past the
   width of std::size_t are 0. */
template<typename FieldT>
std::vector<FieldT> hypercube_point(const std::size_t dimension, const std::size_t index);

/* Index of an explicit point. Throws oracle_error with
   incorrect_oracle_point_dimension if point.size() != dimension, and with
   nonboolean_oracle_point if a coordinate is outside {0, 1}. */
template<typename FieldT>
std::size_t hypercube_index(const std::size_t dimension, const std::vector<FieldT> &point);

/* (1 - z_0, ..., 1 - z_{d-1}) */
template<typename FieldT>
std::vector<FieldT> one_minus_point(const std::vector<FieldT> &z);

/* eq(point(index), z), selecting z[j] when bit j of index is set and
   one_minus_z[j] otherwise. Both vectors must have length d. */
template<typename FieldT>
FieldT lagrange_basis_at_index(const std::size_t index,
                               const std::vector<FieldT> &z,
                               const std::vector<FieldT> &one_minus_z);

/* eq(b, z) for arbitrary b, z in F^d. Throws mle_error with
   inconsistent_dimensions if b.size() != z.size(). */
template<typename FieldT>
FieldT lagrange_basis(const std::vector<FieldT> &b, const std::vector<FieldT> &z);

} // namespace libmle

#include "libmle/multilinear/hypercube.tcc"

#endif // LIBMLE_MULTILINEAR_HYPERCUBE_HPP_
