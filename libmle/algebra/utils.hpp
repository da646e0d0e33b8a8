/**@file
 *****************************************************************************
 Useful operations over vectors of field elements.
 *****************************************************************************
 * @author     This file is part of libmle (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBMLE_ALGEBRA_UTILS_HPP_
#define LIBMLE_ALGEBRA_UTILS_HPP_

#include <cstddef>
#include <vector>

namespace libmle {

/* count independent elements drawn with FieldT::random_element() */
template<typename FieldT>
std::vector<FieldT> random_FieldT_vector(const std::size_t count);

} // namespace libmle

#include "libmle/algebra/utils.tcc"

#endif // LIBMLE_ALGEBRA_UTILS_HPP_
