/**@file
 *****************************************************************************
 Common routines for working with the Boolean hypercube {0,1}^d.
 *****************************************************************************
 * @author     This file is part of libmle (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBMLE_COMMON_COMMON_HPP_
#define LIBMLE_COMMON_COMMON_HPP_

#include <cstddef>
#include <limits>

namespace libmle {

/* Largest dimension for which 2^dimension fits in a std::size_t. */
std::size_t max_hypercube_dimension();

bool is_representable_hypercube_dimension(const std::size_t dimension);

/* Number of points 2^dimension of {0,1}^dimension.
   Throws std::overflow_error if it does not fit in a std::size_t. */
std::size_t hypercube_size(const std::size_t dimension);

/* Coordinate j of the point with the given index, i.e. bit j of index.
   Bits past the width of std::size_t are zero. */
inline bool hypercube_bit(const std::size_t index, const std::size_t coordinate)
{
    if (coordinate >= static_cast<std::size_t>(std::numeric_limits<std::size_t>::digits))
    {
        return false;
    }
    return ((index >> coordinate) & 1) == 1;
}

} // namespace libmle

#endif // LIBMLE_COMMON_COMMON_HPP_
