#include <libmle/common/common.hpp>

#include <limits>
#include <stdexcept>

namespace libmle {

using std::size_t;

size_t max_hypercube_dimension()
{
    return std::numeric_limits<size_t>::digits - 1;
}

bool is_representable_hypercube_dimension(const size_t dimension)
{
    return dimension <= max_hypercube_dimension();
}

size_t hypercube_size(const size_t dimension)
{
    if (!is_representable_hypercube_dimension(dimension))
    {
        throw std::overflow_error("Hypercube dimension too large: 2^dimension does not fit in size_t.");
    }

    return static_cast<size_t>(1) << dimension;
}

} // namespace libmle
