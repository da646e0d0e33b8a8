/**@file
 *****************************************************************************
 Multilinear extension of a function on the Boolean hypercube.

 For f: {0,1}^d -> F the multilinear extension is the unique polynomial of
 degree at most one in each variable that agrees with f on {0,1}^d:

   MLE_f(z) = sum_{b in {0,1}^d} f(b) * eq(b, z).

 The extension only references its oracle; several extensions (for example
 with different strategies) may share one oracle.
 *****************************************************************************
 * @author     This file is part of libmle (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBMLE_MULTILINEAR_MULTILINEAR_EXTENSION_HPP_
#define LIBMLE_MULTILINEAR_MULTILINEAR_EXTENSION_HPP_

#include <cstddef>
#include <memory>
#include <vector>

#include "libmle/multilinear/errors.hpp"
#include "libmle/multilinear/evaluation_type.hpp"
#include "libmle/multilinear/hypercube.hpp"
#include "libmle/multilinear/oracles.hpp"

namespace libmle {

template<typename FieldT>
class multilinear_extension {
protected:
    std::shared_ptr<const boolean_hypercube_oracle<FieldT> > oracle_;
    std::size_t dimension_;
    mle_evaluation_type strategy_;

public:
    /* No validation happens here, a dimension that disagrees with the
       oracle's is reported by evaluate. */
    multilinear_extension(const std::shared_ptr<const boolean_hypercube_oracle<FieldT> > &oracle,
                          const std::size_t dimension,
                          const mle_evaluation_type strategy);

    /* MLE_f(z). Throws mle_error(wrong_dimension) if z.size() != dimension(),
       mle_error(inconsistent_dimensions) if the oracle's dimension differs from
       dimension(), and mle_error(strategy_not_implemented) for strategies
       without an algorithm. */
    FieldT evaluate(const std::vector<FieldT> &z) const;

    const std::shared_ptr<const boolean_hypercube_oracle<FieldT> >& oracle() const;
    std::size_t dimension() const;
    mle_evaluation_type strategy() const;

protected:
    FieldT naive_evaluation(const std::vector<FieldT> &z) const;
};

} // namespace libmle

#include "libmle/multilinear/multilinear_extension.tcc"

#endif // LIBMLE_MULTILINEAR_MULTILINEAR_EXTENSION_HPP_
