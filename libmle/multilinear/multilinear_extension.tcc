#include <stdexcept>

namespace libmle {

template<typename FieldT>
multilinear_extension<FieldT>::multilinear_extension(
    const std::shared_ptr<const boolean_hypercube_oracle<FieldT> > &oracle,
    const std::size_t dimension,
    const mle_evaluation_type strategy) :
    oracle_(oracle),
    dimension_(dimension),
    strategy_(strategy)
{
}

template<typename FieldT>
FieldT multilinear_extension<FieldT>::evaluate(const std::vector<FieldT> &z) const
{
    if (z.size() != this->dimension_)
    {
        throw mle_error::wrong_dimension_error(this->dimension_, z.size());
    }
    if (!this->oracle_)
    {
        throw std::invalid_argument("Multilinear extension has no oracle.");
    }
    /* Every hypercube point the oracle produces has the oracle's dimension. */
    if (this->oracle_->dimension() != this->dimension_)
    {
        throw mle_error::inconsistent_dimensions_error(this->oracle_->dimension(), z.size());
    }

    try
    {
        switch (this->strategy_)
        {
        case naive_evaluation_type:
            return this->naive_evaluation(z);
        case zhu_evaluation_type:
        case rothblum_evaluation_type:
        case ramakrishna_evaluation_type:
            throw mle_error::strategy_not_implemented_error(this->strategy_);
        }
    }
    catch (const oracle_error &e)
    {
        throw mle_error::oracle_failure_error(e);
    }

    throw std::logic_error("Invalid MLE evaluation strategy.");
}

/* Brute force: computes eq(b, z) for every b in {0,1}^d and sums f(b) * eq(b, z).
   O(d * 2^d) time, O(d) space on top of the oracle. */
template<typename FieldT>
FieldT multilinear_extension<FieldT>::naive_evaluation(const std::vector<FieldT> &z) const
{
    const std::vector<FieldT> one_minus_z = one_minus_point(z);

    FieldT sum = FieldT::zero();
    this->oracle_->for_each_point(
        [&z, &one_minus_z, &sum](const std::size_t index, const FieldT &value) {
            sum += value * lagrange_basis_at_index(index, z, one_minus_z);
        });

    return sum;
}

template<typename FieldT>
const std::shared_ptr<const boolean_hypercube_oracle<FieldT> >& multilinear_extension<FieldT>::oracle() const
{
    return this->oracle_;
}

template<typename FieldT>
std::size_t multilinear_extension<FieldT>::dimension() const
{
    return this->dimension_;
}

template<typename FieldT>
mle_evaluation_type multilinear_extension<FieldT>::strategy() const
{
    return this->strategy_;
}

} // namespace libmle
