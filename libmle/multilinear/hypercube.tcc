namespace libmle {

template<typename FieldT>
bool is_boolean(const FieldT &x)
{
    return x == FieldT::zero() || x == FieldT::one();
}

template<typename FieldT>
bool is_boolean_point(const std::vector<FieldT> &point)
{
    for (const FieldT &coordinate : point)
    {
        if (!is_boolean(coordinate))
        {
            return false;
        }
    }
    return true;
}

template<typename FieldT>
std::vector<FieldT> hypercube_point(const std::size_t dimension, const std::size_t index)
{
    std::vector<FieldT> point;
    point.reserve(dimension);
    for (std::size_t j = 0; j < dimension; ++j)
    {
        point.emplace_back(hypercube_bit(index, j) ? FieldT::one() : FieldT::zero());
    }
    return point;
}

template<typename FieldT>
std::size_t hypercube_index(const std::size_t dimension, const std::vector<FieldT> &point)
{
    if (point.size() != dimension)
    {
        throw oracle_error(incorrect_oracle_point_dimension, dimension, point.size());
    }
    if (!is_boolean_point(point))
    {
        throw oracle_error(nonboolean_oracle_point);
    }

    /* Keys longer than a size_t can only be valid for oracles that cannot be built. */
    if (!is_representable_hypercube_dimension(dimension))
    {
        throw oracle_error(point_not_found);
    }

    std::size_t index = 0;
    for (std::size_t j = 0; j < dimension; ++j)
    {
        if (point[j] == FieldT::one())
        {
            index |= static_cast<std::size_t>(1) << j;
        }
    }
    return index;
}

template<typename FieldT>
std::vector<FieldT> one_minus_point(const std::vector<FieldT> &z)
{
    std::vector<FieldT> result;
    result.reserve(z.size());
    for (const FieldT &z_j : z)
    {
        result.emplace_back(FieldT::one() - z_j);
    }
    return result;
}

template<typename FieldT>
FieldT lagrange_basis_at_index(const std::size_t index,
                               const std::vector<FieldT> &z,
                               const std::vector<FieldT> &one_minus_z)
{
    FieldT chi = FieldT::one();
    for (std::size_t j = 0; j < z.size(); ++j)
    {
        chi *= hypercube_bit(index, j) ? z[j] : one_minus_z[j];
    }
    return chi;
}

template<typename FieldT>
FieldT lagrange_basis(const std::vector<FieldT> &b, const std::vector<FieldT> &z)
{
    if (b.size() != z.size())
    {
        throw mle_error::inconsistent_dimensions_error(b.size(), z.size());
    }

    const FieldT one = FieldT::one();
    FieldT result = one;
    for (std::size_t j = 0; j < b.size(); ++j)
    {
        result *= b[j] * z[j] + (one - b[j]) * (one - z[j]);
    }
    return result;
}

} // namespace libmle
