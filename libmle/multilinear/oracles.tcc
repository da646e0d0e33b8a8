#include <libff/common/profiling.hpp>

#include "libmle/common/common.hpp"

namespace libmle {

template<typename FieldT>
std::size_t boolean_hypercube_oracle<FieldT>::dimension() const
{
    return this->dimension_;
}

template<typename FieldT>
std::size_t boolean_hypercube_oracle<FieldT>::num_points() const
{
    return hypercube_size(this->dimension_);
}

template<typename FieldT>
FieldT boolean_hypercube_oracle<FieldT>::query_point(const std::vector<FieldT> &point) const
{
    return this->query(hypercube_index(this->dimension_, point));
}

/* dense_hypercube_oracle */

template<typename FieldT>
dense_hypercube_oracle<FieldT>::dense_hypercube_oracle(
    const std::size_t dimension,
    const std::vector<FieldT> &evaluations) :
    boolean_hypercube_oracle<FieldT>(dimension),
    evaluations_(evaluations)
{
    this->check_size();
}

template<typename FieldT>
dense_hypercube_oracle<FieldT>::dense_hypercube_oracle(
    const std::size_t dimension,
    std::vector<FieldT> &&evaluations) :
    boolean_hypercube_oracle<FieldT>(dimension),
    evaluations_(std::move(evaluations))
{
    this->check_size();
}

template<typename FieldT>
void dense_hypercube_oracle<FieldT>::check_size() const
{
    if (!is_representable_hypercube_dimension(this->dimension_) ||
        this->evaluations_.size() != hypercube_size(this->dimension_))
    {
        throw oracle_error(incorrect_oracle_size);
    }
}

template<typename FieldT>
dense_hypercube_oracle<FieldT> dense_hypercube_oracle<FieldT>::random_oracle(const std::size_t dimension)
{
    const std::size_t num_points = hypercube_size(dimension);

    libff::enter_block("Sample random dense hypercube oracle");
    std::vector<FieldT> evaluations = random_FieldT_vector<FieldT>(num_points);
    libff::leave_block("Sample random dense hypercube oracle");

    return dense_hypercube_oracle<FieldT>(dimension, std::move(evaluations));
}

template<typename FieldT>
const std::vector<FieldT>& dense_hypercube_oracle<FieldT>::evaluations() const
{
    return this->evaluations_;
}

template<typename FieldT>
FieldT dense_hypercube_oracle<FieldT>::query(const std::size_t index) const
{
    if (index >= this->evaluations_.size())
    {
        throw oracle_error(point_not_found);
    }
    return this->evaluations_[index];
}

template<typename FieldT>
void dense_hypercube_oracle<FieldT>::for_each_point(const point_visitor &visitor) const
{
    for (std::size_t i = 0; i < this->evaluations_.size(); ++i)
    {
        visitor(i, this->evaluations_[i]);
    }
}

/* sparse_hypercube_oracle */

template<typename FieldT>
sparse_hypercube_oracle<FieldT>::sparse_hypercube_oracle(
    const std::size_t dimension,
    const hypercube_map<FieldT> &entries) :
    boolean_hypercube_oracle<FieldT>(dimension),
    entries_(entries)
{
    this->index_entries();
}

template<typename FieldT>
sparse_hypercube_oracle<FieldT>::sparse_hypercube_oracle(
    const std::size_t dimension,
    hypercube_map<FieldT> &&entries) :
    boolean_hypercube_oracle<FieldT>(dimension),
    entries_(std::move(entries))
{
    this->index_entries();
}

template<typename FieldT>
void sparse_hypercube_oracle<FieldT>::index_entries()
{
    if (!is_representable_hypercube_dimension(this->dimension_) ||
        this->entries_.size() != hypercube_size(this->dimension_))
    {
        throw oracle_error(incorrect_oracle_size);
    }

    this->indices_.reserve(this->entries_.size());
    this->position_by_index_.reserve(this->entries_.size());
    for (std::size_t k = 0; k < this->entries_.size(); ++k)
    {
        const std::size_t index = hypercube_index(this->dimension_, this->entries_[k].first);
        if (!this->position_by_index_.emplace(index, k).second)
        {
            throw oracle_error(incorrect_oracle_size);
        }
        this->indices_.emplace_back(index);
    }
}

template<typename FieldT>
sparse_hypercube_oracle<FieldT> sparse_hypercube_oracle<FieldT>::random_oracle(const std::size_t dimension)
{
    const std::size_t num_points = hypercube_size(dimension);

    libff::enter_block("Sample random sparse hypercube oracle");
    hypercube_map<FieldT> entries;
    entries.reserve(num_points);
    for (std::size_t i = 0; i < num_points; ++i)
    {
        entries.emplace_back(hypercube_point<FieldT>(dimension, i), FieldT::random_element());
    }
    libff::leave_block("Sample random sparse hypercube oracle");

    return sparse_hypercube_oracle<FieldT>(dimension, std::move(entries));
}

template<typename FieldT>
const hypercube_map<FieldT>& sparse_hypercube_oracle<FieldT>::entries() const
{
    return this->entries_;
}

template<typename FieldT>
FieldT sparse_hypercube_oracle<FieldT>::query(const std::size_t index) const
{
    const auto it = this->position_by_index_.find(index);
    if (it == this->position_by_index_.end())
    {
        throw oracle_error(point_not_found);
    }
    return this->entries_[it->second].second;
}

template<typename FieldT>
void sparse_hypercube_oracle<FieldT>::for_each_point(const point_visitor &visitor) const
{
    for (std::size_t k = 0; k < this->entries_.size(); ++k)
    {
        visitor(this->indices_[k], this->entries_[k].second);
    }
}

} // namespace libmle
