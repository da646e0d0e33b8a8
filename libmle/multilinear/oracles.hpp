/**@file
*****************************************************************************
This file defines oracles for functions on the Boolean hypercube
*****************************************************************************
* @author     This file is part of libmle (see AUTHORS)
* @copyright  MIT license (see LICENSE file)
*****************************************************************************/
#ifndef LIBMLE_MULTILINEAR_ORACLES_HPP_
#define LIBMLE_MULTILINEAR_ORACLES_HPP_

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "libmle/algebra/utils.hpp"
#include "libmle/multilinear/errors.hpp"
#include "libmle/multilinear/hypercube.hpp"

namespace libmle {

/* Read-only oracle access to a function f: {0,1}^d -> F.
   Every implementation stores exactly one value for each of the 2^d points
   and is never modified after construction. */
template<typename FieldT>
class boolean_hypercube_oracle {
protected:
    std::size_t dimension_;

public:
    /* Receives (index, value) for one point of the hypercube. */
    typedef std::function<void(const std::size_t, const FieldT&)> point_visitor;

    explicit boolean_hypercube_oracle(const std::size_t dimension) : dimension_(dimension) {}
    virtual ~boolean_hypercube_oracle() = default;

    std::size_t dimension() const;
    std::size_t num_points() const;

    /* f(point(index)), throws oracle_error(point_not_found) for an index that is not stored. */
    virtual FieldT query(const std::size_t index) const = 0;
    /* f(point) for an explicit point, see hypercube_index for the errors raised on malformed points. */
    FieldT query_point(const std::vector<FieldT> &point) const;

    /* Calls visitor once for every stored point, in storage order. Callers
       may only rely on each of the 2^d points being visited exactly once. */
    virtual void for_each_point(const point_visitor &visitor) const = 0;
};

/* Table of 2^d values, the value of point i is stored at position i. */
template<typename FieldT>
class dense_hypercube_oracle : public boolean_hypercube_oracle<FieldT> {
protected:
    std::vector<FieldT> evaluations_;

public:
    using typename boolean_hypercube_oracle<FieldT>::point_visitor;

    /* Throws oracle_error(incorrect_oracle_size) unless evaluations.size() == 2^dimension. */
    dense_hypercube_oracle(const std::size_t dimension, const std::vector<FieldT> &evaluations);
    dense_hypercube_oracle(const std::size_t dimension, std::vector<FieldT> &&evaluations);

    static dense_hypercube_oracle<FieldT> random_oracle(const std::size_t dimension);

    const std::vector<FieldT>& evaluations() const;

    FieldT query(const std::size_t index) const;
    void for_each_point(const point_visitor &visitor) const;

protected:
    void check_size() const;
};

/* Explicit (point, value) entries, kept in insertion order. */
template<typename FieldT>
using hypercube_map = std::vector<std::pair<std::vector<FieldT>, FieldT> >;

template<typename FieldT>
class sparse_hypercube_oracle : public boolean_hypercube_oracle<FieldT> {
protected:
    hypercube_map<FieldT> entries_;
    /* indices_[k] is the index of the point of entries_[k] */
    std::vector<std::size_t> indices_;
    std::unordered_map<std::size_t, std::size_t> position_by_index_;

public:
    using typename boolean_hypercube_oracle<FieldT>::point_visitor;

    /* Checks that there are 2^dimension entries (incorrect_oracle_size), then
       each entry in turn for its length (incorrect_oracle_point_dimension) and
       its coordinates (nonboolean_oracle_point). A repeated point leaves fewer
       than 2^dimension distinct points and is reported as incorrect_oracle_size. */
    sparse_hypercube_oracle(const std::size_t dimension, const hypercube_map<FieldT> &entries);
    sparse_hypercube_oracle(const std::size_t dimension, hypercube_map<FieldT> &&entries);

    static sparse_hypercube_oracle<FieldT> random_oracle(const std::size_t dimension);

    const hypercube_map<FieldT>& entries() const;

    FieldT query(const std::size_t index) const;
    void for_each_point(const point_visitor &visitor) const;

protected:
    void index_entries();
};

} // namespace libmle

#include "libmle/multilinear/oracles.tcc"

#endif // LIBMLE_MULTILINEAR_ORACLES_HPP_
