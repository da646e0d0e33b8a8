#include "libmle/multilinear/errors.hpp"

#include <sstream>

namespace libmle {

using std::size_t;

namespace {

std::string oracle_error_message(const oracle_error_type type,
                                 const size_t expected,
                                 const size_t found)
{
    std::stringstream ss;
    switch (type)
    {
    case incorrect_oracle_size:
        ss << "Oracle size must be 2^dim";
        break;
    case incorrect_oracle_point_dimension:
        ss << "Dimension mismatch: expected dimension " << expected
           << ", but found dimension " << found;
        break;
    case nonboolean_oracle_point:
        ss << "Non-boolean value encountered: all coordinates must be in {0, 1}";
        break;
    case point_not_found:
        ss << "Point not found in boolean hypercube map";
        break;
    default:
        throw std::logic_error("Invalid oracle error type.");
    }
    return ss.str();
}

} // namespace

oracle_error::oracle_error(const oracle_error_type type) :
    oracle_error(type, 0, 0)
{
}

oracle_error::oracle_error(const oracle_error_type type,
                           const size_t expected,
                           const size_t found) :
    std::invalid_argument(oracle_error_message(type, expected, found)),
    type_(type),
    expected_(expected),
    found_(found)
{
}

oracle_error_type oracle_error::type() const
{
    return this->type_;
}

size_t oracle_error::expected() const
{
    return this->expected_;
}

size_t oracle_error::found() const
{
    return this->found_;
}

mle_error::mle_error(const mle_error_type type, const std::string &message) :
    std::runtime_error(message),
    type_(type),
    expected_(0),
    found_(0),
    inner_type_(point_not_found),
    strategy_(naive_evaluation_type)
{
}

mle_error mle_error::wrong_dimension_error(const size_t expected, const size_t found)
{
    std::stringstream ss;
    ss << "Dimension mismatch: expected dimension " << expected
       << ", but found dimension " << found;
    mle_error error(wrong_dimension, ss.str());
    error.expected_ = expected;
    error.found_ = found;
    return error;
}

mle_error mle_error::inconsistent_dimensions_error(const size_t b_dim, const size_t z_dim)
{
    std::stringstream ss;
    ss << "b and z must have consistent dimensions: b has " << b_dim
       << ", z has " << z_dim;
    mle_error error(inconsistent_dimensions, ss.str());
    error.expected_ = b_dim;
    error.found_ = z_dim;
    return error;
}

mle_error mle_error::oracle_failure_error(const oracle_error &inner)
{
    mle_error error(oracle_failure, std::string("Oracle error: ") + inner.what());
    error.inner_type_ = inner.type();
    error.expected_ = inner.expected();
    error.found_ = inner.found();
    return error;
}

mle_error mle_error::strategy_not_implemented_error(const mle_evaluation_type strategy)
{
    mle_error error(strategy_not_implemented,
                    std::string("MLE evaluation strategy not implemented: ") + mle_evaluation_type_names[strategy]);
    error.strategy_ = strategy;
    return error;
}

mle_error_type mle_error::type() const
{
    return this->type_;
}

size_t mle_error::expected() const
{
    return this->expected_;
}

size_t mle_error::found() const
{
    return this->found_;
}

size_t mle_error::b_dim() const
{
    return this->expected_;
}

size_t mle_error::z_dim() const
{
    return this->found_;
}

oracle_error_type mle_error::inner_type() const
{
    if (this->type_ != oracle_failure)
    {
        throw std::logic_error(std::string("inner_type is only defined for oracle failures, not for ") +
                               mle_error_type_names[this->type_] + ".");
    }
    return this->inner_type_;
}

mle_evaluation_type mle_error::strategy() const
{
    if (this->type_ != strategy_not_implemented)
    {
        throw std::logic_error(std::string("strategy is only defined for unimplemented strategies, not for ") +
                               mle_error_type_names[this->type_] + ".");
    }
    return this->strategy_;
}

} // namespace libmle
