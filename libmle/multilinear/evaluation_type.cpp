#include "libmle/multilinear/evaluation_type.hpp"

#include <stdexcept>

namespace libmle {

std::vector<mle_evaluation_type> all_mle_evaluation_types(
    {naive_evaluation_type, zhu_evaluation_type, rothblum_evaluation_type, ramakrishna_evaluation_type});

mle_evaluation_type mle_evaluation_type_from_name(const std::string &name)
{
    for (const mle_evaluation_type type : all_mle_evaluation_types)
    {
        if (name == mle_evaluation_type_names[type])
        {
            return type;
        }
    }
    throw std::invalid_argument("Unknown MLE evaluation strategy: " + name);
}

} // namespace libmle
