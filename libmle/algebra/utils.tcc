namespace libmle {

template<typename FieldT>
std::vector<FieldT> random_FieldT_vector(const std::size_t count)
{
    std::vector<FieldT> result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; i++) {
        result.emplace_back(FieldT::random_element());
    }

    return result;
}

} // namespace libmle
