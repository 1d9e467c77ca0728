#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace GenEvo {

/**
 * Either a value or an error, for operations that can fail at runtime
 * (config files, text parsing). Contract violations use GENEVO_ASSERT instead.
 *
 * Example:
 *   auto result = BinaryGenotype::fromString("0101");
 *   if (result.isError()) {
 *       spdlog::error("{}", result.errorValue());
 *   }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& errorValue() { return std::get<1>(data_); }
    const E& errorValue() const { return std::get<1>(data_); }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> index, U&& value) : data_(index, std::forward<U>(value))
    {}

    std::variant<T, E> data_;
};

} // namespace GenEvo
