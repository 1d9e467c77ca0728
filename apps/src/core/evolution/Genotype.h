#pragma once

#include <concepts>
#include <string>
#include <type_traits>

namespace GenEvo {

/**
 * Requirements for a candidate solution representation.
 *
 * A genotype is a self-contained value: copying it yields an independent deep
 * copy (breeding clones parents this way), and it can render itself as text.
 * Genotypes must not hold references or views into other objects.
 */
template <typename T>
concept Genotype = std::is_object_v<T> && std::copy_constructible<T> && std::movable<T>
    && requires(const T& genotype) {
           { genotype.toString() } -> std::convertible_to<std::string>;
       };

} // namespace GenEvo
