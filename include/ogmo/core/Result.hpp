#pragma once

#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

#include "ogmo/core/Error.hpp"

namespace ogmo::core {

/**
 * @brief Either a decoded value or the first SchemaError that stopped decoding.
 *
 * Value() on a failed result rethrows the stored error, mirroring
 * std::optional::value().
 */
template <typename T>
class Result {
public:
    Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}
    Result(SchemaError error) : m_data(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool Ok() const noexcept { return m_data.index() == 0; }
    explicit operator bool() const noexcept { return Ok(); }

    const T& Value() const& {
        if (!Ok()) {
            throw std::get<1>(m_data);
        }
        return std::get<0>(m_data);
    }

    T& Value() & {
        if (!Ok()) {
            throw std::get<1>(m_data);
        }
        return std::get<0>(m_data);
    }

    T&& Value() && {
        if (!Ok()) {
            throw std::get<1>(m_data);
        }
        return std::get<0>(std::move(m_data));
    }

    const T& operator*() const& { return Value(); }
    T& operator*() & { return Value(); }
    const T* operator->() const { return &Value(); }
    T* operator->() { return &Value(); }

    // Only valid when Ok() is false.
    const SchemaError& Error() const { return std::get<1>(m_data); }

private:
    std::variant<T, SchemaError> m_data;
};

template <typename T>
using RefResult = Result<std::reference_wrapper<const T>>;

/**
 * @brief Runs a throwing decode/encode step and folds SchemaError into a Result.
 */
template <typename Fn>
auto Capture(Fn&& fn) -> Result<std::invoke_result_t<Fn>> {
    try {
        return std::forward<Fn>(fn)();
    } catch (const SchemaError& error) {
        return error;
    }
}

} // namespace ogmo::core
