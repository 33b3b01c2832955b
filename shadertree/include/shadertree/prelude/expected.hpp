#pragma once

#include <variant>

#include "option.hpp"

namespace st {

template <typename T, typename E>
struct Expected final {
    Expected(T const& value) : data_(value) {}
    Expected(T&& value) : data_(std::move(value)) {}
    Expected(E const& error) : data_(error) {}
    Expected(E&& error) : data_(std::move(error)) {}

    auto has_value() const { return data_.index() == 0; }
    operator bool() const { return has_value(); }

    auto value() & -> T& { return std::get<0>(data_); }
    auto value() const& -> T const& { return std::get<0>(data_); }
    auto value() && -> T&& { return std::move(std::get<0>(data_)); }

    auto error() & -> E& { return std::get<1>(data_); }
    auto error() const& -> E const& { return std::get<1>(data_); }
    auto error() && -> E&& { return std::move(std::get<1>(data_)); }

    auto value_or(T const& fallback) const& -> T { return has_value() ? value() : fallback; }

private:
    std::variant<T, E> data_;
};

// Success carries no value; `return {};` reports it.
template <typename E>
struct Expected<void, E> final {
    Expected() = default;
    Expected(E const& error) : error_(error) {}
    Expected(E&& error) : error_(std::move(error)) {}

    auto has_value() const -> bool { return !error_.has_value(); }
    operator bool() const { return has_value(); }

    auto error() & -> E& { return error_.value(); }
    auto error() const& -> E const& { return error_.value(); }
    auto error() && -> E&& { return std::move(error_).value(); }

private:
    Option<E> error_;
};

}
