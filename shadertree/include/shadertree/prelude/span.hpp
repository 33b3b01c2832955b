#pragma once

#include <concepts>
#include <cstddef>
#include <iterator>
#include <memory>

namespace st {

template <typename T>
struct Span final {
    Span() noexcept = default;
    Span(T* data, size_t size) noexcept : data_(data), size_(size) {}

    template <typename R> requires requires (R& r) { { std::to_address(std::begin(r)) } -> std::convertible_to<T*>; }
    Span(R& range) noexcept : data_(std::to_address(std::begin(range))), size_(std::size(range)) {}

    auto data() const noexcept -> T* { return data_; }
    auto size() const noexcept -> size_t { return size_; }
    auto empty() const noexcept -> bool { return size_ == 0; }

    auto begin() const noexcept -> T* { return data_; }
    auto end() const noexcept -> T* { return data_ + size_; }

    auto operator[](size_t index) const noexcept -> T& { return data_[index]; }

private:
    T* data_ = nullptr;
    size_t size_ = 0;
};

}
