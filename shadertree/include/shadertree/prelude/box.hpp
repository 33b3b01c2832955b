#pragma once

#include <concepts>
#include <memory>
#include <type_traits>

#include "idiom.hpp"

namespace st {

template <typename T>
struct Box final : MoveOnly {
    Box() noexcept = default;

    template <typename... Args> requires std::constructible_from<T, Args...>
    static auto make(Args&&... args) -> Box {
        return Box(new T(std::forward<Args>(args)...));
    }

    ~Box() noexcept { reset(nullptr); }

    Box(Box&& rhs) noexcept : ptr_(rhs.ptr_) { rhs.ptr_ = nullptr; }

    template <typename T2> requires std::convertible_to<T2*, T*>
    Box(Box<T2>&& rhs) noexcept : ptr_(rhs.release()) {}

    auto operator=(Box&& rhs) noexcept -> Box& {
        if (this != std::addressof(rhs)) {
            reset(rhs.release());
        }
        return *this;
    }

    template <typename T2> requires std::convertible_to<T2*, T*>
    auto operator=(Box<T2>&& rhs) noexcept -> Box& {
        reset(rhs.release());
        return *this;
    }

    operator bool() const noexcept { return ptr_ != nullptr; }

    auto operator*() const noexcept -> std::add_lvalue_reference_t<T> { return *ptr_; }
    auto operator->() const noexcept -> T* { return ptr_; }
    auto get() const noexcept -> T* { return ptr_; }

    void reset(T* ptr = nullptr) {
        if (ptr_) {
            delete ptr_;
        }
        ptr_ = ptr;
    }

    auto release() noexcept -> T* {
        auto ret = ptr_;
        ptr_ = nullptr;
        return ret;
    }

private:
    explicit Box(T* ptr) noexcept : ptr_(ptr) {}

    T* ptr_ = nullptr;
};

}
