#pragma once

#include <cassert>
#include <cstddef>
#include <new>
#include <utility>

namespace st {

template <typename T>
struct Option final {
    Option() noexcept = default;

    ~Option() { reset(); }

    Option(T const& value) : has_value_(true) { new (memory_) T(value); }
    Option(T&& value) noexcept : has_value_(true) { new (memory_) T(std::move(value)); }

    Option(Option const& rhs) : has_value_(rhs.has_value_) {
        if (has_value_) {
            new (memory_) T(rhs.value());
        }
    }
    Option(Option&& rhs) noexcept : has_value_(rhs.has_value_) {
        if (has_value_) {
            new (memory_) T(std::move(rhs.value()));
            rhs.reset();
        }
    }

    auto operator=(Option const& rhs) -> Option& {
        if (this != &rhs) {
            reset();
            has_value_ = rhs.has_value_;
            if (has_value_) {
                new (memory_) T(rhs.value());
            }
        }
        return *this;
    }
    auto operator=(Option&& rhs) noexcept -> Option& {
        if (this != &rhs) {
            reset();
            has_value_ = rhs.has_value_;
            if (has_value_) {
                new (memory_) T(std::move(rhs.value()));
                rhs.reset();
            }
        }
        return *this;
    }

    auto operator==(Option const& rhs) const -> bool {
        return has_value_ ? (rhs.has_value() && value() == rhs.value()) : !rhs.has_value();
    }

    auto value() & -> T& {
        assert(has_value() && "call 'value()' on empty Option");
        return *std::launder(reinterpret_cast<T*>(memory_));
    }
    auto value() const& -> T const& {
        assert(has_value() && "call 'value()' on empty Option");
        return *std::launder(reinterpret_cast<T const*>(memory_));
    }
    auto value() && -> T&& {
        assert(has_value() && "call 'value()' on empty Option");
        return std::move(*std::launder(reinterpret_cast<T*>(memory_)));
    }

    auto value_or(T const& fallback) const -> T { return has_value_ ? value() : fallback; }

    auto has_value() const -> bool { return has_value_; }
    operator bool() const { return has_value_; }

    template <typename... Args>
    auto emplace(Args&&... args) -> T& {
        reset();
        new (memory_) T(std::forward<Args>(args)...);
        has_value_ = true;
        return value();
    }

    auto reset() -> void {
        if (has_value_) {
            value().~T();
            has_value_ = false;
        }
    }

private:
    alignas(T) std::byte memory_[sizeof(T)];
    bool has_value_ = false;
};

}
