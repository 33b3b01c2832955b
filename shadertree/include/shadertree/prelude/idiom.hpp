#pragma once

#include <utility>

namespace st {

struct MoveOnly {
    MoveOnly() noexcept = default;

    MoveOnly(MoveOnly&& rhs) noexcept = default;
    MoveOnly(MoveOnly const& rhs) noexcept = delete;
    auto operator=(MoveOnly&& rhs) noexcept -> MoveOnly& = default;
    auto operator=(MoveOnly const& rhs) noexcept -> MoveOnly& = delete;
};

// `T::Impl` only needs to be complete where the constructor of `T` is defined.
template <typename T>
struct PImpl {
    template <typename... Args>
    PImpl(Args&&... args)
        : impl_(new typename T::Impl(std::forward<Args>(args)...))
        , impl_deleter_([](void* impl) { delete static_cast<typename T::Impl*>(impl); })
    {}

    ~PImpl() {
        if (impl_) {
            impl_deleter_(impl_);
            impl_ = nullptr;
        }
    }

    PImpl(PImpl const& rhs) noexcept = delete;
    PImpl(PImpl&& rhs) noexcept : impl_(rhs.impl_), impl_deleter_(rhs.impl_deleter_) {
        rhs.impl_ = nullptr;
    }

    auto operator=(PImpl const& rhs) noexcept -> PImpl& = delete;
    auto operator=(PImpl&& rhs) noexcept -> PImpl& {
        if (this != &rhs) {
            if (impl_) { impl_deleter_(impl_); }
            impl_ = rhs.impl_;
            impl_deleter_ = rhs.impl_deleter_;
            rhs.impl_ = nullptr;
        }
        return *this;
    }

protected:
    auto impl() { return static_cast<typename T::Impl*>(impl_); }
    auto impl() const { return static_cast<typename T::Impl const*>(impl_); }

private:
    void* impl_ = nullptr;
    using ImplDeleter = auto (void*) -> void;
    ImplDeleter* impl_deleter_ = nullptr;
};

}
