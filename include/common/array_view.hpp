#ifndef _COMMON_ARRAY_VIEW_H_
#define _COMMON_ARRAY_VIEW_H_

#include "base/defines.hpp"

#include <cstddef>
#include <type_traits>
#include <utility>

namespace quickfilter {

// Non-owning view over a contiguous run of samples, used for
// both the read-only input signal and caller supplied output.
template<typename T>
class QUICKFILTER_CPP_EXPORT ArrayView {
public:
    using value_type = T;
    using const_iterator = const T*;

    ArrayView(T* ptr, size_t size) noexcept : ptr_(ptr), size_(size) {}

    ArrayView() noexcept : ArrayView(nullptr, 0) {}
    ArrayView(std::nullptr_t) noexcept : ArrayView() {}
  
    template <typename U, size_t N>
    ArrayView(U (&buffer)[N]) noexcept : ArrayView(buffer, N) {}

    // ArrayView<T> to ArrayView<const T>
    // std::vector<T> to ArrayView<const T> or ArrayView<T>
    template <
        typename U,
        // Container has data and size
        typename std::enable_if<
            std::is_convertible<decltype(std::declval<U&>().data()), T*>::value &&
            std::is_convertible<decltype(std::declval<U&>().size()), std::size_t>::value
        >::type* = nullptr
    >
    ArrayView(U& u) noexcept : ArrayView(u.data(), u.size()) {}

    template <
        typename U,
        typename std::enable_if<
            std::is_convertible<decltype(std::declval<const U&>().data()), T*>::value &&
            std::is_convertible<decltype(std::declval<const U&>().size()), std::size_t>::value
        >::type* = nullptr
    >
    ArrayView(const U& u) noexcept : ArrayView(u.data(), u.size()) {}

    T& operator[](size_t i) const noexcept { return ptr_[i]; }
    T* data() const noexcept { return ptr_; }
    size_t size() const noexcept { return size_; };
    bool empty() const noexcept { return this->size() == 0; }

    T* begin() const noexcept { return this->data(); }
    T* end() const noexcept { return this->data() + this->size(); }

    void Reset() {
        ptr_ = nullptr;
        size_ = 0;
    }

private:
    T* ptr_;
    size_t size_;
};

} // namespace quickfilter

#endif
