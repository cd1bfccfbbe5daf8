#ifndef SHOAL_VIEW_HEADER
#define SHOAL_VIEW_HEADER

#include <type_traits>
#include <stdexcept>
#include <iterator>
#include <cstddef>

namespace shoal {

/**
 * A non-owning pointer and length pair with container like accessors. Piece payloads,
 * wire messages and slices of file contents are all passed around as views so that
 * no copies are made until data actually has to be retained.
 */
template <typename T>
struct view
{
    using value_type = T;
    using size_type = size_t;
    using difference_type = std::ptrdiff_t;
    using reference = value_type&;
    using const_reference = const value_type&;
    using pointer = value_type*;
    using const_pointer = const value_type*;
    using iterator = pointer;
    using const_iterator = const_pointer;

private:
    pointer data_ = nullptr;
    size_type length_ = 0;

public:
    view() = default;

    constexpr view(pointer data, size_type length) : data_(data), length_(length) {}

    constexpr view(pointer begin, pointer end) : data_(begin), length_(end - begin) {}

    template <typename U,
            typename = typename std::enable_if<std::is_convertible<U*, T*>::value>::type>
    constexpr view(const view<U>& other) : data_(other.data()), length_(other.size())
    {}

    template <typename Container, typename = decltype(std::declval<Container>().data())>
    view(Container& c) : data_(c.data()), length_(c.size())
    {}

    constexpr size_type size() const noexcept { return length_; }
    constexpr bool empty() const noexcept { return length_ == 0; }

    constexpr pointer data() const noexcept { return data_; }

    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + length_; }

    constexpr reference operator[](const size_type i) const noexcept { return data_[i]; }

    view subview(const size_type offset) const
    {
        if(offset > size()) {
            throw std::out_of_range("tried to create a subview that is larger than view");
        }
        return {data_ + offset, size() - offset};
    }

    view subview(const size_type offset, const size_type count) const
    {
        if((offset > size()) || (count > size() - offset)) {
            throw std::out_of_range("tried to create a subview that is larger than view");
        }
        return {data_ + offset, count};
    }

    void trim_front(const size_type n)
    {
        if(n > size()) {
            throw std::out_of_range("tried to trim more from front of view than its size");
        }
        data_ += n;
        length_ -= n;
    }
};

template <typename T>
using const_view = view<const T>;

} // namespace shoal

#endif // SHOAL_VIEW_HEADER
