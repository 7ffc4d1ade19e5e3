#ifndef FIXED_VECTOR_HPP
#define FIXED_VECTOR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>

namespace mazegraph
{
    /// @brief Sequence with a compile-time capacity and no heap allocation
    /// @details T must be default constructible, unused slots hold default values
    template <typename T, std::size_t Capacity>
    class FixedVector
    {
    public:
        using value_type = T;
        using size_type = std::size_t;
        using iterator = typename std::array<T, Capacity>::iterator;
        using const_iterator = typename std::array<T, Capacity>::const_iterator;

    public:
        /// @throws std::length_error when already holding Capacity elements
        void push_back(const T &value)
        {
            if (mSize == Capacity)
            {
                throw std::length_error("FixedVector::push_back - capacity exceeded");
            }
            mItems[mSize++] = value;
        }

        void clear() noexcept { mSize = 0; }

        [[nodiscard]] size_type size() const noexcept { return mSize; }
        [[nodiscard]] bool empty() const noexcept { return mSize == 0; }
        [[nodiscard]] static constexpr size_type capacity() noexcept { return Capacity; }

        [[nodiscard]] const T &operator[](size_type index) const noexcept { return mItems[index]; }

        [[nodiscard]] const T &at(size_type index) const
        {
            if (index >= mSize)
            {
                throw std::out_of_range("FixedVector::at - index out of range");
            }
            return mItems[index];
        }

        [[nodiscard]] const T &front() const noexcept { return mItems[0]; }
        [[nodiscard]] const T &back() const noexcept { return mItems[mSize - 1]; }

        iterator begin() noexcept { return mItems.begin(); }
        iterator end() noexcept { return mItems.begin() + static_cast<std::ptrdiff_t>(mSize); }
        const_iterator begin() const noexcept { return mItems.begin(); }
        const_iterator end() const noexcept { return mItems.begin() + static_cast<std::ptrdiff_t>(mSize); }

        friend bool operator==(const FixedVector &lhs, const FixedVector &rhs)
        {
            if (lhs.mSize != rhs.mSize)
            {
                return false;
            }
            for (size_type i = 0; i < lhs.mSize; ++i)
            {
                if (!(lhs.mItems[i] == rhs.mItems[i]))
                {
                    return false;
                }
            }
            return true;
        }

        friend bool operator!=(const FixedVector &lhs, const FixedVector &rhs) { return !(lhs == rhs); }

    private:
        std::array<T, Capacity> mItems{};
        size_type mSize{0};
    };
}

#endif // FIXED_VECTOR_HPP
