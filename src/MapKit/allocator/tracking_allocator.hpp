/**
 * @file tracking_allocator.hpp
 * @brief Byte-counting allocator used for hashtable bucket arrays and bucket nodes
 *
 * The allocator does not own its counter. Containers keep a `std::size_t` member and
 * build a fresh allocator around it for every allocation, so moving a container never
 * leaves an allocator pointing at a stale counter.
 */

#ifndef TRACKING_ALLOCATOR_HPP
#define TRACKING_ALLOCATOR_HPP

#include <cstddef>
#include <limits>
#include <memory>
#include <new>
#include <utility>

/**
 * @brief Allocator that adds every allocation to, and subtracts every deallocation from,
 *        an external byte counter
 *
 * @tparam T The type of objects to allocate
 */
template<typename T>
class tracking_allocator {
public:
    using value_type = T;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;

    template<typename U>
    struct rebind {
        using other = tracking_allocator<U>;
    };

private:
    std::size_t* bytes_allocated_;

public:
    /**
     * @param bytes_allocated Counter charged for the lifetime of each allocation
     */
    explicit tracking_allocator(std::size_t& bytes_allocated) noexcept
        : bytes_allocated_{&bytes_allocated} {}

    template<typename U>
    tracking_allocator(const tracking_allocator<U>& other) noexcept
        : bytes_allocated_{&other.get_counter()} {}

    /**
     * @brief Allocates storage for n objects of type T
     * @throws std::bad_alloc if the request overflows or the heap is exhausted
     */
    [[nodiscard]] T* allocate(size_type n) {
        if (n > max_size()) {
            throw std::bad_array_new_length{};
        }
        const size_type bytes{n * sizeof(T)};
        auto* ptr{static_cast<T*>(::operator new(bytes, std::align_val_t{alignof(T)}))};
        *bytes_allocated_ += bytes;
        return ptr;
    }

    void deallocate(T* ptr, size_type n) noexcept {
        if (ptr == nullptr) return;
        *bytes_allocated_ -= n * sizeof(T);
        ::operator delete(ptr, std::align_val_t{alignof(T)});
    }

    template<typename U, typename... Args>
    void construct(U* ptr, Args&&... args) {
        std::construct_at(ptr, std::forward<Args>(args)...);
    }

    template<typename U>
    void destroy(U* ptr) noexcept {
        std::destroy_at(ptr);
    }

    constexpr size_type max_size() const noexcept {
        return std::numeric_limits<size_type>::max() / sizeof(T);
    }

    std::size_t& get_counter() const noexcept {
        return *bytes_allocated_;
    }

    template<typename U>
    bool operator==(const tracking_allocator<U>& other) const noexcept {
        return bytes_allocated_ == &other.get_counter();
    }
};

#endif // TRACKING_ALLOCATOR_HPP
