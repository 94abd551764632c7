#pragma once

/// @file event_window.h
/// @brief Fixed-capacity ring buffer holding the most recent events

#include <array>
#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace turnguard::session {

/// @brief Ring buffer of at most Capacity elements; the oldest is
///        overwritten on overflow
///
/// Storage is a fixed array sized at compile time; Push never allocates for
/// the buffer itself. Logical index 0 is the oldest retained element.
template <typename T, size_t Capacity>
class EventWindow {
    static_assert(Capacity > 0, "EventWindow needs a positive capacity");
    static_assert(std::is_default_constructible_v<T>,
                  "EventWindow slots are default-constructed");

public:
    EventWindow() = default;

    /// @brief Append, evicting the oldest element when full
    void Push(T value) {
        slots_[(head_ + size_) % Capacity] = std::move(value);
        if (size_ < Capacity) {
            ++size_;
        } else {
            head_ = (head_ + 1) % Capacity;
        }
    }

    size_t Size() const { return size_; }
    bool Empty() const { return size_ == 0; }
    static constexpr size_t MaxSize() { return Capacity; }

    /// @brief Element by age, 0 = oldest
    /// @pre index < Size()
    const T& operator[](size_t index) const {
        return slots_[(head_ + index) % Capacity];
    }

    const T& At(size_t index) const {
        if (index >= size_) {
            throw std::out_of_range("EventWindow index out of range");
        }
        return (*this)[index];
    }

    /// @brief Newest element
    /// @pre !Empty()
    const T& Back() const { return (*this)[size_ - 1]; }

    /// @brief Logical index of the first of the newest n elements
    size_t TailStart(size_t n) const {
        return n >= size_ ? 0 : size_ - n;
    }

private:
    std::array<T, Capacity> slots_{};
    size_t head_ = 0;  ///< Slot of the oldest element
    size_t size_ = 0;
};

}  // namespace turnguard::session
