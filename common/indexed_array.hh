#pragma once

#include <array>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <utility>

#include "wise_enum.h"

namespace rps {

template <typename T>
concept Indexable = wise_enum::is_wise_enum_v<T>;

template <Indexable EnumT>
constexpr bool is_contiguous_and_zero_indexed() {
    int expected_idx = 0;
    for (const auto value_and_name : wise_enum::range<EnumT>) {
        if (static_cast<std::underlying_type_t<EnumT>>(value_and_name.value) != expected_idx) {
            return false;
        }
        expected_idx++;
    }
    return true;
}

// Fixed size array with one slot per enumerator. Used for per-move and per-player tallies.
template <typename T, Indexable EnumT>
class IndexedArray {
   public:
    static_assert(is_contiguous_and_zero_indexed<EnumT>(),
                  "IndexedArray requires enumerators numbered 0..N-1");
    static constexpr int SIZE = wise_enum::size<EnumT>;
    using container_type = std::array<T, SIZE>;

    constexpr IndexedArray() = default;
    constexpr IndexedArray(const T &value) { data_.fill(value); }
    constexpr IndexedArray(const std::initializer_list<std::pair<EnumT, T>> &init) {
        for (const auto &[idx, value] : init) {
            (*this)[idx] = value;
        }
    }

    constexpr const T &operator[](const EnumT &index) const {
        return data_[static_cast<int>(index)];
    }
    constexpr T &operator[](const EnumT &index) { return data_[static_cast<int>(index)]; }

    constexpr int size() const { return SIZE; }

    bool operator==(const IndexedArray &other) const = default;

    struct ConstIterator {
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<EnumT, const T &>;
        using reference = value_type;
        using difference_type = std::ptrdiff_t;

        ConstIterator(const container_type *data, const int idx) : data_{data}, idx_{idx} {}

        bool operator!=(const ConstIterator &other) const { return idx_ != other.idx_; }

        ConstIterator &operator++() {
            idx_++;
            return *this;
        }

        value_type operator*() const {
            return {wise_enum::range<EnumT>[idx_].value, (*data_)[idx_]};
        }

       private:
        const container_type *data_;
        int idx_;
    };

    ConstIterator begin() const { return ConstIterator(&data_, 0); }
    ConstIterator end() const { return ConstIterator(&data_, SIZE); }

   private:
    container_type data_{};
};
}  // namespace rps
