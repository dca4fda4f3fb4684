/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace ndarray {

/**
 * @brief N-dimensional array container with shared storage, views and lane-wise arithmetic.
 *
 * Storage is a flat row-major buffer shared between copies and views. Copy construction shares the buffer, copy
 * assignment into an allocated array copies elements, and copy() produces an independent buffer. Views returned by
 * partial indexing, reshape() and flatten() are always contiguous, so operator[] addresses elements of a view in
 * row-major order.
 *
 * @tparam T Element type stored in the array.
 * @tparam N Number of dimensions.
 */
template <typename T, unsigned int N>
class NDArray {
public:
    /**
     * @brief Type alias for the index representation of an N-dimensional array.
     *
     * Each element of the array represents the size in that dimension.
     */
    using Index = std::array<int, N>;

    /**
     * @brief Default constructor, creates an empty array (no allocated storage).
     */
    NDArray() : data_(nullptr), data_offset_(0), shape_{}, strides_{} {}

    /**
     * @brief Construct a zero-initialized array with the given shape.
     *
     * @param shape Sizes of each dimension.
     */
    explicit NDArray(const Index &shape);

    /**
     * @brief Construct an array with a given shape and initial values.
     *
     * @param shape  Sizes of each dimension.
     * @param values Initial values in row-major order.
     *
     * @throws std::invalid_argument if the number of values does not match the shape.
     */
    NDArray(const Index &shape, const std::vector<T> &values);

    /**
     * @brief Copy constructor, shares the underlying buffer.
     */
    NDArray(const NDArray<T, N> &other);

    /**
     * @brief Prevent construction from NDArray of different dimension.
     *
     * @tparam M Other array dimensionality (must differ from N).
     */
    template <unsigned int M, typename = std::enable_if_t<N != M>>
    NDArray(const NDArray<T, M> &other) = delete;

    /**
     * @brief Move constructor.
     */
    NDArray(NDArray<T, N> &&other) = default;

    ~NDArray() {}

    /**
     * @brief Copy assignment operator.
     *
     * An empty array binds to the other buffer, an allocated array receives a copy of the elements.
     *
     * @throws std::invalid_argument if both arrays are allocated and their shapes differ.
     */
    NDArray<T, N> &operator=(const NDArray<T, N> &other);

    /**
     * @brief Prevent assignment from NDArray of different dimension.
     *
     * @tparam M Other array dimensionality (must differ from N).
     */
    template <unsigned int M, typename = std::enable_if_t<N != M>>
    NDArray<T, N> &operator=(NDArray<T, M> &other) = delete;

    /**
     * @brief Move assignment operator, rebinds to the other buffer.
     */
    NDArray<T, N> &operator=(NDArray<T, N> &&other) = default;

    /**
     * @brief Assign scalar value to all elements of the array.
     */
    T operator=(T other);

    /**
     * @brief Return a lower-dimensional view (non-const).
     *
     * @tparam Indices Index types (variadic).
     * @param indices  Leading indices specifying the slice.
     *
     * @return Sub-array view of dimension N - sizeof...(Indices).
     */
    template <typename... Indices, typename = std::enable_if_t<sizeof...(Indices) < N>>
    NDArray<T, N - sizeof...(Indices)> operator()(Indices... indices) noexcept;

    /**
     * @brief Return a lower-dimensional view (const).
     */
    template <typename... Indices, typename = std::enable_if_t<sizeof...(Indices) < N>>
    const NDArray<T, N - sizeof...(Indices)> operator()(Indices... indices) const noexcept;

    /**
     * @brief Return an element of the array (const).
     *
     * @param indices Indices for each dimension.
     */
    template <typename... Indices, typename = std::enable_if_t<sizeof...(Indices) == N>>
    T operator()(Indices... indices) const noexcept;

    /**
     * @brief Return a reference to an element of the array (non-const).
     *
     * @param indices Indices for each dimension.
     */
    template <typename... Indices, typename = std::enable_if_t<sizeof...(Indices) == N>>
    T &operator()(Indices... indices) noexcept;

    /**
     * @brief Flat row-major element access.
     *
     * @param i Flat index in [0, size()).
     */
    T &operator[](unsigned int i) noexcept { return data_[data_offset_ + i]; }

    T operator[](unsigned int i) const noexcept { return data_[data_offset_ + i]; }

    /**
     * @brief Element-wise in-place addition.
     *
     * @throws std::invalid_argument if shapes differ.
     */
    NDArray<T, N> &operator+=(const NDArray<T, N> &other);

    /**
     * @brief Element-wise in-place subtraction.
     *
     * @throws std::invalid_argument if shapes differ.
     */
    NDArray<T, N> &operator-=(const NDArray<T, N> &other);

    /**
     * @brief Multiply all elements by a scalar.
     */
    NDArray<T, N> &operator*=(T factor) noexcept;

    /**
     * @brief Returns pointer to the first element of this array or view.
     */
    T *data() const noexcept { return data_.get() + data_offset_; }

    /**
     * @brief Returns the number of dimensions of the array.
     */
    unsigned int ndim() const noexcept { return N; }

    /**
     * @brief Returns the total number of elements in the array.
     */
    unsigned int size() const noexcept;

    /**
     * @brief Returns the shape of the array.
     */
    std::array<int, N> shape() const noexcept { return shape_; }

    /**
     * @brief Check whether the array has no storage bound to it.
     */
    bool empty() const noexcept { return data_ == nullptr; }

    /**
     * @brief Check whether another array has the same shape.
     */
    bool same_shape(const NDArray<T, N> &other) const noexcept { return shape_ == other.shape_; }

    /**
     * @brief Check whether all elements are finite.
     */
    bool all_finite() const noexcept;

    /**
     * @brief Maximum absolute value over all elements, 0 for an array without elements.
     */
    T max_abs() const noexcept;

    /**
     * @brief Sum of all elements.
     */
    T sum() const noexcept;

    /**
     * @brief Create a deep copy with its own buffer.
     */
    NDArray<T, N> copy() const;

    /**
     * @brief Return a view of the same elements with a different shape.
     *
     * @tparam M    Dimensionality of the new view.
     * @param shape New shape, must hold exactly size() elements.
     *
     * @throws std::invalid_argument if the element count differs.
     */
    template <unsigned int M>
    NDArray<T, M> reshape(const std::array<int, M> &shape) const;

    /**
     * @brief Return a one-dimensional view of all elements.
     */
    NDArray<T, 1> flatten() const { return reshape<1>({static_cast<int>(size())}); }

private:
    /**
     * @brief Compute strides for indexing based on current shape.
     */
    void compute_strides();

    /**
     * @brief Compute the flat buffer index for a given N-dimensional index.
     */
    unsigned int flat_index(const std::array<int, N> &index) const noexcept;

    /**
     * @brief Throw if another array has a different shape.
     */
    void check_shape(const NDArray<T, N> &other) const;

    /**
     * @brief Shared pointer to array data.
     */
    std::shared_ptr<T[]> data_;

    /**
     * @brief Offset applied to the data pointer (used for views).
     */
    int data_offset_;

    /**
     * @brief Shape of the array (size of each dimension).
     */
    std::array<int, N> shape_;

    /**
     * @brief Strides for row-major indexing.
     */
    std::array<int, N> strides_;

    template <typename, unsigned int>
    friend class NDArray;
};

template <typename T, unsigned int N>
NDArray<T, N>::NDArray(const std::array<int, N> &shape) : shape_(shape) {
    unsigned int size = 1;
    for (const auto &s : shape) {
        if (s < 0) {
            throw std::invalid_argument("Negative array dimension");
        }
        size *= s;
    }
    data_ = std::shared_ptr<T[]>(new T[size]());
    data_offset_ = 0;
    compute_strides();
}

template <typename T, unsigned int N>
NDArray<T, N>::NDArray(const std::array<int, N> &shape, const std::vector<T> &values) : NDArray(shape) {
    if (size() != values.size()) {
        throw std::invalid_argument("Invalid number of values");
    }
    std::copy(values.begin(), values.end(), data());
}

template <typename T, unsigned int N>
NDArray<T, N>::NDArray(const NDArray<T, N> &other)
    : data_(other.data_), data_offset_(other.data_offset_), shape_(other.shape_), strides_(other.strides_) {}

template <typename T, unsigned int N>
NDArray<T, N> &NDArray<T, N>::operator=(const NDArray<T, N> &other) {
    if (this == &other) {
        return *this;
    }

    if (data_ == nullptr) {
        data_ = other.data_;
        data_offset_ = other.data_offset_;
        shape_ = other.shape_;
        strides_ = other.strides_;
    } else {
        check_shape(other);
        std::copy(other.data(), other.data() + other.size(), data());
    }

    return *this;
}

template <typename T, unsigned int N>
T NDArray<T, N>::operator=(T other) {
    std::fill(data(), data() + size(), other);
    return other;
}

template <typename T, unsigned int N>
template <typename... Indices, typename>
const NDArray<T, N - sizeof...(Indices)> NDArray<T, N>::operator()(Indices... indices) const noexcept {
    std::array<int, sizeof...(Indices)> index = {static_cast<int>(indices)...};
    NDArray<T, N - sizeof...(Indices)> ret;

    ret.data_ = data_;
    ret.data_offset_ = data_offset_;

    for (int i = 0; i < static_cast<int>(index.size()); ++i) {
        ret.data_offset_ += strides_[i] * index[i];
    }
    for (int i = 0; i < static_cast<int>(N - index.size()); ++i) {
        ret.shape_[i] = shape_[index.size() + i];
    }

    ret.compute_strides();

    return ret;
}

template <typename T, unsigned int N>
template <typename... Indices, typename>
NDArray<T, N - sizeof...(Indices)> NDArray<T, N>::operator()(Indices... indices) noexcept {
    return static_cast<const NDArray<T, N> &>(*this)(indices...);
}

template <typename T, unsigned int N>
template <typename... Indices, typename>
T NDArray<T, N>::operator()(Indices... indices) const noexcept {
    std::array<int, sizeof...(Indices)> index = {static_cast<int>(indices)...};

    return data_[data_offset_ + flat_index(index)];
}

template <typename T, unsigned int N>
template <typename... Indices, typename>
T &NDArray<T, N>::operator()(Indices... indices) noexcept {
    std::array<int, sizeof...(Indices)> index = {static_cast<int>(indices)...};

    return data_[data_offset_ + flat_index(index)];
}

template <typename T, unsigned int N>
NDArray<T, N> &NDArray<T, N>::operator+=(const NDArray<T, N> &other) {
    check_shape(other);
    T *lhs = data();
    const T *rhs = other.data();
    for (unsigned int i = 0; i < size(); ++i) {
        lhs[i] += rhs[i];
    }
    return *this;
}

template <typename T, unsigned int N>
NDArray<T, N> &NDArray<T, N>::operator-=(const NDArray<T, N> &other) {
    check_shape(other);
    T *lhs = data();
    const T *rhs = other.data();
    for (unsigned int i = 0; i < size(); ++i) {
        lhs[i] -= rhs[i];
    }
    return *this;
}

template <typename T, unsigned int N>
NDArray<T, N> &NDArray<T, N>::operator*=(T factor) noexcept {
    T *lhs = data();
    for (unsigned int i = 0; i < size(); ++i) {
        lhs[i] *= factor;
    }
    return *this;
}

template <typename T, unsigned int N>
unsigned int NDArray<T, N>::size() const noexcept {
    if (data_ == nullptr) {
        return 0;
    }
    unsigned int size = 1;
    for (int i = 0; i < static_cast<int>(N); ++i) {
        size *= shape_[i];
    }
    return size;
}

template <typename T, unsigned int N>
bool NDArray<T, N>::all_finite() const noexcept {
    const T *values = data();
    return std::all_of(values, values + size(), [](T v) { return std::isfinite(v); });
}

template <typename T, unsigned int N>
T NDArray<T, N>::max_abs() const noexcept {
    T ret = T(0);
    const T *values = data();
    for (unsigned int i = 0; i < size(); ++i) {
        ret = std::max(ret, static_cast<T>(std::abs(values[i])));
    }
    return ret;
}

template <typename T, unsigned int N>
T NDArray<T, N>::sum() const noexcept {
    T ret = T(0);
    const T *values = data();
    for (unsigned int i = 0; i < size(); ++i) {
        ret += values[i];
    }
    return ret;
}

template <typename T, unsigned int N>
NDArray<T, N> NDArray<T, N>::copy() const {
    if (data_ == nullptr) {
        return NDArray<T, N>();
    }
    NDArray<T, N> ret(shape_);
    std::copy(data(), data() + size(), ret.data());
    return ret;
}

template <typename T, unsigned int N>
template <unsigned int M>
NDArray<T, M> NDArray<T, N>::reshape(const std::array<int, M> &shape) const {
    unsigned int new_size = 1;
    for (const auto &s : shape) {
        new_size *= s;
    }
    if (new_size != size()) {
        throw std::invalid_argument("Cannot reshape array to a different number of elements");
    }

    NDArray<T, M> ret;
    ret.data_ = data_;
    ret.data_offset_ = data_offset_;
    ret.shape_ = shape;
    ret.compute_strides();

    return ret;
}

template <typename T, unsigned int N>
void NDArray<T, N>::compute_strides() {
    int stride = 1;
    for (int i = static_cast<int>(N) - 1; i >= 0; --i) {
        strides_[i] = stride;
        stride *= shape_[i];
    }
}

template <typename T, unsigned int N>
unsigned int NDArray<T, N>::flat_index(const std::array<int, N> &index) const noexcept {
    unsigned int flat_index = 0;
    for (int i = 0; i < static_cast<int>(N); ++i) {
        flat_index += static_cast<unsigned int>(index[i]) * strides_[i];
    }
    return flat_index;
}

template <typename T, unsigned int N>
void NDArray<T, N>::check_shape(const NDArray<T, N> &other) const {
    if (!same_shape(other)) {
        throw std::invalid_argument("Provided ndarrays have different shapes");
    }
}

}; /* namespace ndarray */
