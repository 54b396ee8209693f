/**
 * NumPy buffer protocol utilities for PyBind11.
 *
 * Conversions between NumPy arrays and the flat row-major vectors used by the
 * C++ core.
 */

#pragma once

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace py = pybind11;

namespace confens {
namespace bindings {

/**
 * Create NumPy array from a C++ vector, checking that the sizes agree.
 */
template<typename T>
py::array_t<T> make_array_from_vector(const std::vector<size_t>& shape, const std::vector<T>& data) {
    size_t expected_size = 1;
    for (size_t dim : shape) {
        expected_size *= dim;
    }

    if (data.size() != expected_size) {
        std::ostringstream msg;
        msg << "Data size (" << data.size() << ") doesn't match shape size (" << expected_size << ")";
        throw std::invalid_argument(msg.str());
    }

    py::array_t<T> arr(shape);
    std::copy(data.begin(), data.end(), arr.mutable_data());
    return arr;
}

/**
 * Copy a NumPy array into a flat vector.
 *
 * The array is forced to C order and T's dtype by the py::array_t
 * conversion at the call boundary.
 */
template<typename T>
std::vector<T> to_vector(const py::array_t<T, py::array::c_style | py::array::forcecast>& arr) {
    return std::vector<T>(arr.data(), arr.data() + arr.size());
}

/**
 * Validate coordinate array shape [N, 3] with N > 0.
 *
 * Throws std::invalid_argument if shape is invalid.
 */
inline void validate_coords_array(const py::array& arr, const char* name) {
    if (arr.ndim() != 2) {
        std::ostringstream msg;
        msg << name << " must be 2D array, got " << arr.ndim() << "D";
        throw std::invalid_argument(msg.str());
    }

    if (arr.shape(1) != 3) {
        std::ostringstream msg;
        msg << name << " must have shape (N, 3), got (" << arr.shape(0) << ", " << arr.shape(1)
            << ")";
        throw std::invalid_argument(msg.str());
    }

    if (arr.shape(0) == 0) {
        std::ostringstream msg;
        msg << name << " must have at least 1 atom";
        throw std::invalid_argument(msg.str());
    }
}

/**
 * Validate 1D array length.
 */
inline void validate_1d_array(const py::array& arr, size_t length, const char* name) {
    if (arr.ndim() != 1 || static_cast<size_t>(arr.shape(0)) != length) {
        std::ostringstream msg;
        msg << name << " must have shape (" << length << ",)";
        throw std::invalid_argument(msg.str());
    }
}

} // namespace bindings
} // namespace confens
