#pragma once

#include <type_traits>
#include <cstddef>


namespace MlMath{

/**
 * Running arithmetic mean, updated one value at a time without storing the history. Each new value is blended into the
 * existing mean with weight 1/(n+1), where n is the number of values seen before it.
 * @tparam T floating point width of the mean (float or double)
 */
template<class T> class MeanIncrementor{
    static_assert(std::is_floating_point<T>::value, "ERROR: MeanIncrementor requires a floating point type");

    T running_mean;
    size_t n;

public:
    MeanIncrementor();

    // No validation, NaN and inf propagate into the mean
    void add(T value);

    T mean() const;
    size_t count() const;
};


extern template class MeanIncrementor<float>;
extern template class MeanIncrementor<double>;

using MeanIncrementorF32 = MeanIncrementor<float>;
using MeanIncrementorF64 = MeanIncrementor<double>;

}
