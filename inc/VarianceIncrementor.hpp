#pragma once

#include "MeanIncrementor.hpp"

#include <cstddef>


namespace MlMath{

/**
 * Running variance, updated one value at a time. Owns a MeanIncrementor which provides the mean and count.
 *
 * The update uses the mean from BEFORE the new value is absorbed:
 *      var(n+1) = (n-1)/n * var(n) + (x - mean(n))^2 / (n+1)
 *
 * For n >= 2 this is the unbiased sample variance (divide by n-1), e.g. {0,1} -> 0.5 and {0,1,2} -> 1.0.
 * See: http://math.stackexchange.com/questions/102978/incremental-computation-of-standard-deviation
 * @tparam T floating point width (float or double)
 */
template<class T> class VarianceIncrementor{
    T running_variance;
    MeanIncrementor<T> mean_incrementor;

public:
    VarianceIncrementor();

    void add(T value);

    // 0 when count <= 1
    T variance() const;
    T mean() const;
    size_t count() const;
};


extern template class VarianceIncrementor<float>;
extern template class VarianceIncrementor<double>;

using VarianceIncrementorF32 = VarianceIncrementor<float>;
using VarianceIncrementorF64 = VarianceIncrementor<double>;

}
