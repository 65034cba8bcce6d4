#include "VarianceIncrementor.hpp"


namespace MlMath{


template<class T> VarianceIncrementor<T>::VarianceIncrementor():
        running_variance(0),
        mean_incrementor()
{}


template<class T> void VarianceIncrementor<T>::add(T value){
    // Must be captured before the mean absorbs the new value
    size_t n = mean_incrementor.count();
    T previous_mean = mean_incrementor.mean();

    mean_incrementor.add(value);

    if (n == 0){
        running_variance = 0;
    }
    else {
        auto delta = value - previous_mean;
        running_variance = T(n - 1) / T(n) * running_variance + delta*delta / T(n + 1);
    }
}


template<class T> T VarianceIncrementor<T>::variance() const{
    return running_variance;
}


template<class T> T VarianceIncrementor<T>::mean() const{
    return mean_incrementor.mean();
}


template<class T> size_t VarianceIncrementor<T>::count() const{
    return mean_incrementor.count();
}


template class VarianceIncrementor<float>;
template class VarianceIncrementor<double>;


}
