#include "MeanIncrementor.hpp"


namespace MlMath{


template<class T> MeanIncrementor<T>::MeanIncrementor():
        running_mean(0),
        n(0)
{}


template<class T> void MeanIncrementor<T>::add(T value){
    if (n == 0){
        // First value is the mean, no need to divide
        running_mean = value;
    }
    else {
        T weight = T(1) / T(n + 1);
        running_mean = running_mean*(T(1) - weight) + value*weight;
    }

    n++;
}


template<class T> T MeanIncrementor<T>::mean() const{
    return running_mean;
}


template<class T> size_t MeanIncrementor<T>::count() const{
    return n;
}


template class MeanIncrementor<float>;
template class MeanIncrementor<double>;


}
