#ifndef _libstarpoly_h_
#define _libstarpoly_h_

#include "libstarpoly_version.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

//FIXME This epsilon value is used for several non-related purposes:
// for a threshold of a coordinate difference in the star's local space,
// for a threshold of a cross product of two normalized vectors etc.
static constexpr double EPSILON = 1e-4;
static constexpr double PI = 3.141592653589793238;

namespace StarPoly {

enum Axis {
    X = 0,
    Y,
};

template<typename T>
constexpr inline T sqr(T x)
{
    return x * x;
}

template<typename T> T rad2deg(T angle) { return T(180.0) * angle / T(PI); }
template<typename T> constexpr T deg2rad(const T angle) { return T(PI) * angle / T(180.0); }

template<class T, class I, class... Args> // Arbitrary allocator can be used
std::enable_if_t<std::is_integral<I>::value, std::vector<T, Args...>> reserve_vector(I capacity)
{
    std::vector<T, Args...> ret;
    if (capacity > I(0)) ret.reserve(size_t(capacity));

    return ret;
}

} // namespace StarPoly

#endif // _libstarpoly_h_
