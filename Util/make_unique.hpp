#ifndef UTIL_MAKE_UNIQUE_HPP
#define UTIL_MAKE_UNIQUE_HPP

#include<memory>
#include<type_traits>
#include<utility>

namespace Util {

/** Util::make_unique
 *
 * @brief C++11 lacks `std::make_unique`.
 * Only single objects are supported; arrays are
 * rejected at compile time.
 */
template<typename T, typename... As>
std::unique_ptr<T> make_unique(As&&... as) {
	static_assert( !std::is_array<T>::value
		     , "Util::make_unique does not build arrays"
		     );
	return std::unique_ptr<T>(new T(std::forward<As>(as)...));
}

}

#endif /* !defined(UTIL_MAKE_UNIQUE_HPP) */
