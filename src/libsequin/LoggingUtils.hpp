// =============================================================================
//  SEQUIN
//  
//  Copyright © 2008-present: The SEQUIN Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

/**
 * @file 
 * Utilities for logging various data types.
 */

#ifndef LIBSEQUIN_LOGGING_UTILS_HPP_
#define LIBSEQUIN_LOGGING_UTILS_HPP_

#ifndef SEQUIN_LOGGING_DISABLE
	#include <ostream>
#endif

namespace sequin
{
namespace log
{
	/**
	 * @brief Container for logging arrays given by pointer and number of elements
	 * @tparam T Type of the underlying array items
	 */
	template <class T>
	struct VectorPtr
	{
		const T* data;
		unsigned int nElem;

		VectorPtr(T const* d, unsigned int n) : data(d), nElem(n) { }
	};

#ifndef SEQUIN_LOGGING_DISABLE

	template <class T>
	inline std::ostream& operator<<(std::ostream& os, const sequin::log::VectorPtr<T>& v)
	{
		os << "[";
		if (v.nElem > 0)
		{
			for (unsigned int i = 0; i < v.nElem-1; ++i)
				os << v.data[i] << ",";
			os << v.data[v.nElem - 1];
		}
		os << "]";
		return os;
	}

#endif

} // namespace log
} // namespace sequin

#endif  // LIBSEQUIN_LOGGING_UTILS_HPP_
