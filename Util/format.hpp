#ifndef UTIL_FORMAT_HPP
#define UTIL_FORMAT_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#include<string>

namespace Util {

/* printf into a std::string, for log lines.  */
std::string format(char const* fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 1, 2)))
#endif
;

}

#endif /* UTIL_FORMAT_HPP */
