#include"Util/format.hpp"
#include<stdarg.h>
#include<stdio.h>
#include<vector>

namespace Util {

std::string format(char const* fmt, ...) {
	va_list ap;

	/* First pass measures, second pass writes.  */
	va_start(ap, fmt);
	auto needed = vsnprintf(nullptr, 0, fmt, ap);
	va_end(ap);
	if (needed <= 0)
		return std::string();

	auto buf = std::vector<char>(std::size_t(needed) + 1);
	va_start(ap, fmt);
	vsnprintf(buf.data(), buf.size(), fmt, ap);
	va_end(ap);

	return std::string(buf.data(), std::size_t(needed));
}

}
