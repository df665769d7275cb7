#pragma once

#include <Debug/DebugOptions.hpp>

#ifdef LLA_EXECUTE_ASSERTS_IN_RELEASE
	#include <iostream>
	#include <cstdlib>
	#define ASSERT(condition) \
		do \
		{ \
			if ((condition) == false) \
			{ \
				std::cerr << __FILE__ << ':' << __LINE__ << ": assertion failed: " #condition "\n"; \
				std::abort(); \
			} \
		} while (false)
	#define ASSERT_NOT_REACHED() \
		do \
		{ \
			std::cerr << __FILE__ << ':' << __LINE__ << ": unreachable code reached\n"; \
			std::abort(); \
		} while (false)
#else
	#include <assert.h>
	#define ASSERT assert
	#define ASSERT_NOT_REACHED() assert(false)
#endif
