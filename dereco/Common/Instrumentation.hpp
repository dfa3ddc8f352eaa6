#ifndef __DERECO__COMMON__INSTRUMENTATION_HPP__DEFINED__
#define __DERECO__COMMON__INSTRUMENTATION_HPP__DEFINED__

#include <sys/types.h>
namespace DERECO { namespace Common {
	
	void atomicAdd(volatile u_int32_t &val, u_int32_t increment);
	
}}

#endif
