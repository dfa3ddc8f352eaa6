#include "Instrumentation.hpp"

void DERECO::Common::atomicAdd(volatile u_int32_t &val, u_int32_t increment)
{
	__sync_fetch_and_add(&val, increment);
}
