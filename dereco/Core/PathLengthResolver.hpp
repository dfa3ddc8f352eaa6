#ifndef __DERECO__CORE__PATHLENGTHRESOLVER_HPP__DEFINED__
#define __DERECO__CORE__PATHLENGTHRESOLVER_HPP__DEFINED__

#include "Event.hpp"
#include "BlockEventHandler.hpp"
#include <Common/Instrumentation.hpp>

namespace DERECO { namespace Core {

	class PathLengthResolver : public BlockEventHandler<DirectEvent, DirectEvent> {
	public:
		PathLengthResolver(EventSink<DirectEvent> *sink, bool singleWorker = false);
		~PathLengthResolver();
		void report();

		// Distance between front and back hits; NaN if any input is NaN
		static float getPathLength(float xFront, float yFront, float xBack, float yBack, double frontBackDistance);

	protected:
		virtual EventBuffer<DirectEvent> * handleEvents(EventBuffer<DirectEvent> *inBuffer);

	private:
		u_int32_t nEventsIn;
		u_int32_t nResolved;
	};
}}
#endif
