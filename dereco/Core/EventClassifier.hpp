#ifndef __DERECO__CORE__EVENTCLASSIFIER_HPP__DEFINED__
#define __DERECO__CORE__EVENTCLASSIFIER_HPP__DEFINED__

#include "Event.hpp"
#include "BlockEventHandler.hpp"
#include <Common/Instrumentation.hpp>
#include <vector>

namespace DERECO { namespace Core {

	// Tags each event as pulse height, SSD or invalid from its stop type
	class EventClassifier : public BlockEventHandler<DirectEvent, DirectEvent> {
	public:
		EventClassifier(EventSink<DirectEvent> *sink, bool singleWorker = false);
		~EventClassifier();
		void report();

		// False for events without a start detection, which never enter the pipeline
		static bool isDetected(long long startType) { return startType != START_TYPE_FILL; };
		static EventCategory classify(int stopType);
		static void classify(const std::vector<int> & stopTypes,
			std::vector<unsigned> & phIndices, std::vector<unsigned> & ssdIndices);
		// Positions within buffer of the events already tagged with category
		static void getIndices(EventBuffer<DirectEvent> *buffer, EventCategory category, std::vector<unsigned> & indices);

	protected:
		virtual EventBuffer<DirectEvent> * handleEvents(EventBuffer<DirectEvent> *inBuffer);

	private:
		u_int32_t nEventsIn;
		u_int32_t nPulseHeight;
		u_int32_t nSSD;
		u_int32_t nInvalid;
	};
}}
#endif
