#ifndef __DERECO__CORE__EVENTSOURCESINK_HPP__DEFINED__
#define __DERECO__CORE__EVENTSOURCESINK_HPP__DEFINED__
#include "EventBuffer.hpp"

namespace DERECO { namespace Core {

	// A sink takes ownership of every buffer pushed into it
	template <class TEventInput>
	class EventSink {
	public:
		virtual void pushEvents(EventBuffer<TEventInput> *buffer) = 0;
		virtual void finish() = 0;
		virtual void report() = 0;
		// Waits for work in flight and drops it, down to the last sink.
		// Must be called before deleting a chain which did not finish().
		virtual void discard() = 0;
		virtual ~EventSink() {};
	};

	template <class TEventOutput>
	class EventSource {
	public:
		EventSource(EventSink<TEventOutput> *sink) {
			this->sink = sink;
		};
		
		virtual ~EventSource() {
			delete this->sink;
		};
	protected:
		EventSink<TEventOutput> *sink;

	};
	
}}
#endif
