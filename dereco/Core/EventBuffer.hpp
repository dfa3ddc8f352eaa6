#ifndef __DERECO__CORE__EVENTBUFFER_HPP__DEFINED__
#define __DERECO__CORE__EVENTBUFFER_HPP__DEFINED__
#include "Event.hpp"
#include <stdlib.h>
#include <new>

namespace DERECO { namespace Core {

	// Growable block of trivially copyable events
	template <class TEvent>
	class EventBuffer {
	public:

		EventBuffer(unsigned initialCapacity)
		{
			initialCapacity = ((initialCapacity / 1024) + 1) * 1024;
			buffer = (TEvent *)malloc(sizeof(TEvent)*initialCapacity);
			if(buffer == NULL) throw std::bad_alloc();
			capacity = initialCapacity;
			used = 0;
		};
		
		TEvent &getWriteSlot() {
			if(used >= capacity) {
				size_t increment = ((capacity / 10240) + 1) * 1024;
				TEvent * reBuffer = (TEvent *)realloc((void*)buffer, sizeof(TEvent)*(capacity + increment));
				if(reBuffer == NULL) throw std::bad_alloc();
				buffer = reBuffer;
				capacity += increment;
			}
			return buffer[used];	
		};

		void pushWriteSlot() {
			used++;
		};

		TEvent & get(size_t index) {
			return buffer[index];
		};

		size_t getSize() {
			return used;
		};

		~EventBuffer() {
			free((void*)buffer);
		};

	private:
		TEvent *buffer;
		size_t capacity;
		size_t used;
	};

}}
#endif
