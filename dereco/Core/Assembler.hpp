#ifndef __DERECO__CORE__ASSEMBLER_HPP__DEFINED__
#define __DERECO__CORE__ASSEMBLER_HPP__DEFINED__

#include "Event.hpp"
#include "EventSourceSink.hpp"
#include "DirectEventTable.hpp"
#include <vector>

namespace DERECO { namespace Core {

	// Last pipeline stage. Places each event at its original row of table.
	// Throws StructuralError on a row outside the table, a row delivered
	// twice, or a row count which does not match the table size.
	class Assembler : public EventSink<DirectEvent> {
	public:
		Assembler(DirectEventTable *table);
		~Assembler();
		void pushEvents(EventBuffer<DirectEvent> *buffer);
		void finish();
		void report();
		void discard();

	private:
		DirectEventTable *table;
		std::vector<bool> filled;
		size_t nAssembled;
		unsigned nBlocks;
	};
}}
#endif
