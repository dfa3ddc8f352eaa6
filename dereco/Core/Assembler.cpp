#include "Assembler.hpp"
#include <Common/Exception.hpp>
#include <stdio.h>

using namespace DERECO::Common;
using namespace DERECO::Core;

Assembler::Assembler(DirectEventTable *table)
	: table(table), filled(table->getSize(), false)
{
	nAssembled = 0;
	nBlocks = 0;
}

Assembler::~Assembler()
{
}

void Assembler::pushEvents(EventBuffer<DirectEvent> *buffer)
{
	if(buffer == NULL) return;

	nBlocks++;
	size_t nRows = table->rows.size();
	size_t nEvents = buffer->getSize();
	for(size_t i = 0; i < nEvents; i++) {
		DirectEvent &e = buffer->get(i);
		char message[128];
		if(e.position >= nRows) {
			snprintf(message, sizeof(message), "event row %u outside a table of %lu rows",
				e.position, (unsigned long)nRows);
			delete buffer;
			throw StructuralError(message);
		}
		if(filled[e.position]) {
			snprintf(message, sizeof(message), "event row %u assembled twice", e.position);
			delete buffer;
			throw StructuralError(message);
		}
		table->rows[e.position] = e;
		filled[e.position] = true;
		nAssembled++;
	}
	delete buffer;
}

void Assembler::finish()
{
	if(nAssembled != table->rows.size()) {
		char message[128];
		snprintf(message, sizeof(message), "assembled %lu events, expected %lu",
			(unsigned long)nAssembled, (unsigned long)table->rows.size());
		throw StructuralError(message);
	}
}

void Assembler::report()
{
	fprintf(stderr, ">> Assembler report\n");
	fprintf(stderr, "  %10lu events assembled in %u blocks\n", (unsigned long)nAssembled, nBlocks);
}

void Assembler::discard()
{
	// Rows already placed belong to the table, which the caller drops
}
