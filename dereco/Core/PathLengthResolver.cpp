#include "PathLengthResolver.hpp"
#include <math.h>
#include <stdio.h>

using namespace DERECO::Common;
using namespace DERECO::Core;

PathLengthResolver::PathLengthResolver(EventSink<DirectEvent> *sink, bool singleWorker)
	: BlockEventHandler<DirectEvent, DirectEvent>(sink, singleWorker)
{
	nEventsIn = 0;
	nResolved = 0;
}

PathLengthResolver::~PathLengthResolver()
{
}

float PathLengthResolver::getPathLength(float xFront, float yFront, float xBack, float yBack, double frontBackDistance)
{
	double dx = (double)xBack - xFront;
	double dy = (double)yBack - yFront;
	return sqrt(frontBackDistance * frontBackDistance + dx * dx + dy * dy);
}

EventBuffer<DirectEvent> * PathLengthResolver::handleEvents(EventBuffer<DirectEvent> *inBuffer)
{
	unsigned nEvents = inBuffer->getSize();
	u_int32_t lResolved = 0;
	for(unsigned i = 0; i < nEvents; i++) {
		DirectEvent &e = inBuffer->get(i);
		if(e.category == CATEGORY_INVALID) continue;
		e.pathLength = getPathLength(e.xFront, e.yFront, e.xBack, e.yBack, e.frontBackDistance);
		if(!isnan(e.pathLength)) lResolved++;
	}
	atomicAdd(nEventsIn, nEvents);
	atomicAdd(nResolved, lResolved);
	return inBuffer;
}

void PathLengthResolver::report()
{
	fprintf(stderr, ">> PathLengthResolver report\n");
	fprintf(stderr, " events received\n");
	fprintf(stderr, "  %10u\n", nEventsIn);
	fprintf(stderr, " path lengths resolved\n");
	fprintf(stderr, "  %10u\n", nResolved);
	BlockEventHandler<DirectEvent, DirectEvent>::report();
}
