#include "FrameAnnotator.hpp"
#include <stdio.h>

using namespace DERECO::Common;
using namespace DERECO::Core;
using namespace DERECO::Geometry;

FrameAnnotator::FrameAnnotator(const GeometryService *geometry, Frame instrumentFrame, EventSink<DirectEvent> *sink)
	: BlockEventHandler<DirectEvent, DirectEvent>(sink, true), geometry(geometry), instrumentFrame(instrumentFrame)
{
	nEventsIn = 0;
}

FrameAnnotator::~FrameAnnotator()
{
}

static inline void store(const Vector3 & v, float out[3])
{
	out[0] = v.x;
	out[1] = v.y;
	out[2] = v.z;
}

EventBuffer<DirectEvent> * FrameAnnotator::handleEvents(EventBuffer<DirectEvent> *inBuffer)
{
	unsigned nEvents = inBuffer->getSize();

	et.resize(nEvents);
	velocity.resize(nEvents);
	for(unsigned i = 0; i < nEvents; i++) {
		DirectEvent &e = inBuffer->get(i);
		et[i] = e.raw.eventTime;
		velocity[i].x = e.velocity[0];
		velocity[i].y = e.velocity[1];
		velocity[i].z = e.velocity[2];
	}

	geometry->frameTransform(et, velocity, instrumentFrame, FRAME_SPACECRAFT, velocitySc);
	geometry->frameTransform(et, velocity, instrumentFrame, FRAME_DPS, velocityDps);
	geometry->spacecraftState(et, FRAME_DPS, state);

	for(unsigned i = 0; i < nEvents; i++) {
		DirectEvent &e = inBuffer->get(i);
		store(velocitySc[i], e.velocitySc);
		store(velocityDps[i], e.velocityDpsSc);

		// Compton-Getting: particle velocity seen from the Sun
		Vector3 helio;
		helio.x = velocityDps[i].x + state[i].velocity.x;
		helio.y = velocityDps[i].y + state[i].velocity.y;
		helio.z = velocityDps[i].z + state[i].velocity.z;
		store(helio, e.velocityDpsHelio);
	}

	atomicAdd(nEventsIn, nEvents);
	return inBuffer;
}

void FrameAnnotator::report()
{
	fprintf(stderr, ">> FrameAnnotator report\n");
	fprintf(stderr, " events received\n");
	fprintf(stderr, "  %10u\n", nEventsIn);
	fprintf(stderr, " instrument frame %s\n", getFrameName(instrumentFrame));
	BlockEventHandler<DirectEvent, DirectEvent>::report();
}
