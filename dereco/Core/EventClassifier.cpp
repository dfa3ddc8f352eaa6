#include "EventClassifier.hpp"

using namespace std;
using namespace DERECO::Common;
using namespace DERECO::Core;

EventClassifier::EventClassifier(EventSink<DirectEvent> *sink, bool singleWorker)
	: BlockEventHandler<DirectEvent, DirectEvent>(sink, singleWorker)
{
	nEventsIn = 0;
	nPulseHeight = 0;
	nSSD = 0;
	nInvalid = 0;
}

EventClassifier::~EventClassifier()
{
}

EventCategory EventClassifier::classify(int stopType)
{
	if(isPulseHeightStop(stopType)) return CATEGORY_PULSE_HEIGHT;
	if(isSSDStop(stopType)) return CATEGORY_SSD;
	return CATEGORY_INVALID;
}

void EventClassifier::classify(const vector<int> & stopTypes, vector<unsigned> & phIndices, vector<unsigned> & ssdIndices)
{
	phIndices.clear();
	ssdIndices.clear();
	for(unsigned i = 0; i < stopTypes.size(); i++) {
		EventCategory category = classify(stopTypes[i]);
		if(category == CATEGORY_PULSE_HEIGHT)
			phIndices.push_back(i);
		else if(category == CATEGORY_SSD)
			ssdIndices.push_back(i);
	}
}

void EventClassifier::getIndices(EventBuffer<DirectEvent> *buffer, EventCategory category, vector<unsigned> & indices)
{
	indices.clear();
	unsigned nEvents = buffer->getSize();
	for(unsigned i = 0; i < nEvents; i++) {
		if(buffer->get(i).category == category)
			indices.push_back(i);
	}
}

EventBuffer<DirectEvent> * EventClassifier::handleEvents(EventBuffer<DirectEvent> *inBuffer)
{
	unsigned nEvents = inBuffer->getSize();
	
	u_int32_t lPulseHeight = 0;
	u_int32_t lSSD = 0;
	u_int32_t lInvalid = 0;
	for(unsigned i = 0; i < nEvents; i++) {
		DirectEvent &e = inBuffer->get(i);
		e.category = classify(e.raw.stopType);
		switch(e.category) {
			case CATEGORY_PULSE_HEIGHT: lPulseHeight++; break;
			case CATEGORY_SSD: lSSD++; break;
			default: lInvalid++; break;
		}
	}
	
	atomicAdd(nEventsIn, nEvents);
	atomicAdd(nPulseHeight, lPulseHeight);
	atomicAdd(nSSD, lSSD);
	atomicAdd(nInvalid, lInvalid);
	return inBuffer;
}

void EventClassifier::report()
{
	fprintf(stderr, ">> EventClassifier report\n");
	fprintf(stderr, " events received\n");
	fprintf(stderr, "  %10u\n", nEventsIn);
	if(nEventsIn > 0) {
		fprintf(stderr, "  %10u (%5.1f%%) pulse height\n", nPulseHeight, 100.0 * nPulseHeight / nEventsIn);
		fprintf(stderr, "  %10u (%5.1f%%) SSD\n", nSSD, 100.0 * nSSD / nEventsIn);
		fprintf(stderr, "  %10u (%5.1f%%) neither\n", nInvalid, 100.0 * nInvalid / nEventsIn);
	}
	BlockEventHandler<DirectEvent, DirectEvent>::report();
}
