#include "Reconstructor.hpp"
#include "EventClassifier.hpp"
#include "PositionReconstructor.hpp"
#include "PathLengthResolver.hpp"
#include "TimeOfFlightCorrector.hpp"
#include "SpeciesClassifier.hpp"
#include "VelocityComputer.hpp"
#include "FrameAnnotator.hpp"
#include "Assembler.hpp"
#include <Common/Exception.hpp>
#include <stdio.h>
#include <vector>

using namespace std;
using namespace DERECO::Common;
using namespace DERECO::Core;
using namespace DERECO::Geometry;

Frame DERECO::Core::getSensorFrame(Sensor sensor)
{
	return sensor == SENSOR_45 ? FRAME_ULTRA_45 : FRAME_ULTRA_90;
}

const char * DERECO::Core::getSensorInstrument(Sensor sensor)
{
	return sensor == SENSOR_45 ? "ultra45" : "ultra90";
}

Reconstructor::Reconstructor(const DERECO::Calibration::Calibration *calibration,
	const GeometryService *geometry, Sensor sensor, bool singleThread, unsigned blockSize)
	: calibration(calibration), geometry(geometry), sensor(sensor), singleThread(singleThread),
	  blockSize(blockSize > 0 ? blockSize : 1), verbose(false)
{
}

Reconstructor::~Reconstructor()
{
}

DirectEventTable * Reconstructor::reconstruct(const RawEventBatch & batch)
{
	batch.validate();

	vector<size_t> detected;
	detected.reserve(batch.getSize());
	for(size_t i = 0; i < batch.getSize(); i++) {
		if(EventClassifier::isDetected(batch.startType[i]))
			detected.push_back(i);
	}
	if(verbose) {
		fprintf(stderr, "Reconstructing %lu of %lu events for %s\n",
			(unsigned long)detected.size(), (unsigned long)batch.getSize(),
			getSensorInstrument(sensor));
	}

	DirectEventTable *table = new DirectEventTable(getSensorInstrument(sensor), detected.size());
	EventSink<DirectEvent> *pipeSink = NULL;
	EventBuffer<DirectEvent> *buffer = NULL;
	try {
		// A stage whose constructor throws releases the stages below it
		pipeSink = new EventClassifier(
			new PositionReconstructor(calibration,
			new PathLengthResolver(
			new TimeOfFlightCorrector(calibration,
			new SpeciesClassifier(calibration,
			new VelocityComputer(calibration,
			new FrameAnnotator(geometry, getSensorFrame(sensor),
			new Assembler(table)
			), singleThread), singleThread), singleThread), singleThread), singleThread), singleThread);

		for(size_t i = 0; i < detected.size(); i++) {
			if(buffer == NULL)
				buffer = new EventBuffer<DirectEvent>(blockSize);

			DirectEvent &e = buffer->getWriteSlot();
			e = DirectEvent();
			e.raw = batch.getEvent(detected[i]);
			e.position = i;
			buffer->pushWriteSlot();

			if(buffer->getSize() >= blockSize) {
				EventBuffer<DirectEvent> *block = buffer;
				buffer = NULL;
				pipeSink->pushEvents(block);
			}
		}
		if(buffer != NULL) {
			EventBuffer<DirectEvent> *block = buffer;
			buffer = NULL;
			pipeSink->pushEvents(block);
		}
		pipeSink->finish();

		if(verbose)
			pipeSink->report();
	}
	catch(Exception &) {
		delete buffer;
		if(pipeSink != NULL)
			pipeSink->discard();
		delete pipeSink;
		delete table;
		throw;
	}

	delete pipeSink;
	return table;
}
