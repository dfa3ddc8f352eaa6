#include "PositionReconstructor.hpp"
#include "EventClassifier.hpp"
#include <math.h>
#include <stdio.h>
#include <vector>

using namespace std;
using namespace DERECO::Common;
using namespace DERECO::Core;
using namespace DERECO::Calibration;

PositionReconstructor::PositionReconstructor(const DERECO::Calibration::Calibration *calibration, EventSink<DirectEvent> *sink, bool singleWorker)
	: BlockEventHandler<DirectEvent, DirectEvent>(sink, singleWorker), calibration(calibration)
{
	xftsc = calibration->getImageParam("XFTSC");
	xftOffset[0] = calibration->getImageParam("XFTLTOFF");
	xftOffset[1] = calibration->getImageParam("XFTRTOFF");
	xfttof = calibration->getImageParam("XFTTOF");
	tofsc = calibration->getImageParam("TOFSC");
	tofOffset[QUADRANT_TOP] = calibration->getImageParam("TOFTPOFF");
	tofOffset[QUADRANT_BOTTOM] = calibration->getImageParam("TOFBTOFF");
	phOffset[QUADRANT_TOP] = calibration->getImageParam("SPTPPHOFF");
	phOffset[QUADRANT_BOTTOM] = calibration->getImageParam("SPBTPHOFF");
	tofssdsc = calibration->getImageParam("TOFSSDSC");
	tofssdtotoff = calibration->getImageParam("TOFSSDTOTOFF");
	
	char name[32];
	for(int i = 0; i < N_SSD; i++) {
		snprintf(name, sizeof(name), "TOFSSDLTOFF%d", i);
		ssdTofOffset[0][i] = calibration->getImageParam(name);
		snprintf(name, sizeof(name), "TOFSSDRTOFF%d", i);
		ssdTofOffset[1][i] = calibration->getImageParam(name);
		snprintf(name, sizeof(name), "YBKSSD%d", i);
		ssdY[i] = calibration->getImageParam(name);
	}

	nEventsIn = 0;
	nNoStart = 0;
	nNoSSDElement = 0;
}

PositionReconstructor::~PositionReconstructor()
{
}

float PositionReconstructor::getFrontX(long long startType, int startPosTdc) const
{
	if(startType == START_LEFT)
		return -xftsc * startPosTdc + xftOffset[0];
	else if(startType == START_RIGHT)
		return -xftsc * startPosTdc + xftOffset[1];
	return NAN;
}

void PositionReconstructor::getFrontY(long long startType, float yBack, double & frontBackDistance, float & yFront)
{
	double yEstimate;
	double side;
	if(startType == START_LEFT) {
		yEstimate = YF_ESTIMATE_LEFT;
		side = 1;
	}
	else if(startType == START_RIGHT) {
		yEstimate = YF_ESTIMATE_RIGHT;
		side = -1;
	}
	else {
		frontBackDistance = NAN;
		yFront = NAN;
		return;
	}

	// Path through the slit towards the back hit; the start foil is inclined,
	// so the depth at which the path crosses it depends on the path angle
	double tanTheta = (yEstimate - yBack / 100.0) / SLIT_Z;
	double den = 1 + side * tanTheta;
	if(!(den > 0)) {
		frontBackDistance = NAN;
		yFront = NAN;
		return;
	}
	double dz = D_SLIT_FOIL / den;

	yFront = (yEstimate - dz * tanTheta) * 100;
	frontBackDistance = (SLIT_Z - dz) * 100;
}

int PositionReconstructor::getSSDNumber(unsigned char ssdFlags)
{
	for(int i = N_SSD - 1; i >= 0; i--) {
		if(ssdFlags & (1 << i)) return i;
	}
	return -1;
}

void PositionReconstructor::reconstructPulseHeight(DirectEvent & e) const
{
	const RawEvent &raw = e.raw;
	Quadrant q = raw.stopType == STOP_TOP ? QUADRANT_TOP : QUADRANT_BOTTOM;

	// Stop anode TDCs do not match each other, normalise them first
	float spN = calibration->getNormalizedTDC(q, TDC_STOP_NORTH, raw.stopNorthTdc);
	float spS = calibration->getNormalizedTDC(q, TDC_STOP_SOUTH, raw.stopSouthTdc);
	float spE = calibration->getNormalizedTDC(q, TDC_STOP_EAST, raw.stopEastTdc);
	float spW = calibration->getNormalizedTDC(q, TDC_STOP_WEST, raw.stopWestTdc);

	BackPositionTable xTable = q == QUADRANT_TOP ? BACKPOS_X_TOP : BACKPOS_X_BOTTOM;
	BackPositionTable yTable = q == QUADRANT_TOP ? BACKPOS_Y_TOP : BACKPOS_Y_BOTTOM;
	e.xBack = calibration->getBackPosition(xTable, spS - spN + BACKPOS_LUT_CENTER);
	e.yBack = calibration->getBackPosition(yTable, spE - spW + BACKPOS_LUT_CENTER);

	// Sum over both anode pairs; the 1/2 is folded into TOFSC
	float t1 = spN + spS + spE + spW;
	e.tofProvisional = tofsc * t1 + tofOffset[q];
	e.tofStartStop = e.tofProvisional + e.xFront / 100 * xfttof;

	getFrontY(raw.startType, e.yBack, e.frontBackDistance, e.yFront);

	float xlut = q == QUADRANT_TOP ?
		(e.xBack / 100 - 25.0 / 2) * 20 / 50 :
		(e.xBack / 100 + 50 + 25.0 / 2) * 20 / 50;
	float ylut = (e.yBack / 100 + 82.0 / 2) * 32 / 82;
	e.energy = raw.energyPh - phOffset[q] * calibration->getPulseHeightCorrection(xlut, ylut) / 1024;
}

void PositionReconstructor::reconstructSSD(DirectEvent & e) const
{
	const RawEvent &raw = e.raw;

	// No coincidence anode in this path
	e.xBack = 0;
	e.xCoin = 0;
	e.tofStopCoin = 0;
	e.energy = raw.energyPh;

	int ssd = getSSDNumber(raw.ssdFlags);
	e.ssdNumber = ssd;
	if(ssd < 0) {
		e.yBack = NAN;
		e.tofStartStop = NAN;
		getFrontY(raw.startType, e.yBack, e.frontBackDistance, e.yFront);
		return;
	}

	e.yBack = ssdY[ssd] * 100;

	double offset = 0;
	if(raw.startType == START_LEFT)
		offset = ssdTofOffset[0][ssd];
	else if(raw.startType == START_RIGHT)
		offset = ssdTofOffset[1][ssd];

	e.tofStartStop = tofssdsc * raw.coinDiscreteTdc + offset + tofssdtotoff + e.xFront / 100 * xfttof;

	getFrontY(raw.startType, e.yBack, e.frontBackDistance, e.yFront);
}

EventBuffer<DirectEvent> * PositionReconstructor::handleEvents(EventBuffer<DirectEvent> *inBuffer)
{
	unsigned nEvents = inBuffer->getSize();
	u_int32_t lNoStart = 0;
	u_int32_t lNoSSDElement = 0;

	for(unsigned i = 0; i < nEvents; i++) {
		DirectEvent &e = inBuffer->get(i);
		e.xFront = getFrontX(e.raw.startType, e.raw.startPosTdc);
		if(isnan(e.xFront)) lNoStart++;
	}

	vector<unsigned> indices;
	EventClassifier::getIndices(inBuffer, CATEGORY_PULSE_HEIGHT, indices);
	for(unsigned i = 0; i < indices.size(); i++) {
		reconstructPulseHeight(inBuffer->get(indices[i]));
	}

	EventClassifier::getIndices(inBuffer, CATEGORY_SSD, indices);
	for(unsigned i = 0; i < indices.size(); i++) {
		DirectEvent &e = inBuffer->get(indices[i]);
		reconstructSSD(e);
		if(e.ssdNumber < 0) lNoSSDElement++;
	}

	atomicAdd(nEventsIn, nEvents);
	atomicAdd(nNoStart, lNoStart);
	atomicAdd(nNoSSDElement, lNoSSDElement);
	return inBuffer;
}

void PositionReconstructor::report()
{
	fprintf(stderr, ">> PositionReconstructor report\n");
	fprintf(stderr, " events received\n");
	fprintf(stderr, "  %10u\n", nEventsIn);
	fprintf(stderr, " events with fill positions\n");
	fprintf(stderr, "  %10u unknown start type\n", nNoStart);
	fprintf(stderr, "  %10u no SSD element flagged\n", nNoSSDElement);
	BlockEventHandler<DirectEvent, DirectEvent>::report();
}
