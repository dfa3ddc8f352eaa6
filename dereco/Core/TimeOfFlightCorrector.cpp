#include "TimeOfFlightCorrector.hpp"
#include <Common/Constants.hpp>
#include <math.h>
#include <stdio.h>

using namespace DERECO::Common;
using namespace DERECO::Core;
using namespace DERECO::Calibration;

TimeOfFlightCorrector::TimeOfFlightCorrector(const DERECO::Calibration::Calibration *calibration, EventSink<DirectEvent> *sink, bool singleWorker)
	: BlockEventHandler<DirectEvent, DirectEvent>(sink, singleWorker), calibration(calibration)
{
	xCoinScale[QUADRANT_TOP] = calibration->getImageParam("XCOINTPSC");
	xCoinScale[QUADRANT_BOTTOM] = calibration->getImageParam("XCOINBTSC");
	xCoinOffset[QUADRANT_TOP] = calibration->getImageParam("XCOINTPOFF");
	xCoinOffset[QUADRANT_BOTTOM] = calibration->getImageParam("XCOINBTOFF");
	etofScale = calibration->getImageParam("ETOFSC");
	etofOffset[QUADRANT_TOP] = calibration->getImageParam("ETOFTPOFF");
	etofOffset[QUADRANT_BOTTOM] = calibration->getImageParam("ETOFBTOFF");

	nEventsIn = 0;
	nCoincidence = 0;
	nBothAnodes = 0;
	nNoSpeed = 0;
}

TimeOfFlightCorrector::~TimeOfFlightCorrector()
{
}

bool TimeOfFlightCorrector::correctCoincidence(DirectEvent & e) const
{
	CoincidenceMask mask(e.raw.coinType);
	Quadrant q;
	if(mask.isOnly(CoincidenceMask::TOP))
		q = QUADRANT_TOP;
	else if(mask.isOnly(CoincidenceMask::BOTTOM))
		q = QUADRANT_BOTTOM;
	else {
		e.xCoin = 0;
		e.tofStopCoin = 0;
		return false;
	}

	float cn = calibration->getNormalizedTDC(q, TDC_COIN_NORTH, e.raw.coinNorthTdc);
	float cs = calibration->getNormalizedTDC(q, TDC_COIN_SOUTH, e.raw.coinSouthTdc);

	e.xCoin = (xCoinScale[q] * (cs - cn) + xCoinOffset[q]) * 100;
	float t2Coin = etofScale * (cn + cs) + etofOffset[q];
	e.tofStopCoin = t2Coin * 10 - e.tofProvisional;
	return true;
}

void TimeOfFlightCorrector::getCorrectedTof(float tof, float pathLength, Branch branch,
	float & tofCorrected, float & velocityMagnitude)
{
	double dmin = branch == BRANCH_PH ? DMIN_PH_CTOF : DMIN_SSD_CTOF;
	if(!(pathLength > 0)) {
		tofCorrected = NAN;
		velocityMagnitude = NAN;
		return;
	}

	tofCorrected = tof * dmin / (pathLength / 100.0);
	// mm per tenth of ns is 1e4 km/s
	if(tofCorrected > 0)
		velocityMagnitude = dmin / tofCorrected * 1E4;
	else
		velocityMagnitude = NAN;
}

EventBuffer<DirectEvent> * TimeOfFlightCorrector::handleEvents(EventBuffer<DirectEvent> *inBuffer)
{
	unsigned nEvents = inBuffer->getSize();
	u_int32_t lCoincidence = 0;
	u_int32_t lBothAnodes = 0;
	u_int32_t lNoSpeed = 0;

	for(unsigned i = 0; i < nEvents; i++) {
		DirectEvent &e = inBuffer->get(i);
		if(e.category == CATEGORY_INVALID) continue;

		Branch branch = BRANCH_SSD;
		if(e.category == CATEGORY_PULSE_HEIGHT) {
			branch = BRANCH_PH;
			if(correctCoincidence(e))
				lCoincidence++;
			CoincidenceMask mask(e.raw.coinType);
			if(mask.has(CoincidenceMask::TOP) && mask.has(CoincidenceMask::BOTTOM))
				lBothAnodes++;
		}

		getCorrectedTof(e.tofStartStop, e.pathLength, branch, e.tofCorrected, e.velocityMagnitude);
		if(isnan(e.velocityMagnitude)) lNoSpeed++;
	}

	atomicAdd(nEventsIn, nEvents);
	atomicAdd(nCoincidence, lCoincidence);
	atomicAdd(nBothAnodes, lBothAnodes);
	atomicAdd(nNoSpeed, lNoSpeed);
	return inBuffer;
}

void TimeOfFlightCorrector::report()
{
	fprintf(stderr, ">> TimeOfFlightCorrector report\n");
	fprintf(stderr, " events received\n");
	fprintf(stderr, "  %10u\n", nEventsIn);
	fprintf(stderr, "  %10u with a coincidence TOF\n", nCoincidence);
	fprintf(stderr, "  %10u with both coincidence anodes\n", nBothAnodes);
	fprintf(stderr, "  %10u without a speed\n", nNoSpeed);
	BlockEventHandler<DirectEvent, DirectEvent>::report();
}
