#include "VelocityComputer.hpp"
#include <Common/Constants.hpp>
#include <math.h>
#include <stdio.h>

using namespace DERECO::Common;
using namespace DERECO::Core;

VelocityComputer::VelocityComputer(const DERECO::Calibration::Calibration *calibration, EventSink<DirectEvent> *sink, bool singleWorker)
	: BlockEventHandler<DirectEvent, DirectEvent>(sink, singleWorker)
{
	for(int b = 0; b < DERECO::Calibration::N_BRANCHES; b++) {
		mass[b][SPECIES_UNKNOWN] = NAN;
		for(int s = SPECIES_H; s < N_SPECIES; s++)
			mass[b][s] = calibration->getSpeciesMass((DERECO::Calibration::Branch)b, (Species)s);
	}

	nEventsIn = 0;
	nNoVelocity = 0;
}

VelocityComputer::~VelocityComputer()
{
}

void VelocityComputer::getVelocity(float xFront, float yFront, float xBack, float yBack,
	double frontBackDistance, float tof, float velocity[3])
{
	if(!(tof > 0)) {
		velocity[0] = velocity[1] = velocity[2] = NAN;
		return;
	}

	// Hundredths of mm per tenth of ns is 100 km/s
	velocity[0] = ((double)xBack - xFront) / tof * 100;
	velocity[1] = ((double)yBack - yFront) / tof * 100;
	velocity[2] = frontBackDistance / tof * 100;
}

float VelocityComputer::getKineticEnergy(const float velocity[3], double mass)
{
	double v2 = 0;
	for(int i = 0; i < 3; i++) {
		double v = velocity[i] * 1E3;
		v2 += v * v;
	}
	return 0.5 * mass * v2 * J_KEV;
}

void VelocityComputer::getDirection(const float velocity[3], float & azimuth, float & elevation)
{
	double vx = velocity[0];
	double vy = velocity[1];
	double vz = velocity[2];
	double norm = sqrt(vx*vx + vy*vy + vz*vz);
	if(!(norm > 0)) {
		azimuth = NAN;
		elevation = NAN;
		return;
	}

	double az = atan2(vy, vx);
	if(az < 0) az += 2 * M_PI;
	azimuth = az;
	// Rounding to float may land on 2pi itself
	if(azimuth >= 2 * M_PI) azimuth = 0;

	double sinEl = vz / norm;
	if(sinEl > 1) sinEl = 1;
	if(sinEl < -1) sinEl = -1;
	elevation = asin(sinEl);
	if(elevation > M_PI_2) elevation = nextafterf(elevation, 0);
	if(elevation < -M_PI_2) elevation = nextafterf(elevation, 0);
}

EventBuffer<DirectEvent> * VelocityComputer::handleEvents(EventBuffer<DirectEvent> *inBuffer)
{
	unsigned nEvents = inBuffer->getSize();
	u_int32_t lNoVelocity = 0;

	for(unsigned i = 0; i < nEvents; i++) {
		DirectEvent &e = inBuffer->get(i);
		if(e.category == CATEGORY_INVALID) continue;

		getVelocity(e.xFront, e.yFront, e.xBack, e.yBack, e.frontBackDistance, e.tofStartStop, e.velocity);
		int branch = e.category == CATEGORY_SSD ? DERECO::Calibration::BRANCH_SSD : DERECO::Calibration::BRANCH_PH;
		e.tofEnergy = getKineticEnergy(e.velocity, mass[branch][e.species]);
		getDirection(e.velocity, e.azimuth, e.elevation);
		if(isnan(e.velocity[0])) lNoVelocity++;
	}

	atomicAdd(nEventsIn, nEvents);
	atomicAdd(nNoVelocity, lNoVelocity);
	return inBuffer;
}

void VelocityComputer::report()
{
	fprintf(stderr, ">> VelocityComputer report\n");
	fprintf(stderr, " events received\n");
	fprintf(stderr, "  %10u\n", nEventsIn);
	fprintf(stderr, "  %10u without a velocity\n", nNoVelocity);
	BlockEventHandler<DirectEvent, DirectEvent>::report();
}
