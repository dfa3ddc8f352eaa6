#include "SpeciesClassifier.hpp"
#include <math.h>
#include <stdio.h>

using namespace std;
using namespace DERECO::Common;
using namespace DERECO::Core;
using namespace DERECO::Calibration;

SpeciesClassifier::SpeciesClassifier(const DERECO::Calibration::Calibration *calibration, EventSink<DirectEvent> *sink, bool singleWorker)
	: BlockEventHandler<DirectEvent, DirectEvent>(sink, singleWorker)
{
	for(int b = 0; b < N_BRANCHES; b++)
		bands[b] = calibration->getSpeciesBands((Branch)b);

	nEventsIn = 0;
	for(int s = 0; s < N_SPECIES; s++)
		nSpecies[s] = 0;
}

SpeciesClassifier::~SpeciesClassifier()
{
}

Species SpeciesClassifier::classify(const vector<SpeciesBand> & bands, float tofCorrected)
{
	if(isnan(tofCorrected)) return SPECIES_UNKNOWN;
	for(size_t i = 0; i < bands.size(); i++) {
		if(bands[i].contains(tofCorrected))
			return bands[i].species;
	}
	return SPECIES_UNKNOWN;
}

Species SpeciesClassifier::classify(Branch branch, float tofCorrected) const
{
	return classify(bands[branch], tofCorrected);
}

EventBuffer<DirectEvent> * SpeciesClassifier::handleEvents(EventBuffer<DirectEvent> *inBuffer)
{
	unsigned nEvents = inBuffer->getSize();
	u_int32_t lSpecies[N_SPECIES] = { 0, 0, 0, 0 };

	for(unsigned i = 0; i < nEvents; i++) {
		DirectEvent &e = inBuffer->get(i);
		if(e.category == CATEGORY_PULSE_HEIGHT)
			e.species = classify(BRANCH_PH, e.tofCorrected);
		else if(e.category == CATEGORY_SSD)
			e.species = classify(BRANCH_SSD, e.tofCorrected);
		else
			e.species = SPECIES_UNKNOWN;
		lSpecies[e.species]++;
	}

	atomicAdd(nEventsIn, nEvents);
	for(int s = 0; s < N_SPECIES; s++)
		atomicAdd(nSpecies[s], lSpecies[s]);
	return inBuffer;
}

void SpeciesClassifier::report()
{
	fprintf(stderr, ">> SpeciesClassifier report\n");
	fprintf(stderr, " events received\n");
	fprintf(stderr, "  %10u\n", nEventsIn);
	for(int s = 0; s < N_SPECIES; s++) {
		fprintf(stderr, "  %10u %s\n", nSpecies[s], getSpeciesLabel((Species)s));
	}
	BlockEventHandler<DirectEvent, DirectEvent>::report();
}
