#include "Event.hpp"
#include <string.h>

using namespace DERECO::Core;

static const char * speciesLabels[N_SPECIES] = { "UNKNOWN", "H", "He", "O" };

const char * DERECO::Core::getSpeciesLabel(Species species)
{
	if(species < SPECIES_UNKNOWN || species >= N_SPECIES)
		return speciesLabels[SPECIES_UNKNOWN];
	return speciesLabels[species];
}

Species DERECO::Core::parseSpeciesLabel(const char *label)
{
	for(int i = 0; i < N_SPECIES; i++) {
		if(strcmp(label, speciesLabels[i]) == 0)
			return (Species)i;
	}
	return SPECIES_UNKNOWN;
}
