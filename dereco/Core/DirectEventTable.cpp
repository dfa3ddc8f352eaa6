#include "DirectEventTable.hpp"
#include <math.h>

using namespace std;
using namespace DERECO::Core;

DirectEventTable::DirectEventTable(const string & instrument, size_t nEvents)
	: instrument(instrument), rows(nEvents)
{
}

DirectEventTable::~DirectEventTable()
{
}

double DirectEventTable::getValue(const DirectEvent & e, FieldID id, int component)
{
	switch(id) {
		case FIELD_EPOCH:		return e.raw.epoch;
		case FIELD_MET:			return e.raw.met;
		case FIELD_EVENT_TIME:		return e.raw.eventTime;
		case FIELD_START_TYPE:		return e.raw.startType;
		case FIELD_STOP_TYPE:		return e.raw.stopType;
		case FIELD_COIN_TYPE:		return e.raw.coinType;
		case FIELD_SSD_NUMBER:		return e.ssdNumber;
		case FIELD_X_FRONT:		return e.xFront;
		case FIELD_Y_FRONT:		return e.yFront;
		case FIELD_X_BACK:		return e.xBack;
		case FIELD_Y_BACK:		return e.yBack;
		case FIELD_X_COIN:		return e.xCoin;
		case FIELD_FRONT_BACK_DISTANCE:	return e.frontBackDistance;
		case FIELD_PATH_LENGTH:		return e.pathLength;
		case FIELD_TOF_START_STOP:	return e.tofStartStop;
		case FIELD_TOF_STOP_COIN:	return e.tofStopCoin;
		case FIELD_TOF_CORRECTED:	return e.tofCorrected;
		case FIELD_VELOCITY_MAGNITUDE:	return e.velocityMagnitude;
		case FIELD_VELOCITY:		return e.velocity[component];
		case FIELD_VELOCITY_SC:		return e.velocitySc[component];
		case FIELD_VELOCITY_DPS_SC:	return e.velocityDpsSc[component];
		case FIELD_VELOCITY_DPS_HELIO:	return e.velocityDpsHelio[component];
		case FIELD_TOF_ENERGY:		return e.tofEnergy;
		case FIELD_ENERGY:		return e.energy;
		case FIELD_SPECIES:		return e.species;
		case FIELD_AZIMUTH:		return e.azimuth;
		case FIELD_ELEVATION:		return e.elevation;
		// No efficiency model yet, the column is always fill
		case FIELD_EVENT_EFFICIENCY:	return NAN;
		default:			return NAN;
	}
}

void DirectEventTable::getColumn(const string & name, vector<double> & values) const
{
	const FieldAttributes &field = FieldCatalog::getField(instrument, name);
	values.resize(rows.size() * field.nComponents);
	for(size_t i = 0; i < rows.size(); i++) {
		for(int c = 0; c < field.nComponents; c++) {
			values[i * field.nComponents + c] = getValue(rows[i], field.id, c);
		}
	}
}

void DirectEventTable::getSpeciesLabels(vector<string> & labels) const
{
	labels.resize(rows.size());
	for(size_t i = 0; i < rows.size(); i++)
		labels[i] = getSpeciesLabel(rows[i].species);
}
