#include "FieldCatalog.hpp"
#include "Event.hpp"
#include <Common/Exception.hpp>
#include <climits>
#include <math.h>

using namespace std;
using namespace DERECO::Common;
using namespace DERECO::Core;

static const FieldAttributes fields[N_FIELDS] = {
	{ FIELD_EPOCH,			"epoch",			TYPE_INT64,	1, (double)LLONG_MIN,	NULL, "ns" },
	{ FIELD_MET,			"de_event_met",			TYPE_FLOAT64,	1, NAN,			NULL, "s" },
	{ FIELD_EVENT_TIME,		"event_times",			TYPE_FLOAT64,	1, NAN,			NULL, "s" },
	{ FIELD_START_TYPE,		"start_type",			TYPE_INT64,	1, (double)START_TYPE_FILL, NULL, "" },
	{ FIELD_STOP_TYPE,		"event_type",			TYPE_INT32,	1, -1,			NULL, "" },
	{ FIELD_COIN_TYPE,		"coincidence_type",		TYPE_INT32,	1, -1,			NULL, "" },
	{ FIELD_SSD_NUMBER,		"ssd_number",			TYPE_INT16,	1, -1,			NULL, "" },
	{ FIELD_X_FRONT,		"x_front",			TYPE_FLOAT32,	1, NAN,			NULL, "mm/100" },
	{ FIELD_Y_FRONT,		"y_front",			TYPE_FLOAT32,	1, NAN,			NULL, "mm/100" },
	{ FIELD_X_BACK,			"x_back",			TYPE_FLOAT32,	1, NAN,			NULL, "mm/100" },
	{ FIELD_Y_BACK,			"y_back",			TYPE_FLOAT32,	1, NAN,			NULL, "mm/100" },
	{ FIELD_X_COIN,			"x_coin",			TYPE_FLOAT32,	1, NAN,			NULL, "mm/100" },
	{ FIELD_FRONT_BACK_DISTANCE,	"front_back_distance",		TYPE_FLOAT64,	1, NAN,			NULL, "mm/100" },
	{ FIELD_PATH_LENGTH,		"path_length",			TYPE_FLOAT32,	1, NAN,			NULL, "mm/100" },
	{ FIELD_TOF_START_STOP,		"tof_start_stop",		TYPE_FLOAT32,	1, NAN,			NULL, "ns/10" },
	{ FIELD_TOF_STOP_COIN,		"tof_stop_coin",		TYPE_FLOAT32,	1, NAN,			NULL, "ns/10" },
	{ FIELD_TOF_CORRECTED,		"tof_corrected",		TYPE_FLOAT32,	1, NAN,			NULL, "ns/10" },
	{ FIELD_VELOCITY_MAGNITUDE,	"velocity_magnitude",		TYPE_FLOAT32,	1, NAN,			NULL, "km/s" },
	{ FIELD_VELOCITY,		"direct_event_velocity",	TYPE_FLOAT32,	3, NAN,			NULL, "km/s" },
	{ FIELD_VELOCITY_SC,		"velocity_sc",			TYPE_FLOAT32,	3, NAN,			NULL, "km/s" },
	{ FIELD_VELOCITY_DPS_SC,	"velocity_dps_sc",		TYPE_FLOAT32,	3, NAN,			NULL, "km/s" },
	{ FIELD_VELOCITY_DPS_HELIO,	"velocity_dps_helio",		TYPE_FLOAT32,	3, NAN,			NULL, "km/s" },
	{ FIELD_TOF_ENERGY,		"tof_energy",			TYPE_FLOAT32,	1, NAN,			NULL, "keV" },
	{ FIELD_ENERGY,			"energy",			TYPE_FLOAT32,	1, NAN,			NULL, "" },
	{ FIELD_SPECIES,		"species",			TYPE_STRING,	1, NAN,			"UNKNOWN", "" },
	{ FIELD_AZIMUTH,		"azimuth",			TYPE_FLOAT32,	1, NAN,			NULL, "rad" },
	{ FIELD_ELEVATION,		"elevation",			TYPE_FLOAT32,	1, NAN,			NULL, "rad" },
	{ FIELD_EVENT_EFFICIENCY,	"event_efficiency",		TYPE_FLOAT32,	1, NAN,			NULL, "" }
};

static const char *instruments[] = { "ultra45", "ultra90" };

int FieldCatalog::getNFields()
{
	return N_FIELDS;
}

const FieldAttributes & FieldCatalog::getField(FieldID id)
{
	return fields[id];
}

bool FieldCatalog::isInstrument(const string & instrument)
{
	for(unsigned i = 0; i < sizeof(instruments)/sizeof(instruments[0]); i++) {
		if(instrument == instruments[i]) return true;
	}
	return false;
}

const FieldAttributes & FieldCatalog::getField(const string & instrument, const string & name)
{
	if(!isInstrument(instrument))
		throw CalibrationError("unknown instrument '" + instrument + "'");

	for(int i = 0; i < N_FIELDS; i++) {
		if(name == fields[i].name) return fields[i];
	}
	throw CalibrationError("no field '" + name + "' for instrument '" + instrument + "'");
}
