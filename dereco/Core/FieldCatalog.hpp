#ifndef __DERECO__CORE__FIELDCATALOG_HPP__DEFINED__
#define __DERECO__CORE__FIELDCATALOG_HPP__DEFINED__

#include <string>

namespace DERECO { namespace Core {

	enum DataType { TYPE_INT64, TYPE_INT32, TYPE_INT16, TYPE_FLOAT32, TYPE_FLOAT64, TYPE_STRING };

	enum FieldID {
		FIELD_EPOCH = 0,
		FIELD_MET,
		FIELD_EVENT_TIME,
		FIELD_START_TYPE,
		FIELD_STOP_TYPE,
		FIELD_COIN_TYPE,
		FIELD_SSD_NUMBER,
		FIELD_X_FRONT,
		FIELD_Y_FRONT,
		FIELD_X_BACK,
		FIELD_Y_BACK,
		FIELD_X_COIN,
		FIELD_FRONT_BACK_DISTANCE,
		FIELD_PATH_LENGTH,
		FIELD_TOF_START_STOP,
		FIELD_TOF_STOP_COIN,
		FIELD_TOF_CORRECTED,
		FIELD_VELOCITY_MAGNITUDE,
		FIELD_VELOCITY,
		FIELD_VELOCITY_SC,
		FIELD_VELOCITY_DPS_SC,
		FIELD_VELOCITY_DPS_HELIO,
		FIELD_TOF_ENERGY,
		FIELD_ENERGY,
		FIELD_SPECIES,
		FIELD_AZIMUTH,
		FIELD_ELEVATION,
		FIELD_EVENT_EFFICIENCY,
		N_FIELDS
	};

	struct FieldAttributes {
		FieldID id;
		const char *name;
		DataType type;
		int nComponents;
		double fillValue;	// numeric fields
		const char *fillLabel;	// string fields
		const char *units;
	};

	// Output column metadata, per instrument
	class FieldCatalog {
	public:
		static int getNFields();
		static const FieldAttributes & getField(FieldID id);
		// Throws CalibrationError for an unknown instrument or field name
		static const FieldAttributes & getField(const std::string & instrument, const std::string & name);
		static bool isInstrument(const std::string & instrument);
	};
}}
#endif
