#ifndef __DERECO__CORE__EVENT_HPP__DEFINED__
#define __DERECO__CORE__EVENT_HPP__DEFINED__

#include <cstddef>
#include <climits>
#include <math.h>

namespace DERECO { namespace Core {

	enum StartType { START_LEFT = 1, START_RIGHT = 2 };

	// Start type fill written by decommutation when no start was detected
	static const long long START_TYPE_FILL = LLONG_MIN;

	enum StopType {
		STOP_TOP = 1,
		STOP_BOTTOM = 2,
		STOP_SSD_FIRST = 8,
		STOP_SSD_LAST = 15
	};

	inline bool isPulseHeightStop(int stopType) { return stopType == STOP_TOP || stopType == STOP_BOTTOM; };
	inline bool isSSDStop(int stopType) { return stopType >= STOP_SSD_FIRST && stopType <= STOP_SSD_LAST; };

	// Coincidence anodes which fired, as encoded in telemetry
	class CoincidenceMask {
	public:
		enum Bit { NONE = 0, TOP = 1, BOTTOM = 2 };

		CoincidenceMask(int code = NONE) : code(code) {};

		bool has(Bit b) const { return (code & b) != 0; };
		bool isOnly(Bit b) const { return code == b; };
		int getCode() const { return code; };

	private:
		int code;
	};

	// Events with neither a pulse height nor an SSD stop are INVALID
	enum EventCategory { CATEGORY_INVALID = 0, CATEGORY_PULSE_HEIGHT = 1, CATEGORY_SSD = 2 };

	enum Species { SPECIES_UNKNOWN = 0, SPECIES_H, SPECIES_HE, SPECIES_O, N_SPECIES };

	const char * getSpeciesLabel(Species species);
	// Returns SPECIES_UNKNOWN for labels it does not know
	Species parseSpeciesLabel(const char *label);

	struct RawEvent {
		long long epoch;		// ns since J2000
		double met;			// spacecraft clock, s
		double eventTime;		// ephemeris time, s
		long long startType;
		int stopType;
		int coinType;
		int startPosTdc;
		int stopNorthTdc;
		int stopEastTdc;
		int stopSouthTdc;
		int stopWestTdc;
		int coinNorthTdc;
		int coinSouthTdc;
		int coinDiscreteTdc;
		int energyPh;
		unsigned char ssdFlags;		// bit i set when SSD element i fired
	};

	struct DirectEvent {
		RawEvent raw;
		unsigned position;		// row in the assembled table

		EventCategory category;
		short ssdNumber;

		float xFront;
		float yFront;
		float xBack;
		float yBack;
		float xCoin;
		double frontBackDistance;
		float pathLength;

		float tofStartStop;
		float tofProvisional;		// two-way TOF of the stop anodes (t2)
		float tofStopCoin;
		float tofCorrected;
		float velocityMagnitude;

		float velocity[3];
		float velocitySc[3];
		float velocityDpsSc[3];
		float velocityDpsHelio[3];

		float tofEnergy;		// keV
		float energy;			// corrected pulse height
		Species species;
		float azimuth;
		float elevation;

		DirectEvent() {
			position = 0;
			category = CATEGORY_INVALID;
			ssdNumber = -1;
			xFront = yFront = xBack = yBack = xCoin = NAN;
			frontBackDistance = NAN;
			pathLength = NAN;
			tofStartStop = tofProvisional = tofStopCoin = tofCorrected = NAN;
			velocityMagnitude = NAN;
			for(int i = 0; i < 3; i++) {
				velocity[i] = velocitySc[i] = velocityDpsSc[i] = velocityDpsHelio[i] = NAN;
			}
			tofEnergy = NAN;
			energy = NAN;
			species = SPECIES_UNKNOWN;
			azimuth = elevation = NAN;
		};
	};
}}
#endif
