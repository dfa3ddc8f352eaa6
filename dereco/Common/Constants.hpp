#ifndef __DERECO__COMMON__CONSTANTS_HPP__DEFINED__
#define __DERECO__COMMON__CONSTANTS_HPP__DEFINED__
namespace DERECO { namespace Common {

	static const unsigned EVENT_BLOCK_SIZE = 4096;

	// Number of solid state detector elements behind the stop foil
	static const int N_SSD = 8;

	// Back position tables are indexed by a normalised TDC difference + 2047
	static const int BACKPOS_LUT_SIZE = 4096;
	static const int BACKPOS_LUT_CENTER = 2047;

	// Pulse height correction grid
	static const int PHCORR_NX = 21;
	static const int PHCORR_NY = 33;

	// Instrument geometry (mm)
	static const double SLIT_Z = 44.89;		// slit height above the back detector
	static const double D_SLIT_FOIL = 3.39;		// slit to start foil
	static const double YF_ESTIMATE_LEFT = 40.0;
	static const double YF_ESTIMATE_RIGHT = -40.0;
	static const double Z_DSTOP = 2.6 / 2;		// stop foil half thickness
	static const double Z_DS = 46.19 - Z_DSTOP;
	static const double DMIN_PH_CTOF = Z_DS - 1.4142135623730951 * D_SLIT_FOIL;
	static const double DMIN_SSD_CTOF = DMIN_PH_CTOF + 2 * Z_DSTOP;

	// Species discriminant band for hydrogen (tenths of ns), exclusive edges
	static const double CTOF_SPECIES_MIN = 50;
	static const double CTOF_SPECIES_MAX = 200;

	static const double KEV_J = 1.60218e-16;
	static const double J_KEV = 1 / KEV_J;
	static const double MASS_H = 1.6735575e-27;
	static const double MASS_HE = 6.6464731e-27;
	static const double MASS_O = 2.6567629e-26;

}}
#endif
