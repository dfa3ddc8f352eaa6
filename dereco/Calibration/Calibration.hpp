#ifndef __DERECO__CALIBRATION__CALIBRATION_HPP__DEFINED__
#define __DERECO__CALIBRATION__CALIBRATION_HPP__DEFINED__

#include <Common/Constants.hpp>
#include <Core/Event.hpp>
#include <Calibration/BackPositionLUT.hpp>
#include <map>
#include <string>
#include <vector>

namespace DERECO { namespace Calibration {

	// Stop/coincidence anode quadrant
	enum Quadrant { QUADRANT_TOP = 0, QUADRANT_BOTTOM = 1, N_QUADRANTS = 2 };

	enum TDCChannel {
		TDC_STOP_NORTH = 0,
		TDC_STOP_SOUTH,
		TDC_STOP_EAST,
		TDC_STOP_WEST,
		TDC_COIN_NORTH,
		TDC_COIN_SOUTH,
		N_TDC_CHANNELS
	};

	enum BackPositionTable { BACKPOS_X_TOP = 0, BACKPOS_Y_TOP, BACKPOS_X_BOTTOM, BACKPOS_Y_BOTTOM, N_BACKPOS_TABLES };

	// Detection branch, selects the species discriminant
	enum Branch { BRANCH_PH = 0, BRANCH_SSD = 1, N_BRANCHES = 2 };

	struct SpeciesBand {
		DERECO::Core::Species species;
		double ctofMin;
		double ctofMax;
		bool minInclusive;
		bool maxInclusive;
		double mass;		// kg

		bool contains(double ctof) const {
			bool aboveMin = minInclusive ? ctof >= ctofMin : ctof > ctofMin;
			bool belowMax = maxInclusive ? ctof <= ctofMax : ctof < ctofMax;
			return aboveMin && belowMax;
		};
	};

	// Mnemonic parsing, throw CalibrationError on unknown names
	Quadrant parseQuadrant(const std::string & name);
	TDCChannel parseTDCChannel(const std::string & name);
	BackPositionTable parseBackPositionTable(const std::string & name);
	Branch parseBranch(const std::string & name);
	const char * getQuadrantName(Quadrant q);
	const char * getTDCChannelName(TDCChannel c);
	const char * getBackPositionTableName(BackPositionTable t);

	// Instrument calibration, loaded once per run and then shared read-only
	// between all pipeline stages and threads.
	// Every getter throws CalibrationError when asked for data that was never loaded.
	class Calibration {
	public:
		Calibration();
		~Calibration();

		void setImageParam(const std::string & name, double value);
		double getImageParam(const std::string & name) const;
		bool hasImageParam(const std::string & name) const;

		void setTDCNormalization(Quadrant q, TDCChannel c, float slope, float offset);
		float getNormalizedTDC(Quadrant q, TDCChannel c, int tdc) const;

		BackPositionLUT & getBackPositionLUT(BackPositionTable t) { return backPosition[t]; };
		float getBackPosition(BackPositionTable t, float index) const;

		void setPulseHeightCorrection(int xi, int yi, float v);
		void setAllPulseHeightCorrection(float v);
		// Grid coordinates are rounded and clamped to the grid
		float getPulseHeightCorrection(float xlut, float ylut) const;

		void setSpeciesBands(Branch b, const std::vector<SpeciesBand> & bands);
		const std::vector<SpeciesBand> & getSpeciesBands(Branch b) const;
		void setDefaultSpeciesBands();
		// Mass listed by the branch's band for species, NaN if none
		double getSpeciesMass(Branch b, DERECO::Core::Species species) const;

		void loadParamsFile(const char *fileName);
		void loadTDCFile(const char *fileName);
		void loadBackPositionFile(BackPositionTable t, const char *fileName);
		void loadPHCorrectionFile(const char *fileName);
		void loadSpeciesFile(Branch b, const char *fileName);
		// Setup file lines: "params F", "tdc F", "backpos TABLE F", "phcorr F", "species BRANCH F"
		void loadFiles(const char *setupFileName);

	private:
		struct TDCNorm {
			bool loaded;
			float slope;
			float offset;
		};

		std::map<std::string, double> imageParams;
		TDCNorm tdcNorm[N_QUADRANTS][N_TDC_CHANNELS];
		BackPositionLUT backPosition[N_BACKPOS_TABLES];
		float phCorrection[DERECO::Common::PHCORR_NX * DERECO::Common::PHCORR_NY];
		bool phCorrectionLoaded;
		std::vector<SpeciesBand> speciesBands[N_BRANCHES];
	};
}}
#endif
