#ifndef __DERECO__CALIBRATION__BACKPOSITIONLUT_HPP__DEFINED__
#define __DERECO__CALIBRATION__BACKPOSITIONLUT_HPP__DEFINED__

#include <Common/Constants.hpp>

namespace DERECO { namespace Calibration {
	
	// Back detector position (hundredths of mm) as a function of the
	// normalised stop anode TDC difference, offset by BACKPOS_LUT_CENTER
	class BackPositionLUT {
	public:
		BackPositionLUT();
		~BackPositionLUT();
		
		void set(int index, float position);
		// position = scale * (index - BACKPOS_LUT_CENTER) + offset for every entry
		void setLinear(float scale, float offset);
		// Index is truncated and clamped to the table
		float get(float index) const;
		bool isLoaded() const { return loaded; };
		void loadFile(const char *fileName);
		
	private:
		static const int nEntries = DERECO::Common::BACKPOS_LUT_SIZE;
		float table[nEntries];
		bool loaded;
	};
}}
#endif
