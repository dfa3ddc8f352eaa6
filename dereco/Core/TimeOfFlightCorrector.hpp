#ifndef __DERECO__CORE__TIMEOFFLIGHTCORRECTOR_HPP__DEFINED__
#define __DERECO__CORE__TIMEOFFLIGHTCORRECTOR_HPP__DEFINED__

#include "Event.hpp"
#include "BlockEventHandler.hpp"
#include <Common/Instrumentation.hpp>
#include <Calibration/Calibration.hpp>

namespace DERECO { namespace Core {

	// Coincidence anode position and stop-coincidence TOF for pulse height
	// events, then the path-normalised TOF and speed for every detected event.
	class TimeOfFlightCorrector : public BlockEventHandler<DirectEvent, DirectEvent> {
	public:
		TimeOfFlightCorrector(const DERECO::Calibration::Calibration *calibration, EventSink<DirectEvent> *sink, bool singleWorker = false);
		~TimeOfFlightCorrector();
		void report();

		// Only single-quadrant coincidences are decoded, others get zeros.
		// Returns true if one was decoded.
		bool correctCoincidence(DirectEvent & e) const;

		// TOF over the path length, scaled to the minimum flight distance of branch
		static void getCorrectedTof(float tof, float pathLength, DERECO::Calibration::Branch branch,
			float & tofCorrected, float & velocityMagnitude);

	protected:
		virtual EventBuffer<DirectEvent> * handleEvents(EventBuffer<DirectEvent> *inBuffer);

	private:
		const DERECO::Calibration::Calibration *calibration;

		double xCoinScale[DERECO::Calibration::N_QUADRANTS];
		double xCoinOffset[DERECO::Calibration::N_QUADRANTS];
		double etofScale;
		double etofOffset[DERECO::Calibration::N_QUADRANTS];

		u_int32_t nEventsIn;
		u_int32_t nCoincidence;
		u_int32_t nBothAnodes;
		u_int32_t nNoSpeed;
	};
}}
#endif
