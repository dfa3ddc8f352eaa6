#ifndef __DERECO__CORE__POSITIONRECONSTRUCTOR_HPP__DEFINED__
#define __DERECO__CORE__POSITIONRECONSTRUCTOR_HPP__DEFINED__

#include "Event.hpp"
#include "BlockEventHandler.hpp"
#include <Common/Instrumentation.hpp>
#include <Common/Constants.hpp>
#include <Calibration/Calibration.hpp>

namespace DERECO { namespace Core {

	// Front and back hit positions, start-stop TOF and pulse height energy.
	// Positions are in hundredths of mm, times of flight in tenths of ns.
	class PositionReconstructor : public BlockEventHandler<DirectEvent, DirectEvent> {
	public:
		// Image parameters are read here; a missing one throws CalibrationError
		PositionReconstructor(const DERECO::Calibration::Calibration *calibration, EventSink<DirectEvent> *sink, bool singleWorker = false);
		~PositionReconstructor();
		void report();

		float getFrontX(long long startType, int startPosTdc) const;
		// Front-back separation and refined front y from the back y position
		static void getFrontY(long long startType, float yBack, double & frontBackDistance, float & yFront);
		// Stop anode decoding for one pulse height event; needs xFront
		void reconstructPulseHeight(DirectEvent & e) const;
		// Element index, y and TOF for one SSD event; needs xFront
		void reconstructSSD(DirectEvent & e) const;
		// Highest SSD element flagged, -1 when none
		static int getSSDNumber(unsigned char ssdFlags);

	protected:
		virtual EventBuffer<DirectEvent> * handleEvents(EventBuffer<DirectEvent> *inBuffer);

	private:
		const DERECO::Calibration::Calibration *calibration;

		double xftsc;
		double xftOffset[2];		// left, right
		double xfttof;
		double tofsc;
		double tofOffset[DERECO::Calibration::N_QUADRANTS];
		double phOffset[DERECO::Calibration::N_QUADRANTS];
		double tofssdsc;
		double tofssdtotoff;
		double ssdTofOffset[2][DERECO::Common::N_SSD];
		double ssdY[DERECO::Common::N_SSD];

		u_int32_t nEventsIn;
		u_int32_t nNoStart;
		u_int32_t nNoSSDElement;
	};
}}
#endif
