#ifndef __DERECO__CORE__VELOCITYCOMPUTER_HPP__DEFINED__
#define __DERECO__CORE__VELOCITYCOMPUTER_HPP__DEFINED__

#include "Event.hpp"
#include "BlockEventHandler.hpp"
#include <Common/Instrumentation.hpp>
#include <Calibration/Calibration.hpp>

namespace DERECO { namespace Core {

	// Instrument frame velocity (km/s), kinetic energy and arrival direction
	class VelocityComputer : public BlockEventHandler<DirectEvent, DirectEvent> {
	public:
		VelocityComputer(const DERECO::Calibration::Calibration *calibration, EventSink<DirectEvent> *sink, bool singleWorker = false);
		~VelocityComputer();
		void report();

		static void getVelocity(float xFront, float yFront, float xBack, float yBack,
			double frontBackDistance, float tof, float velocity[3]);
		// keV, NaN for a NaN mass or velocity
		static float getKineticEnergy(const float velocity[3], double mass);
		// Azimuth in [0, 2pi), elevation in [-pi/2, pi/2]
		static void getDirection(const float velocity[3], float & azimuth, float & elevation);

	protected:
		virtual EventBuffer<DirectEvent> * handleEvents(EventBuffer<DirectEvent> *inBuffer);

	private:
		double mass[DERECO::Calibration::N_BRANCHES][N_SPECIES];

		u_int32_t nEventsIn;
		u_int32_t nNoVelocity;
	};
}}
#endif
