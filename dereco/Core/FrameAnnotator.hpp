#ifndef __DERECO__CORE__FRAMEANNOTATOR_HPP__DEFINED__
#define __DERECO__CORE__FRAMEANNOTATOR_HPP__DEFINED__

#include "Event.hpp"
#include "BlockEventHandler.hpp"
#include <Common/Instrumentation.hpp>
#include <Geometry/GeometryService.hpp>
#include <vector>

namespace DERECO { namespace Core {

	// Rotates instrument frame velocities into the spacecraft and despun
	// pointing frames at each event's own time, and adds the spacecraft
	// velocity to obtain the heliocentric velocity.
	// Runs on a single worker, the geometry service need not be reentrant.
	class FrameAnnotator : public BlockEventHandler<DirectEvent, DirectEvent> {
	public:
		FrameAnnotator(const DERECO::Geometry::GeometryService *geometry, DERECO::Geometry::Frame instrumentFrame,
			EventSink<DirectEvent> *sink);
		~FrameAnnotator();
		void report();

	protected:
		virtual EventBuffer<DirectEvent> * handleEvents(EventBuffer<DirectEvent> *inBuffer);

	private:
		const DERECO::Geometry::GeometryService *geometry;
		DERECO::Geometry::Frame instrumentFrame;

		std::vector<double> et;
		std::vector<DERECO::Geometry::Vector3> velocity;
		std::vector<DERECO::Geometry::Vector3> velocitySc;
		std::vector<DERECO::Geometry::Vector3> velocityDps;
		std::vector<DERECO::Geometry::StateVector> state;

		u_int32_t nEventsIn;
	};
}}
#endif
