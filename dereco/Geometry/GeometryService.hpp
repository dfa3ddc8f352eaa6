#ifndef __DERECO__GEOMETRY__GEOMETRYSERVICE_HPP__DEFINED__
#define __DERECO__GEOMETRY__GEOMETRYSERVICE_HPP__DEFINED__

#include <vector>

namespace DERECO { namespace Geometry {

	enum Frame { FRAME_ULTRA_45 = 0, FRAME_ULTRA_90, FRAME_SPACECRAFT, FRAME_DPS, N_FRAMES };

	const char * getFrameName(Frame frame);

	struct Vector3 {
		double x;
		double y;
		double z;
	};

	struct StateVector {
		Vector3 position;	// km
		Vector3 velocity;	// km/s
	};

	// Ephemeris and attitude oracle.
	// All calls take one ephemeris time per element and throw
	// GeometryCoverageError when any time is not covered.
	class GeometryService {
	public:
		// Rotates each vector from one frame to another at its own time
		virtual void frameTransform(const std::vector<double> & et,
			const std::vector<Vector3> & vectors,
			Frame from, Frame to,
			std::vector<Vector3> & out) const = 0;

		// Spacecraft state relative to the Sun, expressed in frame
		virtual void spacecraftState(const std::vector<double> & et,
			Frame frame,
			std::vector<StateVector> & out) const = 0;

		virtual ~GeometryService() {};
	};

}}
#endif
