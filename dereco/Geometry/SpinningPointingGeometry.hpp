#ifndef __DERECO__GEOMETRY__SPINNINGPOINTINGGEOMETRY_HPP__DEFINED__
#define __DERECO__GEOMETRY__SPINNINGPOINTINGGEOMETRY_HPP__DEFINED__

#include <Geometry/GeometryService.hpp>
#include <vector>

namespace DERECO { namespace Geometry {

	// Geometry of a spin-stabilised spacecraft over one pointing.
	//
	// The despun pointing frame (DPS) shares the spin axis (z) with the
	// spacecraft frame; the spacecraft frame is rotated about z by the spin
	// phase phi(et) = phase0 + 2*pi*(et - et0)/period.
	// Instrument frames are fixed mountings relative to the spacecraft.
	// The spacecraft state (DPS frame) is tabulated and linearly interpolated.
	class SpinningPointingGeometry : public GeometryService {
	public:
		SpinningPointingGeometry();
		~SpinningPointingGeometry();

		void setCoverage(double etBegin, double etEnd);
		void setSpin(double period, double et0, double phase0);
		// Row-major rotation taking instrument vectors into the spacecraft frame
		void setMounting(Frame instrument, const double rotation[9]);
		// Samples must be pushed in increasing time
		void addStateSample(double et, const StateVector & state);

		// File lines: "coverage B E", "spin PERIOD ET0 PHASE0",
		// "mount FRAME r11 .. r33", "state ET x y z vx vy vz"
		void loadFile(const char *fileName);

		void frameTransform(const std::vector<double> & et,
			const std::vector<Vector3> & vectors,
			Frame from, Frame to,
			std::vector<Vector3> & out) const;

		void spacecraftState(const std::vector<double> & et,
			Frame frame,
			std::vector<StateVector> & out) const;

	private:
		struct Rotation {
			double m[9];
		};
		struct Sample {
			double et;
			StateVector state;
		};

		double etBegin;
		double etEnd;
		double spinPeriod;
		double spinEt0;
		double spinPhase0;
		bool hasCoverage;
		bool hasSpin;
		bool hasMounting[N_FRAMES];
		Rotation mounting[N_FRAMES];
		std::vector<Sample> samples;

		void checkCoverage(double et) const;
		// Rotation taking frame vectors into the DPS frame at et
		Rotation toDps(Frame frame, double et) const;
		static Rotation multiply(const Rotation & a, const Rotation & b);
		static Rotation transpose(const Rotation & a);
		static Vector3 apply(const Rotation & r, const Vector3 & v);
	};
}}
#endif
