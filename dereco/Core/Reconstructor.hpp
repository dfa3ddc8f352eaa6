#ifndef __DERECO__CORE__RECONSTRUCTOR_HPP__DEFINED__
#define __DERECO__CORE__RECONSTRUCTOR_HPP__DEFINED__

#include "RawEventBatch.hpp"
#include "DirectEventTable.hpp"
#include <Common/Constants.hpp>
#include <Calibration/Calibration.hpp>
#include <Geometry/GeometryService.hpp>

namespace DERECO { namespace Core {

	enum Sensor { SENSOR_45 = 45, SENSOR_90 = 90 };

	DERECO::Geometry::Frame getSensorFrame(Sensor sensor);
	const char * getSensorInstrument(Sensor sensor);

	// Runs the whole direct event chain over one raw batch.
	// Calibration and geometry are borrowed and must outlive this object.
	class Reconstructor {
	public:
		Reconstructor(const DERECO::Calibration::Calibration *calibration,
			const DERECO::Geometry::GeometryService *geometry,
			Sensor sensor,
			bool singleThread = false,
			unsigned blockSize = DERECO::Common::EVENT_BLOCK_SIZE);
		~Reconstructor();

		void setVerbose(bool verbose) { this->verbose = verbose; };

		// Events without a start detection are dropped, all others are
		// returned in input order. Caller owns the table.
		// Any Exception aborts the batch and nothing is returned.
		DirectEventTable * reconstruct(const RawEventBatch & batch);

	private:
		const DERECO::Calibration::Calibration *calibration;
		const DERECO::Geometry::GeometryService *geometry;
		Sensor sensor;
		bool singleThread;
		unsigned blockSize;
		bool verbose;
	};
}}
#endif
