#ifndef __DERECO__CORE__RAWEVENTBATCH_HPP__DEFINED__
#define __DERECO__CORE__RAWEVENTBATCH_HPP__DEFINED__

#include "Event.hpp"
#include <vector>

namespace DERECO { namespace Core {

	// Decommutated direct event telemetry, one column per field.
	// Row order is detection order.
	class RawEventBatch {
	public:
		RawEventBatch();
		~RawEventBatch();

		std::vector<long long> epoch;
		std::vector<double> met;
		std::vector<double> eventTime;
		std::vector<long long> startType;
		std::vector<int> stopType;
		std::vector<int> coinType;
		std::vector<int> startPosTdc;
		std::vector<int> stopNorthTdc;
		std::vector<int> stopEastTdc;
		std::vector<int> stopSouthTdc;
		std::vector<int> stopWestTdc;
		std::vector<int> coinNorthTdc;
		std::vector<int> coinSouthTdc;
		std::vector<int> coinDiscreteTdc;
		std::vector<int> energyPh;
		std::vector<unsigned char> ssdFlags;

		size_t getSize() const { return epoch.size(); };
		void reserve(size_t n);
		void push(const RawEvent & e);
		RawEvent getEvent(size_t index) const;

		// Throws StructuralError naming the first column whose length
		// differs from the epoch column
		void validate() const;
	};
}}
#endif
