#ifndef __DERECO__CORE__SPECIESCLASSIFIER_HPP__DEFINED__
#define __DERECO__CORE__SPECIESCLASSIFIER_HPP__DEFINED__

#include "Event.hpp"
#include "BlockEventHandler.hpp"
#include <Common/Instrumentation.hpp>
#include <Calibration/Calibration.hpp>
#include <vector>

namespace DERECO { namespace Core {

	class SpeciesClassifier : public BlockEventHandler<DirectEvent, DirectEvent> {
	public:
		SpeciesClassifier(const DERECO::Calibration::Calibration *calibration, EventSink<DirectEvent> *sink, bool singleWorker = false);
		~SpeciesClassifier();
		void report();

		// First band containing tofCorrected, SPECIES_UNKNOWN if none
		static Species classify(const std::vector<DERECO::Calibration::SpeciesBand> & bands, float tofCorrected);
		Species classify(DERECO::Calibration::Branch branch, float tofCorrected) const;

	protected:
		virtual EventBuffer<DirectEvent> * handleEvents(EventBuffer<DirectEvent> *inBuffer);

	private:
		std::vector<DERECO::Calibration::SpeciesBand> bands[DERECO::Calibration::N_BRANCHES];

		u_int32_t nEventsIn;
		u_int32_t nSpecies[N_SPECIES];
	};
}}
#endif
