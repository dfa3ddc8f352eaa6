#ifndef __DERECO__CORE__DIRECTEVENTTABLE_HPP__DEFINED__
#define __DERECO__CORE__DIRECTEVENTTABLE_HPP__DEFINED__

#include "Event.hpp"
#include "FieldCatalog.hpp"
#include <string>
#include <vector>

namespace DERECO { namespace Core {

	class Assembler;

	// Reconstructed events of one batch, in detection order.
	// Filled by the Assembler, read-only afterwards.
	class DirectEventTable {
	public:
		DirectEventTable(const std::string & instrument, size_t nEvents);
		~DirectEventTable();

		const std::string & getInstrument() const { return instrument; };
		size_t getSize() const { return rows.size(); };
		const DirectEvent & get(size_t index) const { return rows[index]; };

		// Value of one component of a catalogued field; species as its code
		static double getValue(const DirectEvent & e, FieldID id, int component = 0);
		// Column by name, vector fields interleaved by component.
		// Throws CalibrationError for names not in the catalog.
		void getColumn(const std::string & name, std::vector<double> & values) const;
		void getSpeciesLabels(std::vector<std::string> & labels) const;

	private:
		std::string instrument;
		std::vector<DirectEvent> rows;

		friend class Assembler;
	};
}}
#endif
