#include "RawEventBatch.hpp"
#include <Common/Exception.hpp>
#include <stdio.h>

using namespace DERECO::Common;
using namespace DERECO::Core;

RawEventBatch::RawEventBatch()
{
}

RawEventBatch::~RawEventBatch()
{
}

void RawEventBatch::reserve(size_t n)
{
	epoch.reserve(n);
	met.reserve(n);
	eventTime.reserve(n);
	startType.reserve(n);
	stopType.reserve(n);
	coinType.reserve(n);
	startPosTdc.reserve(n);
	stopNorthTdc.reserve(n);
	stopEastTdc.reserve(n);
	stopSouthTdc.reserve(n);
	stopWestTdc.reserve(n);
	coinNorthTdc.reserve(n);
	coinSouthTdc.reserve(n);
	coinDiscreteTdc.reserve(n);
	energyPh.reserve(n);
	ssdFlags.reserve(n);
}

void RawEventBatch::push(const RawEvent & e)
{
	epoch.push_back(e.epoch);
	met.push_back(e.met);
	eventTime.push_back(e.eventTime);
	startType.push_back(e.startType);
	stopType.push_back(e.stopType);
	coinType.push_back(e.coinType);
	startPosTdc.push_back(e.startPosTdc);
	stopNorthTdc.push_back(e.stopNorthTdc);
	stopEastTdc.push_back(e.stopEastTdc);
	stopSouthTdc.push_back(e.stopSouthTdc);
	stopWestTdc.push_back(e.stopWestTdc);
	coinNorthTdc.push_back(e.coinNorthTdc);
	coinSouthTdc.push_back(e.coinSouthTdc);
	coinDiscreteTdc.push_back(e.coinDiscreteTdc);
	energyPh.push_back(e.energyPh);
	ssdFlags.push_back(e.ssdFlags);
}

RawEvent RawEventBatch::getEvent(size_t index) const
{
	RawEvent e;
	e.epoch = epoch[index];
	e.met = met[index];
	e.eventTime = eventTime[index];
	e.startType = startType[index];
	e.stopType = stopType[index];
	e.coinType = coinType[index];
	e.startPosTdc = startPosTdc[index];
	e.stopNorthTdc = stopNorthTdc[index];
	e.stopEastTdc = stopEastTdc[index];
	e.stopSouthTdc = stopSouthTdc[index];
	e.stopWestTdc = stopWestTdc[index];
	e.coinNorthTdc = coinNorthTdc[index];
	e.coinSouthTdc = coinSouthTdc[index];
	e.coinDiscreteTdc = coinDiscreteTdc[index];
	e.energyPh = energyPh[index];
	e.ssdFlags = ssdFlags[index];
	return e;
}

void RawEventBatch::validate() const
{
	struct Column {
		const char *name;
		size_t size;
	};
	Column columns[] = {
		{ "SHCOARSE", met.size() },
		{ "EVENTTIMES", eventTime.size() },
		{ "START_TYPE", startType.size() },
		{ "STOP_TYPE", stopType.size() },
		{ "COIN_TYPE", coinType.size() },
		{ "START_POS_TDC", startPosTdc.size() },
		{ "STOP_NORTH_TDC", stopNorthTdc.size() },
		{ "STOP_EAST_TDC", stopEastTdc.size() },
		{ "STOP_SOUTH_TDC", stopSouthTdc.size() },
		{ "STOP_WEST_TDC", stopWestTdc.size() },
		{ "COIN_NORTH_TDC", coinNorthTdc.size() },
		{ "COIN_SOUTH_TDC", coinSouthTdc.size() },
		{ "COIN_DISCRETE_TDC", coinDiscreteTdc.size() },
		{ "ENERGY_PH", energyPh.size() },
		{ "SSD_FLAGS", ssdFlags.size() }
	};

	size_t n = epoch.size();
	for(unsigned i = 0; i < sizeof(columns)/sizeof(columns[0]); i++) {
		if(columns[i].size != n) {
			char message[256];
			snprintf(message, sizeof(message), "raw field %s has %lu entries, epoch has %lu",
				columns[i].name, (unsigned long)columns[i].size, (unsigned long)n);
			throw StructuralError(message);
		}
	}
}
