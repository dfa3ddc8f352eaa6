#include "TestSupport.hpp"
#include <Common/Exception.hpp>
#include <errno.h>
#include <math.h>
#include <stdio.h>
#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>

using namespace std;
using namespace DERECO::Common;
using namespace DERECO::Core;
using namespace DERECO::Calibration;
using namespace DERECO::Geometry;
using namespace DERECO::Tests;

void DERECO::Tests::setImageParams(DERECO::Calibration::Calibration *calibration)
{
	calibration->setImageParam("XFTSC", 0.5);
	calibration->setImageParam("XFTLTOFF", 100);
	calibration->setImageParam("XFTRTOFF", -100);
	calibration->setImageParam("XFTTOF", 0.1);
	calibration->setImageParam("TOFSC", 0.5);
	calibration->setImageParam("TOFTPOFF", 0);
	calibration->setImageParam("TOFBTOFF", 0);
	calibration->setImageParam("XCOINTPSC", 0.01);
	calibration->setImageParam("XCOINTPOFF", 0.5);
	calibration->setImageParam("XCOINBTSC", 0.01);
	calibration->setImageParam("XCOINBTOFF", -0.5);
	calibration->setImageParam("ETOFSC", 0.05);
	calibration->setImageParam("ETOFTPOFF", 0);
	calibration->setImageParam("ETOFBTOFF", 0);
	calibration->setImageParam("TOFSSDSC", 0.5);
	calibration->setImageParam("TOFSSDTOTOFF", 0);
	calibration->setImageParam("SPTPPHOFF", 1024);
	calibration->setImageParam("SPBTPHOFF", 1024);

	char name[32];
	for(int i = 0; i < DERECO::Common::N_SSD; i++) {
		snprintf(name, sizeof(name), "TOFSSDLTOFF%d", i);
		calibration->setImageParam(name, 0);
		snprintf(name, sizeof(name), "TOFSSDRTOFF%d", i);
		calibration->setImageParam(name, 0);
		snprintf(name, sizeof(name), "YBKSSD%d", i);
		calibration->setImageParam(name, (i - 3.5) * 5);
	}
}

DERECO::Calibration::Calibration * DERECO::Tests::makeCalibration()
{
	DERECO::Calibration::Calibration *calibration = new DERECO::Calibration::Calibration();
	setImageParams(calibration);

	for(int q = 0; q < N_QUADRANTS; q++) {
		for(int c = 0; c < N_TDC_CHANNELS; c++) {
			calibration->setTDCNormalization((Quadrant)q, (TDCChannel)c, 1.0, 0.0);
		}
	}
	for(int t = 0; t < N_BACKPOS_TABLES; t++) {
		calibration->getBackPositionLUT((BackPositionTable)t).setLinear(1.0, 0.0);
	}
	calibration->setAllPulseHeightCorrection(0.5);
	calibration->setDefaultSpeciesBands();
	return calibration;
}

const double StubGeometry::OMEGA = 1E-3;
const Vector3 StubGeometry::SC_VELOCITY = { 10.0, -20.0, 30.0 };

StubGeometry::StubGeometry(double etBegin, double etEnd)
	: etBegin(etBegin), etEnd(etEnd)
{
}

void StubGeometry::checkCoverage(double et) const
{
	if(!(et >= etBegin && et <= etEnd)) {
		throw GeometryCoverageError("stub geometry has no coverage");
	}
}

int StubGeometry::getFrameIndex(Frame frame)
{
	if(frame == FRAME_SPACECRAFT) return 1;
	if(frame == FRAME_DPS) return 2;
	return 0;
}

Vector3 StubGeometry::rotateZ(const Vector3 & v, double angle)
{
	Vector3 o;
	o.x = cos(angle) * v.x - sin(angle) * v.y;
	o.y = sin(angle) * v.x + cos(angle) * v.y;
	o.z = v.z;
	return o;
}

void StubGeometry::frameTransform(const vector<double> & et, const vector<Vector3> & vectors,
	Frame from, Frame to, vector<Vector3> & out) const
{
	out.resize(vectors.size());
	for(size_t i = 0; i < vectors.size(); i++) {
		checkCoverage(et[i]);
		double angle = (getFrameIndex(to) - getFrameIndex(from)) * et[i] * OMEGA;
		out[i] = rotateZ(vectors[i], angle);
	}
}

void StubGeometry::spacecraftState(const vector<double> & et, Frame frame, vector<StateVector> & out) const
{
	out.resize(et.size());
	for(size_t i = 0; i < et.size(); i++) {
		checkCoverage(et[i]);
		Vector3 zero = { 0, 0, 0 };
		out[i].position = zero;
		out[i].velocity = SC_VELOCITY;
	}
}

RawEvent DERECO::Tests::makePulseHeightEvent(long long startType, int stopType, int stopTdc, double eventTime)
{
	RawEvent e;
	e.epoch = 1000000000LL + (long long)(eventTime * 1E9);
	e.met = eventTime + 5000;
	e.eventTime = eventTime;
	e.startType = startType;
	e.stopType = stopType;
	e.coinType = stopType == STOP_TOP ? CoincidenceMask::TOP : CoincidenceMask::BOTTOM;
	e.startPosTdc = 200;
	e.stopNorthTdc = stopTdc;
	e.stopEastTdc = stopTdc;
	e.stopSouthTdc = stopTdc;
	e.stopWestTdc = stopTdc;
	e.coinNorthTdc = 100;
	e.coinSouthTdc = 100;
	e.coinDiscreteTdc = 0;
	e.energyPh = 1000;
	e.ssdFlags = 0;
	return e;
}

RawEvent DERECO::Tests::makeSSDEvent(long long startType, int ssdElement, int coinDiscreteTdc, double eventTime)
{
	RawEvent e = makePulseHeightEvent(startType, STOP_SSD_FIRST + ssdElement, 0, eventTime);
	e.coinType = CoincidenceMask::NONE;
	e.coinNorthTdc = 0;
	e.coinSouthTdc = 0;
	e.coinDiscreteTdc = coinDiscreteTdc;
	e.energyPh = 700;
	e.ssdFlags = 1 << ssdElement;
	return e;
}

RawEventBatch DERECO::Tests::makeScenarioBatch()
{
	RawEventBatch batch;
	for(int i = 0; i < 8; i++) {
		long long startType = i % 2 == 0 ? START_LEFT : START_RIGHT;
		int stopType = i % 2 == 0 ? STOP_TOP : STOP_BOTTOM;
		// Slower events in the second half of each group of four
		int stopTdc = i % 4 < 2 ? 100 : 200;
		batch.push(makePulseHeightEvent(startType, stopType, stopTdc, 100 + 10 * i));
	}
	for(int i = 0; i < 6; i++) {
		long long startType = i % 2 == 0 ? START_LEFT : START_RIGHT;
		int ssdElement = (i / 2) % 2 == 0 ? 3 : 7;
		batch.push(makeSSDEvent(startType, ssdElement, 400, 200 + 10 * i));
	}
	return batch;
}

TemporaryDirectory::TemporaryDirectory()
{
	boost::filesystem::path p = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("dereco-%%%%-%%%%-%%%%");
	boost::filesystem::create_directories(p);
	path = p.string();
}

TemporaryDirectory::~TemporaryDirectory()
{
	boost::system::error_code ec;
	boost::filesystem::remove_all(path, ec);
}

string TemporaryDirectory::writeFile(const string & name, const string & contents) const
{
	string fileName = (boost::filesystem::path(path) / name).string();
	FILE *f = fopen(fileName.c_str(), "w");
	if(f == NULL) throw OSError(errno, fileName);
	fputs(contents.c_str(), f);
	fclose(f);
	return fileName;
}
