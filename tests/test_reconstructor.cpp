#include <gtest/gtest.h>
#include <Common/Exception.hpp>
#include <Core/Reconstructor.hpp>
#include <Core/DirectEventTable.hpp>
#include <Core/FieldCatalog.hpp>
#include "TestSupport.hpp"
#include <math.h>
#include <string.h>
#include <memory>

using namespace std;
using namespace DERECO::Common;
using namespace DERECO::Core;
using namespace DERECO::Calibration;
using namespace DERECO::Geometry;
using namespace DERECO::Tests;

class ReconstructorTest : public ::testing::Test {
protected:
	virtual void SetUp() {
		calibration = makeCalibration();
	}
	virtual void TearDown() {
		delete calibration;
	}

	DirectEventTable * run(const RawEventBatch & batch, bool singleThread = false, unsigned blockSize = 4) {
		Reconstructor reconstructor(calibration, &geometry, SENSOR_45, singleThread, blockSize);
		return reconstructor.reconstruct(batch);
	}

	DERECO::Calibration::Calibration *calibration;
	StubGeometry geometry;
};

// Bitwise equality of every catalogued column, NaN included
static void expectIdentical(const DirectEventTable *a, const DirectEventTable *b)
{
	ASSERT_EQ(a->getSize(), b->getSize());
	for(int i = 0; i < FieldCatalog::getNFields(); i++) {
		const FieldAttributes &field = FieldCatalog::getField((FieldID)i);
		vector<double> va;
		vector<double> vb;
		a->getColumn(field.name, va);
		b->getColumn(field.name, vb);
		ASSERT_EQ(va.size(), vb.size());
		for(size_t n = 0; n < va.size(); n++) {
			EXPECT_EQ(0, memcmp(&va[n], &vb[n], sizeof(double))) << field.name << " row " << n;
		}
	}
}

TEST_F(ReconstructorTest, FourteenEventScenario)
{
	RawEventBatch batch = makeScenarioBatch();
	unique_ptr<DirectEventTable> table(run(batch));

	ASSERT_EQ(14u, table->getSize());
	EXPECT_EQ("ultra45", table->getInstrument());

	int nPH = 0;
	int nSSD = 0;
	int nHe = 0;
	for(size_t i = 0; i < table->getSize(); i++) {
		const DirectEvent &e = table->get(i);
		EXPECT_NE(SPECIES_UNKNOWN, e.species) << "row " << i;
		EXPECT_EQ(batch.eventTime[i], e.raw.eventTime);
		EXPECT_EQ(batch.coinType[i], e.raw.coinType);
		EXPECT_EQ(batch.startType[i], e.raw.startType);

		if(e.category == CATEGORY_PULSE_HEIGHT) {
			nPH++;
			EXPECT_LT(i, 8u);
			EXPECT_EQ(-1, e.ssdNumber);
			EXPECT_FALSE(isnan(e.xCoin));
			EXPECT_FLOAT_EQ(999.5, e.energy);
		}
		else {
			nSSD++;
			EXPECT_EQ(CATEGORY_SSD, e.category);
			EXPECT_GE(i, 8u);
			EXPECT_EQ(0, e.xBack);
			EXPECT_EQ(0, e.xCoin);
			EXPECT_EQ(0, e.tofStopCoin);
			EXPECT_TRUE(e.ssdNumber == 3 || e.ssdNumber == 7);
			EXPECT_FLOAT_EQ(700, e.energy);
		}
		if(e.species == SPECIES_HE) nHe++;

		EXPECT_GE(e.pathLength, 0);
		EXPECT_GT(e.velocityMagnitude, 0);
		EXPECT_GT(e.tofEnergy, 0);
		EXPECT_GE(e.azimuth, 0);
		EXPECT_LT(e.azimuth, 2 * M_PI);
		EXPECT_GE(e.elevation, -M_PI_2);
		EXPECT_LE(e.elevation, M_PI_2);
	}
	EXPECT_EQ(8, nPH);
	EXPECT_EQ(6, nSSD);
	// Second half of each group of four pulse height events is slower
	EXPECT_EQ(4, nHe);

	vector<double> xBack;
	table->getColumn("x_back", xBack);
	for(size_t i = 8; i < 14; i++)
		EXPECT_EQ(0, xBack[i]);
}

TEST_F(ReconstructorTest, RerunIsBitIdentical)
{
	RawEventBatch batch = makeScenarioBatch();
	unique_ptr<DirectEventTable> a(run(batch));
	unique_ptr<DirectEventTable> b(run(batch));
	expectIdentical(a.get(), b.get());

	// Neither block size nor threading changes the result
	unique_ptr<DirectEventTable> c(run(batch, true, 1));
	unique_ptr<DirectEventTable> d(run(batch, false, 4096));
	expectIdentical(a.get(), c.get());
	expectIdentical(a.get(), d.get());
}

// Copies of the scenario with increasing event times
static RawEventBatch makeLargeBatch(int nCopies)
{
	RawEventBatch batch;
	for(int n = 0; n < nCopies; n++) {
		RawEventBatch scenario = makeScenarioBatch();
		for(size_t i = 0; i < scenario.getSize(); i++) {
			RawEvent e = scenario.getEvent(i);
			e.eventTime = 1000 + batch.getSize();
			batch.push(e);
		}
	}
	return batch;
}

TEST_F(ReconstructorTest, LargeBatchKeepsOrder)
{
	RawEventBatch batch = makeLargeBatch(50);
	unique_ptr<DirectEventTable> table(run(batch, false, 16));
	ASSERT_EQ(batch.getSize(), table->getSize());
	for(size_t i = 0; i < table->getSize(); i++) {
		ASSERT_EQ(batch.eventTime[i], table->get(i).raw.eventTime);
	}
}

TEST_F(ReconstructorTest, UndetectedStartsAreDropped)
{
	RawEventBatch batch = makeScenarioBatch();
	batch.startType[2] = START_TYPE_FILL;
	batch.startType[10] = START_TYPE_FILL;

	unique_ptr<DirectEventTable> table(run(batch));
	ASSERT_EQ(12u, table->getSize());
	EXPECT_EQ(batch.eventTime[3], table->get(2).raw.eventTime);
	EXPECT_EQ(batch.eventTime[11], table->get(9).raw.eventTime);
}

TEST_F(ReconstructorTest, UnclassifiedEventsKeepFill)
{
	RawEventBatch batch = makeScenarioBatch();
	batch.stopType[4] = 5;

	unique_ptr<DirectEventTable> table(run(batch));
	ASSERT_EQ(14u, table->getSize());
	const DirectEvent &e = table->get(4);
	EXPECT_EQ(CATEGORY_INVALID, e.category);
	EXPECT_EQ(SPECIES_UNKNOWN, e.species);
	EXPECT_TRUE(isnan(e.xBack));
	EXPECT_TRUE(isnan(e.pathLength));
	EXPECT_TRUE(isnan(e.velocity[0]));
	EXPECT_TRUE(isnan(e.velocityDpsHelio[1]));
	EXPECT_TRUE(isnan(e.tofEnergy));
	// Carried through regardless
	EXPECT_EQ(5, e.raw.stopType);
	EXPECT_FALSE(isnan(e.xFront));
}

TEST_F(ReconstructorTest, ZeroTofGivesFill)
{
	RawEventBatch batch;
	// Left start at this TDC puts the front hit at x = 0, so no TOF correction
	batch.push(makePulseHeightEvent(START_LEFT, STOP_TOP, 0, 10));
	batch.push(makePulseHeightEvent(START_LEFT, STOP_TOP, 100, 20));

	unique_ptr<DirectEventTable> table(run(batch));
	ASSERT_EQ(2u, table->getSize());
	const DirectEvent &e = table->get(0);
	EXPECT_EQ(0, e.tofStartStop);
	EXPECT_TRUE(isnan(e.velocityMagnitude));
	EXPECT_FALSE(isinf(e.velocityMagnitude));
	EXPECT_TRUE(isnan(e.tofEnergy));
	EXPECT_TRUE(isnan(e.velocity[2]));
	EXPECT_TRUE(isnan(e.azimuth));
	EXPECT_EQ(SPECIES_UNKNOWN, e.species);

	EXPECT_FALSE(isnan(table->get(1).velocityMagnitude));
}

TEST_F(ReconstructorTest, FramesUseEachEventTime)
{
	RawEventBatch batch;
	batch.push(makePulseHeightEvent(START_LEFT, STOP_TOP, 100, 0));
	batch.push(makePulseHeightEvent(START_LEFT, STOP_TOP, 100, M_PI / 2 / StubGeometry::OMEGA));

	unique_ptr<DirectEventTable> table(run(batch));
	ASSERT_EQ(2u, table->getSize());
	for(int i = 0; i < 2; i++) {
		const DirectEvent &e = table->get(i);
		double angle = e.raw.eventTime * StubGeometry::OMEGA;
		Vector3 v = { e.velocity[0], e.velocity[1], e.velocity[2] };
		Vector3 sc = StubGeometry::rotateZ(v, angle);
		Vector3 dps = StubGeometry::rotateZ(v, 2 * angle);
		EXPECT_NEAR(sc.x, e.velocitySc[0], 1E-2);
		EXPECT_NEAR(sc.y, e.velocitySc[1], 1E-2);
		EXPECT_NEAR(sc.z, e.velocitySc[2], 1E-2);
		EXPECT_NEAR(dps.x, e.velocityDpsSc[0], 1E-2);
		EXPECT_NEAR(dps.y, e.velocityDpsSc[1], 1E-2);
		EXPECT_NEAR(dps.x + StubGeometry::SC_VELOCITY.x, e.velocityDpsHelio[0], 1E-2);
		EXPECT_NEAR(dps.y + StubGeometry::SC_VELOCITY.y, e.velocityDpsHelio[1], 1E-2);
		EXPECT_NEAR(dps.z + StubGeometry::SC_VELOCITY.z, e.velocityDpsHelio[2], 1E-2);
	}
	// Same instrument velocity, different spacecraft frame velocity
	EXPECT_NEAR(table->get(0).velocitySc[1], -table->get(1).velocitySc[0], 1E-2);
}

TEST_F(ReconstructorTest, SensorSelectsFrameAndInstrument)
{
	EXPECT_EQ(FRAME_ULTRA_45, getSensorFrame(SENSOR_45));
	EXPECT_EQ(FRAME_ULTRA_90, getSensorFrame(SENSOR_90));
	EXPECT_STREQ("ultra90", getSensorInstrument(SENSOR_90));

	Reconstructor reconstructor(calibration, &geometry, SENSOR_90);
	unique_ptr<DirectEventTable> table(reconstructor.reconstruct(makeScenarioBatch()));
	EXPECT_EQ("ultra90", table->getInstrument());
}

TEST_F(ReconstructorTest, EventEfficiencyIsFill)
{
	unique_ptr<DirectEventTable> table(run(makeScenarioBatch()));
	vector<double> values;
	table->getColumn("event_efficiency", values);
	ASSERT_EQ(14u, values.size());
	for(size_t i = 0; i < values.size(); i++)
		EXPECT_TRUE(isnan(values[i])) << "row " << i;
}

TEST_F(ReconstructorTest, KineticEnergyUsesBranchMasses)
{
	RawEventBatch batch = makeScenarioBatch();
	unique_ptr<DirectEventTable> reference(run(batch));

	vector<SpeciesBand> bands = calibration->getSpeciesBands(BRANCH_SSD);
	for(size_t i = 0; i < bands.size(); i++)
		bands[i].mass *= 2;
	calibration->setSpeciesBands(BRANCH_SSD, bands);
	unique_ptr<DirectEventTable> table(run(batch));

	ASSERT_EQ(reference->getSize(), table->getSize());
	for(size_t i = 0; i < table->getSize(); i++) {
		const DirectEvent &a = reference->get(i);
		const DirectEvent &b = table->get(i);
		ASSERT_EQ(a.species, b.species);
		if(b.category == CATEGORY_SSD)
			EXPECT_FLOAT_EQ(2 * a.tofEnergy, b.tofEnergy) << "row " << i;
		else
			EXPECT_FLOAT_EQ(a.tofEnergy, b.tofEnergy) << "row " << i;
	}
}

TEST_F(ReconstructorTest, EmptyBatch)
{
	RawEventBatch batch;
	unique_ptr<DirectEventTable> table(run(batch));
	EXPECT_EQ(0u, table->getSize());
}

TEST_F(ReconstructorTest, StructuralErrorAbortsBatch)
{
	RawEventBatch batch = makeScenarioBatch();
	batch.energyPh.push_back(1);
	EXPECT_THROW(run(batch), StructuralError);
}

TEST_F(ReconstructorTest, MissingImageParamAbortsBatch)
{
	DERECO::Calibration::Calibration partial;
	partial.setImageParam("XFTSC", 0.5);
	Reconstructor reconstructor(&partial, &geometry, SENSOR_45);
	EXPECT_THROW(reconstructor.reconstruct(makeScenarioBatch()), CalibrationError);
}

TEST_F(ReconstructorTest, MissingTableInWorkerAbortsBatch)
{
	DERECO::Calibration::Calibration partial;
	setImageParams(&partial);
	Reconstructor reconstructor(&partial, &geometry, SENSOR_45, false, 2);
	EXPECT_THROW(reconstructor.reconstruct(makeScenarioBatch()), CalibrationError);

	// The engine stays usable afterwards
	unique_ptr<DirectEventTable> table(run(makeScenarioBatch()));
	EXPECT_EQ(14u, table->getSize());
}

TEST_F(ReconstructorTest, WorkerErrorWithBlocksInFlight)
{
	DERECO::Calibration::Calibration partial;
	setImageParams(&partial);
	RawEventBatch batch = makeLargeBatch(20);

	for(int round = 0; round < 3; round++) {
		Reconstructor reconstructor(&partial, &geometry, SENSOR_45, false, 1);
		EXPECT_THROW(reconstructor.reconstruct(batch), CalibrationError);
	}

	unique_ptr<DirectEventTable> table(run(batch, false, 1));
	EXPECT_EQ(batch.getSize(), table->getSize());
}

TEST_F(ReconstructorTest, CoverageErrorWithBlocksInFlight)
{
	RawEventBatch batch = makeLargeBatch(20);
	ASSERT_EQ(280u, batch.getSize());

	// Early enough that later blocks are still queued upstream
	batch.eventTime[20] = 2E6;
	for(int round = 0; round < 3; round++) {
		EXPECT_THROW(run(batch, false, 1), GeometryCoverageError);
	}

	batch.eventTime[20] = 1020;
	batch.eventTime[150] = NAN;
	EXPECT_THROW(run(batch, false, 1), GeometryCoverageError);
	EXPECT_THROW(run(batch, true, 3), GeometryCoverageError);
}

TEST_F(ReconstructorTest, GeometryCoverageAbortsBatch)
{
	RawEventBatch batch = makeScenarioBatch();
	batch.eventTime[13] = 2E6;
	EXPECT_THROW(run(batch), GeometryCoverageError);

	batch = makeScenarioBatch();
	batch.eventTime[0] = NAN;
	EXPECT_THROW(run(batch, true, 1), GeometryCoverageError);
}
