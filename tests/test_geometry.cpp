#include <gtest/gtest.h>
#include <Common/Exception.hpp>
#include <Geometry/SpinningPointingGeometry.hpp>
#include "TestSupport.hpp"
#include <math.h>
#include <vector>

using namespace std;
using namespace DERECO::Common;
using namespace DERECO::Geometry;
using namespace DERECO::Tests;

static Vector3 makeVector(double x, double y, double z)
{
	Vector3 v = { x, y, z };
	return v;
}

// 90 degree rotation about x: instrument z is spacecraft -y
static const double mountX90[9] = {
	1, 0, 0,
	0, 0, -1,
	0, 1, 0
};

static void setUpGeometry(SpinningPointingGeometry &geometry)
{
	geometry.setCoverage(0, 100);
	// Quarter turn every 10 s, starting at zero phase
	geometry.setSpin(40, 0, 0);
	geometry.setMounting(FRAME_ULTRA_90, mountX90);

	StateVector s0 = { makeVector(1E8, 0, 0), makeVector(0, 30, 0) };
	StateVector s1 = { makeVector(1E8, 0, 0), makeVector(0, 32, 2) };
	geometry.addStateSample(0, s0);
	geometry.addStateSample(100, s1);
}

TEST(SpinningPointingGeometry, MountingAndSpin)
{
	SpinningPointingGeometry geometry;
	setUpGeometry(geometry);

	vector<double> et;
	et.push_back(0);
	et.push_back(10);
	vector<Vector3> v(2, makeVector(0, 0, 1));
	vector<Vector3> out;

	geometry.frameTransform(et, v, FRAME_ULTRA_90, FRAME_SPACECRAFT, out);
	ASSERT_EQ(2u, out.size());
	for(int i = 0; i < 2; i++) {
		EXPECT_NEAR(0, out[i].x, 1E-12);
		EXPECT_NEAR(-1, out[i].y, 1E-12);
		EXPECT_NEAR(0, out[i].z, 1E-12);
	}

	// Spin only shows in the despun frame, and differs per event time
	geometry.frameTransform(et, v, FRAME_ULTRA_90, FRAME_DPS, out);
	EXPECT_NEAR(0, out[0].x, 1E-12);
	EXPECT_NEAR(-1, out[0].y, 1E-12);
	EXPECT_NEAR(1, out[1].x, 1E-12);
	EXPECT_NEAR(0, out[1].y, 1E-12);

	// Round trip back to the instrument
	vector<Vector3> back;
	geometry.frameTransform(et, out, FRAME_DPS, FRAME_ULTRA_90, back);
	EXPECT_NEAR(1, back[1].z, 1E-12);
	EXPECT_NEAR(0, back[1].x, 1E-12);
}

TEST(SpinningPointingGeometry, StateIsInterpolated)
{
	SpinningPointingGeometry geometry;
	setUpGeometry(geometry);

	vector<double> et(1, 50);
	vector<StateVector> out;
	geometry.spacecraftState(et, FRAME_DPS, out);
	ASSERT_EQ(1u, out.size());
	EXPECT_NEAR(31, out[0].velocity.y, 1E-9);
	EXPECT_NEAR(1, out[0].velocity.z, 1E-9);
	EXPECT_NEAR(1E8, out[0].position.x, 1E-3);

	et[0] = 100;
	geometry.spacecraftState(et, FRAME_DPS, out);
	EXPECT_NEAR(32, out[0].velocity.y, 1E-9);
}

TEST(SpinningPointingGeometry, OutsideCoverageThrows)
{
	SpinningPointingGeometry geometry;
	setUpGeometry(geometry);

	vector<double> et;
	et.push_back(50);
	et.push_back(150);
	vector<Vector3> v(2, makeVector(1, 0, 0));
	vector<Vector3> out;
	vector<StateVector> state;

	EXPECT_THROW(geometry.frameTransform(et, v, FRAME_ULTRA_90, FRAME_DPS, out), GeometryCoverageError);
	EXPECT_THROW(geometry.spacecraftState(et, FRAME_DPS, state), GeometryCoverageError);

	et[1] = NAN;
	EXPECT_THROW(geometry.frameTransform(et, v, FRAME_ULTRA_90, FRAME_DPS, out), GeometryCoverageError);

	// No mounting was furnished for this head
	et[1] = 60;
	EXPECT_THROW(geometry.frameTransform(et, v, FRAME_ULTRA_45, FRAME_DPS, out), GeometryCoverageError);
}

TEST(SpinningPointingGeometry, UnfurnishedGeometryThrows)
{
	SpinningPointingGeometry geometry;
	vector<double> et(1, 0);
	vector<Vector3> v(1, makeVector(1, 0, 0));
	vector<Vector3> out;
	EXPECT_THROW(geometry.frameTransform(et, v, FRAME_SPACECRAFT, FRAME_DPS, out), GeometryCoverageError);

	StateVector s = { makeVector(0, 0, 0), makeVector(0, 0, 0) };
	geometry.addStateSample(10, s);
	EXPECT_THROW(geometry.addStateSample(5, s), GeometryCoverageError);
}

TEST(SpinningPointingGeometry, LoadFile)
{
	TemporaryDirectory dir;
	string fileName = dir.writeFile("pointing.txt",
		"# pointing 1\n"
		"coverage 0 100\n"
		"spin 40 0 0\n"
		"mount IMAP_ULTRA_90 1 0 0  0 0 -1  0 1 0\n"
		"state 0 1e8 0 0 0 30 0\n"
		"state 100 1e8 0 0 0 32 2\n");

	SpinningPointingGeometry geometry;
	geometry.loadFile(fileName.c_str());

	vector<double> et(1, 10);
	vector<Vector3> v(1, makeVector(0, 0, 1));
	vector<Vector3> out;
	geometry.frameTransform(et, v, FRAME_ULTRA_90, FRAME_DPS, out);
	EXPECT_NEAR(1, out[0].x, 1E-12);

	string bad = dir.writeFile("bad.txt", "mount IMAP_ULTRA_90 1 0 0\n");
	SpinningPointingGeometry other;
	EXPECT_THROW(other.loadFile(bad.c_str()), GeometryCoverageError);
	string unknownFrame = dir.writeFile("frame.txt", "mount IMAP_LO 1 0 0 0 1 0 0 0 1\n");
	EXPECT_THROW(other.loadFile(unknownFrame.c_str()), GeometryCoverageError);
	EXPECT_THROW(other.loadFile((dir.getPath() + "/missing.txt").c_str()), OSError);
}

TEST(StubGeometry, RotatesPerEventTime)
{
	StubGeometry geometry(0, 10);
	vector<double> et;
	et.push_back(0);
	et.push_back(M_PI / 2 / StubGeometry::OMEGA);
	vector<Vector3> v(2, makeVector(1, 0, 0));
	vector<Vector3> out;

	StubGeometry wide(0, 1E6);
	wide.frameTransform(et, v, FRAME_ULTRA_45, FRAME_SPACECRAFT, out);
	EXPECT_NEAR(1, out[0].x, 1E-12);
	EXPECT_NEAR(1, out[1].y, 1E-9);

	EXPECT_THROW(geometry.frameTransform(et, v, FRAME_ULTRA_45, FRAME_SPACECRAFT, out), GeometryCoverageError);
}
