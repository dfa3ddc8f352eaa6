#include "SpinningPointingGeometry.hpp"
#include <Common/Exception.hpp>
#include <stdio.h>
#include <errno.h>
#include <math.h>
#include <string.h>
#include <string>
#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>

using namespace std;
using namespace DERECO::Common;
using namespace DERECO::Geometry;

static const char *frameNames[N_FRAMES] = { "IMAP_ULTRA_45", "IMAP_ULTRA_90", "IMAP_SPACECRAFT", "IMAP_DPS" };

const char * DERECO::Geometry::getFrameName(Frame frame)
{
	return frameNames[frame];
}

static Frame parseFrame(const string & name)
{
	for(int i = 0; i < N_FRAMES; i++) {
		if(name == frameNames[i]) return (Frame)i;
	}
	throw GeometryCoverageError("Unknown frame '" + name + "'");
}

SpinningPointingGeometry::SpinningPointingGeometry()
{
	etBegin = etEnd = 0;
	spinPeriod = 0;
	spinEt0 = 0;
	spinPhase0 = 0;
	hasCoverage = false;
	hasSpin = false;
	for(int f = 0; f < N_FRAMES; f++) {
		hasMounting[f] = false;
		for(int i = 0; i < 9; i++)
			mounting[f].m[i] = (i % 4 == 0) ? 1 : 0;
	}
	// The spacecraft frame is its own mounting
	hasMounting[FRAME_SPACECRAFT] = true;
}

SpinningPointingGeometry::~SpinningPointingGeometry()
{
}

void SpinningPointingGeometry::setCoverage(double etBegin, double etEnd)
{
	this->etBegin = etBegin;
	this->etEnd = etEnd;
	hasCoverage = true;
}

void SpinningPointingGeometry::setSpin(double period, double et0, double phase0)
{
	spinPeriod = period;
	spinEt0 = et0;
	spinPhase0 = phase0;
	hasSpin = period > 0;
}

void SpinningPointingGeometry::setMounting(Frame instrument, const double rotation[9])
{
	for(int i = 0; i < 9; i++)
		mounting[instrument].m[i] = rotation[i];
	hasMounting[instrument] = true;
}

void SpinningPointingGeometry::addStateSample(double et, const StateVector & state)
{
	if(!samples.empty() && et <= samples.back().et) {
		char message[128];
		snprintf(message, sizeof(message), "State sample at %.6f is not after the previous one", et);
		throw GeometryCoverageError(message);
	}
	Sample s;
	s.et = et;
	s.state = state;
	samples.push_back(s);
}

void SpinningPointingGeometry::checkCoverage(double et) const
{
	if(!hasCoverage || !hasSpin) {
		throw GeometryCoverageError("Pointing geometry was not furnished");
	}
	if(isnan(et) || et < etBegin || et > etEnd) {
		char message[128];
		snprintf(message, sizeof(message), "No pointing coverage for ET %.6f", et);
		throw GeometryCoverageError(message);
	}
}

SpinningPointingGeometry::Rotation SpinningPointingGeometry::multiply(const Rotation & a, const Rotation & b)
{
	Rotation r;
	for(int i = 0; i < 3; i++) {
		for(int j = 0; j < 3; j++) {
			r.m[3*i+j] = a.m[3*i] * b.m[j] + a.m[3*i+1] * b.m[3+j] + a.m[3*i+2] * b.m[6+j];
		}
	}
	return r;
}

SpinningPointingGeometry::Rotation SpinningPointingGeometry::transpose(const Rotation & a)
{
	Rotation r;
	for(int i = 0; i < 3; i++) {
		for(int j = 0; j < 3; j++) {
			r.m[3*i+j] = a.m[3*j+i];
		}
	}
	return r;
}

Vector3 SpinningPointingGeometry::apply(const Rotation & r, const Vector3 & v)
{
	Vector3 o;
	o.x = r.m[0] * v.x + r.m[1] * v.y + r.m[2] * v.z;
	o.y = r.m[3] * v.x + r.m[4] * v.y + r.m[5] * v.z;
	o.z = r.m[6] * v.x + r.m[7] * v.y + r.m[8] * v.z;
	return o;
}

SpinningPointingGeometry::Rotation SpinningPointingGeometry::toDps(Frame frame, double et) const
{
	Rotation identity;
	for(int i = 0; i < 9; i++)
		identity.m[i] = (i % 4 == 0) ? 1 : 0;
	if(frame == FRAME_DPS)
		return identity;

	if(!hasMounting[frame]) {
		throw GeometryCoverageError(string("No mounting for frame ") + frameNames[frame]);
	}

	double phi = spinPhase0 + 2 * M_PI * (et - spinEt0) / spinPeriod;
	double c = cos(phi);
	double s = sin(phi);
	Rotation spin;
	spin.m[0] = c;	spin.m[1] = -s;	spin.m[2] = 0;
	spin.m[3] = s;	spin.m[4] = c;	spin.m[5] = 0;
	spin.m[6] = 0;	spin.m[7] = 0;	spin.m[8] = 1;

	return multiply(spin, mounting[frame]);
}

void SpinningPointingGeometry::frameTransform(const vector<double> & et,
	const vector<Vector3> & vectors,
	Frame from, Frame to,
	vector<Vector3> & out) const
{
	if(et.size() != vectors.size()) {
		throw StructuralError("Frame transform needs one time per vector");
	}

	out.resize(vectors.size());
	for(size_t i = 0; i < vectors.size(); i++) {
		checkCoverage(et[i]);
		Rotation r = multiply(transpose(toDps(to, et[i])), toDps(from, et[i]));
		out[i] = apply(r, vectors[i]);
	}
}

void SpinningPointingGeometry::spacecraftState(const vector<double> & et,
	Frame frame,
	vector<StateVector> & out) const
{
	out.resize(et.size());
	for(size_t i = 0; i < et.size(); i++) {
		checkCoverage(et[i]);
		if(samples.empty() || et[i] < samples.front().et || et[i] > samples.back().et) {
			char message[128];
			snprintf(message, sizeof(message), "No spacecraft state for ET %.6f", et[i]);
			throw GeometryCoverageError(message);
		}

		// First sample at or after et
		size_t lo = 0;
		size_t hi = samples.size() - 1;
		while(lo < hi) {
			size_t mid = (lo + hi) / 2;
			if(samples[mid].et < et[i]) lo = mid + 1;
			else hi = mid;
		}

		StateVector dps;
		if(samples[lo].et == et[i] || lo == 0) {
			dps = samples[lo].state;
		}
		else {
			const Sample &a = samples[lo - 1];
			const Sample &b = samples[lo];
			double f = (et[i] - a.et) / (b.et - a.et);
			dps.position.x = a.state.position.x + f * (b.state.position.x - a.state.position.x);
			dps.position.y = a.state.position.y + f * (b.state.position.y - a.state.position.y);
			dps.position.z = a.state.position.z + f * (b.state.position.z - a.state.position.z);
			dps.velocity.x = a.state.velocity.x + f * (b.state.velocity.x - a.state.velocity.x);
			dps.velocity.y = a.state.velocity.y + f * (b.state.velocity.y - a.state.velocity.y);
			dps.velocity.z = a.state.velocity.z + f * (b.state.velocity.z - a.state.velocity.z);
		}

		Rotation r = transpose(toDps(frame, et[i]));
		out[i].position = apply(r, dps.position);
		out[i].velocity = apply(r, dps.velocity);
	}
}

static double toDouble(const string & s, const char *fileName, int lineNumber)
{
	try {
		return boost::lexical_cast<double>(s);
	}
	catch (boost::bad_lexical_cast &) {
		char message[1200];
		snprintf(message, sizeof(message), "Bad number '%s' in '%s' (line %d)", s.c_str(), fileName, lineNumber);
		throw GeometryCoverageError(message);
	}
}

void SpinningPointingGeometry::loadFile(const char *fileName)
{
	fprintf(stderr, "Loading pointing geometry file: '%s' ... ", fileName); fflush(stderr);
	FILE *f = fopen(fileName, "r");
	if(f == NULL) {
		throw OSError(errno, fileName);
	}

	const boost::regex e("\\s*(\\w+)\\s+(\\S+)((\\s+\\S+)*)\\s*");
	const boost::regex number("\\S+");
	char buffer[1024];
	int lineNumber = 0;
	int nSamples = 0;
	try {
		while(fgets(buffer, sizeof(buffer), f) != NULL) {
			lineNumber += 1;
			buffer[strcspn(buffer, "#\r\n")] = 0;
			if(buffer[strspn(buffer, " \t")] == 0) continue;

			string line(buffer);
			boost::smatch what;
			if(!boost::regex_match(line, what, e)) {
				char message[1200];
				snprintf(message, sizeof(message), "Bad syntax in '%s' (line %d)", fileName, lineNumber);
				throw GeometryCoverageError(message);
			}

			string kind = what[1];
			string first = what[2];
			vector<double> values;
			string rest = what[3];
			boost::sregex_iterator it(rest.begin(), rest.end(), number);
			boost::sregex_iterator end;
			for(; it != end; ++it) {
				values.push_back(toDouble(it->str(), fileName, lineNumber));
			}

			if(kind == "coverage" && values.size() == 1) {
				setCoverage(toDouble(first, fileName, lineNumber), values[0]);
			}
			else if(kind == "spin" && values.size() == 2) {
				setSpin(toDouble(first, fileName, lineNumber), values[0], values[1]);
			}
			else if(kind == "mount" && values.size() == 9) {
				setMounting(parseFrame(first), &values[0]);
			}
			else if(kind == "state" && values.size() == 6) {
				StateVector s;
				s.position.x = values[0];
				s.position.y = values[1];
				s.position.z = values[2];
				s.velocity.x = values[3];
				s.velocity.y = values[4];
				s.velocity.z = values[5];
				addStateSample(toDouble(first, fileName, lineNumber), s);
				nSamples++;
			}
			else {
				char message[1200];
				snprintf(message, sizeof(message), "Bad '%s' record in '%s' (line %d)", kind.c_str(), fileName, lineNumber);
				throw GeometryCoverageError(message);
			}
		}
	}
	catch (Exception &) {
		fclose(f);
		throw;
	}
	fclose(f);
	fprintf(stderr, "%d state samples\n", nSamples);
}
