#include "Calibration.hpp"
#include <Common/Exception.hpp>
#include <Common/Utils.hpp>
#include <stdio.h>
#include <errno.h>
#include <math.h>
#include <string.h>
#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>

using namespace std;
using namespace DERECO::Common;
using namespace DERECO::Core;
using namespace DERECO::Calibration;

static const char *quadrantNames[N_QUADRANTS] = { "TP", "BT" };
static const char *tdcChannelNames[N_TDC_CHANNELS] = { "SpN", "SpS", "SpE", "SpW", "CoinN", "CoinS" };
static const char *backPositionTableNames[N_BACKPOS_TABLES] = { "XBkTp", "YBkTp", "XBkBt", "YBkBt" };
static const char *branchNames[N_BRANCHES] = { "PH", "SSD" };

static int findName(const char **names, int n, const string & name, const char *what)
{
	for(int i = 0; i < n; i++) {
		if(name == names[i]) return i;
	}
	throw CalibrationError(string("Unknown ") + what + " '" + name + "'");
}

Quadrant DERECO::Calibration::parseQuadrant(const string & name)
{
	return (Quadrant)findName(quadrantNames, N_QUADRANTS, name, "quadrant");
}

TDCChannel DERECO::Calibration::parseTDCChannel(const string & name)
{
	return (TDCChannel)findName(tdcChannelNames, N_TDC_CHANNELS, name, "TDC channel");
}

BackPositionTable DERECO::Calibration::parseBackPositionTable(const string & name)
{
	return (BackPositionTable)findName(backPositionTableNames, N_BACKPOS_TABLES, name, "back position table");
}

Branch DERECO::Calibration::parseBranch(const string & name)
{
	return (Branch)findName(branchNames, N_BRANCHES, name, "branch");
}

const char * DERECO::Calibration::getQuadrantName(Quadrant q)
{
	return quadrantNames[q];
}

const char * DERECO::Calibration::getTDCChannelName(TDCChannel c)
{
	return tdcChannelNames[c];
}

const char * DERECO::Calibration::getBackPositionTableName(BackPositionTable t)
{
	return backPositionTableNames[t];
}

// Matches a number field; lexical_cast failures become calibration errors
static double toDouble(const string & s, const char *fileName, int lineNumber)
{
	try {
		return boost::lexical_cast<double>(s);
	}
	catch (boost::bad_lexical_cast &) {
		char message[1200];
		snprintf(message, sizeof(message), "Bad number '%s' in '%s' (line %d)", s.c_str(), fileName, lineNumber);
		throw CalibrationError(message);
	}
}

static void badSyntax(const char *fileName, int lineNumber)
{
	char message[1200];
	snprintf(message, sizeof(message), "Bad syntax in '%s' (line %d)", fileName, lineNumber);
	throw CalibrationError(message);
}

// Reads every non-empty, non-comment line of a calibration file
class LineReader {
public:
	LineReader(const char *fileName) : fileName(fileName), lineNumber(0) {
		f = fopen(fileName, "r");
		if(f == NULL) {
			throw OSError(errno, fileName);
		}
	};
	~LineReader() {
		fclose(f);
	};
	bool next(string & line) {
		char buffer[1024];
		while(fgets(buffer, sizeof(buffer), f) != NULL) {
			lineNumber += 1;
			buffer[strcspn(buffer, "#\r\n")] = 0;
			if(buffer[strspn(buffer, " \t")] == 0) continue;
			line = buffer;
			return true;
		}
		return false;
	};
	int getLineNumber() { return lineNumber; };
private:
	const char *fileName;
	FILE *f;
	int lineNumber;
};

Calibration::Calibration()
{
	for(int q = 0; q < N_QUADRANTS; q++) {
		for(int c = 0; c < N_TDC_CHANNELS; c++) {
			tdcNorm[q][c].loaded = false;
			tdcNorm[q][c].slope = 0;
			tdcNorm[q][c].offset = 0;
		}
	}
	for(int i = 0; i < PHCORR_NX * PHCORR_NY; i++) {
		phCorrection[i] = 0;
	}
	phCorrectionLoaded = false;
	setDefaultSpeciesBands();
}

Calibration::~Calibration()
{
}

void Calibration::setImageParam(const string & name, double value)
{
	imageParams[name] = value;
}

double Calibration::getImageParam(const string & name) const
{
	map<string, double>::const_iterator it = imageParams.find(name);
	if(it == imageParams.end()) {
		throw CalibrationError("Image parameter '" + name + "' not found");
	}
	return it->second;
}

bool Calibration::hasImageParam(const string & name) const
{
	return imageParams.find(name) != imageParams.end();
}

void Calibration::setTDCNormalization(Quadrant q, TDCChannel c, float slope, float offset)
{
	TDCNorm &n = tdcNorm[q][c];
	n.loaded = true;
	n.slope = slope;
	n.offset = offset;
}

float Calibration::getNormalizedTDC(Quadrant q, TDCChannel c, int tdc) const
{
	const TDCNorm &n = tdcNorm[q][c];
	if(!n.loaded) {
		throw CalibrationError(string("TDC normalisation for ") + getQuadrantName(q) + " " + getTDCChannelName(c) + " not loaded");
	}
	return n.slope * tdc + n.offset;
}

float Calibration::getBackPosition(BackPositionTable t, float index) const
{
	const BackPositionLUT &lut = backPosition[t];
	if(!lut.isLoaded()) {
		throw CalibrationError(string("Back position table ") + getBackPositionTableName(t) + " not loaded");
	}
	return lut.get(index);
}

void Calibration::setPulseHeightCorrection(int xi, int yi, float v)
{
	if(xi < 0 || xi >= PHCORR_NX || yi < 0 || yi >= PHCORR_NY) {
		char message[128];
		snprintf(message, sizeof(message), "Pulse height correction cell (%d, %d) outside the grid", xi, yi);
		throw CalibrationError(message);
	}
	phCorrection[xi * PHCORR_NY + yi] = v;
	phCorrectionLoaded = true;
}

void Calibration::setAllPulseHeightCorrection(float v)
{
	for(int i = 0; i < PHCORR_NX * PHCORR_NY; i++) {
		phCorrection[i] = v;
	}
	phCorrectionLoaded = true;
}

float Calibration::getPulseHeightCorrection(float xlut, float ylut) const
{
	if(!phCorrectionLoaded) {
		throw CalibrationError("Pulse height correction grid not loaded");
	}
	if(isnan(xlut) || isnan(ylut)) return NAN;

	int xi = (int)floorf(xlut + 0.5f);
	int yi = (int)floorf(ylut + 0.5f);
	if(xi < 0) xi = 0;
	if(xi >= PHCORR_NX) xi = PHCORR_NX - 1;
	if(yi < 0) yi = 0;
	if(yi >= PHCORR_NY) yi = PHCORR_NY - 1;
	return phCorrection[xi * PHCORR_NY + yi];
}

void Calibration::setSpeciesBands(Branch b, const vector<SpeciesBand> & bands)
{
	speciesBands[b] = bands;
}

const vector<SpeciesBand> & Calibration::getSpeciesBands(Branch b) const
{
	return speciesBands[b];
}

void Calibration::setDefaultSpeciesBands()
{
	// Hydrogen band has exclusive edges, heavier bands start where it ends
	SpeciesBand h =  { SPECIES_H,  CTOF_SPECIES_MIN, CTOF_SPECIES_MAX, false, false, MASS_H };
	SpeciesBand he = { SPECIES_HE, CTOF_SPECIES_MAX, 2*CTOF_SPECIES_MAX, true, false, MASS_HE };
	SpeciesBand o =  { SPECIES_O,  2*CTOF_SPECIES_MAX, 4*CTOF_SPECIES_MAX, true, false, MASS_O };
	
	vector<SpeciesBand> bands;
	bands.push_back(h);
	bands.push_back(he);
	bands.push_back(o);
	for(int b = 0; b < N_BRANCHES; b++) {
		speciesBands[b] = bands;
	}
}

double Calibration::getSpeciesMass(Branch b, Species species) const
{
	for(size_t i = 0; i < speciesBands[b].size(); i++) {
		if(speciesBands[b][i].species == species)
			return speciesBands[b][i].mass;
	}
	return NAN;
}

void Calibration::loadParamsFile(const char *fileName)
{
	fprintf(stderr, "Calibration:: loading image parameters '%s' ... ", fileName); fflush(stderr);
	const boost::regex e("\\s*([A-Za-z_][A-Za-z0-9_]*)\\s+(\\S+)\\s*");
	LineReader reader(fileName);
	string line;
	int nLoaded = 0;
	while(reader.next(line)) {
		boost::smatch what;
		if(!boost::regex_match(line, what, e)) {
			badSyntax(fileName, reader.getLineNumber());
		}
		setImageParam(what[1], toDouble(what[2], fileName, reader.getLineNumber()));
		nLoaded++;
	}
	fprintf(stderr, "%d parameters\n", nLoaded);
}

void Calibration::loadTDCFile(const char *fileName)
{
	fprintf(stderr, "Calibration:: loading TDC normalisation '%s' ... ", fileName); fflush(stderr);
	const boost::regex e("\\s*(\\S+)\\s+(\\S+)\\s+(\\S+)\\s+(\\S+)\\s*");
	LineReader reader(fileName);
	string line;
	int nLoaded = 0;
	while(reader.next(line)) {
		boost::smatch what;
		if(!boost::regex_match(line, what, e)) {
			badSyntax(fileName, reader.getLineNumber());
		}
		Quadrant q = parseQuadrant(what[1]);
		TDCChannel c = parseTDCChannel(what[2]);
		float slope = toDouble(what[3], fileName, reader.getLineNumber());
		float offset = toDouble(what[4], fileName, reader.getLineNumber());
		setTDCNormalization(q, c, slope, offset);
		nLoaded++;
	}
	fprintf(stderr, "%d channels\n", nLoaded);
}

void Calibration::loadBackPositionFile(BackPositionTable t, const char *fileName)
{
	fprintf(stderr, "Calibration:: loading back position table %s from '%s'\n", getBackPositionTableName(t), fileName);
	backPosition[t].loadFile(fileName);
}

void Calibration::loadPHCorrectionFile(const char *fileName)
{
	fprintf(stderr, "Calibration:: loading pulse height correction '%s' ... ", fileName); fflush(stderr);
	const boost::regex e("\\s*([0-9]+)\\s+([0-9]+)\\s+(\\S+)\\s*");
	LineReader reader(fileName);
	string line;
	int nLoaded = 0;
	while(reader.next(line)) {
		boost::smatch what;
		if(!boost::regex_match(line, what, e)) {
			badSyntax(fileName, reader.getLineNumber());
		}
		int xi = (int)toDouble(what[1], fileName, reader.getLineNumber());
		int yi = (int)toDouble(what[2], fileName, reader.getLineNumber());
		setPulseHeightCorrection(xi, yi, toDouble(what[3], fileName, reader.getLineNumber()));
		nLoaded++;
	}
	fprintf(stderr, "%d cells\n", nLoaded);
}

void Calibration::loadSpeciesFile(Branch b, const char *fileName)
{
	fprintf(stderr, "Calibration:: loading %s species bands '%s' ... ", branchNames[b], fileName); fflush(stderr);
	// LABEL ( MIN MAX ] MASS
	const boost::regex e("\\s*(\\w+)\\s+([\\[\\(])\\s*(\\S+)\\s+(\\S+)\\s*([\\]\\)])\\s+(\\S+)\\s*");
	LineReader reader(fileName);
	string line;
	vector<SpeciesBand> bands;
	while(reader.next(line)) {
		boost::smatch what;
		if(!boost::regex_match(line, what, e)) {
			badSyntax(fileName, reader.getLineNumber());
		}
		SpeciesBand band;
		band.species = parseSpeciesLabel(string(what[1]).c_str());
		if(band.species == SPECIES_UNKNOWN) {
			throw CalibrationError("Unknown species '" + string(what[1]) + "' in '" + fileName + "'");
		}
		band.minInclusive = what[2] == "[";
		band.ctofMin = toDouble(what[3], fileName, reader.getLineNumber());
		band.ctofMax = toDouble(what[4], fileName, reader.getLineNumber());
		band.maxInclusive = what[5] == "]";
		band.mass = toDouble(what[6], fileName, reader.getLineNumber());
		bands.push_back(band);
	}
	fprintf(stderr, "%lu bands\n", (unsigned long)bands.size());
	setSpeciesBands(b, bands);
}

void Calibration::loadFiles(const char *setupFileName)
{
	fprintf(stderr, "Calibration:: loading setup '%s'\n", setupFileName);
	const boost::regex e("\\s*(\\w+)\\s+(\\S+)(\\s+(\\S+))?\\s*");
	LineReader reader(setupFileName);
	string line;
	while(reader.next(line)) {
		boost::smatch what;
		if(!boost::regex_match(line, what, e)) {
			badSyntax(setupFileName, reader.getLineNumber());
		}

		string kind = what[1];
		bool hasQualifier = what[4].matched;
		string fileName = resolveRelativePath(setupFileName, hasQualifier ? what[4] : what[2]);

		if(kind == "params" && !hasQualifier) {
			loadParamsFile(fileName.c_str());
		}
		else if(kind == "tdc" && !hasQualifier) {
			loadTDCFile(fileName.c_str());
		}
		else if(kind == "backpos" && hasQualifier) {
			loadBackPositionFile(parseBackPositionTable(what[2]), fileName.c_str());
		}
		else if(kind == "phcorr" && !hasQualifier) {
			loadPHCorrectionFile(fileName.c_str());
		}
		else if(kind == "species" && hasQualifier) {
			loadSpeciesFile(parseBranch(what[2]), fileName.c_str());
		}
		else {
			badSyntax(setupFileName, reader.getLineNumber());
		}
	}
}
