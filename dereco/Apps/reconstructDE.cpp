#include <TFile.h>
#include <TTree.h>
#include <Common/Constants.hpp>
#include <Common/Exception.hpp>
#include <Common/Utils.hpp>
#include <Calibration/Calibration.hpp>
#include <Geometry/SpinningPointingGeometry.hpp>
#include <Core/RawEventBatch.hpp>
#include <Core/DirectEventTable.hpp>
#include <Core/FieldCatalog.hpp>
#include <Core/Reconstructor.hpp>
#include <boost/lexical_cast.hpp>
#include <stdio.h>
#include <string.h>
#include <getopt.h>
#include <string>

using namespace DERECO;
using namespace DERECO::Common;
using namespace DERECO::Core;
using namespace std;

static Long64_t		rawEpoch;
static Double_t		rawMet;
static Double_t		rawEventTime;
static Long64_t		rawStartType;
static Int_t		rawStopType;
static Int_t		rawCoinType;
static Int_t		rawStartPosTdc;
static Int_t		rawStopNorthTdc;
static Int_t		rawStopEastTdc;
static Int_t		rawStopSouthTdc;
static Int_t		rawStopWestTdc;
static Int_t		rawCoinNorthTdc;
static Int_t		rawCoinSouthTdc;
static Int_t		rawCoinDiscreteTdc;
static Int_t		rawEnergyPh;
static UChar_t		rawSSDFlag[N_SSD];

// One slot per catalogued field, only the member matching its type is used
static Long64_t		outLong[N_FIELDS];
static Int_t		outInt[N_FIELDS];
static Short_t		outShort[N_FIELDS];
static Float_t		outFloat[N_FIELDS][3];
static Double_t		outDouble[N_FIELDS];
static Char_t		outSpecies[16];

static void attachBranch(TTree *tree, const char *name, void *address)
{
	if(tree->GetBranch(name) == NULL) {
		throw StructuralError(string("raw field ") + name + " missing from input");
	}
	tree->SetBranchAddress(name, address);
}

static void readRawEvents(TTree *tree, RawEventBatch &batch)
{
	attachBranch(tree, "epoch", &rawEpoch);
	attachBranch(tree, "SHCOARSE", &rawMet);
	attachBranch(tree, "EVENTTIMES", &rawEventTime);
	attachBranch(tree, "START_TYPE", &rawStartType);
	attachBranch(tree, "STOP_TYPE", &rawStopType);
	attachBranch(tree, "COIN_TYPE", &rawCoinType);
	attachBranch(tree, "START_POS_TDC", &rawStartPosTdc);
	attachBranch(tree, "STOP_NORTH_TDC", &rawStopNorthTdc);
	attachBranch(tree, "STOP_EAST_TDC", &rawStopEastTdc);
	attachBranch(tree, "STOP_SOUTH_TDC", &rawStopSouthTdc);
	attachBranch(tree, "STOP_WEST_TDC", &rawStopWestTdc);
	attachBranch(tree, "COIN_NORTH_TDC", &rawCoinNorthTdc);
	attachBranch(tree, "COIN_SOUTH_TDC", &rawCoinSouthTdc);
	attachBranch(tree, "COIN_DISCRETE_TDC", &rawCoinDiscreteTdc);
	attachBranch(tree, "ENERGY_PH", &rawEnergyPh);
	for(int i = 0; i < N_SSD; i++) {
		char name[32];
		sprintf(name, "SSD_FLAG_%d", i);
		attachBranch(tree, name, &rawSSDFlag[i]);
	}

	Long64_t nEntries = tree->GetEntries();
	batch.reserve(nEntries);
	for(Long64_t n = 0; n < nEntries; n++) {
		tree->GetEntry(n);
		RawEvent e;
		e.epoch = rawEpoch;
		e.met = rawMet;
		e.eventTime = rawEventTime;
		e.startType = rawStartType;
		e.stopType = rawStopType;
		e.coinType = rawCoinType;
		e.startPosTdc = rawStartPosTdc;
		e.stopNorthTdc = rawStopNorthTdc;
		e.stopEastTdc = rawStopEastTdc;
		e.stopSouthTdc = rawStopSouthTdc;
		e.stopWestTdc = rawStopWestTdc;
		e.coinNorthTdc = rawCoinNorthTdc;
		e.coinSouthTdc = rawCoinSouthTdc;
		e.coinDiscreteTdc = rawCoinDiscreteTdc;
		e.energyPh = rawEnergyPh;
		e.ssdFlags = 0;
		for(int i = 0; i < N_SSD; i++) {
			if(rawSSDFlag[i] != 0) e.ssdFlags |= (1 << i);
		}
		batch.push(e);
	}
}

static void createBranches(TTree *tree)
{
	for(int i = 0; i < FieldCatalog::getNFields(); i++) {
		const FieldAttributes &field = FieldCatalog::getField((FieldID)i);
		char leafList[128];
		const char *dimension = field.nComponents > 1 ? "[3]" : "";
		switch(field.type) {
			case TYPE_INT64:
				sprintf(leafList, "%s/L", field.name);
				tree->Branch(field.name, &outLong[i], leafList);
				break;
			case TYPE_INT32:
				sprintf(leafList, "%s/I", field.name);
				tree->Branch(field.name, &outInt[i], leafList);
				break;
			case TYPE_INT16:
				sprintf(leafList, "%s/S", field.name);
				tree->Branch(field.name, &outShort[i], leafList);
				break;
			case TYPE_FLOAT32:
				sprintf(leafList, "%s%s/F", field.name, dimension);
				tree->Branch(field.name, outFloat[i], leafList);
				break;
			case TYPE_FLOAT64:
				sprintf(leafList, "%s/D", field.name);
				tree->Branch(field.name, &outDouble[i], leafList);
				break;
			case TYPE_STRING:
				sprintf(leafList, "%s/C", field.name);
				tree->Branch(field.name, outSpecies, leafList);
				break;
		}
	}
}

static void writeDirectEvents(TTree *tree, const DirectEventTable *table)
{
	for(size_t n = 0; n < table->getSize(); n++) {
		const DirectEvent &e = table->get(n);
		for(int i = 0; i < FieldCatalog::getNFields(); i++) {
			const FieldAttributes &field = FieldCatalog::getField((FieldID)i);
			double v = DirectEventTable::getValue(e, field.id);
			switch(field.type) {
				case TYPE_INT64:
					// Through the event itself, doubles cannot hold every 64 bit code
					outLong[i] = field.id == FIELD_EPOCH ? e.raw.epoch : e.raw.startType;
					break;
				case TYPE_INT32:
					outInt[i] = (Int_t)v;
					break;
				case TYPE_INT16:
					outShort[i] = (Short_t)v;
					break;
				case TYPE_FLOAT32:
					for(int c = 0; c < field.nComponents; c++)
						outFloat[i][c] = DirectEventTable::getValue(e, field.id, c);
					break;
				case TYPE_FLOAT64:
					outDouble[i] = v;
					break;
				case TYPE_STRING:
					strncpy(outSpecies, getSpeciesLabel(e.species), sizeof(outSpecies) - 1);
					outSpecies[sizeof(outSpecies) - 1] = 0;
					break;
			}
		}
		tree->Fill();
	}
}

void displayHelp(char * program)
{
	fprintf(stderr, "usage: %s [setup_file] raw_file output_file --geometry=FILE\n", program);
	fprintf(stderr, "\noptional arguments:\n");
	fprintf(stderr,  "  --help \t\t\t Show this help message and exit \n");
	fprintf(stderr,  "  --sensor=SENSOR\t\t Sensor head which produced the data: 45 (default) or 90\n");
	fprintf(stderr,  "  --geometry=FILE\t\t Spacecraft geometry file (required)\n");
	fprintf(stderr,  "  --single-thread\t\t Run every pipeline stage on one worker\n");
	fprintf(stderr, "\npositional arguments:\n");
	fprintf(stderr, "  setup_file \t\t\t Calibration setup file (default: $DERECO_CALIBRATION)\n");
	fprintf(stderr, "  raw_file \t\t\t ROOT file holding the decommutated events in tree 'raw'\n");
	fprintf(stderr, "  output_file \t\t\t ROOT file to write, direct events in tree 'de'\n");
};

void displayUsage(char * program)
{
	fprintf(stderr, "usage: %s [setup_file] raw_file output_file --geometry=FILE\n", program);
};

int main(int argc, char *argv[])
{
	static struct option longOptions[] = {
		{ "help", no_argument, 0, 0 },
		{ "sensor", required_argument, 0, 0 },
		{ "geometry", required_argument, 0, 0 },
		{ "single-thread", no_argument, 0, 0 },
		{ NULL, 0, 0, 0 }
	};

	Sensor sensor = SENSOR_45;
	char *geometryFileName = NULL;
	bool singleThread = false;

	while(1) {
		int optionIndex = 0;
		int c = getopt_long(argc, argv, "", longOptions, &optionIndex);
		if(c == -1) break;

		if(c != 0) {
			displayUsage(argv[0]);
			fprintf(stderr, "\n%s: error: Unknown option!\n", argv[0]);
			return(1);
		}
		if(optionIndex == 0) {
			displayHelp(argv[0]);
			return(1);
		}
		else if(optionIndex == 1) {
			int s = 0;
			try {
				s = boost::lexical_cast<int>(optarg);
			}
			catch(boost::bad_lexical_cast &) {
				s = 0;
			}
			if(s != SENSOR_45 && s != SENSOR_90) {
				fprintf(stderr, "\n%s: error: Sensor '%s' not valid! Please choose 45 or 90\n", argv[0], optarg);
				return(1);
			}
			sensor = (Sensor)s;
		}
		else if(optionIndex == 2) {
			geometryFileName = optarg;
		}
		else if(optionIndex == 3) {
			singleThread = true;
		}
	}

	int nPositional = argc - optind;
	if(nPositional < 2) {
		displayUsage(argv[0]);
		fprintf(stderr, "\n%s: error: too few positional arguments!\n", argv[0]);
		return(1);
	}
	else if(nPositional > 3) {
		displayUsage(argv[0]);
		fprintf(stderr, "\n%s: error: too many positional arguments!\n", argv[0]);
		return(1);
	}
	if(geometryFileName == NULL) {
		displayUsage(argv[0]);
		fprintf(stderr, "\n%s: error: --geometry is required!\n", argv[0]);
		return(1);
	}

	try {
		string setupFileName = nPositional == 3 ? argv[optind] : getCalibrationSetupFileName();
		char *inputFileName = argv[argc - 2];
		char *outputFileName = argv[argc - 1];

		DERECO::Calibration::Calibration *calibration = new DERECO::Calibration::Calibration();
		calibration->loadFiles(setupFileName.c_str());

		DERECO::Geometry::SpinningPointingGeometry *geometry = new DERECO::Geometry::SpinningPointingGeometry();
		geometry->loadFile(geometryFileName);

		TFile *inputFile = new TFile(inputFileName, "READ");
		if(inputFile->IsZombie()) {
			fprintf(stderr, "\n%s: error: could not open '%s'\n", argv[0], inputFileName);
			return(1);
		}
		TTree *rawTree = (TTree *)inputFile->Get("raw");
		if(rawTree == NULL) {
			fprintf(stderr, "\n%s: error: no tree 'raw' in '%s'\n", argv[0], inputFileName);
			return(1);
		}

		RawEventBatch batch;
		readRawEvents(rawTree, batch);
		inputFile->Close();
		delete inputFile;

		Reconstructor reconstructor(calibration, geometry, sensor, singleThread);
		reconstructor.setVerbose(true);
		DirectEventTable *table = reconstructor.reconstruct(batch);

		TFile *outputFile = new TFile(outputFileName, "RECREATE");
		TTree *deTree = new TTree("de", "Direct Events");
		createBranches(deTree);
		writeDirectEvents(deTree, table);
		outputFile->Write();
		outputFile->Close();
		delete outputFile;

		fprintf(stderr, "Wrote %lu direct events to '%s'\n", (unsigned long)table->getSize(), outputFileName);

		delete table;
		delete geometry;
		delete calibration;
	}
	catch(Exception & e) {
		fprintf(stderr, "\n%s: %s\n", argv[0], e.getErrorString().c_str());
		return(1);
	}

	return 0;
}
