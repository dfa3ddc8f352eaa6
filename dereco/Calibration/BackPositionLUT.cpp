#include "BackPositionLUT.hpp"
#include <Common/Exception.hpp>
#include <stdio.h>
#include <errno.h>
#include <math.h>
#include <string.h>

using namespace DERECO::Common;
using namespace DERECO::Calibration;

BackPositionLUT::BackPositionLUT()
{
	for(int i = 0; i < nEntries; i++) {
		table[i] = 0;
	}
	loaded = false;
}

BackPositionLUT::~BackPositionLUT()
{
}

void BackPositionLUT::set(int index, float position)
{
	if(index < 0) index = 0;
	if(index >= nEntries) index = nEntries - 1;
	table[index] = position;
	loaded = true;
}

void BackPositionLUT::setLinear(float scale, float offset)
{
	for(int i = 0; i < nEntries; i++) {
		table[i] = scale * (i - BACKPOS_LUT_CENTER) + offset;
	}
	loaded = true;
}

float BackPositionLUT::get(float index) const
{
	if(isnan(index)) return NAN;
	if(index < 0) return table[0];
	if(index >= nEntries) return table[nEntries - 1];
	return table[(int)index];
}

void BackPositionLUT::loadFile(const char *fileName)
{
	FILE *f = fopen(fileName, "r");
	if(f == NULL) {
		throw OSError(errno, fileName);
	}

	char line[1024];
	int lineNumber = 0;
	int nLoaded = 0;
	while(fgets(line, sizeof(line), f) != NULL) {
		lineNumber += 1;
		if(line[0] == '#' || line[strspn(line, " \t\r\n")] == 0) continue;

		int index;
		float position;
		if(sscanf(line, "%d %f", &index, &position) != 2 || index < 0 || index >= nEntries) {
			fclose(f);
			char message[1200];
			snprintf(message, sizeof(message), "Bad back position entry in '%s' (line %d)", fileName, lineNumber);
			throw CalibrationError(message);
		}
		table[index] = position;
		nLoaded++;
	}
	fclose(f);

	if(nLoaded != nEntries) {
		char message[1200];
		snprintf(message, sizeof(message), "'%s' holds %d of %d back position entries", fileName, nLoaded, nEntries);
		throw CalibrationError(message);
	}
	loaded = true;
}
