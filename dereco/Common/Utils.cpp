#include "Utils.hpp"
#include "Exception.hpp"
#include <stdio.h>
#include <stdlib.h>

#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>
using namespace boost::filesystem;

std::string DERECO::Common::getCalibrationSetupFileName()
{
	char *name = getenv("DERECO_CALIBRATION");
	if(name == NULL) {
		throw CalibrationError("DERECO_CALIBRATION environment variable is not set");
	}
	
	path p(name);
	if(!is_regular_file(p)) {
		throw CalibrationError(std::string(name) + " does not exist or is not a file");
	}
	
	return std::string(name);
}

std::string DERECO::Common::resolveRelativePath(const std::string & referenceFileName, const std::string & fileName)
{
	path p(fileName);
	if(p.is_absolute())
		return fileName;
	
	return (path(referenceFileName).parent_path() / p).string();
}
