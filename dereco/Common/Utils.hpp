#ifndef __DERECO__COMMON__UTILS_HPP__DEFINED__
#define __DERECO__COMMON__UTILS_HPP__DEFINED__

#include <string>

namespace DERECO { namespace Common {

	// Calibration setup file named by the DERECO_CALIBRATION environment variable.
	// Throws CalibrationError if the variable is unset or does not name a file.
	std::string getCalibrationSetupFileName();

	// Resolves fileName against the directory holding referenceFileName,
	// unless fileName is already absolute.
	std::string resolveRelativePath(const std::string & referenceFileName, const std::string & fileName);

}}
#endif
