#ifndef __DERECO__COMMON__EXCEPTION_HPP__DEFINED__
#define __DERECO__COMMON__EXCEPTION_HPP__DEFINED__

#include <exception>
#include <string>

namespace DERECO { namespace Common {

	// Base for every error raised by the engine.
	// Any Exception aborts the batch being reconstructed.
	class Exception : public std::exception {
	public:
		Exception();
		virtual ~Exception() throw() {};
		virtual Exception * clone() = 0;
		virtual void rethrow() = 0;
		// Category name followed by the details
		virtual std::string getErrorString();
		virtual const char * getCategory() { return "error"; };
		virtual int getErrorCode() { return 0; };
	};

	// Holds a copy of an Exception so it can cross a thread boundary
	class ExceptionCarrier : public Exception {
	public:
		ExceptionCarrier(Exception & e);
		ExceptionCarrier(const ExceptionCarrier & e);
		virtual ~ExceptionCarrier() throw();
		ExceptionCarrier * clone();
		void rethrow();
		std::string getErrorString();
		const char * getCategory();
		int getErrorCode();
		const char * what() const throw();
	private:
		Exception * exception;
	};

	// Exception carrying a formatted message
	class MessageException : public Exception {
	public:
		MessageException(const std::string & message);
		virtual ~MessageException() throw() {};
		const char * what() const throw();
	protected:
		std::string message;
	};

	// Missing or inconsistent input fields, mismatched stage outputs
	class StructuralError : public MessageException {
	public:
		StructuralError(const std::string & message) : MessageException(message) {};
		StructuralError * clone() { return new StructuralError(*this); };
		const char * getCategory() { return "structural error"; };
		void rethrow() { throw *this; };
		int getErrorCode() { return 1; };
	};

	// Unknown parameter, channel, table or field in the calibration data
	class CalibrationError : public MessageException {
	public:
		CalibrationError(const std::string & message) : MessageException(message) {};
		CalibrationError * clone() { return new CalibrationError(*this); };
		const char * getCategory() { return "calibration error"; };
		void rethrow() { throw *this; };
		int getErrorCode() { return 2; };
	};

	// Geometry service has no coverage for a requested time or frame
	class GeometryCoverageError : public MessageException {
	public:
		GeometryCoverageError(const std::string & message) : MessageException(message) {};
		GeometryCoverageError * clone() { return new GeometryCoverageError(*this); };
		const char * getCategory() { return "geometry coverage error"; };
		void rethrow() { throw *this; };
		int getErrorCode() { return 4; };
	};

	class OSError : public Exception {
	public:
		OSError(int err);
		OSError(int err, const std::string & fileName);
		virtual ~OSError() throw() {};
		OSError * clone() { return new OSError(*this); };
		void rethrow() { throw *this; };
		const char * getCategory() { return "system error"; };
		const char * what() const throw();
		std::string getErrorString();
		int getErrorCode() { return errorCode; };
	private:
		int errorCode;
		std::string fileName;
	};

}}
#endif
