#include "Exception.hpp"
#include <stdio.h>
#include <string.h>

using namespace DERECO::Common;

Exception::Exception()
{
}

std::string Exception::getErrorString()
{
	return std::string(getCategory()) + ": " + what();
}

ExceptionCarrier::ExceptionCarrier(Exception & e)
	: Exception(), exception(e.clone())
{
}

ExceptionCarrier::ExceptionCarrier(const ExceptionCarrier & e)
	: Exception(), exception(e.exception->clone())
{
}

ExceptionCarrier::~ExceptionCarrier() throw()
{
	delete exception;
}

ExceptionCarrier * ExceptionCarrier::clone()
{
	return new ExceptionCarrier(*this);
}

// Throws the carried exception with its original type
void ExceptionCarrier::rethrow()
{
	exception->rethrow();
}

std::string ExceptionCarrier::getErrorString()
{
	return exception->getErrorString();
}

const char * ExceptionCarrier::getCategory()
{
	return exception->getCategory();
}

int ExceptionCarrier::getErrorCode()
{
	return exception->getErrorCode();
}

const char * ExceptionCarrier::what() const throw()
{
	return exception->what();
}

MessageException::MessageException(const std::string & message)
	: message(message)
{
}

const char * MessageException::what() const throw()
{
	return message.c_str();
}

OSError::OSError(int err)
	: errorCode(err)
{
}

OSError::OSError(int err, const std::string & fileName)
	: errorCode(err), fileName(fileName)
{
}

const char * OSError::what() const throw()
{
	return strerror(errorCode);
}

std::string OSError::getErrorString()
{
	char buffer[4096];
	if(fileName.empty())
		snprintf(buffer, sizeof(buffer), "%s: %s (errno %d)", getCategory(), what(), errorCode);
	else
		snprintf(buffer, sizeof(buffer), "%s: '%s': %s (errno %d)", getCategory(), fileName.c_str(), what(), errorCode);
	return std::string(buffer);
}
