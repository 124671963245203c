// =============================================================================
//  SEQUIN
//  
//  Copyright © 2008-present: The SEQUIN Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

#define CATCH_CONFIG_RUNNER
#include <catch.hpp>

#include "sequin/Logging.hpp"

#include <iostream>
#include <string>

namespace
{
	class LogReceiver : public sequin::ILogReceiver
	{
	public:
		LogReceiver() { }

		virtual void message(const char* file, const char* func, const unsigned int line, sequin::LogLevel lvl, const char* lvlStr, const char* message)
		{
			std::cout << '[' << lvlStr << ": " << func << "::" << line << "] " << message << std::flush;
		}
	};
}

int main(int argc, char* argv[])
{
	std::string logLevel = "None";

	Catch::Session session;

	// Add command line option for the log level to CATCH's argument parser
	session.cli(session.cli() | Catch::clara::Opt( logLevel, "level" )["--loglevel"]("log level of the SEQUIN library (None, ..., Trace)"));

	// Parse the command line and check for error
	const int returnCode = session.applyCommandLine(argc, argv);
	if (returnCode != 0)
		return returnCode;

	LogReceiver lr;
	const sequin::LogLevel lvl = sequin::to_loglevel(logLevel);
	if (lvl != sequin::LogLevel::None)
	{
		sequin::setLogReceiver(&lr);
		sequin::setLogLevel(lvl);
	}

	// Run tests
	const int result = session.run();

	sequin::setLogReceiver(nullptr);
	return result;
}
