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

#include "Logging.hpp"

#include <type_traits>

#ifndef SEQUIN_LOGGING_DISABLE
	namespace
	{
		/**
		 * @brief Receiver of all log messages created in the libsequin library
		 */
		sequin::ILogReceiver* logReceiver = nullptr;
	}

	template <>
	sequin::LogLevel sequin::log::RuntimeFilteringLogger<sequin::log::GlobalLogger>::_minLvl = sequin::LogLevel::Warning;

	#ifdef __clang__
		template class sequin::log::RuntimeFilteringLogger<sequin::log::GlobalLogger>;
	#endif
#endif

namespace sequin
{

#ifdef SEQUIN_LOGGING_DISABLE

	void setLogReceiver(ILogReceiver* const recv) { }
	void setLogLevel(LogLevel lvl) { }
	LogLevel getLogLevel() { return LogLevel::None; }

#else

	namespace log
	{
		void emitLog(const char* file, const char* func, const unsigned int line, LogLevel lvl, const char* message)
		{
			if (logReceiver)
				logReceiver->message(file, func, line, lvl, to_string(lvl), message);
		}
	}

	void setLogReceiver(ILogReceiver* const recv)
	{
		logReceiver = recv;
	}

	void setLogLevel(LogLevel lvl)
	{
		sequin::log::RuntimeFilteringLogger<sequin::log::GlobalLogger>::level(lvl);
	}

	LogLevel getLogLevel()
	{
		return sequin::log::RuntimeFilteringLogger<sequin::log::GlobalLogger>::level();
	}

#endif

} // namespace sequin

extern "C"
{
	SEQUIN_API void sequinSetLogReceiver(sequin::ILogReceiver* const recv)
	{
		sequin::setLogReceiver(recv);
	}

	SEQUIN_API void sequinSetLogLevel(unsigned int lvl)
	{
		sequin::setLogLevel(static_cast<sequin::LogLevel>(lvl));
	}

	SEQUIN_API unsigned int sequinGetLogLevel()
	{
		return static_cast<typename std::underlying_type<sequin::LogLevel>::type>(sequin::getLogLevel());
	}
}
