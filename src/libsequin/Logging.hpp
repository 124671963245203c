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

/**
 * @file 
 * Adapter for transmitting the log messages of the library to a receiver.
 */

#ifndef LIBSEQUIN_LOGGING_IMPL_HPP_
#define LIBSEQUIN_LOGGING_IMPL_HPP_

#include "sequin/Logging.hpp"
#include "common/LoggerBase.hpp"

#ifndef SEQUIN_LOGLEVEL_MIN
	#define SEQUIN_LOGLEVEL_MIN Trace
#endif

namespace sequin
{
namespace log
{

	/**
	 * @brief Dispatches a log message to the installed receiver
	 * @param [in] file Filename in which the log message was raised
	 * @param [in] func Name of the function (implementation defined @c __func__ variable)
	 * @param [in] line Number of the line in which the log message was raised
	 * @param [in] lvl LogLevel representing the severity of the message
	 * @param [in] message Message string
	 */
	void emitLog(const char* file, const char* func, const unsigned int line, LogLevel lvl, const char* message);

	/**
	 * @brief Writes the bare message, position and level are passed to the receiver separately
	 */
	class LibSequinFormattingPolicy : public FormattingPolicyBase<LibSequinFormattingPolicy>
	{
	public:
		template <class writePolicy_t, class paramList_t>
		static inline void format(std::ostream& os, const char*, const char*, unsigned int, LogLevel, const paramList_t& p)
		{
			writeParams(os, p);
		}
	};

	class EmitterWritePolicy : public NonBufferedWritePolicyBase<EmitterWritePolicy>
	{
	public:
		static inline void writeLine(const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const std::string& msg)
		{
			emitLog(fileName, funcName, line, lvl, msg.c_str());
		}
	};

	typedef NonFilteringLogger<LibSequinFormattingPolicy, EmitterWritePolicy> GlobalLogger;

#ifndef SEQUIN_LOGGING_DISABLE
	typedef Logger<RuntimeFilteringLogger<GlobalLogger>, LogLevel::SEQUIN_LOGLEVEL_MIN> DoubleFilterLogger;

	#ifdef __clang__
		// Silence -Wundefined-var-template warning by indicating an 
		// explicit instantiation of this template in another translation unit
		template<> LogLevel RuntimeFilteringLogger<GlobalLogger>::_minLvl;
		extern template class RuntimeFilteringLogger<GlobalLogger>;
	#endif
#else
	typedef Logger<GlobalLogger, LogLevel::None> DiscardingLogger;
#endif

} // namespace log
} // namespace sequin

#ifndef SEQUIN_LOGGING_DISABLE

	/**
	 * @brief Logging macro of the library
	 * @details Note that because of the usage pattern
	 *          <pre>LOG(Info) << "My log line " << arg1;</pre>
	 *          no semicolon is appended.
	 */
	#define LOG(lvl) sequin::log::DoubleFilterLogger::statement(__FILE__, __func__, __LINE__) = sequin::log::DoubleFilterLogger::template createMessage<sequin::LogLevel::lvl>()

#else

	#define LOG(lvl) sequin::log::DiscardingLogger::statement(__FILE__, __func__, __LINE__) = sequin::log::DiscardingLogger::template createMessage<sequin::LogLevel::lvl>()

#endif

#endif  // LIBSEQUIN_LOGGING_IMPL_HPP_
