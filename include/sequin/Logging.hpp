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
 * Provides logging functionality.
 */

#ifndef LIBSEQUIN_LOGGING_HPP_
#define LIBSEQUIN_LOGGING_HPP_

#include "sequin/LibExportImport.hpp"
#include "sequin/sequinCompilerInfo.hpp"

#include <string>

namespace sequin
{
	/**
	 * @brief LogLevel represents the severity of log messages
	 * @details The levels are nested, such that the highest level (Trace) includes all lower levels.
	 *          Initialization summaries are emitted on Info, non-optimal solver terminations on Warning,
	 *          and solver iterations on Debug.
	 */
	enum class LogLevel : unsigned int
	{
		None = 0, //!< Nothing is logged
		Fatal = 1, //!< Non-recoverable error
		Error = 2, //!< Error, which may be recoverable
		Warning = 3, //!< Warning, e.g., non-optimal solver termination
		Normal = 4, //!< Normal output (informative)
		Info = 5, //!< Additional info output
		Debug = 6, //!< Debug messages and values of (intermediate) variables or calculations
		Trace = 7, //!< Full trace including entering / leaving functions
	};

	/**
	 * @brief Converts a LogLevel to a string
	 * @param [in] lvl LogLevel to be converted
	 * @return String representation of the LogLevel
	 */
	inline const char* to_string(LogLevel lvl) SEQUIN_NOEXCEPT
	{
		switch (lvl)
		{
			case LogLevel::None:
				return "None";
			case LogLevel::Fatal:
				return "Fatal";
			case LogLevel::Error:
				return "Error";
			case LogLevel::Warning:
				return "Warning";
			case LogLevel::Normal:
				return "Normal";
			case LogLevel::Info:
				return "Info";
			case LogLevel::Debug:
				return "Debug";
			case LogLevel::Trace:
				return "Trace";
		}
		return "Unknown";
	}

	/**
	 * @brief Converts a string to a LogLevel
	 * @details Accepts the names returned by to_string() as well as the numeric
	 *          values @c 0 to @c 7. Unknown strings map to LogLevel::None.
	 * @param [in] ll LogLevel as string
	 * @return LogLevel corresponding to the given string
	 */
	inline LogLevel to_loglevel(const std::string& ll) SEQUIN_NOEXCEPT
	{
		if ((ll.size() == 1) && (ll[0] >= '0') && (ll[0] <= '7'))
			return static_cast<LogLevel>(ll[0] - '0');

		const char* const names[] = { "None", "Fatal", "Error", "Warning", "Normal", "Info", "Debug", "Trace" };
		for (unsigned int i = 0; i < 8; ++i)
		{
			if (ll == names[i])
				return static_cast<LogLevel>(i);
		}

		return LogLevel::None;
	}

	/**
	 * @brief Interface for receiving log messages
	 */
	class SEQUIN_API ILogReceiver
	{
	public:
		virtual ~ILogReceiver() SEQUIN_NOEXCEPT { }

		/**
		 * @brief Receives a log message
		 * @param [in] file Filename in which the log message was raised
		 * @param [in] func Name of the function (implementation defined @c __func__ variable)
		 * @param [in] line Number of the line in which the log message was raised
		 * @param [in] lvl LogLevel representing the severity of the message
		 * @param [in] lvlStr String representation of the log level
		 * @param [in] message Message string
		 */
		virtual void message(const char* file, const char* func, const unsigned int line, LogLevel lvl, const char* lvlStr, const char* message) = 0;
	};

	/**
	 * @brief Sets the log receiver replacing any previously set receiver
	 * @details Messages are dropped while no receiver is installed.
	 * @param [in] recv Pointer to ILogReceiver implementation or @c nullptr
	 */
	SEQUIN_API void setLogReceiver(ILogReceiver* const recv);

	/**
	 * @brief Sets the runtime log level
	 * @details Messages of a less severe level are filtered out.
	 * @param [in] lvl New log level
	 */
	SEQUIN_API void setLogLevel(LogLevel lvl);

	/**
	 * @brief Returns the current runtime log level
	 * @return Current log level
	 */
	SEQUIN_API LogLevel getLogLevel();

} // namespace sequin

#endif  // LIBSEQUIN_LOGGING_HPP_
