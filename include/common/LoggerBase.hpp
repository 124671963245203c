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
 * Logging mechanism that filters messages at compile time and at runtime.
 * 
 * The design follows templog, a logging library created by Hendrik Schober
 * distributed under the Boost Software License, Version 1.0 (see http://www.boost.org/LICENSE_1_0.txt).
 * Templog can be found at http://templog.sourceforge.net/ 
 * 
 * A log statement <tt>LOG(Info) << a << b</tt> is turned into a LogMessage that holds pointers to
 * its arguments. Messages below the compile-time level never store anything and are removed by
 * the optimizer. Messages that pass are formatted into a single line and handed to a write policy.
 */

#ifndef SEQUIN_LOGGERBASE_HPP_
#define SEQUIN_LOGGERBASE_HPP_

#include "common/CompilerSpecific.hpp"
#include "sequin/sequinCompilerInfo.hpp"

#include <vector>
#include <string>
#include <sstream>
#include <ostream>

namespace sequin
{

enum class LogLevel : unsigned int;
inline const char* to_string(LogLevel lvl) SEQUIN_NOEXCEPT;

namespace log
{

	namespace detail
	{
		/**
		 * @brief Terminates a parameter list
		 */
		struct NullType { };

		template <class head_t, class tail_t>
		struct NestedList
		{
			head_t left;
			tail_t right;

			NestedList(const head_t& l, const tail_t& r) SEQUIN_NOEXCEPT : left(l), right(r) { }
		};

		/**
		 * @brief Log message with its collected parameters
		 * @tparam lvl LogLevel of this message
		 * @tparam passOn Determines whether the message survives compile-time filtering
		 * @tparam params_t Parameters of the statement (nested type list)
		 */
		template <LogLevel lvl, bool passOn, class params_t>
		struct LogMessage
		{
			params_t params;

			LogMessage(const params_t& p = params_t()) SEQUIN_NOEXCEPT : params(p) { }
		};

		// Filtered messages drop every parameter
		template <LogLevel lvl, class paramList_t, class param_t>
		inline LogMessage<lvl, false, NullType> operator<<(const LogMessage<lvl, false, paramList_t>&, const param_t&) SEQUIN_NOEXCEPT
		{
			return LogMessage<lvl, false, NullType>();
		}

		// Forwarded messages keep a pointer to the parameter, which lives until the end of the full expression
		template <LogLevel lvl, class paramList_t, class param_t>
		inline LogMessage<lvl, true, NestedList<paramList_t, const param_t*>> operator<<(const LogMessage<lvl, true, paramList_t>& lm, const param_t& p) SEQUIN_NOEXCEPT
		{
			return LogMessage<lvl, true, NestedList<paramList_t, const param_t*>>(NestedList<paramList_t, const param_t*>(lm.params, &p));
		}

		/**
		 * @brief Positional information of a log statement
		 * @details Assigning a LogMessage hands the complete statement to @p logger_t.
		 * @tparam logger_t Logger to forward messages to
		 */
		template <class logger_t>
		struct LogStatement
		{
			const char* fileName;
			const char* funcName;
			unsigned int line;

			LogStatement(const char* fin, const char* fun, unsigned int ln) SEQUIN_NOEXCEPT : fileName(fin), funcName(fun), line(ln) { }

			template <LogLevel lvl, bool passOn, class params_t>
			inline void operator=(const LogMessage<lvl, passOn, params_t>& lm)
			{
				logger_t::forward(fileName, funcName, line, lm);
			}
		};

	} // namespace detail


	template <class T>
	inline std::ostream& operator<<(std::ostream& os, const std::vector<T>& v)
	{
		os << "[";
		for (std::size_t i = 0; i < v.size(); ++i)
		{
			if (i > 0)
				os << ",";
			os << v[i];
		}
		os << "]";
		return os;
	}


	/**
	 * @brief Logger that filters messages at compile time
	 * @details Loggers form a chain. The first logger in the chain creates the messages and decides
	 *          at compile time whether they are passed on to @p nextLogger_t, which has to provide
	 *          <pre>
	 *              template <LogLevel stmtLevel, class params_t>
	 *              static void forward(const char* fileName, const char* funcName, unsigned int line, const LogMessage<stmtLevel, true, params_t>& lm)
	 *          </pre>
	 * @tparam nextLogger_t Logger the surviving messages are passed on to
	 * @tparam lvl Least severe level that survives
	 */
	template <class nextLogger_t, LogLevel lvl>
	class Logger
	{
	public:
		typedef Logger<nextLogger_t, lvl> this_logger_t;
		typedef nextLogger_t forward_logger_t;

		static inline detail::LogStatement<this_logger_t> statement(const char* fileName, const char* funcName, unsigned int line)
		{
			return detail::LogStatement<this_logger_t>(fileName, funcName, line);
		}

		template <LogLevel stmtLevel>
		static inline detail::LogMessage<stmtLevel, (stmtLevel <= lvl), detail::NullType> createMessage()
		{
			return detail::LogMessage<stmtLevel, (stmtLevel <= lvl), detail::NullType>();
		}

		template <LogLevel stmtLevel, class params_t>
		static inline void forward(const char*, const char*, unsigned int, const detail::LogMessage<stmtLevel, false, params_t>&) { }

		template <LogLevel stmtLevel, class params_t>
		static inline void forward(const char* fileName, const char* funcName, unsigned int line, const detail::LogMessage<stmtLevel, true, params_t>& lm)
		{
			forward_logger_t::forward(fileName, funcName, line, lm);
		}
	};

	/**
	 * @brief Base of formatting policies
	 * @details Implementations provide
	 *          <pre>
	 *             template <class writePolicy_t, class paramList_t>
	 *             static void format(std::ostream& os, const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const paramList_t& p)
	 *          </pre>
	 *          and use writeParams() to write the message parameters. The formatted line is
	 *          passed on to the write policy as a whole.
	 * @tparam subFormattingPolicy_t Actual formatting policy implementation (CRTP)
	 */
	template <class subFormattingPolicy_t>
	class FormattingPolicyBase
	{
	public:

		template <class writePolicy_t, class paramList_t>
		static inline void formatMessage(const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const paramList_t& p)
		{
			std::ostringstream oss;
			subFormattingPolicy_t::template format<writePolicy_t>(oss, fileName, funcName, line, lvl, p);
			oss << "\n";
			writePolicy_t::writeLine(fileName, funcName, line, lvl, oss.str());
		}

	protected:

		// The first parameter of a statement is the innermost left leaf of the nested list
		template <class paramList_t, class T>
		static inline void writeParams(std::ostream& os, const detail::NestedList<paramList_t, T>& p)
		{
			writeParams(os, p.left);
			writeParams(os, p.right);
		}

		static inline void writeParams(std::ostream&, const detail::NullType&) { }

		template <class T>
		static inline void writeParams(std::ostream& os, const T* p)
		{
			os << *p;
		}
	};

	/**
	 * @brief Prefixes messages with level and position
	 */
	class StandardFormattingPolicy : public FormattingPolicyBase<StandardFormattingPolicy>
	{
	public:
		template <class writePolicy_t, class paramList_t>
		static inline void format(std::ostream& os, const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const paramList_t& p)
		{
			os << '[' << to_string(lvl) << ": " << fileName << "::" << funcName << "::" << line << "] ";
			writeParams(os, p);
		}
	};

	/**
	 * @brief Base of write policies that receive complete lines
	 * @details Implementations provide
	 *          <pre>
	 *              static void writeLine(const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const std::string& msg);
	 *          </pre>
	 *          The lines already contain a final newline character.
	 * @tparam subWritePolicy_t Actual write policy implementation (CRTP)
	 */
	template <class subWritePolicy_t>
	class NonBufferedWritePolicyBase
	{
	public:
		template <class formattingPolicy_t, class paramList_t>
		static inline void write(const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const paramList_t& p)
		{
			formattingPolicy_t::template formatMessage<subWritePolicy_t>(fileName, funcName, line, lvl, p);
		}
	};

	/**
	 * @brief Filters messages against a level that can be changed at runtime
	 */
	template <class forward_logger_t>
	class RuntimeFilteringLogger
	{
	public:
		template <LogLevel lvl, class params_t>
		static inline void forward(const char* fileName, const char* funcName, unsigned int line, const detail::LogMessage<lvl, true, params_t>& lm)
		{
			if (lvl <= _minLvl)
				forward_logger_t::forward(fileName, funcName, line, lm);
		}

		static inline LogLevel level() SEQUIN_NOEXCEPT { return _minLvl; }
		static inline void level(LogLevel newLvl) SEQUIN_NOEXCEPT { _minLvl = newLvl; }

	private:
		static LogLevel _minLvl;
	};

	/**
	 * @brief End of a logger chain, formats and writes every message it receives
	 */
	template <class formattingPolicy_t, class writePolicy_t>
	class NonFilteringLogger
	{
	public:
		template <LogLevel lvl, class params_t>
		static inline void forward(const char*, const char*, unsigned int, const detail::LogMessage<lvl, false, params_t>&) { }

		template <LogLevel lvl, class params_t>
		static inline void forward(const char* fileName, const char* funcName, unsigned int line, const detail::LogMessage<lvl, true, params_t>& lm)
		{
			writePolicy_t::template write<formattingPolicy_t>(fileName, funcName, line, lvl, lm.params);
		}
	};

} // namespace log
} // namespace sequin

/**
 * @brief Base for logging macros
 * @details Note that because of the usage pattern
 *          <pre>LOG_BASE(myLogger, Info) << "My log line " << arg1;</pre>
 *          no semicolon is appended.
 */
#define LOG_BASE(logger_t, lvl) logger_t::statement(__FILE__, __func__, __LINE__) = logger_t::template createMessage<sequin::LogLevel::lvl>()

#endif  // SEQUIN_LOGGERBASE_HPP_
