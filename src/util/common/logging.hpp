// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_COMMON_LOGGING_H_
#define CUSTODY_SRC_COMMON_LOGGING_H_

#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace custody::logging {
    /// Available log levels, in increasing order of severity.
    enum class log_level {
        /// Fine-grained, per-operation tracing.
        trace,
        /// Diagnostic information.
        debug,
        /// Normal operational messages.
        info,
        /// Recoverable problems.
        warn,
        /// Operation failures.
        error,
        /// Unrecoverable errors.
        fatal
    };

    /// Parses a log level name such as "INFO" or "trace".
    /// \param level name of the level, case-insensitive.
    /// \return log level or std::nullopt if the name is unknown.
    auto parse_loglevel(const std::string& level) -> std::optional<log_level>;

    /// Thread-safe levelled logger. Each statement is written on one line
    /// with a timestamp and a level tag, and each argument separated by a
    /// space.
    class log {
      public:
        /// Constructor.
        /// \param level minimum level of statements to emit.
        /// \param use_stdout true to write to stdout.
        /// \param logfile optional additional output stream.
        explicit log(log_level level,
                     bool use_stdout = true,
                     std::unique_ptr<std::ostream> logfile = nullptr);

        template<typename... Targs>
        void trace(Targs&&... args) {
            write_log_statement(log_level::trace,
                                "[TRACE]",
                                std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void debug(Targs&&... args) {
            write_log_statement(log_level::debug,
                                "[DEBUG]",
                                std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void info(Targs&&... args) {
            write_log_statement(log_level::info,
                                "[INFO ]",
                                std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void warn(Targs&&... args) {
            write_log_statement(log_level::warn,
                                "[WARN ]",
                                std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void error(Targs&&... args) {
            write_log_statement(log_level::error,
                                "[ERROR]",
                                std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void fatal(Targs&&... args) {
            write_log_statement(log_level::fatal,
                                "[FATAL]",
                                std::forward<Targs>(args)...);
            std::exit(EXIT_FAILURE);
        }

        /// Sets the minimum level of statements to emit.
        /// \param level new minimum level.
        void set_loglevel(log_level level);

      private:
        bool m_stdout;
        std::unique_ptr<std::ostream> m_logfile;
        std::mutex m_stream_mut;
        log_level m_loglevel;

        static auto timestamp() -> std::string;

        template<typename... Targs>
        void write_log_statement(log_level level,
                                 const char* prefix,
                                 Targs&&... args) {
            if(level < m_loglevel) {
                return;
            }
            auto ss = std::stringstream();
            ss << "[" << timestamp() << "] " << prefix;
            ((ss << " " << args), ...);
            ss << std::endl;
            auto line = ss.str();

            std::unique_lock<std::mutex> l(m_stream_mut);
            if(m_stdout) {
                std::cout << line << std::flush;
            }
            if(m_logfile) {
                *m_logfile << line << std::flush;
            }
        }
    };
}

#endif
