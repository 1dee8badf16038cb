// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_COMMON_CONFIG_H_
#define CUSTODY_SRC_COMMON_CONFIG_H_

#include "logging.hpp"

#include <istream>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace custody::config {
    /// Value of a parsed configuration key.
    using value_t = std::variant<std::string, uint64_t>;

    /// Reads and parses a configuration file made of key=value lines.
    /// Values in double quotes are strings, bare digits are unsigned
    /// integers. Empty lines and lines starting with '#' are ignored.
    class parser {
      public:
        /// Constructor. Parses the file at the given path.
        /// \param filename path to the configuration file.
        explicit parser(const std::string& filename);

        /// Constructor. Parses configuration from the given stream.
        /// \param stream input stream containing configuration lines.
        explicit parser(std::istream& stream);

        /// Returns the string value for the given key.
        /// \param key configuration key.
        /// \return value or std::nullopt if the key is missing or not a
        ///         string.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Returns the unsigned integer value for the given key.
        /// \param key configuration key.
        /// \return value or std::nullopt if the key is missing or not an
        ///         integer.
        [[nodiscard]] auto get_ulong(const std::string& key) const
            -> std::optional<uint64_t>;

        /// Returns the log level for the given key.
        /// \param key configuration key.
        /// \return level or std::nullopt if missing or not a level name.
        [[nodiscard]] auto get_loglevel(const std::string& key) const
            -> std::optional<logging::log_level>;

        /// Returns the string value for the key, or the given default.
        [[nodiscard]] auto get_string_or(const std::string& key,
                                         const std::string& def) const
            -> std::string;

        /// Returns the integer value for the key, or the given default.
        [[nodiscard]] auto get_ulong_or(const std::string& key,
                                        uint64_t def) const -> uint64_t;

        /// Returns false if any line of the input failed to parse.
        [[nodiscard]] auto valid() const -> bool;

      private:
        std::map<std::string, value_t> m_values;
        bool m_valid{true};

        void init(std::istream& stream);
        static auto parse_value(const std::string& raw)
            -> std::optional<value_t>;
    };
}

#endif
