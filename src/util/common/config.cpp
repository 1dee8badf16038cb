// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace custody::config {
    namespace {
        auto trim(const std::string& s) -> std::string {
            const auto* ws = " \t\r";
            auto start = s.find_first_not_of(ws);
            if(start == std::string::npos) {
                return {};
            }
            auto end = s.find_last_not_of(ws);
            return s.substr(start, end - start + 1);
        }
    }

    parser::parser(const std::string& filename) {
        auto file = std::ifstream(filename);
        if(!file.good()) {
            m_valid = false;
            return;
        }
        init(file);
    }

    parser::parser(std::istream& stream) {
        init(stream);
    }

    void parser::init(std::istream& stream) {
        auto line = std::string();
        while(std::getline(stream, line)) {
            line = trim(line);
            if(line.empty() || line[0] == '#') {
                continue;
            }
            auto eq = line.find('=');
            if(eq == std::string::npos || eq == 0) {
                m_valid = false;
                continue;
            }
            auto key = trim(line.substr(0, eq));
            auto val = parse_value(trim(line.substr(eq + 1)));
            if(!val.has_value()) {
                m_valid = false;
                continue;
            }
            m_values[key] = std::move(val.value());
        }
    }

    auto parser::parse_value(const std::string& raw)
        -> std::optional<value_t> {
        if(raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
            return raw.substr(1, raw.size() - 2);
        }
        if(raw.empty()
           || !std::all_of(raw.begin(), raw.end(), [](unsigned char c) {
                  return std::isdigit(c) != 0;
              })) {
            return std::nullopt;
        }
        try {
            return static_cast<uint64_t>(std::stoull(raw));
        } catch(const std::out_of_range&) {
            return std::nullopt;
        }
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        auto it = m_values.find(key);
        if(it == m_values.end()
           || !std::holds_alternative<std::string>(it->second)) {
            return std::nullopt;
        }
        return std::get<std::string>(it->second);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<uint64_t> {
        auto it = m_values.find(key);
        if(it == m_values.end()
           || !std::holds_alternative<uint64_t>(it->second)) {
            return std::nullopt;
        }
        return std::get<uint64_t>(it->second);
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        auto str = get_string(key);
        if(!str.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(str.value());
    }

    auto parser::get_string_or(const std::string& key,
                               const std::string& def) const -> std::string {
        return get_string(key).value_or(def);
    }

    auto parser::get_ulong_or(const std::string& key, uint64_t def) const
        -> uint64_t {
        return get_ulong(key).value_or(def);
    }

    auto parser::valid() const -> bool {
        return m_valid;
    }
}
