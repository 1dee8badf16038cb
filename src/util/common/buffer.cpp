// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "buffer.hpp"

#include <iomanip>
#include <sstream>

namespace custody {
    void buffer::clear() {
        m_data.clear();
    }

    auto buffer::size() const -> size_t {
        return m_data.size();
    }

    auto buffer::data() -> void* {
        return m_data.data();
    }

    auto buffer::data() const -> const void* {
        return m_data.data();
    }

    auto buffer::c_ptr() -> unsigned char* {
        return m_data.data();
    }

    auto buffer::c_ptr() const -> const unsigned char* {
        return m_data.data();
    }

    void buffer::append(const void* data, size_t len) {
        if(len == 0) {
            return;
        }
        const auto* start = static_cast<const unsigned char*>(data);
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        m_data.insert(m_data.end(), start, start + len);
    }

    void buffer::extend(size_t len) {
        m_data.resize(m_data.size() + len, 0);
    }

    auto buffer::to_hex() const -> std::string {
        auto ss = std::stringstream();
        ss << std::hex << std::setfill('0');
        for(const auto& byte : m_data) {
            ss << std::setw(2) << static_cast<int>(byte);
        }
        return ss.str();
    }

    auto buffer::to_hex_prefixed() const -> std::string {
        return "0x" + to_hex();
    }

    auto buffer::from_hex(const std::string& hex) -> std::optional<buffer> {
        if(hex.size() % 2 != 0) {
            return std::nullopt;
        }

        auto ret = buffer();
        ret.m_data.reserve(hex.size() / 2);
        static constexpr auto nibble_bits = 4;
        for(size_t i = 0; i < hex.size(); i += 2) {
            auto byte = uint8_t{};
            for(size_t j = 0; j < 2; j++) {
                auto c = hex[i + j];
                auto nibble = uint8_t{};
                if(c >= '0' && c <= '9') {
                    nibble = static_cast<uint8_t>(c - '0');
                } else if(c >= 'a' && c <= 'f') {
                    nibble = static_cast<uint8_t>(c - 'a' + 10);
                } else if(c >= 'A' && c <= 'F') {
                    nibble = static_cast<uint8_t>(c - 'A' + 10);
                } else {
                    return std::nullopt;
                }
                byte = static_cast<uint8_t>((byte << nibble_bits) | nibble);
            }
            ret.m_data.push_back(byte);
        }

        return ret;
    }

    auto buffer::from_hex_prefixed(const std::string& hex)
        -> std::optional<buffer> {
        if(hex.rfind("0x", 0) == 0 || hex.rfind("0X", 0) == 0) {
            return from_hex(hex.substr(2));
        }
        return from_hex(hex);
    }

    auto buffer::operator==(const buffer& other) const -> bool {
        return m_data == other.m_data;
    }

    auto buffer::operator!=(const buffer& other) const -> bool {
        return m_data != other.m_data;
    }

    auto buffer::operator<(const buffer& other) const -> bool {
        return m_data < other.m_data;
    }
}
