// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_SERIALIZATION_FORMAT_H_
#define CUSTODY_SRC_SERIALIZATION_FORMAT_H_

#include "serializer.hpp"
#include "util/common/buffer.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace custody {
    /// Serializes an unsigned integral value in big-endian byte order.
    template<typename T>
    auto operator<<(serializer& ser, T t) -> typename std::
        enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>
                        && !std::is_same_v<T, bool>,
                    serializer&> {
        std::array<unsigned char, sizeof(T)> bytes{};
        for(size_t i = 0; i < sizeof(T); i++) {
            static constexpr auto byte_bits = 8;
            bytes[sizeof(T) - 1 - i]
                = static_cast<unsigned char>(t >> (i * byte_bits));
        }
        ser.write(bytes.data(), bytes.size());
        return ser;
    }

    /// Deserializes a big-endian unsigned integral value.
    template<typename T>
    auto operator>>(serializer& deser, T& t) -> typename std::
        enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>
                        && !std::is_same_v<T, bool>,
                    serializer&> {
        std::array<unsigned char, sizeof(T)> bytes{};
        if(!deser.read(bytes.data(), bytes.size())) {
            return deser;
        }
        t = 0;
        for(const auto b : bytes) {
            static constexpr auto byte_bits = 8;
            t = static_cast<T>((t << byte_bits) | b);
        }
        return deser;
    }

    auto operator<<(serializer& ser, bool b) -> serializer&;
    auto operator>>(serializer& deser, bool& b) -> serializer&;

    /// Serializes a buffer as a 64-bit length followed by its bytes.
    auto operator<<(serializer& ser, const buffer& b) -> serializer&;
    auto operator>>(serializer& deser, buffer& b) -> serializer&;

    /// Serializes a string as a 64-bit length followed by its characters.
    auto operator<<(serializer& ser, const std::string& s) -> serializer&;
    auto operator>>(serializer& deser, std::string& s) -> serializer&;

    /// Serializes a byte vector as a 64-bit length followed by its bytes.
    auto operator<<(serializer& ser, const std::vector<uint8_t>& v)
        -> serializer&;
    auto operator>>(serializer& deser, std::vector<uint8_t>& v)
        -> serializer&;

    /// Serializes an optional as a presence flag followed by the value.
    template<typename T>
    auto operator<<(serializer& ser, const std::optional<T>& o)
        -> serializer& {
        ser << o.has_value();
        if(o.has_value()) {
            ser << o.value();
        }
        return ser;
    }

    template<typename T>
    auto operator>>(serializer& deser, std::optional<T>& o) -> serializer& {
        bool present{};
        if(!(deser >> present)) {
            return deser;
        }
        if(!present) {
            o = std::nullopt;
            return deser;
        }
        auto val = T();
        if(deser >> val) {
            o = std::move(val);
        }
        return deser;
    }
}

#endif
