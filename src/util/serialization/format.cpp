// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace custody {
    auto operator<<(serializer& ser, bool b) -> serializer& {
        return ser << static_cast<uint8_t>(b ? 1 : 0);
    }

    auto operator>>(serializer& deser, bool& b) -> serializer& {
        auto val = uint8_t{};
        if(deser >> val) {
            b = val != 0;
        }
        return deser;
    }

    auto operator<<(serializer& ser, const buffer& b) -> serializer& {
        ser << static_cast<uint64_t>(b.size());
        ser.write(b.data(), b.size());
        return ser;
    }

    auto operator>>(serializer& deser, buffer& b) -> serializer& {
        auto len = uint64_t{};
        if(!(deser >> len)) {
            return deser;
        }
        auto tmp = std::vector<unsigned char>(len);
        if(!deser.read(tmp.data(), tmp.size())) {
            return deser;
        }
        b.clear();
        b.append(tmp.data(), tmp.size());
        return deser;
    }

    auto operator<<(serializer& ser, const std::string& s) -> serializer& {
        ser << static_cast<uint64_t>(s.size());
        ser.write(s.data(), s.size());
        return ser;
    }

    auto operator>>(serializer& deser, std::string& s) -> serializer& {
        auto len = uint64_t{};
        if(!(deser >> len)) {
            return deser;
        }
        auto tmp = std::string(len, '\0');
        if(deser.read(tmp.data(), tmp.size())) {
            s = std::move(tmp);
        }
        return deser;
    }

    auto operator<<(serializer& ser, const std::vector<uint8_t>& v)
        -> serializer& {
        ser << static_cast<uint64_t>(v.size());
        ser.write(v.data(), v.size());
        return ser;
    }

    auto operator>>(serializer& deser, std::vector<uint8_t>& v)
        -> serializer& {
        auto len = uint64_t{};
        if(!(deser >> len)) {
            return deser;
        }
        auto tmp = std::vector<uint8_t>(len);
        if(deser.read(tmp.data(), tmp.size())) {
            v = std::move(tmp);
        }
        return deser;
    }
}
