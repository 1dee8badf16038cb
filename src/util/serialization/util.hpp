// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_SERIALIZATION_UTIL_H_
#define CUSTODY_SRC_SERIALIZATION_UTIL_H_

#include "buffer_serializer.hpp"
#include "format.hpp"

#include <optional>

namespace custody {
    /// Serializes the given object into a new buffer.
    /// \param obj object to serialize.
    /// \return buffer containing the serialized object.
    template<typename T>
    auto make_buffer(const T& obj) -> buffer {
        auto pkt = buffer();
        auto ser = buffer_serializer(pkt);
        ser << obj;
        return pkt;
    }

    /// Deserializes an object from the given buffer.
    /// \param buf buffer containing a serialized object.
    /// \return object or std::nullopt if deserialization failed.
    template<typename T>
    auto from_buffer(buffer& buf) -> std::optional<T> {
        auto deser = buffer_serializer(buf);
        auto ret = T();
        if(!(deser >> ret)) {
            return std::nullopt;
        }
        return ret;
    }
}

#endif
