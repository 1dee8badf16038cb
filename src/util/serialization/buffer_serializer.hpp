// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_SERIALIZATION_BUFFER_SERIALIZER_H_
#define CUSTODY_SRC_SERIALIZATION_BUFFER_SERIALIZER_H_

#include "serializer.hpp"
#include "util/common/buffer.hpp"

namespace custody {
    /// Serializer implementation backed by a \ref buffer. Writes grow the
    /// buffer as needed.
    class buffer_serializer final : public serializer {
      public:
        /// Constructor.
        /// \param pkt buffer to read from or write into.
        explicit buffer_serializer(buffer& pkt);

        explicit operator bool() const final;

        void advance_cursor(size_t len) final;
        void reset() final;
        auto write(const void* data, size_t len) -> bool final;
        auto read(void* data, size_t len) -> bool final;

      private:
        buffer& m_pkt;
        size_t m_cursor{0};
        bool m_valid{true};
    };
}

#endif
