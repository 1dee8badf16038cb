// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_SERIALIZATION_SERIALIZER_H_
#define CUSTODY_SRC_SERIALIZATION_SERIALIZER_H_

#include <cstddef>

namespace custody {
    /// Interface for serializing objects into and out of raw bytes.
    class serializer {
      public:
        virtual ~serializer() = default;

        serializer() = default;
        serializer(const serializer&) = delete;
        auto operator=(const serializer&) -> serializer& = delete;
        serializer(serializer&&) = delete;
        auto operator=(serializer&&) -> serializer& = delete;

        /// Indicates whether the last operation on the serializer was
        /// successful.
        /// \return false if a read or write went past the end of the data.
        explicit virtual operator bool() const = 0;

        /// Moves the cursor forward by the given number of bytes.
        /// \param len number of bytes to skip.
        virtual void advance_cursor(size_t len) = 0;

        /// Resets the cursor to the start of the data and clears any error.
        virtual void reset() = 0;

        /// Writes the given bytes at the cursor.
        /// \param data bytes to write.
        /// \param len number of bytes.
        /// \return true if the write succeeded.
        virtual auto write(const void* data, size_t len) -> bool = 0;

        /// Reads bytes from the cursor into the given destination.
        /// \param data destination.
        /// \param len number of bytes to read.
        /// \return true if there were enough bytes to read.
        virtual auto read(void* data, size_t len) -> bool = 0;
    };
}

#endif
