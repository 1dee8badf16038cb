// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_COMMON_BUFFER_H_
#define CUSTODY_SRC_COMMON_BUFFER_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace custody {
    /// Buffer to store and retrieve byte data.
    class buffer {
      public:
        buffer() = default;

        /// Removes any existing content in the buffer.
        void clear();

        /// Returns the number of bytes contained in the buffer.
        /// \return number of bytes.
        [[nodiscard]] auto size() const -> size_t;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return pointer to the first byte of the buffer.
        auto data() -> void*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return pointer to the first byte of the buffer.
        [[nodiscard]] auto data() const -> const void*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return unsigned char pointer to the first byte of the buffer.
        auto c_ptr() -> unsigned char*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return unsigned char pointer to the first byte of the buffer.
        [[nodiscard]] auto c_ptr() const -> const unsigned char*;

        /// Adds the given number of bytes from the given pointer to the end
        /// of the buffer.
        /// \param data pointer to bytes to append.
        /// \param len number of bytes to append.
        void append(const void* data, size_t len);

        /// Extends the size of the buffer by the given length, filling the
        /// new space with zeros.
        /// \param len number of bytes to extend the buffer by.
        void extend(size_t len);

        /// Returns a hex string representation of the buffer contents.
        /// \return hex string without a 0x prefix.
        [[nodiscard]] auto to_hex() const -> std::string;

        /// Returns the hex representation prefixed with 0x.
        /// \return 0x-prefixed hex string.
        [[nodiscard]] auto to_hex_prefixed() const -> std::string;

        /// Creates a new buffer from the provided hex string.
        /// \param hex string of even length containing only hex digits.
        /// \return buffer or std::nullopt if the string was not valid hex.
        static auto from_hex(const std::string& hex)
            -> std::optional<buffer>;

        /// Creates a new buffer from a hex string which may be prefixed
        /// with 0x.
        /// \param hex hex string, optionally with a 0x prefix.
        /// \return buffer or std::nullopt if the string was not valid hex.
        static auto from_hex_prefixed(const std::string& hex)
            -> std::optional<buffer>;

        auto operator==(const buffer& other) const -> bool;
        auto operator!=(const buffer& other) const -> bool;
        auto operator<(const buffer& other) const -> bool;

      private:
        std::vector<unsigned char> m_data{};
    };
}

#endif
