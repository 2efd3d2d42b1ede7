#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sceneasm::codegen
{
    // Little-endian append-only buffer with in-place patching for fix-ups.
    class ByteWriter
    {
    public:
        void writeU8(std::uint8_t value);
        void writeU16(std::uint16_t value);
        void writeU24(std::uint32_t value);
        void writeU32(std::uint32_t value);
        void writeBytes(const std::vector<std::uint8_t>& bytes);
        void writeZeros(std::size_t count);

        [[nodiscard]] bool patchU32(std::size_t offset, std::uint32_t value);

        [[nodiscard]] std::size_t size() const noexcept
        {
            return m_bytes.size();
        }

        [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept
        {
            return m_bytes;
        }

        std::vector<std::uint8_t> take();

    private:
        std::vector<std::uint8_t> m_bytes;
    };

    // False when the four bytes at offset are not all inside the buffer.
    [[nodiscard]] bool patchU32(std::vector<std::uint8_t>& bytes, std::size_t offset, std::uint32_t value);
} // namespace sceneasm::codegen
