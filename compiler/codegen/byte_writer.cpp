#include "byte_writer.hpp"

#include <utility>

namespace sceneasm::codegen
{
    void ByteWriter::writeU8(std::uint8_t value)
    {
        m_bytes.push_back(value);
    }

    void ByteWriter::writeU16(std::uint16_t value)
    {
        m_bytes.push_back(static_cast<std::uint8_t>(value & 0xff));
        m_bytes.push_back(static_cast<std::uint8_t>(value >> 8));
    }

    void ByteWriter::writeU24(std::uint32_t value)
    {
        for (int shift = 0; shift < 24; shift += 8)
        {
            m_bytes.push_back(static_cast<std::uint8_t>((value >> shift) & 0xff));
        }
    }

    void ByteWriter::writeU32(std::uint32_t value)
    {
        for (int shift = 0; shift < 32; shift += 8)
        {
            m_bytes.push_back(static_cast<std::uint8_t>((value >> shift) & 0xff));
        }
    }

    void ByteWriter::writeBytes(const std::vector<std::uint8_t>& bytes)
    {
        m_bytes.insert(m_bytes.end(), bytes.begin(), bytes.end());
    }

    void ByteWriter::writeZeros(std::size_t count)
    {
        m_bytes.insert(m_bytes.end(), count, 0);
    }

    bool ByteWriter::patchU32(std::size_t offset, std::uint32_t value)
    {
        return codegen::patchU32(m_bytes, offset, value);
    }

    std::vector<std::uint8_t> ByteWriter::take()
    {
        return std::exchange(m_bytes, {});
    }

    bool patchU32(std::vector<std::uint8_t>& bytes, std::size_t offset, std::uint32_t value)
    {
        if (offset + 4 > bytes.size())
        {
            return false;
        }
        for (std::size_t index = 0; index < 4; ++index)
        {
            bytes[offset + index] = static_cast<std::uint8_t>((value >> (index * 8)) & 0xff);
        }
        return true;
    }
} // namespace sceneasm::codegen
