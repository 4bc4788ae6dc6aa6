// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#ifndef UXLEDGER_SERIALIZE_H
#define UXLEDGER_SERIALIZE_H

#include <uint256.h>
#include <primitives/address.h>
#include <vector>
#include <string>
#include <cstring>
#include <stdexcept>

/**
 * CDataStream - Binary serialization buffer for ledger records
 *
 * All integers are little-endian, hashes and addresses are raw bytes. Reads
 * past the end of the buffer throw std::runtime_error; callers that decode
 * untrusted bytes (records loaded from disk) catch it and report a decode
 * error.
 */
class CDataStream {
private:
    std::vector<uint8_t> data;
    size_t read_pos;

public:
    CDataStream() : read_pos(0) {}

    CDataStream(const uint8_t* begin, const uint8_t* end)
        : data(begin, end), read_pos(0) {}

    size_t size() const { return data.size(); }

    const std::vector<uint8_t>& GetData() const { return data; }
    const uint8_t* data_ptr() const { return data.data(); }

    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data.data()), data.size());
    }

    void reserve(size_t n) { data.reserve(n); }

    // --- Write Operations ---

    void write(const uint8_t* src, size_t len) {
        data.insert(data.end(), src, src + len);
    }

    void WriteUint8(uint8_t value) {
        data.push_back(value);
    }

    void WriteUint16(uint16_t value) {
        uint8_t buf[2];
        buf[0] = value & 0xff;
        buf[1] = (value >> 8) & 0xff;
        write(buf, 2);
    }

    void WriteUint32(uint32_t value) {
        uint8_t buf[4];
        buf[0] = value & 0xff;
        buf[1] = (value >> 8) & 0xff;
        buf[2] = (value >> 16) & 0xff;
        buf[3] = (value >> 24) & 0xff;
        write(buf, 4);
    }

    void WriteUint64(uint64_t value) {
        uint8_t buf[8];
        for (int i = 0; i < 8; i++) {
            buf[i] = (value >> (i * 8)) & 0xff;
        }
        write(buf, 8);
    }

    void WriteInt32(int32_t value) {
        WriteUint32(static_cast<uint32_t>(value));
    }

    // Variable-length integer (CompactSize)
    void WriteCompactSize(uint64_t value) {
        if (value < 253) {
            WriteUint8(static_cast<uint8_t>(value));
        } else if (value <= 0xFFFF) {
            WriteUint8(253);
            WriteUint16(static_cast<uint16_t>(value));
        } else if (value <= 0xFFFFFFFF) {
            WriteUint8(254);
            WriteUint32(static_cast<uint32_t>(value));
        } else {
            WriteUint8(255);
            WriteUint64(value);
        }
    }

    void WriteUint256(const uint256& hash) {
        write(hash.data, 32);
    }

    void WriteAddress(const CAddress& addr) {
        WriteUint8(addr.nVersion);
        write(addr.key, CAddress::KEY_SIZE);
    }

    // --- Read Operations ---

    void read(uint8_t* dst, size_t len) {
        if (read_pos > data.size() || len > data.size() - read_pos) {
            throw std::runtime_error("CDataStream: read past end");
        }
        memcpy(dst, &data[read_pos], len);
        read_pos += len;
    }

    uint8_t ReadUint8() {
        if (read_pos >= data.size()) {
            throw std::runtime_error("CDataStream: read past end");
        }
        return data[read_pos++];
    }

    uint32_t ReadUint32() {
        uint8_t buf[4];
        read(buf, 4);
        return static_cast<uint32_t>(buf[0]) |
               (static_cast<uint32_t>(buf[1]) << 8) |
               (static_cast<uint32_t>(buf[2]) << 16) |
               (static_cast<uint32_t>(buf[3]) << 24);
    }

    uint64_t ReadUint64() {
        uint8_t buf[8];
        read(buf, 8);
        uint64_t result = 0;
        for (int i = 0; i < 8; i++) {
            result |= static_cast<uint64_t>(buf[i]) << (i * 8);
        }
        return result;
    }

    int32_t ReadInt32() {
        return static_cast<int32_t>(ReadUint32());
    }

    uint256 ReadUint256() {
        uint256 result;
        read(result.data, 32);
        return result;
    }

    CAddress ReadAddress() {
        CAddress addr;
        addr.nVersion = ReadUint8();
        read(addr.key, CAddress::KEY_SIZE);
        return addr;
    }
};

#endif // UXLEDGER_SERIALIZE_H
