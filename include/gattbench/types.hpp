#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace gattbench {

// Core types
using Bytes = std::vector<uint8_t>;            // Notification / command payload
using ByteSpan = std::span<const uint8_t>;
using MutableByteSpan = std::span<uint8_t>;

// GATT layout of the throughput test service
constexpr const char* SERVICE_UUID = "12345678-1234-5678-1234-56789abcdef0";
constexpr const char* TX_CHAR_UUID = "12345678-1234-5678-1234-56789abcdef1";    // notify
constexpr const char* RX_CHAR_UUID = "12345678-1234-5678-1234-56789abcdef2";    // write w/o response
constexpr const char* RSSI_CHAR_UUID = "12345678-1234-5678-1234-56789abcdef3";  // read / notify

// Notification wire layout: [SEQ_LO][SEQ_HI][TS_LO][TS_HI][DATA...]
constexpr size_t PACKET_HEADER_BYTES = 4;
constexpr uint8_t PACKET_FILLER = 0xAA;

// Data bytes that fit in one notification at the largest negotiated MTU (247 - 3)
constexpr size_t MAX_PAYLOAD_BYTES = 244;
// Range accepted by the sweep orchestrator
constexpr size_t MIN_SWEEP_PAYLOAD_BYTES = 20;
constexpr size_t MAX_SWEEP_PAYLOAD_BYTES = 244;

constexpr int DEFAULT_NOTIFY_HZ = 40;
constexpr size_t DEFAULT_PAYLOAD_BYTES = 120;

// RX command opcodes
enum class Opcode : uint8_t {
    START = 0x01,
    STOP = 0x02,
    RESET = 0x03,
};

inline const char* opcodeToString(Opcode op) {
    switch (op) {
        case Opcode::START: return "START";
        case Opcode::STOP:  return "STOP";
        case Opcode::RESET: return "RESET";
        default: return "UNKNOWN";
    }
}

// Requested link PHY. AUTO leaves the choice to the host controller.
enum class Phy : uint8_t {
    AUTO = 0,
    LE_1M = 1,
    LE_2M = 2,
    CODED = 3,
};

inline const char* phyToString(Phy phy) {
    switch (phy) {
        case Phy::AUTO:  return "auto";
        case Phy::LE_1M: return "1m";
        case Phy::LE_2M: return "2m";
        case Phy::CODED: return "coded";
        default: return "unknown";
    }
}

// Accepts the names printed by phyToString() plus the common aliases.
// Returns false for anything else.
inline bool parsePhy(const std::string& str, Phy& out) {
    if (str == "auto") { out = Phy::AUTO; return true; }
    if (str == "1m" || str == "le1m" || str == "le_1m") { out = Phy::LE_1M; return true; }
    if (str == "2m" || str == "le2m" || str == "le_2m") { out = Phy::LE_2M; return true; }
    if (str == "coded" || str == "le_coded") { out = Phy::CODED; return true; }
    return false;
}

} // namespace gattbench
