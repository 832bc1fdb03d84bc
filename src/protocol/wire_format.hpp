#pragma once

#include "gattbench/types.hpp"
#include <optional>
#include <string>

namespace gattbench {
namespace protocol {

// ============================================================================
// TX notification: [SEQ_LO][SEQ_HI][TS_LO][TS_HI][DATA...]
// ============================================================================

struct NotificationPacket {
    uint16_t sequence = 0;
    uint16_t timestamp_ms = 0;   // Device clock, wraps at 65536
    Bytes data;                  // Filler (PACKET_FILLER) of the configured length

    // Builds a packet with data_len filler bytes
    static NotificationPacket make(uint16_t sequence, uint16_t timestamp_ms, size_t data_len);

    Bytes encode() const;
};

// Header fields of a received notification. Either field is empty when the
// packet is too short to carry it (sequence needs 2 bytes, timestamp 4).
struct NotificationHeader {
    std::optional<uint16_t> sequence;
    std::optional<uint16_t> timestamp_ms;
    size_t raw_len = 0;
    size_t data_len = 0;         // raw_len minus header, never negative
};

NotificationHeader decodeNotificationHeader(ByteSpan raw);

// True when every byte after the header is the filler pattern
bool hasIntactFiller(ByteSpan raw);

// ============================================================================
// RX command: [OPCODE][...]
// ============================================================================

// Opcode values are configurable on both ends
struct CommandOpcodes {
    uint8_t start = static_cast<uint8_t>(Opcode::START);
    uint8_t stop = static_cast<uint8_t>(Opcode::STOP);
    uint8_t reset = static_cast<uint8_t>(Opcode::RESET);
};

struct Command {
    Opcode op = Opcode::RESET;
    // Start only: [payload u8][packet_count u16 LE], both optional on the wire
    std::optional<uint8_t> payload_bytes;
    std::optional<uint16_t> packet_count;  // 0 = unbounded

    static Command reset() { return Command{Opcode::RESET, std::nullopt, std::nullopt}; }
    static Command stop() { return Command{Opcode::STOP, std::nullopt, std::nullopt}; }
    static Command start(uint8_t payload_bytes, uint16_t packet_count);

    Bytes encode(const CommandOpcodes& opcodes = CommandOpcodes{}) const;

    // Throws ProtocolError on an empty write or unknown opcode
    static Command decode(ByteSpan raw, const CommandOpcodes& opcodes = CommandOpcodes{});

    std::string describe() const;
};

} // namespace protocol
} // namespace gattbench
