#include "wire_format.hpp"
#include "gattbench/errors.hpp"
#include <cstdio>

namespace gattbench {
namespace protocol {

NotificationPacket NotificationPacket::make(uint16_t sequence, uint16_t timestamp_ms, size_t data_len) {
    NotificationPacket packet;
    packet.sequence = sequence;
    packet.timestamp_ms = timestamp_ms;
    packet.data.assign(data_len, PACKET_FILLER);
    return packet;
}

Bytes NotificationPacket::encode() const {
    Bytes out;
    out.reserve(PACKET_HEADER_BYTES + data.size());
    out.push_back(static_cast<uint8_t>(sequence & 0xFF));
    out.push_back(static_cast<uint8_t>(sequence >> 8));
    out.push_back(static_cast<uint8_t>(timestamp_ms & 0xFF));
    out.push_back(static_cast<uint8_t>(timestamp_ms >> 8));
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

NotificationHeader decodeNotificationHeader(ByteSpan raw) {
    NotificationHeader header;
    header.raw_len = raw.size();
    header.data_len = raw.size() > PACKET_HEADER_BYTES ? raw.size() - PACKET_HEADER_BYTES : 0;
    if (raw.size() >= 2) {
        header.sequence = static_cast<uint16_t>(raw[0] | (raw[1] << 8));
    }
    if (raw.size() >= 4) {
        header.timestamp_ms = static_cast<uint16_t>(raw[2] | (raw[3] << 8));
    }
    return header;
}

bool hasIntactFiller(ByteSpan raw) {
    for (size_t i = PACKET_HEADER_BYTES; i < raw.size(); i++) {
        if (raw[i] != PACKET_FILLER) {
            return false;
        }
    }
    return true;
}

Command Command::start(uint8_t payload_bytes, uint16_t packet_count) {
    Command cmd;
    cmd.op = Opcode::START;
    cmd.payload_bytes = payload_bytes;
    cmd.packet_count = packet_count;
    return cmd;
}

Bytes Command::encode(const CommandOpcodes& opcodes) const {
    Bytes out;
    switch (op) {
        case Opcode::START:
            out.push_back(opcodes.start);
            if (payload_bytes) {
                out.push_back(*payload_bytes);
                if (packet_count) {
                    out.push_back(static_cast<uint8_t>(*packet_count & 0xFF));
                    out.push_back(static_cast<uint8_t>(*packet_count >> 8));
                }
            }
            break;
        case Opcode::STOP:
            out.push_back(opcodes.stop);
            break;
        case Opcode::RESET:
            out.push_back(opcodes.reset);
            break;
    }
    return out;
}

Command Command::decode(ByteSpan raw, const CommandOpcodes& opcodes) {
    if (raw.empty()) {
        throw ProtocolError("empty command write");
    }
    uint8_t code = raw[0];
    Command cmd;
    if (code == opcodes.start) {
        cmd.op = Opcode::START;
        if (raw.size() >= 2) {
            cmd.payload_bytes = raw[1];
        }
        if (raw.size() >= 4) {
            cmd.packet_count = static_cast<uint16_t>(raw[2] | (raw[3] << 8));
        }
    } else if (code == opcodes.stop) {
        cmd.op = Opcode::STOP;
    } else if (code == opcodes.reset) {
        cmd.op = Opcode::RESET;
    } else {
        char msg[64];
        snprintf(msg, sizeof(msg), "unknown command opcode 0x%02x", code);
        throw ProtocolError(msg);
    }
    return cmd;
}

std::string Command::describe() const {
    if (op != Opcode::START) {
        return opcodeToString(op);
    }
    char buf[64];
    snprintf(buf, sizeof(buf), "START(payload=%d, count=%d)",
             payload_bytes ? static_cast<int>(*payload_bytes) : -1,
             packet_count ? static_cast<int>(*packet_count) : -1);
    return buf;
}

} // namespace protocol
} // namespace gattbench
