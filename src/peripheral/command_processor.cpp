#include "command_processor.hpp"
#include "gattbench/errors.hpp"
#include "gattbench/logging.hpp"

namespace gattbench {
namespace peripheral {

CommandProcessor::CommandProcessor(NotificationScheduler& scheduler, RandomSource& rng,
                                   const protocol::CommandOpcodes& opcodes)
    : scheduler_(scheduler), rng_(rng), opcodes_(opcodes) {
}

void CommandProcessor::handleWrite(ByteSpan data) {
    stats_.received++;

    protocol::Command cmd;
    try {
        cmd = protocol::Command::decode(data, opcodes_);
    } catch (const ProtocolError& e) {
        stats_.rejected++;
        LOG_PERIPH(WARN, "Rejected RX write (%zu bytes): %s", data.size(), e.what());
        return;
    }

    if (rng_.chancePercent(ignore_chance_)) {
        stats_.ignored++;
        LOG_PERIPH(INFO, "Ignoring %s (simulated missed write)", cmd.describe().c_str());
        return;
    }

    apply(cmd);
    stats_.applied++;
}

void CommandProcessor::apply(const protocol::Command& cmd) {
    LOG_PERIPH(DEBUG, "Command %s in state %s", cmd.describe().c_str(),
               schedulerStateToString(scheduler_.getState()));
    switch (cmd.op) {
        case Opcode::RESET:
            scheduler_.reset();
            break;
        case Opcode::START: {
            std::optional<size_t> payload;
            if (cmd.payload_bytes) {
                payload = *cmd.payload_bytes;
            }
            scheduler_.start(payload, cmd.packet_count.value_or(0));
            break;
        }
        case Opcode::STOP:
            scheduler_.stop();
            break;
    }
}

} // namespace peripheral
} // namespace gattbench
