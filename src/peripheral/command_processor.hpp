#pragma once

#include "notification_scheduler.hpp"
#include "../protocol/wire_format.hpp"
#include "../common/random_source.hpp"
#include "gattbench/types.hpp"
#include <cstdint>

namespace gattbench {
namespace peripheral {

struct CommandStats {
    uint64_t received = 0;
    uint64_t applied = 0;
    uint64_t ignored = 0;      // Dropped per command_ignore_chance
    uint64_t rejected = 0;     // Empty write or unknown opcode
};

// Handles writes to the RX characteristic. Writes are fire-and-forget, so
// nothing is reported back to the writer: ignored and rejected commands
// are only visible in the log and the counters.
class CommandProcessor {
public:
    CommandProcessor(NotificationScheduler& scheduler, RandomSource& rng,
                     const protocol::CommandOpcodes& opcodes = protocol::CommandOpcodes{});

    // Entry point for an RX write
    void handleWrite(ByteSpan data);

    // command_ignore_chance comes from here; set per trial
    void setIgnoreChance(double percent) { ignore_chance_ = percent; }

    const CommandStats& getStats() const { return stats_; }
    void resetStats() { stats_ = CommandStats{}; }

private:
    void apply(const protocol::Command& cmd);

    NotificationScheduler& scheduler_;
    RandomSource& rng_;
    protocol::CommandOpcodes opcodes_;
    double ignore_chance_ = 0.0;
    CommandStats stats_;
};

} // namespace peripheral
} // namespace gattbench
