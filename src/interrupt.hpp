#pragma once
#include <atomic>

namespace agentsh {

// SIGINT handler that only raises a flag. Installed without SA_RESTART so
// a blocking read returns and the REPL can notice the interrupt.
void install_interrupt_handler();

const std::atomic<bool>& interrupt_flag();
bool interrupt_requested();
void clear_interrupt();

// Same effect as a delivered SIGINT
void raise_interrupt();

} // namespace agentsh
