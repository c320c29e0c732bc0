#pragma once

namespace ncwire {

// Route SIGINT/SIGTERM into the cancellation flag
void install_signal_handlers();

bool cancel_requested();
void request_cancel();
void reset_cancel();

// Throws TransferError(Cancelled) when a signal has been received
void throw_if_cancelled();

} // namespace ncwire
