#pragma once

namespace staticfs {

// Blocks SIGINT and SIGTERM in the calling thread and every thread it
// starts afterwards. Call before spawning threads.
void BlockTerminationSignals();

// Waits for a blocked SIGINT or SIGTERM and returns its number, or -1.
int WaitForTerminationSignal();

} // namespace staticfs
