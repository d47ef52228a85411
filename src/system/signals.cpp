// signals.cpp - Termination signals delivered synchronously to a waiter thread.

#include "system/signals.hpp"

#include <csignal>
#include <pthread.h>

namespace staticfs {

namespace {

sigset_t TerminationSet() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

} // namespace

void BlockTerminationSignals() {
    const sigset_t set = TerminationSet();
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

int WaitForTerminationSignal() {
    const sigset_t set = TerminationSet();
    int sig = 0;
    if (sigwait(&set, &sig) != 0) return -1;
    return sig;
}

} // namespace staticfs
