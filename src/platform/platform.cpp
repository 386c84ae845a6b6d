#include "platform.hpp"
#include <cstdlib>
#include <csignal>
#include <pthread.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

// SIGUSR1 is the wake-up used by stop_waiting_for_signal().
static sigset_t termination_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGUSR1);
    return set;
}

void block_termination_signals() {
    sigset_t set = termination_set();
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

int wait_for_termination_signal() {
    sigset_t set = termination_set();
    int sig = 0;
    if (sigwait(&set, &sig) != 0) return 0;
    return sig == SIGUSR1 ? 0 : sig;
}

void stop_waiting_for_signal() {
    kill(getpid(), SIGUSR1);
}

} // namespace platform
