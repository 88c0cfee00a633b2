#include <trustpdf/TPDFSignals.hh>

#include <trustpdf/TPDFExc.hh>
#include <trustpdf/TUtil.hh>

#include <cstring>
#include <string>

namespace
{
    volatile sig_atomic_t received_signal = 0;
    volatile sig_atomic_t child_pid = 0;
} // namespace

static void
handle_signal(int sig)
{
    received_signal = sig;
    if (child_pid > 0) {
        kill(static_cast<pid_t>(child_pid), sig);
    }
}

static void
set_signal(int sig, struct sigaction* old)
{
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_signal;
    // waitpid is restarted; the child exits once the signal has been forwarded to it.
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    TUtil::os_wrapper(
        "install handler for signal " + std::to_string(sig), sigaction(sig, &sa, old));
    if ((old->sa_handler == SIG_IGN) && (sig == SIGHUP)) {
        // Started under nohup: keep ignoring hangups.
        sigaction(sig, old, nullptr);
    }
}

TPDFSignals::Guard::Guard()
{
    received_signal = 0;
    child_pid = 0;
    set_signal(SIGINT, &old_int);
    set_signal(SIGTERM, &old_term);
    set_signal(SIGHUP, &old_hup);
}

TPDFSignals::Guard::~Guard()
{
    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGTERM, &old_term, nullptr);
    sigaction(SIGHUP, &old_hup, nullptr);
    child_pid = 0;
}

int
TPDFSignals::interrupted()
{
    return received_signal;
}

void
TPDFSignals::checkInterrupted()
{
    int sig = received_signal;
    if (sig != 0) {
        throw TPDFExc(
            tpdf_e_interrupted, "", std::string("interrupted by signal ") + strsignal(sig));
    }
}

void
TPDFSignals::block(sigset_t* old)
{
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    TUtil::os_wrapper("block signals", sigprocmask(SIG_BLOCK, &mask, old));
}

void
TPDFSignals::unblock(sigset_t const* old)
{
    sigprocmask(SIG_SETMASK, old, nullptr);
}

void
TPDFSignals::setChild(pid_t pid)
{
    child_pid = static_cast<sig_atomic_t>(pid);
}
