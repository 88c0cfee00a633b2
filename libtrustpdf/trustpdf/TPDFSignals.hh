#ifndef TPDFSIGNALS_HH
#define TPDFSIGNALS_HH

#include <csignal>
#include <sys/types.h>

// Interruption handling for a running conversion. While a Guard is alive, SIGINT, SIGTERM and
// SIGHUP are caught: the handler records the signal and forwards it to the external program that
// is currently running, if any. The job polls interrupted() after each external program exits and
// between stages and unwinds with an exception, which lets the scratch directory's destructor
// run.
class TPDFSignals
{
  public:
    class Guard
    {
      public:
        Guard();
        ~Guard();
        Guard(Guard const&) = delete;
        Guard& operator=(Guard const&) = delete;

      private:
        struct sigaction old_int;
        struct sigaction old_term;
        struct sigaction old_hup;
    };

    // Signal number received since the last Guard was created, or 0.
    static int interrupted();

    // Throw TPDFExc with tpdf_e_interrupted if a signal has been received.
    static void checkInterrupted();

    // Block the handled signals, saving the previous mask in *old. Used around fork so that a
    // signal can't arrive between fork and recording the child.
    static void block(sigset_t* old);
    static void unblock(sigset_t const* old);

    // Record the process that should receive forwarded signals; 0 clears it.
    static void setChild(pid_t);
};

#endif // TPDFSIGNALS_HH
