#include <trustpdf/assert_test.h>

#include "fake_tools.hh"

#include <trustpdf/Pipeline.hh>
#include <trustpdf/Pl_String.hh>
#include <trustpdf/TPDFCommand.hh>
#include <trustpdf/TPDFExc.hh>
#include <trustpdf/TPDFJob.hh>
#include <trustpdf/TPDFLogger.hh>
#include <trustpdf/TPDFSignals.hh>

#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>

using namespace fake_tools;

static void
test_guard()
{
    struct sigaction before;
    sigaction(SIGTERM, nullptr, &before);
    {
        TPDFSignals::Guard guard;
        assert(TPDFSignals::interrupted() == 0);
        TPDFSignals::checkInterrupted();
        raise(SIGINT);
        assert(TPDFSignals::interrupted() == SIGINT);
        try {
            TPDFSignals::checkInterrupted();
            assert(false);
        } catch (TPDFExc& e) {
            assert(e.getErrorCode() == tpdf_e_interrupted);
            assert(std::string(e.what()).starts_with("interrupted by signal "));
        }
    }
    struct sigaction after;
    sigaction(SIGTERM, nullptr, &after);
    assert(after.sa_handler == before.sa_handler);

    // A new guard starts clean.
    TPDFSignals::Guard guard;
    assert(TPDFSignals::interrupted() == 0);
}

static void
test_forwarding()
{
    // The child signals its parent; the handler forwards the signal back to the child, which is
    // still waiting, so the child dies from it.
    TPDFSignals::Guard guard;
    TPDFCommand cmd("/bin/sh", {"-c", "kill -TERM $PPID; while :; do :; done"});
    int status = cmd.run();
    assert(status == 128 + SIGTERM);
    assert(TPDFSignals::interrupted() == SIGTERM);
}

static void
test_job_interrupted()
{
    Area a;
    std::string in = a.work + "/report.pdf";
    write_file(in, "%PDF-1.7\n");
    setenv("FAKE_RASTER_SIGNAL", "1", 1);

    auto log = TPDFLogger::create();
    std::string out;
    std::string err;
    log->setInfo(std::make_shared<Pl_String>(out));
    log->setError(std::make_shared<Pl_String>(err));

    TPDFJob job;
    job.setLogger(log);
    job.config()->inputFile(in);
    try {
        job.run();
        assert(false);
    } catch (TPDFExc& e) {
        assert(e.getErrorCode() == tpdf_e_interrupted);
        assert(std::string(e.what()) == std::string("interrupted by signal ") + strsignal(SIGTERM));
    }
    assert(out.find("Step 2") == std::string::npos);
    assert(a.scratchClean());
    assert(!TUtil::is_regular_file((a.work + "/report.trusted.pdf").c_str()));

    // The handlers are gone once run() has returned.
    struct sigaction sa;
    sigaction(SIGTERM, nullptr, &sa);
    assert(sa.sa_handler == SIG_DFL);
}

namespace
{
    // Captures text like Pl_String and raises a signal the first time the captured text
    // contains trigger.
    class Pl_RaiseOn: public Pipeline
    {
      public:
        Pl_RaiseOn(std::string& s, std::string const& trigger, int sig) :
            s(s),
            trigger(trigger),
            sig(sig)
        {
        }
        void
        write(char const* data, size_t len) override
        {
            s.append(data, len);
            if ((!raised) && (s.find(trigger) != std::string::npos)) {
                raised = true;
                raise(sig);
            }
        }
        void
        finish() override
        {
        }

      private:
        std::string& s;
        std::string trigger;
        int sig;
        bool raised{false};
    };
} // namespace

static void
test_interrupted_between_stages()
{
    // SIGINT arrives after rasterizing, while no program is running. Reassembly must not start,
    // and the existing output file the user agreed to overwrite is left alone.
    Area a;
    std::string in = a.work + "/report.pdf";
    std::string out_file = a.work + "/out.pdf";
    write_file(in, "%PDF-1.7\n");
    write_file(out_file, "old contents\n");

    auto log = TPDFLogger::create();
    std::string out;
    std::string err;
    log->setInfo(std::make_shared<Pl_RaiseOn>(out, "Step 2", SIGINT));
    log->setError(std::make_shared<Pl_String>(err));
    std::istringstream answer("y\n");

    TPDFJob job;
    job.setLogger(log);
    job.setPromptInput(&answer);
    job.config()->inputFile(in)->outputFile(out_file)->verbose();
    try {
        job.run();
        assert(false);
    } catch (TPDFExc& e) {
        assert(e.getErrorCode() == tpdf_e_interrupted);
        assert(std::string(e.what()) == std::string("interrupted by signal ") + strsignal(SIGINT));
    }
    assert(out.find("Running: " + a.bin + "/magick -density") != std::string::npos);
    assert(out.find("Running: " + a.bin + "/magick png:") == std::string::npos);
    assert(read_file(out_file) == "old contents\n");
    assert(err.find("removing incomplete output") == std::string::npos);
    assert(a.scratchClean());
}

static void
test_interrupted_while_writing_output()
{
    // The signal arrives while the output is being written: the partial file is removed.
    Area a;
    std::string in = a.work + "/report.pdf";
    std::string out_file = a.work + "/report.trusted.pdf";
    write_file(in, "%PDF-1.7\n");
    setenv("FAKE_ASSEMBLE_SIGNAL", "1", 1);

    auto log = TPDFLogger::create();
    std::string out;
    std::string err;
    log->setInfo(std::make_shared<Pl_String>(out));
    log->setError(std::make_shared<Pl_String>(err));

    TPDFJob job;
    job.setLogger(log);
    job.config()->inputFile(in);
    try {
        job.run();
        assert(false);
    } catch (TPDFExc& e) {
        assert(e.getErrorCode() == tpdf_e_interrupted);
    }
    assert(out.find("Step 2") != std::string::npos);
    assert(out.find("Step 3") == std::string::npos);
    assert(!TUtil::is_regular_file(out_file.c_str()));
    assert(err.find("[WARNING] removing incomplete output file " + out_file + "\n") !=
           std::string::npos);
    assert(read_file(in) == "%PDF-1.7\n");
    assert(a.scratchClean());
}

int
main()
{
    test_guard();
    test_forwarding();
    test_job_interrupted();
    test_interrupted_between_stages();
    test_interrupted_while_writing_output();
    std::cout << "interrupt tests done" << std::endl;
    return 0;
}
