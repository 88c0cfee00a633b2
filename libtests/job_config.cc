#include <trustpdf/assert_test.h>

#include <trustpdf/Pl_String.hh>
#include <trustpdf/TPDFJob.hh>
#include <trustpdf/TPDFLogger.hh>
#include <trustpdf/TPDFUsage.hh>

#include <iostream>
#include <vector>

namespace
{
    // A job whose output is captured in strings.
    struct CapturedJob
    {
        CapturedJob()
        {
            log->setInfo(std::make_shared<Pl_String>(out));
            log->setError(std::make_shared<Pl_String>(err));
            job.setLogger(log);
        }

        std::shared_ptr<TPDFLogger> log{TPDFLogger::create()};
        std::string out;
        std::string err;
        TPDFJob job;
    };
} // namespace

static std::string
argv_usage(std::vector<char const*> args)
{
    args.push_back(nullptr);
    CapturedJob cj;
    try {
        cj.job.initializeFromArgv(args.data());
    } catch (TPDFUsage& e) {
        return e.what();
    }
    assert(false);
    return "";
}

static std::string
dpi_usage(std::string const& value)
{
    TPDFJob j;
    try {
        j.config()->dpi(value);
    } catch (TPDFUsage& e) {
        return e.what();
    }
    return "";
}

static void
test_trusted_name()
{
    assert(TPDFJob::trustedName("report.pdf") == "report.trusted.pdf");
    assert(TPDFJob::trustedName("dir/report.pdf") == "dir/report.trusted.pdf");
    assert(TPDFJob::trustedName("report.final.pdf") == "report.final.trusted.pdf");
    assert(TPDFJob::trustedName("report") == "report.trusted.pdf");
    assert(TPDFJob::trustedName("my.dir/report") == "my.dir/report.trusted.pdf");
    assert(TPDFJob::trustedName(".hidden") == ".hidden.trusted.pdf");
    assert(TPDFJob::trustedName("dir/.hidden") == "dir/.hidden.trusted.pdf");
    assert(TPDFJob::trustedName("./report.PDF") == "./report.trusted.pdf");
}

static void
test_dpi()
{
    std::string msg = "DPI must be a number between 72 and 600";
    for (auto v: {"", "71", "601", "0", "-100", "+300", "300dpi", "3e2", " 300", "1e9",
                  "99999999999999999999999"}) {
        assert(dpi_usage(v) == msg);
    }
    for (auto v: {"72", "150", "300", "600", "0600"}) {
        assert(dpi_usage(v).empty());
    }
    TPDFJob j;
    assert(j.getDPI() == TPDFJob::DEFAULT_DPI);
    j.config()->dpi("72");
    assert(j.getDPI() == 72);
    j.config()->dpi("600");
    assert(j.getDPI() == 600);
}

static void
test_config()
{
    TPDFJob j;
    try {
        j.checkConfiguration();
        assert(false);
    } catch (TPDFUsage& e) {
        assert(std::string(e.what()) == "an input file name is required");
    }

    j.config()->inputFile("in/report.pdf")->verbose()->checkConfiguration();
    assert(j.getInputFile() == "in/report.pdf");
    assert(j.getOutputFile() == "in/report.trusted.pdf");

    try {
        j.config()->inputFile("other.pdf");
        assert(false);
    } catch (TPDFUsage& e) {
        assert(std::string(e.what()) == "input file has already been given");
    }

    j.config()->outputFile("out.pdf")->checkConfiguration();
    assert(j.getOutputFile() == "out.pdf");
    try {
        j.config()->outputFile("out2.pdf");
        assert(false);
    } catch (TPDFUsage& e) {
        assert(std::string(e.what()) == "output file has already been given");
    }
}

static void
test_batch()
{
    // Batch mode wins over an explicit output file, with a warning.
    CapturedJob cj;
    cj.job.config()->inputFile("report.pdf")->outputFile("custom.pdf")->batch();
    cj.job.checkConfiguration();
    assert(cj.job.getOutputFile() == "report.trusted.pdf");
    assert(cj.err == "[WARNING] batch mode: ignoring output file custom.pdf\n");
    // Checking again does not repeat the warning.
    cj.job.checkConfiguration();
    assert(cj.err == "[WARNING] batch mode: ignoring output file custom.pdf\n");

    CapturedJob cj2;
    cj2.job.config()->batch()->inputFile("a/b.c.pdf")->checkConfiguration();
    assert(cj2.job.getOutputFile() == "a/b.c.trusted.pdf");
    assert(cj2.err.empty());
}

static void
test_argv()
{
    CapturedJob cj;
    char const* argv[] = {
        "trustpdf", "-v", "--dpi=150", "report.pdf", "--batch", "custom.pdf", nullptr};
    cj.job.initializeFromArgv(argv);
    assert(cj.job.getDPI() == 150);
    assert(cj.job.getInputFile() == "report.pdf");
    assert(cj.job.getOutputFile() == "report.trusted.pdf");

    CapturedJob cj2;
    char const* argv2[] = {"trustpdf", "-d", "600", "--", "-in.pdf", "-out.pdf", nullptr};
    cj2.job.initializeFromArgv(argv2);
    assert(cj2.job.getDPI() == 600);
    assert(cj2.job.getInputFile() == "-in.pdf");
    assert(cj2.job.getOutputFile() == "-out.pdf");

    CapturedJob cj3;
    char const* argv3[] = {"trustpdf", "--dpi", "72", "in.pdf", nullptr};
    cj3.job.initializeFromArgv(argv3);
    assert(cj3.job.getDPI() == 72);
    assert(cj3.job.getOutputFile() == "in.trusted.pdf");
}

static void
test_argv_errors()
{
    assert(argv_usage({"trustpdf"}) == "an input file name is required");
    assert(argv_usage({"trustpdf", "-v"}) == "an input file name is required");
    assert(argv_usage({"trustpdf", "a.pdf", "b.pdf", "c.pdf"}) == "too many arguments");
    assert(
        argv_usage({"trustpdf", "--frobnicate", "a.pdf"}) == "unrecognized argument --frobnicate");
    assert(argv_usage({"trustpdf", "-x", "a.pdf"}) == "unrecognized argument -x");
    assert(argv_usage({"trustpdf", "a.pdf", "-d"}) == "-d requires a DPI parameter");
    assert(argv_usage({"trustpdf", "a.pdf", "--dpi"}) == "--dpi requires a DPI parameter");
    std::string bad_dpi = "DPI must be a number between 72 and 600";
    assert(argv_usage({"trustpdf", "-d", "71", "a.pdf"}) == bad_dpi);
    assert(argv_usage({"trustpdf", "-d", "abc", "a.pdf"}) == bad_dpi);
    assert(argv_usage({"trustpdf", "--batch=yes", "a.pdf"}) ==
           "--batch does not take a parameter, but \"yes\" was given");
    // DPI is checked before the input file.
    assert(argv_usage({"trustpdf", "-d", "1000"}) == bad_dpi);
}

static void
test_help()
{
    // Help wins even after a bad DPI and without an input file; run() then does nothing.
    CapturedJob cj;
    char const* argv[] = {"/usr/bin/trustpdf", "-d", "5", "-h", "--frobnicate", nullptr};
    cj.job.initializeFromArgv(argv);
    assert(cj.out.starts_with("Usage: trustpdf [OPTIONS] <input.pdf> [output.pdf]\n"));
    assert(cj.out.find("OPTIONS:\n") != std::string::npos);
    assert(cj.out.find("EXAMPLES:\n") != std::string::npos);
    assert(cj.out.find("REQUIREMENTS:\n") != std::string::npos);
    assert(cj.out.find("    trustpdf --batch document.pdf\n") != std::string::npos);
    cj.job.run();
    assert(cj.job.getExitCode() == 0);
    assert(!cj.job.wasCancelled());
    assert(cj.err.empty());

    CapturedJob cj2;
    char const* argv2[] = {"trustpdf", "--version", nullptr};
    cj2.job.initializeFromArgv(argv2);
    assert(cj2.out == std::string("trustpdf version ") + TRUSTPDF_VERSION + "\n");
    cj2.job.run();
    assert(cj2.job.getExitCode() == 0);
}

static void
test_usage_error()
{
    // A command-line error is followed by the same usage text that --help prints.
    CapturedJob cj;
    char const* argv[] = {"/usr/bin/trustpdf", "--bogus", "x.pdf", nullptr};
    try {
        cj.job.initializeFromArgv(argv);
        assert(false);
    } catch (TPDFUsage& e) {
        cj.job.showUsageError(e.what());
    }
    assert(cj.out.empty());
    assert(cj.err.starts_with("[ERROR] unrecognized argument --bogus\n\n"));
    assert(
        cj.err.find("Usage: trustpdf [OPTIONS] <input.pdf> [output.pdf]\n") != std::string::npos);
    assert(cj.err.ends_with(TPDFJob::usageText("trustpdf")));

    CapturedJob help;
    char const* help_argv[] = {"trustpdf", "--help", nullptr};
    help.job.initializeFromArgv(help_argv);
    assert(help.out == TPDFJob::usageText("trustpdf"));

    // Errors from programmatic configuration use the default program name.
    CapturedJob cj2;
    try {
        cj2.job.config()->checkConfiguration();
        assert(false);
    } catch (TPDFUsage& e) {
        cj2.job.showUsageError(e.what());
    }
    assert(cj2.err.starts_with("[ERROR] an input file name is required\n"));
    assert(cj2.err.find("    trustpdf --batch document.pdf\n") != std::string::npos);
}

int
main()
{
    test_trusted_name();
    test_dpi();
    test_config();
    test_batch();
    test_argv();
    test_argv_errors();
    test_help();
    test_usage_error();
    std::cout << "job configuration tests done" << std::endl;
    return 0;
}
