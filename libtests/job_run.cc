#include <trustpdf/assert_test.h>

#include "fake_tools.hh"

#include <trustpdf/Pl_String.hh>
#include <trustpdf/TPDFExc.hh>
#include <trustpdf/TPDFJob.hh>
#include <trustpdf/TPDFLogger.hh>

#include <iostream>
#include <sstream>
#include <unistd.h>

using namespace fake_tools;

namespace
{
    struct CapturedJob
    {
        CapturedJob(std::string const& answer = "") :
            prompt(answer)
        {
            log->setInfo(std::make_shared<Pl_String>(out));
            log->setError(std::make_shared<Pl_String>(err));
            job.setLogger(log);
            job.setPromptInput(&prompt);
        }

        // Run the job and return the exception it threw.
        TPDFExc
        fail()
        {
            try {
                job.run();
            } catch (TPDFExc& e) {
                return e;
            }
            assert(false);
            return TPDFExc(tpdf_e_internal, "", "");
        }

        bool
        printed(std::string const& s) const
        {
            return out.find(s) != std::string::npos;
        }

        bool
        warned(std::string const& s) const
        {
            return err.find(s) != std::string::npos;
        }

        std::shared_ptr<TPDFLogger> log{TPDFLogger::create()};
        std::string out;
        std::string err;
        std::istringstream prompt;
        TPDFJob job;
    };

    std::string const pdf_data = "%PDF-1.7\n%\xe2\xe3\xcf\xd3\n1 0 obj\n<< >>\nendobj\n%%EOF\n";
} // namespace

static void
test_success()
{
    Area a;
    std::string in = a.work + "/report.pdf";
    write_file(in, pdf_data);
    setenv("FAKE_PAGES", "3", 1);

    CapturedJob cj;
    cj.job.config()->inputFile(in)->checkConfiguration();
    assert(cj.job.getOutputFile() == a.work + "/report.trusted.pdf");
    cj.job.run();
    assert(cj.job.getExitCode() == 0);
    assert(!cj.job.wasCancelled());

    std::string out = a.work + "/report.trusted.pdf";
    std::string produced = read_file(out);
    assert(
        produced ==
        "%PDF-1.4\n% pages: 3\npage-000.png\npage-001.png\npage-002.png\n% optimized\n");
    assert(a.scratchClean());

    auto const& r = cj.job.getResult();
    assert(r.page_count == 3);
    assert(r.dpi == 300);
    assert(r.optimized);
    assert(r.original_size_known);
    assert(r.original_size == pdf_data.length());
    assert(r.output_size_known);
    assert(r.output_size == produced.length());

    std::string expected_start = "[INFO] Converting PDF to trusted format...\n"
                                 "[INFO] Input: " +
        in +
        " (PDF 1.7)\n"
        "[INFO] Output: " +
        out +
        "\n"
        "[INFO] DPI: 300\n"
        "[INFO] Step 1: Converting PDF pages to images...\n"
        "[INFO] Generated 3 page images\n"
        "[INFO] Step 2: Converting images back to PDF...\n"
        "[INFO] Step 3: Optimizing output PDF...\n"
        "[INFO] PDF optimization completed\n"
        "[SUCCESS] PDF conversion completed successfully!\n"
        "[INFO] Summary:\n";
    assert(cj.out.starts_with(expected_start));
    assert(cj.printed(
        "[INFO]   - Original file: " + in + " (" + std::to_string(pdf_data.length()) +
        " bytes)\n"));
    assert(cj.printed(
        "[INFO]   - Trusted file: " + out + " (" + std::to_string(produced.length()) +
        " bytes)\n"));
    assert(cj.printed("[INFO]   - Pages processed: 3\n"));
    assert(cj.printed("[INFO]   - DPI used: 300\n"));
    assert(cj.printed("[INFO]   - Optimized: yes\n"));
    assert(
        cj.err ==
        "[WARNING] Note: Text is now embedded as images and cannot be selected or searched.\n");
    // Commands are not echoed without verbose.
    assert(!cj.printed("Running:"));
}

static void
test_page_order()
{
    Area a;
    std::string in = a.work + "/long.pdf";
    write_file(in, pdf_data);
    setenv("FAKE_PAGES", "12", 1);

    CapturedJob cj;
    cj.job.config()->inputFile(in)->outputFile(a.work + "/out.pdf");
    cj.job.run();
    std::string expected = "%PDF-1.4\n% pages: 12\n";
    for (int i = 0; i < 12; ++i) {
        std::string n = std::to_string(i);
        expected += "page-" + std::string(3 - n.length(), '0') + n + ".png\n";
    }
    expected += "% optimized\n";
    assert(read_file(a.work + "/out.pdf") == expected);
    assert(cj.job.getResult().page_count == 12);

    std::vector<std::string> names = {
        "page-1000.png",
        "optimized.pdf",
        "page-010.png",
        "page-999.png",
        "page-002.png",
        "page-.png",
        "page-01a.png",
        "page-1.png",
        "page-000.png",
        "page-001.pngx",
        "xpage-003.png"};
    std::vector<std::string> wanted = {
        "page-000.png",
        "page-1.png",
        "page-002.png",
        "page-010.png",
        "page-999.png",
        "page-1000.png"};
    assert(TPDFJob::sortPageImages(names) == wanted);
}

static void
test_verbose()
{
    Area a;
    std::string in = a.work + "/report.pdf";
    write_file(in, pdf_data);

    CapturedJob cj;
    cj.job.config()->inputFile(in)->dpi("150")->verbose();
    cj.job.run();
    assert(cj.printed("[INFO] DPI: 150\n"));
    assert(cj.printed("[INFO] Running: " + a.bin + "/magick -density 150 pdf:" + in + " png:"));
    assert(cj.printed("/page-%03d.png\n"));
    assert(cj.printed(
        "[INFO] Running: " + a.bin +
        "/gs -q -dNOPAUSE -dBATCH -dSAFER -sDEVICE=pdfwrite -dCompatibilityLevel=1.4 "
        "-dPDFSETTINGS=/default -sOutputFile="));
    assert(cj.printed("[INFO]   - DPI used: 150\n"));
    assert(cj.job.getResult().dpi == 150);
    assert(a.scratchClean());
}

static void
test_optimize_failure()
{
    Area a;
    std::string in = a.work + "/report.pdf";
    std::string out = a.work + "/report.trusted.pdf";
    write_file(in, pdf_data);
    setenv("FAKE_PAGES", "2", 1);
    setenv("FAKE_GS_FAIL", "1", 1);

    CapturedJob cj;
    cj.job.config()->inputFile(in);
    cj.job.run();
    assert(cj.job.getExitCode() == 0);
    assert(!cj.job.getResult().optimized);
    assert(read_file(out) == "%PDF-1.4\n% pages: 2\npage-000.png\npage-001.png\n");
    assert(cj.warned("[WARNING] PDF optimization failed, keeping unoptimized version\n"));
    assert(!cj.printed("PDF optimization completed"));
    assert(cj.printed("[SUCCESS] PDF conversion completed successfully!\n"));
    assert(cj.printed("[INFO]   - Optimized: no\n"));
    assert(a.scratchClean());
}

static void
test_stage_failures()
{
    Area a;
    std::string in = a.work + "/report.pdf";
    std::string out = a.work + "/report.trusted.pdf";
    write_file(in, pdf_data);

    setenv("FAKE_RASTER_FAIL", "1", 1);
    {
        CapturedJob cj;
        cj.job.config()->inputFile(in);
        auto e = cj.fail();
        assert(e.getErrorCode() == tpdf_e_stage);
        assert(std::string(e.what()) == in + ": failed to convert PDF to images");
        assert(cj.printed("[INFO] Step 1: Converting PDF pages to images...\n"));
        assert(!cj.printed("Step 2"));
        // The failing command is only shown in verbose mode.
        assert(!cj.warned("Failed command"));
    }
    assert(a.scratchClean());
    assert(!TUtil::is_regular_file(out.c_str()));
    unsetenv("FAKE_RASTER_FAIL");

    setenv("FAKE_PAGES", "0", 1);
    {
        CapturedJob cj;
        cj.job.config()->inputFile(in);
        auto e = cj.fail();
        assert(e.getErrorCode() == tpdf_e_stage);
        assert(e.getMessageDetail() == "no images were generated from PDF");
        assert(cj.printed("[INFO] Generated 0 page images\n"));
    }
    assert(a.scratchClean());
    unsetenv("FAKE_PAGES");

    setenv("FAKE_ASSEMBLE_FAIL", "1", 1);
    {
        CapturedJob cj;
        cj.job.config()->inputFile(in)->verbose();
        auto e = cj.fail();
        assert(e.getErrorCode() == tpdf_e_stage);
        assert(e.getFilename() == out);
        assert(e.getMessageDetail() == "failed to convert images back to PDF");
        assert(cj.warned("[ERROR] Failed command: " + a.bin + "/magick png:"));
        assert(!cj.printed("Step 3"));
    }
    assert(a.scratchClean());
    unsetenv("FAKE_ASSEMBLE_FAIL");
}

static void
test_bad_input()
{
    Area a;
    auto check = [&a](std::string const& in, std::string const& detail) {
        CapturedJob cj;
        cj.job.config()->inputFile(in);
        auto e = cj.fail();
        assert(e.getErrorCode() == tpdf_e_input);
        assert(e.getFilename() == in);
        assert(e.getMessageDetail() == detail);
        assert(std::string(e.what()) == in + ": " + detail);
        assert(!cj.printed("Converting PDF"));
        assert(a.scratchClean());
    };

    check(a.work + "/missing.pdf", "input file does not exist");
    check(a.work, "input file does not exist");

    std::string text = a.work + "/text.pdf";
    write_file(text, "This is not a PDF file.\n");
    check(text, "input file is not a PDF");

    std::string empty = a.work + "/empty.pdf";
    write_file(empty, "");
    check(empty, "input file is not a PDF");

    std::string late = a.work + "/late.pdf";
    write_file(late, std::string(1024, ' ') + "%PDF-1.4\n");
    check(late, "input file is not a PDF");

    // A header after some leading junk is still a PDF.
    std::string junk = a.work + "/junk.pdf";
    write_file(junk, std::string(100, 'x') + "%PDF-1.5\n");
    CapturedJob cj;
    cj.job.config()->inputFile(junk);
    cj.job.run();
    assert(cj.printed("[INFO] Input: " + junk + " (PDF 1.5)\n"));
}

static void
test_missing_dependencies()
{
    Area a(false);
    std::string in = a.work + "/report.pdf";
    write_file(in, pdf_data);

    CapturedJob cj;
    cj.job.config()->inputFile(in);
    auto e = cj.fail();
    assert(e.getErrorCode() == tpdf_e_dependency);
    assert(std::string(e.what()).starts_with("Missing dependencies: ghostscript; install with: "));
    assert(cj.out.empty());
    assert(a.scratchClean());
    assert(!TUtil::is_regular_file((a.work + "/report.trusted.pdf").c_str()));

    // Missing dependencies are detected before the input is looked at.
    CapturedJob cj2;
    cj2.job.config()->inputFile(a.work + "/missing.pdf");
    assert(cj2.fail().getErrorCode() == tpdf_e_dependency);
}

static void
test_overwrite()
{
    Area a(false);
    std::string in = a.work + "/report.pdf";
    std::string out = a.work + "/report.trusted.pdf";
    write_file(in, pdf_data);
    write_file(out, "keep me\n");

    // Declining happens before the dependency check, so gs being absent doesn't matter.
    for (auto answer: {"n\n", "", "\n", "no\n", "nope y\n"}) {
        CapturedJob cj(answer);
        cj.job.config()->inputFile(in);
        cj.job.run();
        assert(cj.job.wasCancelled());
        assert(cj.job.getExitCode() == 0);
        assert(cj.out.starts_with("Output file already exists. Overwrite? (y/N): "));
        assert(cj.printed("[INFO] Operation cancelled by user\n"));
        assert(read_file(out) == "keep me\n");
    }
    assert(a.scratchClean());

    write_file(a.bin + "/gs", gs_script, 0755);
    for (auto answer: {"y\n", " Yes\n", "Y"}) {
        write_file(out, "keep me\n");
        CapturedJob cj(answer);
        cj.job.config()->inputFile(in);
        cj.job.run();
        assert(!cj.job.wasCancelled());
        assert(read_file(out) == "%PDF-1.4\n% pages: 1\npage-000.png\n% optimized\n");
    }

    // Replacing the input itself is allowed once confirmed; sizes refer to the original.
    CapturedJob cj("y\n");
    cj.job.config()->inputFile(in)->outputFile(in);
    cj.job.run();
    assert(cj.job.getResult().original_size == pdf_data.length());
    assert(cj.warned("[WARNING] the input file will be replaced by the trusted version\n"));
    assert(read_file(in) == "%PDF-1.4\n% pages: 1\npage-000.png\n% optimized\n");
    assert(a.scratchClean());
}

static void
test_batch()
{
    Area a;
    std::string in = a.work + "/report.pdf";
    write_file(in, pdf_data);

    CapturedJob cj;
    char const* argv[] = {"trustpdf", "--batch", in.c_str(), "custom.pdf", nullptr};
    cj.job.initializeFromArgv(argv);
    cj.job.run();
    assert(TUtil::is_regular_file((a.work + "/report.trusted.pdf").c_str()));
    assert(!TUtil::is_regular_file((a.work + "/custom.pdf").c_str()));
    assert(!TUtil::is_regular_file("custom.pdf"));
    assert(cj.warned("[WARNING] batch mode: ignoring output file custom.pdf\n"));
}

static void
test_odd_names()
{
    Area a;
    assert(chdir(a.work.c_str()) == 0);
    std::string in = "-odd name's.pdf";
    std::string out = "-out $(x).pdf";
    write_file(in, pdf_data);

    CapturedJob cj;
    char const* argv[] = {"trustpdf", "-v", "--", in.c_str(), out.c_str(), nullptr};
    cj.job.initializeFromArgv(argv);
    cj.job.run();
    assert(cj.job.getResult().optimized);
    assert(read_file(out) == "%PDF-1.4\n% pages: 1\npage-000.png\n% optimized\n");
    // Ghostscript sees the output as a file, not an option.
    assert(cj.printed(" './-out $(x).pdf'\n"));
    assert(cj.printed(" 'pdf:-odd name'\\''s.pdf' "));
    assert(chdir("/") == 0);
    assert(a.scratchClean());
}

int
main()
{
    test_success();
    test_page_order();
    test_verbose();
    test_optimize_failure();
    test_stage_failures();
    test_bad_input();
    test_missing_dependencies();
    test_overwrite();
    test_batch();
    test_odd_names();
    std::cout << "job run tests done" << std::endl;
    return 0;
}
