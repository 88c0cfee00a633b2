#include <trustpdf/TPDFJob.hh>

#include <trustpdf/Pipeline.hh>
#include <trustpdf/TPDFArgParser.hh>
#include <trustpdf/TPDFLogger.hh>

#include <memory>
#include <string>

namespace
{
    class ArgParser
    {
      public:
        ArgParser(
            TPDFArgParser& ap,
            std::shared_ptr<TPDFJob::Config> c_main,
            std::shared_ptr<TPDFLogger> log,
            bool& info_only);
        void parseOptions();

      private:
        void argPositional(std::string const&);
        void argDpi(std::string const&);
        void argBatch();
        void argVerbose();
        void argHelp();
        void argVersion();
        void finalCheck();

        void usage(std::string const& message);
        void initOptionTables();

        TPDFArgParser ap;
        std::shared_ptr<TPDFJob::Config> c_main;
        std::shared_ptr<TPDFLogger> log;
        bool& info_only;
        std::string dpi;
        bool gave_dpi{false};
        bool gave_input{false};
        bool gave_output{false};
    };
} // namespace

ArgParser::ArgParser(
    TPDFArgParser& ap,
    std::shared_ptr<TPDFJob::Config> c_main,
    std::shared_ptr<TPDFLogger> log,
    bool& info_only) :
    ap(ap),
    c_main(c_main),
    log(log),
    info_only(info_only)
{
    initOptionTables();
}

void
ArgParser::initOptionTables()
{
    auto b = [this](void (ArgParser::*f)()) { return TPDFArgParser::bindBare(f, this); };
    auto p = [this](void (ArgParser::*f)(std::string const&)) {
        return TPDFArgParser::bindParam(f, this);
    };

    ap.addPositional(p(&ArgParser::argPositional));
    ap.addRequiredParameter("dpi", p(&ArgParser::argDpi), "DPI");
    ap.addShortAlias('d', "dpi");
    ap.addBare("batch", b(&ArgParser::argBatch));
    ap.addShortAlias('b', "batch");
    ap.addBare("verbose", b(&ArgParser::argVerbose));
    ap.addShortAlias('v', "verbose");
    ap.addBare("help", b(&ArgParser::argHelp));
    ap.addShortAlias('h', "help");
    ap.addBare("version", b(&ArgParser::argVersion));
    ap.addFinalCheck(b(&ArgParser::finalCheck));
}

void
ArgParser::argPositional(std::string const& arg)
{
    if (!gave_input) {
        c_main->inputFile(arg);
        gave_input = true;
    } else if (!gave_output) {
        c_main->outputFile(arg);
        gave_output = true;
    } else {
        usage("too many arguments");
    }
}

void
ArgParser::argDpi(std::string const& parameter)
{
    // Validated in the final check so that --help is honored even after a bad value.
    dpi = parameter;
    gave_dpi = true;
}

void
ArgParser::argBatch()
{
    c_main->batch();
}

void
ArgParser::argVerbose()
{
    c_main->verbose();
}

void
ArgParser::argHelp()
{
    *log->getInfo() << TPDFJob::usageText(ap.getProgname());
    log->getInfo()->finish();
    info_only = true;
    ap.stopParsing();
}

void
ArgParser::argVersion()
{
    *log->getInfo() << ap.getProgname() << " version " << TRUSTPDF_VERSION << "\n";
    log->getInfo()->finish();
    info_only = true;
    ap.stopParsing();
}

void
ArgParser::finalCheck()
{
    if (gave_dpi) {
        c_main->dpi(dpi);
    }
    c_main->checkConfiguration();
}

void
ArgParser::usage(std::string const& message)
{
    ap.usage(message);
}

void
ArgParser::parseOptions()
{
    ap.parseArgs();
}

void
TPDFJob::initializeFromArgv(char const* const argv[])
{
    int argc = 0;
    for (auto k = argv; *k; ++k) {
        ++argc;
    }
    TPDFArgParser qap(argc, argv);
    m->progname = qap.getProgname();
    ArgParser ap(qap, config(), m->log, m->info_only);
    ap.parseOptions();
}

std::string
TPDFJob::usageText(std::string const& whoami)
{
    // clang-format off
    // Make sure the output looks right on an 80-column display.
    //               1         2         3         4         5         6         7         8
    //      12345678901234567890123456789012345678901234567890123456789012345678901234567890
    return
        "Usage: " + whoami + " [OPTIONS] <input.pdf> [output.pdf]\n"
        "\n"
        "Convert PDF to trusted format by converting to images and back to PDF.\n"
        "This removes JavaScript, forms, links, and other potentially dangerous elements.\n"
        "\n"
        "OPTIONS:\n"
        "    -d, --dpi DPI       Set DPI for conversion (default: " +
        std::to_string(DEFAULT_DPI) + ", range: " + std::to_string(MIN_DPI) + "-" +
        std::to_string(MAX_DPI) + ")\n"
        "    -b, --batch         Batch mode: write <input>.trusted.pdf, ignoring any\n"
        "                        output file argument\n"
        "    -h, --help          Show this help message\n"
        "    -v, --verbose       Show each external command before running it\n"
        "        --version       Show the version and exit\n"
        "\n"
        "EXAMPLES:\n"
        "    " + whoami + " document.pdf trusted_document.pdf\n"
        "    " + whoami + " --batch document.pdf\n"
        "    " + whoami + " -d 600 high_quality.pdf output.pdf\n"
        "\n"
        "REQUIREMENTS:\n"
        "    - ImageMagick (magick or convert)\n"
        "    - Ghostscript (gs)\n";
    // clang-format on
}

void
TPDFJob::showUsageError(std::string const& msg)
{
    m->log->error(msg);
    *m->log->getError() << "\n" << usageText(m->progname);
    m->log->getError()->finish();
}
