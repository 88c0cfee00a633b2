#include <trustpdf/TPDFJob.hh>

#include <trustpdf/Pipeline.hh>
#include <trustpdf/TPDFCommand.hh>
#include <trustpdf/TPDFDependencies.hh>
#include <trustpdf/TPDFExc.hh>
#include <trustpdf/TPDFLogger.hh>
#include <trustpdf/TPDFScratchDir.hh>
#include <trustpdf/TPDFSignals.hh>
#include <trustpdf/TPDFSystemError.hh>
#include <trustpdf/TPDFUsage.hh>
#include <trustpdf/TUtil.hh>

#include <algorithm>

namespace
{
    // PDF readers accept a header anywhere in the first 1024 bytes.
    size_t constexpr HEADER_SEARCH_LENGTH = 1024;

    std::string
    size_string(bool known, unsigned long long size)
    {
        return known ? std::to_string(size) : std::string("unknown");
    }

    bool
    is_page_image(std::string const& name)
    {
        static std::string const prefix = "page-";
        static std::string const suffix = ".png";
        if (name.length() <= prefix.length() + suffix.length()) {
            return false;
        }
        if (!(name.starts_with(prefix) && name.ends_with(suffix))) {
            return false;
        }
        for (size_t i = prefix.length(); i < name.length() - suffix.length(); ++i) {
            if (!TUtil::is_digit(name.at(i))) {
                return false;
            }
        }
        return true;
    }

    // The digits of the page number without leading zeroes.
    std::string
    page_number(std::string const& name)
    {
        std::string digits = name.substr(5, name.length() - 9);
        size_t first = digits.find_first_not_of('0');
        return (first == std::string::npos) ? "" : digits.substr(first);
    }
} // namespace

TPDFJob::Members::Members() :
    log(TPDFLogger::defaultLogger())
{
}

TPDFJob::TPDFJob() :
    m(new Members())
{
}

void
TPDFJob::usage(std::string const& msg)
{
    throw TPDFUsage(msg);
}

std::shared_ptr<TPDFLogger>
TPDFJob::getLogger()
{
    return m->log;
}

void
TPDFJob::setLogger(std::shared_ptr<TPDFLogger> l)
{
    m->log = l;
}

void
TPDFJob::setPromptInput(std::istream* input)
{
    m->prompt_input = input;
}

void
TPDFJob::doIfVerbose(std::function<void(TPDFLogger&)> fn)
{
    if (m->verbose) {
        fn(*m->log);
    }
}

std::shared_ptr<TPDFJob::Config>
TPDFJob::config()
{
    return std::shared_ptr<Config>(new Config(*this));
}

std::string const&
TPDFJob::getInputFile() const
{
    return m->infilename;
}

std::string const&
TPDFJob::getOutputFile() const
{
    return m->outfilename;
}

int
TPDFJob::getDPI() const
{
    return m->dpi;
}

int
TPDFJob::getExitCode() const
{
    return tpdf_exit_success;
}

bool
TPDFJob::wasCancelled() const
{
    return m->cancelled;
}

TPDFJob::Result const&
TPDFJob::getResult() const
{
    return m->result;
}

std::string
TPDFJob::trustedName(std::string const& input)
{
    size_t slash = input.rfind('/');
    size_t base_start = (slash == std::string::npos) ? 0 : slash + 1;
    size_t dot = input.rfind('.');
    // A leading dot names a hidden file, not an extension.
    if ((dot == std::string::npos) || (dot <= base_start)) {
        return input + ".trusted.pdf";
    }
    return input.substr(0, dot) + ".trusted.pdf";
}

std::vector<std::string>
TPDFJob::sortPageImages(std::vector<std::string> const& names)
{
    std::vector<std::string> result;
    for (auto const& name: names) {
        if (is_page_image(name)) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end(), [](std::string const& a, std::string const& b) {
        auto na = page_number(a);
        auto nb = page_number(b);
        if (na.length() != nb.length()) {
            return na.length() < nb.length();
        }
        if (na != nb) {
            return na < nb;
        }
        return a < b;
    });
    return result;
}

void
TPDFJob::checkConfiguration()
{
    if (m->infilename.empty()) {
        usage("an input file name is required");
    }
    if (m->batch) {
        if ((!m->given_outfilename.empty()) && (!m->configured)) {
            m->log->warn("batch mode: ignoring output file " + m->given_outfilename);
        }
        m->outfilename = trustedName(m->infilename);
    } else if (m->given_outfilename.empty()) {
        m->outfilename = trustedName(m->infilename);
    } else {
        m->outfilename = m->given_outfilename;
    }
    m->configured = true;
}

bool
TPDFJob::confirmOverwrite()
{
    auto p = m->log->getInfo();
    *p << "Output file already exists. Overwrite? (y/N): ";
    p->finish();
    std::string answer;
    if (!std::getline(*m->prompt_input, answer)) {
        // End of input is a "no".
        *p << "\n";
        p->finish();
        return false;
    }
    for (char ch: answer) {
        if (!TUtil::is_space(ch)) {
            return ((ch == 'y') || (ch == 'Y'));
        }
    }
    return false;
}

std::string
TPDFJob::validateInput()
{
    char const* filename = m->infilename.c_str();
    if (!TUtil::is_regular_file(filename)) {
        throw TPDFExc(tpdf_e_input, m->infilename, "input file does not exist");
    }
    std::string prefix;
    try {
        prefix = TUtil::read_file_prefix(filename, HEADER_SEARCH_LENGTH);
    } catch (std::runtime_error& e) {
        throw TPDFExc(tpdf_e_input, m->infilename, std::string("unable to read: ") + e.what());
    }
    size_t pos = prefix.find("%PDF-");
    if (pos == std::string::npos) {
        throw TPDFExc(tpdf_e_input, m->infilename, "input file is not a PDF");
    }
    std::string version;
    for (size_t i = pos + 5; i < prefix.length(); ++i) {
        char ch = prefix.at(i);
        if (!(TUtil::is_digit(ch) || (ch == '.'))) {
            break;
        }
        version += ch;
    }
    return version;
}

int
TPDFJob::runCommand(TPDFCommand const& cmd)
{
    // A signal that arrived while no child was running is noticed here.
    TPDFSignals::checkInterrupted();
    doIfVerbose([&](TPDFLogger& log) { log.info("Running: " + cmd.unparse()); });
    int status = cmd.run(m->verbose);
    TPDFSignals::checkInterrupted();
    if (status != 0) {
        doIfVerbose([&](TPDFLogger& log) { log.error("Failed command: " + cmd.unparse()); });
    }
    return status;
}

std::vector<std::string>
TPDFJob::rasterize(TPDFDependencies const& deps, TPDFScratchDir const& scratch)
{
    // The explicit coder prefixes keep ImageMagick from reading anything in the file names as a
    // format or an option.
    TPDFCommand cmd(
        deps.getRasterizer(),
        {"-density",
         std::to_string(m->dpi),
         "pdf:" + m->infilename,
         "png:" + scratch.file("page-%03d.png")});
    if (runCommand(cmd) != 0) {
        throw TPDFExc(tpdf_e_stage, m->infilename, "failed to convert PDF to images");
    }

    std::vector<std::string> pages;
    for (auto const& name: sortPageImages(TUtil::list_directory(scratch.getPath().c_str()))) {
        pages.push_back(scratch.file(name));
    }
    m->log->info("Generated " + std::to_string(pages.size()) + " page images");
    if (pages.empty()) {
        throw TPDFExc(tpdf_e_stage, m->infilename, "no images were generated from PDF");
    }
    return pages;
}

void
TPDFJob::reassemble(TPDFDependencies const& deps, std::vector<std::string> const& pages)
{
    std::vector<std::string> args;
    for (auto const& page: pages) {
        args.push_back("png:" + page);
    }
    args.push_back("pdf:" + m->outfilename);
    TPDFCommand cmd(deps.getRasterizer(), args);
    TPDFSignals::checkInterrupted();
    m->writing_output = true;
    if (runCommand(cmd) != 0) {
        throw TPDFExc(tpdf_e_stage, m->outfilename, "failed to convert images back to PDF");
    }
}

bool
TPDFJob::optimize(TPDFDependencies const& deps, TPDFScratchDir const& scratch)
{
    std::string optimized = scratch.file("optimized.pdf");
    std::string source = m->outfilename;
    if (source.starts_with("-")) {
        source = "./" + source;
    }
    TPDFCommand cmd(
        deps.getOptimizer(),
        {"-q",
         "-dNOPAUSE",
         "-dBATCH",
         "-dSAFER",
         "-sDEVICE=pdfwrite",
         "-dCompatibilityLevel=1.4",
         "-dPDFSETTINGS=/default",
         "-sOutputFile=" + optimized,
         source});

    int status = -1;
    try {
        status = runCommand(cmd);
    } catch (TPDFSystemError& e) {
        m->log->warn(e.what());
    }
    if ((status == 0) && TUtil::is_regular_file(optimized.c_str())) {
        try {
            TUtil::move_file(optimized.c_str(), m->outfilename.c_str());
            m->log->info("PDF optimization completed");
            return true;
        } catch (TPDFSystemError& e) {
            m->log->warn(e.what());
        }
    }
    m->log->warn("PDF optimization failed, keeping unoptimized version");
    return false;
}

void
TPDFJob::discardOutput()
{
    if (!TUtil::is_regular_file(m->outfilename.c_str())) {
        return;
    }
    m->log->warn("removing incomplete output file " + m->outfilename);
    try {
        TUtil::remove_file(m->outfilename.c_str());
    } catch (TPDFSystemError& e) {
        m->log->warn(e.what());
    }
}

void
TPDFJob::summarize()
{
    auto& r = m->result;
    r.output_size_known = TUtil::get_file_size(m->outfilename.c_str(), &r.output_size);

    m->log->success("PDF conversion completed successfully!");
    m->log->info("Summary:");
    m->log->info(
        "  - Original file: " + m->infilename + " (" +
        size_string(r.original_size_known, r.original_size) + " bytes)");
    m->log->info(
        "  - Trusted file: " + m->outfilename + " (" +
        size_string(r.output_size_known, r.output_size) + " bytes)");
    m->log->info("  - Pages processed: " + std::to_string(r.page_count));
    m->log->info("  - DPI used: " + std::to_string(r.dpi));
    m->log->info(std::string("  - Optimized: ") + (r.optimized ? "yes" : "no"));
    m->log->warn("Note: Text is now embedded as images and cannot be selected or searched.");
}

void
TPDFJob::run()
{
    if (m->info_only) {
        return;
    }
    if (!m->configured) {
        checkConfiguration();
    }
    m->cancelled = false;
    m->writing_output = false;
    m->result = Result();

    if (TUtil::is_regular_file(m->outfilename.c_str()) && (!confirmOverwrite())) {
        m->log->info("Operation cancelled by user");
        m->cancelled = true;
        return;
    }

    if (TUtil::same_file(m->infilename.c_str(), m->outfilename.c_str())) {
        m->log->warn("the input file will be replaced by the trusted version");
    }

    TPDFDependencies deps;
    deps.check();

    std::string version = validateInput();
    m->log->info("Converting PDF to trusted format...");
    m->log->info(
        "Input: " + m->infilename + (version.empty() ? "" : " (PDF " + version + ")"));
    m->log->info("Output: " + m->outfilename);
    m->log->info("DPI: " + std::to_string(m->dpi));
    m->result.dpi = m->dpi;
    // Measured now because the output may replace the input.
    m->result.original_size_known =
        TUtil::get_file_size(m->infilename.c_str(), &m->result.original_size);

    // The guard outlives the scratch directory, so an interruption at any point from here on
    // unwinds through the directory's destructor.
    TPDFSignals::Guard guard;
    TPDFScratchDir scratch("trustpdf-", m->log);

    m->log->info("Step 1: Converting PDF pages to images...");
    auto pages = rasterize(deps, scratch);
    m->result.page_count = pages.size();

    try {
        m->log->info("Step 2: Converting images back to PDF...");
        reassemble(deps, pages);

        m->log->info("Step 3: Optimizing output PDF...");
        m->result.optimized = optimize(deps, scratch);
        TPDFSignals::checkInterrupted();
    } catch (TPDFExc& e) {
        // Once reassembly has started, an interrupted run leaves no output behind.
        if ((e.getErrorCode() == tpdf_e_interrupted) && m->writing_output) {
            discardOutput();
        }
        throw;
    }

    summarize();
}
