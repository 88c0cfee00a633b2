#include <trustpdf/TPDFLogger.hh>

#include <trustpdf/Pl_Discard.hh>
#include <trustpdf/Pl_OStream.hh>

#include <stdexcept>

namespace
{
    char const* const RED = "\033[0;31m";
    char const* const GREEN = "\033[0;32m";
    char const* const YELLOW = "\033[1;33m";
    char const* const BLUE = "\033[0;34m";
    char const* const RESET = "\033[0m";
} // namespace

TPDFLogger::Members::Members() :
    p_discard(new Pl_Discard()),
    p_stdout(new Pl_OStream(std::cout)),
    p_stderr(new Pl_OStream(std::cerr)),
    p_info(p_stdout),
    p_success(nullptr),
    p_warn(nullptr),
    p_error(p_stderr)
{
}

TPDFLogger::Members::~Members()
{
    p_stdout->finish();
    p_stderr->finish();
}

TPDFLogger::TPDFLogger() :
    m(new Members())
{
}

std::shared_ptr<TPDFLogger>
TPDFLogger::create()
{
    return std::shared_ptr<TPDFLogger>(new TPDFLogger);
}

std::shared_ptr<TPDFLogger>
TPDFLogger::defaultLogger()
{
    static auto l = create();
    return l;
}

void
TPDFLogger::writeMarked(
    std::shared_ptr<Pipeline> p, char const* marker, char const* color, std::string const& msg)
{
    bool use_color = (m->color == Members::c_on);
    if (m->color == Members::c_auto) {
        auto os = std::dynamic_pointer_cast<Pl_OStream>(p);
        use_color = os && os->isTerminal();
    }
    if (use_color) {
        *p << color << marker << RESET << " " << msg << "\n";
    } else {
        *p << marker << " " << msg << "\n";
    }
    // Progress has to be visible while a long external stage runs.
    p->finish();
}

void
TPDFLogger::info(std::string const& s)
{
    writeMarked(getInfo(false), "[INFO]", BLUE, s);
}

std::shared_ptr<Pipeline>
TPDFLogger::getInfo(bool null_okay)
{
    return throwIfNull(m->p_info, null_okay);
}

void
TPDFLogger::success(std::string const& s)
{
    writeMarked(getSuccess(false), "[SUCCESS]", GREEN, s);
}

std::shared_ptr<Pipeline>
TPDFLogger::getSuccess(bool null_okay)
{
    if (m->p_success) {
        return m->p_success;
    }
    return getInfo(null_okay);
}

void
TPDFLogger::warn(std::string const& s)
{
    writeMarked(getWarn(false), "[WARNING]", YELLOW, s);
}

std::shared_ptr<Pipeline>
TPDFLogger::getWarn(bool null_okay)
{
    if (m->p_warn) {
        return m->p_warn;
    }
    return getError(null_okay);
}

void
TPDFLogger::error(std::string const& s)
{
    writeMarked(getError(false), "[ERROR]", RED, s);
}

std::shared_ptr<Pipeline>
TPDFLogger::getError(bool null_okay)
{
    return throwIfNull(m->p_error, null_okay);
}

std::shared_ptr<Pipeline>
TPDFLogger::standardOutput()
{
    return m->p_stdout;
}

std::shared_ptr<Pipeline>
TPDFLogger::standardError()
{
    return m->p_stderr;
}

std::shared_ptr<Pipeline>
TPDFLogger::discard()
{
    return m->p_discard;
}

void
TPDFLogger::setInfo(std::shared_ptr<Pipeline> p)
{
    if (p == nullptr) {
        p = m->p_stdout;
    }
    m->p_info = p;
}

void
TPDFLogger::setSuccess(std::shared_ptr<Pipeline> p)
{
    m->p_success = p;
}

void
TPDFLogger::setWarn(std::shared_ptr<Pipeline> p)
{
    m->p_warn = p;
}

void
TPDFLogger::setError(std::shared_ptr<Pipeline> p)
{
    if (p == nullptr) {
        p = m->p_stderr;
    }
    m->p_error = p;
}

void
TPDFLogger::setOutputStreams(std::ostream* out_stream, std::ostream* err_stream)
{
    if (out_stream == &std::cout) {
        out_stream = nullptr;
    }
    if (err_stream == &std::cerr) {
        err_stream = nullptr;
    }
    std::shared_ptr<Pipeline> new_out;
    std::shared_ptr<Pipeline> new_err;

    if (out_stream == nullptr) {
        new_out = m->p_stdout;
    } else {
        new_out = std::make_shared<Pl_OStream>(*out_stream);
    }
    if (err_stream == nullptr) {
        new_err = m->p_stderr;
    } else {
        new_err = std::make_shared<Pl_OStream>(*err_stream);
    }
    m->p_info = new_out;
    m->p_success = nullptr;
    m->p_warn = nullptr;
    m->p_error = new_err;
}

void
TPDFLogger::setColor(bool on)
{
    m->color = on ? Members::c_on : Members::c_off;
}

std::shared_ptr<Pipeline>
TPDFLogger::throwIfNull(std::shared_ptr<Pipeline> p, bool null_okay)
{
    if (!(null_okay || p)) {
        throw std::logic_error("TPDFLogger: requested a null pipeline without null_okay == true");
    }
    return p;
}
