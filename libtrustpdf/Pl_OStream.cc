#include <trustpdf/Pl_OStream.hh>

#include <unistd.h>

class Pl_OStream::Members
{
  public:
    Members(std::ostream& os) :
        os(os)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

    std::ostream& os;
};

Pl_OStream::Pl_OStream(std::ostream& os) :
    m(std::make_unique<Members>(os))
{
}

// Must be explicit and not inline -- see TRUSTPDF_DLL_CLASS in DLL.h
Pl_OStream::~Pl_OStream() = default;

void
Pl_OStream::write(char const* data, size_t len)
{
    m->os.write(data, static_cast<std::streamsize>(len));
}

void
Pl_OStream::finish()
{
    m->os.flush();
}

bool
Pl_OStream::isTerminal() const
{
    if (&m->os == &std::cout) {
        return isatty(STDOUT_FILENO) == 1;
    }
    if ((&m->os == &std::cerr) || (&m->os == &std::clog)) {
        return isatty(STDERR_FILENO) == 1;
    }
    return false;
}
