#include <trustpdf/TPDFSystemError.hh>

#include <cstring>

TPDFSystemError::TPDFSystemError(std::string const& description, int system_errno) :
    std::runtime_error(createWhat(description, system_errno)),
    description(description),
    system_errno(system_errno)
{
}

std::string
TPDFSystemError::createWhat(std::string const& description, int system_errno)
{
    return description + ": " + strerror(system_errno);
}

std::string const&
TPDFSystemError::getDescription() const
{
    return description;
}

int
TPDFSystemError::getErrno() const
{
    return system_errno;
}
