#include <trustpdf/TPDFExc.hh>

TPDFExc::TPDFExc(
    tpdf_error_code_e error_code, std::string const& filename, std::string const& message) :
    std::runtime_error(createWhat(filename, message)),
    error_code(error_code),
    filename(filename),
    message(message)
{
}

std::string
TPDFExc::createWhat(std::string const& filename, std::string const& message)
{
    if (filename.empty()) {
        return message;
    }
    return filename + ": " + message;
}

tpdf_error_code_e
TPDFExc::getErrorCode() const
{
    return error_code;
}

std::string const&
TPDFExc::getFilename() const
{
    return filename;
}

std::string const&
TPDFExc::getMessageDetail() const
{
    return message;
}
