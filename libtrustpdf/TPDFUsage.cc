#include <trustpdf/TPDFUsage.hh>

TPDFUsage::TPDFUsage(std::string const& msg) :
    std::runtime_error(msg)
{
}
