#include <trustpdf/Pipeline.hh>

#include <cstring>

Pipeline&
Pipeline::operator<<(char const* cstr)
{
    write(cstr, strlen(cstr));
    return *this;
}

Pipeline&
Pipeline::operator<<(std::string const& str)
{
    write(str.data(), str.length());
    return *this;
}

Pipeline&
Pipeline::operator<<(int i)
{
    return *this << std::to_string(i);
}
