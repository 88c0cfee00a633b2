#include <trustpdf/Pl_String.hh>

Pl_String::Pl_String(std::string& s) :
    s(s)
{
}

// Must be explicit and not inline -- see TRUSTPDF_DLL_CLASS in DLL.h
Pl_String::~Pl_String() = default;

void
Pl_String::write(char const* data, size_t len)
{
    s.append(data, len);
}

void
Pl_String::finish()
{
}
