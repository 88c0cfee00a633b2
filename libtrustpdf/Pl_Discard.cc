#include <trustpdf/Pl_Discard.hh>

// Must be explicit and not inline -- see TRUSTPDF_DLL_CLASS in DLL.h
Pl_Discard::~Pl_Discard() = default;

void
Pl_Discard::write(char const*, size_t)
{
}

void
Pl_Discard::finish()
{
}
