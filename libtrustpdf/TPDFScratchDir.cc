#include <trustpdf/TPDFScratchDir.hh>

#include <trustpdf/TPDFLogger.hh>
#include <trustpdf/TUtil.hh>

TPDFScratchDir::TPDFScratchDir(std::string const& prefix, std::shared_ptr<TPDFLogger> log) :
    path(TUtil::make_temp_directory(prefix.c_str())),
    log(log ? log : TPDFLogger::defaultLogger())
{
}

TPDFScratchDir::~TPDFScratchDir()
{
    try {
        TUtil::remove_recursively(path.c_str());
    } catch (std::exception& e) {
        try {
            log->warn("unable to remove temporary directory " + path + ": " + e.what());
        } catch (std::exception&) {
            // nothing more can be done from a destructor
        }
    }
}

std::string const&
TPDFScratchDir::getPath() const
{
    return path;
}

std::string
TPDFScratchDir::file(std::string const& name) const
{
    return path + "/" + name;
}
