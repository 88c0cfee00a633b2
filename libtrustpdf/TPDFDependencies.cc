#include <trustpdf/TPDFDependencies.hh>

#include <trustpdf/TPDFExc.hh>
#include <trustpdf/TUtil.hh>

TPDFDependencies::TPDFDependencies() :
    m(new Members())
{
    std::string path;
    TUtil::get_env("PATH", &path);
    locate(path);
}

TPDFDependencies::TPDFDependencies(std::string const& search_path) :
    m(new Members())
{
    locate(search_path);
}

void
TPDFDependencies::locate(std::string const& search_path)
{
    m->rasterizer = findProgram("magick", search_path);
    if (m->rasterizer.empty()) {
        m->rasterizer = findProgram("convert", search_path);
    }
    m->optimizer = findProgram("gs", search_path);
}

std::string
TPDFDependencies::findProgram(std::string const& name, std::string const& search_path)
{
    size_t start = 0;
    while (true) {
        size_t colon = search_path.find(':', start);
        std::string dir = search_path.substr(
            start, (colon == std::string::npos) ? std::string::npos : colon - start);
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = (dir.back() == '/') ? dir + name : dir + "/" + name;
        if (TUtil::is_executable(candidate.c_str())) {
            return candidate;
        }
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    return "";
}

std::string const&
TPDFDependencies::getRasterizer() const
{
    return m->rasterizer;
}

std::string const&
TPDFDependencies::getOptimizer() const
{
    return m->optimizer;
}

std::vector<std::string>
TPDFDependencies::getMissing() const
{
    std::vector<std::string> result;
    if (m->rasterizer.empty()) {
        result.emplace_back("imagemagick");
    }
    if (m->optimizer.empty()) {
        result.emplace_back("ghostscript");
    }
    return result;
}

std::string
TPDFDependencies::installCommand(std::vector<std::string> const& packages)
{
#ifdef __APPLE__
    std::string result = "brew install";
#else
    std::string result = "apt-get install";
#endif
    for (auto const& p: packages) {
        result += " " + p;
    }
    return result;
}

void
TPDFDependencies::check() const
{
    auto missing = getMissing();
    if (missing.empty()) {
        return;
    }
    std::string names;
    for (auto const& p: missing) {
        if (!names.empty()) {
            names += " ";
        }
        names += p;
    }
    throw TPDFExc(
        tpdf_e_dependency,
        "",
        "Missing dependencies: " + names + "; install with: " + installCommand(missing));
}
