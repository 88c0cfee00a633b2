#include <trustpdf/TPDFJob.hh>

#include <trustpdf/TUtil.hh>

#include <stdexcept>

void
TPDFJob::Config::checkConfiguration()
{
    o.checkConfiguration();
}

TPDFJob::Config*
TPDFJob::Config::inputFile(std::string const& filename)
{
    if (filename.empty()) {
        usage("the input file name may not be empty");
    }
    if (o.m->infilename.empty()) {
        o.m->infilename = filename;
    } else {
        usage("input file has already been given");
    }
    o.m->configured = false;
    return this;
}

TPDFJob::Config*
TPDFJob::Config::outputFile(std::string const& filename)
{
    if (filename.empty()) {
        usage("the output file name may not be empty");
    }
    if (o.m->given_outfilename.empty()) {
        o.m->given_outfilename = filename;
    } else {
        usage("output file has already been given");
    }
    o.m->configured = false;
    return this;
}

TPDFJob::Config*
TPDFJob::Config::dpi(std::string const& parameter)
{
    static std::string const msg = "DPI must be a number between " +
        std::to_string(TPDFJob::MIN_DPI) + " and " + std::to_string(TPDFJob::MAX_DPI);
    if (parameter.empty()) {
        usage(msg);
    }
    for (char ch: parameter) {
        if (!TUtil::is_digit(ch)) {
            usage(msg);
        }
    }
    int value = 0;
    try {
        value = TUtil::string_to_int(parameter.c_str());
    } catch (std::range_error&) {
        usage(msg);
    }
    if ((value < TPDFJob::MIN_DPI) || (value > TPDFJob::MAX_DPI)) {
        usage(msg);
    }
    o.m->dpi = value;
    return this;
}

TPDFJob::Config*
TPDFJob::Config::batch()
{
    o.m->batch = true;
    o.m->configured = false;
    return this;
}

TPDFJob::Config*
TPDFJob::Config::verbose()
{
    o.m->verbose = true;
    return this;
}
