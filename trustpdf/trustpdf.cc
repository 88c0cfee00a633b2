#include <trustpdf/TPDFJob.hh>
#include <trustpdf/TPDFLogger.hh>
#include <trustpdf/TPDFUsage.hh>
#include <trustpdf/TUtil.hh>

#include <cstdio>

int
realmain(int argc, char* argv[])
{
    TUtil::setLineBuf(stdout);

    TPDFJob j;
    try {
        j.initializeFromArgv(argv);
        j.run();
    } catch (TPDFUsage& e) {
        j.showUsageError(e.what());
        return TPDFJob::EXIT_ERROR;
    } catch (std::exception& e) {
        TPDFLogger::defaultLogger()->error(e.what());
        return TPDFJob::EXIT_ERROR;
    }
    return j.getExitCode();
}

int
main(int argc, char* argv[])
{
    return realmain(argc, argv);
}
