#include <trustpdf/assert_test.h>

#include <trustpdf/Pl_String.hh>
#include <trustpdf/TPDFLogger.hh>
#include <trustpdf/TPDFScratchDir.hh>
#include <trustpdf/TUtil.hh>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>

static void
write_file(std::string const& path)
{
    FILE* f = TUtil::safe_fopen(path.c_str(), "wb");
    TUtil::FileCloser fc(f);
    fputs("data\n", f);
}

static void
test_lifetime(std::string const& tmpdir)
{
    std::string path;
    {
        TPDFScratchDir scratch("trustpdf-");
        path = scratch.getPath();
        assert(TUtil::is_directory(path.c_str()));
        assert(TUtil::path_dirname(path) == tmpdir);
        assert(TUtil::path_basename(path).starts_with("trustpdf-"));
        assert(scratch.file("page-001.png") == path + "/page-001.png");
        write_file(scratch.file("page-001.png"));
        std::string nested = scratch.file("nested");
        TUtil::os_wrapper("mkdir", mkdir(nested.c_str(), 0700));
        write_file(nested + "/deeper");
    }
    assert(!TUtil::is_directory(path.c_str()));
    assert(TUtil::list_directory(tmpdir.c_str()).empty());
}

static void
test_unwinding(std::string const& tmpdir)
{
    std::string path;
    try {
        TPDFScratchDir scratch("trustpdf-");
        path = scratch.getPath();
        write_file(scratch.file("optimized.pdf"));
        throw std::runtime_error("stage failed");
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()) == "stage failed");
    }
    assert(!path.empty());
    assert(!TUtil::is_directory(path.c_str()));
    assert(TUtil::list_directory(tmpdir.c_str()).empty());
}

static void
test_already_removed(std::string const& tmpdir)
{
    auto log = TPDFLogger::create();
    std::string err;
    log->setError(std::make_shared<Pl_String>(err));
    {
        TPDFScratchDir scratch("trustpdf-", log);
        TUtil::remove_recursively(scratch.getPath().c_str());
    }
    // Nothing to remove is not a failure.
    assert(err.empty());
    assert(TUtil::list_directory(tmpdir.c_str()).empty());
}

int
main()
{
    std::string base = TUtil::make_temp_directory("trustpdf-scratch-test-");
    std::string tmpdir = base + "/tmp";
    TUtil::os_wrapper("mkdir", mkdir(tmpdir.c_str(), 0700));
    setenv("TMPDIR", tmpdir.c_str(), 1);

    test_lifetime(tmpdir);
    test_unwinding(tmpdir);
    test_already_removed(tmpdir);

    TUtil::remove_recursively(base.c_str());
    std::cout << "scratch directory tests done" << std::endl;
    return 0;
}
