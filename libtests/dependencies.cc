#include <trustpdf/assert_test.h>

#include <trustpdf/TPDFDependencies.hh>
#include <trustpdf/TPDFExc.hh>
#include <trustpdf/TUtil.hh>

#include <cstdlib>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>

static void
make_program(std::string const& path, bool executable = true)
{
    FILE* f = TUtil::safe_fopen(path.c_str(), "wb");
    {
        TUtil::FileCloser fc(f);
        fputs("#!/bin/sh\nexit 0\n", f);
    }
    TUtil::os_wrapper("chmod", chmod(path.c_str(), executable ? 0755 : 0644));
}

static void
make_dir(std::string const& path)
{
    TUtil::os_wrapper("mkdir", mkdir(path.c_str(), 0700));
}

static void
test_find_program(std::string const& dir)
{
    std::string d1 = dir + "/d1";
    std::string d2 = dir + "/d2";
    make_dir(d1);
    make_dir(d2);
    make_program(d1 + "/gs", false);
    make_program(d2 + "/gs");
    make_dir(d1 + "/magick");

    // Non-executable files and directories are skipped.
    assert(TPDFDependencies::findProgram("gs", d1 + ":" + d2) == d2 + "/gs");
    assert(TPDFDependencies::findProgram("magick", d1 + ":" + d2).empty());
    assert(TPDFDependencies::findProgram("gs", d2 + "/") == d2 + "/gs");
    assert(TPDFDependencies::findProgram("gs", dir + "/missing:" + d2) == d2 + "/gs");

    // Earlier directories win.
    make_program(d1 + "/convert");
    make_program(d2 + "/convert");
    assert(TPDFDependencies::findProgram("convert", d1 + ":" + d2) == d1 + "/convert");
    assert(TPDFDependencies::findProgram("convert", d2 + ":" + d1) == d2 + "/convert");

    // An empty entry is the current directory.
    assert(chdir(d2.c_str()) == 0);
    assert(TPDFDependencies::findProgram("gs", dir + "/missing::") == "./gs");
    assert(TPDFDependencies::findProgram("gs", ":" + d1) == "./gs");
}

static void
test_preference(std::string const& dir)
{
    std::string im6 = dir + "/im6";
    std::string im7 = dir + "/im7";
    make_dir(im6);
    make_dir(im7);
    make_program(im6 + "/convert");
    make_program(im7 + "/magick");
    make_program(im7 + "/gs");

    TPDFDependencies deps(im6 + ":" + im7);
    assert(deps.getRasterizer() == im7 + "/magick");
    assert(deps.getOptimizer() == im7 + "/gs");
    assert(deps.getMissing().empty());
    deps.check();

    TPDFDependencies deps6(im6);
    assert(deps6.getRasterizer() == im6 + "/convert");
    assert(deps6.getOptimizer().empty());
    auto missing = deps6.getMissing();
    assert(missing.size() == 1);
    assert(missing.at(0) == "ghostscript");
}

static void
test_missing(std::string const& dir)
{
    TPDFDependencies deps(dir + "/nothing-here");
    assert(deps.getRasterizer().empty());
    assert(deps.getOptimizer().empty());
    auto missing = deps.getMissing();
    assert(missing.size() == 2);
    assert(missing.at(0) == "imagemagick");
    assert(missing.at(1) == "ghostscript");
    try {
        deps.check();
        assert(false);
    } catch (TPDFExc& e) {
        assert(e.getErrorCode() == tpdf_e_dependency);
        std::string msg = e.what();
        assert(msg.starts_with("Missing dependencies: imagemagick ghostscript; install with: "));
        assert(msg.ends_with(" install imagemagick ghostscript"));
    }
    assert(
        TPDFDependencies::installCommand({"ghostscript"}).ends_with("install ghostscript"));

    // The default constructor searches PATH.
    std::string saved;
    bool had_path = TUtil::get_env("PATH", &saved);
    std::string im7 = dir + "/im7";
    setenv("PATH", im7.c_str(), 1);
    TPDFDependencies from_env;
    assert(from_env.getRasterizer() == im7 + "/magick");
    assert(from_env.getOptimizer() == im7 + "/gs");
    if (had_path) {
        setenv("PATH", saved.c_str(), 1);
    } else {
        unsetenv("PATH");
    }
}

int
main()
{
    std::string dir = TUtil::make_temp_directory("trustpdf-dependencies-");
    test_preference(dir);
    test_missing(dir);
    test_find_program(dir);
    assert(chdir("/") == 0);
    TUtil::remove_recursively(dir.c_str());
    std::cout << "dependency tests done" << std::endl;
    return 0;
}
