#include <trustpdf/assert_test.h>

#include <trustpdf/TPDFSystemError.hh>
#include <trustpdf/TUtil.hh>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

static void
write_file(std::string const& path, std::string const& data)
{
    FILE* f = TUtil::safe_fopen(path.c_str(), "wb");
    TUtil::FileCloser fc(f);
    assert(fwrite(data.c_str(), 1, data.length(), f) == data.length());
}

static void
string_conversion_test()
{
    assert(TUtil::string_to_int("300") == 300);
    assert(TUtil::string_to_int("-72") == -72);
    assert(TUtil::string_to_ll("9223372036854775807") == 9223372036854775807LL);
    bool threw = false;
    try {
        TUtil::string_to_int("2147483648");
    } catch (std::range_error&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        TUtil::string_to_ll("99999999999999999999");
    } catch (std::range_error&) {
        threw = true;
    }
    assert(threw);
    assert(TUtil::is_digit('7'));
    assert(!TUtil::is_digit('x'));
    assert(TUtil::is_space('\t'));
    assert(!TUtil::is_space('\0'));
}

static void
os_wrapper_test()
{
    assert(TUtil::os_wrapper("ok", 3) == 3);
    try {
        errno = ENOENT;
        TUtil::os_wrapper("before remove", -1);
        assert(false);
    } catch (TPDFSystemError& e) {
        assert(e.getErrno() == ENOENT);
        assert(e.getDescription() == "before remove");
        assert(std::string(e.what()).starts_with("before remove: "));
    }
    try {
        TUtil::safe_fopen("/this/file/does/not/exist", "rb");
        assert(false);
    } catch (TPDFSystemError& e) {
        assert(e.getErrno() == ENOENT);
    }
}

static void
getenv_test()
{
    std::string value;
    setenv("TRUSTPDF_TEST_VAR", "potato", 1);
    assert(TUtil::get_env("TRUSTPDF_TEST_VAR", &value));
    assert(value == "potato");
    unsetenv("TRUSTPDF_TEST_VAR");
    assert(!TUtil::get_env("TRUSTPDF_TEST_VAR", &value));
    assert(!TUtil::get_env("TRUSTPDF_TEST_VAR"));
}

static void
path_test()
{
    assert(TUtil::path_basename("/a/b/c.pdf") == "c.pdf");
    assert(TUtil::path_basename("c.pdf") == "c.pdf");
    assert(TUtil::path_basename("/a/b/") == "b");
    assert(TUtil::path_basename("/") == "/");
    assert(TUtil::path_dirname("/a/b/c.pdf") == "/a/b");
    assert(TUtil::path_dirname("c.pdf") == ".");
    assert(TUtil::path_dirname("/c.pdf") == "/");
    assert(TUtil::path_dirname("a/b/") == "a");

    char argv0[] = "/usr/bin/trustpdf";
    assert(std::string(TUtil::getWhoami(argv0)) == "trustpdf");
    char bare[] = "trustpdf";
    assert(std::string(TUtil::getWhoami(bare)) == "trustpdf");
}

static void
file_test(std::string const& dir)
{
    std::string a = dir + "/a.pdf";
    std::string b = dir + "/b.pdf";
    std::string sub = dir + "/sub";

    write_file(a, "%PDF-1.7\nbody\n");
    assert(TUtil::is_regular_file(a.c_str()));
    assert(!TUtil::is_directory(a.c_str()));
    assert(TUtil::is_directory(dir.c_str()));
    assert(!TUtil::is_regular_file(dir.c_str()));
    assert(!TUtil::is_executable(a.c_str()));

    unsigned long long size = 0;
    assert(TUtil::get_file_size(a.c_str(), &size));
    assert(size == 14);
    assert(!TUtil::get_file_size(dir.c_str(), &size));
    assert(!TUtil::get_file_size(b.c_str(), &size));

    assert(TUtil::read_file_prefix(a.c_str(), 4) == "%PDF");
    assert(TUtil::read_file_prefix(a.c_str(), 1024) == "%PDF-1.7\nbody\n");

    TUtil::copy_file(a.c_str(), b.c_str());
    assert(TUtil::read_file_prefix(b.c_str(), 1024) == "%PDF-1.7\nbody\n");
    assert(!TUtil::same_file(a.c_str(), b.c_str()));
    assert(TUtil::same_file(a.c_str(), a.c_str()));
    assert(!TUtil::same_file(a.c_str(), ""));

    write_file(b, "replacement");
    TUtil::move_file(b.c_str(), a.c_str());
    assert(!TUtil::is_regular_file(b.c_str()));
    assert(TUtil::read_file_prefix(a.c_str(), 1024) == "replacement");

    TUtil::rename_file(a.c_str(), b.c_str());
    assert(TUtil::is_regular_file(b.c_str()));
    TUtil::remove_file(b.c_str());
    assert(!TUtil::is_regular_file(b.c_str()));
    try {
        TUtil::remove_file(b.c_str());
        assert(false);
    } catch (TPDFSystemError& e) {
        assert(e.getErrno() == ENOENT);
    }

    std::string tool = dir + "/tool";
    write_file(tool, "#!/bin/sh\nexit 0\n");
    assert(!TUtil::is_executable(tool.c_str()));
    assert(chmod(tool.c_str(), 0755) == 0);
    assert(TUtil::is_executable(tool.c_str()));
    TUtil::remove_file(tool.c_str());

    TUtil::os_wrapper("mkdir", mkdir(sub.c_str(), 0700));
    write_file(sub + "/one", "1");
    write_file(sub + "/two", "2");
    auto names = TUtil::list_directory(sub.c_str());
    std::sort(names.begin(), names.end());
    assert(names.size() == 2);
    assert(names.at(0) == "one");
    assert(names.at(1) == "two");
    TUtil::remove_recursively(sub.c_str());
    assert(!TUtil::is_directory(sub.c_str()));
    // Removing something that isn't there is not an error.
    TUtil::remove_recursively(sub.c_str());
}

static mode_t
mode_of(std::string const& path)
{
    struct stat st;
    TUtil::os_wrapper("stat " + path, stat(path.c_str(), &st));
    return st.st_mode & 07777;
}

static void
move_mode_test(std::string const& dir)
{
    std::string src = dir + "/mode-src.pdf";
    std::string dst = dir + "/mode-dst.pdf";
    write_file(src, "optimized");
    assert(chmod(src.c_str(), 0640) == 0);
    write_file(dst, "original");
    assert(chmod(dst.c_str(), 0600) == 0);
    TUtil::move_file(src.c_str(), dst.c_str());
    assert(mode_of(dst) == 0640);

    // The copying path is only taken between file systems. /dev/shm is a tmpfs on most Linux
    // systems.
    struct stat shm;
    struct stat here;
    if ((stat("/dev/shm", &shm) != 0) || (!S_ISDIR(shm.st_mode)) ||
        (access("/dev/shm", W_OK) != 0) || (stat(dir.c_str(), &here) != 0) ||
        (shm.st_dev == here.st_dev)) {
        std::cout << "cross-device move not available" << std::endl;
        TUtil::remove_file(dst.c_str());
        return;
    }
    std::string far = "/dev/shm/trustpdf-tutil-" + std::to_string(getpid()) + ".pdf";
    write_file(far, "from another file system");
    assert(chmod(far.c_str(), 0644) == 0);
    TUtil::move_file(far.c_str(), dst.c_str());
    assert(!TUtil::is_regular_file(far.c_str()));
    assert(TUtil::read_file_prefix(dst.c_str(), 1024) == "from another file system");
    assert(mode_of(dst) == 0644);
    // Nothing staged is left beside the destination.
    auto names = TUtil::list_directory(dir.c_str());
    assert(std::count_if(names.begin(), names.end(), [](std::string const& n) {
               return n.starts_with(".mode-dst.pdf.");
           }) == 0);
    TUtil::remove_file(dst.c_str());
}

static void
temp_directory_test(std::string const& dir)
{
    std::string saved;
    bool had_tmpdir = TUtil::get_env("TMPDIR", &saved);
    setenv("TMPDIR", (dir + "///").c_str(), 1);
    auto t1 = TUtil::make_temp_directory("tutil-");
    auto t2 = TUtil::make_temp_directory("tutil-");
    assert(t1 != t2);
    assert(TUtil::path_dirname(t1) == dir);
    assert(TUtil::path_basename(t1).starts_with("tutil-"));
    assert(TUtil::is_directory(t1.c_str()));
    TUtil::remove_recursively(t1.c_str());
    TUtil::remove_recursively(t2.c_str());
    assert(TUtil::list_directory(dir.c_str()).empty());

    // A TMPDIR that isn't a directory falls back to /tmp.
    setenv("TMPDIR", (dir + "/missing").c_str(), 1);
    auto t3 = TUtil::make_temp_directory("tutil-");
    assert(t3.starts_with("/tmp/tutil-"));
    TUtil::remove_recursively(t3.c_str());

    if (had_tmpdir) {
        setenv("TMPDIR", saved.c_str(), 1);
    } else {
        unsetenv("TMPDIR");
    }
}

int
main()
{
    std::string dir = TUtil::make_temp_directory("trustpdf-tutil-");
    try {
        std::cout << "---- string conversion" << std::endl;
        string_conversion_test();
        std::cout << "---- os wrapper" << std::endl;
        os_wrapper_test();
        std::cout << "---- getenv" << std::endl;
        getenv_test();
        std::cout << "---- path" << std::endl;
        path_test();
        std::cout << "---- file" << std::endl;
        file_test(dir);
        std::cout << "---- move permissions" << std::endl;
        move_mode_test(dir);
        std::cout << "---- temporary directory" << std::endl;
        std::string tdir = dir + "/tmp";
        TUtil::os_wrapper("mkdir", mkdir(tdir.c_str(), 0700));
        temp_directory_test(tdir);
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        TUtil::remove_recursively(dir.c_str());
        return 2;
    }
    TUtil::remove_recursively(dir.c_str());
    std::cout << "tutil tests done" << std::endl;
    return 0;
}
