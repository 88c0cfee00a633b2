#include <trustpdf/TUtil.hh>

#include <trustpdf/TPDFSystemError.hh>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <memory>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

long long
TUtil::string_to_ll(char const* str)
{
    errno = 0;
    long long result = strtoll(str, nullptr, 10);
    if (errno == ERANGE) {
        throw std::range_error(
            std::string("overflow/underflow converting ") + str + " to 64-bit integer");
    }
    return result;
}

int
TUtil::string_to_int(char const* str)
{
    long long result = string_to_ll(str);
    if ((result < INT_MIN) || (result > INT_MAX)) {
        throw std::range_error(std::string("overflow/underflow converting ") + str + " to int");
    }
    return static_cast<int>(result);
}

void
TUtil::throw_system_error(std::string const& description)
{
    throw TPDFSystemError(description, errno);
}

int
TUtil::os_wrapper(std::string const& description, int status)
{
    if (status == -1) {
        throw_system_error(description);
    }
    return status;
}

FILE*
TUtil::safe_fopen(char const* filename, char const* mode)
{
    return fopen_wrapper(std::string("open ") + filename, fopen(filename, mode));
}

FILE*
TUtil::fopen_wrapper(std::string const& description, FILE* f)
{
    if (f == nullptr) {
        throw_system_error(description);
    }
    return f;
}

bool
TUtil::is_regular_file(char const* path)
{
    struct stat st;
    return (stat(path, &st) == 0) && S_ISREG(st.st_mode);
}

bool
TUtil::is_directory(char const* path)
{
    struct stat st;
    return (stat(path, &st) == 0) && S_ISDIR(st.st_mode);
}

bool
TUtil::is_executable(char const* path)
{
    return is_regular_file(path) && (access(path, X_OK) == 0);
}

bool
TUtil::get_file_size(char const* path, unsigned long long* size)
{
    struct stat st;
    if ((stat(path, &st) != 0) || (!S_ISREG(st.st_mode))) {
        return false;
    }
    if (size) {
        *size = static_cast<unsigned long long>(st.st_size);
    }
    return true;
}

bool
TUtil::same_file(char const* name1, char const* name2)
{
    if ((name1 == nullptr) || (strlen(name1) == 0) || (name2 == nullptr) || (strlen(name2) == 0)) {
        return false;
    }
    struct stat st1;
    struct stat st2;
    if ((stat(name1, &st1) == 0) && (stat(name2, &st2) == 0) && (st1.st_ino == st2.st_ino) &&
        (st1.st_dev == st2.st_dev)) {
        return true;
    }
    return false;
}

void
TUtil::remove_file(char const* path)
{
    os_wrapper(std::string("remove ") + path, unlink(path));
}

void
TUtil::rename_file(char const* oldname, char const* newname)
{
    os_wrapper(std::string("rename ") + oldname + " " + newname, rename(oldname, newname));
}

void
TUtil::copy_file(char const* from, char const* to)
{
    FILE* in = safe_fopen(from, "rb");
    FileCloser in_closer(in);
    FILE* out = safe_fopen(to, "wb");
    bool okay = true;
    size_t len = 0;
    int constexpr size = 8192;
    unsigned char buf[size];
    while (okay && ((len = fread(buf, 1, size, in)) > 0)) {
        okay = (fwrite(buf, 1, len, out) == len);
    }
    if (ferror(in)) {
        fclose(out);
        throw std::runtime_error(std::string("failure reading file ") + from);
    }
    if (!okay) {
        int saved_errno = errno;
        fclose(out);
        throw TPDFSystemError(std::string("write ") + to, saved_errno);
    }
    if (fclose(out) != 0) {
        throw_system_error(std::string("close ") + to);
    }
}

void
TUtil::move_file(char const* oldname, char const* newname)
{
    if (rename(oldname, newname) == 0) {
        return;
    }
    if (errno != EXDEV) {
        throw_system_error(std::string("rename ") + oldname + " " + newname);
    }

    // Different file systems: stage the data next to the destination so that the final step is
    // still a rename within one directory.
    std::string tmpl =
        path_dirname(newname) + "/." + path_basename(newname) + ".XXXXXX";
    auto buf = std::make_unique<char[]>(tmpl.length() + 1);
    memcpy(buf.get(), tmpl.c_str(), tmpl.length() + 1);
    int fd = os_wrapper(std::string("create temporary file for ") + newname, mkstemp(buf.get()));
    close(fd);
    std::string staged = buf.get();
    try {
        copy_file(oldname, staged.c_str());
        // mkstemp creates the file owner-only; give it the source's permissions as rename would.
        struct stat st;
        os_wrapper(std::string("stat ") + oldname, stat(oldname, &st));
        os_wrapper("chmod " + staged, chmod(staged.c_str(), st.st_mode & 07777));
        rename_file(staged.c_str(), newname);
    } catch (std::exception&) {
        unlink(staged.c_str());
        throw;
    }
    remove_file(oldname);
}

std::string
TUtil::path_basename(std::string const& filename)
{
    std::string last = filename;
    auto len = last.length();
    while (len > 1) {
        auto pos = last.find_last_of('/');
        if (pos == len - 1) {
            last.pop_back();
            --len;
        } else if (pos == std::string::npos) {
            break;
        } else {
            last = last.substr(pos + 1);
            break;
        }
    }
    return last;
}

std::string
TUtil::path_dirname(std::string const& filename)
{
    std::string path = filename;
    while ((path.length() > 1) && (path.back() == '/')) {
        path.pop_back();
    }
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

std::vector<std::string>
TUtil::list_directory(char const* path)
{
    std::vector<std::string> result;
    DIR* dir = opendir(path);
    if (dir == nullptr) {
        throw_system_error(std::string("open directory ") + path);
    }
    errno = 0;
    struct dirent* entry = nullptr;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if ((name != ".") && (name != "..")) {
            result.push_back(name);
        }
        errno = 0;
    }
    int read_errno = errno;
    closedir(dir);
    if (read_errno != 0) {
        throw TPDFSystemError(std::string("read directory ") + path, read_errno);
    }
    return result;
}

std::string
TUtil::make_temp_directory(char const* prefix)
{
    std::string tmpdir;
    if (!(get_env("TMPDIR", &tmpdir) && is_directory(tmpdir.c_str()))) {
        tmpdir = "/tmp";
    }
    while ((tmpdir.length() > 1) && (tmpdir.back() == '/')) {
        tmpdir.pop_back();
    }
    std::string tmpl = tmpdir + "/" + prefix + "XXXXXX";
    auto buf = std::make_unique<char[]>(tmpl.length() + 1);
    memcpy(buf.get(), tmpl.c_str(), tmpl.length() + 1);
    if (mkdtemp(buf.get()) == nullptr) {
        throw_system_error("create temporary directory in " + tmpdir);
    }
    return buf.get();
}

void
TUtil::remove_recursively(char const* path)
{
    struct stat st;
    if (lstat(path, &st) != 0) {
        if (errno == ENOENT) {
            return;
        }
        throw_system_error(std::string("stat ") + path);
    }
    if (S_ISDIR(st.st_mode)) {
        for (auto const& name: list_directory(path)) {
            remove_recursively((std::string(path) + "/" + name).c_str());
        }
        os_wrapper(std::string("remove directory ") + path, rmdir(path));
    } else {
        remove_file(path);
    }
}

std::string
TUtil::read_file_prefix(char const* filename, size_t length)
{
    FILE* f = safe_fopen(filename, "rb");
    FileCloser fc(f);
    std::string result(length, '\0');
    size_t len = fread(result.data(), 1, length, f);
    if (ferror(f)) {
        throw std::runtime_error(std::string("failure reading file ") + filename);
    }
    result.resize(len);
    return result;
}

void
TUtil::setLineBuf(FILE* f)
{
    setvbuf(f, reinterpret_cast<char*>(0), _IOLBF, 0);
}

char*
TUtil::getWhoami(char* argv0)
{
    char* whoami = nullptr;
    if ((whoami = strrchr(argv0, '/')) == nullptr) {
        whoami = argv0;
    } else {
        ++whoami;
    }
    return whoami;
}

bool
TUtil::get_env(std::string const& var, std::string* value)
{
    char* p = getenv(var.c_str());
    if (p == nullptr) {
        return false;
    }
    if (value) {
        *value = p;
    }

    return true;
}
