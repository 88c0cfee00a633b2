#include <trustpdf/TPDFCommand.hh>

#include <trustpdf/TPDFSignals.hh>
#include <trustpdf/TPDFSystemError.hh>
#include <trustpdf/TUtil.hh>

#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

TPDFCommand::Members::Members(std::string const& program, std::vector<std::string> const& args) :
    program(program),
    args(args)
{
}

TPDFCommand::TPDFCommand(std::string const& program, std::vector<std::string> const& args) :
    m(new Members(program, args))
{
}

std::string const&
TPDFCommand::getProgram() const
{
    return m->program;
}

std::vector<std::string> const&
TPDFCommand::getArgs() const
{
    return m->args;
}

std::string
TPDFCommand::shell_quote(std::string const& word)
{
    if (word.empty()) {
        return "''";
    }
    bool safe = true;
    for (char ch: word) {
        if (!(isalnum(static_cast<unsigned char>(ch)) || strchr("_@%+=:,./-", ch))) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return word;
    }
    std::string result = "'";
    for (char ch: word) {
        if (ch == '\'') {
            result += "'\\''";
        } else {
            result += ch;
        }
    }
    result += "'";
    return result;
}

std::string
TPDFCommand::unparse() const
{
    std::string result = shell_quote(m->program);
    for (auto const& arg: m->args) {
        result += " " + shell_quote(arg);
    }
    return result;
}

int
TPDFCommand::run(bool show_errors) const
{
    // Everything the child needs is prepared before fork. Between fork and exec the child only
    // makes async-signal-safe calls.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(m->program.c_str()));
    for (auto const& arg: m->args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    sigset_t old_mask;
    TPDFSignals::block(&old_mask);
    pid_t pid = fork();
    if (pid == -1) {
        int saved_errno = errno;
        TPDFSignals::unblock(&old_mask);
        throw TPDFSystemError("start " + m->program, saved_errno);
    }
    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull != -1) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            if (!show_errors) {
                dup2(devnull, STDERR_FILENO);
            }
            if (devnull > STDERR_FILENO) {
                close(devnull);
            }
        }
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        sigprocmask(SIG_SETMASK, &old_mask, nullptr);
        execv(argv[0], argv.data());
        _exit(127);
    }

    TPDFSignals::setChild(pid);
    TPDFSignals::unblock(&old_mask);
    int status = 0;
    pid_t result = 0;
    while (((result = waitpid(pid, &status, 0)) == -1) && (errno == EINTR)) {
        // keep waiting; the signal handler has already forwarded the signal
    }
    TPDFSignals::setChild(0);
    if (result == -1) {
        TUtil::throw_system_error("wait for " + m->program);
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 127;
}
