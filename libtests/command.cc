#include <trustpdf/assert_test.h>

#include <trustpdf/TPDFCommand.hh>
#include <trustpdf/TUtil.hh>

#include <iostream>
#include <sys/stat.h>

static void
test_quoting()
{
    assert(TPDFCommand::shell_quote("") == "''");
    assert(TPDFCommand::shell_quote("plain") == "plain");
    assert(TPDFCommand::shell_quote("-sOutputFile=/tmp/x.pdf") == "-sOutputFile=/tmp/x.pdf");
    assert(TPDFCommand::shell_quote("png:page-%03d.png") == "png:page-%03d.png");
    assert(TPDFCommand::shell_quote("my file.pdf") == "'my file.pdf'");
    assert(TPDFCommand::shell_quote("it's") == "'it'\\''s'");
    assert(TPDFCommand::shell_quote("$(rm -rf ~)") == "'$(rm -rf ~)'");
    assert(TPDFCommand::shell_quote("a;b") == "'a;b'");

    TPDFCommand cmd("/usr/bin/magick", {"-density", "300", "pdf:my doc.pdf", "png:out.png"});
    assert(cmd.getProgram() == "/usr/bin/magick");
    assert(cmd.getArgs().size() == 4);
    assert(cmd.unparse() == "/usr/bin/magick -density 300 'pdf:my doc.pdf' png:out.png");
}

static void
test_run(std::string const& dir)
{
    assert(TPDFCommand("/bin/sh", {"-c", "exit 0"}).run() == 0);
    assert(TPDFCommand("/bin/sh", {"-c", "exit 3"}).run() == 3);
    assert(TPDFCommand("/bin/sh", {"-c", "kill -KILL $$"}).run() == 128 + 9);
    assert(TPDFCommand(dir + "/no-such-program", {}).run() == 127);

    // Arguments reach the program unchanged; nothing is expanded by a shell.
    std::string out = dir + "/args";
    std::string weird = "a b; $HOME 'q' *";
    TPDFCommand cmd(
        "/bin/sh", {"-c", "printf '%s\\n' \"$1\" > \"$2\"", "sh", weird, out});
    assert(cmd.run() == 0);
    assert(TUtil::read_file_prefix(out.c_str(), 1024) == weird + "\n");

    // Standard input is /dev/null, so reading it hits end of file immediately.
    TPDFCommand reader("/bin/sh", {"-c", "read line; exit $?"});
    assert(reader.run() != 0);

    // Standard output is discarded; show_errors only affects standard error.
    assert(TPDFCommand("/bin/sh", {"-c", "echo to stdout; echo to stderr >&2"}).run(true) == 0);
}

int
main()
{
    std::string dir = TUtil::make_temp_directory("trustpdf-command-");
    test_quoting();
    test_run(dir);
    TUtil::remove_recursively(dir.c_str());
    std::cout << "command tests done" << std::endl;
    return 0;
}
