#include <trustpdf/assert_test.h>

#include <trustpdf/Pl_String.hh>
#include <trustpdf/TPDFLogger.hh>

#include <sstream>
#include <stdexcept>

static void
test_markers()
{
    auto l = TPDFLogger::create();
    std::string out;
    std::string err;
    l->setInfo(std::make_shared<Pl_String>(out));
    l->setError(std::make_shared<Pl_String>(err));

    l->info("progress");
    l->success("done");
    l->warn("careful");
    l->error("broken");
    assert(out == "[INFO] progress\n[SUCCESS] done\n");
    assert(err == "[WARNING] careful\n[ERROR] broken\n");

    // Raw channel text is not marked.
    *l->getInfo() << "Overwrite? " << 3 << "\n";
    assert(out == "[INFO] progress\n[SUCCESS] done\nOverwrite? 3\n");
}

static void
test_routing()
{
    auto l = TPDFLogger::create();

    // Warning follows error when error is set explicitly.
    std::string errors;
    l->setError(std::make_shared<Pl_String>(errors));
    l->warn("warn follows error");
    assert(errors == "[WARNING] warn follows error\n");

    // Set warnings -- now they're separate
    std::string warnings;
    l->setWarn(std::make_shared<Pl_String>(warnings));
    l->warn("separate");
    l->error("new error");
    assert(warnings == "[WARNING] separate\n");
    assert(errors == "[WARNING] warn follows error\n[ERROR] new error\n");

    // Restore warnings to default -- follows error again
    l->setWarn(nullptr);
    l->warn("again");
    assert(warnings == "[WARNING] separate\n");
    assert(errors == "[WARNING] warn follows error\n[ERROR] new error\n[WARNING] again\n");

    // Success follows info unless set.
    std::string info;
    std::string success;
    l->setInfo(std::make_shared<Pl_String>(info));
    l->success("one");
    l->setSuccess(std::make_shared<Pl_String>(success));
    l->success("two");
    l->setSuccess(nullptr);
    l->success("three");
    assert(info == "[SUCCESS] one\n[SUCCESS] three\n");
    assert(success == "[SUCCESS] two\n");

    // Discard
    l->setInfo(l->discard());
    l->info("not seen");
    assert(info == "[SUCCESS] one\n[SUCCESS] three\n");
    assert(l->getInfo(true) == l->discard());
    l->setInfo(nullptr);
    assert(l->getInfo() == l->standardOutput());
    l->setError(nullptr);
    assert(l->getError() == l->standardError());
    assert(l->getWarn() == l->standardError());
}

static void
test_color()
{
    auto l = TPDFLogger::create();
    std::string out;
    l->setInfo(std::make_shared<Pl_String>(out));
    l->setColor(true);
    l->info("blue");
    l->success("green");
    assert(out == "\033[0;34m[INFO]\033[0m blue\n\033[0;32m[SUCCESS]\033[0m green\n");
    out.clear();
    l->setColor(false);
    l->info("plain");
    assert(out == "[INFO] plain\n");

    // A string stream is never a terminal, so automatic colour stays off.
    std::ostringstream os;
    std::ostringstream es;
    auto l2 = TPDFLogger::create();
    l2->setOutputStreams(&os, &es);
    l2->info("to stream");
    l2->warn("to error stream");
    assert(os.str() == "[INFO] to stream\n");
    assert(es.str() == "[WARNING] to error stream\n");
}

static void
test_default()
{
    auto l = TPDFLogger::defaultLogger();
    assert(l == TPDFLogger::defaultLogger());
    l->info("info to stdout");
    l->warn("warn to stderr");
    l->setWarn(l->discard());
    l->warn("warning not seen");
    l->setWarn(nullptr);
    l->warn("restored warning to stderr");
}

int
main()
{
    test_markers();
    test_routing();
    test_color();
    test_default();
    return 0;
}
