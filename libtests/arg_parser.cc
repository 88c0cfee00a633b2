#include <trustpdf/assert_test.h>

#include <trustpdf/TPDFArgParser.hh>
#include <trustpdf/TPDFUsage.hh>

#include <iostream>
#include <string>
#include <vector>

class ArgParser
{
  public:
    ArgParser(std::vector<char const*> const& args);
    void parseArgs();

    std::vector<std::string> seen;
    bool final_checked{false};

  private:
    void handlePotato();
    void handleSalad(std::string const& p);
    void handlePositional(std::string const& p);
    void handleStop();
    void finalChecks();

    void initOptions();

    std::vector<char const*> argv;
    TPDFArgParser ap;
};

static std::vector<char const*>
with_null(std::vector<char const*> args)
{
    args.push_back(nullptr);
    return args;
}

ArgParser::ArgParser(std::vector<char const*> const& args) :
    argv(with_null(args)),
    ap(static_cast<int>(args.size()), argv.data())
{
    initOptions();
}

void
ArgParser::initOptions()
{
    auto b = [this](void (ArgParser::*f)()) { return TPDFArgParser::bindBare(f, this); };
    auto p = [this](void (ArgParser::*f)(std::string const&)) {
        return TPDFArgParser::bindParam(f, this);
    };

    ap.addBare("potato", b(&ArgParser::handlePotato));
    ap.addShortAlias('p', "potato");
    ap.addRequiredParameter("salad", p(&ArgParser::handleSalad), "tossed");
    ap.addShortAlias('s', "salad");
    ap.addBare("stop", b(&ArgParser::handleStop));
    ap.addPositional(p(&ArgParser::handlePositional));
    ap.addFinalCheck(b(&ArgParser::finalChecks));
}

void
ArgParser::handlePotato()
{
    seen.push_back("potato");
}

void
ArgParser::handleSalad(std::string const& p)
{
    seen.push_back("salad=" + p);
}

void
ArgParser::handlePositional(std::string const& p)
{
    seen.push_back("pos=" + p);
}

void
ArgParser::handleStop()
{
    seen.push_back("stop");
    ap.stopParsing();
}

void
ArgParser::finalChecks()
{
    final_checked = true;
}

void
ArgParser::parseArgs()
{
    ap.parseArgs();
}

static std::string
usage_message(std::vector<char const*> const& args)
{
    ArgParser ap(args);
    try {
        ap.parseArgs();
    } catch (TPDFUsage& e) {
        return e.what();
    }
    assert(false);
    return "";
}

static void
test_forms()
{
    ArgParser ap({"prog", "--potato", "-p", "--salad=green", "--salad", "caesar", "-s", "tuna",
                  "file1", "-", "--", "--potato", "-s"});
    ap.parseArgs();
    std::vector<std::string> wanted = {
        "potato",
        "potato",
        "salad=green",
        "salad=caesar",
        "salad=tuna",
        "pos=file1",
        "pos=-",
        "pos=--potato",
        "pos=-s"};
    assert(ap.seen == wanted);
    assert(ap.final_checked);
}

static void
test_empty_parameter()
{
    ArgParser ap({"prog", "--salad="});
    ap.parseArgs();
    assert(ap.seen.size() == 1);
    assert(ap.seen.at(0) == "salad=");
}

static void
test_errors()
{
    assert(usage_message({"prog", "--quack"}) == "unrecognized argument --quack");
    assert(usage_message({"prog", "-q"}) == "unrecognized argument -q");
    assert(usage_message({"prog", "-ps"}) == "unrecognized argument -ps");
    assert(usage_message({"prog", "--salad"}) == "--salad requires a tossed parameter");
    assert(usage_message({"prog", "-s"}) == "-s requires a tossed parameter");
    assert(
        usage_message({"prog", "--potato=mashed"}) ==
        "--potato does not take a parameter, but \"mashed\" was given");
}

static void
test_stop()
{
    ArgParser ap({"prog", "--potato", "--stop", "--quack", "-s"});
    ap.parseArgs();
    std::vector<std::string> wanted = {"potato", "stop"};
    assert(ap.seen == wanted);
    assert(!ap.final_checked);
}

static void
test_registration_errors()
{
    char const* argv[] = {"prog", nullptr};
    TPDFArgParser ap(1, argv);
    ap.addBare("potato", []() {});
    try {
        ap.addBare("potato", []() {});
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        ap.addShortAlias('x', "salad");
        assert(false);
    } catch (std::logic_error&) {
    }
    ap.addShortAlias('p', "potato");
    try {
        ap.addShortAlias('p', "potato");
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        ap.addBare("--potato", []() {});
        assert(false);
    } catch (std::logic_error&) {
    }
    assert(ap.getProgname() == "prog");
}

static void
test_progname()
{
    char const* argv[] = {"/usr/local/bin/trustpdf", nullptr};
    TPDFArgParser ap(1, argv);
    assert(ap.getProgname() == "trustpdf");
}

int
main()
{
    test_forms();
    test_empty_parameter();
    test_errors();
    test_stop();
    test_registration_errors();
    test_progname();
    std::cout << "arg parser tests done" << std::endl;
    return 0;
}
