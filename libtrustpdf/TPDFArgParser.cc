#include <trustpdf/TPDFArgParser.hh>

#include <trustpdf/TPDFUsage.hh>
#include <trustpdf/TUtil.hh>

#include <cstring>
#include <memory>
#include <stdexcept>

using namespace std::literals;

TPDFArgParser::Members::Members(int argc, char const* const argv[]) :
    argc(argc),
    argv(argv)
{
    std::string argv0 = (argc > 0) ? argv[0] : "trustpdf";
    auto tmp = std::make_unique<char[]>(argv0.length() + 1);
    memcpy(tmp.get(), argv0.c_str(), argv0.length() + 1);
    whoami = TUtil::getWhoami(tmp.get());
}

TPDFArgParser::TPDFArgParser(int argc, char const* const argv[]) :
    m(new Members(argc, argv))
{
}

TPDFArgParser::OptionEntry&
TPDFArgParser::registerArg(std::string const& arg)
{
    if (arg.empty() || (arg.at(0) == '-')) {
        throw std::logic_error("TPDFArgParser: option names must not be empty or start with -");
    }
    if (m->option_table.contains(arg)) {
        throw std::logic_error("TPDFArgParser: adding a duplicate handler for option " + arg);
    }
    return m->option_table[arg];
}

void
TPDFArgParser::addPositional(param_arg_handler_t handler)
{
    if (m->positional_handler) {
        throw std::logic_error("TPDFArgParser: adding a duplicate positional handler");
    }
    m->positional_handler = handler;
}

void
TPDFArgParser::addBare(std::string const& arg, bare_arg_handler_t handler)
{
    OptionEntry& oe = registerArg(arg);
    oe.parameter_needed = false;
    oe.bare_arg_handler = handler;
}

void
TPDFArgParser::addRequiredParameter(
    std::string const& arg, param_arg_handler_t handler, char const* parameter_name)
{
    OptionEntry& oe = registerArg(arg);
    oe.parameter_needed = true;
    oe.parameter_name = parameter_name;
    oe.param_arg_handler = handler;
}

void
TPDFArgParser::addShortAlias(char ch, std::string const& arg)
{
    if (!m->option_table.contains(arg)) {
        throw std::logic_error(
            "TPDFArgParser: adding alias -"s + ch + " for unknown option " + arg);
    }
    if (m->short_aliases.contains(ch)) {
        throw std::logic_error("TPDFArgParser: adding a duplicate alias -"s + ch);
    }
    m->short_aliases[ch] = arg;
}

void
TPDFArgParser::addFinalCheck(bare_arg_handler_t handler)
{
    m->final_check_handler = handler;
}

void
TPDFArgParser::stopParsing()
{
    m->stopped = true;
}

bool
TPDFArgParser::wasStopped() const
{
    return m->stopped;
}

int
TPDFArgParser::argsLeft() const
{
    return m->argc - m->cur_arg - 1;
}

void
TPDFArgParser::usage(std::string const& message)
{
    throw TPDFUsage(message);
}

std::string
TPDFArgParser::getProgname()
{
    return m->whoami;
}

void
TPDFArgParser::handlePositional(std::string const& arg)
{
    if (!m->positional_handler) {
        usage("unrecognized argument " + arg);
    }
    m->positional_handler(arg);
}

void
TPDFArgParser::handleOption(std::string const& o_arg, std::string const& name)
{
    // name may carry a parameter after =. Search for = from after the first character so that
    // --=x is not taken as an empty option name.
    std::string arg_s = name;
    std::string parameter;
    bool have_parameter = false;
    size_t equal_pos = std::string::npos;
    if (!arg_s.empty()) {
        equal_pos = arg_s.find('=', 1);
    }
    if (equal_pos != std::string::npos) {
        have_parameter = true;
        parameter = arg_s.substr(equal_pos + 1);
        arg_s = arg_s.substr(0, equal_pos);
    }

    auto oep = m->option_table.find(arg_s);
    if (oep == m->option_table.end()) {
        usage("unrecognized argument " + o_arg);
    }
    OptionEntry& oe = oep->second;

    if (oe.bare_arg_handler) {
        if (have_parameter) {
            usage(
                "--"s + arg_s + " does not take a parameter, but \"" + parameter +
                "\" was given");
        }
        oe.bare_arg_handler();
        return;
    }

    if (oe.parameter_needed && !have_parameter) {
        if (argsLeft() == 0) {
            usage(o_arg + " requires a " + oe.parameter_name + " parameter");
        }
        ++m->cur_arg;
        parameter = m->argv[m->cur_arg];
    }
    oe.param_arg_handler(parameter);
}

void
TPDFArgParser::parseArgs()
{
    for (m->cur_arg = 1; (m->cur_arg < m->argc) && (!m->stopped); ++m->cur_arg) {
        char const* arg = m->argv[m->cur_arg];
        std::string o_arg(arg);
        if (m->options_done || (arg[0] != '-') || (strcmp(arg, "-") == 0)) {
            // A lone - is an ordinary file name as far as the parser is concerned.
            handlePositional(o_arg);
        } else if (strcmp(arg, "--") == 0) {
            m->options_done = true;
        } else if (arg[1] == '-') {
            handleOption(o_arg, arg + 2);
        } else if (strlen(arg) == 2) {
            auto alias = m->short_aliases.find(arg[1]);
            if (alias == m->short_aliases.end()) {
                usage("unrecognized argument " + o_arg);
            }
            handleOption(o_arg, alias->second);
        } else {
            usage("unrecognized argument " + o_arg);
        }
    }
    if (!m->stopped) {
        doFinalChecks();
    }
}

void
TPDFArgParser::doFinalChecks()
{
    if (m->final_check_handler != nullptr) {
        m->final_check_handler();
    }
}
