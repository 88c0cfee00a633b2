#ifndef TPDFARGPARSER_HH
#define TPDFARGPARSER_HH

#include <functional>
#include <map>
#include <memory>
#include <string>

// This is not a general-purpose argument parser. It handles the small, conventional command line
// of trustpdf: long options (--name, --name=value, --name value), single-letter aliases (-n,
// -n value), positional arguments, and -- to end option processing. Options and positional
// arguments may be mixed freely. Handlers are called in command-line order; a handler may call
// stopParsing() (as --help does) to skip the remaining arguments and the final check.
class TPDFArgParser
{
  public:
    TPDFArgParser(int argc, char const* const argv[]);

    // Handlers and the final check may throw TPDFUsage. Unknown options and missing parameters
    // also throw TPDFUsage.
    void parseArgs();

    // Return the program name as the last path element of the program executable.
    std::string getProgname();

    typedef std::function<void()> bare_arg_handler_t;
    typedef std::function<void(std::string const&)> param_arg_handler_t;

    // Methods for registering arguments. Names are given without leading dashes.

    void addPositional(param_arg_handler_t);
    void addBare(std::string const& arg, bare_arg_handler_t);
    void
    addRequiredParameter(std::string const& arg, param_arg_handler_t, char const* parameter_name);

    // Make -ch an alias for --arg. arg must already be registered.
    void addShortAlias(char ch, std::string const& arg);

    // The final check handler is called at the very end of argument parsing unless parsing was
    // stopped.
    void addFinalCheck(bare_arg_handler_t);

    // Convenience methods for adding member functions of a class as handlers.
    template <class T>
    static bare_arg_handler_t
    bindBare(void (T::*f)(), T* o)
    {
        return std::bind(std::mem_fn(f), o);
    }
    template <class T>
    static param_arg_handler_t
    bindParam(void (T::*f)(std::string const&), T* o)
    {
        return std::bind(std::mem_fn(f), o, std::placeholders::_1);
    }

    // Ignore all remaining arguments and skip the final check.
    void stopParsing();
    bool wasStopped() const;

    // When processing arguments, indicate how many arguments remain after the one whose handler
    // is being called.
    int argsLeft() const;

    // Throw a TPDFUsage exception with the given message.
    void usage(std::string const& message);

  private:
    struct OptionEntry
    {
        bool parameter_needed{false};
        std::string parameter_name;
        bare_arg_handler_t bare_arg_handler{nullptr};
        param_arg_handler_t param_arg_handler{nullptr};
    };
    typedef std::map<std::string, OptionEntry> option_table_t;

    OptionEntry& registerArg(std::string const& arg);
    void handlePositional(std::string const& arg);
    void handleOption(std::string const& o_arg, std::string const& name);
    void doFinalChecks();

    class Members
    {
        friend class TPDFArgParser;

      public:
        ~Members() = default;

      private:
        Members(int argc, char const* const argv[]);
        Members(Members const&) = delete;

        int argc;
        char const* const* argv;
        std::string whoami;
        int cur_arg{0};
        bool options_done{false};
        bool stopped{false};
        option_table_t option_table;
        std::map<char, std::string> short_aliases;
        param_arg_handler_t positional_handler{nullptr};
        bare_arg_handler_t final_check_handler{nullptr};
    };
    std::shared_ptr<Members> m;
};

#endif // TPDFARGPARSER_HH
