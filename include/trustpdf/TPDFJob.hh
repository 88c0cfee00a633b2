// Copyright (c) 2024 The trustpdf Authors
//
// This file is part of trustpdf.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef TPDFJOB_HH
#define TPDFJOB_HH

#include <trustpdf/Constants.h>
#include <trustpdf/DLL.h>

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

class TPDFCommand;
class TPDFDependencies;
class TPDFLogger;
class TPDFScratchDir;

// A TPDFJob converts one PDF into a "trusted" PDF: every page is rasterized with ImageMagick, the
// page images are assembled into a new PDF, and the result is optimized with Ghostscript. Nothing
// from the original file survives except what can be seen on the page, so scripts, embedded
// files, forms and links are gone.
//
// The trustpdf command-line tool just initializes a TPDFJob from argv, calls run(), and handles
// errors and the exit status. The same can be done programmatically through config().
class TPDFJob
{
  public:
    // Exit codes -- returned by getExitCode() after calling run(). When run() throws, the exit
    // status is EXIT_ERROR.
    static int constexpr EXIT_ERROR = tpdf_exit_error;

    static int constexpr DEFAULT_DPI = 300;
    static int constexpr MIN_DPI = 72;
    static int constexpr MAX_DPI = 600;

    // TPDFUsage is thrown if there are any usage-like errors when calling Config methods.
    TRUSTPDF_DLL
    TPDFJob();

    // SETUP FUNCTIONS

    // Initialize a TPDFJob object from argv, which must be a null-terminated array of
    // null-terminated C strings. If there are any command-line errors, this method throws
    // TPDFUsage. --help and --version write their output to the logger's info channel right away;
    // run() then does nothing.
    TRUSTPDF_DLL
    void initializeFromArgv(char const* const argv[]);

    // The full usage text printed by --help, with progname in the synopsis and examples.
    TRUSTPDF_DLL
    static std::string usageText(std::string const& progname);

    // Report a command-line error: the message on the logger's error channel followed by the
    // usage text. The program name is taken from the last initializeFromArgv() call.
    TRUSTPDF_DLL
    void showUsageError(std::string const& msg);

    // To capture or redirect output, configure the logger returned by getLogger(). By default,
    // all TPDFJob objects share the default logger. See TPDFLogger.hh.
    TRUSTPDF_DLL
    std::shared_ptr<TPDFLogger> getLogger();
    TRUSTPDF_DLL
    void setLogger(std::shared_ptr<TPDFLogger>);

    // The answer to the overwrite prompt is read from this stream. Defaults to std::cin.
    TRUSTPDF_DLL
    void setPromptInput(std::istream*);

    // Check to make sure the configuration is complete and derive the output file name. This is
    // called automatically after initializing from argv and by run() if it has not been called.
    // It throws a TPDFUsage exception if there are any errors.
    TRUSTPDF_DLL
    void checkConfiguration();

    // CONFIGURATION

    // Configuration is implemented in TPDFJob_config.cc. The methods correspond to the
    // command-line options and may be chained:
    //
    //   job.config()->inputFile("in.pdf")->dpi("150")->verbose()->checkConfiguration();
    class Config
    {
        friend class TPDFJob;

      public:
        // Proxy to TPDFJob::checkConfiguration()
        TRUSTPDF_DLL
        void checkConfiguration();

        TRUSTPDF_DLL
        Config* inputFile(std::string const& filename);
        TRUSTPDF_DLL
        Config* outputFile(std::string const& filename);
        // The value must be a decimal number from MIN_DPI to MAX_DPI.
        TRUSTPDF_DLL
        Config* dpi(std::string const& parameter);
        TRUSTPDF_DLL
        Config* batch();
        TRUSTPDF_DLL
        Config* verbose();

      private:
        Config() = delete;
        Config(Config const&) = delete;
        Config(TPDFJob& job) :
            o(job)
        {
        }
        TPDFJob& o;
    };
    friend class Config;

    // Return a top-level configuration item. See CONFIGURATION above for details. If an invalid
    // configuration is created (such as supplying contradictory options, omitting an input file,
    // etc.), TPDFUsage is thrown.
    TRUSTPDF_DLL
    std::shared_ptr<Config> config();

    // QUERY FUNCTIONS

    // Valid after checkConfiguration().
    TRUSTPDF_DLL
    std::string const& getInputFile() const;
    TRUSTPDF_DLL
    std::string const& getOutputFile() const;
    TRUSTPDF_DLL
    int getDPI() const;

    // EXECUTION

    // Run the conversion. Throws TPDFExc if a dependency is missing, the input can't be used, a
    // required stage fails or the process is interrupted. The scratch directory is removed
    // before run() returns or throws. If the process is interrupted after the output file has
    // started to be written, the output file is removed as well.
    TRUSTPDF_DLL
    void run();

    TRUSTPDF_DLL
    int getExitCode() const;

    // True if run() stopped because the user declined to overwrite the output file.
    TRUSTPDF_DLL
    bool wasCancelled() const;

    // Figures from the last successful run().
    struct Result
    {
        bool original_size_known{false};
        unsigned long long original_size{0};
        bool output_size_known{false};
        unsigned long long output_size{0};
        size_t page_count{0};
        int dpi{0};
        bool optimized{false};
    };
    TRUSTPDF_DLL
    Result const& getResult() const;

    // Return the page image file names from a directory listing in page order. Only names of
    // the form page-<digits>.png are included; they are ordered by page number.
    TRUSTPDF_DLL
    static std::vector<std::string> sortPageImages(std::vector<std::string> const& names);

    // Convert a file name to the default output name: the last extension of the last path
    // element is replaced by ".trusted.pdf".
    TRUSTPDF_DLL
    static std::string trustedName(std::string const& input);

    // Call fn with the logger if verbose mode is enabled.
    TRUSTPDF_DLL
    void doIfVerbose(std::function<void(TPDFLogger&)> fn);

  private:
    // Basic file checking
    static void usage(std::string const& msg);
    bool confirmOverwrite();
    std::string validateInput();

    // Conversion stages
    std::vector<std::string> rasterize(TPDFDependencies const&, TPDFScratchDir const&);
    void reassemble(TPDFDependencies const&, std::vector<std::string> const& pages);
    bool optimize(TPDFDependencies const&, TPDFScratchDir const&);
    void discardOutput();
    void summarize();
    int runCommand(TPDFCommand const&);

    class Members
    {
        friend class TPDFJob;

      public:
        ~Members() = default;

      private:
        Members();
        Members(Members const&) = delete;

        std::shared_ptr<TPDFLogger> log;
        std::istream* prompt_input{&std::cin};
        std::string progname{"trustpdf"};
        std::string infilename;
        std::string outfilename;
        std::string given_outfilename;
        int dpi{DEFAULT_DPI};
        bool batch{false};
        bool verbose{false};
        bool configured{false};
        bool info_only{false};
        bool cancelled{false};
        // Set when the reassembly command is about to write the output file.
        bool writing_output{false};
        Result result;
    };
    std::shared_ptr<Members> m;
};

#endif // TPDFJOB_HH
