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

#ifndef TPDFLOGGER_HH
#define TPDFLOGGER_HH

#include <trustpdf/DLL.h>
#include <trustpdf/Pipeline.hh>

#include <iostream>
#include <memory>

class TPDFLogger
{
  public:
    TRUSTPDF_DLL
    static std::shared_ptr<TPDFLogger> create();

    // Return the default logger. TPDFJob uses it unless a different logger is passed to
    // TPDFJob::setLogger. Create a separate logger when output from a job has to be captured
    // without disturbing anything else, as the test suite does.
    TRUSTPDF_DLL
    static std::shared_ptr<TPDFLogger> defaultLogger();

    // Defaults:
    //
    // info -- standard output
    // success -- whatever info points to
    // warn -- whatever error points to
    // error -- standard error
    //
    // "info" is used for progress messages, verbose command echoing, the summary, help text and
    // the overwrite prompt. "success" is used for the completion message. "warn" is used for
    // conditions that do not stop the conversion, such as a failed optimization. "error" is
    // used for anything that stops it.
    //
    // info(), success(), warn() and error() each write one complete line consisting of a
    // severity marker ("[INFO]", "[SUCCESS]", "[WARNING]", "[ERROR]"), a space, the message,
    // and a newline. The message must not end with a newline. To write unmarked text, write to
    // the pipeline returned by the corresponding get method.
    //
    // Markers are coloured with ANSI escape sequences when the destination is standard output
    // or standard error and that stream is a terminal. Call setColor to force colour on or off.
    //
    // On deletion, finish() is called for the standard output and standard error pipelines,
    // which flushes output. If you supply any custom pipelines, you must call finish() on them
    // yourself.

    TRUSTPDF_DLL
    void info(std::string const&);
    TRUSTPDF_DLL
    std::shared_ptr<Pipeline> getInfo(bool null_okay = false);

    TRUSTPDF_DLL
    void success(std::string const&);
    TRUSTPDF_DLL
    std::shared_ptr<Pipeline> getSuccess(bool null_okay = false);

    TRUSTPDF_DLL
    void warn(std::string const&);
    TRUSTPDF_DLL
    std::shared_ptr<Pipeline> getWarn(bool null_okay = false);

    TRUSTPDF_DLL
    void error(std::string const&);
    TRUSTPDF_DLL
    std::shared_ptr<Pipeline> getError(bool null_okay = false);

    TRUSTPDF_DLL
    std::shared_ptr<Pipeline> standardOutput();
    TRUSTPDF_DLL
    std::shared_ptr<Pipeline> standardError();
    TRUSTPDF_DLL
    std::shared_ptr<Pipeline> discard();

    // Passing a null pointer resets to default
    TRUSTPDF_DLL
    void setInfo(std::shared_ptr<Pipeline>);
    TRUSTPDF_DLL
    void setSuccess(std::shared_ptr<Pipeline>);
    TRUSTPDF_DLL
    void setWarn(std::shared_ptr<Pipeline>);
    TRUSTPDF_DLL
    void setError(std::shared_ptr<Pipeline>);

    // Shortcut for logic to reset output to new output/error streams. out_stream is used for
    // info, err_stream is used for error, and success and warn are cleared so that they follow
    // info and error respectively.
    TRUSTPDF_DLL
    void setOutputStreams(std::ostream* out_stream, std::ostream* err_stream);

    TRUSTPDF_DLL
    void setColor(bool);

  private:
    TPDFLogger();
    std::shared_ptr<Pipeline> throwIfNull(std::shared_ptr<Pipeline>, bool null_okay);
    void writeMarked(
        std::shared_ptr<Pipeline> p,
        char const* marker,
        char const* color,
        std::string const& msg);

    class Members
    {
        friend class TPDFLogger;

      public:
        TRUSTPDF_DLL
        ~Members();

      private:
        enum color_e { c_auto, c_on, c_off };

        Members();
        Members(Members const&) = delete;

        std::shared_ptr<Pipeline> p_discard;
        std::shared_ptr<Pipeline> p_stdout;
        std::shared_ptr<Pipeline> p_stderr;
        std::shared_ptr<Pipeline> p_info;
        std::shared_ptr<Pipeline> p_success;
        std::shared_ptr<Pipeline> p_warn;
        std::shared_ptr<Pipeline> p_error;
        color_e color{c_auto};
    };
    std::shared_ptr<Members> m;
};

#endif // TPDFLOGGER_HH
