/* Copyright (c) 2024 The trustpdf Authors
 *
 * This file is part of trustpdf.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef TRUSTPDFCONSTANTS_H
#define TRUSTPDFCONSTANTS_H

/*
 * Keep this file 'C' compatible. It contains only enumerated types
 * that are shared between the library and the command-line tool.
 */

/* Exit Codes from trustpdf */

enum tpdf_exit_code_e {
    tpdf_exit_success = 0,
    /* Usage errors, missing tools, bad input, and failed stages */
    tpdf_exit_error = 1,
};

/* Error Codes */

enum tpdf_error_code_e {
    tpdf_e_success = 0,
    tpdf_e_internal,    /* logic/programming error -- indicates bug */
    tpdf_e_system,      /* I/O error, memory error, etc. */
    tpdf_e_dependency,  /* a required external program is not installed */
    tpdf_e_input,       /* input file is missing or is not a PDF */
    tpdf_e_stage,       /* an external conversion stage failed */
    tpdf_e_interrupted, /* terminated by a signal */
};

#endif /* TRUSTPDFCONSTANTS_H */
