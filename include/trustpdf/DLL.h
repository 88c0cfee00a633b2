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

#ifndef TRUSTPDF_DLL_HH
#define TRUSTPDF_DLL_HH

#define TRUSTPDF_MAJOR_VERSION 1
#define TRUSTPDF_MINOR_VERSION 0
#define TRUSTPDF_PATCH_VERSION 0
#define TRUSTPDF_VERSION "1.0.0"

/*
 * Symbol visibility for libtrustpdf. The library is built with
 * visibility=hidden, so anything in the public ABI is marked
 * explicitly. TRUSTPDF_DLL_CLASS exports a class together with its
 * type information, which is required for exception classes and for
 * classes used with dynamic_cast across the shared object boundary.
 * TRUSTPDF_DLL_PRIVATE hides a member of an exported class.
 */

#if defined __GNUC__
# define TRUSTPDF_DLL __attribute__((visibility("default")))
# define TRUSTPDF_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define TRUSTPDF_DLL
# define TRUSTPDF_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define TRUSTPDF_DLL_CLASS TRUSTPDF_DLL
#else
# define TRUSTPDF_DLL_CLASS
#endif

#endif /* TRUSTPDF_DLL_HH */
