/*
 * Copyright (C) 2014-2018 Olzhas Rakhimov
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

/// @file
/// Exceptions for Tremor.
/// Exceptions are designed with boost::exception;
/// that is, exception classes act like tags.
/// No new data members shall ever be added to derived exception classes
/// (no slicing upon copy or change of exception type!).
/// Instead, all the data are carried with boost::error_info mechanism.

#pragma once

#include <exception>
#include <optional>
#include <string>

#include <boost/current_function.hpp>
#include <boost/exception/exception.hpp>
#include <boost/exception/info.hpp>

#include "ext/source_info.h"

/// Convenience macro to throw Tremor exceptions.
/// This is similar to BOOST_THROW_EXCEPTION;
/// however, it doesn't obfuscate
/// the resultant exception type to conform to boost::exception.
///
/// @param[in] err  The error type deriving from boost::exception.
#define TREMOR_THROW(err)                                                      \
  throw err << ::boost::throw_function(BOOST_CURRENT_FUNCTION)                 \
            << ::boost::throw_file(FILE_REL_PATH)                              \
            << ::boost::throw_line(__LINE__)

namespace tremor {

/// The generic tag to carry an erroneous value.
/// Use this tag only if another more-specific error tag is not available.
using errinfo_value = boost::error_info<struct tag_value, std::string>;

/// The Error class is the base class
/// for all exceptions specific to the Tremor code.
///
/// @note The copy constructor is not noexcept as required by std::exception.
///       However, this class may only throw std::bad_alloc upon copy,
///       which may be produced anyway
///       even if the copy constructor were noexcept.
class Error : virtual public std::exception, virtual public boost::exception {
 public:
  /// Constructs a new error with a provided message.
  ///
  /// @param[in] msg  The message to be passed with this error.
  explicit Error(std::string msg) : msg_(std::move(msg)) {}

  /// @returns The formatted error message to be printed.
  const char* what() const noexcept final { return msg_.c_str(); }

 private:
  std::string msg_;  ///< The error message.
};

/// For input/output related errors.
struct IOError : public Error {
  using Error::Error;
};

/// Signals internal logic errors,
/// for example, pre-condition failure
/// or use of functionality in ways not designed to.
struct LogicError : public Error {
  using Error::Error;
};

/// This error can be used to indicate
/// that call for a function or operation is not legal.
struct IllegalOperation : public Error {
  using Error::Error;
};

/// Requests for functionality that has no implementation
/// for the given combination of inputs.
struct NotImplemented : public Error {
  using Error::Error;
};

/// The error in analysis settings.
struct SettingsError : public Error {
  using Error::Error;
};

/// Model validity errors.
struct ValidityError : public Error {
  using Error::Error;
};

/// This error indicates that elements must be unique.
struct DuplicateElementError : public ValidityError {
  DuplicateElementError() : ValidityError("Duplicate Element Error") {}
};

/// The error for undefined elements in a model.
struct UndefinedElement : public ValidityError {
  UndefinedElement() : ValidityError("Undefined Element Error") {}
};

/// Invalid domain for values or arguments.
struct DomainError : public ValidityError {
  using ValidityError::ValidityError;
};

namespace model {  // Source model specific errors.

/// The identifier of the seismic source.
using errinfo_source_id = boost::error_info<struct tag_source_id, std::string>;

/// The name of the requested source or MFD modification.
using errinfo_operation =
    boost::error_info<struct tag_operation, const char*>;

}  // namespace model

namespace lt {  // Logic-tree specific errors.

/// The branch identifier.
using errinfo_branch_id = boost::error_info<struct tag_branch_id, std::string>;

/// The branch set identifier.
using errinfo_branchset_id =
    boost::error_info<struct tag_branchset_id, std::string>;

/// The uncertainty type string of a branch set.
using errinfo_uncertainty =
    boost::error_info<struct tag_uncertainty, std::string>;

/// The applicability filter key.
using errinfo_filter = boost::error_info<struct tag_filter, std::string>;

/// Logic tree input contains a logic error.
///
/// The message is rendered as "filename '<file>', line <line>: <message>".
/// The same file and line are also attached as error info.
struct LogicTreeError : public ValidityError {
  /// @param[in] line  The line of the offending node if known (positive).
  /// @param[in] filename  The file with the logic tree description.
  /// @param[in] message  The description of the problem.
  LogicTreeError(std::optional<int> line, const std::string& filename,
                 const std::string& message);
};

}  // namespace lt

namespace core {  // Analysis specific errors.

/// The ordinal of the realization under processing.
using errinfo_realization = boost::error_info<struct tag_realization, int>;

}  // namespace core

namespace xml {

/// The base for all XML related errors.
struct Error : public tremor::Error {
  using tremor::Error::Error;
};

/// XML parsing errors.
struct ParseError : public Error {
  using Error::Error;
};

/// XML document validity errors.
struct ValidityError : public Error {
  using Error::Error;
};

/// The XML attribute name.
using errinfo_attribute =
    boost::error_info<struct tag_xml_attribute, std::string>;

/// The XML element name.
using errinfo_element = boost::error_info<struct tag_xml_element, std::string>;

}  // namespace xml

}  // namespace tremor
