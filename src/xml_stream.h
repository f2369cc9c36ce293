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
/// Facilities to stream reports in XML format.

#pragma once

#include <cassert>
#include <cstdio>

#include <exception>
#include <string>

#include <boost/exception/errinfo_errno.hpp>

#include "error.h"

namespace tremor::xml {

/// Errors in using XML streaming facilities.
struct StreamError : public Error {
  using Error::Error;
};

namespace detail {  // XML streaming helpers.

/// Adaptor for stdio FILE stream with the stream-like write interface.
///
/// @note Write operations do not report errors.
///       The FILE handler keeps the error state for the final check.
class FileStream {
 public:
  /// @param[in] file  The output file stream.
  /// @param[in] indent  Option to produce indentation.
  FileStream(std::FILE* file, bool indent) : file_(file), indent_(indent) {}

  /// @returns The destination file stream.
  std::FILE* file() { return file_; }

  /// Writes the value into the file.
  /// @{
  FileStream& operator<<(const char* value) {
    std::fputs(value, file_);
    return *this;
  }
  FileStream& operator<<(char value) {
    std::fputc(value, file_);
    return *this;
  }
  FileStream& operator<<(int value) {
    std::fprintf(file_, "%d", value);
    return *this;
  }
  FileStream& operator<<(double value) {
    std::fprintf(file_, "%.12g", value);
    return *this;
  }
  /// @}

  /// Writes the indentation of the given width if enabled.
  void Indent(int width) {
    if (indent_ && width)
      std::fprintf(file_, "%*s", width, "");
  }

 private:
  std::FILE* file_;  ///< The destination file.
  bool indent_;  ///< Option to enable/disable indentation.
};

}  // namespace detail

/// Writer of an XML element into the stream.
/// The closing tag is put upon destruction,
/// so elements are meant to live on the stack.
/// Only the innermost live element accepts data;
/// its ancestors are inactive until it is destroyed.
///
/// @pre All strings are UTF-8 encoded.
///
/// @note Elements with text cannot have child elements.
///
/// @warning Names of elements and attributes are not validated.
///          The element does not own the name string.
class StreamElement {
 public:
  /// Moves the streaming responsibility to the new element.
  StreamElement(StreamElement&& other) noexcept
      : name_(other.name_),
        depth_(other.depth_),
        state_(other.state_),
        active_(other.active_),
        parent_(other.parent_),
        stream_(other.stream_) {
    other.stream_ = nullptr;
  }

  /// Puts the closing tag.
  ///
  /// @pre No child element is alive.
  ~StreamElement() noexcept {
    if (!stream_)
      return;
    assert(active_ && "The child element may still be alive.");
    if (parent_)
      parent_->active_ = true;
    switch (state_) {
      case State::kAttributes:
        *stream_ << "/>\n";
        break;
      case State::kElements:
        Indent();
        [[fallthrough]];
      case State::kText:
        *stream_ << "</" << name_ << ">\n";
    }
  }

  /// Sets an attribute of the element.
  ///
  /// @param[in] name  Non-empty name for the attribute.
  /// @param[in] value  The value with XML special characters escaped.
  ///
  /// @returns The reference to this element.
  ///
  /// @throws StreamError  The name is empty
  ///                      or the element does not accept attributes anymore.
  template <typename T>
  StreamElement& SetAttribute(const char* name, const T& value) {
    Require(State::kAttributes, "Too late for attributes.");
    if (*name == '\0')
      throw StreamError("Attribute name can't be empty.");
    *stream_ << ' ' << name << "=\"";
    Put(value);
    *stream_ << '"';
    return *this;
  }

  /// Adds text to the element.
  ///
  /// @param[in] text  The text with XML special characters escaped.
  ///
  /// @returns The reference to this element.
  ///
  /// @throws StreamError  The element already has child elements.
  template <typename T>
  StreamElement& AddText(const T& text) {
    if (state_ == State::kElements)
      throw StreamError("Too late to put text.");
    Require(State::kText, "The element is inactive.");
    if (state_ == State::kAttributes)
      *stream_ << '>';
    state_ = State::kText;
    Put(text);
    return *this;
  }

  /// Adds a child element to the element.
  ///
  /// @param[in] name  Non-empty name for the child element.
  ///
  /// @returns The writer of the child element.
  ///
  /// @post The element is inactive while the child is alive.
  ///
  /// @throws StreamError  The element already has text.
  StreamElement AddChild(const char* name) {
    if (state_ == State::kText)
      throw StreamError("Too late to add elements.");
    Require(State::kElements, "The element is inactive.");
    if (state_ == State::kAttributes)
      *stream_ << ">\n";
    state_ = State::kElements;
    return StreamElement(name, depth_ + 1, this, stream_);
  }

 private:
  friend class Stream;

  /// The streaming state of the element.
  enum class State { kAttributes, kElements, kText };

  /// @param[in] name  Non-empty name of the element.
  /// @param[in] depth  The depth of the element in the document.
  /// @param[in,out] parent  The parent element or nullptr for the root.
  /// @param[in,out] stream  The destination stream.
  ///
  /// @throws StreamError  The name is empty.
  StreamElement(const char* name, int depth, StreamElement* parent,
                detail::FileStream* stream)
      : name_(name), depth_(depth), parent_(parent), stream_(stream) {
    if (*name_ == '\0')
      throw StreamError("The element name can't be empty.");
    if (parent_)
      parent_->active_ = false;
    Indent();
    *stream_ << '<' << name_;
  }

  /// @throws StreamError  The element is inactive or past the state.
  void Require(State state, const char* message) const {
    if (!active_)
      throw StreamError("The element is inactive.");
    if (state_ > state)
      throw StreamError(message);
  }

  /// Indents the tags of the element.
  void Indent() { stream_->Indent(depth_ * 2); }

  /// Puts the value escaping the XML special characters.
  /// @{
  void Put(int value) { *stream_ << value; }
  void Put(double value) { *stream_ << value; }
  void Put(bool value) { *stream_ << (value ? "true" : "false"); }
  void Put(const std::string& value) { Put(value.c_str()); }
  void Put(const char* value) {
    for (; *value; ++value) {
      switch (*value) {
        case '&':
          *stream_ << "&amp;";
          break;
        case '<':
          *stream_ << "&lt;";
          break;
        case '"':
          *stream_ << "&quot;";
          break;
        default:
          *stream_ << *value;
      }
    }
  }
  /// @}

  const char* name_;  ///< The name of the element.
  int depth_;  ///< The depth for indentation.
  State state_ = State::kAttributes;  ///< The accepted data.
  bool active_ = true;  ///< The innermost element in streaming.
  StreamElement* parent_;  ///< The parent element.
  detail::FileStream* stream_;  ///< The destination.
};

/// XML Stream document.
///
/// @pre Only this stream and its elements write to the output destination.
class Stream {
 public:
  /// Puts the XML header into the destination.
  ///
  /// @param[in] out  The stream destination with clean error state.
  /// @param[in] indent  Option to indent output for readability.
  explicit Stream(std::FILE* out, bool indent = true)
      : uncaught_exceptions_(std::uncaught_exceptions()), out_(out, indent) {
    assert(!std::ferror(out) && "Unclean error state in output destination.");
    out_ << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  }

  /// @throws IOError  The file write operation has failed.
  ///
  /// @post The exception is thrown only if no other exception is on flight.
  ~Stream() noexcept(false) {
    int err = std::ferror(out_.file());
    if (err && (std::uncaught_exceptions() == uncaught_exceptions_))
      TREMOR_THROW(IOError("FILE error on write")) << boost::errinfo_errno(err);
  }

  /// Creates the root element of the document.
  ///
  /// @param[in] name  The name for the root element.
  ///
  /// @returns XML stream element representing the document root.
  ///
  /// @throws StreamError  The document already has a root element.
  StreamElement root(const char* name) {
    if (has_root_)
      throw StreamError("The XML stream document already has a root.");
    has_root_ = true;
    return StreamElement(name, 0, nullptr, &out_);
  }

 private:
  bool has_root_ = false;  ///< The document has constructed its root.
  int uncaught_exceptions_;  ///< The balance of exceptions.
  detail::FileStream out_;  ///< The output stream.
};

}  // namespace tremor::xml
