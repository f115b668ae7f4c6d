/// @file
/// @brief Streaming C++ CSV library

// Copyright 2020 Matthew Chandler

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:

// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#ifndef CSVSTREAM_CSV_HPP
#define CSVSTREAM_CSV_HPP

#include <algorithm>
#include <array>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include <cassert>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

#include "csvstream/version.h"

/// @defgroup cpp C++ library

/// CSV library namespace

/// @ingroup cpp
namespace csvstream
{
    /// @addtogroup cpp
    /// @{

    /// Library version
    static constexpr struct
    {
        int major {CSVSTREAM_VERSION_MAJOR},
            minor {CSVSTREAM_VERSION_MINOR},
            patch {CSVSTREAM_VERSION_PATCH};
    } version;

    /// A decoded row
    using Row = std::vector<std::string>;

    /// A decoded row zipped with its headers

    /// Duplicated headers keep every value, in column order
    using Map_row = std::multimap<std::string, std::string>;

    /// Kinds of row-level errors
    enum class Error_kind
    {
        encoding,               ///< Row is not valid UTF-8
        stray_escape_character, ///< Escape character in an invalid position
        escape_sequence,        ///< Escape sequence did not terminate
        row_length              ///< Row length differs from the reference length
    };

    /// @returns Short name for an Error_kind
    inline std::string to_string(const Error_kind kind)
    {
        switch(kind)
        {
        case Error_kind::encoding:
            return "encoding error";
        case Error_kind::stray_escape_character:
            return "stray escape character";
        case Error_kind::escape_sequence:
            return "escape sequence error";
        case Error_kind::row_length:
            return "row length error";
        }
        return "unknown error";
    }

    /// Details of a row-level error
    struct Error_info
    {
        Error_kind kind { Error_kind::stray_escape_character }; ///< What went wrong
        std::size_t line { 0 };             ///< 1-based line the error is reported on
        std::string sequence;               ///< Offending input fragment
        std::size_t escape_max_lines { 0 }; ///< Line limit in effect (escape_sequence only)
        std::size_t expected_length { 0 };  ///< Reference row length (row_length only)
        std::size_t actual_length { 0 };    ///< Actual row length (row_length only)
        bool stream_halted { false };       ///< Reported while flushing at end of input

        /// Render as descriptive text

        /// @returns Human readable error message
        std::string message() const;
    };

    inline bool operator==(const Error_info & lhs, const Error_info & rhs)
    {
        return lhs.kind == rhs.kind
            && lhs.line == rhs.line
            && lhs.sequence == rhs.sequence
            && lhs.escape_max_lines == rhs.escape_max_lines
            && lhs.expected_length == rhs.expected_length
            && lhs.actual_length == rhs.actual_length
            && lhs.stream_halted == rhs.stream_halted;
    }

    inline bool operator!=(const Error_info & lhs, const Error_info & rhs)
    {
        return !(lhs == rhs);
    }

    /// Error base class

    /// Base class for all library exceptions. Do not use directly
    class Error: virtual public std::exception
    {
    public:
        virtual ~Error() = default;
        /// @returns Exception message
        const char * what() const throw() override { return msg_.c_str(); }
    protected:
        Error() = default;
        explicit Error(const std::string & msg): msg_{msg} {}
    private:
        std::string msg_;
    };

    /// Internal error

    /// Thrown when an illegal state occurs
    struct Internal_error: virtual public Error
    {
        /// @param msg Error message
        explicit Internal_error(const std::string & msg): Error{msg} {}
    };

    /// Option error

    /// Thrown when decoding or encoding options are inconsistent
    struct Option_error final: virtual public Error
    {
        /// @param msg Error message
        explicit Option_error(const std::string & msg): Error{msg} {}
    };

    /// Parsing error

    /// Base class for the exceptions thrown by strict decoding. Each Error_kind
    /// has its own subclass
    class Parse_error: virtual public Error
    {
    public:
        /// @returns Details of the error
        const Error_info & info() const { return info_; }
        /// @returns Line number that the error occured on
        std::size_t line_no() const { return info_.line; }

    protected:
        /// @param info Details of the error
        explicit Parse_error(const Error_info & info): Error{info.message()}, info_{info} {}

    private:
        Error_info info_;
    };

    /// Thrown by strict decoding for rows that are not valid UTF-8
    struct Encoding_error final: public Parse_error
    {
        /// @param info Details of the error
        explicit Encoding_error(const Error_info & info): Error{info.message()}, Parse_error{info} {}
    };

    /// Thrown by strict decoding when an escape character appears in an invalid position
    struct Stray_escape_character_error final: public Parse_error
    {
        /// @param info Details of the error
        explicit Stray_escape_character_error(const Error_info & info): Error{info.message()}, Parse_error{info} {}
    };

    /// Thrown by strict decoding when an escape sequence does not terminate
    struct Escape_sequence_error final: public Parse_error
    {
        /// @param info Details of the error
        explicit Escape_sequence_error(const Error_info & info): Error{info.message()}, Parse_error{info} {}
    };

    /// Thrown by strict decoding when a row has an unexpected number of fields
    struct Row_length_error final: public Parse_error
    {
        /// @param info Details of the error
        explicit Row_length_error(const Error_info & info): Error{info.message()}, Parse_error{info} {}
    };

    /// IO error

    /// Thrown when an IO error occurs
    class IO_error final: virtual public Error
    {
    public:
        /// @param msg Error message
        /// @param errno_code \c errno code
        explicit IO_error(const std::string & msg, int errno_code):
            Error{msg + ": " + std::strerror(errno_code)},
            errno_code_{errno_code}
        {}
        /// @returns \c errno code
        int errno_code() const { return errno_code_; }
        /// @returns %Error message for the \c errno code
        std::string errno_str() const { return std::strerror(errno_code_); }
    private:
        int errno_code_;
    };

    /// Throw the Parse_error subclass matching an error's kind
    [[noreturn]] inline void throw_parse_error(const Error_info & info)
    {
        switch(info.kind)
        {
        case Error_kind::encoding:
            throw Encoding_error{info};
        case Error_kind::stray_escape_character:
            throw Stray_escape_character_error{info};
        case Error_kind::escape_sequence:
            throw Escape_sequence_error{info};
        case Error_kind::row_length:
            throw Row_length_error{info};
        }
        throw Internal_error{"Unknown error kind"};
    }

    /// Result of decoding one row

    /// Holds either a Row or the Error_info describing why the row was rejected
    class Row_result
    {
    public:
        /// @param row Decoded fields
        /// @param line Line the row started on
        static Row_result ok(Row row, std::size_t line = 0)
        {
            return Row_result{std::move(row), line};
        }

        /// @param info Error details
        static Row_result error(Error_info info)
        {
            auto line = info.line;
            return Row_result{std::move(info), line};
        }

        /// @returns \c true if this holds a Row
        bool ok() const { return std::holds_alternative<Row>(value_); }
        explicit operator bool() const { return ok(); }

        /// @returns The decoded row
        /// @throws Internal_error if this holds an error
        const Row & row() const
        {
            if(!ok())
                throw Internal_error{"Row_result holds an error: " + to_string(error().kind)};
            return std::get<Row>(value_);
        }

        /// @returns The decoded row
        /// @throws Internal_error if this holds an error
        Row & row()
        {
            if(!ok())
                throw Internal_error{"Row_result holds an error: " + to_string(error().kind)};
            return std::get<Row>(value_);
        }

        /// @returns The error details
        /// @throws Internal_error if this holds a row
        const Error_info & error() const
        {
            if(ok())
                throw Internal_error{"Row_result holds a row"};
            return std::get<Error_info>(value_);
        }

        /// @returns Line the row started on, or the line of the error
        std::size_t line() const { return line_; }

        /// Compare payloads. Line numbers of successful rows are not compared
        bool equals(const Row_result & rhs) const
        {
            return value_ == rhs.value_;
        }

    private:
        Row_result(std::variant<Row, Error_info> value, std::size_t line): value_{std::move(value)}, line_{line} {}

        std::variant<Row, Error_info> value_;
        std::size_t line_ { 0 };
    };

    inline bool operator==(const Row_result & lhs, const Row_result & rhs)
    {
        return lhs.equals(rhs);
    }

    inline bool operator!=(const Row_result & lhs, const Row_result & rhs)
    {
        return !lhs.equals(rhs);
    }

    /// A value or an error message

    /// Produced by fail-soft decoding, where every error is rendered as text
    /// inline with successful rows
    template <typename T>
    class Result
    {
    public:
        /// @param value Successful value
        static Result success(T value)
        {
            Result r;
            r.value_ = std::move(value);
            return r;
        }

        /// @param message Error text
        static Result failure(std::string message)
        {
            Result r;
            r.error_ = std::move(message);
            return r;
        }

        /// @returns \c true if this holds a value
        bool ok() const { return value_.has_value(); }
        explicit operator bool() const { return ok(); }

        /// @returns The value
        /// @throws Internal_error if this holds an error
        const T & value() const
        {
            if(!value_)
                throw Internal_error{"Result holds an error: " + error_};
            return *value_;
        }

        /// @returns The value
        /// @throws Internal_error if this holds an error
        T & value()
        {
            if(!value_)
                throw Internal_error{"Result holds an error: " + error_};
            return *value_;
        }

        /// @returns Error text, or an empty string on success
        const std::string & error() const { return error_; }

    private:
        Result() = default;

        std::optional<T> value_;
        std::string error_;
    };

    template <typename T>
    inline bool operator==(const Result<T> & lhs, const Result<T> & rhs)
    {
        if(lhs.ok() != rhs.ok())
            return false;
        return lhs.ok() ? lhs.value() == rhs.value() : lhs.error() == rhs.error();
    }

    template <typename T>
    inline bool operator!=(const Result<T> & lhs, const Result<T> & rhs)
    {
        return !(lhs == rhs);
    }

    /// Header row configuration
    class Headers
    {
    public:
        /// Where header names come from
        enum class Mode
        {
            none,      ///< Rows are not zipped with headers
            first_row, ///< The first decoded row is the header row
            given      ///< Header names are supplied by the caller
        };

        /// @returns No headers
        static Headers none() { return Headers{Mode::none, {}}; }
        /// @returns Take headers from the first decoded row
        static Headers first_row() { return Headers{Mode::first_row, {}}; }
        /// @param names Header names
        /// @returns Use the given header names
        static Headers given(std::vector<std::string> names) { return Headers{Mode::given, std::move(names)}; }

        Mode mode() const { return mode_; }
        const std::vector<std::string> & names() const { return names_; }

    private:
        Headers(Mode mode, std::vector<std::string> names): mode_{mode}, names_{std::move(names)} {}

        Mode mode_ { Mode::none };
        std::vector<std::string> names_;
    };

    /// Which row fixes the reference length for row-length validation
    enum class Row_length_source
    {
        headers,  ///< The header row (given or decoded); without headers, the first row
        first_row ///< The first data row after any header row
    };

    /// Decoding options
    struct Decode_options
    {
        char32_t separator { U',' };        ///< Field separator codepoint
        char32_t escape_character { U'"' }; ///< Escape (quote) codepoint

        /// Applied to every field after formula unescaping. Empty for identity
        std::function<std::string(std::string)> field_transform;

        /// Strip the apostrophe from fields starting with \c '= \c '- \c '+ or \c '@
        bool unescape_formulas { false };

        /// Number of newlines an escape sequence may span before it is abandoned. Must be positive
        std::size_t escape_max_lines { 10 };

        /// Reject (or repair, with \c replacement) rows that are not valid UTF-8
        bool validate_encoding { false };

        /// Replaces each invalid UTF-8 sequence when \c validate_encoding is set
        std::optional<std::string> replacement;

        Headers headers { Headers::none() };          ///< Header row handling
        bool validate_row_length { false };            ///< Reject rows of unexpected length
        Row_length_source row_length_source { Row_length_source::headers }; ///< Reference length policy
    };

    /// Encoding options
    struct Encode_options
    {
        char32_t separator { U',' };        ///< Field separator codepoint
        char32_t escape_character { U'"' }; ///< Escape (quote) codepoint
        std::string delimiter { "\r\n" };   ///< Row delimiter
        bool escape_formulas { false };     ///< Prefix formula-like fields with an apostrophe
    };

    namespace detail
    {
        /// Encode a codepoint as UTF-8

        /// @throws Option_error if \c c is not a Unicode scalar value
        inline std::string encode_utf8(const char32_t c)
        {
            if(c > 0x10FFFF || (c >= 0xD800 && c <= 0xDFFF))
                throw Option_error{"Invalid codepoint: " + std::to_string(static_cast<unsigned long>(c))};

            std::string out;
            if(c < 0x80)
            {
                out += static_cast<char>(c);
            }
            else if(c < 0x800)
            {
                out += static_cast<char>(0xC0 | (c >> 6));
                out += static_cast<char>(0x80 | (c & 0x3F));
            }
            else if(c < 0x10000)
            {
                out += static_cast<char>(0xE0 | (c >> 12));
                out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (c & 0x3F));
            }
            else
            {
                out += static_cast<char>(0xF0 | (c >> 18));
                out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (c & 0x3F));
            }
            return out;
        }

        /// Length of the well-formed UTF-8 sequence starting at \c pos

        /// @returns Sequence length, or 0 if the bytes at \c pos are ill-formed
        inline std::size_t utf8_sequence_length(const std::string_view text, const std::size_t pos)
        {
            auto byte = [&text](std::size_t i) { return static_cast<unsigned char>(text[i]); };

            auto lead = byte(pos);
            if(lead < 0x80)
                return 1;

            std::size_t len = 0;
            unsigned char lo = 0x80, hi = 0xBF;
            if(lead >= 0xC2 && lead <= 0xDF)
                len = 2;
            else if(lead >= 0xE0 && lead <= 0xEF)
            {
                len = 3;
                if(lead == 0xE0)
                    lo = 0xA0;
                else if(lead == 0xED)
                    hi = 0x9F;
            }
            else if(lead >= 0xF0 && lead <= 0xF4)
            {
                len = 4;
                if(lead == 0xF0)
                    lo = 0x90;
                else if(lead == 0xF4)
                    hi = 0x8F;
            }
            else
                return 0;

            if(pos + len > std::size(text))
                return 0;

            if(byte(pos + 1) < lo || byte(pos + 1) > hi)
                return 0;

            for(std::size_t i = 2; i < len; ++i)
            {
                if(byte(pos + i) < 0x80 || byte(pos + i) > 0xBF)
                    return 0;
            }

            return len;
        }

        /// @returns \c true if \c text is well-formed UTF-8
        inline bool valid_utf8(const std::string_view text)
        {
            for(std::size_t i = 0; i < std::size(text);)
            {
                auto len = utf8_sequence_length(text, i);
                if(len == 0)
                    return false;
                i += len;
            }
            return true;
        }

        /// Replace each ill-formed byte of \c text with \c replacement
        inline std::string replace_invalid_utf8(const std::string_view text, const std::string & replacement)
        {
            std::string out;
            out.reserve(std::size(text));
            for(std::size_t i = 0; i < std::size(text);)
            {
                if(auto len = utf8_sequence_length(text, i); len > 0)
                {
                    out.append(text.substr(i, len));
                    i += len;
                }
                else
                {
                    out += replacement;
                    ++i;
                }
            }
            return out;
        }

        /// @returns The first \c count characters of \c text. Ill-formed bytes count as one character each
        inline std::string utf8_prefix(const std::string_view text, std::size_t count)
        {
            std::size_t i = 0;
            for(; i < std::size(text) && count > 0; --count)
                i += std::max<std::size_t>(utf8_sequence_length(text, i), 1);
            return std::string{text.substr(0, i)};
        }

        /// @returns \c true if \c c starts a spreadsheet formula
        inline bool is_formula_start(const char c)
        {
            return c == '=' || c == '-' || c == '+' || c == '@';
        }

        /// Double every occurrence of \c escape in \c text
        inline std::string double_escapes(const std::string & text, const std::string & escape)
        {
            std::string out;
            out.reserve(std::size(text));
            std::size_t start = 0;
            for(auto pos = text.find(escape); pos != std::string::npos; pos = text.find(escape, start))
            {
                out.append(text, start, pos + std::size(escape) - start);
                out += escape;
                start = pos + std::size(escape);
            }
            out.append(text, start, std::string::npos);
            return out;
        }

        /// Delimiter alphabet
        enum class Token_kind: unsigned char
        {
            separator,
            escape,
            carriage_return,
            newline
        };

        /// A delimiter found in a buffer
        struct Token
        {
            Token_kind kind;
            std::size_t position; ///< Offset of the first byte
            std::size_t length;   ///< Length in bytes

            std::size_t end() const { return position + length; }
        };

        inline bool operator==(const Token & lhs, const Token & rhs)
        {
            return lhs.kind == rhs.kind && lhs.position == rhs.position && lhs.length == rhs.length;
        }

        /// Finds separator, escape, CR and LF tokens

        /// Tokens are reported leftmost first and never overlap. Separator and
        /// escape may be multi-byte UTF-8 sequences; a token that does not fit
        /// entirely in the buffer is not reported
        class Token_scanner
        {
        public:
            /// @param separator Separator bytes
            /// @param escape Escape character bytes
            Token_scanner(const std::string & separator, const std::string & escape):
                separator_{separator},
                escape_{escape}
            {
                if(std::empty(separator_) || std::empty(escape_))
                    throw Option_error{"Separator and escape character must not be empty"};

                lead_[static_cast<unsigned char>('\r')] = true;
                lead_[static_cast<unsigned char>('\n')] = true;
                lead_[static_cast<unsigned char>(separator_[0])] = true;
                lead_[static_cast<unsigned char>(escape_[0])] = true;
            }

            /// Find the first token at or after \c from

            /// @returns The token, or an empty optional if none remain
            std::optional<Token> find(const std::string_view buffer, std::size_t from) const
            {
                for(auto i = from; i < std::size(buffer); ++i)
                {
                    auto c = static_cast<unsigned char>(buffer[i]);
                    if(!lead_[c])
                        continue;

                    if(c == '\n')
                        return Token{Token_kind::newline, i, 1};
                    if(c == '\r')
                        return Token{Token_kind::carriage_return, i, 1};
                    if(matches(buffer, i, escape_))
                        return Token{Token_kind::escape, i, std::size(escape_)};
                    if(matches(buffer, i, separator_))
                        return Token{Token_kind::separator, i, std::size(separator_)};
                }
                return {};
            }

            /// Find every token at or after \c from
            std::vector<Token> scan(const std::string_view buffer, std::size_t from = 0) const
            {
                std::vector<Token> tokens;
                while(auto token = find(buffer, from))
                {
                    from = token->end();
                    tokens.push_back(*token);
                }
                return tokens;
            }

            /// @returns Length of the longest token
            std::size_t max_token_length() const
            {
                return std::max(std::size(separator_), std::size(escape_));
            }

        private:
            static bool matches(const std::string_view buffer, const std::size_t pos, const std::string & token)
            {
                return buffer.compare(pos, std::size(token), token) == 0;
            }

            std::string separator_;
            std::string escape_;
            std::array<bool, 256> lead_ {}; ///< First bytes of every token
        };

        /// Builds a field's final value

        /// Joins carried partial content with a byte range of the buffer, strips
        /// formula escaping if enabled, then applies the field transform
        class Field_finalizer
        {
        public:
            using Transform = std::function<std::string(std::string)>;

            Field_finalizer(const bool unescape_formulas, Transform transform):
                unescape_formulas_{unescape_formulas},
                transform_{std::move(transform)}
            {}

            /// @param buffer Current buffer
            /// @param partial Raw field content carried from earlier
            /// @param start Offset of the field's remaining bytes in \c buffer
            /// @param length Number of bytes
            /// @returns The field
            std::string operator()(const std::string_view buffer, const std::string & partial,
                    const std::size_t start, const std::size_t length) const
            {
                std::string field;
                field.reserve(std::size(partial) + length);
                field += partial;
                field.append(buffer.substr(start, length));

                if(unescape_formulas_ && std::size(field) > 1 && field[0] == '\'' && is_formula_start(field[1]))
                    field.erase(0, 1);

                if(transform_)
                    return transform_(std::move(field));

                return field;
            }

        private:
            bool unescape_formulas_;
            Transform transform_;
        };
    }

    inline std::string Error_info::message() const
    {
        auto line_str = std::to_string(line);
        auto excerpt = detail::utf8_prefix(sequence, 10);
        switch(kind)
        {
        case Error_kind::encoding:
            return "Invalid encoding on line " + line_str;

        case Error_kind::stray_escape_character:
            return "Stray escape character on line " + line_str + ":\n\n" + sequence +
                "\n\nThis error often happens when the wrong separator or escape character has been applied.\n";

        case Error_kind::escape_sequence:
            if(stream_halted)
                return "Escape sequence started on line " + line_str + ":\n\n" + excerpt +
                    "\n\ndid not terminate before the stream halted.\n";

            return "Escape sequence started on line " + line_str + ":\n\n" + excerpt +
                "\n\ndid not terminate. Escape sequences are allowed to span up to " +
                std::to_string(escape_max_lines) + " lines. This threshold avoids collecting the whole "
                "input into memory when an escape sequence does not terminate. It can be changed with "
                "the escape_max_lines option.\n";

        case Error_kind::row_length:
            return "Row on line " + line_str + " has length " + std::to_string(actual_length) +
                " - expected length " + std::to_string(expected_length);
        }
        return "Unknown error on line " + line_str;
    }

    /// Parser states
    enum class State
    {
        open,           ///< Outside of an escape sequence
        escaped,        ///< Inside an escape sequence
        escape_closing, ///< Saw an escape character while escaped. Either a doubled escape or the end of the sequence
        errored,        ///< Discarding input until the next newline
        row_closing     ///< Saw CR, an LF may follow
    };

    /// Parser state and the fields belonging to it

    /// Positions are byte offsets into the parser's buffer, which starts with
    /// Parser_context::leftover between chunks
    struct Parse_state
    {
        State kind { State::open };
        std::size_t field_start { 0 };       ///< Start of the current field's unconsumed bytes
        std::size_t line { 1 };              ///< Current line. While errored: line that counting resumes from
        std::size_t escape_start { 0 };      ///< escaped, escape_closing: position of the opening escape character
        std::size_t escape_start_line { 0 }; ///< escaped, escape_closing: line the escape began on
        std::size_t previous_match { 0 };    ///< escape_closing: position of the escape character just seen
        std::optional<Error_info> error;     ///< errored: queued error
    };

    /// Decoding state carried between chunks
    struct Parser_context
    {
        Row fields;               ///< Completed fields of the current row
        std::string partial_field; ///< Raw content of an escaped field before a doubled escape
        Parse_state state;
        std::string leftover;     ///< Unconsumed bytes of the current field, from the opening escape if escaped
        std::size_t row_line { 1 }; ///< Line the current row started on
    };

    /// Incremental CSV parser

    /// Feed chunks of any size with consume(), then call finish() once at end
    /// of input. Output is the same no matter how the input is split. Malformed
    /// rows are reported as errors and parsing resumes at the next line
    class Row_parser
    {
    public:
        /// @param options Decoding options
        /// @throws Option_error if the options are inconsistent
        explicit Row_parser(const Decode_options & options = {}):
            escape_{detail::encode_utf8(options.escape_character)},
            escape_max_lines_{options.escape_max_lines},
            validate_encoding_{options.validate_encoding},
            replacement_{options.replacement},
            scanner_{detail::encode_utf8(options.separator), escape_},
            finalize_{options.unescape_formulas, options.field_transform}
        {
            if(options.separator == options.escape_character)
                throw Option_error{"Separator and escape character must differ"};
            if(options.separator == U'\r' || options.separator == U'\n'
                    || options.escape_character == U'\r' || options.escape_character == U'\n')
                throw Option_error{"Separator and escape character must not be CR or LF"};
            if(escape_max_lines_ == 0)
                throw Option_error{"escape_max_lines must be greater than 0"};
        }

        /// Parse a chunk of input

        /// @param chunk Next bytes of input
        /// @returns Rows and errors completed by this chunk
        std::vector<Row_result> consume(const std::string_view chunk)
        {
            SPDLOG_TRACE("consuming {} bytes, {} carried over", std::size(chunk), std::size(ctx_.leftover));

            buffer_ = std::move(ctx_.leftover);
            ctx_.leftover.clear();
            parsed_end_ = std::size(buffer_);
            buffer_.append(chunk);

            // a multi-byte token may have started in the carried bytes
            auto overlap = scanner_.max_token_length() - 1;
            walk(parsed_end_ > overlap ? parsed_end_ - overlap : 0);

            carry_over();
            return take_emitted();
        }

        /// Flush at end of input

        /// Closes any pending field and row. Errors reported here have
        /// Error_info::stream_halted set. Resets the parser for reuse
        /// @returns Remaining rows and errors
        std::vector<Row_result> finish()
        {
            halting_ = true;
            buffer_ = std::move(ctx_.leftover);
            ctx_.leftover.clear();
            parsed_end_ = std::size(buffer_);

            while(flush_pending())
                ;

            SPDLOG_TRACE("end of input");
            auto rows = take_emitted();
            reset();
            return rows;
        }

        /// Discard all state and start over at line 1
        void reset()
        {
            ctx_ = Parser_context{};
            buffer_.clear();
            parsed_end_ = 0;
            halting_ = false;
        }

        /// @returns Current state
        const Parser_context & context() const { return ctx_; }

    private:
        /// Dispatch tokens starting at \c pos until none remain
        void walk(std::size_t pos)
        {
            while(auto token = scanner_.find(buffer_, pos))
            {
                // already handled in an earlier chunk
                if(token->end() <= parsed_end_)
                {
                    pos = token->end();
                    continue;
                }

                pos = dispatch(*token);
            }
        }

        /// Apply the transition for the current state

        /// @returns Position to continue scanning from
        std::size_t dispatch(const detail::Token & token)
        {
            switch(ctx_.state.kind)
            {
            case State::open:
                return on_open(token);
            case State::escaped:
                return on_escaped(token);
            case State::escape_closing:
                return on_escape_closing(token);
            case State::errored:
                return on_errored(token);
            case State::row_closing:
                return on_row_closing(token);
            }
            throw Internal_error{"Illegal state"};
        }

        std::size_t on_open(const detail::Token & token)
        {
            auto & st = ctx_.state;
            switch(token.kind)
            {
            case detail::Token_kind::escape:
                if(token.position == st.field_start)
                {
                    st.kind = State::escaped;
                    st.field_start = token.end();
                    st.escape_start = token.position;
                    st.escape_start_line = st.line;
                }
                else
                {
                    Error_info error;
                    error.kind = Error_kind::stray_escape_character;
                    error.line = st.line;
                    enter_errored(std::move(error), st.field_start, st.line);
                }
                return token.end();

            case detail::Token_kind::newline:
                push_field(token.position);
                emit_row();
                open_at(token.end(), st.line + 1);
                return token.end();

            case detail::Token_kind::carriage_return:
                push_field(token.position);
                emit_row();
                st.kind = State::row_closing;
                st.field_start = token.end();
                return token.end();

            case detail::Token_kind::separator:
                push_field(token.position);
                st.field_start = token.end();
                return token.end();
            }
            throw Internal_error{"Illegal token"};
        }

        std::size_t on_escaped(const detail::Token & token)
        {
            auto & st = ctx_.state;
            if(token.kind == detail::Token_kind::escape)
            {
                st.kind = State::escape_closing;
                st.previous_match = token.position;
            }
            else if(token.kind == detail::Token_kind::newline)
            {
                if(st.escape_start_line + escape_max_lines_ == st.line)
                    return abandon_escape(escape_max_lines_);

                ++st.line;
            }
            return token.end();
        }

        std::size_t on_escape_closing(const detail::Token & token)
        {
            auto & st = ctx_.state;
            if(token.position != st.previous_match + std::size(escape_))
            {
                Error_info error;
                error.kind = Error_kind::stray_escape_character;
                error.line = st.line;
                enter_errored(std::move(error), st.escape_start, st.escape_start_line);

                // reprocess this token while errored
                return token.position;
            }

            switch(token.kind)
            {
            case detail::Token_kind::escape:
                // doubled escape: keep the first one as content
                ctx_.partial_field.append(buffer_, st.field_start, token.position - st.field_start);
                st.kind = State::escaped;
                st.field_start = token.end();
                break;

            case detail::Token_kind::newline:
                push_field(st.previous_match);
                emit_row();
                open_at(token.end(), st.line + 1);
                break;

            case detail::Token_kind::carriage_return:
                push_field(st.previous_match);
                emit_row();
                st.kind = State::row_closing;
                st.field_start = token.end();
                break;

            case detail::Token_kind::separator:
                push_field(st.previous_match);
                st.kind = State::open;
                st.field_start = token.end();
                break;
            }
            return token.end();
        }

        std::size_t on_errored(const detail::Token & token)
        {
            if(token.kind != detail::Token_kind::newline)
                return token.end();

            auto & st = ctx_.state;
            auto first_newline = buffer_.find('\n', st.field_start);
            auto line = st.line;

            emit_queued_error(token.position);

            if(first_newline == token.position)
            {
                open_at(token.end(), line + 1);
                return token.end();
            }
            return resync(first_newline, line + 1);
        }

        std::size_t on_row_closing(const detail::Token & token)
        {
            auto & st = ctx_.state;
            if(token.kind == detail::Token_kind::newline && token.position == st.field_start)
            {
                open_at(token.end(), st.line + 1);
                return token.end();
            }

            // bare CR: reinterpret this token at the start of a new row
            open_at(st.field_start, st.line);
            return token.position;
        }

        /// Close whatever is pending at end of input

        /// @returns \c true if parsing resumed and another pass is needed
        bool flush_pending()
        {
            auto & st = ctx_.state;
            auto size = std::size(buffer_);

            switch(st.kind)
            {
            case State::row_closing:
                open_at(st.field_start, st.line);
                [[fallthrough]];

            case State::open:
                if(!std::empty(ctx_.fields) || st.field_start < size)
                {
                    push_field(size);
                    emit_row();
                }
                return false;

            case State::escape_closing:
                if(st.previous_match + std::size(escape_) == size)
                {
                    push_field(st.previous_match);
                    emit_row();
                    return false;
                }
                else
                {
                    Error_info error;
                    error.kind = Error_kind::stray_escape_character;
                    error.line = st.line;
                    enter_errored(std::move(error), st.escape_start, st.escape_start_line);
                }
                [[fallthrough]];

            case State::errored:
            {
                auto first_newline = buffer_.find('\n', st.field_start);
                auto line = st.line;

                emit_queued_error(size);

                if(first_newline == std::string::npos)
                    return false;

                walk(resync(first_newline, line + 1));
                return true;
            }

            case State::escaped:
            {
                auto lines = static_cast<std::size_t>(std::count(std::begin(buffer_) + st.escape_start, std::end(buffer_), '\n'));
                auto first_newline = buffer_.find('\n', st.escape_start);
                if(first_newline == std::string::npos)
                {
                    abandon_escape(lines);
                    return false;
                }

                walk(abandon_escape(lines));
                return true;
            }
            }
            throw Internal_error{"Illegal state"};
        }

        /// Report an unterminated escape sequence and resume after the first newline following its start

        /// @param max_lines Line limit reported in the error
        /// @returns Position to continue scanning from
        std::size_t abandon_escape(const std::size_t max_lines)
        {
            auto & st = ctx_.state;
            auto first_newline = buffer_.find('\n', st.escape_start);
            auto stop = first_newline == std::string::npos ? std::size(buffer_) : first_newline;

            Error_info error;
            error.kind = Error_kind::escape_sequence;
            error.line = st.escape_start_line;
            error.escape_max_lines = max_lines;
            error.sequence = buffer_.substr(st.escape_start, stop - st.escape_start);
            emit_error(std::move(error));

            if(first_newline == std::string::npos)
            {
                ctx_.fields.clear();
                ctx_.partial_field.clear();
                open_at(std::size(buffer_), st.escape_start_line + 1);
                return std::size(buffer_);
            }
            return resync(first_newline, st.escape_start_line + 1);
        }

        /// Drop the current row and restart parsing after \c newline

        /// Tokens after \c newline are rescanned from a clean state
        /// @returns Position to continue scanning from
        std::size_t resync(const std::size_t newline, const std::size_t line)
        {
            ctx_.fields.clear();
            ctx_.partial_field.clear();
            open_at(newline + 1, line);
            parsed_end_ = 0;

            SPDLOG_DEBUG("resynchronized at byte {}, line {}", newline + 1, line);
            return newline + 1;
        }

        /// Drop the current row and discard input until the next newline

        /// @param error Error to emit once the newline is found
        /// @param field_start Start of the offending field, reported in the error's sequence
        /// @param line Line that counting resumes from after the newline
        void enter_errored(Error_info error, const std::size_t field_start, const std::size_t line)
        {
            auto & st = ctx_.state;
            ctx_.fields.clear();
            ctx_.partial_field.clear();
            st.kind = State::errored;
            st.field_start = field_start;
            st.line = line;
            st.error = std::move(error);

            SPDLOG_DEBUG("{} on line {}, discarding until next newline", to_string(st.error->kind), st.error->line);
        }

        /// Emit the errored state's error, with the input from the field start to \c stop
        void emit_queued_error(const std::size_t stop)
        {
            auto & st = ctx_.state;
            if(!st.error)
                throw Internal_error{"No queued error"};

            auto error = std::move(*st.error);
            st.error.reset();
            error.sequence = buffer_.substr(st.field_start, stop - st.field_start);
            emit_error(std::move(error));
        }

        void open_at(const std::size_t pos, const std::size_t line)
        {
            auto & st = ctx_.state;
            st.kind = State::open;
            st.field_start = pos;
            st.line = line;
            st.error.reset();
            ctx_.row_line = line;
        }

        void push_field(const std::size_t field_end)
        {
            auto & st = ctx_.state;
            ctx_.fields.push_back(finalize_(buffer_, ctx_.partial_field, st.field_start, field_end - st.field_start));
            ctx_.partial_field.clear();
        }

        void emit_row()
        {
            Row row = std::move(ctx_.fields);
            ctx_.fields.clear();

            if(validate_encoding_)
            {
                for(auto & field: row)
                {
                    if(detail::valid_utf8(field))
                        continue;

                    if(!replacement_)
                    {
                        Error_info error;
                        error.kind = Error_kind::encoding;
                        error.line = ctx_.row_line;
                        error.sequence = field;
                        emit_error(std::move(error));
                        return;
                    }
                    field = detail::replace_invalid_utf8(field, *replacement_);
                }
            }

            emitted_.push_back(Row_result::ok(std::move(row), ctx_.row_line));
        }

        void emit_error(Error_info error)
        {
            error.stream_halted = error.stream_halted || halting_;
            SPDLOG_DEBUG("emitting {} on line {}", to_string(error.kind), error.line);
            emitted_.push_back(Row_result::error(std::move(error)));
        }

        /// Keep the bytes of the unfinished field for the next chunk
        void carry_over()
        {
            auto & st = ctx_.state;
            auto escaping = st.kind == State::escaped || st.kind == State::escape_closing;
            auto keep_from = std::min(escaping ? st.escape_start : st.field_start, std::size(buffer_));

            ctx_.leftover.assign(buffer_, keep_from, std::string::npos);
            st.field_start -= keep_from;
            if(escaping)
                st.escape_start -= keep_from;
            if(st.kind == State::escape_closing)
                st.previous_match -= keep_from;

            buffer_.clear();
        }

        std::vector<Row_result> take_emitted()
        {
            auto rows = std::move(emitted_);
            emitted_.clear();
            return rows;
        }

        std::string escape_;               ///< Escape character bytes
        std::size_t escape_max_lines_;     ///< Newlines an escape sequence may span
        bool validate_encoding_;           ///< Check rows for valid UTF-8
        std::optional<std::string> replacement_; ///< Replacement for invalid UTF-8

        detail::Token_scanner scanner_;
        detail::Field_finalizer finalize_;

        Parser_context ctx_;
        std::string buffer_;               ///< Carried bytes followed by the current chunk
        std::size_t parsed_end_ { 0 };     ///< Tokens ending at or before this offset were already handled
        bool halting_ { false };           ///< Flushing at end of input
        std::vector<Row_result> emitted_;  ///< Output of the current call
    };

    /// Pulls the next chunk of input. An empty optional signals end of input
    using Chunk_source = std::function<std::optional<std::string>()>;

    /// Chunk sources for Row_stream
    namespace sources
    {
        /// Default chunk size for streams and strings
        inline constexpr std::size_t default_chunk_size = 64 * 1024;

        namespace detail
        {
            inline std::optional<std::string> read_chunk(std::istream & input_stream, const std::size_t chunk_size)
            {
                std::string chunk(chunk_size, '\0');
                input_stream.read(std::data(chunk), static_cast<std::streamsize>(chunk_size));
                if(input_stream.bad())
                    throw IO_error{"Error reading from input", errno};

                chunk.resize(static_cast<std::size_t>(input_stream.gcount()));
                if(std::empty(chunk))
                    return {};

                return chunk;
            }

            inline void check_chunk_size(const std::size_t chunk_size)
            {
                if(chunk_size == 0)
                    throw Option_error{"Chunk size must be greater than 0"};
            }
        }

        /// Yield each of \c chunks in order
        inline Chunk_source from_chunks(std::vector<std::string> chunks)
        {
            return [chunks = std::move(chunks), i = std::size_t{0}]() mutable -> std::optional<std::string>
            {
                if(i == std::size(chunks))
                    return {};
                return chunks[i++];
            };
        }

        /// Split \c data into chunks of \c chunk_size bytes
        /// @throws Option_error if \c chunk_size is 0
        inline Chunk_source from_string(std::string data, const std::size_t chunk_size = default_chunk_size)
        {
            detail::check_chunk_size(chunk_size);
            return [data = std::move(data), chunk_size, pos = std::size_t{0}]() mutable -> std::optional<std::string>
            {
                if(pos >= std::size(data))
                    return {};
                auto chunk = data.substr(pos, chunk_size);
                pos += std::size(chunk);
                return chunk;
            };
        }

        /// Read chunks of \c chunk_size bytes from \c input_stream

        /// The source throws IO_error if the stream goes bad
        /// @warning \c input_stream must outlive the source
        /// @throws Option_error if \c chunk_size is 0
        inline Chunk_source from_istream(std::istream & input_stream, const std::size_t chunk_size = default_chunk_size)
        {
            detail::check_chunk_size(chunk_size);
            return [stream = &input_stream, chunk_size]() { return detail::read_chunk(*stream, chunk_size); };
        }

        /// Read chunks of \c chunk_size bytes from a file
        /// @throws IO_error if the file can not be opened
        /// @throws Option_error if \c chunk_size is 0
        inline Chunk_source from_file(const std::string & filename, const std::size_t chunk_size = default_chunk_size)
        {
            detail::check_chunk_size(chunk_size);
            auto stream = std::make_shared<std::ifstream>(filename, std::ios::binary);
            if(!(*stream))
                throw IO_error("Could not open file '" + filename + "'", errno);

            return [stream, chunk_size]() { return detail::read_chunk(*stream, chunk_size); };
        }
    }

    /// Lazy sequence of decoded rows

    /// Pulls chunks from a Chunk_source only as rows are requested. Queued
    /// results are handed out before the next chunk is fetched, and the
    /// end-of-input flush runs exactly once
    class Row_stream
    {
    public:
        /// Iterates over Row_results
        class Iterator
        {
        public:
            using value_type        = Row_result;
            using difference_type   = std::ptrdiff_t;
            using pointer           = const value_type*;
            using reference         = const value_type&;
            using iterator_category = std::input_iterator_tag;

            /// Empty constructor

            /// Denotes the end of iteration
            Iterator(): stream_{nullptr} {}

            /// Creates an iterator from a Row_stream, and reads the first result

            /// @param stream Row_stream to iterate over
            /// @warning \c stream must not be destroyed or read from during iteration
            explicit Iterator(Row_stream & stream): stream_{&stream}
            {
                ++*this;
            }

            /// @returns Current result
            const value_type & operator*() const { return *obj_; }
            /// @returns Current result
            value_type & operator*() { return *obj_; }

            /// @returns Pointer to current result
            const value_type * operator->() const { return &*obj_; }
            /// @returns Pointer to current result
            value_type * operator->() { return &*obj_; }

            /// Iterate to next result
            Iterator & operator++()
            {
                assert(stream_);

                obj_ = stream_->next();
                if(!obj_)
                    stream_ = nullptr;

                return *this;
            }

            /// Compare to another Row_stream::Iterator
            bool equals(const Iterator & rhs) const
            {
                return stream_ == rhs.stream_;
            }

        private:
            Row_stream * stream_; ///< Pointer to parent Row_stream, or \c nullptr if no results remain
            std::optional<value_type> obj_; ///< Storage for the current result
        };

        /// Disambiguation tag type

        /// Distinguishes opening a Row_stream with a filename from opening a
        /// Row_stream with a string
        struct input_string_t{};

        /// Disambiguation tag

        /// Distinguishes opening a Row_stream with a filename from opening a
        /// Row_stream with a string
        static inline constexpr input_string_t input_string{};

        /// Decode chunks from any source

        /// @param source Chunk_source to pull from
        /// @param options Decoding options
        /// @throws Option_error if the options are inconsistent
        explicit Row_stream(Chunk_source source, const Decode_options & options = {}):
            source_{std::move(source)},
            parser_{options}
        {}

        /// Use a std::istream for CSV parsing

        /// @param input_stream std::istream to read from
        /// @param options Decoding options
        /// @param chunk_size Bytes to read per chunk
        /// @warning \c input_stream must not be destroyed or read from during the lifetime of this Row_stream
        explicit Row_stream(std::istream & input_stream, const Decode_options & options = {},
                const std::size_t chunk_size = sources::default_chunk_size):
            Row_stream{sources::from_istream(input_stream, chunk_size), options}
        {}

        /// Open a file for CSV parsing

        /// @param filename Path to a file to parse
        /// @param options Decoding options
        /// @param chunk_size Bytes to read per chunk
        /// @throws IO_error if there is an error opening the file
        explicit Row_stream(const std::string & filename, const Decode_options & options = {},
                const std::size_t chunk_size = sources::default_chunk_size):
            Row_stream{sources::from_file(filename, chunk_size), options}
        {}

        /// Parse CSV from memory

        /// Use Row_stream::input_string to distinguish this constructor from the
        /// constructor accepting a filename
        /// @param input_data \c std::string containing CSV to parse
        /// @param options Decoding options
        /// @param chunk_size Bytes per chunk
        Row_stream(input_string_t, const std::string & input_data, const Decode_options & options = {},
                const std::size_t chunk_size = sources::default_chunk_size):
            Row_stream{sources::from_string(input_data, chunk_size), options}
        {}

        Row_stream(const Row_stream &) = delete;
        Row_stream & operator=(const Row_stream &) = delete;
        Row_stream(Row_stream &&) = default;
        Row_stream & operator=(Row_stream &&) = default;

        /// Get the next result

        /// @returns Next row or error, or an empty optional at end of input
        /// @throws IO_error if the source fails
        std::optional<Row_result> next()
        {
            while(std::empty(pending_))
            {
                if(!pull())
                    return {};
            }

            auto result = std::move(pending_.front());
            pending_.pop_front();
            return result;
        }

        /// Read all remaining results
        std::vector<Row_result> read_all()
        {
            std::vector<Row_result> results;
            while(auto result = next())
                results.push_back(std::move(*result));
            return results;
        }

        /// @returns \c true once end of input has been flushed and every result handed out
        bool eof() const { return finished_ && std::empty(pending_); }

        /// @returns Iterator to current result
        Iterator begin()
        {
            return Iterator(*this);
        }

        /// @returns Iterator to end of input
        Iterator end()
        {
            return Iterator();
        }

    private:
        /// Fetch one chunk (or flush at end of input) into the queue

        /// @returns \c false if input was already exhausted
        bool pull()
        {
            if(finished_)
                return false;

            if(auto chunk = source_())
            {
                auto rows = parser_.consume(*chunk);
                std::move(std::begin(rows), std::end(rows), std::back_inserter(pending_));
            }
            else
            {
                auto rows = parser_.finish();
                std::move(std::begin(rows), std::end(rows), std::back_inserter(pending_));
                finished_ = true;
            }
            return true;
        }

        Chunk_source source_;
        Row_parser parser_;
        std::deque<Row_result> pending_; ///< Results not yet handed out
        bool finished_ { false };        ///< End of input has been flushed
    };

    /// Compare two Row_stream::Iterator objects
    inline bool operator==(const Row_stream::Iterator & lhs, const Row_stream::Iterator & rhs)
    {
        return lhs.equals(rhs);
    }

    /// Compare two Row_stream::Iterator objects
    inline bool operator!=(const Row_stream::Iterator & lhs, const Row_stream::Iterator & rhs)
    {
        return !lhs.equals(rhs);
    }

    /// Extracts header rows, validates row lengths and zips rows with headers
    class Row_assembler
    {
    public:
        /// @param options Decoding options. Uses \c headers, \c validate_row_length and \c row_length_source
        explicit Row_assembler(const Decode_options & options = {}):
            mode_{options.headers.mode()},
            headers_{options.headers.names()},
            have_headers_{options.headers.mode() == Headers::Mode::given},
            validate_row_length_{options.validate_row_length},
            row_length_source_{options.row_length_source}
        {}

        /// Process one decoded result

        /// @returns The result to hand out, or an empty optional if the row was consumed as the header row
        std::optional<Row_result> assemble(Row_result result)
        {
            if(!result)
                return result;

            if(mode_ == Headers::Mode::first_row && !have_headers_)
            {
                headers_ = std::move(result.row());
                have_headers_ = true;
                return {};
            }

            if(!validate_row_length_)
                return result;

            auto length = std::size(result.row());
            if(!expected_length_)
            {
                if(row_length_source_ == Row_length_source::headers && mode_ != Headers::Mode::none)
                    expected_length_ = std::size(headers_);
                else
                    expected_length_ = length;
            }

            if(length == *expected_length_)
                return result;

            Error_info error;
            error.kind = Error_kind::row_length;
            error.line = result.line();
            error.expected_length = *expected_length_;
            error.actual_length = length;
            return Row_result::error(std::move(error));
        }

        /// Zip a row with the headers

        /// The shorter of the two bounds the result
        Map_row zip(const Row & row) const
        {
            Map_row map;
            for(std::size_t i = 0; i < std::min(std::size(row), std::size(headers_)); ++i)
                map.emplace(headers_[i], row[i]);
            return map;
        }

        /// @returns \c true if rows are zipped with headers
        bool uses_headers() const { return mode_ != Headers::Mode::none; }

        /// @returns Header names. Decoded headers are available once the header row has been read
        const std::vector<std::string> & headers() const { return headers_; }

    private:
        Headers::Mode mode_;
        std::vector<std::string> headers_;
        bool have_headers_;
        bool validate_row_length_;
        Row_length_source row_length_source_;
        std::optional<std::size_t> expected_length_;
    };

    /// Decodes CSV data

    /// Decodes according to RFC 4180 rules from a chunked source. By default
    /// decoding is fail-soft: a malformed row is reported as a Result holding
    /// the error's text, and decoding continues with the next row. A strict
    /// Reader instead throws the Parse_error subclass for the first error
    class Reader
    {
    public:
        /// Iterates over rows
        class Iterator
        {
        public:
            using value_type        = Result<Row>;
            using difference_type   = std::ptrdiff_t;
            using pointer           = const value_type*;
            using reference         = const value_type&;
            using iterator_category = std::input_iterator_tag;

            /// Empty constructor

            /// Denotes the end of iteration
            Iterator(): reader_{nullptr} {}

            /// Creates an iterator from a Reader object

            /// @param r Reader object to iterate over
            /// @warning \c r must not be destroyed or read from during iteration
            explicit Iterator(Reader & r): reader_{&r}
            {
                ++*this;
            }

            /// @returns Current row
            const value_type & operator*() const { return *obj_; }
            /// @returns Current row
            value_type & operator*() { return *obj_; }

            /// @returns Pointer to current row
            const value_type * operator->() const { return &*obj_; }
            /// @returns Pointer to current row
            value_type * operator->() { return &*obj_; }

            /// Iterate to next row
            Iterator & operator++()
            {
                assert(reader_);

                obj_ = reader_->read_row();
                if(!obj_)
                    reader_ = nullptr;

                return *this;
            }

            /// Compare to another Reader::Iterator
            bool equals(const Iterator & rhs) const
            {
                return reader_ == rhs.reader_;
            }

        private:
            Reader * reader_; ///< Pointer to parent Reader object or nullptr if no rows remain
            std::optional<value_type> obj_; ///< Storage for the current row
        };

        using input_string_t = Row_stream::input_string_t;
        static inline constexpr input_string_t input_string{};

        /// Decode chunks from any source

        /// @param source Chunk_source to pull from
        /// @param options Decoding options
        /// @param strict Throw on the first error instead of reporting it inline
        explicit Reader(Chunk_source source, const Decode_options & options = {}, const bool strict = false):
            stream_{std::move(source), options},
            assembler_{options},
            strict_{strict}
        {}

        /// Use a std::istream for CSV parsing

        /// @param input_stream std::istream to read from
        /// @param options Decoding options
        /// @param strict Throw on the first error instead of reporting it inline
        /// @warning \c input_stream must not be destroyed or read from during the lifetime of this Reader
        explicit Reader(std::istream & input_stream, const Decode_options & options = {}, const bool strict = false):
            Reader{sources::from_istream(input_stream), options, strict}
        {}

        /// Open a file for CSV parsing

        /// @param filename Path to a file to parse
        /// @param options Decoding options
        /// @param strict Throw on the first error instead of reporting it inline
        /// @throws IO_error if there is an error opening the file
        explicit Reader(const std::string & filename, const Decode_options & options = {}, const bool strict = false):
            Reader{sources::from_file(filename), options, strict}
        {}

        /// Parse CSV from memory

        /// Use Reader::input_string to distinguish this constructor from the
        /// constructor accepting a filename
        /// @param input_data \c std::string containing CSV to parse
        /// @param options Decoding options
        /// @param strict Throw on the first error instead of reporting it inline
        Reader(input_string_t, const std::string & input_data, const Decode_options & options = {}, const bool strict = false):
            Reader{sources::from_string(input_data), options, strict}
        {}

        /// Read the next row

        /// @returns The next row or error text, or an empty optional if no rows remain
        /// @throws Parse_error subclass on a malformed row (*only in strict mode*)
        /// @throws IO_error if error reading CSV data
        std::optional<Result<Row>> read_row()
        {
            auto result = next_assembled();
            if(!result)
                return {};

            if(result->ok())
                return Result<Row>::success(std::move(result->row()));

            return Result<Row>::failure(result->error().message());
        }

        /// Read the next row zipped with the headers

        /// @returns The next row as a map or error text, or an empty optional if no rows remain
        /// @throws Option_error if the Reader was not configured with headers
        /// @throws Parse_error subclass on a malformed row (*only in strict mode*)
        /// @throws IO_error if error reading CSV data
        std::optional<Result<Map_row>> read_map()
        {
            if(!assembler_.uses_headers())
                throw Option_error{"Reading maps requires headers"};

            auto result = next_assembled();
            if(!result)
                return {};

            if(result->ok())
                return Result<Map_row>::success(assembler_.zip(result->row()));

            return Result<Map_row>::failure(result->error().message());
        }

        /// Read all remaining rows
        std::vector<Result<Row>> read_all()
        {
            std::vector<Result<Row>> data;
            while(auto row = read_row())
                data.push_back(std::move(*row));
            return data;
        }

        /// Read all remaining rows zipped with the headers
        std::vector<Result<Map_row>> read_all_maps()
        {
            std::vector<Result<Map_row>> data;
            while(auto row = read_map())
                data.push_back(std::move(*row));
            return data;
        }

        /// @returns Header names. Headers from the first row are available after the first read
        const std::vector<std::string> & headers() const { return assembler_.headers(); }

        /// @returns Iterator to current row
        Iterator begin()
        {
            return Iterator(*this);
        }

        /// @returns Iterator to end of CSV data
        Iterator end()
        {
            return Iterator();
        }

    private:
        std::optional<Row_result> next_assembled()
        {
            while(auto result = stream_.next())
            {
                auto assembled = assembler_.assemble(std::move(*result));
                if(!assembled)
                    continue;

                if(strict_ && !assembled->ok())
                    throw_parse_error(assembled->error());

                return assembled;
            }
            return {};
        }

        Row_stream stream_;
        Row_assembler assembler_;
        bool strict_ { false }; ///< Throw on first error
    };

    /// Compare two Reader::Iterator objects
    inline bool operator==(const Reader::Iterator & lhs, const Reader::Iterator & rhs)
    {
        return lhs.equals(rhs);
    }

    /// Compare two Reader::Iterator objects
    inline bool operator!=(const Reader::Iterator & lhs, const Reader::Iterator & rhs)
    {
        return !lhs.equals(rhs);
    }

    /// Decode a list of chunks, reporting errors inline

    /// @returns Every row, with malformed rows replaced by their error text
    inline std::vector<Result<Row>> decode(std::vector<std::string> chunks, const Decode_options & options = {})
    {
        return Reader{sources::from_chunks(std::move(chunks)), options}.read_all();
    }

    /// Decode a list of chunks, throwing on the first error

    /// @returns Every row
    /// @throws Parse_error subclass on the first malformed row
    inline std::vector<Row> decode_strict(std::vector<std::string> chunks, const Decode_options & options = {})
    {
        Reader reader{sources::from_chunks(std::move(chunks)), options, true};

        std::vector<Row> rows;
        while(auto row = reader.read_row())
            rows.push_back(std::move(row->value()));
        return rows;
    }

    namespace detail
    {
        // SFINAE types to determine the best way to convert a given type to a std::string

        // Does the type support std::to_string?
        template <typename T, typename = void>
        struct has_std_to_string: std::false_type{};
        template <typename T>
        struct has_std_to_string<T, std::void_t<decltype(std::to_string(std::declval<T>()))>> : std::true_type{};
        template <typename T>
        inline constexpr bool has_std_to_string_v = has_std_to_string<T>::value;

        // Does the type support a custom to_string?
        template <typename T, typename = void>
        struct has_to_string: std::false_type{};
        template <typename T>
        struct has_to_string<T, std::void_t<decltype(to_string(std::declval<T>()))>> : std::true_type{};
        template <typename T>
        inline constexpr bool has_to_string_v = has_to_string<T>::value;

        // Does the type support conversion via std::ostream::operator<<
        template <typename T, typename = void>
        struct has_ostr: std::false_type{};
        template <typename T>
        struct has_ostr<T, std::void_t<decltype(std::declval<std::ostringstream&>() << std::declval<T>())>> : std::true_type{};
        template <typename T>
        inline constexpr bool has_ostr_v = has_ostr<T>::value;

        template <typename T, typename std::enable_if_t<std::is_convertible_v<T, std::string>, int> = 0>
        std::string str(const T & t)
        {
            return t;
        }

        template <typename T, typename std::enable_if_t<!std::is_convertible_v<T, std::string> && has_std_to_string_v<T>, int> = 0>
        std::string str(const T & t)
        {
            return std::to_string(t);
        }

        template <typename T, typename std::enable_if_t<!std::is_convertible_v<T, std::string> && !has_std_to_string_v<T> && has_to_string_v<T>, int> = 0>
        std::string str(const T & t)
        {
            return to_string(t);
        }

        template <typename T, typename std::enable_if_t<!std::is_convertible_v<T, std::string> && !has_std_to_string_v<T> && !has_to_string_v<T> && has_ostr_v<T>, int> = 0>
        std::string str(const T & t)
        {
            std::ostringstream os;
            os<<t;
            return os.str();
        }

        // special conversion for char using std::string's initializer list ctor
        inline std::string str(char c)
        {
            return {c};
        }

        /// Quotes fields when needed and applies formula escaping
        class Field_quoter
        {
        public:
            /// @throws Option_error if the options are inconsistent
            explicit Field_quoter(const Encode_options & options):
                separator_{encode_utf8(options.separator)},
                escape_{encode_utf8(options.escape_character)},
                delimiter_{options.delimiter},
                escape_formulas_{options.escape_formulas}
            {
                if(options.separator == options.escape_character)
                    throw Option_error{"Separator and escape character must differ"};
                if(options.separator == U'\r' || options.separator == U'\n'
                        || options.escape_character == U'\r' || options.escape_character == U'\n')
                    throw Option_error{"Separator and escape character must not be CR or LF"};
            }

            /// @returns \c field, escaped and quoted if necessary
            std::string operator()(std::string field) const
            {
                bool quoted = false;
                if(escape_formulas_ && !std::empty(field) && is_formula_start(field[0]))
                {
                    field.insert(0, 1, '\'');
                    quoted = true;
                }

                if(!quoted)
                {
                    quoted = field.find(separator_) != std::string::npos
                        || field.find(escape_) != std::string::npos
                        || field.find_first_of("\r\n") != std::string::npos
                        || (!std::empty(delimiter_) && field.find(delimiter_) != std::string::npos);
                }

                if(!quoted)
                    return field;

                return escape_ + double_escapes(field, escape_) + escape_;
            }

            /// @returns Separator bytes
            const std::string & separator() const { return separator_; }

        private:
            std::string separator_;
            std::string escape_;
            std::string delimiter_;
            bool escape_formulas_;
        };
    }

    /// Field stringification trait

    /// The default converts values directly to std::string, then by
    /// \c std::to_string, then by a \c to_string found by ADL, then by
    /// `ostream::operator<<`. Specialize for other types:
    ///
    ///     namespace csvstream
    ///     {
    ///         template<> struct Field_encoder<Point>
    ///         {
    ///             static std::string encode(const Point & p) { ... }
    ///         };
    ///     }
    template <typename T, typename = void>
    struct Field_encoder
    {
        /// @returns \c value as a std::string
        static std::string encode(const T & value)
        {
            return detail::str(value);
        }
    };

    /// Encode one value with its Field_encoder
    template <typename T>
    std::string encode_value(const T & value)
    {
        return Field_encoder<T>::encode(value);
    }

    /// Format one row as a CSV line

    /// @param row Range of fields. Each is stringified with Field_encoder
    /// @param options Encoding options
    /// @returns The line, ending with the delimiter
    /// @throws Option_error if the options are inconsistent
    template <typename Range>
    std::string encode_row(const Range & row, const Encode_options & options = {})
    {
        detail::Field_quoter quote{options};

        std::string line;
        bool first_col = true;
        for(auto & field: row)
        {
            if(!first_col)
                line += quote.separator();
            first_col = false;

            line += quote(encode_value(field));
        }
        line += options.delimiter;
        return line;
    }

    /// Format one row from an initializer_list
    template <typename T>
    std::string encode_row(const std::initializer_list<T> & row, const Encode_options & options = {})
    {
        return encode_row<std::initializer_list<T>>(row, options);
    }

    /// Format rows as CSV lines

    /// @param rows Range of rows
    /// @param options Encoding options
    /// @returns One line per row
    template <typename Rows>
    std::vector<std::string> encode(const Rows & rows, const Encode_options & options = {})
    {
        std::vector<std::string> lines;
        for(auto & row: rows)
            lines.push_back(encode_row(row, options));
        return lines;
    }

    /// CSV writer

    /// Writes data in CSV format, with correct escaping as needed, according to RFC 4180 rules.
    /// Allows writing by rows or field-by-field. Mixing these is not
    /// recommended, but is possible. Row-wise methods will append to the row
    /// started by any field-wise methods.
    class Writer
    {
    public:
        /// Output iterator for writing CSV data field-by-field

        /// This iterator has no mechanism for ending a row. Use Writer::end_row instead
        class Iterator
        {
        public:
            using value_type        = void;
            using difference_type   = void;
            using pointer           = void;
            using reference         = void;
            using iterator_category = std::output_iterator_tag;

            /// Creates an iterator from a Writer object

            /// @warning \c w must not be destroyed during iteration
            explicit Iterator(Writer & w): writer_{w} {}

            /// No-op
            Iterator & operator*() { return *this; }
            /// No-op
            Iterator & operator++() { return *this; }
            /// No-op
            Iterator & operator++(int) { return *this; }

            /// Writes a field to the CSV output

            /// @param field Data to write. Stringified with Field_encoder
            /// @throws IO_error if there is an error writing
            template <typename T>
            Iterator & operator=(const T & field)
            {
                writer_.write_field(field);
                return *this;
            }

        private:
            Writer & writer_; ///< Ref to parent Writer object
        };

        /// Use a std::ostream for CSV output

        /// @param output_stream std::ostream to write to
        /// @param options Encoding options
        /// @warning \c output_stream must not be destroyed or written to during the lifetime of this Writer
        explicit Writer(std::ostream & output_stream, const Encode_options & options = {}):
            output_stream_{&output_stream},
            quote_{options},
            delimiter_{options.delimiter}
        {}

        /// Open a file for CSV output

        /// @param filename Path to file to write to. Any existing file will be overwritten
        /// @param options Encoding options
        /// @throws IO_error if there is an error opening the file
        explicit Writer(const std::string& filename, const Encode_options & options = {}):
            internal_output_stream_{std::make_unique<std::ofstream>(filename, std::ios::binary)},
            output_stream_{internal_output_stream_.get()},
            quote_{options},
            delimiter_{options.delimiter}
        {
            if(!(*internal_output_stream_))
                throw IO_error("Could not open file '" + filename + "'", errno);
        }

        /// Destructor

        /// Writes a final delimiter if needed to close current row
        ~Writer()
        {
            if(!start_of_row_ && output_stream_)
            {
                // try to end the row, but ignore any IO errors
                try { end_row(); }
                catch(const IO_error & e)
                {
                    SPDLOG_DEBUG("could not end final row: {}", e.what());
                }
            }
        }

        Writer(const Writer &) = delete;
        Writer & operator=(const Writer &) = delete;

        /// The moved-from Writer no longer writes to the output
        Writer(Writer && other):
            internal_output_stream_{std::move(other.internal_output_stream_)},
            output_stream_{other.output_stream_},
            start_of_row_{other.start_of_row_},
            quote_{std::move(other.quote_)},
            delimiter_{std::move(other.delimiter_)}
        {
            other.output_stream_ = nullptr;
            other.start_of_row_ = true;
        }

        /// Ends any row this Writer has started, then takes over \c other's output
        /// @throws IO_error if there is an error ending the current row
        Writer & operator=(Writer && other)
        {
            if(this == &other)
                return *this;

            if(!start_of_row_ && output_stream_)
                end_row();

            internal_output_stream_ = std::move(other.internal_output_stream_);
            output_stream_ = other.output_stream_;
            start_of_row_ = other.start_of_row_;
            quote_ = std::move(other.quote_);
            delimiter_ = std::move(other.delimiter_);

            other.output_stream_ = nullptr;
            other.start_of_row_ = true;
            return *this;
        }

        /// Get iterator

        /// @returns An iterator on this Writer
        Iterator iterator()
        {
            return Iterator(*this);
        }

        /// Writes a field to the CSV output

        /// @param field Data to write. Stringified with Field_encoder
        /// @throws IO_error if there is an error writing
        template<typename T>
        void write_field(const T & field)
        {
            if(!start_of_row_)
            {
                (*output_stream_)<<quote_.separator();
                if(output_stream_->bad())
                    throw IO_error{"Error writing to output", errno};
            }

            (*output_stream_)<<quote_(encode_value(field));
            if(output_stream_->bad())
                throw IO_error{"Error writing to output", errno};

            start_of_row_ = false;
        }

        /// Writes a field to the CSV output

        /// @param field Data to write. Stringified with Field_encoder
        /// @throws IO_error if there is an error writing
        template<typename T>
        Writer & operator<<(const T & field)
        {
            write_field(field);
            return *this;
        }

        /// Apply a stream manipulator to the CSV output

        /// Currently only csvstream::end_row is supported
        /// @param manip Stream manipulator to apply
        Writer & operator<<(Writer & (*manip)(Writer &))
        {
            manip(*this);
            return *this;
        }

        /// End the current row

        /// @throws IO_error if there is an error writing
        void end_row()
        {
            (*output_stream_)<<delimiter_;
            if(output_stream_->bad())
                throw IO_error{"Error writing to output", errno};
            start_of_row_ = true;
        }

        /// Write fields from iterators, without ending the row
        /// @param first Iterator to start of data to write
        /// @param last Iterator to end of data to write
        /// @throws IO_error if there is an error writing
        template<typename Iter>
        void write_fields(Iter first, Iter last)
        {
            for(; first != last; ++first)
                write_field(*first);
        }

        /// Write fields from an initializer_list, without ending the row
        /// @param data list of fields to write
        /// @throws IO_error if there is an error writing
        template<typename T>
        void write_fields(const std::initializer_list<T> & data)
        {
            write_fields(std::begin(data), std::end(data));
        }

        /// Write fields from a range, without ending the row

        /// A range in this context must support std::begin and std::end as at
        /// least input iterators
        /// @param data %Range of fields to write
        /// @throws IO_error if there is an error writing
        template<typename Range>
        void write_fields(const Range & data)
        {
            write_fields(std::begin(data), std::end(data));
        }

        /// Write fields from the given variadic parameters, without ending the row

        /// @param data Fields to write
        /// @throws IO_error if there is an error writing
        template<typename ...Data>
        void write_fields_v(const Data & ...data)
        {
            (void)(*this << ... << data);
        }

        /// Write fields from a tuple, without ending the row

        /// @param data tuple of fields to write
        /// @throws IO_error if there is an error writing
        template<typename ...Args>
        void write_fields(const std::tuple<Args...> & data)
        {
            std::apply(&Writer::write_fields_v<Args...>, std::tuple_cat(std::tuple(std::ref(*this)), data));
        }

        /// Write a row from iterators
        /// @param first Iterator to start of data to write
        /// @param last Iterator to end of data to write
        /// @throws IO_error if there is an error writing
        template<typename Iter>
        void write_row(Iter first, Iter last)
        {
            write_fields(first, last);

            end_row();
        }

        /// Write a row from an initializer_list
        /// @param data list of fields to write
        /// @throws IO_error if there is an error writing
        template<typename T>
        void write_row(const std::initializer_list<T> & data)
        {
            write_row(std::begin(data), std::end(data));
        }

        /// Write a row from a range
        /// @param data %Range of fields to write
        /// @throws IO_error if there is an error writing
        template<typename Range>
        void write_row(const Range & data)
        {
            write_row(std::begin(data), std::end(data));
        }

        /// Write a row from the given variadic parameters

        /// @param data Fields to write
        /// @throws IO_error if there is an error writing
        template<typename ...Data>
        void write_row_v(const Data & ...data)
        {
            (void)(*this << ... << data);

            end_row();
        }

        /// Write a row from a tuple

        /// @param data tuple of fields to write
        /// @throws IO_error if there is an error writing
        template<typename ...Args>
        void write_row(const std::tuple<Args...> & data)
        {
            std::apply(&Writer::write_row_v<Args...>, std::tuple_cat(std::tuple(std::ref(*this)), data));
        }

    private:
        friend Writer &end_row(Writer & w);

        /// Owns an ofstream created by this Writer when constructed by filename
        std::unique_ptr<std::ostream> internal_output_stream_;

        /// Points to output ostream. Will point to *internal_output_stream_ if
        /// constructed by filename or the ostream passed when constructed by
        /// ostream
        std::ostream * output_stream_;
        bool start_of_row_ {true}; ///< for keeping track if when a row needs to be ended

        detail::Field_quoter quote_;
        std::string delimiter_;
    };

    /// End row stream manipulator for Writer

    /// Ends the current row, as in: `writer << field << csvstream::end_row; `
    /// @throws IO_error if there is an error writing
    inline Writer & end_row(Writer & w)
    {
        w.end_row();
        return w;
    }

    /// Map-based Writer iterator

    /// Output iterator accepting a std::map to write as a CSV row
    template <typename Header = std::string, typename Default_value = std::string>
    class Map_writer_iter
    {
    private:
        std::unique_ptr<Writer> writer_; ///< Writer object
        std::vector<Header> headers_;    ///< Headers
        Default_value default_val_;      ///< Default value
        bool header_written_ {false};    ///< Header row has been written

    public:
        /// Use a std::ostream for CSV output

        /// @param output_stream std::ostream to write to
        /// @param headers Field headers to use. This specifies the header row and order.
        ///        Pass an empty vector to use the keys of the first row
        /// @param default_val Default value to write to a field if not specified in row input
        /// @param options Encoding options
        /// @warning \c output_stream must not be destroyed or written to during the lifetime of this Writer
        Map_writer_iter(std::ostream & output_stream, const std::vector<Header> & headers, const Default_value & default_val = {},
                const Encode_options & options = {}):
            writer_{std::make_unique<Writer>(output_stream, options)}, headers_{headers}, default_val_{default_val}
        {
            write_header();
        }

        /// Open a file for CSV output

        /// @param filename Path to file to write to. Any existing file will be overwritten
        /// @param headers Field headers to use. This specifies the header row and order.
        ///        Pass an empty vector to use the keys of the first row
        /// @param default_val Default value to write to a field if not specified in row input
        /// @param options Encoding options
        /// @throws IO_error if there is an error opening the file
        Map_writer_iter(const std::string& filename, const std::vector<Header> & headers, const Default_value & default_val = {},
                const Encode_options & options = {}):
            writer_{std::make_unique<Writer>(filename, options)}, headers_{headers}, default_val_{default_val}
        {
            write_header();
        }

        using value_type        = void;
        using difference_type   = void;
        using pointer           = void;
        using reference         = void;
        using iterator_category = std::output_iterator_tag;

        /// No-op
        Map_writer_iter & operator*() { return *this; }
        /// No-op
        Map_writer_iter & operator++() { return *this; }
        /// No-op
        Map_writer_iter & operator++(int) { return *this; }

        /// Write a row

        /// @param row std::map containing header to field pairs. If row
        /// contains keys not in the header, the associated values will
        /// be ignored. If the map is missing headers, their values will be filled
        /// with default_val
        /// @throws IO_error if there is an error writing
        template <typename K, typename T, typename std::enable_if_t<std::is_convertible_v<Header, K>, int> = 0>
        Map_writer_iter & operator=(const std::map<K, T> & row)
        {
            if(!header_written_)
            {
                for(auto & field: row)
                    headers_.push_back(field.first);
                write_header();
            }

            for(auto & h: headers_)
            {
                if(auto field = row.find(h); field != std::end(row))
                    (*writer_)<<field->second;
                else
                    (*writer_)<<default_val_;
            }

            writer_->end_row();
            return *this;
        }

    private:
        void write_header()
        {
            if(std::empty(headers_))
                return;

            writer_->write_row(headers_);
            header_written_ = true;
        }
    };
    /// @} // end doxygen group
}

#endif // CSVSTREAM_CSV_HPP
