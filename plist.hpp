// This file is part of PLIST.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef PLIST_PLIST_HPP_
#define PLIST_PLIST_HPP_

#include <rocket/cow_string.hpp>
#include <rocket/cow_vector.hpp>
#include <rocket/cow_hashmap.hpp>
#include <rocket/prehashed_string.hpp>
#include <rocket/variant.hpp>
#include <rocket/tinybuf.hpp>
#include <rocket/tinyfmt.hpp>
#include <chrono>
#include <cstdio>
namespace plist {

class Value;

// Define aliases and enumerators for data types.
using V_array       = ::rocket::cow_vector<Value>;
using V_dictionary  = ::rocket::cow_hashmap<::rocket::phcow_string,
                           Value, ::rocket::phcow_string::hash>;

using V_boolean     = bool;
using V_data        = ::rocket::cow_bstring;
using V_date        = ::std::chrono::time_point<::std::chrono::system_clock,
                           ::std::chrono::microseconds>;
using V_real        = double;
using V_integer     = ::std::int64_t;
using V_string      = ::rocket::cow_string;

// Expand a sequence of alternatives without a trailing comma. This macro is part of
// the ABI.
#define PLIST_TYPES_QUAE4AEF_(U)  \
    /*  0 */  U##_array  \
    /*  1 */, U##_dictionary  \
    /*  2 */, U##_boolean  \
    /*  3 */, U##_data  \
    /*  4 */, U##_date  \
    /*  5 */, U##_real  \
    /*  6 */, U##_integer  \
    /*  7 */, U##_string

// Define type enumerators such as `t_array`, `t_real`, `t_string`, and so on.
enum Type : ::std::uint8_t {PLIST_TYPES_QUAE4AEF_(t)};
using Variant = ::rocket::variant<PLIST_TYPES_QUAE4AEF_(V)>;

// These are options for parsing. Multiple options may be OR'd together.
enum Options : ::std::uint32_t
  {
    options_default               = 0,

    // Containers are allowed to nest at most 32 levels by default. This option
    // removes the limit.
    option_bypass_nesting_limit   = 0b00000001,

    // Convert the fractional part of a binary date with a scale of 10^10 and
    // saturate it to 32 bits, like some old decoders do. Negative dates are then
    // clamped to the reference date. By default, the scale is 10^9.
    option_legacy_date_scale      = 0b00000010,

    // Take the low nibble of a binary integer marker as the base-2 logarithm of
    // its width, which is how CoreFoundation writes integers. By default, the
    // marker is skipped and a variable-length integer follows.
    option_marker_sized_integers  = 0b00000100,
  };

constexpr
Options
operator|(Options lhs, Options rhs) noexcept
  {
    return static_cast<Options>(static_cast<::std::uint32_t>(lhs)
                                | static_cast<::std::uint32_t>(rhs));
  }

// These are kinds of errors that may be reported by a parser.
enum Error_Code : ::std::uint8_t
  {
    error_none                        =  0,
    error_io                          =  1,

    // binary format
    error_invalid_magic_bytes         =  2,
    error_invalid_trailer             =  3,
    error_version_not_supported       =  4,
    error_invalid_key_object          =  5,
    error_invalid_boolean             =  6,
    error_invalid_integer_size        =  7,
    error_object_not_supported        =  8,
    error_invalid_object_reference    =  9,
    error_cyclic_reference            = 10,
    error_nesting_limit               = 11,

    // XML format
    error_unexpected_xml_eof          = 12,
    error_unexpected_xml_event        = 13,
    error_xml_object_not_supported    = 14,
    error_xml                         = 15,

    // leaf values
    error_integer_format              = 16,
    error_real_format                 = 17,
    error_date_format                 = 18,
    error_base64                      = 19,
    error_utf8                        = 20,
    error_utf16                       = 21,
  };

// Gets a static string that describes an error code.
const char*
describe_error(Error_Code code) noexcept;

// These are structural events of an XML document.
enum Xml_Event_Kind : ::std::uint8_t
  {
    xml_start_document  = 0,
    xml_end_document    = 1,
    xml_start_element   = 2,
    xml_end_element     = 3,
    xml_characters      = 4,
    xml_error           = 5,
  };

struct Xml_Event
  {
    Xml_Event_Kind kind = xml_start_document;

    // offset of the event in the document, or -1 if unknown
    ::std::int64_t offset = -1;

    // local name of an element
    ::rocket::cow_string name;

    // content of a character run, or a message about a malformed document
    ::rocket::cow_string text;
  };

// This structure provides storage for all parser states. This structure need not
// be initialized before parsing.
struct Parser_Context
  {
    // stream offset of the failed operation
    ::std::int64_t offset = 0;

    // if no error, `error_none`; otherwise, the kind of the error
    Error_Code code = error_none;

    // if no error, a null pointer; otherwise, a static string about the error
    const char* error = nullptr;

    // for `error_object_not_supported`, the type nibble of the object
    int object_tag = -1;

    // for `error_unexpected_xml_event`, the offending event
    Xml_Event event;

    // for `error_xml_object_not_supported`, the name of the element; for
    // `error_version_not_supported`, the version string, which is empty if it is
    // not valid UTF-8; for `error_xml`, a message from the XML parser
    ::rocket::cow_string name;
  };

// This is the only and comprehensive class that is provided by this library. It is
// responsible for storing and parsing all the alternatives above.
class Value
  {
  private:
    Variant m_stor;

  public:
    // Initializes an empty array.
    Value() noexcept { }

    // Destroys this value. The destructor shall take care of a deep recursion, to
    // avoid running out of the system stack.
    ~Value()
      {
        if(this->m_stor.index() <= t_dictionary)
          this->do_nonrecursive_destructor();
      }

  private:
    void
    do_nonrecursive_destructor() noexcept;

  public:
    // These are for internal use only.
    const Variant&
    mf_stor() const noexcept
      { return this->m_stor;  }

    Variant&
    mf_stor() noexcept
      { return this->m_stor;  }

    // Gets the type of the stored value.
    constexpr
    Type
    type() const noexcept
      { return static_cast<Type>(this->m_stor.index());  }

    // Swaps two values in a smart way.
    Value&
    swap(Value& other) noexcept
      {
        this->m_stor.swap(other.m_stor);
        return *this;
      }

    // Initializes an array.
    Value(const V_array& val) noexcept
      {
        this->m_stor.emplace<V_array>(val);
      }

    // Checks whether the stored value is an array.
    bool
    is_array() const noexcept
      { return this->m_stor.index() == t_array;  }

    // Gets an array. If the stored value is not an array, an exception is thrown,
    // and there is no effect.
    const V_array&
    as_array() const
      { return this->m_stor.as<V_array>();  }

    size_t
    as_array_size() const
      { return this->as_array().size();  }

    // Gets or creates an array. If the stored value is not an array, it is
    // overwritten with an empty array, and a reference to the new value is
    // returned.
    V_array&
    mut_array() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_array>())
          return *ptr;
        else
          return this->m_stor.emplace<V_array>();
      }

    // Sets an array.
    Value&
    operator=(const V_array& val) & noexcept
      {
        this->mut_array() = val;
        return *this;
      }

    // Initializes a dictionary.
    Value(const V_dictionary& val) noexcept
      {
        this->m_stor.emplace<V_dictionary>(val);
      }

    // Checks whether the stored value is a dictionary.
    bool
    is_dictionary() const noexcept
      { return this->m_stor.index() == t_dictionary;  }

    // Gets a dictionary. If the stored value is not a dictionary, an exception is
    // thrown, and there is no effect.
    const V_dictionary&
    as_dictionary() const
      { return this->m_stor.as<V_dictionary>();  }

    size_t
    as_dictionary_size() const
      { return this->as_dictionary().size();  }

    // Gets or creates a dictionary. If the stored value is not a dictionary, it is
    // overwritten with an empty dictionary, and a reference to the new value is
    // returned.
    V_dictionary&
    mut_dictionary() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_dictionary>())
          return *ptr;
        else
          return this->m_stor.emplace<V_dictionary>();
      }

    // Sets a dictionary.
    Value&
    operator=(const V_dictionary& val) & noexcept
      {
        this->mut_dictionary() = val;
        return *this;
      }

    // Initializes a boolean value.
    Value(bool val) noexcept
      {
        this->m_stor.emplace<V_boolean>(val);
      }

    bool
    is_boolean() const noexcept
      { return this->m_stor.index() == t_boolean;  }

    V_boolean
    as_boolean() const
      { return this->m_stor.as<V_boolean>();  }

    V_boolean&
    mut_boolean() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_boolean>())
          return *ptr;
        else
          return this->m_stor.emplace<V_boolean>();
      }

    Value&
    operator=(bool val) & noexcept
      {
        this->mut_boolean() = val;
        return *this;
      }

    // Initializes a byte string.
    Value(const ::rocket::cow_bstring& val) noexcept
      {
        this->m_stor.emplace<V_data>(val);
      }

    // Checks whether the stored value is a byte string.
    bool
    is_data() const noexcept
      { return this->m_stor.index() == t_data;  }

    // Gets a byte string. If the stored value is not a byte string, an exception
    // is thrown, and there is no effect.
    const V_data&
    as_data() const
      { return this->m_stor.as<V_data>();  }

    const unsigned char*
    as_data_bytes() const
      { return this->as_data().data();  }

    size_t
    as_data_size() const
      { return this->as_data().size();  }

    // Gets or creates a byte string. If the stored value is not a byte string, it
    // is overwritten with an empty string, and a reference to the new value is
    // returned.
    V_data&
    mut_data() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_data>())
          return *ptr;
        else
          return this->m_stor.emplace<V_data>();
      }

    Value&
    operator=(const ::rocket::cow_bstring& val) & noexcept
      {
        this->mut_data() = val;
        return *this;
      }

    // Initializes a date. Dates are absolute and carry no time zone. They are
    // stored in microseconds, which covers years from -290308 to 294247.
    Value(V_date val) noexcept
      {
        this->m_stor.emplace<V_date>(val);
      }

    bool
    is_date() const noexcept
      { return this->m_stor.index() == t_date;  }

    V_date
    as_date() const
      { return this->m_stor.as<V_date>();  }

    // Gets or creates a date. If the stored value is not a date, it is
    // overwritten with `1970-01-01T00:00:00Z`, and a reference to the new value is
    // returned.
    V_date&
    mut_date() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_date>())
          return *ptr;
        else
          return this->m_stor.emplace<V_date>();
      }

    Value&
    operator=(V_date val) & noexcept
      {
        this->mut_date() = val;
        return *this;
      }

    // Initializes a floating-point number.
    Value(float val) noexcept
      {
        this->m_stor.emplace<V_real>(val);
      }

    Value(double val) noexcept
      {
        this->m_stor.emplace<V_real>(val);
      }

    // Checks whether the stored value is a floating-point number. Integers are
    // not real numbers.
    bool
    is_real() const noexcept
      { return this->m_stor.index() == t_real;  }

    V_real
    as_real() const
      { return this->m_stor.as<V_real>();  }

    V_real&
    mut_real() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_real>())
          return *ptr;
        else
          return this->m_stor.emplace<V_real>();
      }

    Value&
    operator=(float val) & noexcept
      {
        this->mut_real() = val;
        return *this;
      }

    Value&
    operator=(double val) & noexcept
      {
        this->mut_real() = val;
        return *this;
      }

    // Initializes an integer. Only conversions from signed types are provided. We
    // don't use `int64_t` here due to some nasty overloading rules.
    Value(int val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    Value(long val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    Value(long long val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    bool
    is_integer() const noexcept
      { return this->m_stor.index() == t_integer;  }

    V_integer
    as_integer() const
      { return this->m_stor.as<V_integer>();  }

    V_integer&
    mut_integer() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_integer>())
          return *ptr;
        else
          return this->m_stor.emplace<V_integer>();
      }

    Value&
    operator=(int val) & noexcept
      {
        this->mut_integer() = val;
        return *this;
      }

    Value&
    operator=(long val) & noexcept
      {
        this->mut_integer() = val;
        return *this;
      }

    Value&
    operator=(long long val) & noexcept
      {
        this->mut_integer() = val;
        return *this;
      }

    // Initializes a character string. The caller shall supply a valid UTF-8
    // string. Strings from parsers are always valid.
    Value(const ::rocket::cow_string& val) noexcept
      {
        this->m_stor.emplace<V_string>(val);
      }

    Value(::rocket::shallow_string val) noexcept
      {
        this->m_stor.emplace<V_string>(val);
      }

    template<size_t N>
    Value(const char (*val)[N]) noexcept
      {
        this->m_stor.emplace<V_string>(val);
      }

    bool
    is_string() const noexcept
      { return this->m_stor.index() == t_string;  }

    const V_string&
    as_string() const
      { return this->m_stor.as<V_string>();  }

    const char*
    as_string_c_str() const
      { return this->as_string().c_str();  }

    size_t
    as_string_length() const
      { return this->as_string().length();  }

    V_string&
    mut_string() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_string>())
          return *ptr;
        else
          return this->m_stor.emplace<V_string>();
      }

    Value&
    operator=(const ::rocket::cow_string& val) & noexcept
      {
        this->mut_string() = val;
        return *this;
      }

    Value&
    operator=(::rocket::shallow_string val) & noexcept
      {
        this->mut_string() = val;
        return *this;
      }

    template<size_t N>
    Value&
    operator=(const char (*val)[N]) & noexcept
      {
        this->mut_string() = val;
        return *this;
      }

    // Parse a binary property list, and store it into the current object. The
    // document starts at offset zero of the stream, which must be seekable.
    // Errors are stored into the `Parser_Context`. The context object does not
    // have to be initialized. If an error occurs or an exception is thrown, the
    // value of the current object is indeterminate.
    void
    parse_binary_with(Parser_Context& ctx, ::rocket::tinybuf& buf, Options opts = options_default);

    void
    parse_binary_with(Parser_Context& ctx, const ::rocket::cow_string& str, Options opts = options_default);

    void
    parse_binary_with(Parser_Context& ctx, const char* str, size_t len, Options opts = options_default);

    void
    parse_binary_with(Parser_Context& ctx, ::std::FILE* fp, Options opts = options_default);

    bool
    parse_binary(::rocket::tinybuf& buf, Options opts = options_default);

    bool
    parse_binary(const ::rocket::cow_string& str, Options opts = options_default);

    bool
    parse_binary(const char* str, size_t len, Options opts = options_default);

    bool
    parse_binary(::std::FILE* fp, Options opts = options_default);

    // Parse an XML property list, and store it into the current object. The
    // stream is read from its current position to the end, and is not required to
    // be seekable.
    void
    parse_xml_with(Parser_Context& ctx, ::rocket::tinybuf& buf, Options opts = options_default);

    void
    parse_xml_with(Parser_Context& ctx, const ::rocket::cow_string& str, Options opts = options_default);

    void
    parse_xml_with(Parser_Context& ctx, const char* str, size_t len, Options opts = options_default);

    void
    parse_xml_with(Parser_Context& ctx, ::std::FILE* fp, Options opts = options_default);

    bool
    parse_xml(::rocket::tinybuf& buf, Options opts = options_default);

    bool
    parse_xml(const ::rocket::cow_string& str, Options opts = options_default);

    bool
    parse_xml(const char* str, size_t len, Options opts = options_default);

    bool
    parse_xml(::std::FILE* fp, Options opts = options_default);

    // Parse a property list in either format. If the stream does not start with
    // the binary magic bytes, it is rewound and parsed as XML. A stream that has
    // the magic bytes but is otherwise malformed is never retried as XML.
    void
    parse_with(Parser_Context& ctx, ::rocket::tinybuf& buf, Options opts = options_default);

    void
    parse_with(Parser_Context& ctx, const ::rocket::cow_string& str, Options opts = options_default);

    void
    parse_with(Parser_Context& ctx, const char* str, size_t len, Options opts = options_default);

    void
    parse_with(Parser_Context& ctx, ::std::FILE* fp, Options opts = options_default);

    bool
    parse(::rocket::tinybuf& buf, Options opts = options_default);

    bool
    parse(const ::rocket::cow_string& str, Options opts = options_default);

    bool
    parse(const char* str, size_t len, Options opts = options_default);

    bool
    parse(::std::FILE* fp, Options opts = options_default);

    // Print this value for diagnostic purposes, in the text style of old property
    // lists. Arrays are `(1, 2)`, dictionaries are `{"k" = "v";}`, data are
    // `<0001abcd ef>`, and dates are `2001-01-01T00:00:00Z`. Reals always have a
    // decimal point or an exponent, unless they are not finite. The output is not
    // meant to be parsed back.
    void
    print_to(::rocket::tinybuf& buf) const;

    void
    print_to(::rocket::cow_string& str) const;

    void
    print_to(::std::FILE* fp) const;

    ::rocket::cow_string
    to_string() const;

    void
    print_to_stderr() const;
  };

inline
void
swap(Value& lhs, Value& rhs) noexcept
  {
    lhs.swap(rhs);
  }

// Compares two values structurally. Arrays are equal if their elements are equal
// in the same order. Dictionaries are equal if they have the same keys and equal
// values, regardless of their order.
bool
operator==(const Value& lhs, const Value& rhs);

inline
bool
operator!=(const Value& lhs, const Value& rhs)
  {
    return !(lhs == rhs);
  }

inline
::rocket::tinyfmt&
operator<<(::rocket::tinyfmt& fmt, const Value& value)
  {
    value.print_to(fmt.mut_buf());
    return fmt;
  }

// Values are reference-counting so all these will not throw exceptions. It is
// recommended that they be passed by value or by const reference.
static_assert(::std::is_nothrow_copy_constructible<Value>::value, "");
static_assert(::std::is_nothrow_copy_assignable<Value>::value, "");
static_assert(::std::is_nothrow_move_constructible<Value>::value, "");
static_assert(::std::is_nothrow_move_assignable<Value>::value, "");

}  // namespace plist

extern template
class ::rocket::variant<PLIST_TYPES_QUAE4AEF_(::plist::V)>;

extern template
class ::rocket::cow_vector<::plist::Value>;

extern template
class ::rocket::cow_hashmap<::rocket::phcow_string,
  ::plist::Value, ::rocket::phcow_string::hash>;
#endif
