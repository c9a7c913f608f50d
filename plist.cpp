// This file is part of PLIST.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#define PLIST_DETAILS_5E0B7A2C_93F1_4D86_A4C7_1F6B2E8D9C03_
#include "details.hpp"
#include <rocket/ascii_numput.hpp>
#include <algorithm>
#include <vector>
#include <cmath>
#include <cstdio>
template class ::rocket::variant<PLIST_TYPES_QUAE4AEF_(::plist::V)>;
template class ::rocket::cow_vector<::plist::Value>;
template class ::rocket::cow_hashmap<::rocket::phcow_string,
    ::plist::Value, ::rocket::phcow_string::hash>;
namespace plist {
namespace {

using details::variant_type;
using details::is_within;
using details::is_any;
using details::Memory_Source;
using details::Unified_Source;
using bytes_type = ::std::aligned_storage<sizeof(variant_type), sizeof(void*)>::type;

struct Unified_Sink
  {
    ::rocket::cow_string* str = nullptr;
    ::rocket::tinybuf* buf = nullptr;
    ::std::FILE* fp = nullptr;

    Unified_Sink(::rocket::cow_string* s) : str(s)  { }
    Unified_Sink(::rocket::tinybuf* b) : buf(b)  { }
    Unified_Sink(::std::FILE* f) : fp(f)  { }

    void
    putc(char c) const
      {
        if(this->str)
          this->str->push_back(c);
        else if(this->buf)
          this->buf->putc(c);
        else if(this->fp)
          ::fputc(c, this->fp);
        else
          ROCKET_UNREACHABLE();
      }

    void
    putn(const char* s, size_t n) const
      {
        if(this->str)
          this->str->append(s, n);
        else if(this->buf)
          this->buf->putn(s, n);
        else if(this->fp)
          ::fwrite(s, 1, n, this->fp);
        else
          ROCKET_UNREACHABLE();
      }
  };

// Strings are printed in double quotes. Control characters and bytes that are
// not part of valid UTF-8 sequences are escaped, and the latter become U+FFFD.
void
do_print_string(Unified_Sink usink, ::rocket::ascii_numput& nump, const ::rocket::cow_string& str)
  {
    usink.putc('\"');

    auto bptr = str.data();
    const auto eptr = str.data() + str.size();
    while(bptr != eptr) {
      int ch = static_cast<unsigned char>(*bptr);

      if((ch == '\"') || (ch == '\\')) {
        char temp[2] = { '\\', *bptr };
        usink.putn(temp, 2);
      }
      else if(is_within(ch, 0x20, 0x7E))
        usink.putc(*bptr);
      else if(ch == '\t')
        usink.putn("\\t", 2);
      else if(ch == '\n')
        usink.putn("\\n", 2);
      else if(ch == '\r')
        usink.putn("\\r", 2);
      else {
        int u8len = (ch >= 0xC0) ? ROCKET_LZCNT32(static_cast<uint32_t>(ch ^ -1) << 24) : 0;
        if(is_within(u8len, 2, 4) && (eptr - bptr >= u8len)
           && details::is_valid_utf8(bptr, bptr + u8len)) {
          // printable as is
          usink.putn(bptr, static_cast<size_t>(u8len));
          bptr += u8len;
          continue;
        }

        char temp[8] = "\\U";
        nump.put_XU((ch < 0x80) ? static_cast<uint32_t>(ch) : 0xFFFDU, 4);
        ::std::memcpy(temp + 2, nump.data() + 2, 4);
        usink.putn(temp, 6);
      }

      bptr ++;
    }

    usink.putc('\"');
  }

// Prints a date in RFC 3339 format, in UTC, without quotes. Trailing zeroes of
// the fractional part are removed.
void
do_print_date(Unified_Sink usink, ::rocket::ascii_numput& nump, const V_date& date)
  {
    ::std::int64_t usecs = date.time_since_epoch().count();
    ::std::int64_t secs = usecs / 1000000;
    ::std::int64_t frac = usecs % 1000000;
    if(frac < 0) {
      secs --;
      frac += 1000000;
    }

    ::std::int64_t days = secs / 86400;
    ::std::int64_t sod = secs % 86400;
    if(sod < 0) {
      days --;
      sod += 86400;
    }

    // Get the civil date from days since 1970-01-01.
    days += 719468;
    ::std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    ::std::int64_t doe = days - era * 146097;
    ::std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    ::std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    ::std::int64_t mp = (5 * doy + 2) / 153;
    ::std::int64_t day = doy - (153 * mp + 2) / 5 + 1;
    ::std::int64_t month = mp < 10 ? mp + 3 : mp - 9;
    ::std::int64_t year = yoe + era * 400 + (month <= 2);

    if(year < 0) {
      usink.putc('-');
      year = -year;
    }

    const ::std::int64_t fields[] = { year, month, day, sod / 3600, sod / 60 % 60, sod % 60 };
    static constexpr char separators[] = "--T::";
    for(size_t k = 0;  k != 6;  ++k) {
      nump.put_DU(static_cast<uint64_t>(fields[k]), (k == 0) ? 4 : 2);
      usink.putn(nump.data(), nump.size());
      if(k != 5)
        usink.putc(separators[k]);
    }

    if(frac != 0) {
      char temp[8] = ".";
      for(int k = 6;  k != 0;  --k) {
        temp[k] = static_cast<char>('0' + frac % 10);
        frac /= 10;
      }

      size_t len = 7;
      while(temp[len - 1] == '0')
        len --;

      usink.putn(temp, len);
    }
    usink.putc('Z');
  }

// Prints bytes in hexadecimal within angle brackets, in groups of four.
void
do_print_data(Unified_Sink usink, const V_data& bin)
  {
    static constexpr char hex_digits[] = "0123456789abcdef";

    usink.putc('<');
    for(size_t k = 0;  k != bin.size();  ++k) {
      if((k != 0) && (k % 4 == 0))
        usink.putc(' ');

      char temp[2] = { hex_digits[bin[k] >> 4], hex_digits[bin[k] & 0x0F] };
      usink.putn(temp, 2);
    }
    usink.putc('>');
  }

// Prints a real number. Finite values always have a decimal point or an
// exponent, so they can be told from integers.
void
do_print_real(Unified_Sink usink, ::rocket::ascii_numput& nump, double value)
  {
    nump.put_DD(value);
    usink.putn(nump.data(), nump.size());

    if(::std::isfinite(value)
       && !::std::any_of(nump.data(), nump.data() + nump.size(),
                         [](char c) { return is_any(c, '.', 'e', 'E', 'p', 'P');  }))
      usink.putn(".0", 2);
  }

// Prints a value in the text style of old property lists, for diagnostic
// purposes: `("a", 1, 2.5, true, <0001>, 2001-01-01T00:00:00Z, {"k" = ();})`.
void
do_print_to(Unified_Sink usink, const variant_type& root)
  {
    // Break deep recursion with a handwritten stack.
    struct xFrame
      {
        const V_array* psa;
        V_array::const_iterator ita;
        const V_dictionary* psd;
        V_dictionary::const_iterator itd;
      };

    ::std::vector<xFrame> stack;
    ::rocket::ascii_numput nump;
    const variant_type* pstor = &root;

  do_print_value_loop_:
    switch(static_cast<Type>(pstor->index()))
      {
      case t_array:
        if(pstor->as<V_array>().empty()) {
          usink.putn("()", 2);
          break;
        }

        {
          // open
          auto& frm = stack.emplace_back();
          frm.psa = &(pstor->as<V_array>());
          frm.ita = frm.psa->begin();
          frm.psd = nullptr;
          usink.putc('(');
          pstor = &(frm.ita->mf_stor());
          goto do_print_value_loop_;
        }

      case t_dictionary:
        if(pstor->as<V_dictionary>().empty()) {
          usink.putn("{}", 2);
          break;
        }

        {
          // open
          auto& frm = stack.emplace_back();
          frm.psa = nullptr;
          frm.psd = &(pstor->as<V_dictionary>());
          frm.itd = frm.psd->begin();
          usink.putc('{');
          do_print_string(usink, nump, frm.itd->first.rdstr());
          usink.putn(" = ", 3);
          pstor = &(frm.itd->second.mf_stor());
          goto do_print_value_loop_;
        }

      case t_boolean:
        nump.put_TB(pstor->as<V_boolean>());
        usink.putn(nump.data(), nump.size());
        break;

      case t_data:
        do_print_data(usink, pstor->as<V_data>());
        break;

      case t_date:
        do_print_date(usink, nump, pstor->as<V_date>());
        break;

      case t_real:
        do_print_real(usink, nump, pstor->as<V_real>());
        break;

      case t_integer:
        nump.put_DI(pstor->as<V_integer>());
        usink.putn(nump.data(), nump.size());
        break;

      case t_string:
        do_print_string(usink, nump, pstor->as<V_string>());
        break;

      default:
        ::rocket::sprintf_and_throw<::std::invalid_argument>(
              "plist::Value: unknown type enumeration `%d`",
              static_cast<int>(pstor->index()));
      }

    while(!stack.empty()) {
      auto& frm = stack.back();
      if(frm.psa) {
        if(++ frm.ita != frm.psa->end()) {
          // next element
          usink.putn(", ", 2);
          pstor = &(frm.ita->mf_stor());
          goto do_print_value_loop_;
        }

        usink.putc(')');
      }
      else {
        // Each entry is terminated by a semicolon.
        usink.putc(';');
        if(++ frm.itd != frm.psd->end()) {
          // next entry
          usink.putc(' ');
          do_print_string(usink, nump, frm.itd->first.rdstr());
          usink.putn(" = ", 3);
          pstor = &(frm.itd->second.mf_stor());
          goto do_print_value_loop_;
        }

        usink.putc('}');
      }

      // close
      stack.pop_back();
    }
  }

// Tries the binary format first. Only if the magic bytes don't match, the stream
// is rewound and parsed as XML.
void
do_parse_auto(variant_type& root, Parser_Context& ctx, Unified_Source usrc, Options opts)
  {
    details::do_parse_binary(root, ctx, usrc, opts);
    if(ctx.code != error_invalid_magic_bytes)
      return;

    if(!usrc.seek(0)) {
      details::do_reset(ctx);
      return details::do_err(ctx, 0, error_io, "Could not seek stream");
    }

    details::do_parse_xml(root, ctx, usrc, opts);
  }

}  // namespace

const char*
describe_error(Error_Code code) noexcept
  {
    switch(code)
      {
      case error_none:
        return "no error";

      case error_io:
        return "input/output error";

      case error_invalid_magic_bytes:
        return "invalid magic bytes";

      case error_invalid_trailer:
        return "invalid trailer";

      case error_version_not_supported:
        return "binary version not supported";

      case error_invalid_key_object:
        return "dictionary key not a string";

      case error_invalid_boolean:
        return "invalid boolean";

      case error_invalid_integer_size:
        return "invalid integer size";

      case error_object_not_supported:
        return "object type not supported";

      case error_invalid_object_reference:
        return "invalid object reference";

      case error_cyclic_reference:
        return "cyclic object reference";

      case error_nesting_limit:
        return "nesting limit exceeded";

      case error_unexpected_xml_eof:
        return "unexpected end of XML document";

      case error_unexpected_xml_event:
        return "unexpected XML event";

      case error_xml_object_not_supported:
        return "XML element not supported";

      case error_xml:
        return "malformed XML document";

      case error_integer_format:
        return "invalid integer format";

      case error_real_format:
        return "invalid real number format";

      case error_date_format:
        return "invalid date format";

      case error_base64:
        return "invalid base64 data";

      case error_utf8:
        return "invalid UTF-8 string";

      case error_utf16:
        return "invalid UTF-16 string";

      default:
        return "unknown error";
      }
  }

bool
operator==(const Value& lhs, const Value& rhs)
  {
    // Break deep recursion with a handwritten stack.
    ::std::vector<::std::pair<const Value*, const Value*>> stack;
    stack.emplace_back(&lhs, &rhs);

    while(!stack.empty()) {
      auto px = stack.back().first;
      auto py = stack.back().second;
      stack.pop_back();

      if(px->type() != py->type())
        return false;

      switch(px->type())
        {
        case t_array:
          if(px->as_array_size() != py->as_array_size())
            return false;

          for(size_t k = 0;  k != px->as_array_size();  ++k)
            stack.emplace_back(&(px->as_array()[k]), &(py->as_array()[k]));
          break;

        case t_dictionary:
          if(px->as_dictionary_size() != py->as_dictionary_size())
            return false;

          // Order doesn't matter.
          for(const auto& r : px->as_dictionary()) {
            auto it = py->as_dictionary().find(r.first);
            if(it == py->as_dictionary().end())
              return false;

            stack.emplace_back(&(r.second), &(it->second));
          }
          break;

        case t_boolean:
          if(px->as_boolean() != py->as_boolean())
            return false;
          break;

        case t_data:
          if(px->as_data() != py->as_data())
            return false;
          break;

        case t_date:
          if(px->as_date() != py->as_date())
            return false;
          break;

        case t_real:
          if(px->as_real() != py->as_real())
            return false;
          break;

        case t_integer:
          if(px->as_integer() != py->as_integer())
            return false;
          break;

        case t_string:
          if(px->as_string() != py->as_string())
            return false;
          break;

        default:
          ROCKET_UNREACHABLE();
        }
    }
    return true;
  }

void
Value::
do_nonrecursive_destructor() noexcept
  {
    // Break deep recursion with a handwritten stack.
    ::std::vector<bytes_type> stack;

  do_unpack_loop_:
    switch(this->m_stor.index())
      {
      case t_array:
        try {
          auto& sa = this->m_stor.mut<V_array>();
          if(sa.unique())
            for(auto it = sa.mut_begin();  it != sa.end();  ++it)
              ::std::swap(stack.emplace_back(), reinterpret_cast<bytes_type&>(it->m_stor));
        }
        catch(::std::exception& stdex)
          { ::std::fprintf(stderr, "WARNING: %s\n", stdex.what());  }
        break;

      case t_dictionary:
        try {
          auto& sd = this->m_stor.mut<V_dictionary>();
          if(sd.unique())
            for(auto it = sd.mut_begin();  it != sd.end();  ++it)
              ::std::swap(stack.emplace_back(), reinterpret_cast<bytes_type&>(it->second.m_stor));
        }
        catch(::std::exception& stdex)
          { ::std::fprintf(stderr, "WARNING: %s\n", stdex.what());  }
        break;
      }

    // An all-bit-zero variant is an empty array, which owns nothing.
    ::rocket::destroy(&(this->m_stor));
    reinterpret_cast<bytes_type&>(this->m_stor) = bytes_type();

    if(!stack.empty()) {
      reinterpret_cast<bytes_type&>(this->m_stor) = stack.back();
      stack.pop_back();
      goto do_unpack_loop_;
    }
  }

void
Value::
parse_binary_with(Parser_Context& ctx, ::rocket::tinybuf& buf, Options opts)
  {
    details::do_parse_binary(this->m_stor, ctx, &buf, opts);
  }

void
Value::
parse_binary_with(Parser_Context& ctx, const ::rocket::cow_string& str, Options opts)
  {
    Memory_Source msrc(str.data(), str.size());
    details::do_parse_binary(this->m_stor, ctx, &msrc, opts);
  }

void
Value::
parse_binary_with(Parser_Context& ctx, const char* str, size_t len, Options opts)
  {
    Memory_Source msrc(str, len);
    details::do_parse_binary(this->m_stor, ctx, &msrc, opts);
  }

void
Value::
parse_binary_with(Parser_Context& ctx, ::std::FILE* fp, Options opts)
  {
    details::do_parse_binary(this->m_stor, ctx, fp, opts);
  }

bool
Value::
parse_binary(::rocket::tinybuf& buf, Options opts)
  {
    Parser_Context ctx;
    details::do_parse_binary(this->m_stor, ctx, &buf, opts);
    return !ctx.error;
  }

bool
Value::
parse_binary(const ::rocket::cow_string& str, Options opts)
  {
    Parser_Context ctx;
    Memory_Source msrc(str.data(), str.size());
    details::do_parse_binary(this->m_stor, ctx, &msrc, opts);
    return !ctx.error;
  }

bool
Value::
parse_binary(const char* str, size_t len, Options opts)
  {
    Parser_Context ctx;
    Memory_Source msrc(str, len);
    details::do_parse_binary(this->m_stor, ctx, &msrc, opts);
    return !ctx.error;
  }

bool
Value::
parse_binary(::std::FILE* fp, Options opts)
  {
    Parser_Context ctx;
    details::do_parse_binary(this->m_stor, ctx, fp, opts);
    return !ctx.error;
  }

void
Value::
parse_xml_with(Parser_Context& ctx, ::rocket::tinybuf& buf, Options opts)
  {
    details::do_parse_xml(this->m_stor, ctx, &buf, opts);
  }

void
Value::
parse_xml_with(Parser_Context& ctx, const ::rocket::cow_string& str, Options opts)
  {
    Memory_Source msrc(str.data(), str.size());
    details::do_parse_xml(this->m_stor, ctx, &msrc, opts);
  }

void
Value::
parse_xml_with(Parser_Context& ctx, const char* str, size_t len, Options opts)
  {
    Memory_Source msrc(str, len);
    details::do_parse_xml(this->m_stor, ctx, &msrc, opts);
  }

void
Value::
parse_xml_with(Parser_Context& ctx, ::std::FILE* fp, Options opts)
  {
    details::do_parse_xml(this->m_stor, ctx, fp, opts);
  }

bool
Value::
parse_xml(::rocket::tinybuf& buf, Options opts)
  {
    Parser_Context ctx;
    details::do_parse_xml(this->m_stor, ctx, &buf, opts);
    return !ctx.error;
  }

bool
Value::
parse_xml(const ::rocket::cow_string& str, Options opts)
  {
    Parser_Context ctx;
    Memory_Source msrc(str.data(), str.size());
    details::do_parse_xml(this->m_stor, ctx, &msrc, opts);
    return !ctx.error;
  }

bool
Value::
parse_xml(const char* str, size_t len, Options opts)
  {
    Parser_Context ctx;
    Memory_Source msrc(str, len);
    details::do_parse_xml(this->m_stor, ctx, &msrc, opts);
    return !ctx.error;
  }

bool
Value::
parse_xml(::std::FILE* fp, Options opts)
  {
    Parser_Context ctx;
    details::do_parse_xml(this->m_stor, ctx, fp, opts);
    return !ctx.error;
  }

void
Value::
parse_with(Parser_Context& ctx, ::rocket::tinybuf& buf, Options opts)
  {
    do_parse_auto(this->m_stor, ctx, &buf, opts);
  }

void
Value::
parse_with(Parser_Context& ctx, const ::rocket::cow_string& str, Options opts)
  {
    Memory_Source msrc(str.data(), str.size());
    do_parse_auto(this->m_stor, ctx, &msrc, opts);
  }

void
Value::
parse_with(Parser_Context& ctx, const char* str, size_t len, Options opts)
  {
    Memory_Source msrc(str, len);
    do_parse_auto(this->m_stor, ctx, &msrc, opts);
  }

void
Value::
parse_with(Parser_Context& ctx, ::std::FILE* fp, Options opts)
  {
    do_parse_auto(this->m_stor, ctx, fp, opts);
  }

bool
Value::
parse(::rocket::tinybuf& buf, Options opts)
  {
    Parser_Context ctx;
    do_parse_auto(this->m_stor, ctx, &buf, opts);
    return !ctx.error;
  }

bool
Value::
parse(const ::rocket::cow_string& str, Options opts)
  {
    Parser_Context ctx;
    Memory_Source msrc(str.data(), str.size());
    do_parse_auto(this->m_stor, ctx, &msrc, opts);
    return !ctx.error;
  }

bool
Value::
parse(const char* str, size_t len, Options opts)
  {
    Parser_Context ctx;
    Memory_Source msrc(str, len);
    do_parse_auto(this->m_stor, ctx, &msrc, opts);
    return !ctx.error;
  }

bool
Value::
parse(::std::FILE* fp, Options opts)
  {
    Parser_Context ctx;
    do_parse_auto(this->m_stor, ctx, fp, opts);
    return !ctx.error;
  }

void
Value::
print_to(::rocket::tinybuf& buf) const
  {
    do_print_to(&buf, this->m_stor);
  }

void
Value::
print_to(::rocket::cow_string& str) const
  {
    do_print_to(&str, this->m_stor);
  }

void
Value::
print_to(::std::FILE* fp) const
  {
    do_print_to(fp, this->m_stor);
  }

::rocket::cow_string
Value::
to_string() const
  {
    ::rocket::cow_string str;
    do_print_to(&str, this->m_stor);
    return str;
  }

void
Value::
print_to_stderr() const
  {
    do_print_to(stderr, this->m_stor);
  }

}  // namespace plist
