// This file is part of PLIST.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#define PLIST_DETAILS_5E0B7A2C_93F1_4D86_A4C7_1F6B2E8D9C03_
#include "details.hpp"
#include "xml_stream.hpp"
#include <rocket/ascii_numget.hpp>
#include <vector>
#include <cmath>
#include <cstring>
namespace plist {
namespace details {
namespace {

void
do_xml_unexpected(Parser_Context& ctx, const Xml_Event& event)
  {
    if(ctx.error)
      return;

    ctx.event = event;
    do_err(ctx, event.offset, error_unexpected_xml_event, "Unexpected XML event");
  }

void
do_xml_failed(Parser_Context& ctx, const Xml_Event& event)
  {
    if(ctx.error)
      return;

    ctx.name = event.text;
    do_err(ctx, event.offset, error_xml, "Malformed XML document");
  }

// Skips character runs, and returns the next structural event without
// consuming it. If the stream has ended or is malformed, an error is set and a
// null pointer is returned.
const Xml_Event*
do_xml_peek(Parser_Context& ctx, Xml_Event_Stream& xstrm)
  {
    const Xml_Event* pev;
    while((pev = xstrm.peek()) && (pev->kind == xml_characters))
      xstrm.skip();

    if(!pev) {
      do_err(ctx, xstrm.size(), error_unexpected_xml_eof, "Unexpected end of XML document");
      return nullptr;
    }

    if(pev->kind == xml_error) {
      do_xml_failed(ctx, *pev);
      return nullptr;
    }

    return pev;
  }

// Consumes an event of the given kind, ignoring character runs before it. If
// `name` is not null, the event shall be for an element with that name.
bool
do_xml_expect(Parser_Context& ctx, Xml_Event_Stream& xstrm, Xml_Event_Kind kind,
              const char* name)
  {
    auto pev = do_xml_peek(ctx, xstrm);
    if(!pev)
      return false;

    if((pev->kind != kind) || (name && (pev->name != name))) {
      do_xml_unexpected(ctx, *pev);
      return false;
    }

    xstrm.skip();
    return true;
  }

// Accumulates character runs up to the end of the element that has just been
// opened. If there are no character runs, the result is empty.
bool
do_xml_content(::rocket::cow_string& text, Parser_Context& ctx, Xml_Event_Stream& xstrm,
               const ::rocket::cow_string& name)
  {
    text.clear();
    for(;;) {
      auto pev = xstrm.peek();
      if(!pev) {
        do_err(ctx, xstrm.size(), error_unexpected_xml_eof, "Unexpected end of XML document");
        return false;
      }

      if(pev->kind == xml_characters)
        text.append(pev->text);
      else if((pev->kind == xml_end_element) && (pev->name == name)) {
        xstrm.skip();
        return true;
      }
      else if(pev->kind == xml_error) {
        do_xml_failed(ctx, *pev);
        return false;
      }
      else {
        do_xml_unexpected(ctx, *pev);
        return false;
      }

      xstrm.skip();
    }
  }

bool
do_convert_integer(V_integer& value, const ::rocket::cow_string& text)
  {
    // optional sign, followed by decimal digits
    size_t off = 0;
    if((text.size() != 0) && is_any(text[0], '+', '-'))
      off = 1;

    if(off == text.size())
      return false;

    for(size_t k = off;  k != text.size();  ++k)
      if(!is_within(text[k], '0', '9'))
        return false;

    if(text[0] == '+')
      off = 1;
    else
      off = 0;

    ::rocket::ascii_numget numg;
    if(numg.parse_I(text.data() + off, text.size() - off) != text.size() - off)
      return false;

    numg.cast_I(value, INT64_MIN, INT64_MAX);
    return !numg.overflowed();
  }

bool
do_convert_real(V_real& value, const ::rocket::cow_string& text)
  {
    if(text.empty())
      return false;

    ::rocket::ascii_numget numg;
    if(numg.parse_D(text.data(), text.size()) != text.size())
      return false;

    // Values that are out of range are converted to infinities.
    numg.cast_D(value, -HUGE_VAL, HUGE_VAL);
    return true;
  }

// Reads exactly `n` decimal digits.
bool
do_get_digits(int& value, const char*& sptr, const char* eptr, int n)
  {
    if(eptr - sptr < n)
      return false;

    value = 0;
    for(int k = 0;  k != n;  ++k) {
      if(!is_within(sptr[k], '0', '9'))
        return false;

      value = value * 10 + (sptr[k] - '0');
    }

    sptr += n;
    return true;
  }

ROCKET_ALWAYS_INLINE
bool
do_get_char(const char*& sptr, const char* eptr, char c)
  {
    if((sptr == eptr) || (*sptr != c))
      return false;

    sptr ++;
    return true;
  }

// Gets the number of days from 1970-01-01 to a date in the proleptic Gregorian
// calendar.
constexpr
::std::int64_t
do_days_from_civil(::std::int64_t y, int m, int d) noexcept
  {
    y -= m <= 2;
    ::std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    ::std::int64_t yoe = y - era * 400;
    ::std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    ::std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
  }

// Parses an RFC 3339 timestamp, such as `2001-01-01T00:00:00Z`, with optional
// fractional seconds and an optional UTC offset in place of `Z`.
bool
do_convert_date(V_date& date, const ::rocket::cow_string& text)
  {
    const char* sptr = text.data();
    const char* eptr = text.data() + text.size();
    int year, month, day, hour, minute, second;

    if(!do_get_digits(year, sptr, eptr, 4) || !do_get_char(sptr, eptr, '-')
       || !do_get_digits(month, sptr, eptr, 2) || !do_get_char(sptr, eptr, '-')
       || !do_get_digits(day, sptr, eptr, 2) || !do_get_char(sptr, eptr, 'T')
       || !do_get_digits(hour, sptr, eptr, 2) || !do_get_char(sptr, eptr, ':')
       || !do_get_digits(minute, sptr, eptr, 2) || !do_get_char(sptr, eptr, ':')
       || !do_get_digits(second, sptr, eptr, 2))
      return false;

    static constexpr int days_of_month[] = { 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    bool leap = (year % 4 == 0) && ((year % 100 != 0) || (year % 400 == 0));

    if(!is_within(month, 1, 12) || !is_within(day, 1, days_of_month[month - 1])
       || ((month == 2) && (day == 29) && !leap)
       || (hour > 23) || (minute > 59) || (second > 60))
      return false;

    // fractional seconds; digits beyond nanoseconds are ignored
    ::std::int64_t nsecs = 0;
    if(do_get_char(sptr, eptr, '.')) {
      int ndigits = 0;
      while((sptr != eptr) && is_within(*sptr, '0', '9')) {
        if(ndigits < 9) {
          nsecs = nsecs * 10 + (*sptr - '0');
          ndigits ++;
        }
        sptr ++;
      }

      if(ndigits == 0)
        return false;

      while(ndigits < 9) {
        nsecs *= 10;
        ndigits ++;
      }
    }

    // time zone
    ::std::int64_t zone = 0;
    if(!do_get_char(sptr, eptr, 'Z')) {
      int sign = 1;
      int zone_hour, zone_minute;
      if(do_get_char(sptr, eptr, '-'))
        sign = -1;
      else if(!do_get_char(sptr, eptr, '+'))
        return false;

      if(!do_get_digits(zone_hour, sptr, eptr, 2) || !do_get_char(sptr, eptr, ':')
         || !do_get_digits(zone_minute, sptr, eptr, 2)
         || (zone_hour > 23) || (zone_minute > 59))
        return false;

      zone = sign * (zone_hour * 3600 + zone_minute * 60);
    }

    if(sptr != eptr)
      return false;

    ::std::int64_t secs = do_days_from_civil(year, month, day) * 86400
                          + hour * 3600 + minute * 60 + second - zone;

    // Digits beyond microseconds are truncated.
    date = V_date(::std::chrono::seconds(secs))
           + ::std::chrono::duration_cast<V_date::duration>(::std::chrono::nanoseconds(nsecs));
    return true;
  }

ROCKET_ALWAYS_INLINE
int
do_base64_digit(int c) noexcept
  {
    if(is_within(c, 'A', 'Z'))
      return c - 'A';
    else if(is_within(c, 'a', 'z'))
      return c - 'a' + 26;
    else if(is_within(c, '0', '9'))
      return c - '0' + 52;
    else if(c == '+')
      return 62;
    else if(c == '/')
      return 63;
    else
      return -1;
  }

// Decodes base64 text. Whitespace is ignored. Padding characters are optional,
// but they may only appear at the end of the last group.
bool
do_convert_base64(V_data& bin, const ::rocket::cow_string& text)
  {
    bin.clear();
    bin.reserve(text.size() / 4 * 3 + 2);

    uint32_t word = 0;
    uint32_t ndigits = 0;
    uint32_t npad = 0;

    for(char ch : text) {
      int c = static_cast<unsigned char>(ch);
      if(is_any(c, ' ', '\t', '\r', '\n'))
        continue;

      if(c == '=') {
        npad ++;
        continue;
      }

      int digit = do_base64_digit(c);
      if((digit < 0) || (npad != 0))
        return false;

      word |= static_cast<uint32_t>(digit) << (26 - ndigits * 6);
      ndigits ++;

      if(ndigits == 4) {
        // 3-byte group
        word = ROCKET_HTOBE32(word);
        bin.append(reinterpret_cast<const unsigned char*>(&word), 3);
        word = 0;
        ndigits = 0;
      }
    }

    if((ndigits == 0) && (npad == 0))
      return true;

    if((ndigits < 2) || ((npad != 0) && (ndigits + npad != 4)))
      return false;

    // 1-byte or 2-byte group
    word = ROCKET_HTOBE32(word);
    bin.append(reinterpret_cast<const unsigned char*>(&word), ndigits - 1);
    return true;
  }

// Parses an element that has just been opened, which is not a container.
bool
do_parse_leaf(variant_type& stor, Parser_Context& ctx, Xml_Event_Stream& xstrm,
              const Xml_Event& start, ::rocket::cow_string& text)
  {
    const auto& name = start.name;

    if((name == "true") || (name == "false")) {
      if(!do_xml_expect(ctx, xstrm, xml_end_element, name.c_str()))
        return false;

      stor.emplace<V_boolean>(name == "true");
      return true;
    }

    if(!do_xml_content(text, ctx, xstrm, name))
      return false;

    if(name == "integer") {
      if(!do_convert_integer(stor.emplace<V_integer>(), text)) {
        do_err(ctx, start.offset, error_integer_format, "Invalid integer");
        return false;
      }
    }
    else if(name == "real") {
      if(!do_convert_real(stor.emplace<V_real>(), text)) {
        do_err(ctx, start.offset, error_real_format, "Invalid real number");
        return false;
      }
    }
    else if(name == "date") {
      if(!do_convert_date(stor.emplace<V_date>(), text)) {
        do_err(ctx, start.offset, error_date_format, "Invalid date");
        return false;
      }
    }
    else if(name == "data") {
      if(!do_convert_base64(stor.emplace<V_data>(), text)) {
        do_err(ctx, start.offset, error_base64, "Invalid base64 data");
        return false;
      }
    }
    else {
      ROCKET_ASSERT(name == "string");
      if(!is_valid_utf8(text.data(), text.data() + text.size())) {
        do_err(ctx, start.offset, error_utf8, "Invalid UTF-8 string");
        return false;
      }
      stor.emplace<V_string>(text);
    }
    return true;
  }

// Parses a `key` element in a dictionary.
bool
do_parse_key(const ::rocket::phcow_string*& pkey, Parser_Context& ctx, Xml_Event_Stream& xstrm,
             ::rocket::cow_string& text, Key_Pool& key_pool)
  {
    auto pev = do_xml_peek(ctx, xstrm);
    if(!pev)
      return false;

    if((pev->kind != xml_start_element) || (pev->name != "key")) {
      do_xml_unexpected(ctx, *pev);
      return false;
    }

    ::std::int64_t offset = pev->offset;
    xstrm.skip();
    if(!do_xml_content(text, ctx, xstrm, ::rocket::sref("key")))
      return false;

    if(!is_valid_utf8(text.data(), text.data() + text.size())) {
      do_err(ctx, offset, error_utf8, "Invalid UTF-8 string");
      return false;
    }

    pkey = &(key_pool.intern(text));
    return true;
  }

bool
is_leaf_name(const ::rocket::cow_string& name)
  {
    return (name == "true") || (name == "false") || (name == "integer") || (name == "real")
           || (name == "date") || (name == "data") || (name == "string");
  }

ROCKET_ALWAYS_INLINE
bool
is_end_of(const Xml_Event& event, const char* name)
  {
    return (event.kind == xml_end_element) && (event.name == name);
  }

void
do_parse_document(variant_type& root, Parser_Context& ctx, Xml_Event_Stream& xstrm,
                  Options opts)
  {
    // Break deep recursion with a handwritten stack.
    struct xFrame
      {
        V_array* psa;
        V_dictionary* psd;
      };

    ::std::vector<xFrame> stack;
    ::rocket::cow_string text;
    Key_Pool key_pool;
    const ::rocket::phcow_string* pkey;
    variant_type* pstor = &root;
    const Xml_Event* pev;
    Xml_Event start;

    if(!do_xml_expect(ctx, xstrm, xml_start_document, nullptr)
       || !do_xml_expect(ctx, xstrm, xml_start_element, "plist"))
      return;

  do_pack_value_loop_:
    if(!(opts & option_bypass_nesting_limit) && (stack.size() > max_nesting_depth))
      return do_err(ctx, xstrm.peek() ? xstrm.peek()->offset : xstrm.size(),
                    error_nesting_limit, "Nesting limit exceeded");

    pev = do_xml_peek(ctx, xstrm);
    if(!pev)
      return;

    if(pev->kind != xml_start_element)
      return do_xml_unexpected(ctx, *pev);

    xstrm.next(start);

    if(start.name == "array") {
      pev = do_xml_peek(ctx, xstrm);
      if(!pev)
        return;

      if(!is_end_of(*pev, "array")) {
        // open
        auto& frm = stack.emplace_back();
        frm.psa = &(pstor->emplace<V_array>());
        frm.psd = nullptr;

        // first
        pstor = &(frm.psa->emplace_back().mf_stor());
        goto do_pack_value_loop_;
      }

      // empty
      xstrm.skip();
      pstor->emplace<V_array>();
    }
    else if(start.name == "dict") {
      pev = do_xml_peek(ctx, xstrm);
      if(!pev)
        return;

      if(!is_end_of(*pev, "dict")) {
        // open
        auto& frm = stack.emplace_back();
        frm.psa = nullptr;
        frm.psd = &(pstor->emplace<V_dictionary>());

        // first
        if(!do_parse_key(pkey, ctx, xstrm, text, key_pool))
          return;

        pstor = &(frm.psd->try_emplace(*pkey).first->second.mf_stor());
        goto do_pack_value_loop_;
      }

      // empty
      xstrm.skip();
      pstor->emplace<V_dictionary>();
    }
    else if(is_leaf_name(start.name)) {
      if(!do_parse_leaf(*pstor, ctx, xstrm, start, text))
        return;
    }
    else {
      ctx.name = start.name;
      return do_err(ctx, start.offset, error_xml_object_not_supported,
                    "XML element not supported");
    }

    while(!stack.empty()) {
      auto& frm = stack.back();
      pev = do_xml_peek(ctx, xstrm);
      if(!pev)
        return;

      if(frm.psa) {
        // array
        if(!is_end_of(*pev, "array")) {
          // next
          pstor = &(frm.psa->emplace_back().mf_stor());
          goto do_pack_value_loop_;
        }
      }
      else {
        // dictionary
        if(!is_end_of(*pev, "dict")) {
          // next; a duplicate key overwrites the previous value
          if(!do_parse_key(pkey, ctx, xstrm, text, key_pool))
            return;

          pstor = &(frm.psd->try_emplace(*pkey).first->second.mf_stor());
          goto do_pack_value_loop_;
        }
      }

      // close
      xstrm.skip();
      stack.pop_back();
    }

    do_xml_expect(ctx, xstrm, xml_end_element, "plist");
  }

}  // namespace

void
do_parse_xml(variant_type& root, Parser_Context& ctx, Unified_Source usrc, Options opts)
  {
    do_reset(ctx);

    // The tokenizer requires the whole document in memory.
    ::rocket::cow_string text;
    char temp[4096];
    size_t n;
    while((n = usrc.getn(temp, sizeof(temp))) != 0)
      text.append(temp, n);

    if(usrc.failed())
      return do_err(ctx, static_cast<::std::int64_t>(text.size()), error_io,
                    "Could not read stream");

    Xml_Event_Stream xstrm;
    xstrm.load(text.data(), text.size());
    do_parse_document(root, ctx, xstrm, opts);
  }

}  // namespace details
}  // namespace plist
