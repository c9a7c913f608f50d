// This file is part of PLIST.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef PLIST_DETAILS_HPP_
#define PLIST_DETAILS_HPP_

#ifndef PLIST_DETAILS_5E0B7A2C_93F1_4D86_A4C7_1F6B2E8D9C03_
#  error Please include <plist.hpp> instead.
#endif

#include "plist.hpp"
#include <rocket/tinybuf.hpp>
#include <algorithm>
#include <vector>
#include <cstring>
#include <cstdio>
namespace plist {
namespace details {

using variant_type = ::rocket::variant<PLIST_TYPES_QUAE4AEF_(V)>;

// Containers may nest this deep unless `option_bypass_nesting_limit` is set.
constexpr size_t max_nesting_depth = 32;

constexpr ROCKET_ALWAYS_INLINE
bool
is_within(int c, int lo, int hi)
  {
    return (c >= lo) && (c <= hi);
  }

template<typename... Ts>
constexpr ROCKET_ALWAYS_INLINE
bool
is_any(int c, Ts... accept_set)
  {
    return (... || (c == accept_set));
  }

inline
void
do_reset(Parser_Context& ctx)
  {
    ctx.offset = 0;
    ctx.code = error_none;
    ctx.error = nullptr;
    ctx.object_tag = -1;
    ctx.event = Xml_Event();
    ctx.name.clear();
  }

// Only the first error is recorded.
inline
void
do_err(Parser_Context& ctx, ::std::int64_t offset, Error_Code code, const char* error)
  {
    if(ctx.error)
      return;

    ctx.offset = offset;
    ctx.code = code;
    ctx.error = error;
  }

struct Memory_Source
  {
    const char* bptr;
    const char* sptr;
    const char* eptr;

    constexpr Memory_Source() noexcept
      : bptr(), sptr(), eptr()  { }

    constexpr Memory_Source(const char* s, size_t n) noexcept
      : bptr(s), sptr(s), eptr(s + n)  { }

    int
    getc() noexcept
      {
        int r = -1;
        if(this->sptr != this->eptr) {
          r = static_cast<unsigned char>(*(this->sptr));
          this->sptr ++;
        }
        return r;
      }

    size_t
    getn(char* s, size_t n) noexcept
      {
        size_t r = ::std::min(static_cast<size_t>(this->eptr - this->sptr), n);
        if(r != 0) {
          ::memcpy(s, this->sptr, r);
          this->sptr += r;
        }
        return r;
      }

    ::std::int64_t
    tell() const noexcept
      {
        return this->sptr - this->bptr;
      }

    bool
    seek(::std::int64_t off) noexcept
      {
        if((off < 0) || (off > this->eptr - this->bptr))
          return false;

        this->sptr = this->bptr + off;
        return true;
      }

    ::std::int64_t
    size() const noexcept
      {
        return this->eptr - this->bptr;
      }
  };

struct Unified_Source
  {
    Memory_Source* mem = nullptr;
    ::rocket::tinybuf* buf = nullptr;
    ::std::FILE* fp = nullptr;

    Unified_Source(Memory_Source* m) : mem(m)  { }
    Unified_Source(::rocket::tinybuf* b) : buf(b)  { }
    Unified_Source(::std::FILE* f) : fp(f)  { }

    int
    getc() const
      {
        if(this->mem)
          return this->mem->getc();
        else if(this->buf)
          return this->buf->getc();
        else if(this->fp)
          return ::fgetc(this->fp);
        else
          ROCKET_UNREACHABLE();
      }

    size_t
    getn(char* s, size_t n) const
      {
        if(this->mem)
          return this->mem->getn(s, n);
        else if(this->buf)
          return this->buf->getn(s, n);
        else if(this->fp)
          return ::fread(s, 1, n, this->fp);
        else
          ROCKET_UNREACHABLE();
      }

    ::std::int64_t
    tell() const
      {
        if(this->mem)
          return this->mem->tell();
        else if(this->buf)
          return this->buf->tell();
        else if(this->fp)
          return ::ftello(this->fp);
        else
          ROCKET_UNREACHABLE();
      }

    // Sets the absolute read position. A `tinybuf` throws an exception if it
    // can't seek.
    bool
    seek(::std::int64_t off) const
      {
        if(this->mem)
          return this->mem->seek(off);
        else if(this->buf) {
          this->buf->seek(off, ::rocket::tinybuf::seek_set);
          return true;
        }
        else if(this->fp)
          return ::fseeko(this->fp, off, SEEK_SET) == 0;
        else
          ROCKET_UNREACHABLE();
      }

    // Gets the total length of the stream, without moving the read position.
    // If the length is unknown, -1 is returned.
    ::std::int64_t
    size() const
      {
        if(this->mem)
          return this->mem->size();
        else if(this->buf) {
          ::std::int64_t cur = this->buf->tell();
          this->buf->seek(0, ::rocket::tinybuf::seek_end);
          ::std::int64_t end = this->buf->tell();
          this->buf->seek(cur, ::rocket::tinybuf::seek_set);
          return end;
        }
        else if(this->fp) {
          ::std::int64_t cur = ::ftello(this->fp);
          if((cur < 0) || (::fseeko(this->fp, 0, SEEK_END) != 0))
            return -1;
          ::std::int64_t end = ::ftello(this->fp);
          if(::fseeko(this->fp, cur, SEEK_SET) != 0)
            return -1;
          return end;
        }
        else
          ROCKET_UNREACHABLE();
      }

    // Checks whether a read operation has failed. A `tinybuf` throws an
    // exception instead.
    bool
    failed() const
      {
        if(this->fp)
          return ::ferror(this->fp);
        else
          return false;
      }
  };

// Dictionaries in a document tend to share keys, so each distinct key is only
// allocated once.
struct Key_Pool
  {
    ::std::vector<::rocket::phcow_string> st;

    struct hash_less
      {
        bool
        operator()(const ::rocket::phcow_string& x, size_t y) const noexcept
          { return x.rdhash() < y;  }

        bool
        operator()(size_t x, const ::rocket::phcow_string& y) const noexcept
          { return x < y.rdhash();  }
      };

    const ::rocket::phcow_string&
    intern(const ::rocket::cow_string& str)
      {
        size_t hval = ::rocket::cow_string::hash()(str.data(), str.size());
        auto range = ::std::equal_range(this->st.begin(), this->st.end(), hval, hash_less());

        for(auto it = range.first;  it != range.second;  ++it)
          if(it->rdstr() == str)
            return *it;

        auto it = this->st.insert(range.second, str);
        ROCKET_ASSERT(it->rdhash() == hval);
        return *it;
      }
  };

// Checks whether a byte string is valid UTF-8. Overlong sequences, surrogates
// and values above U+10FFFF are rejected.
inline
bool
is_valid_utf8(const char* bptr, const char* eptr) noexcept
  {
    while(bptr != eptr) {
      int c = static_cast<unsigned char>(*bptr);
      bptr ++;

      if(c <= 0x7F)
        continue;
      else if(is_within(c, 0x80, 0xBF) || (c >= 0xF8))
        return false;

      int u8len = ROCKET_LZCNT32(static_cast<uint32_t>(c ^ -1) << 24);
      c &= (1 << (7 - u8len)) - 1;
      for(int k = 1;  k < u8len;  ++k) {
        if(bptr == eptr)
          return false;

        int next = static_cast<unsigned char>(*bptr);
        bptr ++;
        if(!is_within(next, 0x80, 0xBF))
          return false;

        c <<= 6;
        c |= next & 0x3F;
      }

      if((c < 0x80)  // overlong
          || (c < (1 << (u8len * 5 - 4)))  // overlong
          || is_within(c, 0xD800, 0xDFFF)  // surrogates
          || (c > 0x10FFFF))
        return false;
    }
    return true;
  }

void
do_parse_binary(variant_type& root, Parser_Context& ctx, Unified_Source usrc, Options opts);

void
do_parse_xml(variant_type& root, Parser_Context& ctx, Unified_Source usrc, Options opts);

}  // namespace details
}  // namespace plist
#endif
