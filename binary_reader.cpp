// This file is part of PLIST.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#define PLIST_DETAILS_5E0B7A2C_93F1_4D86_A4C7_1F6B2E8D9C03_
#include "details.hpp"
#include <vector>
#include <cmath>
#include <cstring>
namespace plist {
namespace details {
namespace {

// seconds from 1970-01-01T00:00:00Z to 2001-01-01T00:00:00Z
constexpr ::std::int64_t reference_date_offset = 978307200;

struct Binary_Trailer
  {
    ::std::int64_t file_size;
    uint32_t offset_size;
    uint32_t ref_size;
    uint64_t object_count;
    uint64_t root_object;
    uint64_t table_offset;
    ::std::vector<uint64_t> offsets;
  };

ROCKET_ALWAYS_INLINE
uint64_t
do_load_be(const unsigned char* bptr, size_t len) noexcept
  {
    uint64_t value = 0;
    for(size_t k = 0;  k != len;  ++k)
      value = value << 8 | bptr[k];
    return value;
  }

// Only 1, 2, 4 and 8 are valid widths of integers.
constexpr ROCKET_ALWAYS_INLINE
bool
is_valid_int_size(uint64_t size) noexcept
  {
    return (size != 0) && ((size & (size - 1)) == 0) && (size <= 8);
  }

bool
do_read_exact(Parser_Context& ctx, Unified_Source usrc, void* data, size_t len)
  {
    ::std::int64_t offset = usrc.tell();
    if(usrc.getn(static_cast<char*>(data), len) == len)
      return true;

    do_err(ctx, offset, error_io, "Unexpected end of stream");
    return false;
  }

bool
do_seek(Parser_Context& ctx, Unified_Source usrc, ::std::int64_t offset)
  {
    if(usrc.seek(offset))
      return true;

    do_err(ctx, offset, error_io, "Could not seek stream");
    return false;
  }

// Checks that `count` units of `unit` bytes can be read before the end of the
// stream, so nothing is allocated for a bogus count.
bool
do_check_available(Parser_Context& ctx, Unified_Source usrc, const Binary_Trailer& trl,
                   uint64_t count, uint32_t unit)
  {
    ::std::int64_t offset = usrc.tell();
    uint64_t avail = static_cast<uint64_t>(::std::max<::std::int64_t>(trl.file_size - offset, 0));
    if(count <= avail / unit)
      return true;

    do_err(ctx, offset, error_io, "Unexpected end of stream");
    return false;
  }

// Reads a big-endian integer whose width is given by a marker byte, the low
// nibble of which is the base-2 logarithm of the width.
bool
do_read_sized(Parser_Context& ctx, Unified_Source usrc, unsigned char marker, uint64_t& value)
  {
    ::std::int64_t offset = usrc.tell();
    uint32_t width = 1U << (marker & 0x0F);
    if(!is_valid_int_size(width)) {
      do_err(ctx, offset, error_invalid_integer_size, "Invalid integer size");
      return false;
    }

    unsigned char temp[8];
    if(!do_read_exact(ctx, usrc, temp, width))
      return false;

    value = do_load_be(temp, width);
    return true;
  }

// Reads a count, whose first byte has already been read. If the low nibble is
// not 0xF, it is the count itself; otherwise the next byte is a size marker,
// followed by the count.
bool
do_read_count(Parser_Context& ctx, Unified_Source usrc, unsigned char first, uint64_t& value)
  {
    if((first & 0x0F) != 0x0F) {
      value = first & 0x0F;
      return true;
    }

    unsigned char marker;
    if(!do_read_exact(ctx, usrc, &marker, 1))
      return false;

    return do_read_sized(ctx, usrc, marker, value);
  }

bool
do_load_trailer(Parser_Context& ctx, Unified_Source usrc, Binary_Trailer& trl)
  {
    trl.file_size = usrc.size();
    if(trl.file_size < 8 + 26) {
      do_err(ctx, ::std::max<::std::int64_t>(trl.file_size, 0), error_invalid_trailer,
             "Trailer not found");
      return false;
    }

    // The trailer occupies the last 26 bytes.
    ::std::int64_t trailer_offset = trl.file_size - 26;
    unsigned char temp[26];
    if(!usrc.seek(trailer_offset) || (usrc.getn(reinterpret_cast<char*>(temp), 26) != 26)) {
      do_err(ctx, trailer_offset, error_invalid_trailer, "Trailer not readable");
      return false;
    }

    trl.offset_size = temp[0];
    trl.ref_size = temp[1];
    trl.object_count = do_load_be(temp + 2, 8);
    trl.root_object = do_load_be(temp + 10, 8);
    trl.table_offset = do_load_be(temp + 18, 8);

    if(!is_valid_int_size(trl.offset_size)) {
      do_err(ctx, trailer_offset, error_invalid_integer_size, "Invalid offset integer size");
      return false;
    }

    if(!is_valid_int_size(trl.ref_size)) {
      do_err(ctx, trailer_offset + 1, error_invalid_integer_size, "Invalid object reference size");
      return false;
    }

    // The offset table shall fit between the header and the trailer.
    uint64_t table_end = static_cast<uint64_t>(trailer_offset);
    if((trl.table_offset < 8) || (trl.table_offset > table_end)
        || (trl.object_count > (table_end - trl.table_offset) / trl.offset_size)) {
      do_err(ctx, trailer_offset + 18, error_invalid_trailer, "Offset table out of range");
      return false;
    }

    if(trl.root_object >= trl.object_count) {
      do_err(ctx, trailer_offset + 10, error_invalid_trailer, "Root object out of range");
      return false;
    }

    size_t table_size = static_cast<size_t>(trl.object_count * trl.offset_size);
    ::std::vector<unsigned char> table(table_size);
    if(!usrc.seek(static_cast<::std::int64_t>(trl.table_offset))
        || (usrc.getn(reinterpret_cast<char*>(table.data()), table_size) != table_size)) {
      do_err(ctx, static_cast<::std::int64_t>(trl.table_offset), error_invalid_trailer,
             "Offset table not readable");
      return false;
    }

    trl.offsets.resize(static_cast<size_t>(trl.object_count));
    for(size_t k = 0;  k != trl.offsets.size();  ++k)
      trl.offsets[k] = do_load_be(table.data() + k * trl.offset_size, trl.offset_size);
    return true;
  }

// Seeks to the first byte of an object and peeks its marker.
bool
do_seek_object(Parser_Context& ctx, Unified_Source usrc, const Binary_Trailer& trl,
               uint64_t index, unsigned char& marker)
  {
    uint64_t offset = trl.offsets[index];
    if((offset < 8) || (offset >= trl.table_offset)) {
      do_err(ctx, usrc.tell(), error_invalid_object_reference, "Object offset out of range");
      return false;
    }

    return do_seek(ctx, usrc, static_cast<::std::int64_t>(offset))
           && do_read_exact(ctx, usrc, &marker, 1)
           && do_seek(ctx, usrc, static_cast<::std::int64_t>(offset));
  }

bool
do_read_refs(Parser_Context& ctx, Unified_Source usrc, const Binary_Trailer& trl,
             uint64_t count, ::std::vector<uint64_t>& refs)
  {
    if(!do_check_available(ctx, usrc, trl, count, trl.ref_size))
      return false;

    ::std::int64_t offset = usrc.tell();
    ::std::vector<unsigned char> temp(static_cast<size_t>(count * trl.ref_size));
    if(!do_read_exact(ctx, usrc, temp.data(), temp.size()))
      return false;

    refs.resize(static_cast<size_t>(count));
    for(size_t k = 0;  k != refs.size();  ++k) {
      refs[k] = do_load_be(temp.data() + k * trl.ref_size, trl.ref_size);
      if(refs[k] >= trl.object_count) {
        do_err(ctx, offset + static_cast<::std::int64_t>(k * trl.ref_size),
               error_invalid_object_reference, "Object reference out of range");
        return false;
      }
    }
    return true;
  }

void
do_append_utf8(V_string& str, char32_t c)
  {
    if(c < 0x80)
      str.push_back(static_cast<char>(c));
    else if(c < 0x800) {
      str.push_back(static_cast<char>(0xC0 | c >> 6));
      str.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
    else if(c < 0x10000) {
      str.push_back(static_cast<char>(0xE0 | c >> 12));
      str.push_back(static_cast<char>(0x80 | (c >> 6 & 0x3F)));
      str.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
    else {
      str.push_back(static_cast<char>(0xF0 | c >> 18));
      str.push_back(static_cast<char>(0x80 | (c >> 12 & 0x3F)));
      str.push_back(static_cast<char>(0x80 | (c >> 6 & 0x3F)));
      str.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
  }

// Converts big-endian UTF-16 code units to UTF-8. Unpaired surrogates are
// errors.
bool
do_convert_utf16(V_string& str, const unsigned char* bptr, size_t units)
  {
    for(size_t k = 0;  k != units;  ++k) {
      char32_t c = static_cast<char32_t>(do_load_be(bptr + k * 2, 2));
      if(is_within(static_cast<int>(c), 0xDC00, 0xDFFF))
        return false;

      if(is_within(static_cast<int>(c), 0xD800, 0xDBFF)) {
        // Look for a trailing surrogate.
        if(k + 1 == units)
          return false;

        char32_t low = static_cast<char32_t>(do_load_be(bptr + k * 2 + 2, 2));
        if(!is_within(static_cast<int>(low), 0xDC00, 0xDFFF))
          return false;

        c = ((c & 0x3FF) << 10 | (low & 0x3FF)) + 0x10000;
        k ++;
      }

      do_append_utf8(str, c);
    }
    return true;
  }

bool
do_make_date(V_date& date, Parser_Context& ctx, ::std::int64_t offset, double secs, Options opts)
  {
    // `V_date` counts microseconds in 64 bits, which is about 9.2e12 seconds.
    if(!::std::isfinite(secs) || (::std::fabs(secs) > 9.0e12)) {
      do_err(ctx, offset, error_date_format, "Date value out of range");
      return false;
    }

    ::std::int64_t whole = static_cast<::std::int64_t>(::std::trunc(secs));
    double frac = secs - ::std::trunc(secs);
    ::std::int64_t nsecs;

    if(opts & option_legacy_date_scale) {
      // Negative values are truncated to zero. The scaled fraction may exceed one
      // second, and carries into whole seconds.
      uint64_t scaled = 0;
      if(secs <= 0)
        whole = 0;
      else
        scaled = static_cast<uint64_t>(::std::fmin(frac * 10e9, 4294967295.0));

      whole += static_cast<::std::int64_t>(scaled / 1000000000);
      nsecs = static_cast<::std::int64_t>(scaled % 1000000000);
    }
    else
      nsecs = static_cast<::std::int64_t>(frac * 1.0e9);

    // Digits beyond microseconds are truncated.
    date = V_date(::std::chrono::seconds(reference_date_offset + whole))
           + ::std::chrono::duration_cast<V_date::duration>(::std::chrono::nanoseconds(nsecs));
    return true;
  }

// Decodes a non-container object, starting from its marker.
bool
do_parse_scalar(variant_type& stor, Parser_Context& ctx, Unified_Source usrc,
                const Binary_Trailer& trl, Options opts)
  {
    ::std::int64_t offset = usrc.tell();
    unsigned char marker;
    unsigned char temp[8];
    uint64_t count;

    if(!do_read_exact(ctx, usrc, &marker, 1))
      return false;

    switch(marker >> 4)
      {
      case 0x0:
        // boolean
        if(marker == 0x08)
          stor.emplace<V_boolean>(false);
        else if(marker == 0x09)
          stor.emplace<V_boolean>(true);
        else {
          do_err(ctx, offset, error_invalid_boolean, "Invalid boolean marker");
          return false;
        }
        return true;

      case 0x1:
        // integer
        if(opts & option_marker_sized_integers) {
          if(!do_read_sized(ctx, usrc, marker, count))
            return false;
        }
        else {
          unsigned char first;
          if(!do_read_exact(ctx, usrc, &first, 1) || !do_read_count(ctx, usrc, first, count))
            return false;
        }

        stor.emplace<V_integer>(static_cast<::std::int64_t>(count));
        return true;

      case 0x2:
        // real
        if((marker & 0x0F) == 2) {
          if(!do_read_exact(ctx, usrc, temp, 4))
            return false;

          uint32_t bits = static_cast<uint32_t>(do_load_be(temp, 4));
          float value;
          ::std::memcpy(&value, &bits, 4);
          stor.emplace<V_real>(value);
        }
        else if((marker & 0x0F) == 3) {
          if(!do_read_exact(ctx, usrc, temp, 8))
            return false;

          uint64_t bits = do_load_be(temp, 8);
          double value;
          ::std::memcpy(&value, &bits, 8);
          stor.emplace<V_real>(value);
        }
        else {
          do_err(ctx, offset, error_invalid_integer_size, "Invalid real size");
          return false;
        }
        return true;

      case 0x3:
        {
          // date; seconds since 2001-01-01T00:00:00Z as a double
          if(!do_read_exact(ctx, usrc, temp, 8))
            return false;

          uint64_t bits = do_load_be(temp, 8);
          double secs;
          ::std::memcpy(&secs, &bits, 8);
          return do_make_date(stor.emplace<V_date>(), ctx, offset, secs, opts);
        }

      case 0x4:
        {
          // data
          if(!do_read_count(ctx, usrc, marker, count)
              || !do_check_available(ctx, usrc, trl, count, 1))
            return false;

          auto& bin = stor.emplace<V_data>();
          bin.append(static_cast<size_t>(count), static_cast<unsigned char>(0));
          return do_read_exact(ctx, usrc, bin.mut_data(), bin.size());
        }

      case 0x5:
        {
          // UTF-8 string
          if(!do_read_count(ctx, usrc, marker, count)
              || !do_check_available(ctx, usrc, trl, count, 1))
            return false;

          auto& str = stor.emplace<V_string>();
          str.append(static_cast<size_t>(count), '\0');
          if(!do_read_exact(ctx, usrc, str.mut_data(), str.size()))
            return false;

          if(!is_valid_utf8(str.data(), str.data() + str.size())) {
            do_err(ctx, offset, error_utf8, "Invalid UTF-8 string");
            return false;
          }
          return true;
        }

      case 0x6:
        {
          // UTF-16 string; the count is in code units
          if(!do_read_count(ctx, usrc, marker, count)
              || !do_check_available(ctx, usrc, trl, count, 2))
            return false;

          ::std::vector<unsigned char> units(static_cast<size_t>(count * 2));
          if(!do_read_exact(ctx, usrc, units.data(), units.size()))
            return false;

          auto& str = stor.emplace<V_string>();
          if(!do_convert_utf16(str, units.data(), static_cast<size_t>(count))) {
            do_err(ctx, offset, error_utf16, "Invalid UTF-16 string");
            return false;
          }
          return true;
        }

      default:
        if(!ctx.error)
          ctx.object_tag = marker >> 4;

        do_err(ctx, offset, error_object_not_supported, "Object type not supported");
        return false;
      }
  }

// Decodes a dictionary key, which shall be a string.
bool
do_parse_key(const ::rocket::phcow_string*& pkey, Parser_Context& ctx, Unified_Source usrc,
             const Binary_Trailer& trl, uint64_t index, Key_Pool& key_pool, Options opts)
  {
    unsigned char marker;
    if(!do_seek_object(ctx, usrc, trl, index, marker))
      return false;

    if(is_any(marker >> 4, 0xA, 0xD)) {
      do_err(ctx, usrc.tell(), error_invalid_key_object, "Key object not a string");
      return false;
    }

    variant_type key;
    if(!do_parse_scalar(key, ctx, usrc, trl, opts))
      return false;

    if(key.index() != t_string) {
      do_err(ctx, static_cast<::std::int64_t>(trl.offsets[index]), error_invalid_key_object,
             "Key object not a string");
      return false;
    }

    pkey = &(key_pool.intern(key.as<V_string>()));
    return true;
  }

void
do_resolve_objects(variant_type& root, Parser_Context& ctx, Unified_Source usrc,
                   const Binary_Trailer& trl, Options opts)
  {
    // Break deep recursion with a handwritten stack.
    struct xFrame
      {
        uint64_t index;
        V_array* psa;
        V_dictionary* psd;
        ::std::vector<uint64_t> refs;  // for a dictionary, keys then values
        size_t next;
      };

    ::std::vector<xFrame> stack;
    ::std::vector<bool> busy(static_cast<size_t>(trl.object_count));
    Key_Pool key_pool;
    const ::rocket::phcow_string* pkey;
    variant_type* pstor = &root;
    uint64_t index = trl.root_object;
    unsigned char marker;
    uint64_t count;

  do_pack_object_loop_:
    if(!(opts & option_bypass_nesting_limit) && (stack.size() > max_nesting_depth))
      return do_err(ctx, usrc.tell(), error_nesting_limit, "Nesting limit exceeded");

    // A container that is being decoded may not contain itself.
    if(busy[index])
      return do_err(ctx, static_cast<::std::int64_t>(trl.offsets[index]), error_cyclic_reference,
                    "Cyclic object reference");

    if(!do_seek_object(ctx, usrc, trl, index, marker))
      return;

    if((marker >> 4) == 0xA) {
      // array
      if(!do_read_exact(ctx, usrc, &marker, 1) || !do_read_count(ctx, usrc, marker, count))
        return;

      if(count != 0) {
        // open
        auto& frm = stack.emplace_back();
        frm.index = index;
        frm.psa = &(pstor->emplace<V_array>());
        frm.psd = nullptr;
        if(!do_read_refs(ctx, usrc, trl, count, frm.refs))
          return;

        frm.psa->reserve(frm.refs.size());
        busy[index] = true;

        // first
        frm.next = 0;
        pstor = &(frm.psa->emplace_back().mf_stor());
        index = frm.refs[0];
        goto do_pack_object_loop_;
      }

      // empty
      pstor->emplace<V_array>();
    }
    else if((marker >> 4) == 0xD) {
      // dictionary
      if(!do_read_exact(ctx, usrc, &marker, 1) || !do_read_count(ctx, usrc, marker, count))
        return;

      if(count != 0) {
        // open
        auto& frm = stack.emplace_back();
        frm.index = index;
        frm.psa = nullptr;
        frm.psd = &(pstor->emplace<V_dictionary>());
        if(!do_check_available(ctx, usrc, trl, count, 2)
            || !do_read_refs(ctx, usrc, trl, count * 2, frm.refs))
          return;

        busy[index] = true;

        // first
        frm.next = 0;
        if(!do_parse_key(pkey, ctx, usrc, trl, frm.refs[0], key_pool, opts))
          return;

        pstor = &(frm.psd->try_emplace(*pkey).first->second.mf_stor());
        index = frm.refs[frm.refs.size() / 2];
        goto do_pack_object_loop_;
      }

      // empty
      pstor->emplace<V_dictionary>();
    }
    else if(!do_parse_scalar(*pstor, ctx, usrc, trl, opts))
      return;

    while(!stack.empty()) {
      auto& frm = stack.back();
      frm.next ++;

      if(frm.psa) {
        // array
        if(frm.next != frm.refs.size()) {
          // next
          pstor = &(frm.psa->emplace_back().mf_stor());
          index = frm.refs[frm.next];
          goto do_pack_object_loop_;
        }
      }
      else {
        // dictionary
        size_t npairs = frm.refs.size() / 2;
        if(frm.next != npairs) {
          // next; a duplicate key overwrites the previous value
          if(!do_parse_key(pkey, ctx, usrc, trl, frm.refs[frm.next], key_pool, opts))
            return;

          pstor = &(frm.psd->try_emplace(*pkey).first->second.mf_stor());
          index = frm.refs[npairs + frm.next];
          goto do_pack_object_loop_;
        }
      }

      // close
      busy[static_cast<size_t>(frm.index)] = false;
      stack.pop_back();
    }
  }

}  // namespace

void
do_parse_binary(variant_type& root, Parser_Context& ctx, Unified_Source usrc, Options opts)
  {
    do_reset(ctx);

    // The header consists of the magic `bplist` and the version `00`.
    // A stream that is too short for the magic is not a binary document.
    char header[8];
    if(!do_seek(ctx, usrc, 0))
      return;

    size_t nread = usrc.getn(header, 8);
    if((nread < 6) || (::std::memcmp(header, "bplist", 6) != 0))
      return do_err(ctx, 0, error_invalid_magic_bytes, "Invalid magic bytes");

    if(nread < 8)
      return do_err(ctx, static_cast<::std::int64_t>(nread), error_io, "Unexpected end of stream");

    if(::std::memcmp(header + 6, "00", 2) != 0) {
      if(is_valid_utf8(header + 6, header + 8))
        ctx.name.assign(header + 6, 2);

      return do_err(ctx, 6, error_version_not_supported, "Version not supported");
    }

    Binary_Trailer trl;
    if(!do_load_trailer(ctx, usrc, trl))
      return;

    do_resolve_objects(root, ctx, usrc, trl, opts);
  }

}  // namespace details
}  // namespace plist
