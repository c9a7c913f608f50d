// This file is part of PLIST.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "test_utils.hpp"
#include <cstdio>

int
main(void)
  {
    delete new int;
    ::alloc_count = 0;

    {
      // { "a": 1, "b": [ true, false ], "c": "hello" }
      Bplist_Builder bld;
      bld.add_dictionary({ 1, 3, 7 }, { 2, 4, 8 });
      bld.add_string("a");
      bld.add_integer(1);
      bld.add_string("b");
      bld.add_array({ 5, 6 });
      bld.add_boolean(true);
      bld.add_boolean(false);
      bld.add_string("c");
      bld.add_string("hello");

      ::plist::Value val;
      ::plist::Parser_Context ctx;
      val.parse_binary_with(ctx, bld.finish(0));
      assert(ctx.error == nullptr);
      assert(ctx.code == ::plist::error_none);
      assert(val.is_dictionary());
      assert(val.as_dictionary_size() == 3);
      assert(val.as_dictionary().at(&"a").as_integer() == 1);
      assert(val.as_dictionary().at(&"b").as_array_size() == 2);
      assert(val.as_dictionary().at(&"b").as_array().at(0).as_boolean() == true);
      assert(val.as_dictionary().at(&"b").as_array().at(1).as_boolean() == false);
      assert(val.as_dictionary().at(&"c").as_string() == "hello");
    }

    {
      // Every valid combination of integer sizes is accepted.
      for(unsigned offset_size : { 1, 2, 4, 8 })
        for(unsigned ref_size : { 1, 2, 4, 8 }) {
          Bplist_Builder bld;
          bld.ref_size = ref_size;
          bld.add_array({ 1, 2 });
          bld.add_string("x");
          bld.add_integer(-7);

          ::plist::Value val;
          assert(val.parse_binary(bld.finish(0, offset_size)));
          assert(val.as_array_size() == 2);
          assert(val.as_array().at(0).as_string() == "x");
          assert(val.as_array().at(1).as_integer() == -7);
        }
    }

    {
      // Size bytes in the trailer shall be 1, 2, 4 or 8.
      Bplist_Builder bld;
      bld.add_string("x");
      auto doc = bld.finish(0, 1);

      for(size_t field = 0;  field != 2;  ++field)
        for(int size = 0;  size != 256;  ++size) {
          auto copy = doc;
          copy.mut(trailer_field(copy, field)) = static_cast<char>(size);

          ::plist::Value val;
          ::plist::Parser_Context ctx;
          val.parse_binary_with(ctx, copy);
          if((size == 1) || (size == 2) || (size == 4) || (size == 8))
            assert(ctx.code != ::plist::error_invalid_integer_size);
          else
            assert(ctx.code == ::plist::error_invalid_integer_size);
        }
    }

    {
      // Unsupported object types
      for(int tag : { 0x7, 0x8, 0x9, 0xB, 0xC, 0xE, 0xF }) {
        char raw[] = { static_cast<char>(tag << 4 | 1), 0, 0, 0 };
        Bplist_Builder bld;
        bld.add_raw(raw, sizeof(raw));

        ::plist::Value val;
        ::plist::Parser_Context ctx;
        val.parse_binary_with(ctx, bld.finish(0));
        assert(ctx.code == ::plist::error_object_not_supported);
        assert(ctx.object_tag == tag);
        assert(ctx.offset == 8);
      }
    }

    {
      // Dictionary keys shall be strings.
      Bplist_Builder bld;
      bld.add_dictionary({ 1 }, { 2 });
      bld.add_integer(1);
      bld.add_string("value");

      ::plist::Value val;
      ::plist::Parser_Context ctx;
      val.parse_binary_with(ctx, bld.finish(0));
      assert(ctx.code == ::plist::error_invalid_key_object);

      Bplist_Builder bld2;
      bld2.add_dictionary({ 1 }, { 2 });
      bld2.add_array({ });
      bld2.add_string("value");

      val.parse_binary_with(ctx, bld2.finish(0));
      assert(ctx.code == ::plist::error_invalid_key_object);
    }

    {
      // UTF-16 keys are strings too. A duplicate key overwrites the previous
      // value.
      Bplist_Builder bld;
      bld.add_dictionary({ 1, 2 }, { 3, 4 });
      bld.add_utf16({ 'k' });
      bld.add_string("k");
      bld.add_integer(1);
      bld.add_integer(2);

      ::plist::Value val;
      assert(val.parse_binary(bld.finish(0)));
      assert(val.as_dictionary_size() == 1);
      assert(val.as_dictionary().at(&"k").as_integer() == 2);
    }

    {
      // extremal integers
      static constexpr ::std::int64_t values[] = { 0, -1, 5, INT64_MAX, INT64_MIN };
      for(::std::int64_t value : values) {
        Bplist_Builder bld;
        bld.add_integer(value);

        ::plist::Value val;
        assert(val.parse_binary(bld.finish(0)));
        assert(val.is_integer());
        assert(val.as_integer() == value);

        Bplist_Builder bld2;
        bld2.add_marker_sized_integer(value);
        assert(val.parse_binary(bld2.finish(0), ::plist::option_marker_sized_integers));
        assert(val.is_integer());
        assert(val.as_integer() == value);
      }
    }

    {
      // An integer with a bad width marker
      static constexpr char raw[] = "\x10\x1F\x15\x00";
      Bplist_Builder bld;
      bld.add_raw(raw, 4);

      ::plist::Value val;
      ::plist::Parser_Context ctx;
      val.parse_binary_with(ctx, bld.finish(0));
      assert(ctx.code == ::plist::error_invalid_integer_size);
    }

    {
      // booleans
      Bplist_Builder bld;
      bld.add_array({ 1, 2 });
      bld.add_boolean(true);
      bld.add_boolean(false);

      ::plist::Value val;
      assert(val.parse_binary(bld.finish(0)));
      assert(val.as_array().at(0).as_boolean() == true);
      assert(val.as_array().at(1).as_boolean() == false);

      static constexpr char raw[] = "\x00";
      Bplist_Builder bld2;
      bld2.add_raw(raw, 1);

      ::plist::Parser_Context ctx;
      val.parse_binary_with(ctx, bld2.finish(0));
      assert(ctx.code == ::plist::error_invalid_boolean);
    }

    {
      // reals
      Bplist_Builder bld;
      bld.add_array({ 1, 2 });
      bld.add_real(-0.125);
      bld.add_real32(1.5f);

      ::plist::Value val;
      assert(val.parse_binary(bld.finish(0)));
      assert(val.as_array().at(0).as_real() == -0.125);
      assert(val.as_array().at(1).as_real() == 1.5);

      static constexpr char raw[] = "\x21\x00\x00";
      Bplist_Builder bld2;
      bld2.add_raw(raw, 3);

      ::plist::Parser_Context ctx;
      val.parse_binary_with(ctx, bld2.finish(0));
      assert(ctx.code == ::plist::error_invalid_integer_size);
    }

    {
      // dates with the nanosecond scale, truncated to microseconds
      Bplist_Builder bld;
      bld.add_array({ 1, 2, 3 });
      bld.add_date(0);
      bld.add_date(1.5);
      bld.add_date(-1.25);

      ::plist::Value val;
      assert(val.parse_binary(bld.finish(0)));
      assert(val.as_array().at(0).as_date() == make_date(978307200));
      assert(val.as_array().at(1).as_date() == make_date(978307201, 500000000));
      assert(val.as_array().at(2).as_date() == make_date(978307198, 750000000));

      // The legacy scale saturates the fraction and clamps negative dates.
      assert(val.parse_binary(bld.finish(0), ::plist::option_legacy_date_scale));
      assert(val.as_array().at(0).as_date() == make_date(978307200));
      assert(val.as_array().at(1).as_date() == make_date(978307205, 294967295));
      assert(val.as_array().at(2).as_date() == make_date(978307200));

      Bplist_Builder bld2;
      bld2.add_date(1.25);
      assert(val.parse_binary(bld2.finish(0), ::plist::option_legacy_date_scale));
      assert(val.as_date() == make_date(978307203, 500000000));
    }

    {
      // far dates, such as `distantPast` and `distantFuture`
      Bplist_Builder bld;
      bld.add_array({ 1, 2, 3 });
      bld.add_date(-63113904000.0);
      bld.add_date(63113904000.0);
      bld.add_date(-63114076800.0);

      ::plist::Value val;
      assert(val.parse_binary(bld.finish(0)));
      assert(val.as_array().at(0).as_date() == make_date(-62135596800));
      assert(val.as_array().at(0).to_string() == "0001-01-01T00:00:00Z");
      assert(val.as_array().at(1).as_date() == make_date(64092211200));
      assert(val.as_array().at(1).to_string() == "4001-01-01T00:00:00Z");
      assert(val.as_array().at(2).to_string() == "0000-12-30T00:00:00Z");
    }

    {
      // dates that can't be represented
      for(double secs : { 1.0e13, -1.0e13, HUGE_VAL, ::std::nan("") }) {
        Bplist_Builder bld;
        bld.add_date(secs);

        ::plist::Value val;
        ::plist::Parser_Context ctx;
        val.parse_binary_with(ctx, bld.finish(0));
        assert(ctx.code == ::plist::error_date_format);
      }
    }

    {
      // data with an escaped count
      unsigned char bytes[20];
      for(int k = 0;  k != 20;  ++k)
        bytes[k] = static_cast<unsigned char>(k);

      Bplist_Builder bld;
      bld.add_data(bytes, 20);

      ::plist::Value val;
      assert(val.parse_binary(bld.finish(0)));
      assert(val.is_data());
      assert(val.as_data_size() == 20);
      assert(::std::memcmp(val.as_data_bytes(), bytes, 20) == 0);
    }

    {
      // UTF-16 strings
      Bplist_Builder bld;
      bld.add_utf16({ 0x0048, 0x732B, 0xD83D, 0xDE02 });

      ::plist::Value val;
      assert(val.parse_binary(bld.finish(0)));
      assert(val.as_string() == "H\xE7\x8C\xAB\xF0\x9F\x98\x82");

      for(const auto& units : { ::std::vector<::std::uint16_t>{ 0xDE02 },
                                ::std::vector<::std::uint16_t>{ 0xD83D },
                                ::std::vector<::std::uint16_t>{ 0xD83D, 0x0041 } }) {
        Bplist_Builder bld2;
        bld2.add_utf16(units);

        ::plist::Parser_Context ctx;
        val.parse_binary_with(ctx, bld2.finish(0));
        assert(ctx.code == ::plist::error_utf16);
      }
    }

    {
      // invalid UTF-8 strings
      for(const char* str : { "\xC0\x80", "\xED\xA0\x80", "\xF4\x90\x80\x80", "\xE7\x8C" }) {
        Bplist_Builder bld;
        bld.add_string(str);

        ::plist::Value val;
        ::plist::Parser_Context ctx;
        val.parse_binary_with(ctx, bld.finish(0));
        assert(ctx.code == ::plist::error_utf8);
      }
    }

    {
      // A shared object is decoded twice.
      Bplist_Builder bld;
      bld.add_array({ 1, 1, 2 });
      bld.add_string("shared");
      bld.add_array({ 1 });

      ::plist::Value val;
      assert(val.parse_binary(bld.finish(0)));
      assert(val.as_array_size() == 3);
      assert(val.as_array().at(0).as_string() == "shared");
      assert(val.as_array().at(1).as_string() == "shared");
      assert(val.as_array().at(2).as_array().at(0).as_string() == "shared");
    }

    {
      // cycles
      Bplist_Builder bld;
      bld.add_array({ 0 });

      ::plist::Value val;
      ::plist::Parser_Context ctx;
      val.parse_binary_with(ctx, bld.finish(0));
      assert(ctx.code == ::plist::error_cyclic_reference);

      Bplist_Builder bld2;
      bld2.add_dictionary({ 1 }, { 2 });
      bld2.add_string("k");
      bld2.add_array({ 3, 0 });
      bld2.add_boolean(true);

      val.parse_binary_with(ctx, bld2.finish(0));
      assert(ctx.code == ::plist::error_cyclic_reference);
    }

    {
      // references out of range
      Bplist_Builder bld;
      bld.add_array({ 1, 5 });
      bld.add_boolean(true);

      ::plist::Value val;
      ::plist::Parser_Context ctx;
      val.parse_binary_with(ctx, bld.finish(0));
      assert(ctx.code == ::plist::error_invalid_object_reference);

      Bplist_Builder bld2;
      bld2.add_array({ 1 });
      bld2.add_boolean(true);
      bld2.offsets[1] = 4;
      val.parse_binary_with(ctx, bld2.finish(0));
      assert(ctx.code == ::plist::error_invalid_object_reference);

      bld2.offsets[1] = 1000;
      val.parse_binary_with(ctx, bld2.finish(0));
      assert(ctx.code == ::plist::error_invalid_object_reference);
    }

    {
      // root object out of range
      Bplist_Builder bld;
      bld.add_boolean(true);

      ::plist::Value val;
      ::plist::Parser_Context ctx;
      val.parse_binary_with(ctx, bld.finish(1));
      assert(ctx.code == ::plist::error_invalid_trailer);

      // offset table out of range
      auto doc = bld.finish(0);
      doc.mut(trailer_field(doc, 25)) = 100;
      val.parse_binary_with(ctx, doc);
      assert(ctx.code == ::plist::error_invalid_trailer);

      // too many objects
      doc = bld.finish(0);
      doc.mut(trailer_field(doc, 9)) = 100;
      val.parse_binary_with(ctx, doc);
      assert(ctx.code == ::plist::error_invalid_trailer);
    }

    {
      // truncated documents
      Bplist_Builder bld;
      bld.add_string("hello");
      auto doc = bld.finish(0);

      ::plist::Value val;
      ::plist::Parser_Context ctx;
      for(size_t len : { 8, 20, 33 }) {
        val.parse_binary_with(ctx, doc.data(), len);
        assert(ctx.code == ::plist::error_invalid_trailer);
      }

      val.parse_binary_with(ctx, doc.data(), 7);
      assert(ctx.code == ::plist::error_io);
    }

    {
      // A count that exceeds the stream is rejected before allocation.
      static constexpr char raw[] = "\x5F\x12\x00\x10\x00\x00";
      Bplist_Builder bld;
      bld.add_raw(raw, 6);

      ::plist::Value val;
      ::plist::Parser_Context ctx;
      val.parse_binary_with(ctx, bld.finish(0));
      assert(ctx.code == ::plist::error_io);
    }

    {
      // magic and version
      ::plist::Value val;
      ::plist::Parser_Context ctx;
      val.parse_binary_with(ctx, "<plist><true/></plist>", 22);
      assert(ctx.code == ::plist::error_invalid_magic_bytes);

      Bplist_Builder bld;
      bld.add_boolean(true);
      auto doc = bld.finish(0);
      doc.mut(7) = '1';
      val.parse_binary_with(ctx, doc);
      assert(ctx.code == ::plist::error_version_not_supported);
      assert(ctx.name == "01");
    }

    {
      // nesting limit
      for(size_t depth : { 33, 34 }) {
        Bplist_Builder bld;
        for(size_t k = 0;  k != depth - 1;  ++k)
          bld.add_array({ k + 1 });
        bld.add_array({ });

        ::plist::Value val;
        ::plist::Parser_Context ctx;
        val.parse_binary_with(ctx, bld.finish(0));
        if(depth == 33)
          assert(ctx.code == ::plist::error_none);
        else
          assert(ctx.code == ::plist::error_nesting_limit);

        val.parse_binary_with(ctx, bld.finish(0), ::plist::option_bypass_nesting_limit);
        assert(ctx.code == ::plist::error_none);
      }
    }

    {
      // from a file
      Bplist_Builder bld;
      bld.add_array({ 1 });
      bld.add_string("file");
      auto doc = bld.finish(0);

      ::std::FILE* fp = ::std::tmpfile();
      assert(fp);
      assert(::std::fwrite(doc.data(), 1, doc.size(), fp) == doc.size());

      ::plist::Value val;
      assert(val.parse_binary(fp));
      assert(val.as_array().at(0).as_string() == "file");
      ::std::fclose(fp);
    }

    // leak check
    assert(::alloc_count == 0);
  }
