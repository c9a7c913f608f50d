// This file is part of PLIST.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "test_utils.hpp"
#include <limits>

int
main(void)
  {
    delete new int;
    ::alloc_count = 0;

    {
      ::plist::Value val;
      assert(val.type() == ::plist::t_array);
      assert(val.is_array());
      assert(val.as_array_size() == 0);
      assert(val.to_string() == "()");
    }

    {
      ::plist::V_array arr = { 1, &"hello", false };
      ::plist::Value val = arr;
      assert(val.type() == ::plist::t_array);
      assert(val.as_array().size() == 3);
      assert(val.as_array().at(0).type() == ::plist::t_integer);
      assert(val.as_array().at(0).as_integer() == 1);
      assert(val.as_array().at(1).type() == ::plist::t_string);
      assert(val.as_array().at(1).as_string() == "hello");
      assert(val.as_array().at(2).type() == ::plist::t_boolean);
      assert(val.as_array().at(2).as_boolean() == false);
      assert(val.to_string() == R"((1, "hello", false))");
    }

    {
      ::plist::V_dictionary dict = { { &"x", 3.5 }, { &"y", &"hello" } };
      ::plist::Value val = dict;
      assert(val.type() == ::plist::t_dictionary);
      assert(val.is_dictionary());
      assert(val.as_dictionary_size() == 2);
      assert(val.as_dictionary().at(&"x").is_real());
      assert(val.as_dictionary().at(&"x").as_real() == 3.5);
      assert(val.as_dictionary().at(&"y").is_string());
      assert(val.as_dictionary().at(&"y").as_string() == "hello");
      assert(val.to_string() == R"({"x" = 3.5; "y" = "hello";})"
             || val.to_string() == R"({"y" = "hello"; "x" = 3.5;})");
    }

    {
      ::plist::Value val = true;
      assert(val.is_boolean());
      assert(val.as_boolean() == true);
      assert(val.to_string() == "true");

      val.mut_integer() = 42;
      assert(val.type() == ::plist::t_integer);
      assert(val.as_integer() == 42);
      assert(val.to_string() == "42");
    }

    {
      ::plist::Value val = INT64_MAX;
      assert(val.is_integer());
      assert(val.to_string() == "9223372036854775807");

      val = INT64_MIN;
      assert(val.is_integer());
      assert(val.to_string() == "-9223372036854775808");
    }

    {
      ::plist::Value val = 1.5;
      assert(val.type() == ::plist::t_real);
      assert(val.as_real() == 1.5);
      assert(val.to_string() == "1.5");

      val = 0.25F;
      assert(val.is_real());
      assert(val.as_real() == 0.25);

      // Reals can be told from integers.
      val = 2.0;
      assert(val.to_string() == "2.0");
      val = -::std::numeric_limits<double>::infinity();
      assert((val.to_string() == "-inf") || (val.to_string() == "-infinity"));

      val = ::std::numeric_limits<double>::quiet_NaN();
      assert(val.is_real());
      assert(::std::isnan(val.as_real()));
      assert(val.to_string() == "nan");

      val = &"world";
      assert(val.is_string());
      assert(val.as_string_length() == 5);
      assert(::std::memcmp(val.as_string_c_str(), "world", 6) == 0);
    }

    {
      ::plist::Value val = &"$meow";
      assert(val.to_string() == R"("$meow")");

      val = &"";
      assert(val.to_string() == R"("")");

      val = &"\b\f\n\r\t\x1B\x7F\"\\";
      assert(val.to_string() == R"("\U0008\U000C\n\r\t\U001B\U007F\"\\")");

      val = &"猫😂";
      assert(val.to_string() == R"("猫😂")");

      // Invalid UTF-8 is never produced by a parser, but may be assigned.
      val = ::rocket::cow_string("a\xFFz", 3);
      assert(val.to_string() == R"("a\UFFFDz")");
    }

    {
      ::plist::Value val = ::rocket::cow_bstring(reinterpret_cast<const unsigned char*>("ACE"), 3);
      assert(val.type() == ::plist::t_data);
      assert(val.as_data_size() == 3);
      assert(val.to_string() == "<414345>");

      static constexpr unsigned char bytes[] = "\xFF\x00\xFE\x7F\x80";
      val = ::rocket::cow_bstring(bytes, 5);
      assert(val.as_data().compare(bytes, 5) == 0);
      assert(::std::memcmp(val.as_data_bytes(), bytes, 5) == 0);
      assert(val.to_string() == "<ff00fe7f 80>");

      static constexpr unsigned char more_bytes[] =
          "\xc9\x89\x0d\x33\xa3\x9b\x0e\x85\x88\x33\x44\x7c";
      val = ::rocket::cow_bstring(more_bytes, 12);
      assert(val.as_data_size() == 12);
      assert(val.to_string() == "<c9890d33 a39b0e85 8833447c>");

      val = ::rocket::cow_bstring(more_bytes, 8);
      assert(val.to_string() == "<c9890d33 a39b0e85>");

      val = ::rocket::cow_bstring();
      assert(val.is_data());
      assert(val.to_string() == "<>");
    }

    {
      ::plist::Value val = make_date(978307200);
      assert(val.type() == ::plist::t_date);
      assert(val.is_date());
      assert(val.as_date() == make_date(978307200));
      assert(val.to_string() == "2001-01-01T00:00:00Z");

      val = make_date(978307200, 250000000);
      assert(val.to_string() == "2001-01-01T00:00:00.25Z");

      val = make_date(-1);
      assert(val.to_string() == "1969-12-31T23:59:59Z");

      val = make_date(951825845, 1000);
      assert(val.to_string() == "2000-02-29T12:04:05.000001Z");

      // Digits beyond microseconds are not stored.
      val = make_date(951825845, 999);
      assert(val.to_string() == "2000-02-29T12:04:05Z");

      val = make_date(-62135596800);
      assert(val.to_string() == "0001-01-01T00:00:00Z");

      val = make_date(64092211200);
      assert(val.to_string() == "4001-01-01T00:00:00Z");

      val = make_date(253402300799, 999999000);
      assert(val.to_string() == "9999-12-31T23:59:59.999999Z");
    }

    {
      // `("$meow", {"x" = true;}, 12.5, (37, ()))`
      ::plist::Value val;
      val.mut_array().resize(4);
      val.mut_array().mut(0) = &"$meow";
      val.mut_array().mut(1).mut_dictionary().try_emplace(&"x", true);
      val.mut_array().mut(2) = 12.5;
      val.mut_array().mut(3).mut_array().resize(2);
      val.mut_array().mut(3).mut_array().mut(0) = 37;
      assert(val.to_string() == R"(("$meow", {"x" = true;}, 12.5, (37, ())))");

      ::rocket::cow_string str;
      val.print_to(str);
      assert(str == val.to_string());
    }

    {
      // equality
      ::plist::Value x = ::plist::V_array{ 1, 2, 3 };
      ::plist::Value y = ::plist::V_array{ 1, 2, 3 };
      assert(x == y);
      y = ::plist::V_array{ 1, 3, 2 };
      assert(x != y);
      y = ::plist::V_array{ 1, 2 };
      assert(x != y);

      x = ::plist::V_dictionary{ { &"a", 1 }, { &"b", &"two" } };
      y = ::plist::V_dictionary{ { &"b", &"two" }, { &"a", 1 } };
      assert(x == y);
      y = ::plist::V_dictionary{ { &"a", 1 }, { &"b", &"three" } };
      assert(x != y);
      y = ::plist::V_dictionary{ { &"a", 1 }, { &"c", &"two" } };
      assert(x != y);

      x = 1;
      y = 1.0;
      assert(x != y);
      y = 1;
      assert(x == y);

      x = ::plist::Value();
      y = ::plist::V_dictionary();
      assert(x != y);
    }

    {
      // recursion
      ::plist::Value val;
      constexpr ::std::size_t N = 100000;
      for(::std::size_t i = 0; i < N; ++i) {
        ::plist::V_array arr;
        arr.emplace_back(::std::move(val));
        val = ::std::move(arr);
      }

      ::rocket::cow_string str;
      str.append(N + 1, '(');
      str.append(N + 1, ')');
      assert(val.to_string() == str);

      ::plist::Value other = val;
      assert(other == val);
      other.mut_array().mut(0).mut_array().clear();
      assert(other != val);
    }

    {
      assert(::std::strcmp(::plist::describe_error(::plist::error_none), "no error") == 0);
      assert(::std::strcmp(::plist::describe_error(::plist::error_cyclic_reference),
                           "cyclic object reference") == 0);
      assert(::std::strcmp(::plist::describe_error(::plist::error_utf16), "invalid UTF-16 string") == 0);
      assert(::std::strcmp(::plist::describe_error(static_cast<::plist::Error_Code>(200)),
                           "unknown error") == 0);
    }

    // leak check
    assert(::alloc_count == 0);
  }
