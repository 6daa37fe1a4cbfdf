#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/compile.h>
#include <fmt/ranges.h>
#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jd::detail {
  /**
   * Message class which stores a keyed list of strings, which
   * are output line-by-line in a formatted manner, in the order
   * in which they were provided.
   */
  class Message {
    std::string _buffer;

  public:
    void put(std::string_view key, std::string_view message) {
      fmt::format_to(std::back_inserter(_buffer),
                     FMT_COMPILE("  {:<8} : {}\n"), 
                     key, 
                     message);
    }
    
    std::string get() const {
      return _buffer;
    }
  };
  
  /**
   * Exception class which stores a keyed list of strings, which
   * are output line-by-line in a formatted manner, in the order
   * in which they were provided.
   */
  class Exception : public std::exception, public Message {
    mutable std::string _what;

  protected:
    virtual std::string_view name() const noexcept {
      return "jd::detail::Exception";
    }

  public:
    const char * what() const noexcept override {
      _what = fmt::format("{} thrown\n{}", name(), get());
      return _what.c_str();
    }
  };
} // namespace jd::detail
