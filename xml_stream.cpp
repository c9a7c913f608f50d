// This file is part of PLIST.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "xml_stream.hpp"
#include <algorithm>
#include <cstring>
namespace plist {
namespace details {
namespace {

ROCKET_ALWAYS_INLINE
bool
is_text_node(const ::pugi::xml_node& node) noexcept
  {
    return (node.type() == ::pugi::node_pcdata) || (node.type() == ::pugi::node_cdata);
  }

// Strips the namespace prefix of an element name.
ROCKET_ALWAYS_INLINE
const char*
do_local_name(const char* name) noexcept
  {
    const char* colon = ::std::strrchr(name, ':');
    return colon ? (colon + 1) : name;
  }

// Counts the end tags that follow the last node of a partial tree. These close
// the deepest elements on its rightmost path.
size_t
do_count_closed_tail(const char* data, const char* eptr, const ::pugi::xml_node& tail)
  {
    if(!tail || (tail.offset_debug() < 0))
      return 0;

    const char* bptr = data + tail.offset_debug();
    if(bptr >= eptr)
      return 0;

    size_t count = 0;
    if(tail.type() == ::pugi::node_element) {
      // A childless element may have been closed by itself.
      bptr = static_cast<const char*>(::std::memchr(bptr, '>', static_cast<size_t>(eptr - bptr)));
      if(!bptr)
        return 0;

      if(bptr[-1] == '/')
        count ++;
      bptr ++;
    }
    else if(tail.type() == ::pugi::node_cdata) {
      static constexpr char term[] = "]]>";
      bptr = ::std::search(bptr, eptr, term, term + 3);
      if(bptr == eptr)
        return 0;
      bptr += 3;
    }
    else
      bptr = ::std::find(bptr, eptr, '<');

    for(;;) {
      while((bptr != eptr) && ::std::memchr(" \t\r\n", *bptr, 4))
        bptr ++;

      if((eptr - bptr < 2) || (bptr[0] != '<'))
        break;

      // Comments and processing instructions are not loaded.
      if((eptr - bptr >= 4) && (::std::memcmp(bptr, "<!--", 4) == 0)) {
        static constexpr char term[] = "-->";
        bptr = ::std::search(bptr + 4, eptr, term, term + 3);
        if(bptr == eptr)
          break;
        bptr += 3;
        continue;
      }

      if(bptr[1] == '?') {
        static constexpr char term[] = "?>";
        bptr = ::std::search(bptr + 2, eptr, term, term + 2);
        if(bptr == eptr)
          break;
        bptr += 2;
        continue;
      }

      if(bptr[1] != '/')
        break;

      bptr = static_cast<const char*>(::std::memchr(bptr, '>', static_cast<size_t>(eptr - bptr)));
      if(!bptr)
        break;

      count ++;
      bptr ++;
    }
    return count;
  }

}  // namespace

void
Xml_Event_Stream::
do_push_event(Xml_Event_Kind kind, ::std::int64_t offset, const char* name, const char* text)
  {
    auto& event = this->m_events.emplace_back();
    event.kind = kind;
    event.offset = offset;
    if(name)
      event.name.assign(name);
    if(text)
      event.text.assign(text);
  }

void
Xml_Event_Stream::
load(const char* data, size_t size)
  {
    this->m_events.clear();
    this->m_pos = 0;
    this->m_size = static_cast<::std::int64_t>(size);

    // Whitespace is kept, so it can be reported as character runs. Comments,
    // processing instructions and document type declarations are not loaded.
    auto result = this->m_doc.load_buffer(data, size,
                        ::pugi::parse_default | ::pugi::parse_ws_pcdata,
                        ::pugi::encoding_auto);

    bool truncated = false;
    ::std::vector<::pugi::xml_node> unclosed;

    if(!result) {
      // If the parser stops at the last non-blank character, or there is no
      // such character, the document has been truncated.
      ::std::ptrdiff_t last = static_cast<::std::ptrdiff_t>(size) - 1;
      while((last >= 0) && ::std::memchr(" \t\r\n", data[last], 4))
        last --;

      truncated = (last < 0) || (result.offset >= last);

      // Elements on the rightmost path of the partial tree may not have been
      // closed. Their end events shall not be reported.
      ::pugi::xml_node tail;
      auto node = this->m_doc.last_child();
      while(node) {
        tail = node;
        if(node.type() != ::pugi::node_element)
          break;

        unclosed.emplace_back(node);
        node = node.last_child();
      }

      // End tags before the point of failure close the deepest elements.
      size_t eoff = size;
      if(!truncated)
        eoff = ::std::min(size, static_cast<size_t>(result.offset));

      size_t nclosed = do_count_closed_tail(data, data + eoff, tail);
      unclosed.resize(unclosed.size() - ::std::min(nclosed, unclosed.size()));
    }

    this->do_push_event(xml_start_document, 0, nullptr, nullptr);

    // Break deep recursion by walking the tree with sibling and parent links.
    ::rocket::cow_string text;
    auto node = this->m_doc.first_child();
    while(node) {
      if(node.type() == ::pugi::node_element) {
        // open
        this->do_push_event(xml_start_element, node.offset_debug(),
                            do_local_name(node.name()), nullptr);

        if(node.first_child()) {
          node = node.first_child();
          continue;
        }

        if(::std::find(unclosed.begin(), unclosed.end(), node) == unclosed.end())
          this->do_push_event(xml_end_element, node.offset_debug(),
                              do_local_name(node.name()), nullptr);
      }
      else if(is_text_node(node)) {
        // Coalesce adjacent character runs.
        ::std::int64_t offset = node.offset_debug();
        text.assign(node.value());
        while(is_text_node(node.next_sibling())) {
          node = node.next_sibling();
          text.append(node.value());
        }

        auto& event = this->m_events.emplace_back();
        event.kind = xml_characters;
        event.offset = offset;
        event.text = text;
      }

      // next
      while(!node.next_sibling()) {
        node = node.parent();
        if(!node || (node.type() != ::pugi::node_element)) {
          node = ::pugi::xml_node();
          break;
        }

        // close
        if(::std::find(unclosed.begin(), unclosed.end(), node) == unclosed.end())
          this->do_push_event(xml_end_element, node.offset_debug(),
                              do_local_name(node.name()), nullptr);
      }

      if(node)
        node = node.next_sibling();
    }

    if(result)
      this->do_push_event(xml_end_document, this->m_size, nullptr, nullptr);
    else if(!truncated)
      this->do_push_event(xml_error, result.offset, nullptr, result.description());
  }

bool
Xml_Event_Stream::
next(Xml_Event& event)
  {
    if(this->m_pos == this->m_events.size())
      return false;

    event = this->m_events[this->m_pos];
    this->m_pos ++;
    return true;
  }

}  // namespace details
}  // namespace plist
