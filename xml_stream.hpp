// This file is part of PLIST.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef PLIST_XML_STREAM_HPP_
#define PLIST_XML_STREAM_HPP_

#include "plist.hpp"
#include <pugixml.hpp>
#include <vector>
namespace plist {
namespace details {

// This class loads an XML document and replays it as a sequence of structural
// events. Character runs are coalesced, and CDATA sections are character runs
// too. If the document ends before its root element is closed, the sequence
// stops after the last complete event without `xml_end_document`. Any other
// malformation is reported as an `xml_error` event, after all events that
// precede it.
class Xml_Event_Stream
  {
  private:
    ::pugi::xml_document m_doc;
    ::std::vector<Xml_Event> m_events;
    size_t m_pos = 0;
    ::std::int64_t m_size = 0;

  public:
    Xml_Event_Stream() { }

    Xml_Event_Stream(const Xml_Event_Stream&) = delete;
    Xml_Event_Stream& operator=(const Xml_Event_Stream&) & = delete;

  private:
    void
    do_push_event(Xml_Event_Kind kind, ::std::int64_t offset, const char* name, const char* text);

  public:
    // Gets the length of the document in bytes.
    ::std::int64_t
    size() const noexcept
      { return this->m_size;  }

    // Loads a document from memory, discarding any previous events.
    void
    load(const char* data, size_t size);

    // Gets the next event without consuming it. If there are no more events, a
    // null pointer is returned.
    const Xml_Event*
    peek() const noexcept
      {
        if(this->m_pos == this->m_events.size())
          return nullptr;
        else
          return &(this->m_events[this->m_pos]);
      }

    // Consumes the next event. If there are no more events, `false` is returned.
    bool
    next(Xml_Event& event);

    bool
    skip() noexcept
      {
        if(this->m_pos == this->m_events.size())
          return false;

        this->m_pos ++;
        return true;
      }
  };

}  // namespace details
}  // namespace plist
#endif
