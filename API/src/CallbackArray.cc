
#include "cantypes/CallbackArray.hh"

namespace CanTypesN {

  AbstractCallbackArrayC::~AbstractCallbackArrayC()
  {}

  // -----------------------------------------------------

  void CallbackHandleC::Remove()
  {
    if(m_cb == 0)
      return;
    m_cb->Remove(m_id);
    m_cb = 0;
    m_id = -1;
  }

  // -----------------------------------------------------

  CallbackSetC::~CallbackSetC()
  { RemoveAll(); }

  void CallbackSetC::RemoveAll()
  {
    while(!m_callbacks.empty()) {
      m_callbacks.back().Remove();
      m_callbacks.pop_back();
    }
  }

}
