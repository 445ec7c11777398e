#ifndef CANTYPES_CALLBACK_ARRAY_HEADER
#define CANTYPES_CALLBACK_ARRAY_HEADER 1

#include <vector>
#include <functional>
#include <mutex>
#include <utility>

namespace CanTypesN {

  //! Abstract callback array base class.
  //! Lets a handle remove its entry without knowing the function type.

  class AbstractCallbackArrayC
  {
  public:
    AbstractCallbackArrayC()
    {}

    //! virtual destructor to keep the compiler happy.
    virtual ~AbstractCallbackArrayC();

    //! Remove a callback from the list.
    virtual void Remove(int id) = 0;
  };

  //! Handle for a single callback

  class CallbackHandleC
  {
  public:
    //! Default constructor,
    //! Creates an invalid handle. It is safe to call Remove() on it which will have no effect.
    CallbackHandleC()
    {}

    //! Create from an array entry and an id
    CallbackHandleC(AbstractCallbackArrayC *cb,int id)
      : m_cb(cb),
        m_id(id)
    {}

    //! Remove callback from list if handle is valid, otherwise take no action.
    //! The handle will be changed to an invalid state after call back is removed.
    void Remove();

    //! Test if the handle still refers to a callback.
    bool IsActive() const
    { return m_cb != 0; }

  protected:
    AbstractCallbackArrayC *m_cb = 0;
    int m_id = -1;
  };

  //! Set of callbacks removed together, either by 'RemoveAll()' or on destruction.

  class CallbackSetC
  {
  public:
    CallbackSetC()
    {}

    //! Disconnects all stored callbacks.
    ~CallbackSetC();

    //! Add a new callback to the set
    CallbackSetC &operator+=(const CallbackHandleC &handle) {
      m_callbacks.push_back(handle);
      return *this;
    }

    //! Remove and disconnect all stored callbacks
    void RemoveAll();

  protected:
    std::vector<CallbackHandleC> m_callbacks;
  };

  //! Thread safe list of functions to call on an event.
  //! Every Add() issues a new id, so a handle never refers to a later callback.

  template<typename FuncT>
  class CallbackArrayC
   : public AbstractCallbackArrayC
  {
  public:
    CallbackArrayC()
    {}

    //! Add a new call back to the list.
    CallbackHandleC Add(const FuncT &callback)
    {
      std::lock_guard<std::mutex> lock(m_mutexAccess);
      int id = m_nextId++;
      m_callbacks.push_back(EntryT(id,callback));
      return CallbackHandleC(this,id);
    }

    //! Remove a callback, unknown ids are ignored.
    virtual void Remove(int id) override
    {
      std::lock_guard<std::mutex> lock(m_mutexAccess);
      for(auto it = m_callbacks.begin();it != m_callbacks.end();++it) {
        if(it->first == id) {
          m_callbacks.erase(it);
          return;
        }
      }
    }

    //! Remove all callbacks.
    //! Handles already issued become stale and their Remove() has no effect.
    void Clear()
    {
      std::lock_guard<std::mutex> lock(m_mutexAccess);
      m_callbacks.clear();
    }

    //! Number of active callbacks.
    size_t Size()
    {
      std::lock_guard<std::mutex> lock(m_mutexAccess);
      return m_callbacks.size();
    }

    //! Call every active callback with the given arguments.
    //! The list is copied first so callbacks may add or remove entries.
    template<typename... ArgsT>
    void Call(ArgsT&&... args)
    {
      std::vector<EntryT> calls;
      {
        std::lock_guard<std::mutex> lock(m_mutexAccess);
        calls = m_callbacks;
      }
      for(auto &a : calls) {
        if(a.second) a.second(args...);
      }
    }

  protected:
    typedef std::pair<int,FuncT> EntryT;

    std::mutex m_mutexAccess;
    int m_nextId = 0;
    std::vector<EntryT> m_callbacks;
  };

}

#endif
