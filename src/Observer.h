#pragma once

#include "concurrency/Lock.h"
#include <algorithm>
#include <vector>

template <class T> class Observable;

/**
 * Receives the values published by one or more Observables. Subclass and implement onNotify.
 * Detaches itself from everything it watches when destroyed.
 */
template <class T> class Observer
{
    friend class Observable<T>;

    std::vector<Observable<T> *> watched;

  public:
    virtual ~Observer()
    {
        for (Observable<T> *o : watched)
            o->detach(this);
    }

    /// Start receiving values from o
    void observe(Observable<T> *o)
    {
        watched.push_back(o);
        o->attach(this);
    }

    /// Stop receiving values from o
    void unobserve(Observable<T> *o)
    {
        o->detach(this);
        watched.erase(std::remove(watched.begin(), watched.end(), o), watched.end());
    }

  protected:
    /// Return 0 to let the next observer run, anything else stops the notification and is returned to the publisher
    virtual int onNotify(T arg) = 0;
};

/**
 * Observer that forwards to a member function, so one class can watch several observables
 */
template <class Callback, class T> class CallbackObserver : public Observer<T>
{
    typedef int (Callback::*ObserverCallback)(T arg);

    Callback *objPtr;
    ObserverCallback method;

  public:
    CallbackObserver(Callback *_objPtr, ObserverCallback _method) : objPtr(_objPtr), method(_method) {}

  protected:
    virtual int onNotify(T arg) override { return (objPtr->*method)(arg); }
};

/**
 * Publishes values to its observers in the order they attached.
 *
 * The updater notifies from its worker thread while observers come and go on others, so the list is guarded.
 * Callbacks run outside the lock and may unobserve themselves.
 */
template <class T> class Observable
{
    friend class Observer<T>;

    std::vector<Observer<T> *> observers;
    mutable concurrency::Lock lock;

  public:
    ~Observable()
    {
        concurrency::LockGuard guard(lock);
        for (Observer<T> *o : observers)
            o->watched.erase(std::remove(o->watched.begin(), o->watched.end(), this), o->watched.end());
        observers.clear();
    }

    /**
     * Hand arg to every observer.
     * @return 0, or the first non-zero value an observer returned (later observers are then skipped)
     */
    int notifyObservers(T arg)
    {
        std::vector<Observer<T> *> current;
        {
            concurrency::LockGuard guard(lock);
            current = observers;
        }
        for (Observer<T> *o : current) {
            int result = o->onNotify(arg);
            if (result != 0)
                return result;
        }
        return 0;
    }

    bool hasObservers() const
    {
        concurrency::LockGuard guard(lock);
        return !observers.empty();
    }

  private:
    void attach(Observer<T> *o)
    {
        concurrency::LockGuard guard(lock);
        observers.push_back(o);
    }

    void detach(Observer<T> *o)
    {
        concurrency::LockGuard guard(lock);
        observers.erase(std::remove(observers.begin(), observers.end(), o), observers.end());
    }
};
