#ifndef SHAREDQUEUE_H
#define SHAREDQUEUE_H

#include <deque>
#include <mutex>
#include <chrono>
#include <condition_variable>

/*
 * SharedQueue
 *   blocking FIFO handed between threads: request queues for the
 *   device process thread and reply queues back to waiting callers
 */

template <typename T>
class SharedQueue
{
public:
  SharedQueue();
  ~SharedQueue();

  T pop_front();
  bool pop_front_for(T& item, std::chrono::milliseconds timeout);

  void push_back(const T& item);
  void push_back(T&& item);

  int size();
  bool empty();
  void clear();

private:
  std::deque<T> queue_;
  std::mutex mutex_;
  std::condition_variable cond_;
};

template <typename T>
SharedQueue<T>::SharedQueue(){}

template <typename T>
SharedQueue<T>::~SharedQueue(){}

template <typename T>
T SharedQueue<T>::pop_front()
{
  std::unique_lock<std::mutex> mlock(mutex_);
  while (queue_.empty())
    {
      cond_.wait(mlock);
    }
  T val = std::move(queue_.front());
  queue_.pop_front();
  return val;
}

/*
 * wait at most timeout for an item, returns false if none arrived
 */
template <typename T>
bool SharedQueue<T>::pop_front_for(T& item, std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> mlock(mutex_);
  if (!cond_.wait_for(mlock, timeout, [this] { return !queue_.empty(); }))
    return false;
  item = std::move(queue_.front());
  queue_.pop_front();
  return true;
}

template <typename T>
void SharedQueue<T>::push_back(const T& item)
{
  std::unique_lock<std::mutex> mlock(mutex_);
  queue_.push_back(item);
  mlock.unlock();     // unlock before notificiation to minimize mutex con
  cond_.notify_one(); // notify one waiting thread
}

template <typename T>
void SharedQueue<T>::push_back(T&& item)
{
  std::unique_lock<std::mutex> mlock(mutex_);
  queue_.push_back(std::move(item));
  mlock.unlock();     // unlock before notificiation to minimize mutex con
  cond_.notify_one(); // notify one waiting thread
}

template <typename T>
int SharedQueue<T>::size()
{
  std::lock_guard<std::mutex> mlock(mutex_);
  return queue_.size();
}

template <typename T>
bool SharedQueue<T>::empty()
{
  std::lock_guard<std::mutex> mlock(mutex_);
  return queue_.empty();
}

template <typename T>
void SharedQueue<T>::clear()
{
  std::lock_guard<std::mutex> mlock(mutex_);
  queue_.clear();
}

#endif
