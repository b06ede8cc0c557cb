#include "bits3/pipeline/bounded_queue.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

int main() {
  using bits3::pipeline::BoundedQueue;

  {
    BoundedQueue<int> queue(2);
    std::atomic<int> pushed{0};
    std::thread producer([&]() {
      for (int i = 0; i < 100; ++i) {
        assert(queue.Push(i));
        ++pushed;
      }
      queue.Close();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(pushed.load() <= 2 && "a full queue blocks the producer");
    assert(queue.size() <= queue.capacity());

    std::vector<int> received;
    while (auto item = queue.Pop()) {
      received.push_back(*item);
    }
    producer.join();
    assert(received.size() == 100);
    for (int i = 0; i < 100; ++i) {
      assert(received[static_cast<size_t>(i)] == i && "order is preserved");
    }
    assert(!queue.Push(1) && "closed queues refuse new items");
  }

  {
    BoundedQueue<int> queue(4);
    assert(queue.Push(1) && queue.Push(2));
    queue.Close();
    assert(queue.Pop() == 1 && queue.Pop() == 2 && "close drains queued items");
    assert(!queue.Pop().has_value());
  }

  {
    BoundedQueue<int> queue(1);
    assert(queue.Push(1));
    std::atomic<bool> push_result{true};
    std::thread blocked([&]() { push_result = queue.Push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.Cancel();
    blocked.join();
    assert(!push_result.load() && "cancel releases a blocked producer");
    assert(!queue.Pop().has_value() && "cancel drops queued items");
  }

  {
    BoundedQueue<int> queue(1);
    std::atomic<bool> got_item{true};
    std::thread waiting([&]() { got_item = queue.Pop().has_value(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.Cancel();
    waiting.join();
    assert(!got_item.load() && "cancel releases a blocked consumer");
  }

  std::cout << "bounded queue tests ok\n";
  return 0;
}
