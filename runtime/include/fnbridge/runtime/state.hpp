#ifndef FNBRIDGE_RUNTIME_STATE_HPP
#define FNBRIDGE_RUNTIME_STATE_HPP

#include <atomic>

namespace fnbridge::runtime {

  struct LoopState {

    bool running() const
    {
      return _running.load();
    }

    // Returns false if the loop was already running.
    bool begin()
    {
      return !_running.exchange(true);
    }

    void stop()
    {
      _running = false;
    }

  private:
    std::atomic<bool> _running{false};
  };

  struct CancellationToken {

    void cancel()
    {
      _cancelled = true;
    }

    bool cancelled() const
    {
      return _cancelled.load();
    }

  private:
    std::atomic<bool> _cancelled{false};
  };

} // namespace fnbridge::runtime

#endif
