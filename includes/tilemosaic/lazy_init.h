#ifndef TILEMOSAIC_LAZY_INIT_H
#define TILEMOSAIC_LAZY_INIT_H
#pragma once

#include <exception>
#include <future>
#include <mutex>

namespace tilemosaic {

// One-shot initialization shared by concurrent callers.
//
// The first caller runs the initializer outside the lock while later callers
// wait on the same attempt and observe its outcome, exception included. A
// failed attempt leaves the guard uninitialized so the next call retries.
class LazyInit {
public:
    template <typename Fn>
    void ensure(Fn &&initializer);

    bool ready() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _state == State::Ready;
    }

private:
    enum class State {
        Uninitialized,
        Initializing,
        Ready,
    };

    mutable std::mutex _mutex;
    State _state = State::Uninitialized;
    std::shared_future<void> _pending;
};

template <typename Fn>
void LazyInit::ensure(Fn &&initializer) {
    std::shared_future<void> in_flight;
    std::promise<void> promise;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state == State::Ready) {
            return;
        }
        if (_state == State::Initializing) {
            in_flight = _pending;
        } else {
            _state = State::Initializing;
            _pending = promise.get_future().share();
        }
    }

    if (in_flight.valid()) {
        in_flight.get();
        return;
    }

    try {
        initializer();
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _state = State::Uninitialized;
            _pending = std::shared_future<void>();
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _state = State::Ready;
        _pending = std::shared_future<void>();
    }
    promise.set_value();
}

}  // namespace tilemosaic

#endif // TILEMOSAIC_LAZY_INIT_H
