#ifndef MSG_CHANNEL_HPP
#define MSG_CHANNEL_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

/**
 * Bounded FIFO between one producer and one consumer thread.
 *
 * write() never blocks and reports a clogged channel, writeWait() blocks
 * until there is room. close() wakes both sides: pending writes fail and
 * readers drain what is left before getting std::nullopt.
 */
template <typename T>
class MsgChannel {
public:
    explicit MsgChannel(unsigned int buffer_size) : buffer_size_(buffer_size ? buffer_size : 1) {}

    bool write(T msg) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_ || msg_buffer_.size() >= buffer_size_) {
            return false;
        }
        msg_buffer_.emplace_back(std::move(msg));
        readable_.notify_one();
        return true;
    }

    bool writeWait(T msg) {
        std::unique_lock<std::mutex> lock(mutex_);
        writable_.wait(lock, [this] { return closed_ || msg_buffer_.size() < buffer_size_; });
        if (closed_) {
            return false;
        }
        msg_buffer_.emplace_back(std::move(msg));
        readable_.notify_one();
        return true;
    }

    bool read(T *out) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (msg_buffer_.empty()) {
            return false;
        }
        *out = std::move(msg_buffer_.front());
        msg_buffer_.pop_front();
        writable_.notify_one();
        return true;
    }

    std::optional<T> waitRead() {
        std::unique_lock<std::mutex> lock(mutex_);
        readable_.wait(lock, [this] { return closed_ || !msg_buffer_.empty(); });
        if (msg_buffer_.empty()) {
            return std::nullopt;
        }
        T result = std::move(msg_buffer_.front());
        msg_buffer_.pop_front();
        writable_.notify_one();
        return result;
    }

    void close() {
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        readable_.notify_all();
        writable_.notify_all();
    }

    bool isClosed() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return msg_buffer_.size();
    }

private:
    std::deque<T> msg_buffer_;
    mutable std::mutex mutex_;
    std::condition_variable readable_;
    std::condition_variable writable_;
    unsigned int buffer_size_;
    bool closed_ = false;
};

#endif // MSG_CHANNEL_HPP
