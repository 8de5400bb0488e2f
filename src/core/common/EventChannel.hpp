#pragma once

#include <QtCore/QDeadlineTimer>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QQueue>
#include <QtCore/QWaitCondition>

#include <algorithm>
#include <optional>

namespace WhisperGui {

/**
 * @brief Bounded FIFO between one producing task and one consumer
 *
 * send() blocks while the queue is full, so a slow consumer throttles the
 * producer instead of losing items. Once the receiving side has been
 * detached, send() returns false immediately and the item is discarded.
 * close() marks end of stream; items already queued are still delivered.
 */
template<typename T>
class EventChannel {
public:
    explicit EventChannel(int capacity)
        : capacity_(std::max(1, capacity)) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    bool send(T value) {
        QMutexLocker locker(&mutex_);
        while (queue_.size() >= capacity_ && !receiverGone_ && !closed_) {
            notFull_.wait(&mutex_);
        }
        if (receiverGone_ || closed_) {
            return false;
        }
        queue_.enqueue(std::move(value));
        notEmpty_.wakeOne();
        return true;
    }

    void close() {
        QMutexLocker locker(&mutex_);
        closed_ = true;
        notEmpty_.wakeAll();
        notFull_.wakeAll();
    }

    void detachReceiver() {
        QMutexLocker locker(&mutex_);
        receiverGone_ = true;
        queue_.clear();
        notFull_.wakeAll();
    }

    // Next item in order; nothing on end of stream or when timeoutMs expires
    std::optional<T> receive(int timeoutMs = -1) {
        QDeadlineTimer deadline = timeoutMs < 0
            ? QDeadlineTimer(QDeadlineTimer::Forever)
            : QDeadlineTimer(timeoutMs);

        QMutexLocker locker(&mutex_);
        while (queue_.isEmpty() && !closed_) {
            if (!notEmpty_.wait(&mutex_, deadline)) {
                break;
            }
        }
        if (queue_.isEmpty()) {
            return std::nullopt;
        }
        T value = queue_.dequeue();
        notFull_.wakeOne();
        return value;
    }

    // Closed by the sender and fully drained
    bool isFinished() const {
        QMutexLocker locker(&mutex_);
        return closed_ && queue_.isEmpty();
    }

    int capacity() const { return capacity_; }

private:
    const int capacity_;
    mutable QMutex mutex_;
    QWaitCondition notEmpty_;
    QWaitCondition notFull_;
    QQueue<T> queue_;
    bool closed_ = false;
    bool receiverGone_ = false;
};

} // namespace WhisperGui
