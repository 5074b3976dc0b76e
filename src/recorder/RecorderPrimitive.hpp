/**
 * @file RecorderPrimitive.hpp
 * @brief One encoder bound to one channel's stream.
 *
 * start() begins emitting dataAvailable() roughly every timeslice. stop()
 * flushes: the final chunk (possibly empty) is emitted before stopped().
 * Implementations may emit from worker threads; receivers on the event
 * loop thread get queued delivery, which keeps per-recorder chunk order.
 *
 * After faulted() no further chunks arrive. stopped() still follows a
 * stop() request.
 */

#pragma once
#include <QByteArray>
#include <QObject>
#include <QString>
#include <chrono>

namespace smu {

enum class RecorderState { Inactive, Recording, Paused };

class RecorderPrimitive : public QObject {
    Q_OBJECT

public:
    explicit RecorderPrimitive(QObject* parent = nullptr) : QObject(parent) {
    }
    ~RecorderPrimitive() override = default;

    virtual void start(std::chrono::milliseconds timeslice) = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;

    virtual RecorderState state() const = 0;

    // The encoding actually in use, even when the platform default was asked
    virtual QString mimeType() const = 0;

signals:
    void dataAvailable(const QByteArray& chunk);
    void stopped();
    void faulted(const QString& message);
};

} // namespace smu
