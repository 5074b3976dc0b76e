#pragma once
// StdioTransport.hpp - Newline-delimited JSON over a pair of file descriptors
// Defaults to stdin/stdout. Reads are driven by the Qt event loop.

#include <QByteArray>
#include <QFile>
#include <QJsonObject>
#include <QObject>
#include <QSocketNotifier>
#include <memory>
#include "util/Signal.hpp"

namespace smu {

class StdioTransport : public QObject {
    Q_OBJECT

public:
    explicit StdioTransport(int inputFd = 0,
                            int outputFd = 1,
                            QObject* parent = nullptr);
    ~StdioTransport() override;

    bool isOpen() const {
        return open_;
    }

    void send(const QJsonObject& message);

    Signal<const QByteArray&> lineReceived;
    // End of input or a read error; emitted once
    Signal<> closed;

private:
    void onReadable();
    void drainLines();
    void close();

    int inputFd_;
    QFile output_;
    std::unique_ptr<QSocketNotifier> notifier_;
    QByteArray pending_;
    bool open_{true};
};

} // namespace smu
